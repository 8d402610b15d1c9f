// standing_wave_initializer.hpp
#pragma once
#include <vector>

#include "wave2d_grid.hpp"

/// 定在波モード (mx, my) による初期条件
///   u(x,y,0)   = cos(mx pi x) cos(my pi y)
///   u_t(x,y,0) = 0
class StandingWaveInitializer {
public:
    /// @param mx_ x 方向モード (>= 1)
    /// @param my_ y 方向モード (>= 1)
    StandingWaveInitializer(int mx_, int my_);

    /// 点 (x, y) でのモード値
    double value(double x_val, double y_val) const;

    /// current にモードを書き込み、初速度 0 となるよう previous を作る。
    ///   previous = current + 0.5 * r2 * L_h(current)
    /// (L_h は鏡像ゴースト点込みの 5 点ステンシル)。next は 0 に戻す
    void apply(Wave2DGrid& grid, double r2) const;

    int get_mx() const { return mx; }
    int get_my() const { return my; }

private:
    int mx;
    int my;
};

/// 厳密解の角振動数 omega = c pi sqrt(mx^2 + my^2)
double standing_wave_omega(double c, int mx, int my);

/// 厳密解 cos(mx pi x) cos(my pi y) cos(omega t) を格子上で評価
std::vector<double> exact_standing_wave(const Wave2DGrid& grid,
                                        int mx, int my, double c, double t);
