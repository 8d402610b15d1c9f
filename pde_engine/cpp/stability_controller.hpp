// stability_controller.hpp
#pragma once

/// Courant 数から時間刻みを決める
///   dt = cfl * h / c,  r = c dt / h = cfl
/// 2D 5 点差分の陽解法は c dt sqrt(2) / h <= 1 で安定
class StabilityController {
public:
    /// @param h_   格子幅
    /// @param c_   波の速さ
    /// @param cfl_ Courant 数
    StabilityController(double h_, double c_, double cfl_);

    double dt() const { return dt_value; }

    /// ステンシル係数 r = c dt / h (= cfl)
    double r() const { return r_value; }

    /// r^2
    double r2() const { return r_value * r_value; }

    /// 2D での安定余裕 c dt sqrt(2) / h (<= 1 なら安定)
    double stability_margin() const;

    /// 2D 安定条件の上限 1/sqrt(2)
    static double max_stable_cfl();

    static bool is_stable(double cfl);

private:
    double dt_value;
    double r_value;
};
