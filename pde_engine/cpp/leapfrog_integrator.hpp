// leapfrog_integrator.hpp
#pragma once
#include "wave2d_grid.hpp"

/// 陽的 leapfrog (2 次中心差分) による時間発展
///   u^{n+1} = 2u^n - u^{n-1} + r^2 (u_L + u_R + u_D + u_U - 4u_C)
///
/// 状態遷移: Uninitialized -> Ready -> Stepping -> Done
///   Ready    : 初期条件がセットされた (mark_ready)
///   Stepping : 1 ステップ以上進めた
///   Done     : total_steps 回進めた。これ以上は進めない
class LeapfrogIntegrator {
public:
    enum class State {
        Uninitialized,
        Ready,
        Stepping,
        Done
    };

    /// @param r_  ステンシル係数 c dt / h
    /// @param Nt_ 総ステップ数
    LeapfrogIntegrator(double r_, int Nt_);

    /// 初期条件を書き込んだ後に呼ぶ (ステップ数は 0 に戻る)
    void mark_ready();

    /// 1 ステップ進める: 内部点更新 -> Neumann 境界 -> バッファ回転
    void step(Wave2DGrid& grid);

    State state() const { return current_state; }
    bool  done() const { return current_state == State::Done; }

    int steps_taken() const { return n_steps; }
    int total_steps() const { return Nt; }
    double get_r() const { return r; }

private:
    double r;
    double r2;   // r^2
    int    Nt;
    int    n_steps;
    State  current_state;

    void update_interior(Wave2DGrid& grid) const;
};

const char* state_name(LeapfrogIntegrator::State state);
