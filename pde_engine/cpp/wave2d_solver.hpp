// wave2d_solver.hpp
#pragma once
#include <vector>

#include "leapfrog_integrator.hpp"
#include "snapshot_recorder.hpp"
#include "solver_base.hpp"
#include "stability_controller.hpp"
#include "standing_wave_initializer.hpp"
#include "wave2d_grid.hpp"
#include "wave2d_params.hpp"

/// 2D wave equation solver on [0,1]^2
/// u_tt = c^2 (u_xx + u_yy), 斉次 Neumann 境界 (鏡像ゴースト点)
/// 初期条件:
///   u(x,y,0)   = cos(mx pi x) cos(my pi y)
///   u_t(x,y,0) = 0
class Wave2DNeumannSolver : public ISolver2D {
public:
    /// パラメータはすべてここで検証する (失敗時 Wave2DParameterError、何も確保しない)
    /// @param verbose_ true なら設定を標準出力に 1 行出す
    explicit Wave2DNeumannSolver(const Wave2DParams& params_, bool verbose_ = false);

    /// 定在波モードで初期化し、integrator を Ready に戻す
    void reset_initial() override;

    /// 1 ステップ進める (Nt 回を超えると std::logic_error)
    void step() override;

    /// 初期状態から Nt ステップ回し、記録方針に従ったスナップショットを返す
    /// (途中まで進めていた場合は reset_initial() からやり直す)
    SnapshotCollection solve();

    const std::vector<double>& get_x() const override { return grid.get_x(); }
    const std::vector<double>& get_y() const override { return grid.get_y(); }
    const std::vector<double>& get_u() const override { return grid.current(); }

    const Wave2DParams& get_params() const { return params; }

    int    get_N()  const { return params.N; }
    double get_h()  const { return grid.h(); }
    double get_dt() const { return stability.dt(); }
    double get_r()  const { return stability.r(); }

    int    steps_taken() const { return integrator.steps_taken(); }
    double time() const { return steps_taken() * get_dt(); }
    LeapfrogIntegrator::State state() const { return integrator.state(); }

    /// 現在の解と厳密解の l2 誤差
    double current_error() const;

private:
    Wave2DParams            params;
    bool                    verbose;
    Wave2DGrid              grid;
    StabilityController     stability;
    StandingWaveInitializer initializer;
    LeapfrogIntegrator      integrator;
    SnapshotRecorder        recorder;
};

/// 1 回分の実行: 検証 -> 初期化 -> Nt ステップ -> スナップショット
SnapshotCollection run_wave_2d_neumann(int    N,
                                       int    Nt,
                                       double cfl,
                                       double c,
                                       int    mx,
                                       int    my,
                                       int    store_every);

SnapshotCollection run_wave_2d_neumann(const Wave2DParams& params);

/// sqrt(mean((u - ue)^2)), ue は時刻 t の厳密解
double l2_error(const Wave2DGrid& grid, const std::vector<double>& u,
                int mx, int my, double c, double t);

/// 各ステップ後の l2 誤差の履歴
struct ErrorHistory {
    double              h;
    std::vector<double> errors;   // errors[n-1] がステップ n の誤差
};

ErrorHistory run_with_errors(const Wave2DParams& params);

/// 収束次数の計算結果
struct ConvergenceResult {
    std::vector<double> rates;    // 隣り合う 2 解像度から求めた次数 (m-1 個)
    std::vector<double> errors;   // 最終ステップの l2 誤差
    std::vector<double> h;        // 格子幅
};

/// N = 8 から始め、N と Nt を倍々にして m 通りの解像度で誤差を測る
ConvergenceResult convergence_rates(int    m   = 4,
                                    double cfl = 0.1,
                                    int    Nt  = 10,
                                    int    mx  = 3,
                                    int    my  = 3,
                                    double c   = 1.0);
