// wave2d_solver.cpp
#include "wave2d_solver.hpp"

#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

// メンバ初期化より先に検証するため
const Wave2DParams& validated(const Wave2DParams& params) {
    validate_params(params);
    return params;
}

} // namespace

Wave2DNeumannSolver::Wave2DNeumannSolver(const Wave2DParams& params_, bool verbose_)
    : params(validated(params_)),
      verbose(verbose_),
      grid(params_.N),
      stability(grid.h(), params_.c, params_.cfl),
      initializer(params_.mx, params_.my),
      integrator(stability.r(), params_.Nt),
      recorder(params_.store_every, params_.Nt)
{
    if (verbose) {
        std::cout << "[Wave2D] N = " << params.N
                  << ", h = " << grid.h()
                  << ", dt = " << stability.dt()
                  << ", r = " << stability.r()
                  << " (2D margin r*sqrt(2) = " << stability.stability_margin()
                  << " <= 1)\n";
    }

    reset_initial();
}

void Wave2DNeumannSolver::reset_initial() {
    initializer.apply(grid, stability.r2());
    integrator.mark_ready();
}

void Wave2DNeumannSolver::step() {
    integrator.step(grid);
}

SnapshotCollection Wave2DNeumannSolver::solve() {
    // Ready なら格子は初期状態のまま (コンストラクタ直後など)
    if (integrator.state() != LeapfrogIntegrator::State::Ready) {
        reset_initial();
    }

    SnapshotCollection snapshots(params.N);
    recorder.record(0, grid, snapshots);

    while (!integrator.done()) {
        integrator.step(grid);
        recorder.record(integrator.steps_taken(), grid, snapshots);
    }

    if (verbose) {
        std::cout << "[Wave2D] " << params.Nt << " steps (t = " << time() << "), "
                  << snapshots.size() << " snapshots stored\n";
    }
    return snapshots;
}

double Wave2DNeumannSolver::current_error() const {
    return l2_error(grid, grid.current(), params.mx, params.my, params.c, time());
}

SnapshotCollection run_wave_2d_neumann(int    N,
                                       int    Nt,
                                       double cfl,
                                       double c,
                                       int    mx,
                                       int    my,
                                       int    store_every)
{
    Wave2DParams params;
    params.N           = N;
    params.Nt          = Nt;
    params.cfl         = cfl;
    params.c           = c;
    params.mx          = mx;
    params.my          = my;
    params.store_every = store_every;
    return run_wave_2d_neumann(params);
}

SnapshotCollection run_wave_2d_neumann(const Wave2DParams& params) {
    Wave2DNeumannSolver solver(params);
    return solver.solve();
}

double l2_error(const Wave2DGrid& grid, const std::vector<double>& u,
                int mx, int my, double c, double t)
{
    if (u.size() != grid.size()) {
        throw std::invalid_argument("l2_error: field size does not match the grid");
    }

    const std::vector<double> ue = exact_standing_wave(grid, mx, my, c, t);

    double sum = 0.0;
    for (std::size_t k = 0; k < u.size(); ++k) {
        const double diff = u[k] - ue[k];
        sum += diff * diff;
    }
    return std::sqrt(sum / static_cast<double>(u.size()));
}

ErrorHistory run_with_errors(const Wave2DParams& params) {
    Wave2DNeumannSolver solver(params);

    ErrorHistory history;
    history.h = solver.get_h();
    history.errors.reserve(static_cast<std::size_t>(params.Nt));

    for (int n = 1; n <= params.Nt; ++n) {
        solver.step();
        history.errors.push_back(solver.current_error());
    }
    return history;
}

ConvergenceResult convergence_rates(int m, double cfl, int Nt, int mx, int my, double c) {
    if (m < 2) {
        throw std::invalid_argument("convergence_rates: need at least 2 resolutions (got m = "
                                    + std::to_string(m) + ")");
    }

    ConvergenceResult result;
    int N0  = 8;
    int Nt0 = Nt;

    for (int level = 0; level < m; ++level) {
        Wave2DParams params;
        params.N   = N0;
        params.Nt  = Nt0;
        params.cfl = cfl;
        params.c   = c;
        params.mx  = mx;
        params.my  = my;

        const ErrorHistory history = run_with_errors(params);
        result.errors.push_back(history.errors.back());
        result.h.push_back(history.h);

        N0  *= 2;
        Nt0 *= 2;
    }

    for (int i = 1; i < m; ++i) {
        result.rates.push_back(std::log(result.errors[i - 1] / result.errors[i])
                               / std::log(result.h[i - 1] / result.h[i]));
    }
    return result;
}
