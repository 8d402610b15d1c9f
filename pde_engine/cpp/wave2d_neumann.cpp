#include <algorithm>
#include <cmath>
#include <exception>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include "wave2d_config.hpp"
#include "wave2d_solver.hpp"

namespace {

int run_solve(const Wave2DRunConfig& cfg) {
    const Wave2DParams& p = cfg.params;

    Wave2DNeumannSolver solver(p, cfg.verbose);
    SnapshotCollection snapshots = solver.solve();

    // 可視化側と同じく、最初と最後のスナップショットから色スケールを決める
    auto max_abs = [](const std::vector<double>& u) {
        double m = 0.0;
        for (double v : u) m = std::max(m, std::abs(v));
        return m;
    };
    const double vmax = std::max(max_abs(snapshots.at(snapshots.first_step())),
                                 max_abs(snapshots.at(snapshots.last_step())));

    std::cout << "Neumann wave: mx=" << p.mx << ", my=" << p.my
              << ", N=" << p.N << ", CFL=" << p.cfl << "\n";
    std::cout << "snapshots   : " << snapshots.size()
              << " (steps " << snapshots.first_step() << " .. " << snapshots.last_step()
              << ", every " << p.store_every << ")\n";
    std::cout << "color scale : [" << -vmax << ", " << vmax << "]\n";
    std::cout << "l2 error    : " << solver.current_error()
              << " at t = " << solver.time() << "\n";
    return 0;
}

int run_convergence(const Wave2DRunConfig& cfg) {
    const Wave2DParams& p = cfg.params;
    const ConvergenceResult result =
        convergence_rates(cfg.conv_levels, cfg.conv_cfl, cfg.conv_Nt, p.mx, p.my, p.c);

    std::cout << std::setw(12) << "h" << std::setw(16) << "l2 error" << std::setw(10) << "rate" << "\n";
    for (std::size_t k = 0; k < result.h.size(); ++k) {
        std::cout << std::setw(12) << result.h[k]
                  << std::setw(16) << result.errors[k];
        if (k > 0) {
            std::cout << std::setw(10) << std::fixed << std::setprecision(3)
                      << result.rates[k - 1] << std::defaultfloat << std::setprecision(6);
        }
        std::cout << "\n";
    }
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    // ============================
    // パラメータ（可視化スクリプトと同じデフォルト、key=value で上書き）
    // ============================
    const std::vector<std::string> args(argv + 1, argv + argc);

    try {
        const Wave2DRunConfig cfg = parse_config_args(args);

        if (cfg.mode == Wave2DRunConfig::Mode::convergence) {
            return run_convergence(cfg);
        }
        return run_solve(cfg);
    } catch (const Wave2DParameterError& e) {
        std::cerr << "[Wave2D] invalid parameter: " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "[Wave2D] error: " << e.what() << "\n";
        return 1;
    }
}
