// standing_wave_initializer.cpp
#include "standing_wave_initializer.hpp"
#include "neumann_boundary.hpp"
#include "wave2d_params.hpp"

#include <cmath>
#include <string>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

StandingWaveInitializer::StandingWaveInitializer(int mx_, int my_)
    : mx(mx_),
      my(my_)
{
    if (mx < 1 || my < 1) {
        throw Wave2DParameterError(Wave2DErrorKind::InvalidMode,
                                   "mode must satisfy mx >= 1 and my >= 1 (got mx="
                                   + std::to_string(mx) + ", my=" + std::to_string(my) + ")");
    }
}

double StandingWaveInitializer::value(double x_val, double y_val) const {
    return std::cos(mx * M_PI * x_val) * std::cos(my * M_PI * y_val);
}

void StandingWaveInitializer::apply(Wave2DGrid& grid, double r2) const {
    grid.clear();

    const int N = grid.n();
    const std::vector<double>& x = grid.get_x();
    const std::vector<double>& y = grid.get_y();
    std::vector<double>& cur = grid.current_mut();

    for (int j = 0; j <= N; ++j) {
        for (int i = 0; i <= N; ++i) {
            cur[grid.idx(i, j)] = value(x[i], y[j]);
        }
    }

    // u_t = 0 の中心差分: u^{-1} = u^{1} = u^0 + 0.5 r^2 L_h u^0
    std::vector<double>& prev = grid.previous_mut();
    for (int j = 0; j <= N; ++j) {
        for (int i = 0; i <= N; ++i) {
            const std::size_t k = grid.idx(i, j);
            prev[k] = cur[k] + 0.5 * r2 * NeumannBoundary::laplacian(grid, cur, i, j);
        }
    }
}

double standing_wave_omega(double c, int mx, int my) {
    const double kx = mx;
    const double ky = my;
    return c * M_PI * std::sqrt(kx * kx + ky * ky);
}

std::vector<double> exact_standing_wave(const Wave2DGrid& grid,
                                        int mx, int my, double c, double t)
{
    const StandingWaveInitializer mode(mx, my);
    const double time_factor = std::cos(standing_wave_omega(c, mx, my) * t);

    const int N = grid.n();
    const std::vector<double>& x = grid.get_x();
    const std::vector<double>& y = grid.get_y();

    std::vector<double> ue(grid.size());
    for (int j = 0; j <= N; ++j) {
        for (int i = 0; i <= N; ++i) {
            ue[grid.idx(i, j)] = mode.value(x[i], y[j]) * time_factor;
        }
    }
    return ue;
}
