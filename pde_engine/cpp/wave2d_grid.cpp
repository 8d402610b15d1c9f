// wave2d_grid.cpp
#include "wave2d_grid.hpp"
#include "wave2d_params.hpp"

#include <algorithm>
#include <string>

Wave2DGrid::Wave2DGrid(int N_)
    : N(N_),
      dx(0.0),
      offset(0)
{
    if (N < 2 || N > max_grid_resolution()) {
        throw Wave2DParameterError(Wave2DErrorKind::InvalidResolution,
                                   "N must satisfy 2 <= N <= "
                                   + std::to_string(max_grid_resolution())
                                   + " (got " + std::to_string(N) + ")");
    }

    dx = 1.0 / N;

    x.resize(N + 1);
    y.resize(N + 1);
    for (int i = 0; i <= N; ++i) {
        x[i] = dx * i;
        y[i] = dx * i;
    }

    for (auto& buf : slots) {
        buf.assign(size(), 0.0);
    }
}

void Wave2DGrid::rotate() {
    offset = (offset + 1) % 3;
}

void Wave2DGrid::clear() {
    for (auto& buf : slots) {
        std::fill(buf.begin(), buf.end(), 0.0);
    }
    offset = 0;
}
