// neumann_boundary.cpp
#include "neumann_boundary.hpp"

double NeumannBoundary::laplacian(const Wave2DGrid& grid, const std::vector<double>& u,
                                  int i, int j)
{
    const int N = grid.n();
    return five_point(u[grid.idx(i, j)],
                      u[grid.idx(mirror(i - 1, N), j)],
                      u[grid.idx(mirror(i + 1, N), j)],
                      u[grid.idx(i, mirror(j - 1, N))],
                      u[grid.idx(i, mirror(j + 1, N))]);
}

void NeumannBoundary::apply(Wave2DGrid& grid, double r2) {
    const int N = grid.n();
    const std::vector<double>& prev = grid.previous();
    const std::vector<double>& cur  = grid.current();
    std::vector<double>&       next = grid.next_mut();

    auto update = [&](int i, int j) {
        const std::size_t k = grid.idx(i, j);
        next[k] = 2.0 * cur[k] - prev[k] + r2 * laplacian(grid, cur, i, j);
    };

    // 下端・上端 (角を含む)
    for (int i = 0; i <= N; ++i) {
        update(i, 0);
        update(i, N);
    }
    // 左端・右端 (角は済み)
    for (int j = 1; j < N; ++j) {
        update(0, j);
        update(N, j);
    }
}
