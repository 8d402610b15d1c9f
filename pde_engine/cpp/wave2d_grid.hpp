// wave2d_grid.hpp
#pragma once
#include <array>
#include <cstddef>
#include <vector>

/// [0,1] x [0,1] 上の (N+1) x (N+1) 一様格子と 3 本の解バッファ
/// previous (u^{n-1}), current (u^n), next (u^{n+1})
///
/// 3 本のバッファは固定の 3 スロットに置き、offset を回して役割を入れ替える
/// (ステップ毎の再確保はしない)。
/// 並びは row-major: idx(i, j) = j * (N+1) + i  (i: x 方向, j: y 方向)
class Wave2DGrid {
public:
    /// @param N_ 各方向の分割数 (2 <= N <= max_grid_resolution())
    explicit Wave2DGrid(int N_);

    int n() const { return N; }
    int points() const { return N + 1; }   // 1 方向の格子点数
    std::size_t size() const {
        return static_cast<std::size_t>(N + 1) * static_cast<std::size_t>(N + 1);
    }
    double h() const { return dx; }

    const std::vector<double>& get_x() const { return x; }
    const std::vector<double>& get_y() const { return y; }

    inline std::size_t idx(int i, int j) const {
        return static_cast<std::size_t>(j) * static_cast<std::size_t>(N + 1)
             + static_cast<std::size_t>(i);
    }

    const std::vector<double>& previous() const { return slots[slot(0)]; }
    const std::vector<double>& current()  const { return slots[slot(1)]; }
    const std::vector<double>& next()     const { return slots[slot(2)]; }

private:
    // 書き込みは初期化・時間発展・境界処理だけに許す
    friend class StandingWaveInitializer;
    friend class LeapfrogIntegrator;
    friend class NeumannBoundary;

    std::vector<double>& previous_mut() { return slots[slot(0)]; }
    std::vector<double>& current_mut()  { return slots[slot(1)]; }
    std::vector<double>& next_mut()     { return slots[slot(2)]; }

    /// previous <- current, current <- next (古い previous が次の next になる)
    void rotate();

    /// 3 本とも 0 に戻す
    void clear();

    int slot(int role) const { return (offset + role) % 3; }

    int    N;
    double dx;
    int    offset;

    std::vector<double> x;
    std::vector<double> y;
    std::array<std::vector<double>, 3> slots;
};
