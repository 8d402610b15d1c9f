// neumann_boundary.hpp
#pragma once
#include <vector>

#include "wave2d_grid.hpp"

/// 5 点ステンシル (h^2 倍したラプラシアン)
///   (u_L + u_R) + (u_D + u_U) - 4 u_C
/// x 方向の和と y 方向の和を別々に取ってから足すので、転置対称な場では
/// 結果も厳密に転置対称になる
inline double five_point(double uC, double uL, double uR, double uD, double uU) {
    return ((uL + uR) + (uD + uU)) - 4.0 * uC;
}

/// 斉次 Neumann 境界 (∂u/∂n = 0) を鏡像ゴースト点で課す
///
/// 領域外のゴースト点は境界を挟んだ内部点と等しいとみなす:
///   u(-1, j) = u(1, j),  u(N+1, j) = u(N-1, j)   (y 方向も同様)
/// 角では両方向に反射するだけで、特別扱いはしない。
class NeumannBoundary {
public:
    /// ゴースト添字を鏡像の内部添字に写す (-1 -> 1, N+1 -> N-1)
    static int mirror(int k, int N) {
        if (k < 0) return -k;
        if (k > N) return 2 * N - k;
        return k;
    }

    /// 鏡像ゴースト点込みの 5 点ステンシル。境界・角を含む全格子点で使える
    static double laplacian(const Wave2DGrid& grid, const std::vector<double>& u,
                            int i, int j);

    /// 内部更新のあと next の境界 (i=0, i=N, j=0, j=N) を埋める
    ///   next = 2 cur - prev + r2 * laplacian(cur)
    static void apply(Wave2DGrid& grid, double r2);
};
