#pragma once

#include <vector>

// 2次元スカラー場 PDE ソルバの共通インターフェイス
class ISolver2D {
public:
    virtual ~ISolver2D() = default;

    // 初期条件をセット／リセット
    virtual void reset_initial() = 0;

    // 1ステップ分 時間発展
    virtual void step() = 0;

    // 共通の run 実装（必要ステップ数だけ step() を回す）
    virtual void run(int steps) {
        for (int n = 0; n < steps; ++n) {
            step();
        }
    }

    // 格子座標と現在の解 u(x, y, t) へのアクセス（u は row-major: j*Nx+i）
    virtual const std::vector<double>& get_x() const = 0;
    virtual const std::vector<double>& get_y() const = 0;
    virtual const std::vector<double>& get_u() const = 0;
};
