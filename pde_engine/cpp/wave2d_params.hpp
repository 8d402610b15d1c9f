// wave2d_params.hpp
#pragma once
#include <stdexcept>
#include <string>

/// 2D 波動方程式 (Neumann 境界) の入力パラメータ
/// デフォルト値は可視化スクリプト (neumann movie) と揃えてある
struct Wave2DParams {
    int    N           = 60;   // 各方向の分割数 (格子点は N+1)
    int    Nt          = 120;  // 時間ステップ数
    double cfl         = 0.5;  // Courant 数 c*dt/h
    double c           = 1.0;  // 波の速さ
    int    mx          = 2;    // 定在波モード (x 方向)
    int    my          = 3;    // 定在波モード (y 方向)
    int    store_every = 2;    // スナップショット間隔
};

/// パラメータ検証エラーの種類
enum class Wave2DErrorKind {
    InvalidResolution,        // N < 2
    InvalidStepCount,         // Nt < 1
    InvalidMode,              // mx < 1 or my < 1
    InvalidWaveSpeed,         // c <= 0
    InvalidCourantNumber,     // cfl <= 0
    StabilityRisk,            // cfl > 1/sqrt(2)
    InvalidRecordingInterval  // store_every < 1
};

const char* error_kind_name(Wave2DErrorKind kind);

/// 検証失敗時に投げる例外。what() は違反したパラメータと制約を含む
class Wave2DParameterError : public std::invalid_argument {
public:
    Wave2DParameterError(Wave2DErrorKind kind_, const std::string& message);

    Wave2DErrorKind kind() const { return error_kind; }

private:
    Wave2DErrorKind error_kind;
};

/// N の上限。格子点数 (N+1)^2 が int に収まる最大の N
int max_grid_resolution();

/// 全パラメータを検証する (確保・時間発展の前に呼ぶ)
/// 検査順: N, Nt, mode, c, cfl, 安定性, store_every
void validate_params(const Wave2DParams& params);
