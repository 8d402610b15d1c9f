// wave2d_config.hpp
#pragma once
#include <string>
#include <vector>

#include "wave2d_params.hpp"

/// CLI 実行設定
struct Wave2DRunConfig {
    enum class Mode {
        solve,        // 1 回解いてスナップショットの要約を出す
        convergence   // 収束次数を測る
    };

    Mode         mode    = Mode::solve;
    Wave2DParams params;
    bool         verbose = true;

    // convergence 用 (N は 8 から倍々)
    int    conv_levels = 4;
    double conv_cfl    = 0.1;
    int    conv_Nt     = 10;
};

/// key=value 形式の引数列から設定を作る。
/// config=<path> があれば先にファイルを読み、残りの引数で上書きする
Wave2DRunConfig parse_config_args(const std::vector<std::string>& args);

/// "key = value" 行のファイルを読む (# 以降はコメント)
void parse_config_file(const std::string& path, Wave2DRunConfig& cfg);

/// 1 項目を反映する。未知のキー・読めない値は std::runtime_error
void apply_config_entry(Wave2DRunConfig& cfg, const std::string& key, const std::string& value);

std::string trim_copy(const std::string& input);
