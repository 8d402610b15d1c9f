// snapshot_recorder.hpp
#pragma once
#include <cstddef>
#include <map>
#include <vector>

#include "wave2d_grid.hpp"

/// ステップ番号 -> 場のコピー (昇順, 追記のみ)
/// 各場は (N+1) x (N+1), row-major (j * (N+1) + i)
class SnapshotCollection {
public:
    using Field = std::vector<double>;
    using Map   = std::map<int, Field>;

    explicit SnapshotCollection(int N_);

    /// step は直前に追加したものより大きいこと、field のサイズは (N+1)^2
    void append(int step, const Field& field);

    int n() const { return N; }
    int points() const { return N + 1; }

    std::size_t size() const { return data.size(); }
    bool empty() const { return data.empty(); }
    bool contains(int step) const { return data.count(step) != 0; }

    /// 無い step は std::out_of_range
    const Field& at(int step) const;
    double value(int step, int i, int j) const;

    std::vector<int> steps() const;
    int first_step() const;
    int last_step() const;

    Map::const_iterator begin() const { return data.begin(); }
    Map::const_iterator end()   const { return data.end(); }

private:
    int N;
    Map data;
};

/// 記録方針: step 0, store_every の倍数, 最終ステップ Nt (割り切れなくても必ず)
class SnapshotRecorder {
public:
    /// @param store_every_ 記録間隔 (>= 1)
    /// @param Nt_          総ステップ数
    SnapshotRecorder(int store_every_, int Nt_);

    bool should_record(int step) const;

    /// should_record(step) なら grid.current() のコピーを out に追加
    /// @return 記録したかどうか
    bool record(int step, const Wave2DGrid& grid, SnapshotCollection& out) const;

    /// 1 回の実行で記録されるスナップショット数
    static std::size_t expected_snapshot_count(int Nt, int store_every);

private:
    int store_every;
    int Nt;
};
