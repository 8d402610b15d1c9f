// snapshot_recorder.cpp
#include "snapshot_recorder.hpp"
#include "wave2d_params.hpp"

#include <stdexcept>
#include <string>

SnapshotCollection::SnapshotCollection(int N_)
    : N(N_)
{
}

void SnapshotCollection::append(int step, const Field& field) {
    if (step < 0) {
        throw std::invalid_argument("SnapshotCollection::append: negative step "
                                    + std::to_string(step));
    }
    if (!data.empty() && step <= data.rbegin()->first) {
        throw std::logic_error("SnapshotCollection::append: step "
                               + std::to_string(step) + " is not after step "
                               + std::to_string(data.rbegin()->first));
    }
    const std::size_t expected = static_cast<std::size_t>(N + 1) * static_cast<std::size_t>(N + 1);
    if (field.size() != expected) {
        throw std::invalid_argument("SnapshotCollection::append: field has "
                                    + std::to_string(field.size()) + " values, expected "
                                    + std::to_string(expected));
    }
    data.emplace_hint(data.end(), step, field);
}

const SnapshotCollection::Field& SnapshotCollection::at(int step) const {
    auto it = data.find(step);
    if (it == data.end()) {
        throw std::out_of_range("SnapshotCollection::at: no snapshot at step "
                                + std::to_string(step));
    }
    return it->second;
}

double SnapshotCollection::value(int step, int i, int j) const {
    return at(step)[static_cast<std::size_t>(j) * static_cast<std::size_t>(N + 1)
                    + static_cast<std::size_t>(i)];
}

std::vector<int> SnapshotCollection::steps() const {
    std::vector<int> keys;
    keys.reserve(data.size());
    for (const auto& kv : data) {
        keys.push_back(kv.first);
    }
    return keys;
}

int SnapshotCollection::first_step() const {
    if (data.empty()) {
        throw std::out_of_range("SnapshotCollection::first_step: collection is empty");
    }
    return data.begin()->first;
}

int SnapshotCollection::last_step() const {
    if (data.empty()) {
        throw std::out_of_range("SnapshotCollection::last_step: collection is empty");
    }
    return data.rbegin()->first;
}

SnapshotRecorder::SnapshotRecorder(int store_every_, int Nt_)
    : store_every(store_every_),
      Nt(Nt_)
{
    if (store_every < 1) {
        throw Wave2DParameterError(Wave2DErrorKind::InvalidRecordingInterval,
                                   "store_every must satisfy store_every >= 1 (got "
                                   + std::to_string(store_every) + ")");
    }
}

bool SnapshotRecorder::should_record(int step) const {
    if (step < 0 || step > Nt) return false;
    return step % store_every == 0 || step == Nt;
}

bool SnapshotRecorder::record(int step, const Wave2DGrid& grid, SnapshotCollection& out) const {
    if (!should_record(step)) {
        return false;
    }
    out.append(step, grid.current());
    return true;
}

std::size_t SnapshotRecorder::expected_snapshot_count(int Nt, int store_every) {
    if (Nt < 0 || store_every < 1) return 0;
    // 0, s, 2s, ... (<= Nt) に加えて、Nt が s の倍数でなければ Nt
    std::size_t count = static_cast<std::size_t>(Nt / store_every) + 1;
    if (Nt % store_every != 0) {
        ++count;
    }
    return count;
}
