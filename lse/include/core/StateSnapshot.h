// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of LSE (Lifecycle State Engine).

#pragma once

#include "common/Constants.h"
#include "common/JsonUtils.h"
#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <stdexcept>
#include <vector>

namespace LSE {

/**
 * @brief Data carried alongside a machine's state
 *
 * Always a JSON object; fields are domain-specific.
 */
using Context = json;

/**
 * @brief Immutable record of a machine at one point in its history
 */
template <typename TState> struct StateSnapshot {
    TState state;
    Context context;

    // Logical timestamp: 0 at construction/reset, +1 per recorded snapshot
    uint64_t sequence = Constants::INITIAL_SNAPSHOT_SEQUENCE;

    // Wall-clock time from the owning machine's Clock
    int64_t timestampMs = 0;
};

/**
 * @brief Bounded FIFO of snapshots
 *
 * Keeps at most capacity() entries; capturing past the bound evicts the
 * oldest entry. Contexts are stored by value so later mutation of the
 * machine never rewrites recorded history.
 */
template <typename TState> class SnapshotHistory {
public:
    using Snapshot = StateSnapshot<TState>;

    /**
     * @throws std::invalid_argument if capacity is zero
     */
    explicit SnapshotHistory(std::size_t capacity = Constants::DEFAULT_HISTORY_CAPACITY) : capacity_(capacity) {
        if (capacity_ == 0) {
            throw std::invalid_argument("SnapshotHistory: capacity must be at least 1");
        }
    }

    /**
     * @brief Append a snapshot, assigning the next logical sequence number
     * @return The recorded snapshot
     */
    const Snapshot &capture(TState state, const Context &context, int64_t timestampMs) {
        snapshots_.push_back(Snapshot{state, context, nextSequence_++, timestampMs});

        if (snapshots_.size() > capacity_) {
            snapshots_.pop_front();
        }

        return snapshots_.back();
    }

    /**
     * @brief Copy of retained snapshots, oldest first
     */
    std::vector<Snapshot> snapshots() const {
        return std::vector<Snapshot>(snapshots_.begin(), snapshots_.end());
    }

    std::optional<Snapshot> latest() const {
        if (snapshots_.empty()) {
            return std::nullopt;
        }
        return snapshots_.back();
    }

    /**
     * @brief Drop all snapshots and restart the logical sequence
     */
    void clear() {
        snapshots_.clear();
        nextSequence_ = Constants::INITIAL_SNAPSHOT_SEQUENCE;
    }

    std::size_t size() const {
        return snapshots_.size();
    }

    std::size_t capacity() const {
        return capacity_;
    }

private:
    std::deque<Snapshot> snapshots_;
    std::size_t capacity_;
    uint64_t nextSequence_ = Constants::INITIAL_SNAPSHOT_SEQUENCE;
};

}  // namespace LSE
