#pragma once

#include <cstddef>
#include <cstdint>

/**
 * @file Constants.h
 * @brief Engine-wide defaults
 */

namespace LSE::Constants {

/**
 * @brief Number of snapshots a machine retains
 *
 * The oldest snapshot is evicted first once the bound is reached.
 */
constexpr std::size_t DEFAULT_HISTORY_CAPACITY = 10;

/**
 * @brief Logical sequence number of the snapshot recorded at construction and reset
 */
constexpr uint64_t INITIAL_SNAPSHOT_SEQUENCE = 0;

}  // namespace LSE::Constants
