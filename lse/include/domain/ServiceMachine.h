// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of LSE (Lifecycle State Engine).

#pragma once

#include "common/Clock.h"
#include "core/StateMachine.h"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace LSE {

/**
 * @brief Result of the most recent probe of one service
 */
enum class ServiceState { Unknown, Checking, Available, Blocked, Error };

const char *toString(ServiceState state);

namespace ServiceEvents {
constexpr const char *CHECK = "CHECK";
constexpr const char *AVAILABLE = "AVAILABLE";
constexpr const char *BLOCKED = "BLOCKED";
constexpr const char *ERROR = "ERROR";
constexpr const char *RESET = "RESET";
}  // namespace ServiceEvents

// Context field names
namespace ServiceFields {
constexpr const char *SERVICE_ID = "serviceId";
constexpr const char *LAST_CHECK = "lastCheck";                      // epoch ms | null
constexpr const char *LATENCY = "latency";                           // ms | null
constexpr const char *ERROR_COUNT = "errorCount";                    // integer, cumulative
constexpr const char *LAST_ERROR = "lastError";                      // string | null
constexpr const char *CONSECUTIVE_FAILURES = "consecutiveFailures";  // integer
}  // namespace ServiceFields

using ServiceMachine = StateMachine<ServiceState>;

/**
 * @brief Typed view of a service machine's context
 */
struct ServiceHealth {
    std::string serviceId;
    std::optional<int64_t> lastCheck;
    std::optional<int64_t> latencyMs;
    int64_t errorCount = 0;
    std::optional<std::string> lastError;
    int64_t consecutiveFailures = 0;
};

const TransitionTable<ServiceState> &serviceTransitions();

Context serviceInitialContext(const std::string &serviceId);

std::shared_ptr<ServiceMachine> createServiceMachine(const std::string &serviceId, Clock clock = systemClock());

ServiceHealth serviceHealth(const ServiceMachine &machine);

/**
 * @brief Begin a probe (CHECK), stamping lastCheck
 */
bool checkService(ServiceMachine &machine);

/**
 * @brief Record a successful probe
 *
 * Sets latency and clears both consecutiveFailures and lastError; errorCount
 * is cumulative and stays as is.
 */
bool markServiceAvailable(ServiceMachine &machine, int64_t latencyMs);

/**
 * @brief Record a blocked probe: consecutiveFailures + 1, latency cleared
 */
bool markServiceBlocked(ServiceMachine &machine);

/**
 * @brief Record a failed probe: errorCount + 1, consecutiveFailures + 1, lastError set
 */
bool markServiceError(ServiceMachine &machine, const std::string &error);

bool resetService(ServiceMachine &machine);

}  // namespace LSE
