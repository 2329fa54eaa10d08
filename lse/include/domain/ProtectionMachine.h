// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of LSE (Lifecycle State Engine).

#pragma once

#include "common/Clock.h"
#include "core/StateMachine.h"
#include <memory>
#include <string>

namespace LSE {

/**
 * @brief Phases of a protection session
 *
 * idle → checking → starting → active, with degraded/recovering branches off
 * active, a stop path back to idle, ERROR from any non-error state and RESET
 * from every state.
 */
enum class ProtectionState { Idle, Checking, Starting, Active, Degraded, Recovering, Stopping, Error };

const char *toString(ProtectionState state);

namespace ProtectionEvents {
constexpr const char *CHECK = "CHECK";
constexpr const char *START = "START";
constexpr const char *STARTED = "STARTED";
constexpr const char *DEGRADE = "DEGRADE";
constexpr const char *RECOVER = "RECOVER";
constexpr const char *RECOVERED = "RECOVERED";
constexpr const char *RECOVER_FAILED = "RECOVER_FAILED";
constexpr const char *STOP = "STOP";
constexpr const char *STOPPED = "STOPPED";
constexpr const char *ERROR = "ERROR";
constexpr const char *RESET = "RESET";
constexpr const char *RETRY = "RETRY";
}  // namespace ProtectionEvents

// Context field names
namespace ProtectionFields {
constexpr const char *CURRENT_STRATEGY = "currentStrategy";    // string | null
constexpr const char *LAST_ERROR = "lastError";                // string | null
constexpr const char *RECOVERY_ATTEMPTS = "recoveryAttempts";  // integer
constexpr const char *STARTED_AT = "startedAt";                // epoch ms | null
constexpr const char *LAST_STATE_CHANGE = "lastStateChange";   // epoch ms
}  // namespace ProtectionFields

using ProtectionMachine = StateMachine<ProtectionState>;

/**
 * @brief The protection lifecycle's transition table
 */
const TransitionTable<ProtectionState> &protectionTransitions();

/**
 * @brief Context of a fresh machine: no strategy, no error, zero recovery attempts
 * @param now Value for lastStateChange
 */
Context protectionInitialContext(int64_t now);

std::shared_ptr<ProtectionMachine> createProtectionMachine(Clock clock = systemClock());

/**
 * @brief Begin a session with strategyId (CHECK)
 *
 * Clears lastError and recoveryAttempts. Fails without side effects when the
 * machine does not accept CHECK (only idle does).
 */
bool startProtection(ProtectionMachine &machine, const std::string &strategyId);

/**
 * @brief Advance a starting session by one step
 *
 * checking → starting (START), or starting → active (STARTED, stamps
 * startedAt). Any other state fails.
 */
bool activateProtection(ProtectionMachine &machine);

/**
 * @brief Stop a running session (STOP then STOPPED)
 *
 * Clears currentStrategy and startedAt. Fails unless the machine is active,
 * degraded or recovering.
 */
bool stopProtection(ProtectionMachine &machine);

bool handleProtectionError(ProtectionMachine &machine, const std::string &error);

bool degradeProtection(ProtectionMachine &machine, const std::string &reason);

/**
 * @brief Start a recovery attempt from degraded, incrementing recoveryAttempts
 */
bool attemptRecovery(ProtectionMachine &machine);

bool completeRecovery(ProtectionMachine &machine);

bool failRecovery(ProtectionMachine &machine, const std::string &error);

/**
 * @brief Leave the error state by re-checking; clears lastError
 */
bool retryProtection(ProtectionMachine &machine);

/**
 * @brief Fire RESET (any state → idle)
 *
 * Context fields other than lastStateChange are kept; use
 * ProtectionMachine::reset() to restore the initial context as well.
 */
bool resetProtection(ProtectionMachine &machine);

}  // namespace LSE
