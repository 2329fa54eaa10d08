// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of LSE (Lifecycle State Engine).

#include "domain/ProtectionMachine.h"
#include <stdexcept>

namespace LSE {

const char *toString(ProtectionState state) {
    switch (state) {
    case ProtectionState::Idle:
        return "idle";
    case ProtectionState::Checking:
        return "checking";
    case ProtectionState::Starting:
        return "starting";
    case ProtectionState::Active:
        return "active";
    case ProtectionState::Degraded:
        return "degraded";
    case ProtectionState::Recovering:
        return "recovering";
    case ProtectionState::Stopping:
        return "stopping";
    case ProtectionState::Error:
        return "error";
    default:
        return "unknown";
    }
}

const TransitionTable<ProtectionState> &protectionTransitions() {
    using S = ProtectionState;
    namespace E = ProtectionEvents;

    static const TransitionTable<ProtectionState> table{
        // Normal flow
        {{S::Idle}, S::Checking, E::CHECK},
        {{S::Checking}, S::Starting, E::START},
        {{S::Starting}, S::Active, E::STARTED},

        // Degradation and recovery
        {{S::Active}, S::Degraded, E::DEGRADE},
        {{S::Degraded}, S::Recovering, E::RECOVER},
        {{S::Recovering}, S::Active, E::RECOVERED},
        {{S::Recovering}, S::Degraded, E::RECOVER_FAILED},

        // Stopping
        {{S::Active, S::Degraded, S::Recovering}, S::Stopping, E::STOP},
        {{S::Stopping}, S::Idle, E::STOPPED},

        {{S::Idle, S::Checking, S::Starting, S::Active, S::Degraded, S::Recovering, S::Stopping}, S::Error, E::ERROR},
        {{S::Idle, S::Checking, S::Starting, S::Active, S::Degraded, S::Recovering, S::Stopping, S::Error}, S::Idle,
         E::RESET},
        {{S::Error}, S::Checking, E::RETRY},
    };

    return table;
}

Context protectionInitialContext(int64_t now) {
    return json{
        {ProtectionFields::CURRENT_STRATEGY, nullptr},
        {ProtectionFields::LAST_ERROR, nullptr},
        {ProtectionFields::RECOVERY_ATTEMPTS, 0},
        {ProtectionFields::STARTED_AT, nullptr},
        {ProtectionFields::LAST_STATE_CHANGE, now},
    };
}

std::shared_ptr<ProtectionMachine> createProtectionMachine(Clock clock) {
    if (!clock) {
        throw std::invalid_argument("createProtectionMachine: Clock must not be empty");
    }

    const int64_t now = clock();
    return std::make_shared<ProtectionMachine>(protectionTransitions(), ProtectionState::Idle,
                                               protectionInitialContext(now), std::move(clock));
}

bool startProtection(ProtectionMachine &machine, const std::string &strategyId) {
    if (!machine.canTransition(ProtectionEvents::CHECK)) {
        LOG_DEBUG("Protection: Cannot start strategy {} from {}", Log::sanitize(strategyId),
                  toString(machine.currentState()));
        return false;
    }

    return machine.transition(ProtectionEvents::CHECK, json{
                                                           {ProtectionFields::CURRENT_STRATEGY, strategyId},
                                                           {ProtectionFields::LAST_ERROR, nullptr},
                                                           {ProtectionFields::RECOVERY_ATTEMPTS, 0},
                                                           {ProtectionFields::LAST_STATE_CHANGE, machine.now()},
                                                       });
}

bool activateProtection(ProtectionMachine &machine) {
    if (machine.matches(ProtectionState::Checking)) {
        return machine.transition(ProtectionEvents::START, json{{ProtectionFields::LAST_STATE_CHANGE, machine.now()}});
    }

    if (machine.matches(ProtectionState::Starting)) {
        const int64_t now = machine.now();
        return machine.transition(ProtectionEvents::STARTED, json{
                                                                 {ProtectionFields::STARTED_AT, now},
                                                                 {ProtectionFields::LAST_STATE_CHANGE, now},
                                                             });
    }

    return false;
}

bool stopProtection(ProtectionMachine &machine) {
    if (!machine.canTransition(ProtectionEvents::STOP)) {
        return false;
    }

    if (!machine.transition(ProtectionEvents::STOP, json{{ProtectionFields::LAST_STATE_CHANGE, machine.now()}})) {
        return false;
    }

    return machine.transition(ProtectionEvents::STOPPED, json{
                                                             {ProtectionFields::CURRENT_STRATEGY, nullptr},
                                                             {ProtectionFields::STARTED_AT, nullptr},
                                                             {ProtectionFields::LAST_STATE_CHANGE, machine.now()},
                                                         });
}

bool handleProtectionError(ProtectionMachine &machine, const std::string &error) {
    return machine.transition(ProtectionEvents::ERROR, json{
                                                           {ProtectionFields::LAST_ERROR, error},
                                                           {ProtectionFields::LAST_STATE_CHANGE, machine.now()},
                                                       });
}

bool degradeProtection(ProtectionMachine &machine, const std::string &reason) {
    return machine.transition(ProtectionEvents::DEGRADE, json{
                                                             {ProtectionFields::LAST_ERROR, reason},
                                                             {ProtectionFields::LAST_STATE_CHANGE, machine.now()},
                                                         });
}

bool attemptRecovery(ProtectionMachine &machine) {
    if (!machine.matches(ProtectionState::Degraded)) {
        return false;
    }

    const Context context = machine.currentContext();
    const int64_t attempts = JsonUtils::getInt(context, ProtectionFields::RECOVERY_ATTEMPTS);

    return machine.transition(ProtectionEvents::RECOVER, json{
                                                             {ProtectionFields::RECOVERY_ATTEMPTS, attempts + 1},
                                                             {ProtectionFields::LAST_STATE_CHANGE, machine.now()},
                                                         });
}

bool completeRecovery(ProtectionMachine &machine) {
    return machine.transition(ProtectionEvents::RECOVERED, json{
                                                               {ProtectionFields::LAST_ERROR, nullptr},
                                                               {ProtectionFields::LAST_STATE_CHANGE, machine.now()},
                                                           });
}

bool failRecovery(ProtectionMachine &machine, const std::string &error) {
    return machine.transition(ProtectionEvents::RECOVER_FAILED,
                              json{
                                  {ProtectionFields::LAST_ERROR, error},
                                  {ProtectionFields::LAST_STATE_CHANGE, machine.now()},
                              });
}

bool retryProtection(ProtectionMachine &machine) {
    return machine.transition(ProtectionEvents::RETRY, json{
                                                           {ProtectionFields::LAST_ERROR, nullptr},
                                                           {ProtectionFields::LAST_STATE_CHANGE, machine.now()},
                                                       });
}

bool resetProtection(ProtectionMachine &machine) {
    return machine.transition(ProtectionEvents::RESET, json{{ProtectionFields::LAST_STATE_CHANGE, machine.now()}});
}

}  // namespace LSE
