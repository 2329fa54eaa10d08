// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of LSE (Lifecycle State Engine).

#include "domain/ServiceMachine.h"

namespace LSE {

const char *toString(ServiceState state) {
    switch (state) {
    case ServiceState::Unknown:
        return "unknown";
    case ServiceState::Checking:
        return "checking";
    case ServiceState::Available:
        return "available";
    case ServiceState::Blocked:
        return "blocked";
    case ServiceState::Error:
        return "error";
    default:
        return "invalid";
    }
}

const TransitionTable<ServiceState> &serviceTransitions() {
    using S = ServiceState;
    namespace E = ServiceEvents;

    static const TransitionTable<ServiceState> table{
        {{S::Unknown, S::Available, S::Blocked, S::Error}, S::Checking, E::CHECK},

        // Probe results
        {{S::Checking}, S::Available, E::AVAILABLE},
        {{S::Checking}, S::Blocked, E::BLOCKED},
        {{S::Checking}, S::Error, E::ERROR},

        {{S::Unknown, S::Checking, S::Available, S::Blocked, S::Error}, S::Unknown, E::RESET},
    };

    return table;
}

Context serviceInitialContext(const std::string &serviceId) {
    return json{
        {ServiceFields::SERVICE_ID, serviceId},   {ServiceFields::LAST_CHECK, nullptr},
        {ServiceFields::LATENCY, nullptr},        {ServiceFields::ERROR_COUNT, 0},
        {ServiceFields::LAST_ERROR, nullptr},     {ServiceFields::CONSECUTIVE_FAILURES, 0},
    };
}

std::shared_ptr<ServiceMachine> createServiceMachine(const std::string &serviceId, Clock clock) {
    return std::make_shared<ServiceMachine>(serviceTransitions(), ServiceState::Unknown,
                                            serviceInitialContext(serviceId), std::move(clock));
}

ServiceHealth serviceHealth(const ServiceMachine &machine) {
    const Context context = machine.currentContext();

    ServiceHealth health;
    health.serviceId = JsonUtils::getString(context, ServiceFields::SERVICE_ID);
    health.lastCheck = JsonUtils::getOptionalInt(context, ServiceFields::LAST_CHECK);
    health.latencyMs = JsonUtils::getOptionalInt(context, ServiceFields::LATENCY);
    health.errorCount = JsonUtils::getInt(context, ServiceFields::ERROR_COUNT);
    health.lastError = JsonUtils::getOptionalString(context, ServiceFields::LAST_ERROR);
    health.consecutiveFailures = JsonUtils::getInt(context, ServiceFields::CONSECUTIVE_FAILURES);
    return health;
}

bool checkService(ServiceMachine &machine) {
    return machine.transition(ServiceEvents::CHECK, json{{ServiceFields::LAST_CHECK, machine.now()}});
}

bool markServiceAvailable(ServiceMachine &machine, int64_t latencyMs) {
    return machine.transition(ServiceEvents::AVAILABLE, json{
                                                            {ServiceFields::LATENCY, latencyMs},
                                                            {ServiceFields::LAST_CHECK, machine.now()},
                                                            {ServiceFields::CONSECUTIVE_FAILURES, 0},
                                                            {ServiceFields::LAST_ERROR, nullptr},
                                                        });
}

bool markServiceBlocked(ServiceMachine &machine) {
    const Context context = machine.currentContext();
    const int64_t failures = JsonUtils::getInt(context, ServiceFields::CONSECUTIVE_FAILURES);

    return machine.transition(ServiceEvents::BLOCKED, json{
                                                          {ServiceFields::LATENCY, nullptr},
                                                          {ServiceFields::LAST_CHECK, machine.now()},
                                                          {ServiceFields::CONSECUTIVE_FAILURES, failures + 1},
                                                      });
}

bool markServiceError(ServiceMachine &machine, const std::string &error) {
    const Context context = machine.currentContext();
    const int64_t errors = JsonUtils::getInt(context, ServiceFields::ERROR_COUNT);
    const int64_t failures = JsonUtils::getInt(context, ServiceFields::CONSECUTIVE_FAILURES);

    return machine.transition(ServiceEvents::ERROR, json{
                                                        {ServiceFields::LATENCY, nullptr},
                                                        {ServiceFields::LAST_CHECK, machine.now()},
                                                        {ServiceFields::ERROR_COUNT, errors + 1},
                                                        {ServiceFields::CONSECUTIVE_FAILURES, failures + 1},
                                                        {ServiceFields::LAST_ERROR, error},
                                                    });
}

bool resetService(ServiceMachine &machine) {
    return machine.transition(ServiceEvents::RESET);
}

}  // namespace LSE
