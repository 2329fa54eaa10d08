// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of LSE (Lifecycle State Engine).

#include "domain/ServiceMachineManager.h"
#include "common/LogUtils.h"
#include "common/Logger.h"
#include <stdexcept>

namespace LSE {

ServiceMachineManager::ServiceMachineManager(Clock clock) : clock_(std::move(clock)) {
    if (!clock_) {
        throw std::invalid_argument("ServiceMachineManager requires a valid clock");
    }
}

std::shared_ptr<ServiceMachine> ServiceMachineManager::getOrCreate(const std::string &serviceId) {
    if (serviceId.empty()) {
        throw std::invalid_argument("ServiceMachineManager: Service ID cannot be empty");
    }

    std::lock_guard<std::mutex> lock(machinesMutex_);

    auto it = machines_.find(serviceId);
    if (it != machines_.end()) {
        return it->second;
    }

    auto machine = createServiceMachine(serviceId, clock_);
    machines_.emplace(serviceId, machine);

    LOG_DEBUG("ServiceMachineManager: Created machine for '{}' (total machines: {})", Log::sanitize(serviceId),
              machines_.size());

    return machine;
}

std::shared_ptr<ServiceMachine> ServiceMachineManager::get(const std::string &serviceId) const {
    std::lock_guard<std::mutex> lock(machinesMutex_);

    auto it = machines_.find(serviceId);
    if (it != machines_.end()) {
        return it->second;
    }

    return nullptr;
}

std::vector<std::shared_ptr<ServiceMachine>> ServiceMachineManager::getAll() const {
    std::lock_guard<std::mutex> lock(machinesMutex_);

    std::vector<std::shared_ptr<ServiceMachine>> machines;
    machines.reserve(machines_.size());

    for (const auto &pair : machines_) {
        machines.push_back(pair.second);
    }

    return machines;
}

std::map<std::string, ServiceState> ServiceMachineManager::getAllStates() const {
    std::map<std::string, ServiceState> states;

    for (const auto &[serviceId, machine] : snapshotMachines()) {
        states.emplace(serviceId, machine->currentState());
    }

    return states;
}

std::size_t ServiceMachineManager::checkAll() {
    std::size_t accepted = 0;

    // Helpers run outside the lock; subscribers may call back into the manager
    for (const auto &[serviceId, machine] : snapshotMachines()) {
        if (checkService(*machine)) {
            ++accepted;
        } else {
            LOG_DEBUG("ServiceMachineManager: '{}' did not accept CHECK in state {}", Log::sanitize(serviceId),
                      toString(machine->currentState()));
        }
    }

    return accepted;
}

std::size_t ServiceMachineManager::resetAll() {
    std::size_t accepted = 0;

    for (const auto &[serviceId, machine] : snapshotMachines()) {
        if (resetService(*machine)) {
            ++accepted;
        } else {
            LOG_DEBUG("ServiceMachineManager: '{}' did not accept RESET in state {}", Log::sanitize(serviceId),
                      toString(machine->currentState()));
        }
    }

    return accepted;
}

bool ServiceMachineManager::remove(const std::string &serviceId) {
    std::lock_guard<std::mutex> lock(machinesMutex_);

    auto removed = machines_.erase(serviceId);
    if (removed > 0) {
        LOG_DEBUG("ServiceMachineManager: Removed machine for '{}' (remaining machines: {})",
                  Log::sanitize(serviceId), machines_.size());
    }

    return removed > 0;
}

void ServiceMachineManager::clear() {
    std::lock_guard<std::mutex> lock(machinesMutex_);
    machines_.clear();
}

bool ServiceMachineManager::contains(const std::string &serviceId) const {
    std::lock_guard<std::mutex> lock(machinesMutex_);
    return machines_.find(serviceId) != machines_.end();
}

std::size_t ServiceMachineManager::size() const {
    std::lock_guard<std::mutex> lock(machinesMutex_);
    return machines_.size();
}

std::vector<std::pair<std::string, std::shared_ptr<ServiceMachine>>> ServiceMachineManager::snapshotMachines() const {
    std::lock_guard<std::mutex> lock(machinesMutex_);
    return std::vector<std::pair<std::string, std::shared_ptr<ServiceMachine>>>(machines_.begin(), machines_.end());
}

}  // namespace LSE
