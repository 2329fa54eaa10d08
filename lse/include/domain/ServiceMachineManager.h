// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of LSE (Lifecycle State Engine).

#pragma once

#include "common/Clock.h"
#include "domain/ServiceMachine.h"
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace LSE {

/**
 * @brief Registry holding one ServiceMachine per service id
 *
 * Machines are created lazily by getOrCreate() and live until remove() or
 * clear(). Callers own the manager; there is no global instance.
 *
 * The registry map is guarded by a mutex, so concurrent first access to the
 * same id yields a single machine. The machines themselves are not
 * synchronized: bulk operations run the helpers outside the lock, and callers
 * that share one machine across threads must serialize its use.
 */
class ServiceMachineManager {
public:
    /**
     * @param clock Clock handed to every machine this manager creates
     */
    explicit ServiceMachineManager(Clock clock = systemClock());
    ~ServiceMachineManager() = default;

    ServiceMachineManager(const ServiceMachineManager &) = delete;
    ServiceMachineManager &operator=(const ServiceMachineManager &) = delete;
    ServiceMachineManager(ServiceMachineManager &&) = delete;
    ServiceMachineManager &operator=(ServiceMachineManager &&) = delete;

    /**
     * @brief Existing machine for serviceId, or a newly registered one
     * @throws std::invalid_argument if serviceId is empty
     */
    std::shared_ptr<ServiceMachine> getOrCreate(const std::string &serviceId);

    /**
     * @return Machine for serviceId, or nullptr when not tracked
     */
    std::shared_ptr<ServiceMachine> get(const std::string &serviceId) const;

    std::vector<std::shared_ptr<ServiceMachine>> getAll() const;

    /**
     * @brief Point-in-time state of every tracked service
     */
    std::map<std::string, ServiceState> getAllStates() const;

    /**
     * @brief checkService() on every machine
     * @return Number of machines that accepted CHECK
     */
    std::size_t checkAll();

    /**
     * @brief resetService() on every machine
     * @return Number of machines that accepted RESET
     */
    std::size_t resetAll();

    /**
     * @brief Stop tracking serviceId; the machine is neither reset nor notified
     * @return true if a machine was removed
     */
    bool remove(const std::string &serviceId);

    void clear();

    bool contains(const std::string &serviceId) const;

    std::size_t size() const;

private:
    std::vector<std::pair<std::string, std::shared_ptr<ServiceMachine>>> snapshotMachines() const;

    Clock clock_;
    mutable std::mutex machinesMutex_;
    std::map<std::string, std::shared_ptr<ServiceMachine>> machines_;
};

}  // namespace LSE
