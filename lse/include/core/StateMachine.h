// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of LSE (Lifecycle State Engine).

#pragma once

#include "common/Clock.h"
#include "common/Constants.h"
#include "common/JsonUtils.h"
#include "common/LogUtils.h"
#include "common/Logger.h"
#include "core/StateSnapshot.h"
#include "core/TransitionTable.h"
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <initializer_list>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace LSE {

/**
 * @brief Generic finite state machine with JSON context and bounded history
 *
 * Holds the current state, the current context, the last N snapshots and a
 * list of subscribers. The only way to move between states is transition(),
 * which consults the TransitionTable; an event that is not legal from the
 * current state is rejected with `false` and leaves everything untouched.
 *
 * Mutations commit before subscribers run. Subscribers are called
 * synchronously, in subscription order, each inside its own try block: a
 * subscriber throwing std::exception is logged and the rest are still called.
 * When a subscriber changes the machine re-entrantly, the nested dispatch
 * supersedes the outer one, so every subscriber's last call carries the
 * current state.
 *
 * Not thread-safe. A machine has one logical owner; callers sharing a machine
 * across threads must serialize access themselves.
 *
 * States are reported in logs through a `toString(TState)` overload found by
 * argument-dependent lookup.
 *
 * @code
 * StateMachine<ServiceState> machine(table, ServiceState::Unknown, json{{"latency", nullptr}});
 * auto unsubscribe = machine.subscribe([](ServiceState state, const Context &context) { render(state, context); });
 * if (!machine.transition("CHECK", json{{"lastCheck", now}})) {
 *     // not legal from the current state
 * }
 * unsubscribe();
 * @endcode
 *
 * @tparam TState Enum type of the domain's states
 */
template <typename TState> class StateMachine {
public:
    using State = TState;
    using Table = TransitionTable<TState>;
    using Snapshot = StateSnapshot<TState>;
    using Listener = std::function<void(TState, const Context &)>;
    using Unsubscribe = std::function<void()>;

    /**
     * @brief Construct and record the initial snapshot
     *
     * @param table Legal transitions
     * @param initialState State entered at construction and on reset()
     * @param initialContext Context restored on reset(); must be a JSON object
     * @param clock Time source for snapshot timestamps and domain helpers
     * @param historyCapacity Maximum number of retained snapshots
     * @throws std::invalid_argument on an unusable configuration: initial state
     *         unknown to the table, ambiguous table, non-object context,
     *         empty clock or zero capacity
     */
    StateMachine(Table table, TState initialState, Context initialContext, Clock clock = systemClock(),
                 std::size_t historyCapacity = Constants::DEFAULT_HISTORY_CAPACITY)
        : table_(std::move(table)), initialState_(initialState), initialContext_(std::move(initialContext)),
          state_(initialState), clock_(std::move(clock)), history_(historyCapacity),
          subscribers_(std::make_shared<SubscriberList>()) {
        validateConfiguration();
        context_ = initialContext_;
        captureSnapshot();
    }

    // Unsubscribe handles refer to this instance's subscriber list
    StateMachine(const StateMachine &) = delete;
    StateMachine &operator=(const StateMachine &) = delete;
    StateMachine(StateMachine &&) = delete;
    StateMachine &operator=(StateMachine &&) = delete;

    TState currentState() const {
        return state_;
    }

    /**
     * @brief Copy of the current context
     *
     * Editing the returned value never affects the machine.
     */
    Context currentContext() const {
        return context_;
    }

    bool canTransition(const std::string &event) const {
        return table_.accepts(event, state_);
    }

    /**
     * @brief Events legal from the current state, in declaration order
     */
    std::vector<std::string> availableEvents() const {
        return table_.eventsFrom(state_);
    }

    /**
     * @brief Fire event, merging delta into the context on success
     *
     * @param event Event name
     * @param delta JSON object of fields to overwrite, or null for none
     * @return true if the transition happened; false if event is not legal
     *         from the current state (nothing changes)
     * @throws std::invalid_argument if delta is neither an object nor null
     */
    bool transition(const std::string &event, const Context &delta = Context()) {
        requireMergeable(delta);

        const auto *rule = table_.findRule(event, state_);
        if (!rule) {
            LOG_WARN("StateMachine: Invalid transition: {} from {}", Log::sanitize(event), toString(state_));
            return false;
        }

        Context merged = JsonUtils::shallowMerge(context_, delta);

        const TState previousState = state_;
        state_ = rule->to;
        context_ = std::move(merged);
        captureSnapshot();

        LOG_DEBUG("StateMachine: State transition: {} -> {} ({})", toString(previousState), toString(state_),
                  Log::sanitize(event));

        notifySubscribers();
        return true;
    }

    /**
     * @brief Merge delta into the context without changing state
     *
     * Does not consult the transition table and does not record a snapshot.
     *
     * @throws std::invalid_argument if delta is neither an object nor null
     */
    void updateContext(const Context &delta) {
        requireMergeable(delta);

        context_ = JsonUtils::shallowMerge(context_, delta);
        notifySubscribers();
    }

    /**
     * @brief Register a listener and call it once with the current state
     *
     * @param listener Called with (state, context) now and after every change
     * @return Function removing this registration; safe to call more than
     *         once and after the machine is destroyed
     * @throws std::invalid_argument if listener is empty
     */
    Unsubscribe subscribe(Listener listener) {
        if (!listener) {
            throw std::invalid_argument("StateMachine: Cannot subscribe an empty listener");
        }

        const uint64_t id = subscribers_->nextId++;
        subscribers_->entries.push_back(SubscriberEntry{id, listener});

        const Context context = context_;
        try {
            invokeListener(listener, state_, context);
        } catch (...) {
            // No handle reaches the caller; drop the registration and rethrow
            subscribers_->remove(id);
            throw;
        }

        std::weak_ptr<SubscriberList> weakList = subscribers_;
        return [weakList, id]() {
            if (auto list = weakList.lock()) {
                list->remove(id);
            }
        };
    }

    /**
     * @brief Copy of the retained snapshots, oldest first
     */
    std::vector<Snapshot> history() const {
        return history_.snapshots();
    }

    /**
     * @brief Restore the initial state and context, restart history, notify
     */
    void reset() {
        state_ = initialState_;
        context_ = initialContext_;
        history_.clear();
        captureSnapshot();

        LOG_DEBUG("StateMachine: Reset to {}", toString(state_));

        notifySubscribers();
    }

    bool matches(TState state) const {
        return state_ == state;
    }

    bool matches(std::initializer_list<TState> states) const {
        return std::find(states.begin(), states.end(), state_) != states.end();
    }

    bool matches(const std::vector<TState> &states) const {
        return std::find(states.begin(), states.end(), state_) != states.end();
    }

    TState initialState() const {
        return initialState_;
    }

    const Table &transitionTable() const {
        return table_;
    }

    std::size_t historyCapacity() const {
        return history_.capacity();
    }

    std::size_t subscriberCount() const {
        return subscribers_->entries.size();
    }

    /**
     * @brief Current time from this machine's clock (epoch milliseconds)
     */
    int64_t now() const {
        return clock_();
    }

private:
    struct SubscriberEntry {
        uint64_t id;
        Listener listener;
    };

    // Shared with unsubscribe handles through weak_ptr
    struct SubscriberList {
        std::vector<SubscriberEntry> entries;
        uint64_t nextId = 1;

        const SubscriberEntry *find(uint64_t id) const {
            auto it = std::find_if(entries.begin(), entries.end(),
                                   [id](const SubscriberEntry &entry) { return entry.id == id; });
            return it != entries.end() ? &*it : nullptr;
        }

        void remove(uint64_t id) {
            entries.erase(std::remove_if(entries.begin(), entries.end(),
                                         [id](const SubscriberEntry &entry) { return entry.id == id; }),
                          entries.end());
        }
    };

    void validateConfiguration() const {
        if (!clock_) {
            throw std::invalid_argument("StateMachine: Clock must not be empty");
        }

        if (!initialContext_.is_object()) {
            throw std::invalid_argument("StateMachine: Initial context must be a JSON object");
        }

        if (!table_.contains(initialState_)) {
            throw std::invalid_argument(std::string("StateMachine: Initial state ") + toString(initialState_) +
                                        " does not appear in the transition table");
        }

        const auto ambiguities = table_.findAmbiguities();
        if (!ambiguities.empty()) {
            const auto &first = ambiguities.front();
            throw std::invalid_argument("StateMachine: Ambiguous transition table: event " + first.event +
                                        " from " + toString(first.state) + " matches rules " +
                                        std::to_string(first.firstRule) + " and " +
                                        std::to_string(first.secondRule));
        }
    }

    static void requireMergeable(const Context &delta) {
        if (!JsonUtils::isMergeable(delta)) {
            throw std::invalid_argument(std::string("StateMachine: Context delta must be an object or null, got ") +
                                        delta.type_name());
        }
    }

    void captureSnapshot() {
        history_.capture(state_, context_, clock_());
    }

    void notifySubscribers() {
        // Copies: listeners may transition, subscribe or unsubscribe re-entrantly
        const TState state = state_;
        const Context context = context_;
        const uint64_t generation = ++dispatchGeneration_;

        std::vector<uint64_t> ids;
        ids.reserve(subscribers_->entries.size());
        for (const auto &entry : subscribers_->entries) {
            ids.push_back(entry.id);
        }

        auto list = subscribers_;
        for (uint64_t id : ids) {
            const SubscriberEntry *entry = list->find(id);
            if (!entry) {
                continue;  // Unsubscribed by an earlier listener
            }

            Listener listener = entry->listener;
            invokeListener(listener, state, context);

            if (dispatchGeneration_ != generation) {
                break;  // A nested dispatch already delivered a newer state to everyone
            }
        }
    }

    static void invokeListener(const Listener &listener, TState state, const Context &context) {
        try {
            listener(state, context);
        } catch (const std::exception &e) {
            LOG_ERROR("StateMachine: Subscriber failed while handling state {}: {}", toString(state),
                      Log::sanitize(e.what()));
        }
    }

    Table table_;
    TState initialState_;
    Context initialContext_;
    TState state_;
    Context context_;
    Clock clock_;
    SnapshotHistory<TState> history_;
    std::shared_ptr<SubscriberList> subscribers_;
    uint64_t dispatchGeneration_ = 0;
};

}  // namespace LSE
