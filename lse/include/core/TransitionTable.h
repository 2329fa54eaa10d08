// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of LSE (Lifecycle State Engine).

#pragma once

#include <algorithm>
#include <cstddef>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <vector>

namespace LSE {

/**
 * @brief One legal move: any state in `from` goes to `to` on `event`
 *
 * Aggregate so tables read as declarations:
 * @code
 * {{State::Idle}, State::Checking, "CHECK"},
 * {{State::Active, State::Degraded}, State::Stopping, "STOP"},
 * @endcode
 *
 * @tparam TState Enum type of the domain's states
 */
template <typename TState> struct TransitionRule {
    std::vector<TState> from;
    TState to;
    std::string event;

    bool acceptsFrom(TState state) const {
        return std::find(from.begin(), from.end(), state) != from.end();
    }
};

/**
 * @brief Two rules that both answer the same (event, state) pair
 *
 * Indices refer to declaration order in the table.
 */
template <typename TState> struct TransitionAmbiguity {
    std::string event;
    TState state;
    std::size_t firstRule;
    std::size_t secondRule;
};

/**
 * @brief Ordered, immutable list of transition rules for one state type
 *
 * Lookup is first-declared-wins. StateMachine refuses tables with
 * ambiguities, so in practice at most one rule ever matches.
 */
template <typename TState> class TransitionTable {
public:
    using Rule = TransitionRule<TState>;
    using Ambiguity = TransitionAmbiguity<TState>;

    TransitionTable() = default;

    TransitionTable(std::initializer_list<Rule> rules) : TransitionTable(std::vector<Rule>(rules)) {}

    /**
     * @throws std::invalid_argument if a rule has an empty event name or no source state
     */
    explicit TransitionTable(std::vector<Rule> rules) : rules_(std::move(rules)) {
        for (std::size_t i = 0; i < rules_.size(); ++i) {
            if (rules_[i].event.empty()) {
                throw std::invalid_argument("TransitionTable: rule " + std::to_string(i) + " has an empty event name");
            }
            if (rules_[i].from.empty()) {
                throw std::invalid_argument("TransitionTable: rule " + std::to_string(i) + " ('" + rules_[i].event +
                                            "') has no source state");
            }
        }
    }

    /**
     * @brief Find the first rule accepting event from state
     * @return Matching rule, or nullptr when the transition is not legal
     */
    const Rule *findRule(const std::string &event, TState state) const {
        for (const auto &rule : rules_) {
            if (rule.event == event && rule.acceptsFrom(state)) {
                return &rule;
            }
        }
        return nullptr;
    }

    bool accepts(const std::string &event, TState state) const {
        return findRule(event, state) != nullptr;
    }

    /**
     * @brief Distinct events legal from state, in declaration order
     */
    std::vector<std::string> eventsFrom(TState state) const {
        std::vector<std::string> events;
        for (const auto &rule : rules_) {
            if (rule.acceptsFrom(state) && std::find(events.begin(), events.end(), rule.event) == events.end()) {
                events.push_back(rule.event);
            }
        }
        return events;
    }

    /**
     * @brief Check whether any rule names state as a source or a target
     */
    bool contains(TState state) const {
        return std::any_of(rules_.begin(), rules_.end(),
                           [state](const Rule &rule) { return rule.to == state || rule.acceptsFrom(state); });
    }

    /**
     * @brief List every pair of rules sharing an event and a source state
     */
    std::vector<Ambiguity> findAmbiguities() const {
        std::vector<Ambiguity> ambiguities;
        for (std::size_t i = 0; i < rules_.size(); ++i) {
            for (std::size_t j = i + 1; j < rules_.size(); ++j) {
                if (rules_[i].event != rules_[j].event) {
                    continue;
                }
                for (TState state : rules_[i].from) {
                    if (rules_[j].acceptsFrom(state)) {
                        ambiguities.push_back(Ambiguity{rules_[i].event, state, i, j});
                    }
                }
            }
        }
        return ambiguities;
    }

    const std::vector<Rule> &rules() const {
        return rules_;
    }

    std::size_t size() const {
        return rules_.size();
    }

    bool empty() const {
        return rules_.empty();
    }

private:
    std::vector<Rule> rules_;
};

}  // namespace LSE
