#include "common/TestUtils.h"
#include "domain/ProtectionMachine.h"
#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace LSE {
namespace Test {

using S = ProtectionState;
namespace F = ProtectionFields;

class ProtectionMachineTest : public ::testing::Test {
protected:
    void SetUp() override {
        machine_ = createProtectionMachine(clock_.clock());
    }

    // Drive a fresh machine to active through the public helpers
    void bringToActive(const std::string &strategy = "strategyA") {
        ASSERT_TRUE(startProtection(*machine_, strategy));
        ASSERT_TRUE(activateProtection(*machine_));
        ASSERT_TRUE(activateProtection(*machine_));
        ASSERT_EQ(machine_->currentState(), S::Active);
    }

    Utils::ManualClock clock_;
    std::shared_ptr<ProtectionMachine> machine_;
};

TEST_F(ProtectionMachineTest, FreshMachineIsIdleWithEmptySession) {
    EXPECT_EQ(machine_->currentState(), S::Idle);

    const Context context = machine_->currentContext();
    EXPECT_TRUE(context[F::CURRENT_STRATEGY].is_null());
    EXPECT_TRUE(context[F::LAST_ERROR].is_null());
    EXPECT_EQ(context[F::RECOVERY_ATTEMPTS], 0);
    EXPECT_TRUE(context[F::STARTED_AT].is_null());
    EXPECT_EQ(context[F::LAST_STATE_CHANGE], Utils::BASE_TIME_MS);
    EXPECT_EQ(machine_->history().size(), 1u);
}

TEST_F(ProtectionMachineTest, StateNamesAreLowercase) {
    EXPECT_STREQ(toString(S::Idle), "idle");
    EXPECT_STREQ(toString(S::Checking), "checking");
    EXPECT_STREQ(toString(S::Starting), "starting");
    EXPECT_STREQ(toString(S::Active), "active");
    EXPECT_STREQ(toString(S::Degraded), "degraded");
    EXPECT_STREQ(toString(S::Recovering), "recovering");
    EXPECT_STREQ(toString(S::Stopping), "stopping");
    EXPECT_STREQ(toString(S::Error), "error");
}

TEST_F(ProtectionMachineTest, StartAndActivateReachActive) {
    clock_.advance(100);
    ASSERT_TRUE(startProtection(*machine_, "strategyA"));
    EXPECT_EQ(machine_->currentState(), S::Checking);
    EXPECT_EQ(machine_->currentContext()[F::CURRENT_STRATEGY], "strategyA");
    EXPECT_TRUE(machine_->currentContext()[F::STARTED_AT].is_null());

    clock_.advance(100);
    ASSERT_TRUE(activateProtection(*machine_));
    EXPECT_EQ(machine_->currentState(), S::Starting);
    EXPECT_TRUE(machine_->currentContext()[F::STARTED_AT].is_null());

    clock_.advance(100);
    ASSERT_TRUE(activateProtection(*machine_));
    EXPECT_EQ(machine_->currentState(), S::Active);

    const Context context = machine_->currentContext();
    ASSERT_FALSE(context[F::STARTED_AT].is_null());
    EXPECT_EQ(context[F::STARTED_AT], Utils::BASE_TIME_MS + 300);
    EXPECT_EQ(context[F::LAST_STATE_CHANGE], Utils::BASE_TIME_MS + 300);
    EXPECT_EQ(context[F::CURRENT_STRATEGY], "strategyA");
}

TEST_F(ProtectionMachineTest, StartClearsPreviousErrorAndAttempts) {
    ASSERT_TRUE(handleProtectionError(*machine_, "driver missing"));
    ASSERT_TRUE(resetProtection(*machine_));
    machine_->updateContext(json{{F::RECOVERY_ATTEMPTS, 4}});

    ASSERT_TRUE(startProtection(*machine_, "strategyB"));

    const Context context = machine_->currentContext();
    EXPECT_TRUE(context[F::LAST_ERROR].is_null());
    EXPECT_EQ(context[F::RECOVERY_ATTEMPTS], 0);
    EXPECT_EQ(context[F::CURRENT_STRATEGY], "strategyB");
}

TEST_F(ProtectionMachineTest, StartOutsideIdleFailsWithoutSideEffects) {
    bringToActive();
    const Context before = machine_->currentContext();
    const auto historySize = machine_->history().size();

    EXPECT_FALSE(startProtection(*machine_, "strategyB"));

    EXPECT_EQ(machine_->currentState(), S::Active);
    EXPECT_EQ(machine_->currentContext(), before);
    EXPECT_EQ(machine_->history().size(), historySize);
}

TEST_F(ProtectionMachineTest, ActivateFailsOutsideStartup) {
    EXPECT_FALSE(activateProtection(*machine_));
    EXPECT_EQ(machine_->currentState(), S::Idle);

    bringToActive();
    EXPECT_FALSE(activateProtection(*machine_));
    EXPECT_EQ(machine_->currentState(), S::Active);
}

TEST_F(ProtectionMachineTest, StopReturnsToIdleAndClearsSession) {
    bringToActive();
    const auto historySize = machine_->history().size();

    ASSERT_TRUE(stopProtection(*machine_));

    EXPECT_EQ(machine_->currentState(), S::Idle);
    const Context context = machine_->currentContext();
    EXPECT_TRUE(context[F::CURRENT_STRATEGY].is_null());
    EXPECT_TRUE(context[F::STARTED_AT].is_null());

    // stopping then idle
    const auto history = machine_->history();
    ASSERT_EQ(history.size(), historySize + 2);
    EXPECT_EQ(history[history.size() - 2].state, S::Stopping);
    EXPECT_EQ(history.back().state, S::Idle);
}

TEST_F(ProtectionMachineTest, StopWorksFromDegradedAndRecovering) {
    bringToActive();
    ASSERT_TRUE(degradeProtection(*machine_, "latency spike"));
    ASSERT_TRUE(stopProtection(*machine_));
    EXPECT_EQ(machine_->currentState(), S::Idle);

    bringToActive();
    ASSERT_TRUE(degradeProtection(*machine_, "latency spike"));
    ASSERT_TRUE(attemptRecovery(*machine_));
    ASSERT_TRUE(stopProtection(*machine_));
    EXPECT_EQ(machine_->currentState(), S::Idle);
}

TEST_F(ProtectionMachineTest, StopFromIdleFailsWithoutSideEffects) {
    const Context before = machine_->currentContext();

    EXPECT_FALSE(stopProtection(*machine_));

    EXPECT_EQ(machine_->currentState(), S::Idle);
    EXPECT_EQ(machine_->currentContext(), before);
    EXPECT_EQ(machine_->history().size(), 1u);
}

TEST_F(ProtectionMachineTest, ErrorIsReachableFromEveryNonErrorState) {
    const std::vector<std::vector<std::string>> paths = {
        {},
        {"CHECK"},
        {"CHECK", "START"},
        {"CHECK", "START", "STARTED"},
        {"CHECK", "START", "STARTED", "DEGRADE"},
        {"CHECK", "START", "STARTED", "DEGRADE", "RECOVER"},
        {"CHECK", "START", "STARTED", "STOP"},
    };

    for (const auto &path : paths) {
        machine_->reset();
        for (const auto &event : path) {
            ASSERT_TRUE(machine_->transition(event)) << event;
        }

        ASSERT_TRUE(handleProtectionError(*machine_, "boom"));
        EXPECT_EQ(machine_->currentState(), S::Error);
        EXPECT_EQ(machine_->currentContext()[F::LAST_ERROR], "boom");
    }
}

TEST_F(ProtectionMachineTest, ErrorFromErrorIsRejected) {
    ASSERT_TRUE(handleProtectionError(*machine_, "first"));

    EXPECT_FALSE(handleProtectionError(*machine_, "second"));
    EXPECT_EQ(machine_->currentContext()[F::LAST_ERROR], "first");
}

TEST_F(ProtectionMachineTest, DegradeRecordsReason) {
    bringToActive();

    ASSERT_TRUE(degradeProtection(*machine_, "packet loss"));

    EXPECT_EQ(machine_->currentState(), S::Degraded);
    EXPECT_EQ(machine_->currentContext()[F::LAST_ERROR], "packet loss");
}

TEST_F(ProtectionMachineTest, DegradeOnlyFromActive) {
    EXPECT_FALSE(degradeProtection(*machine_, "packet loss"));
    EXPECT_TRUE(machine_->currentContext()[F::LAST_ERROR].is_null());
}

TEST_F(ProtectionMachineTest, RecoveryCycleCountsAttempts) {
    bringToActive();
    ASSERT_TRUE(degradeProtection(*machine_, "packet loss"));

    ASSERT_TRUE(attemptRecovery(*machine_));
    EXPECT_EQ(machine_->currentState(), S::Recovering);
    EXPECT_EQ(machine_->currentContext()[F::RECOVERY_ATTEMPTS], 1);

    ASSERT_TRUE(failRecovery(*machine_, "still lossy"));
    EXPECT_EQ(machine_->currentState(), S::Degraded);
    EXPECT_EQ(machine_->currentContext()[F::LAST_ERROR], "still lossy");

    ASSERT_TRUE(attemptRecovery(*machine_));
    EXPECT_EQ(machine_->currentContext()[F::RECOVERY_ATTEMPTS], 2);

    ASSERT_TRUE(completeRecovery(*machine_));
    EXPECT_EQ(machine_->currentState(), S::Active);
    EXPECT_TRUE(machine_->currentContext()[F::LAST_ERROR].is_null());
    EXPECT_EQ(machine_->currentContext()[F::RECOVERY_ATTEMPTS], 2);
}

TEST_F(ProtectionMachineTest, AttemptRecoveryOutsideDegradedLeavesCountUntouched) {
    bringToActive();

    EXPECT_FALSE(attemptRecovery(*machine_));

    EXPECT_EQ(machine_->currentState(), S::Active);
    EXPECT_EQ(machine_->currentContext()[F::RECOVERY_ATTEMPTS], 0);
}

TEST_F(ProtectionMachineTest, RecoveryResultsRequireRecovering) {
    bringToActive();
    ASSERT_TRUE(degradeProtection(*machine_, "packet loss"));

    EXPECT_FALSE(completeRecovery(*machine_));
    EXPECT_FALSE(failRecovery(*machine_, "nope"));
    EXPECT_EQ(machine_->currentState(), S::Degraded);
    EXPECT_EQ(machine_->currentContext()[F::LAST_ERROR], "packet loss");
}

TEST_F(ProtectionMachineTest, RetryLeavesErrorForChecking) {
    ASSERT_TRUE(startProtection(*machine_, "strategyA"));
    ASSERT_TRUE(handleProtectionError(*machine_, "driver missing"));

    ASSERT_TRUE(retryProtection(*machine_));

    EXPECT_EQ(machine_->currentState(), S::Checking);
    EXPECT_TRUE(machine_->currentContext()[F::LAST_ERROR].is_null());
    EXPECT_EQ(machine_->currentContext()[F::CURRENT_STRATEGY], "strategyA");
}

TEST_F(ProtectionMachineTest, RetryOnlyFromError) {
    EXPECT_FALSE(retryProtection(*machine_));
    EXPECT_EQ(machine_->currentState(), S::Idle);
}

TEST_F(ProtectionMachineTest, ResetEventReturnsToIdleFromAnyState) {
    bringToActive();
    ASSERT_TRUE(degradeProtection(*machine_, "packet loss"));
    clock_.advance(50);

    ASSERT_TRUE(resetProtection(*machine_));

    EXPECT_EQ(machine_->currentState(), S::Idle);
    const Context context = machine_->currentContext();
    EXPECT_EQ(context[F::LAST_STATE_CHANGE], clock_.now());
    // Only RESET's own field changes
    EXPECT_EQ(context[F::CURRENT_STRATEGY], "strategyA");
    EXPECT_EQ(context[F::LAST_ERROR], "packet loss");

    ASSERT_TRUE(resetProtection(*machine_));
    EXPECT_EQ(machine_->currentState(), S::Idle);
}

TEST_F(ProtectionMachineTest, MachineResetRestoresInitialContext) {
    bringToActive();

    machine_->reset();

    EXPECT_EQ(machine_->currentState(), S::Idle);
    EXPECT_EQ(machine_->currentContext(), protectionInitialContext(Utils::BASE_TIME_MS));
    EXPECT_EQ(machine_->history().size(), 1u);
}

TEST_F(ProtectionMachineTest, AvailableEventsFollowTable) {
    EXPECT_EQ(machine_->availableEvents(), (std::vector<std::string>{"CHECK", "ERROR", "RESET"}));

    ASSERT_TRUE(handleProtectionError(*machine_, "boom"));
    EXPECT_EQ(machine_->availableEvents(), (std::vector<std::string>{"RESET", "RETRY"}));
}

TEST_F(ProtectionMachineTest, TableHasNoAmbiguities) {
    EXPECT_TRUE(protectionTransitions().findAmbiguities().empty());
}

TEST_F(ProtectionMachineTest, EmptyClockIsRejected) {
    EXPECT_THROW(createProtectionMachine(Clock()), std::invalid_argument);
}

}  // namespace Test
}  // namespace LSE
