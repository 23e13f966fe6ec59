// test/unit/test_stake_ledger.cpp
// -----------------------------------------------------------
// Stake record lifecycle, aggregates, atomicity and reentrancy.

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>
#include <gtest/gtest.h>

#include "staking/stake_ledger.hpp"
#include "test_fixtures.hpp"

namespace {

using lockstake::core::ErrorCode;
using lockstake::staking::EventKind;
using lockstake::staking::StakeRecord;
using lockstake::test::errorOf;
using lockstake::test::kDay;
using lockstake::test::kT0;
using lockstake::test::LedgerTest;
using lockstake::test::ScriptedLedgerTest;

// ---------------------------------------------------------------- stake

TEST_F(LedgerTest, StakeCreatesActiveRecord) {
    ledger.stake("alice", 1000, 0);

    StakeRecord r = ledger.getStake("alice");
    EXPECT_TRUE(r.isActive);
    EXPECT_EQ(r.principal, 1000u);
    EXPECT_EQ(r.startTime, kT0);
    EXPECT_EQ(r.maturityTime - r.startTime, registry.get(0).lockSeconds);
    EXPECT_EQ(r.lockDays, 90u);
    EXPECT_EQ(r.percentage, 10u);
    EXPECT_EQ(r.totalClaimed, 0u);
    EXPECT_EQ(r.lastClaimTime, kT0);

    EXPECT_EQ(bank.balanceOf("alice"), 9000u);
    EXPECT_EQ(bank.poolBalance(), 101000u);
    EXPECT_EQ(ledger.participantCount(), 1u);
    ASSERT_EQ(ledger.events().size(), 1u);
    EXPECT_EQ(ledger.events()[0].kind, EventKind::Staked);
    EXPECT_EQ(ledger.events()[0].amount, 1000u);
}

TEST_F(LedgerTest, SecondStakeAlwaysFailsAlreadyStaking) {
    ledger.stake("alice", 1000, 0);
    auto digest = ledger.stateDigest();

    EXPECT_EQ(errorOf([&] { ledger.stake("alice", 500, 1); }), ErrorCode::AlreadyStaking);
    EXPECT_EQ(errorOf([&] { ledger.stake("alice", 0, 99); }), ErrorCode::AlreadyStaking);
    EXPECT_EQ(ledger.stateDigest(), digest);
    EXPECT_EQ(bank.balanceOf("alice"), 9000u);
}

TEST_F(LedgerTest, StakePreconditionsLeaveNoTrace) {
    registry.disable("operator", 2);
    auto digest = ledger.stateDigest();

    EXPECT_EQ(errorOf([&] { ledger.stake("alice", 0, 0); }), ErrorCode::InvalidAmount);
    EXPECT_EQ(errorOf([&] { ledger.stake("alice", 1000, 3); }), ErrorCode::IndexOutOfRange);
    EXPECT_EQ(errorOf([&] { ledger.stake("alice", 1000, 2); }), ErrorCode::ScheduleDisabled);

    EXPECT_EQ(ledger.stateDigest(), digest);
    EXPECT_FALSE(ledger.isStaking("alice"));
    EXPECT_EQ(ledger.participantCount(), 0u);
    EXPECT_TRUE(ledger.events().empty());
    EXPECT_EQ(bank.balanceOf("alice"), 10000u);
}

TEST_F(LedgerTest, StakeWithoutFundsFailsTransfer) {
    auto digest = ledger.stateDigest();
    EXPECT_EQ(errorOf([&] { ledger.stake("carol", 1000, 0); }), ErrorCode::TransferFailed);

    EXPECT_EQ(ledger.getStake("carol"), StakeRecord());
    EXPECT_EQ(ledger.participantCount(), 0u);
    EXPECT_EQ(ledger.stateDigest(), digest);
    EXPECT_TRUE(ledger.events().empty());
}

// ---------------------------------------------------------------- claimReward

TEST_F(LedgerTest, TwoFullDaysPayTwo) {
    ledger.stake("alice", 1000, 0);
    clock.advance(2 * kDay);

    EXPECT_EQ(ledger.pendingReward("alice"), 2u);
    EXPECT_EQ(ledger.claimReward("alice"), 2u);

    StakeRecord r = ledger.getStake("alice");
    EXPECT_EQ(r.totalClaimed, 2u);
    EXPECT_EQ(r.lastClaimTime, kT0 + 2 * kDay);
    EXPECT_EQ(bank.balanceOf("alice"), 9002u);
    EXPECT_EQ(ledger.pendingReward("alice"), 0u);
}

TEST_F(LedgerTest, ClaimWithinADayFailsNoReward) {
    ledger.stake("alice", 1000, 0);
    clock.advance(kDay - 1);
    EXPECT_EQ(errorOf([&] { ledger.claimReward("alice"); }), ErrorCode::NoRewardAvailable);

    clock.advance(1);
    EXPECT_EQ(ledger.claimReward("alice"), 1u);
    clock.advance(kDay - 1);
    EXPECT_EQ(errorOf([&] { ledger.claimReward("alice"); }), ErrorCode::NoRewardAvailable);
    EXPECT_EQ(ledger.getStake("alice").totalClaimed, 1u);
}

TEST_F(LedgerTest, PartialDayIsNotCarriedPastAClaim) {
    ledger.stake("alice", 1000, 0);
    clock.advance(kDay + kDay / 2);
    EXPECT_EQ(ledger.claimReward("alice"), 1u);

    // 2.1 days since start, but only 0.6 since the last claim
    clock.advance(kDay * 6 / 10);
    EXPECT_EQ(errorOf([&] { ledger.claimReward("alice"); }), ErrorCode::NoRewardAvailable);
}

TEST_F(LedgerTest, TotalClaimedGrowsAcrossClaims) {
    ledger.stake("alice", 9000, 1);  // 180 days, 20%: cut 1800, 10/day
    clock.advance(3 * kDay);
    EXPECT_EQ(ledger.claimReward("alice"), 30u);
    clock.advance(5 * kDay);
    EXPECT_EQ(ledger.claimReward("alice"), 50u);
    EXPECT_EQ(ledger.getStake("alice").totalClaimed, 80u);
}

TEST_F(LedgerTest, ClaimAtOrAfterMaturityFails) {
    ledger.stake("alice", 1000, 0);
    clock.advance(90 * kDay);
    EXPECT_EQ(errorOf([&] { ledger.claimReward("alice"); }), ErrorCode::LockMatured);
    EXPECT_EQ(ledger.pendingReward("alice"), 0u);
}

TEST_F(LedgerTest, ClaimWithoutStakeFails) {
    EXPECT_EQ(errorOf([&] { ledger.claimReward("alice"); }), ErrorCode::NotStaking);
    EXPECT_EQ(ledger.pendingReward("alice"), 0u);
}

// ---------------------------------------------------------------- unstake

TEST_F(LedgerTest, UnstakeBeforeMaturityFails) {
    ledger.stake("alice", 1000, 0);
    clock.advance(90 * kDay - 1);
    EXPECT_EQ(errorOf([&] { ledger.unstake("alice"); }), ErrorCode::LockNotMatured);
    EXPECT_TRUE(ledger.isStaking("alice"));
}

TEST_F(LedgerTest, UnstakeAtMaturityReturnsPrincipalAndClearsRecord) {
    ledger.stake("alice", 1000, 0);
    clock.advance(90 * kDay);

    EXPECT_EQ(ledger.unstake("alice"), 1000u);
    EXPECT_EQ(ledger.getStake("alice"), StakeRecord());
    EXPECT_EQ(ledger.getStake("alice"), ledger.getStake("never-staked"));
    EXPECT_FALSE(ledger.isStaking("alice"));
    EXPECT_EQ(bank.balanceOf("alice"), 10000u);
    EXPECT_EQ(bank.poolBalance(), 100000u);
    EXPECT_EQ(ledger.events().back().kind, EventKind::Unstaked);
}

TEST_F(LedgerTest, UnstakeWithoutStakeFails) {
    EXPECT_EQ(errorOf([&] { ledger.unstake("alice"); }), ErrorCode::NotStaking);
}

// ---------------------------------------------------------------- restake

TEST_F(LedgerTest, RestakeBeforeMaturityFails) {
    ledger.stake("alice", 1000, 0);
    clock.advance(10 * kDay);
    EXPECT_EQ(errorOf([&] { ledger.restake("alice", 1); }), ErrorCode::LockNotMatured);
}

TEST_F(LedgerTest, RestakeKeepsPrincipalAndResetsLock) {
    ledger.stake("alice", 1000, 0);
    clock.advance(5 * kDay);
    ledger.claimReward("alice");
    clock.advance(85 * kDay);
    auto balanceBefore = bank.balanceOf("alice");
    auto poolBefore = bank.poolBalance();

    ledger.restake("alice", 1);

    StakeRecord r = ledger.getStake("alice");
    const auto now = kT0 + 90 * kDay;
    EXPECT_TRUE(r.isActive);
    EXPECT_EQ(r.principal, 1000u);
    EXPECT_EQ(r.totalClaimed, 0u);
    EXPECT_EQ(r.startTime, now);
    EXPECT_EQ(r.lastClaimTime, now);
    EXPECT_EQ(r.lockDays, 180u);
    EXPECT_EQ(r.percentage, 20u);
    EXPECT_EQ(r.maturityTime, now + 180 * kDay);

    EXPECT_EQ(bank.balanceOf("alice"), balanceBefore);
    EXPECT_EQ(bank.poolBalance(), poolBefore);
    EXPECT_EQ(ledger.participantCount(), 1u);
    EXPECT_EQ(ledger.events().back().kind, EventKind::Restaked);
}

TEST_F(LedgerTest, RestakeAfterUnstakeFailsNotStaking) {
    ledger.stake("alice", 1000, 0);
    clock.advance(90 * kDay);
    ledger.unstake("alice");
    EXPECT_EQ(errorOf([&] { ledger.restake("alice", 0); }), ErrorCode::NotStaking);
}

TEST_F(LedgerTest, RestakeChecksSchedule) {
    ledger.stake("alice", 1000, 0);
    clock.advance(90 * kDay);
    registry.disable("operator", 1);
    auto digest = ledger.stateDigest();

    EXPECT_EQ(errorOf([&] { ledger.restake("alice", 1); }), ErrorCode::ScheduleDisabled);
    EXPECT_EQ(errorOf([&] { ledger.restake("alice", 9); }), ErrorCode::IndexOutOfRange);
    EXPECT_EQ(ledger.stateDigest(), digest);
}

// ---------------------------------------------------------------- catalog

TEST_F(LedgerTest, CatalogEditsDoNotReachLiveRecords) {
    ledger.stake("alice", 1000, 0);
    ledger.upsertSchedule("operator", 90, 50);
    ledger.disableSchedule("operator", 0);

    StakeRecord r = ledger.getStake("alice");
    EXPECT_EQ(r.percentage, 10u);
    clock.advance(2 * kDay);
    EXPECT_EQ(ledger.claimReward("alice"), 2u);
    clock.advance(88 * kDay);
    EXPECT_EQ(ledger.unstake("alice"), 1000u);
}

TEST_F(LedgerTest, CatalogChangesAreJournaled) {
    auto added = ledger.upsertSchedule("operator", 30, 3);
    auto updated = ledger.upsertSchedule("operator", 30, 4);
    ledger.disableSchedule("operator", added.index);
    EXPECT_EQ(errorOf([&] { ledger.upsertSchedule("alice", 30, 99); }), ErrorCode::Unauthorized);

    auto events = ledger.events();
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0].kind, EventKind::ScheduleAdded);
    EXPECT_EQ(events[0].scheduleIndex, 3u);
    EXPECT_EQ(events[1].kind, EventKind::ScheduleUpdated);
    EXPECT_EQ(events[1].scheduleIndex, updated.index);
    EXPECT_EQ(events[1].amount, 4u);
    EXPECT_EQ(events[2].kind, EventKind::ScheduleDisabled);
    EXPECT_EQ(registry.get(3).percentage, 4u);
}

TEST_F(LedgerTest, EstimateDailyRateUsesCatalog) {
    EXPECT_EQ(ledger.estimateDailyRate(1000, 0), 1u);
    EXPECT_EQ(ledger.estimateDailyRate(12345, 1), 13u);
    registry.disable("operator", 1);
    EXPECT_EQ(ledger.estimateDailyRate(12345, 1), 13u);
    EXPECT_EQ(errorOf([&] { ledger.estimateDailyRate(1000, 3); }), ErrorCode::IndexOutOfRange);
}

// ---------------------------------------------------------------- aggregates

TEST_F(LedgerTest, RosterKeepsHistoryWhilePoolCountsLiveStakes) {
    ledger.stake("alice", 1000, 0);
    clock.advance(90 * kDay);
    ledger.unstake("alice");
    EXPECT_EQ(ledger.poolTotal(), 0u);
    EXPECT_EQ(ledger.participantCount(), 1u);
    EXPECT_EQ(ledger.activeParticipantCount(), 0u);

    ledger.stake("alice", 500, 0);
    ledger.stake("bob", 2000, 2);

    EXPECT_EQ(ledger.participantCount(), 3u);
    EXPECT_EQ(ledger.activeParticipantCount(), 2u);
    EXPECT_EQ(ledger.poolTotal(), 2500u);
    EXPECT_EQ(ledger.roster(), (std::vector<std::string>{"alice", "alice", "bob"}));
}

TEST_F(LedgerTest, StateDigestTracksLogicalState) {
    auto empty = ledger.stateDigest();
    EXPECT_EQ(empty.size(), 64u);

    ledger.stake("alice", 1000, 0);
    auto staked = ledger.stateDigest();
    EXPECT_NE(staked, empty);

    clock.advance(kDay);
    ledger.claimReward("alice");
    EXPECT_NE(ledger.stateDigest(), staked);
}

TEST(StateDigestTest, EqualHistoriesEqualDigests) {
    auto run = [](lockstake::core::Amount amount) {
        lockstake::governance::SingleOperatorGate gate("operator");
        lockstake::staking::ConfigRegistry registry(gate);
        registry.initialize();
        lockstake::core::InMemoryAssetBank bank;
        bank.credit("alice", 5000);
        lockstake::core::ManualClock clock(kT0);
        lockstake::staking::StakeLedger ledger(registry, bank, clock);
        ledger.stake("alice", amount, 1);
        return ledger.stateDigest();
    };
    EXPECT_EQ(run(1000), run(1000));
    EXPECT_NE(run(1000), run(1001));
}

// ---------------------------------------------------------------- transfer failures

TEST_F(ScriptedLedgerTest, FailedPushOnUnstakeRestoresRecord) {
    ledger.stake("alice", 1000, 0);
    clock.advance(90 * kDay);
    auto before = ledger.getStake("alice");
    auto digest = ledger.stateDigest();

    transfer.failPush = true;
    EXPECT_EQ(errorOf([&] { ledger.unstake("alice"); }), ErrorCode::TransferFailed);
    EXPECT_EQ(ledger.getStake("alice"), before);
    EXPECT_EQ(ledger.stateDigest(), digest);
    EXPECT_EQ(ledger.events().size(), 1u);

    transfer.failPush = false;
    EXPECT_EQ(ledger.unstake("alice"), 1000u);
}

TEST_F(ScriptedLedgerTest, FailedPushOnClaimRestoresRecord) {
    ledger.stake("alice", 1000, 0);
    clock.advance(3 * kDay);
    transfer.failPush = true;

    EXPECT_EQ(errorOf([&] { ledger.claimReward("alice"); }), ErrorCode::TransferFailed);
    StakeRecord r = ledger.getStake("alice");
    EXPECT_EQ(r.totalClaimed, 0u);
    EXPECT_EQ(r.lastClaimTime, kT0);
    EXPECT_TRUE(transfer.pushes.empty());
}

TEST_F(ScriptedLedgerTest, FailedPullOnStakeAfterUnstakeRestoresSentinel) {
    ledger.stake("alice", 1000, 0);
    clock.advance(90 * kDay);
    ledger.unstake("alice");

    transfer.failPull = true;
    EXPECT_EQ(errorOf([&] { ledger.stake("alice", 700, 1); }), ErrorCode::TransferFailed);
    EXPECT_EQ(ledger.getStake("alice"), StakeRecord());
    EXPECT_EQ(ledger.participantCount(), 1u);
}

TEST_F(ScriptedLedgerTest, ThrowingTransferPropagatesAndRestores) {
    ledger.stake("alice", 1000, 0);
    clock.advance(2 * kDay);
    transfer.onTransfer = [] { throw std::runtime_error("bridge offline"); };

    EXPECT_THROW(ledger.claimReward("alice"), std::runtime_error);
    EXPECT_EQ(ledger.getStake("alice").totalClaimed, 0u);

    transfer.onTransfer = nullptr;
    EXPECT_EQ(ledger.claimReward("alice"), 2u);
}

// ---------------------------------------------------------------- reentrancy

TEST_F(ScriptedLedgerTest, ReentrantUnstakeIsRejected) {
    ledger.stake("alice", 1000, 0);
    clock.advance(90 * kDay);

    std::vector<ErrorCode> reentryErrors;
    bool recordClearedBeforePush = false;
    transfer.onTransfer = [&] {
        recordClearedBeforePush = !ledger.getStake("alice").isActive;
        reentryErrors.push_back(errorOf([&] { ledger.unstake("alice"); }));
    };

    EXPECT_EQ(ledger.unstake("alice"), 1000u);
    EXPECT_TRUE(recordClearedBeforePush);
    ASSERT_EQ(reentryErrors.size(), 1u);
    EXPECT_EQ(reentryErrors[0], ErrorCode::ReentrantCall);
    ASSERT_EQ(transfer.pushes.size(), 1u);
    EXPECT_EQ(transfer.pushes[0].second, 1000u);
}

TEST_F(ScriptedLedgerTest, ReentrantClaimIsRejected) {
    ledger.stake("alice", 1000, 0);
    clock.advance(4 * kDay);

    ErrorCode reentry = ErrorCode::InvalidState;
    lockstake::core::Timestamp seenLastClaim = 0;
    transfer.onTransfer = [&] {
        seenLastClaim = ledger.getStake("alice").lastClaimTime;
        reentry = errorOf([&] { ledger.claimReward("alice"); });
    };

    EXPECT_EQ(ledger.claimReward("alice"), 4u);
    EXPECT_EQ(reentry, ErrorCode::ReentrantCall);
    EXPECT_EQ(seenLastClaim, kT0 + 4 * kDay);
    EXPECT_EQ(ledger.getStake("alice").totalClaimed, 4u);
    EXPECT_EQ(transfer.pushes.size(), 1u);
}

TEST_F(ScriptedLedgerTest, ReentrantStakeOfAnotherAccountIsRejected) {
    ErrorCode reentry = ErrorCode::InvalidState;
    transfer.onTransfer = [&] {
        reentry = errorOf([&] { ledger.stake("bob", 10, 0); });
    };

    ledger.stake("alice", 1000, 0);
    EXPECT_EQ(reentry, ErrorCode::ReentrantCall);
    EXPECT_FALSE(ledger.isStaking("bob"));
    EXPECT_EQ(ledger.roster(), (std::vector<std::string>{"alice"}));
}

// ------------------------------------------------------- 64-bit limits

TEST_F(ScriptedLedgerTest, StakeWhoseMaturityOverflowsIsRejected) {
    clock.set(std::numeric_limits<lockstake::core::Timestamp>::max() - kDay);
    const std::string before = ledger.stateDigest();

    EXPECT_EQ(errorOf([&] { ledger.stake("alice", 1000, 0); }), ErrorCode::ArithmeticOverflow);
    EXPECT_FALSE(ledger.isStaking("alice"));
    EXPECT_TRUE(transfer.pulls.empty());
    EXPECT_EQ(ledger.participantCount(), 0u);
    EXPECT_EQ(ledger.stateDigest(), before);
}

TEST_F(ScriptedLedgerTest, RestakeWhoseMaturityOverflowsKeepsRecord) {
    ledger.stake("alice", 1000, 0);
    clock.set(std::numeric_limits<lockstake::core::Timestamp>::max() - 10);
    const StakeRecord before = ledger.getStake("alice");

    EXPECT_EQ(errorOf([&] { ledger.restake("alice", 0); }), ErrorCode::ArithmeticOverflow);
    EXPECT_EQ(ledger.getStake("alice"), before);
    EXPECT_EQ(ledger.getStake("alice").maturityTime, kT0 + 90 * kDay);

    // the matured lock can still be paid out
    ledger.unstake("alice");
    ASSERT_EQ(transfer.pushes.size(), 1u);
    EXPECT_EQ(transfer.pushes[0].second, 1000u);
}

TEST_F(ScriptedLedgerTest, PoolTotalOverflowIsReported) {
    // 1% keeps principal x percentage inside 64 bits for near-max principals
    auto out = ledger.upsertSchedule("operator", 7, 1);
    const uint64_t half = std::numeric_limits<uint64_t>::max() / 2 + 1;
    ledger.stake("alice", half, out.index);
    EXPECT_EQ(ledger.poolTotal(), half);

    ledger.stake("bob", half, out.index);
    EXPECT_EQ(errorOf([&] { ledger.poolTotal(); }), ErrorCode::ArithmeticOverflow);
    EXPECT_EQ(ledger.activeParticipantCount(), 2u);
}

TEST(EventKindTest, NamesEveryKind) {
    using lockstake::staking::eventKindName;
    EXPECT_STREQ(eventKindName(EventKind::Staked), "Staked");
    EXPECT_STREQ(eventKindName(EventKind::Unstaked), "Unstaked");
    EXPECT_STREQ(eventKindName(EventKind::Restaked), "Restaked");
    EXPECT_STREQ(eventKindName(EventKind::RewardClaimed), "RewardClaimed");
    EXPECT_STREQ(eventKindName(EventKind::ScheduleAdded), "ScheduleAdded");
    EXPECT_STREQ(eventKindName(EventKind::ScheduleUpdated), "ScheduleUpdated");
    EXPECT_STREQ(eventKindName(EventKind::ScheduleDisabled), "ScheduleDisabled");
}

} // anonymous namespace
