#include <gtest/gtest.h>
#include "../core/domain/UploadCoordinator.hpp"
#include "../core/adapters/SqliteEventStore.hpp"
#include "../core/sim/ManualWakeupTimer.hpp"
#include "../core/sim/MockEventTransport.hpp"
#include "../core/sim/SimulatedClock.hpp"
#include "TestEvents.hpp"
#include <limits>
#include <memory>

using namespace uplink;
using namespace std::chrono_literals;
using uplink::test::makeEvent;

class UploadCoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<sim::SimulatedClock>();
        timer_ = std::make_shared<sim::ManualWakeupTimer>();
        transport_ = std::make_shared<sim::MockEventTransport>();
        store_ = std::make_shared<adapters::SqliteEventStore>(":memory:");
        tuning_ = std::make_shared<domain::TuningStateRepository>("");
        scheduler_ = std::make_shared<domain::UploadScheduler>(tuning_, timer_, clock_, 15min);
        coordinator_ = std::make_unique<domain::UploadCoordinator>(
            store_, transport_, tuning_, scheduler_, clock_);
    }

    void insertEvents(int count, std::size_t size = 100) {
        for (int i = 0; i < count; ++i) {
            store_->insert(makeEvent("e" + std::to_string(i), "s1", i, size));
        }
    }

    std::shared_ptr<sim::SimulatedClock> clock_;
    std::shared_ptr<sim::ManualWakeupTimer> timer_;
    std::shared_ptr<sim::MockEventTransport> transport_;
    std::shared_ptr<adapters::SqliteEventStore> store_;
    std::shared_ptr<domain::TuningStateRepository> tuning_;
    std::shared_ptr<domain::UploadScheduler> scheduler_;
    std::unique_ptr<domain::UploadCoordinator> coordinator_;
};

TEST_F(UploadCoordinatorTest, EmptyStoreSendsNothingAndDoesNotReschedule) {
    auto result = coordinator_->runCycle();

    EXPECT_FALSE(result.attempted);
    EXPECT_FALSE(result.rescheduled);
    EXPECT_EQ(transport_->sendCount(), 0u);
    EXPECT_EQ(timer_->armCount(), 0u);
    EXPECT_EQ(tuning_->state().lastSendTime, clock_->epochMillis());
    EXPECT_EQ(coordinator_->getCurrentState(), domain::UploadState::Idle);
}

TEST_F(UploadCoordinatorTest, SuccessDeletesBatchAndResetsBackoff) {
    insertEvents(3);
    tuning_->update([](domain::TuningState& state) { state.backoffMs = 4000; });

    auto result = coordinator_->runCycle();

    EXPECT_TRUE(result.attempted);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.batchSize, 3u);
    EXPECT_FALSE(result.rescheduled);
    EXPECT_EQ(store_->count(), 0);
    EXPECT_EQ(tuning_->state().backoffMs, 0);
    EXPECT_EQ(timer_->armCount(), 0u);
}

TEST_F(UploadCoordinatorTest, BatchCountFollowsAverageEventSize) {
    insertEvents(5, 100);
    tuning_->update([](domain::TuningState& state) { state.maxBatchSize = 250; });

    auto result = coordinator_->runCycle();

    ASSERT_EQ(transport_->sendCount(), 1u);
    EXPECT_EQ(transport_->sentBatches()[0].size(), 2u);
    EXPECT_EQ(result.batchSize, 2u);
    EXPECT_EQ(store_->count(), 3);

    // Remaining events get another wakeup
    EXPECT_TRUE(result.rescheduled);
    EXPECT_TRUE(timer_->hasPendingWakeup());
}

TEST_F(UploadCoordinatorTest, BatchIsOldestEventsFirst) {
    store_->insert(makeEvent("newer", "s1", 50));
    store_->insert(makeEvent("older", "s1", 10));
    auto expected = store_->selectBatch(1);
    tuning_->update([](domain::TuningState& state) { state.maxBatchSize = 100; });

    coordinator_->runCycle();

    ASSERT_EQ(transport_->sendCount(), 1u);
    ASSERT_EQ(transport_->sentBatches()[0].size(), 1u);
    EXPECT_EQ(transport_->sentBatches()[0][0], expected[0].data);
    ASSERT_EQ(store_->count(), 1);
    EXPECT_EQ(store_->selectBatch(1)[0].id, "newer");
}

TEST_F(UploadCoordinatorTest, BackoffDoublesUpToMaxWait) {
    insertEvents(2);
    tuning_->update([](domain::TuningState& state) {
        state.minBatchInterval = 1000;
        state.maxWait = 5000;
    });
    transport_->setDefaultResponse(std::nullopt);

    const int64_t expected[] = {1000, 2000, 4000, 5000, 5000};
    for (int64_t backoff : expected) {
        auto result = coordinator_->runCycle();
        EXPECT_FALSE(result.success);
        EXPECT_EQ(tuning_->state().backoffMs, backoff);
    }

    EXPECT_EQ(store_->count(), 2);
}

TEST_F(UploadCoordinatorTest, BackoffSaturatesAtHugeMaxWait) {
    insertEvents(1);
    tuning_->update([](domain::TuningState& state) {
        state.maxWait = std::numeric_limits<int64_t>::max();
    });
    transport_->setDefaultResponse(std::nullopt);

    int64_t previous = 0;
    for (int i = 0; i < 70; ++i) {
        coordinator_->runCycle();
        ASSERT_GE(tuning_->state().backoffMs, previous);
        previous = tuning_->state().backoffMs;
    }

    EXPECT_EQ(tuning_->state().backoffMs, std::numeric_limits<int64_t>::max());
    EXPECT_EQ(scheduler_->nextSendDelay(),
              std::numeric_limits<int64_t>::max() - clock_->epochMillis());
    EXPECT_TRUE(timer_->hasPendingWakeup());
}

TEST_F(UploadCoordinatorTest, FailureReschedulesAfterIntervalAndBackoff) {
    insertEvents(1);
    transport_->queueFailure();

    auto result = coordinator_->runCycle();

    EXPECT_TRUE(result.rescheduled);
    ASSERT_TRUE(timer_->pendingWakeup().has_value());
    EXPECT_EQ(*timer_->pendingWakeup(), fromEpochMillis(clock_->epochMillis() + 60000 + 60000));
}

TEST_F(UploadCoordinatorTest, FailureThenSuccessLeavesOnlyUnsentEvents) {
    insertEvents(5, 100);
    tuning_->update([](domain::TuningState& state) { state.maxBatchSize = 250; });
    transport_->queueFailure();

    coordinator_->runCycle();
    EXPECT_EQ(store_->count(), 5);
    EXPECT_EQ(tuning_->state().backoffMs, domain::TuningState::kDefaultMinBatchInterval);

    clock_->advance(120s);
    auto result = coordinator_->runCycle();

    EXPECT_TRUE(result.success);
    EXPECT_EQ(store_->count(), 3);
    EXPECT_EQ(tuning_->state().backoffMs, 0);
}

TEST_F(UploadCoordinatorTest, Status204IsTreatedAsFailure) {
    insertEvents(2);
    transport_->queueStatus(204);

    auto result = coordinator_->runCycle();

    EXPECT_TRUE(result.attempted);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(store_->count(), 2);
    EXPECT_EQ(tuning_->state().backoffMs, domain::TuningState::kDefaultMinBatchInterval);
}

TEST_F(UploadCoordinatorTest, ServerRejectionKeepsEvents) {
    insertEvents(2);
    transport_->queueStatus(500);

    auto result = coordinator_->runCycle();

    EXPECT_FALSE(result.success);
    EXPECT_TRUE(result.rescheduled);
    EXPECT_EQ(store_->count(), 2);
}

TEST_F(UploadCoordinatorTest, CollectorTuningIsApplied) {
    insertEvents(1);
    ports::UploadResponse response;
    response.statusCode = 200;
    response.maxTotalSize = 1000;
    response.maxBatchSize = 2000;
    response.maxWait = 3000;
    response.minBatchInterval = 4000;
    transport_->queueResponse(response);

    coordinator_->runCycle();

    const auto& state = tuning_->state();
    EXPECT_EQ(state.maxTotalDbSize, 1000);
    EXPECT_EQ(state.maxBatchSize, 2000);
    EXPECT_EQ(state.maxWait, 3000);
    EXPECT_EQ(state.minBatchInterval, 4000);
}

TEST_F(UploadCoordinatorTest, PartialTuningLeavesOtherValues) {
    insertEvents(1);
    ports::UploadResponse response;
    response.statusCode = 200;
    response.maxBatchSize = 2048;
    transport_->queueResponse(response);

    coordinator_->runCycle();

    EXPECT_EQ(tuning_->state().maxBatchSize, 2048);
    EXPECT_EQ(tuning_->state().maxTotalDbSize, domain::TuningState::kDefaultMaxTotalDbSize);
    EXPECT_EQ(tuning_->state().minBatchInterval, domain::TuningState::kDefaultMinBatchInterval);
}

TEST_F(UploadCoordinatorTest, TuningOnRejectionAppliesAfterBackoff) {
    insertEvents(1);
    ports::UploadResponse response;
    response.statusCode = 503;
    response.minBatchInterval = 5000;
    transport_->queueResponse(response);

    coordinator_->runCycle();

    // Backoff was computed with the interval in force when the cycle ran
    EXPECT_EQ(tuning_->state().backoffMs, domain::TuningState::kDefaultMinBatchInterval);
    EXPECT_EQ(tuning_->state().minBatchInterval, 5000);
}

TEST(UploadCoordinatorBatchCount, ApproximatesFromAverageSize) {
    EXPECT_EQ(domain::UploadCoordinator::approximateBatchCount(250, 500, 5), 2);
    EXPECT_EQ(domain::UploadCoordinator::approximateBatchCount(10, 500, 5), 1);
    EXPECT_EQ(domain::UploadCoordinator::approximateBatchCount(1000000, 500, 5), 5);
    EXPECT_EQ(domain::UploadCoordinator::approximateBatchCount(100, 0, 3), 3);
    EXPECT_EQ(domain::UploadCoordinator::approximateBatchCount(100, 0, 0), 1);
}
