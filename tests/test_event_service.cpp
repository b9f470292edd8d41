#include <gtest/gtest.h>
#include "../core/domain/EventService.hpp"
#include "../core/adapters/SqliteEventStore.hpp"
#include "../core/sim/ManualWakeupTimer.hpp"
#include "../core/sim/MockEventTransport.hpp"
#include "../core/sim/SimulatedClock.hpp"
#include "TestEvents.hpp"
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

using namespace uplink;
using namespace std::chrono_literals;
using uplink::test::makeEvent;

namespace {

// SQLite-backed store that records eviction requests
class SpyEventStore : public ports::IEventStore {
public:
    explicit SpyEventStore(const std::string& path = ":memory:") : inner_(path) {}

    int insert(const Event& event) override { return inner_.insert(event); }
    int64_t totalSizeBytes() const override { return inner_.totalSizeBytes(); }
    int count() const override { return inner_.count(); }
    std::optional<std::string> oldestSessionId() const override { return inner_.oldestSessionId(); }

    bool deleteSession(const std::string& sessionId) override {
        evictedSessions.push_back(sessionId);
        return inner_.deleteSession(sessionId);
    }

    ports::Batch selectBatch(int approxCount) const override { return inner_.selectBatch(approxCount); }
    bool deleteEvents(const std::vector<std::string>& ids) override { return inner_.deleteEvents(ids); }
    bool deleteAll() override { return inner_.deleteAll(); }

    std::vector<std::string> evictedSessions;

private:
    adapters::SqliteEventStore inner_;
};

} // namespace

class EventServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<sim::SimulatedClock>();
        timer_ = std::make_shared<sim::ManualWakeupTimer>();
        transport_ = std::make_shared<sim::MockEventTransport>();
        store_ = std::make_shared<SpyEventStore>();
        tuning_ = std::make_shared<domain::TuningStateRepository>("");
        service_ = std::make_unique<domain::EventService>(store_, transport_, tuning_, timer_, clock_);
    }

    void setMaxTotalSize(int64_t bytes) {
        tuning_->update([bytes](domain::TuningState& state) { state.maxTotalDbSize = bytes; });
    }

    int64_t now() const { return clock_->epochMillis(); }

    std::shared_ptr<sim::SimulatedClock> clock_;
    std::shared_ptr<sim::ManualWakeupTimer> timer_;
    std::shared_ptr<sim::MockEventTransport> transport_;
    std::shared_ptr<SpyEventStore> store_;
    std::shared_ptr<domain::TuningStateRepository> tuning_;
    std::unique_ptr<domain::EventService> service_;
};

TEST_F(EventServiceTest, CommandsWaitUntilProcessed) {
    service_->addEvent(makeEvent("e1", "s1", 1));
    EXPECT_EQ(store_->count(), 0);

    EXPECT_EQ(service_->processPending(), 1u);
    EXPECT_EQ(store_->count(), 1);
}

TEST_F(EventServiceTest, AddEventStoresAndSchedulesUpload) {
    service_->addEvent(makeEvent("e1", "s1", 1));
    service_->processPending();

    EXPECT_EQ(store_->count(), 1);
    EXPECT_EQ(service_->scheduler()->nextSendDelay(), 0);
    ASSERT_TRUE(timer_->pendingWakeup().has_value());
    EXPECT_EQ(*timer_->pendingWakeup(),
              fromEpochMillis(now() + domain::UploadScheduler::kBatchDelayMs));
}

TEST_F(EventServiceTest, IncompleteEventsAreDropped) {
    auto noData = makeEvent("e1", "s1", 1);
    noData.data.clear();
    auto noId = makeEvent("", "s1", 2);
    auto noType = makeEvent("e3", "s1", 3);
    noType.type.clear();
    auto noTimestamp = makeEvent("e4", "s1", 4);
    noTimestamp.timestamp.clear();

    service_->addEvent(noData);
    service_->addEvent(noId);
    service_->addEvent(noType);
    service_->addEvent(noTimestamp);
    service_->processPending();

    EXPECT_EQ(store_->count(), 0);
    EXPECT_EQ(timer_->armCount(), 0u);
}

TEST_F(EventServiceTest, EmptySessionIdIsAccepted) {
    service_->addEvent(makeEvent("e1", "", 1));
    service_->processPending();

    EXPECT_EQ(store_->count(), 1);
}

TEST_F(EventServiceTest, NoEvictionUnderCap) {
    setMaxTotalSize(1000);

    for (int i = 0; i < 10; ++i) {
        service_->addEvent(makeEvent("e" + std::to_string(i), "s" + std::to_string(i % 3), i, 100));
    }
    service_->processPending();

    EXPECT_TRUE(store_->evictedSessions.empty());
    EXPECT_EQ(store_->count(), 10);
    EXPECT_EQ(store_->totalSizeBytes(), 1000);
}

TEST_F(EventServiceTest, InsertOverCapEvictsOldestSessionOnce) {
    setMaxTotalSize(500);

    service_->addEvent(makeEvent("a1", "s1", 1, 100));
    service_->addEvent(makeEvent("a2", "s1", 2, 100));
    service_->addEvent(makeEvent("a3", "s1", 3, 100));
    service_->addEvent(makeEvent("b1", "s2", 4, 100));
    service_->addEvent(makeEvent("b2", "s2", 5, 100));
    service_->processPending();
    ASSERT_TRUE(store_->evictedSessions.empty());

    service_->addEvent(makeEvent("c1", "s3", 6, 100));
    service_->processPending();

    ASSERT_EQ(store_->evictedSessions.size(), 1u);
    EXPECT_EQ(store_->evictedSessions[0], "s1");
    EXPECT_EQ(store_->count(), 3);
    EXPECT_EQ(store_->totalSizeBytes(), 300);
}

TEST_F(EventServiceTest, EvictingTheOnlySessionStillStoresNewEvent) {
    setMaxTotalSize(250);

    service_->addEvent(makeEvent("a1", "s1", 1, 100));
    service_->addEvent(makeEvent("a2", "s1", 2, 100));
    service_->addEvent(makeEvent("a3", "s1", 3, 100));
    service_->processPending();

    ASSERT_EQ(store_->evictedSessions.size(), 1u);
    EXPECT_EQ(store_->count(), 1);
    EXPECT_EQ(store_->selectBatch(1)[0].id, "a3");
}

TEST_F(EventServiceTest, RegionEventIsScheduledDespiteBackoff) {
    tuning_->update([this](domain::TuningState& state) {
        state.lastSendTime = now();
        state.backoffMs = 600000;
    });

    service_->addEvent(makeEvent("r1", "s1", 1, 100, kRegionEventType));
    service_->processPending();

    ASSERT_TRUE(timer_->pendingWakeup().has_value());
    EXPECT_EQ(*timer_->pendingWakeup(),
              fromEpochMillis(now() + domain::UploadScheduler::kRegionBatchDelayMs));
}

TEST_F(EventServiceTest, LocationEventInBackgroundWaitsForReportingInterval) {
    tuning_->update([this](domain::TuningState& state) { state.lastSendTime = now() - 60000; });
    service_->setAppInForeground(false);
    ASSERT_FALSE(service_->isAppInForeground());

    service_->addEvent(makeEvent("l1", "s1", 1, 100, kLocationEventType));
    service_->processPending();

    ASSERT_TRUE(timer_->pendingWakeup().has_value());
    EXPECT_EQ(*timer_->pendingWakeup(), fromEpochMillis(now() + 840000));
}

TEST_F(EventServiceTest, WakeupUploadsStoredEvents) {
    service_->addEvent(makeEvent("e1", "s1", 1));
    service_->addEvent(makeEvent("e2", "s1", 2));
    service_->processPending();

    clock_->advance(10s);
    ASSERT_TRUE(timer_->fire());
    service_->processPending();

    EXPECT_EQ(transport_->sendCount(), 1u);
    EXPECT_EQ(store_->count(), 0);
    EXPECT_EQ(tuning_->state().backoffMs, 0);
    EXPECT_EQ(service_->coordinator()->getCurrentState(), domain::UploadState::Idle);
}

TEST_F(EventServiceTest, UploadOnEmptyStoreIsNoOp) {
    service_->requestUpload();
    service_->processPending();

    EXPECT_EQ(transport_->sendCount(), 0u);
    EXPECT_FALSE(timer_->hasPendingWakeup());
}

TEST_F(EventServiceTest, DeleteAllPurgesStore) {
    service_->addEvent(makeEvent("e1", "s1", 1));
    service_->addEvent(makeEvent("e2", "s2", 2));
    service_->deleteAll();
    service_->processPending();

    EXPECT_EQ(store_->count(), 0);
    EXPECT_EQ(store_->totalSizeBytes(), 0);
}

TEST_F(EventServiceTest, WorkerRunsCommandsInOrder) {
    service_->start();

    service_->addEvent(makeEvent("e1", "s1", 1));
    service_->addEvent(makeEvent("e2", "s1", 2));
    service_->addEvent(makeEvent("e3", "s1", 3));
    service_->requestUpload();
    service_->flush();

    ASSERT_EQ(transport_->sendCount(), 1u);
    EXPECT_EQ(transport_->sentBatches()[0].size(), 3u);
    EXPECT_EQ(store_->count(), 0);

    EXPECT_EQ(service_->processPending(), 0u);
    service_->stop();
}

TEST_F(EventServiceTest, StopDrainsQueuedCommands) {
    service_->start();
    for (int i = 0; i < 20; ++i) {
        service_->addEvent(makeEvent("e" + std::to_string(i), "s1", i));
    }
    service_->stop();

    EXPECT_EQ(store_->count(), 20);
}

TEST_F(EventServiceTest, StartRearmsWakeupForStoredEvents) {
    store_->insert(makeEvent("e1", "s1", 1));

    service_->start();
    service_->flush();

    EXPECT_TRUE(timer_->hasPendingWakeup());
    service_->stop();
}

TEST_F(EventServiceTest, StartWithEmptyStoreDoesNotArm) {
    service_->start();
    service_->flush();

    EXPECT_EQ(timer_->armCount(), 0u);
    service_->stop();
}

TEST(EventServiceRestart, PacingAndEventsSurviveRestart) {
    namespace fs = std::filesystem;
    const fs::path dbPath = fs::temp_directory_path() / "uplink_test_restart.db";
    const fs::path statePath = fs::temp_directory_path() / "uplink_test_restart_state.json";
    auto cleanup = [&]() {
        fs::remove(dbPath);
        fs::remove(dbPath.string() + "-wal");
        fs::remove(dbPath.string() + "-shm");
        fs::remove(statePath);
    };
    cleanup();

    auto clock = std::make_shared<sim::SimulatedClock>();
    auto transport = std::make_shared<sim::MockEventTransport>();
    transport->setDefaultResponse(std::nullopt);

    {
        auto store = std::make_shared<SpyEventStore>(dbPath.string());
        auto tuning = std::make_shared<domain::TuningStateRepository>(statePath.string());
        tuning->load();
        auto timer = std::make_shared<sim::ManualWakeupTimer>();
        domain::EventService service(store, transport, tuning, timer, clock);

        service.addEvent(makeEvent("e1", "s1", 1));
        service.requestUpload();
        service.processPending();
        ASSERT_EQ(tuning->state().backoffMs, domain::TuningState::kDefaultMinBatchInterval);
    }

    {
        auto store = std::make_shared<SpyEventStore>(dbPath.string());
        auto tuning = std::make_shared<domain::TuningStateRepository>(statePath.string());
        ASSERT_TRUE(tuning->load());
        auto timer = std::make_shared<sim::ManualWakeupTimer>();
        domain::EventService service(store, transport, tuning, timer, clock);

        EXPECT_EQ(store->count(), 1);
        EXPECT_EQ(tuning->state().backoffMs, domain::TuningState::kDefaultMinBatchInterval);
        EXPECT_EQ(tuning->state().lastSendTime, clock->epochMillis());

        service.start();
        service.flush();
        ASSERT_TRUE(timer->pendingWakeup().has_value());
        EXPECT_EQ(*timer->pendingWakeup(), fromEpochMillis(clock->epochMillis() + 120000));
        service.stop();
    }

    cleanup();
}
