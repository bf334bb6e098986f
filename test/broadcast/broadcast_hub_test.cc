#include <gtest/gtest.h>
#include "../../src/broadcast/broadcast_hub.h"
#include "../../src/decoder/byte_source.h"
#include "../../src/decoder/page_framer.h"
#include "../test_utils.h"

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace FseDump;
using namespace FseDump::testing_util;
using namespace std::chrono_literals;

namespace {

RecordPtr MakeRecord(uint64_t id) {
    auto record = std::make_shared<Record>();
    record->path = "/r/" + std::to_string(id);
    record->event_id = id;
    return record;
}

std::vector<uint64_t> DrainIds(Consumer& consumer) {
    std::vector<uint64_t> ids;
    RecordPtr record;
    while (consumer.Recv(record)) {
        ids.push_back(record->event_id);
    }
    return ids;
}

} // namespace

TEST(BroadcastHubTest, EveryConsumerSeesEveryRecordInOrder) {
    BroadcastHub hub(8);
    auto a = hub.Register();
    auto b = hub.Register();
    EXPECT_EQ(hub.NumConsumers(), 2u);

    std::vector<uint64_t> seen_a, seen_b;
    std::thread ta([&]() { seen_a = DrainIds(*a); });
    std::thread tb([&]() { seen_b = DrainIds(*b); });

    for (uint64_t i = 0; i < 1000; ++i) {
        hub.Publish(MakeRecord(i));
    }
    hub.Close();
    ta.join();
    tb.join();

    ASSERT_EQ(seen_a.size(), 1000u);
    EXPECT_EQ(seen_a, seen_b);
    for (uint64_t i = 0; i < 1000; ++i) {
        EXPECT_EQ(seen_a[i], i);
    }
    EXPECT_EQ(hub.published(), 1000u);
}

TEST(BroadcastHubTest, ThreeConsumersSeeTheWholeFixture) {
    FseventsBuilder builder = MakeMixedFixture();
    MemorySource source(builder.data());
    RecordFilter filter;

    BroadcastHub hub(64);
    std::vector<std::shared_ptr<Consumer>> consumers;
    for (int i = 0; i < 3; ++i) {
        consumers.push_back(hub.Register());
    }

    std::vector<std::vector<std::string>> paths(3);
    std::vector<std::thread> threads;
    for (int i = 0; i < 3; ++i) {
        threads.emplace_back([&, i]() {
            RecordPtr record;
            while (consumers[i]->Recv(record)) {
                paths[i].push_back(record->path);
            }
        });
    }

    DecodeSummary summary = DecodeStream(source, hub, filter);
    hub.Close();
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(summary.records, kMixedFixtureRecords);
    for (int i = 0; i < 3; ++i) {
        EXPECT_EQ(paths[i].size(), kMixedFixtureRecords);
        EXPECT_EQ(paths[i], paths[0]);
    }
}

TEST(BroadcastHubTest, RecordsAreSharedNotCopied) {
    BroadcastHub hub(4);
    auto a = hub.Register();
    auto b = hub.Register();
    RecordPtr original = MakeRecord(7);
    hub.Publish(original);
    hub.Close();

    RecordPtr ra, rb;
    ASSERT_TRUE(a->Recv(ra));
    ASSERT_TRUE(b->Recv(rb));
    EXPECT_EQ(ra.get(), original.get());
    EXPECT_EQ(rb.get(), original.get());
}

TEST(BroadcastHubTest, PublishBlocksOnSlowConsumer) {
    BroadcastHub hub(2);
    EXPECT_EQ(hub.capacity(), 2u);
    auto slow = hub.Register();

    std::atomic<int> published{0};
    std::thread producer([&]() {
        for (int i = 0; i < 10; ++i) {
            hub.Publish(MakeRecord(i));
            published.fetch_add(1);
        }
    });

    std::this_thread::sleep_for(100ms);
    // A consumer never buffers more than the hub capacity
    EXPECT_EQ(published.load(), 2);

    RecordPtr record;
    for (int i = 0; i < 10; ++i) {
        ASSERT_TRUE(slow->Recv(record));
        EXPECT_EQ(record->event_id, static_cast<uint64_t>(i));
    }
    producer.join();
    EXPECT_EQ(published.load(), 10);
}

TEST(BroadcastHubTest, RecvForTimesOutThenReportsClose) {
    BroadcastHub hub(4);
    auto consumer = hub.Register();

    RecordPtr record;
    EXPECT_EQ(consumer->RecvFor(10ms, record), RecvStatus::kTimeout);

    hub.Publish(MakeRecord(1));
    hub.Close();
    EXPECT_EQ(consumer->RecvFor(10ms, record), RecvStatus::kRecord);
    EXPECT_EQ(record->event_id, 1u);
    EXPECT_EQ(consumer->RecvFor(10ms, record), RecvStatus::kClosed);
    EXPECT_TRUE(consumer->closed());
    EXPECT_FALSE(consumer->Recv(record));
}

TEST(BroadcastHubTest, LateRegistrationSeesOnlyLaterRecords) {
    BroadcastHub hub(8);
    auto early = hub.Register();
    hub.Publish(MakeRecord(1));
    auto late = hub.Register();
    hub.Publish(MakeRecord(2));
    hub.Close();

    EXPECT_EQ(DrainIds(*early), (std::vector<uint64_t>{1, 2}));
    EXPECT_EQ(DrainIds(*late), (std::vector<uint64_t>{2}));
}

TEST(BroadcastHubTest, AfterCloseNothingIsDelivered) {
    BroadcastHub hub(4);
    auto consumer = hub.Register();
    hub.Close();
    hub.Close();
    EXPECT_TRUE(hub.is_closed());

    hub.Publish(MakeRecord(1));
    EXPECT_EQ(hub.published(), 0u);
    EXPECT_TRUE(DrainIds(*consumer).empty());

    auto late = hub.Register();
    RecordPtr record;
    EXPECT_EQ(late->RecvFor(10ms, record), RecvStatus::kClosed);
}

TEST(BroadcastHubTest, CloseWaitsForRoomInAFullQueue) {
    BroadcastHub hub(1);
    auto consumer = hub.Register();
    hub.Publish(MakeRecord(1));

    std::atomic<bool> closed{false};
    std::thread closer([&]() {
        hub.Close();
        closed.store(true);
    });

    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(closed.load());
    // Readers of the hub state are not held up by the pending close
    EXPECT_EQ(hub.NumConsumers(), 1u);
    EXPECT_TRUE(hub.is_closed());

    EXPECT_EQ(DrainIds(*consumer), (std::vector<uint64_t>{1}));
    closer.join();
    EXPECT_TRUE(closed.load());
}

TEST(BroadcastHubTest, ConcurrentProducersKeepPerProducerOrder) {
    BroadcastHub hub(16);
    auto consumer = hub.Register();

    std::vector<uint64_t> seen;
    std::thread reader([&]() { seen = DrainIds(*consumer); });

    constexpr uint64_t kPerProducer = 500;
    std::vector<std::thread> producers;
    for (uint64_t p = 0; p < 3; ++p) {
        producers.emplace_back([&hub, p]() {
            for (uint64_t i = 0; i < kPerProducer; ++i) {
                hub.Publish(MakeRecord(p * 100000 + i));
            }
        });
    }
    for (auto& producer : producers) {
        producer.join();
    }
    hub.Close();
    reader.join();

    ASSERT_EQ(seen.size(), 3 * kPerProducer);
    std::vector<int64_t> last(3, -1);
    for (uint64_t id : seen) {
        const uint64_t p = id / 100000;
        const int64_t i = static_cast<int64_t>(id % 100000);
        EXPECT_GT(i, last[p]);
        last[p] = i;
    }
}

TEST(PublisherGroupTest, ForwardsToEveryPublisher) {
    CollectingPublisher a;
    CollectingPublisher b;
    PublisherGroup group{&a};
    group.Add(&b);
    group.Publish(MakeRecord(5));
    ASSERT_EQ(a.records.size(), 1u);
    ASSERT_EQ(b.records.size(), 1u);
    EXPECT_EQ(a.records[0], b.records[0]);
}
