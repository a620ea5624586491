/**
 * Unit tests for UploadQueue, OutcomeChannel and WorkerPool
 */

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

#include "outcome_channel.hpp"
#include "upload_queue.hpp"
#include "worker_pool.hpp"

using namespace dirpush::uploader;

namespace {

WorkItem makeItem(int i, uint64_t size = 100) {
  return WorkItem("/tmp/file_" + std::to_string(i), "key_" + std::to_string(i), size);
}

}  // namespace

class UploadQueueTest : public ::testing::Test {
protected:
  void SetUp() override {
    queue_ = std::make_unique<UploadQueue>();
  }

  void TearDown() override {
    if (queue_) {
      queue_->close();
    }
  }

  std::unique_ptr<UploadQueue> queue_;
};

TEST_F(UploadQueueTest, FifoOrder) {
  for (int i = 0; i < 10; ++i) {
    queue_->enqueue(makeItem(i));
  }
  queue_->close();

  for (int i = 0; i < 10; ++i) {
    auto dequeued = queue_->dequeue();
    ASSERT_TRUE(dequeued.has_value());
    EXPECT_EQ(dequeued->remote_key, "key_" + std::to_string(i));
    EXPECT_EQ(dequeued->local_path.string(), "/tmp/file_" + std::to_string(i));
  }
  EXPECT_FALSE(queue_->dequeue().has_value());
}

TEST_F(UploadQueueTest, ClosedQueueDrainsThenEnds) {
  queue_->enqueue(makeItem(1));
  queue_->enqueue(makeItem(2));
  queue_->close();

  EXPECT_THROW(queue_->enqueue(makeItem(3)), std::logic_error);
  EXPECT_TRUE(queue_->dequeue().has_value());
  EXPECT_TRUE(queue_->dequeue().has_value());
  EXPECT_FALSE(queue_->dequeue().has_value());
}

TEST_F(UploadQueueTest, ItemEnqueuedLaterWakesConsumer) {
  std::thread consumer([this] {
    auto item = queue_->dequeue();
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(item->remote_key, "key_7");
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  queue_->enqueue(makeItem(7));
  consumer.join();
}

TEST_F(UploadQueueTest, CloseWakesBlockedConsumer) {
  std::atomic<bool> returned{false};
  std::thread consumer([this, &returned] {
    auto item = queue_->dequeue();
    EXPECT_FALSE(item.has_value());
    returned = true;
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_FALSE(returned.load());
  queue_->close();
  consumer.join();
  EXPECT_TRUE(returned.load());
}

// =============================================================================
// OutcomeChannel
// =============================================================================

TEST(OutcomeChannelTest, ReceivesFromOtherThreads) {
  OutcomeChannel channel;
  std::vector<std::thread> senders;
  for (int i = 0; i < 4; ++i) {
    senders.emplace_back([&channel, i] {
      channel.send(TransferOutcome::ok(makeItem(i)));
    });
  }

  std::set<std::string> keys;
  for (int i = 0; i < 4; ++i) {
    keys.insert(channel.receive().item.remote_key);
  }
  for (auto& t : senders) {
    t.join();
  }

  EXPECT_EQ(keys.size(), 4u);
}

TEST(OutcomeChannelTest, PreservesFailureDetail) {
  OutcomeChannel channel;
  channel.send(TransferOutcome::fail(makeItem(1), "HTTP 500"));

  TransferOutcome outcome = channel.receive();
  EXPECT_FALSE(outcome.succeeded);
  EXPECT_EQ(outcome.error_detail.value_or(""), "HTTP 500");
}

// =============================================================================
// WorkerPool
// =============================================================================

TEST(WorkerPoolTest, EveryItemHandledExactlyOnce) {
  UploadQueue queue;
  for (int i = 0; i < 50; ++i) {
    queue.enqueue(makeItem(i));
  }
  queue.close();

  std::mutex mutex;
  std::multiset<std::string> seen;
  std::set<int> worker_ids;
  WorkerPool pool(queue, 4, [&](int worker_id, const WorkItem& item) {
    std::lock_guard<std::mutex> lock(mutex);
    seen.insert(item.remote_key);
    worker_ids.insert(worker_id);
  });
  pool.start();
  pool.join();

  EXPECT_EQ(seen.size(), 50u);
  EXPECT_EQ(std::set<std::string>(seen.begin(), seen.end()).size(), 50u);
  for (int id : worker_ids) {
    EXPECT_GE(id, 0);
    EXPECT_LT(id, 4);
  }
}

TEST(WorkerPoolTest, DestructorStopsIdleWorkers) {
  UploadQueue queue;
  {
    WorkerPool pool(queue, 2, [](int, const WorkItem&) {});
    pool.start();
  }
  EXPECT_THROW(queue.enqueue(makeItem(1)), std::logic_error);
}

TEST(WorkerPoolTest, RejectsNonPositiveWorkerCount) {
  UploadQueue queue;
  EXPECT_THROW(WorkerPool(queue, 0, [](int, const WorkItem&) {}), std::invalid_argument);
}
