#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

#include "absl/synchronization/mutex.h"
#include "folly/MPMCQueue.h"

#include "interfaces.h"

namespace FseDump {

class BroadcastHub;

enum class RecvStatus {
	kRecord,
	kTimeout,
	kClosed
};

/**
 * One consumer's end of a BroadcastHub.
 *
 * Records arrive in the order each producer published them. Once the hub is
 * closed, records already queued are still delivered, then Recv reports the
 * close. Only one thread may receive from a consumer.
 */
class Consumer {
public:
	explicit Consumer(size_t capacity) : queue_(capacity) {}

	/**
	 * Block until a record arrives.
	 * @return false once the hub has closed and the queue is drained
	 */
	bool Recv(RecordPtr& record);

	// Wait at most timeout for a record
	RecvStatus RecvFor(std::chrono::milliseconds timeout, RecordPtr& record);

	// Non-blocking; kTimeout means the queue is empty right now
	RecvStatus TryRecv(RecordPtr& record);

	bool closed() const { return closed_; }

private:
	friend class BroadcastHub;

	void Deliver(const RecordPtr& record) { queue_.blockingWrite(record); }

	void Close() {
		std::optional<RecordPtr> sentinel = std::nullopt;
		queue_.blockingWrite(sentinel);
	}

	RecvStatus Unwrap(std::optional<RecordPtr>& item, RecordPtr& record);

	folly::MPMCQueue<std::optional<RecordPtr>> queue_;
	// Touched by the receiving thread only
	bool closed_ = false;
};

/**
 * Bounded fan-out channel: every published record reaches every consumer
 * registered before it was published.
 *
 * Publish blocks while any consumer's queue is full, so the slowest sink sets
 * the decode rate. Several producers may publish at once.
 */
class BroadcastHub : public RecordPublisher {
public:
	explicit BroadcastHub(size_t capacity);
	~BroadcastHub() override;

	BroadcastHub(const BroadcastHub&) = delete;
	BroadcastHub& operator=(const BroadcastHub&) = delete;

	// Consumers registered after Close come back already closed
	std::shared_ptr<Consumer> Register();

	void Publish(RecordPtr record) override;

	// Waits for in-flight publishes, then queues the end marker for every
	// consumer, blocking until each has a free slot. Idempotent.
	void Close();

	size_t NumConsumers() const;
	size_t capacity() const { return capacity_; }
	uint64_t published() const { return published_.load(std::memory_order_relaxed); }
	bool is_closed() const;

private:
	const size_t capacity_;
	mutable absl::Mutex mu_;
	std::vector<std::shared_ptr<Consumer>> consumers_ ABSL_GUARDED_BY(mu_);
	bool closed_ ABSL_GUARDED_BY(mu_) = false;
	std::atomic<uint64_t> published_{0};
	std::atomic<uint64_t> dropped_{0};
};

} // namespace FseDump
