#include "broadcast_hub.h"

#include <glog/logging.h>

namespace FseDump {

bool Consumer::Recv(RecordPtr& record) {
	if (closed_) {
		return false;
	}
	std::optional<RecordPtr> item;
	queue_.blockingRead(item);
	return Unwrap(item, record) == RecvStatus::kRecord;
}

RecvStatus Consumer::Unwrap(std::optional<RecordPtr>& item, RecordPtr& record) {
	if (!item.has_value()) {
		closed_ = true;
		return RecvStatus::kClosed;
	}
	record = std::move(*item);
	return RecvStatus::kRecord;
}

RecvStatus Consumer::RecvFor(std::chrono::milliseconds timeout, RecordPtr& record) {
	if (closed_) {
		return RecvStatus::kClosed;
	}
	std::optional<RecordPtr> item;
	if (!queue_.tryReadUntil(std::chrono::steady_clock::now() + timeout, item)) {
		return RecvStatus::kTimeout;
	}
	return Unwrap(item, record);
}

RecvStatus Consumer::TryRecv(RecordPtr& record) {
	if (closed_) {
		return RecvStatus::kClosed;
	}
	std::optional<RecordPtr> item;
	if (!queue_.read(item)) {
		return RecvStatus::kTimeout;
	}
	return Unwrap(item, record);
}

BroadcastHub::BroadcastHub(size_t capacity) : capacity_(capacity) {
	CHECK_GT(capacity_, 0u) << "BroadcastHub capacity must be positive";
}

BroadcastHub::~BroadcastHub() {
	Close();
}

std::shared_ptr<Consumer> BroadcastHub::Register() {
	auto consumer = std::make_shared<Consumer>(capacity_);
	absl::MutexLock lock(&mu_);
	if (closed_) {
		LOG(WARNING) << "Consumer registered on a closed BroadcastHub";
		consumer->Close();
		return consumer;
	}
	consumers_.push_back(consumer);
	VLOG(1) << "Registered consumer " << consumers_.size();
	return consumer;
}

void BroadcastHub::Publish(RecordPtr record) {
	absl::ReaderMutexLock lock(&mu_);
	if (closed_) {
		uint64_t dropped = dropped_.fetch_add(1, std::memory_order_relaxed);
		LOG_IF(WARNING, dropped == 0) << "Publish on a closed BroadcastHub, dropping records";
		return;
	}
	for (const auto& consumer : consumers_) {
		consumer->Deliver(record);
	}
	published_.fetch_add(1, std::memory_order_relaxed);
}

void BroadcastHub::Close() {
	std::vector<std::shared_ptr<Consumer>> consumers;
	{
		absl::MutexLock lock(&mu_);
		if (closed_) {
			return;
		}
		closed_ = true;
		consumers = consumers_;
	}
	// The end marker takes a queue slot, so this waits on full consumers;
	// no publish can interleave once closed_ is set
	for (const auto& consumer : consumers) {
		consumer->Close();
	}
	VLOG(1) << "BroadcastHub closed after " << published() << " records to "
		<< consumers.size() << " consumers";
}

size_t BroadcastHub::NumConsumers() const {
	absl::ReaderMutexLock lock(&mu_);
	return consumers_.size();
}

bool BroadcastHub::is_closed() const {
	absl::ReaderMutexLock lock(&mu_);
	return closed_;
}

} // namespace FseDump
