#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <thread>

#include "broadcast/broadcast_hub.h"
#include "record_sink.h"

namespace FseDump {

/**
 * Runs one RecordSink on a dedicated thread, fed by its own hub consumer.
 *
 * The loop ends when the hub closes the consumer, or when RequestStop has been
 * called and a poll interval passes without a record. Either way every record
 * published before the stop signal is written, then the sink is finished.
 */
class SinkRunner {
public:
	SinkRunner(std::unique_ptr<RecordSink> sink,
			std::shared_ptr<Consumer> consumer,
			std::chrono::milliseconds poll_interval = std::chrono::milliseconds(100));
	~SinkRunner();

	SinkRunner(const SinkRunner&) = delete;
	SinkRunner& operator=(const SinkRunner&) = delete;

	// Construct a runner and start its thread
	static std::unique_ptr<SinkRunner> Spawn(std::unique_ptr<RecordSink> sink,
			std::shared_ptr<Consumer> consumer,
			std::chrono::milliseconds poll_interval = std::chrono::milliseconds(100));

	void Start();

	// Cancellation token for transient sinks: no further records will be published
	void RequestStop() { stop_requested_.store(true, std::memory_order_release); }

	void Join();

	uint64_t written() const { return written_.load(std::memory_order_relaxed); }
	uint64_t failed() const { return failed_.load(std::memory_order_relaxed); }
	// False if Finish threw
	bool finished_ok() const { return finished_ok_.load(std::memory_order_acquire); }

	RecordSink& sink() { return *sink_; }

private:
	void Run();
	void WriteOne(const Record& record);
	void Finish();

	std::unique_ptr<RecordSink> sink_;
	std::shared_ptr<Consumer> consumer_;
	const std::chrono::milliseconds poll_interval_;
	std::thread thread_;
	std::atomic<bool> stop_requested_{false};
	std::atomic<uint64_t> written_{0};
	std::atomic<uint64_t> failed_{0};
	std::atomic<bool> finished_ok_{false};
};

} // namespace FseDump
