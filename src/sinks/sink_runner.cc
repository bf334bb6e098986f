#include "sink_runner.h"

#include <exception>
#include <stdexcept>
#include <utility>

#include <glog/logging.h>

namespace FseDump {

SinkRunner::SinkRunner(std::unique_ptr<RecordSink> sink,
		std::shared_ptr<Consumer> consumer,
		std::chrono::milliseconds poll_interval)
	: sink_(std::move(sink)),
	  consumer_(std::move(consumer)),
	  poll_interval_(poll_interval) {
	if (!sink_ || !consumer_) {
		throw std::invalid_argument("SinkRunner needs a sink and a consumer");
	}
}

SinkRunner::~SinkRunner() {
	if (thread_.joinable()) {
		RequestStop();
		thread_.join();
	}
}

std::unique_ptr<SinkRunner> SinkRunner::Spawn(std::unique_ptr<RecordSink> sink,
		std::shared_ptr<Consumer> consumer,
		std::chrono::milliseconds poll_interval) {
	auto runner = std::make_unique<SinkRunner>(std::move(sink), std::move(consumer), poll_interval);
	runner->Start();
	return runner;
}

void SinkRunner::Start() {
	if (thread_.joinable()) {
		LOG(WARNING) << sink_->Name() << " already started";
		return;
	}
	thread_ = std::thread(&SinkRunner::Run, this);
}

void SinkRunner::Join() {
	if (thread_.joinable()) {
		thread_.join();
	}
}

void SinkRunner::WriteOne(const Record& record) {
	try {
		sink_->Write(record);
		written_.fetch_add(1, std::memory_order_relaxed);
	} catch (const std::exception& e) {
		failed_.fetch_add(1, std::memory_order_relaxed);
		LOG_EVERY_N(ERROR, 1000) << sink_->Name() << " failed to write " << record.path
			<< ": " << e.what() << " (" << google::COUNTER << " failures)";
	}
}

void SinkRunner::Run() {
	VLOG(1) << "Sink thread started: " << sink_->Name();
	while (true) {
		RecordPtr record;
		RecvStatus status = consumer_->RecvFor(poll_interval_, record);
		if (status == RecvStatus::kClosed) {
			break;
		}
		if (status == RecvStatus::kRecord) {
			WriteOne(*record);
			continue;
		}
		if (stop_requested_.load(std::memory_order_acquire)) {
			// Pick up anything published between the timeout and the stop signal
			while (consumer_->TryRecv(record) == RecvStatus::kRecord) {
				WriteOne(*record);
			}
			break;
		}
	}
	Finish();
}

void SinkRunner::Finish() {
	try {
		sink_->Finish();
		finished_ok_.store(true, std::memory_order_release);
	} catch (const std::exception& e) {
		LOG(ERROR) << sink_->Name() << " failed to finish: " << e.what();
	}
	VLOG(1) << "Sink thread done: " << sink_->Name() << " wrote " << written()
		<< " records, " << failed() << " failures";
}

} // namespace FseDump
