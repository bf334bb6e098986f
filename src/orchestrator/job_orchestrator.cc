#include "job_orchestrator.h"

#include <algorithm>
#include <atomic>
#include <exception>
#include <thread>
#include <utility>

#include <glog/logging.h>

#include "common/configuration.h"
#include "file_discovery.h"
#include "sinks/record_writer.h"
#include "sinks/unique_aggregator.h"

namespace FseDump {

JobOptions JobOptions::FromConfig() {
	const auto& config = Configuration::getInstance();
	const FseDumpConfig& cfg = config.config();

	JobOptions options;
	options.queue_capacity = config.getQueueCapacity();
	options.poll_interval = std::chrono::milliseconds(config.getSinkPollIntervalMs());
	options.worker_threads = config.getWorkerThreads();
	options.decode.strict_page_end = cfg.decode.strict_page_end.get();
	options.decode.stamp_file_time = cfg.decode.file_timestamps.get();
	options.format = FormatOptions::FromConfig();
	return options;
}

JobOrchestrator::JobOrchestrator(JobOptions options, RecordFilter filter)
	: options_(std::move(options)),
	  filter_(std::move(filter)) {}

JobOrchestrator::~JobOrchestrator() {
	if (hub_) {
		hub_->Close();
	}
	runners_.clear();
}

void JobOrchestrator::AddSink(std::unique_ptr<RecordSink> sink) {
	CHECK(!hub_) << "AddSink after Run";
	extra_sinks_.push_back(std::move(sink));
}

bool JobOrchestrator::HasPerFileSinks() const {
	return options_.per_file_csv || options_.per_file_json || options_.per_file_yaml;
}

size_t JobOrchestrator::NumWorkers(size_t num_files) const {
	size_t workers = options_.worker_threads > 0
		? static_cast<size_t>(options_.worker_threads)
		: std::max(1u, std::thread::hardware_concurrency());
	return std::max<size_t>(1, std::min(workers, num_files));
}

void JobOrchestrator::StartRunner(std::unique_ptr<RecordSink> sink) {
	LOG(INFO) << "Starting " << sink->Name();
	runners_.push_back(SinkRunner::Spawn(std::move(sink), hub_->Register(), options_.poll_interval));
}

void JobOrchestrator::StartSinks() {
	// Create every output first so a bad path fails before any thread starts
	std::vector<std::unique_ptr<RecordSink>> sinks;
	if (options_.csv_path) {
		sinks.push_back(std::make_unique<RecordWriter>(*options_.csv_path, OutputFormat::kCsv, options_.format));
	}
	if (options_.json_path) {
		sinks.push_back(std::make_unique<RecordWriter>(*options_.json_path, OutputFormat::kJson, options_.format));
	}
	if (options_.yaml_path) {
		sinks.push_back(std::make_unique<RecordWriter>(*options_.yaml_path, OutputFormat::kYaml, options_.format));
	}
	if (options_.uniques_path) {
		auto format = FormatFromPath(*options_.uniques_path).value_or(OutputFormat::kCsv);
		sinks.push_back(std::make_unique<UniqueAggregator>(*options_.uniques_path, format, options_.format));
	}
	for (auto& sink : extra_sinks_) {
		sinks.push_back(std::move(sink));
	}
	extra_sinks_.clear();

	for (auto& sink : sinks) {
		StartRunner(std::move(sink));
	}
}

FileResult JobOrchestrator::DecodeOne(const std::string& path) {
	FileResult result;
	result.path = path;

	// Per-file sinks get their own hub so they can be closed with the file
	std::unique_ptr<BroadcastHub> file_hub;
	std::vector<std::unique_ptr<SinkRunner>> file_runners;
	if (HasPerFileSinks()) {
		file_hub = std::make_unique<BroadcastHub>(options_.queue_capacity);
		auto add = [&](bool enabled, OutputFormat format) {
			if (!enabled) {
				return;
			}
			const std::string out_path = path + "." + std::string(OutputFormatName(format));
			try {
				auto writer = std::make_unique<RecordWriter>(out_path, format, options_.format);
				file_runners.push_back(SinkRunner::Spawn(std::move(writer), file_hub->Register(),
						options_.poll_interval));
			} catch (const std::exception& e) {
				LOG(ERROR) << "Skipping per-file output " << out_path << ": " << e.what();
				absl::MutexLock lock(&per_file_mu_);
				++per_file_finish_failures_;
			}
		};
		add(options_.per_file_csv, OutputFormat::kCsv);
		add(options_.per_file_json, OutputFormat::kJson);
		add(options_.per_file_yaml, OutputFormat::kYaml);
	}

	PublisherGroup publishers{hub_.get()};
	if (file_hub) {
		publishers.Add(file_hub.get());
	}

	try {
		DecodeFile(path, publishers, filter_, options_.decode, result.summary);
		result.ok = true;
	} catch (const DecodeError& e) {
		result.error_kind = e.kind();
		result.error = e.what();
		LOG(ERROR) << "Failed to decode " << path << " (" << DecodeErrorKindName(e.kind()) << "): " << e.what();
	} catch (const std::exception& e) {
		result.error = e.what();
		LOG(ERROR) << "Failed to decode " << path << ": " << e.what();
	}

	if (file_hub) {
		file_hub->Close();
		for (auto& runner : file_runners) {
			runner->RequestStop();
			runner->Join();
		}
		absl::MutexLock lock(&per_file_mu_);
		for (const auto& runner : file_runners) {
			per_file_write_failures_ += runner->failed();
			if (!runner->finished_ok()) {
				++per_file_finish_failures_;
			}
		}
	}
	return result;
}

void JobOrchestrator::DecodeSequential(const std::vector<std::string>& files,
		std::vector<FileResult>& results) {
	for (size_t i = 0; i < files.size(); ++i) {
		results[i] = DecodeOne(files[i]);
	}
}

void JobOrchestrator::DecodeParallel(const std::vector<std::string>& files,
		std::vector<FileResult>& results) {
	const size_t num_workers = NumWorkers(files.size());
	LOG(INFO) << "Decoding " << files.size() << " files on " << num_workers << " threads";

	std::atomic<size_t> next{0};
	std::vector<std::thread> workers;
	workers.reserve(num_workers);
	for (size_t w = 0; w < num_workers; ++w) {
		workers.emplace_back([&]() {
			while (true) {
				size_t i = next.fetch_add(1, std::memory_order_relaxed);
				if (i >= files.size()) {
					break;
				}
				results[i] = DecodeOne(files[i]);
			}
		});
	}
	for (auto& worker : workers) {
		worker.join();
	}
}

JobReport JobOrchestrator::Run() {
	CHECK(!hub_) << "JobOrchestrator::Run called twice";
	JobReport report;

	DiscoveredInputs inputs = DiscoverInputs(options_.inputs);
	for (const auto& missing : inputs.missing) {
		FileResult result;
		result.path = missing;
		result.error_kind = DecodeError::Kind::kIo;
		result.error = "No such file or directory";
		report.files.push_back(std::move(result));
	}

	hub_ = std::make_unique<BroadcastHub>(options_.queue_capacity);
	StartSinks();

	std::vector<FileResult> results(inputs.files.size());
	if (options_.parallel && inputs.files.size() > 1) {
		DecodeParallel(inputs.files, results);
	} else {
		DecodeSequential(inputs.files, results);
	}

	hub_->Close();
	for (auto& runner : runners_) {
		runner->Join();
		report.sink_write_failures += runner->failed();
		if (!runner->finished_ok()) {
			++report.sink_finish_failures;
		}
	}
	{
		absl::MutexLock lock(&per_file_mu_);
		report.sink_write_failures += per_file_write_failures_;
		report.sink_finish_failures += per_file_finish_failures_;
	}

	for (auto& result : results) {
		report.files.push_back(std::move(result));
	}
	for (const auto& file : report.files) {
		report.records += file.summary.records;
		report.accepted += file.summary.accepted;
		if (!file.ok) {
			++report.failed_files;
		}
	}

	LOG(INFO) << "Processed " << report.files.size() << " inputs (" << report.failed_files
		<< " failed), " << report.records << " records decoded, " << report.accepted
		<< " published to " << runners_.size() << " sinks";
	LOG_IF(WARNING, report.sink_write_failures > 0) << report.sink_write_failures << " record writes failed";
	return report;
}

} // namespace FseDump
