#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "absl/synchronization/mutex.h"

#include "broadcast/broadcast_hub.h"
#include "decoder/decode_error.h"
#include "decoder/page_framer.h"
#include "decoder/record_filter.h"
#include "sinks/formats.h"
#include "sinks/record_sink.h"
#include "sinks/sink_runner.h"

namespace FseDump {

struct JobOptions {
	std::vector<std::string> inputs;

	// Combined exports covering every input
	std::optional<std::string> csv_path;
	std::optional<std::string> json_path;
	std::optional<std::string> yaml_path;
	std::optional<std::string> uniques_path;

	// Per-file exports written next to each input
	bool per_file_csv = false;
	bool per_file_json = false;
	bool per_file_yaml = false;

	bool parallel = false;
	// 0 = hardware concurrency
	int worker_threads = 0;

	size_t queue_capacity = 4096;
	std::chrono::milliseconds poll_interval{100};
	DecodeOptions decode;
	FormatOptions format;

	// Tunables from the loaded Configuration; outputs and inputs left empty
	static JobOptions FromConfig();
};

struct FileResult {
	std::string path;
	bool ok = false;
	std::optional<DecodeError::Kind> error_kind;
	std::string error;
	DecodeSummary summary;
};

struct JobReport {
	std::vector<FileResult> files;
	size_t records = 0;
	size_t accepted = 0;
	size_t failed_files = 0;
	uint64_t sink_write_failures = 0;
	size_t sink_finish_failures = 0;

	bool ok() const { return failed_files == 0 && sink_finish_failures == 0; }
};

/**
 * Drives one run: discovers inputs, starts the sinks, decodes every file
 * into the shared hub and tears everything down in order.
 *
 * A file that fails to decode is reported and the job moves on; records it
 * produced before the failure stay delivered.
 */
class JobOrchestrator {
public:
	JobOrchestrator(JobOptions options, RecordFilter filter);
	~JobOrchestrator();

	/**
	 * Attach an extra job-wide sink. Must be called before Run.
	 */
	void AddSink(std::unique_ptr<RecordSink> sink);

	/**
	 * @throws std::runtime_error if a combined output cannot be created
	 */
	JobReport Run();

private:
	void StartSinks();
	void StartRunner(std::unique_ptr<RecordSink> sink);
	FileResult DecodeOne(const std::string& path);
	void DecodeSequential(const std::vector<std::string>& files, std::vector<FileResult>& results);
	void DecodeParallel(const std::vector<std::string>& files, std::vector<FileResult>& results);
	bool HasPerFileSinks() const;
	size_t NumWorkers(size_t num_files) const;

	JobOptions options_;
	RecordFilter filter_;
	std::vector<std::unique_ptr<RecordSink>> extra_sinks_;
	std::unique_ptr<BroadcastHub> hub_;
	std::vector<std::unique_ptr<SinkRunner>> runners_;

	absl::Mutex per_file_mu_;
	uint64_t per_file_write_failures_ ABSL_GUARDED_BY(per_file_mu_) = 0;
	size_t per_file_finish_failures_ ABSL_GUARDED_BY(per_file_mu_) = 0;
};

} // namespace FseDump
