#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"

#include "formats.h"
#include "record_sink.h"

namespace FseDump {

struct UniqueAggregate {
	uint64_t count = 0;
	// Bitwise OR of every flag mask seen for the path
	uint32_t combined_flags = 0;
	// Seconds since the epoch, from the records' file timestamps
	std::optional<int64_t> earliest;
	std::optional<int64_t> latest;
};

/**
 * Folds the record stream into one summary per distinct path and writes
 * them out, sorted by case-folded path, when the stream ends.
 *
 * Memory grows with the number of distinct paths, not the number of events.
 */
class UniqueAggregator : public RecordSink {
public:
	// Collect only; Finish writes nothing
	explicit UniqueAggregator(FormatOptions options = {});

	// Write the summary to output_path on Finish
	UniqueAggregator(std::string output_path, OutputFormat format, FormatOptions options = {});

	void Write(const Record& record) override;
	void Finish() override;
	std::string Name() const override;

	// Aggregates ordered the way they are written
	std::vector<std::pair<std::string, UniqueAggregate>> Sorted() const;

	const UniqueAggregate* Find(const std::string& path) const;
	size_t size() const { return aggregates_.size(); }

	// Text of one summary row, newline-terminated
	std::string FormatRow(const std::string& path, const UniqueAggregate& aggregate) const;

	static std::string FormatTimestamp(const std::optional<int64_t>& seconds);

private:
	std::optional<std::string> output_path_;
	OutputFormat format_ = OutputFormat::kCsv;
	FormatOptions options_;
	absl::flat_hash_map<std::string, UniqueAggregate> aggregates_;
};

} // namespace FseDump
