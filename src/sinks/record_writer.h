#pragma once

#include <cstdint>
#include <string>

#include "formats.h"
#include "output_file.h"
#include "record_sink.h"

namespace FseDump {

// Streams every record to one CSV, JSON Lines or YAML export
class RecordWriter : public RecordSink {
public:
	// @throws std::runtime_error if the output cannot be created
	RecordWriter(const std::string& path, OutputFormat format, FormatOptions options = {});

	void Write(const Record& record) override;
	void Finish() override;
	std::string Name() const override;

	uint64_t records_written() const { return records_written_; }

private:
	OutputFile out_;
	RecordFormatter formatter_;
	uint64_t records_written_ = 0;
};

} // namespace FseDump
