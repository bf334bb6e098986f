#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "decoder/record.h"

namespace FseDump {

enum class OutputFormat {
	kCsv,
	kJson,
	kYaml
};

std::string_view OutputFormatName(OutputFormat format);

// Format from the extension, ignoring a trailing ".gz"
std::optional<OutputFormat> FormatFromPath(std::string_view path);

struct FormatOptions {
	// node_id/extra_id as "0x" + uppercase hex
	bool hex_ids = true;
	// Extra column with the alternate flag vocabulary
	bool alt_flags = false;
	bool extra_id = true;

	// Defaults taken from the loaded Configuration
	static FormatOptions FromConfig();
};

// "0x1F" style when hex, plain decimal otherwise
std::string FormatId(uint64_t id, bool hex);

// RFC 4180: quote when the field holds a comma, quote or line break
std::string CsvEscape(std::string_view field);

/**
 * Text encodings for one record per call. Each call returns a complete,
 * newline-terminated chunk so chunks can be appended to a file as they come.
 */
class RecordFormatter {
public:
	RecordFormatter(OutputFormat format, FormatOptions options)
		: format_(format), options_(options) {}

	// Written once before the first record (CSV header)
	std::string Header() const;

	// @throws on serialization failure
	std::string Format(const Record& record) const;

	// Written after the last record; records_written lets YAML emit "[]"
	std::string Footer(uint64_t records_written) const;

	OutputFormat format() const { return format_; }
	const FormatOptions& options() const { return options_; }

private:
	std::string FormatCsv(const Record& record) const;
	std::string FormatJson(const Record& record) const;
	std::string FormatYaml(const Record& record) const;

	OutputFormat format_;
	FormatOptions options_;
};

} // namespace FseDump
