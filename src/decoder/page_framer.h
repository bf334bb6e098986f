#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "broadcast/interfaces.h"
#include "byte_source.h"
#include "flag_codec.h"
#include "record_filter.h"
#include "versioned_decoder.h"

namespace FseDump {

// Tag + reserved word + little-endian page length
inline constexpr size_t kPageHeaderSize = 12;

struct DecodeOptions {
	// Fail instead of warn when the stream ends before a page is complete
	bool strict_page_end = false;
	// DecodeFile: stamp records with the input file's mtime
	bool stamp_file_time = false;
	// Applied to every record decoded; DecodeFile fills it when stamp_file_time is set
	std::optional<int64_t> file_timestamp;
	// nullptr = FlagCodec::Instance()
	FlagCodec* codec = nullptr;
};

struct PageStats {
	Version version;
	uint32_t declared_length = 0;
	// Bytes accounted to the page, header included
	uint64_t consumed = 0;
	size_t records = 0;
	size_t accepted = 0;
	// The stream ended before consumed reached declared_length
	bool truncated = false;
};

struct DecodeSummary {
	std::string source;
	std::vector<PageStats> pages;
	size_t records = 0;
	size_t accepted = 0;
};

/**
 * Walks the pages of one fsevents stream.
 *
 * Every decoded record is counted against the page length, whether or not
 * the filter lets it through; only publication depends on the filter. A page
 * closes when the count reaches the declared length exactly, overshooting it
 * is fatal.
 */
class PageFramer {
public:
	PageFramer(ByteSource& source,
			RecordPublisher& publisher,
			const RecordFilter& filter,
			const DecodeOptions& options = {});

	/**
	 * Decode the next page.
	 * @return Statistics for the page, or nullopt when the stream is exhausted
	 * @throws DecodeError on an unknown tag, a short read or a length mismatch
	 */
	std::optional<PageStats> NextPage();

	// Set once a record read hit the end of the stream
	bool exhausted() const { return exhausted_; }

	// True between a page header and the page's close; current() then holds
	// the counts of the page so far
	bool in_page() const { return in_page_; }
	const PageStats& current() const { return current_; }

private:
	std::optional<Version> ReadHeader(uint32_t& declared_length);

	ByteSource& source_;
	RecordPublisher& publisher_;
	const RecordFilter& filter_;
	DecodeOptions options_;
	FlagCodec& codec_;
	PageStats current_{};
	bool in_page_ = false;
	bool exhausted_ = false;
};

/**
 * Decode every page of source, publishing accepted records.
 *
 * summary is updated page by page. When a DecodeError escapes it still holds
 * the counts of everything decoded so far, the failing page included.
 * @throws DecodeError; records published before the failure stay published
 */
void DecodeStream(ByteSource& source,
		RecordPublisher& publisher,
		const RecordFilter& filter,
		const DecodeOptions& options,
		DecodeSummary& summary);

DecodeSummary DecodeStream(ByteSource& source,
		RecordPublisher& publisher,
		const RecordFilter& filter,
		const DecodeOptions& options = {});

/**
 * Open path (gzip or raw) and decode it into summary.
 * @throws DecodeError(kIo) if the file cannot be opened or read
 */
void DecodeFile(const std::string& path,
		RecordPublisher& publisher,
		const RecordFilter& filter,
		const DecodeOptions& options,
		DecodeSummary& summary);

DecodeSummary DecodeFile(const std::string& path,
		RecordPublisher& publisher,
		const RecordFilter& filter,
		const DecodeOptions& options = {});

} // namespace FseDump
