#include "page_framer.h"

#include <cctype>
#include <cerrno>
#include <cstring>
#include <iomanip>
#include <memory>
#include <sstream>

#include <sys/stat.h>

#include <glog/logging.h>

#include "decode_error.h"

namespace FseDump {

namespace {

// Printable rendering of a tag for error messages
std::string EscapeTag(const char* tag, size_t len) {
	std::ostringstream out;
	for (size_t i = 0; i < len; ++i) {
		const unsigned char c = static_cast<unsigned char>(tag[i]);
		if (std::isprint(c)) {
			out << static_cast<char>(c);
		} else {
			out << "\\x" << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c);
		}
	}
	return out.str();
}

} // namespace

PageFramer::PageFramer(ByteSource& source,
		RecordPublisher& publisher,
		const RecordFilter& filter,
		const DecodeOptions& options)
	: source_(source),
	  publisher_(publisher),
	  filter_(filter),
	  options_(options),
	  codec_(options.codec ? *options.codec : FlagCodec::Instance()) {}

std::optional<Version> PageFramer::ReadHeader(uint32_t& declared_length) {
	const uint64_t page_offset = source_.position();

	char tag[kTagSize];
	const size_t got = source_.ReadUpTo(tag, kTagSize);
	if (got == 0) {
		return std::nullopt;
	}
	if (got < kTagSize) {
		throw DecodeError(DecodeError::Kind::kTruncated,
				"Partial page tag '" + EscapeTag(tag, got) + "' at offset " +
				std::to_string(page_offset) + " in " + source_.Describe());
	}

	auto version = VersionFromTag(std::string_view(tag, kTagSize));
	if (!version.has_value()) {
		throw DecodeError(DecodeError::Kind::kUnsupportedVersion,
				"Unsupported or invalid file version '" + EscapeTag(tag, kTagSize) +
				"' at offset " + std::to_string(page_offset) + " in " + source_.Describe());
	}

	uint8_t reserved[4];
	source_.ReadExact(reserved, sizeof(reserved));

	uint8_t len[4];
	source_.ReadExact(len, sizeof(len));
	declared_length = static_cast<uint32_t>(len[0]) | (static_cast<uint32_t>(len[1]) << 8) |
		(static_cast<uint32_t>(len[2]) << 16) | (static_cast<uint32_t>(len[3]) << 24);

	VLOG(1) << source_.Describe() << ": " << VersionName(*version) << " page at offset "
		<< page_offset << " declared length " << declared_length;
	return version;
}

std::optional<PageStats> PageFramer::NextPage() {
	if (exhausted_) {
		return std::nullopt;
	}

	uint32_t declared_length = 0;
	auto version = ReadHeader(declared_length);
	if (!version.has_value()) {
		exhausted_ = true;
		return std::nullopt;
	}

	current_ = PageStats{};
	current_.version = *version;
	current_.declared_length = declared_length;
	current_.consumed = kPageHeaderSize;
	in_page_ = true;
	PageStats& stats = current_;

	VersionedDecoder decoder(*version, codec_);

	while (true) {
		auto decoded = decoder.DecodeRecord(source_);
		if (!decoded.has_value()) {
			exhausted_ = true;
			if (stats.consumed != declared_length) {
				stats.truncated = true;
				const std::string msg = "Stream ended inside a " + std::string(VersionName(*version)) +
					" page of " + source_.Describe() + " after " + std::to_string(stats.consumed) +
					" of " + std::to_string(declared_length) + " bytes";
				if (options_.strict_page_end) {
					throw DecodeError(DecodeError::Kind::kTruncated, msg);
				}
				LOG(WARNING) << msg;
			}
			break;
		}

		stats.consumed += decoded->bytes_consumed;
		++stats.records;

		if (stats.consumed > declared_length) {
			throw DecodeError(DecodeError::Kind::kPageLengthMismatch,
					"Length of page records didn't match expected length in " + source_.Describe() +
					": consumed " + std::to_string(stats.consumed) + " of " +
					std::to_string(declared_length) + " bytes");
		}

		Record& rec = decoded->record;
		if (options_.file_timestamp.has_value()) {
			rec.file_timestamp = options_.file_timestamp;
		}

		if (filter_.Accepts(rec)) {
			publisher_.Publish(std::make_shared<const Record>(std::move(rec)));
			++stats.accepted;
		} else {
			VLOG(3) << "Skipping " << rec.path << " due to the filters";
		}

		if (stats.consumed == declared_length) {
			VLOG(2) << "Closed " << VersionName(*version) << " page with " << stats.records << " records";
			break;
		}
	}

	in_page_ = false;
	return stats;
}

namespace {

void AddPage(DecodeSummary& summary, const PageStats& page) {
	summary.records += page.records;
	summary.accepted += page.accepted;
	summary.pages.push_back(page);
}

} // namespace

void DecodeStream(ByteSource& source,
		RecordPublisher& publisher,
		const RecordFilter& filter,
		const DecodeOptions& options,
		DecodeSummary& summary) {
	summary.source = source.Describe();

	PageFramer framer(source, publisher, filter, options);
	try {
		while (auto page = framer.NextPage()) {
			AddPage(summary, *page);
		}
	} catch (const DecodeError&) {
		if (framer.in_page()) {
			AddPage(summary, framer.current());
		}
		throw;
	}
}

DecodeSummary DecodeStream(ByteSource& source,
		RecordPublisher& publisher,
		const RecordFilter& filter,
		const DecodeOptions& options) {
	DecodeSummary summary;
	DecodeStream(source, publisher, filter, options, summary);
	return summary;
}

void DecodeFile(const std::string& path,
		RecordPublisher& publisher,
		const RecordFilter& filter,
		const DecodeOptions& options,
		DecodeSummary& summary) {
	LOG(INFO) << "Parsing " << path;
	summary.source = path;

	DecodeOptions file_options = options;
	if (options.stamp_file_time && !options.file_timestamp.has_value()) {
		struct stat st;
		if (::stat(path.c_str(), &st) == 0) {
			file_options.file_timestamp = static_cast<int64_t>(st.st_mtime);
		} else {
			throw DecodeError(DecodeError::Kind::kIo,
					"Failed to stat " + path + ": " + std::strerror(errno));
		}
	}

	GzFileSource source(path);
	DecodeStream(source, publisher, filter, file_options, summary);

	LOG(INFO) << "Finished " << path << ": " << summary.pages.size() << " pages, "
		<< summary.records << " records, " << summary.accepted << " accepted";
}

DecodeSummary DecodeFile(const std::string& path,
		RecordPublisher& publisher,
		const RecordFilter& filter,
		const DecodeOptions& options) {
	DecodeSummary summary;
	DecodeFile(path, publisher, filter, options, summary);
	return summary;
}

} // namespace FseDump
