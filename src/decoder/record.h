#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "flag_codec.h"

namespace FseDump {

/**
 * One decoded fsevents entry.
 *
 * Built once by the decoder and never modified afterwards; sinks share it
 * through RecordPtr.
 */
struct Record {
	std::string path;
	uint64_t event_id = 0;
	uint32_t flag_bits = 0;
	// Canonical rendering of flag_bits, owned by the FlagCodec
	const FlagTexts* flags = nullptr;
	// Present for format versions 2 and 3
	std::optional<uint64_t> node_id;
	// Present for format version 3 only; meaning unknown
	std::optional<uint32_t> extra_id;
	// mtime of the source file, seconds since the epoch
	std::optional<int64_t> file_timestamp;

	const std::string& FlagText() const;
	const std::string& AltFlagText() const;
};

using RecordPtr = std::shared_ptr<const Record>;

} // namespace FseDump
