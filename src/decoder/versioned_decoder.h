#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "byte_source.h"
#include "flag_codec.h"
#include "record.h"

namespace FseDump {

// Page tags as they appear on disk
inline constexpr std::string_view kV1Tag = "1SLD";
inline constexpr std::string_view kV2Tag = "2SLD";
inline constexpr std::string_view kV3Tag = "3SLD";
inline constexpr size_t kTagSize = 4;

enum class Version : uint8_t {
	kV1 = 1,
	kV2 = 2,
	kV3 = 3,
};

// Per-layout record suffix
struct VersionTraits {
	bool has_node_id;
	bool has_extra_id;
};

constexpr VersionTraits TraitsOf(Version version) {
	switch (version) {
		case Version::kV1: return {false, false};
		case Version::kV2: return {true, false};
		case Version::kV3: return {true, true};
	}
	return {false, false};
}

// nullopt for any tag other than the three known ones
std::optional<Version> VersionFromTag(std::string_view tag);

const char* VersionName(Version version);

struct DecodedRecord {
	// Exact on-disk size of the record
	size_t bytes_consumed;
	Record record;
};

/**
 * Decodes records of one page layout.
 *
 * Layout, shared prefix: NUL terminated path, u64 event id (BE), u32 flags
 * (BE). V2 and V3 append a u64 node id (LE); V3 appends 4 more bytes in host
 * order that are kept but not interpreted.
 */
class VersionedDecoder {
public:
	explicit VersionedDecoder(Version version, FlagCodec& codec = FlagCodec::Instance());

	/**
	 * Decode the next record of the page.
	 * @return nullopt when the path has no terminator (the stream ended)
	 * @throws DecodeError(kTruncated) when the stream ends after the path
	 */
	std::optional<DecodedRecord> DecodeRecord(ByteSource& source);

	Version version() const { return version_; }

private:
	Version version_;
	VersionTraits traits_;
	FlagCodec& codec_;
	std::string path_buf_;
};

// Replace invalid UTF-8 sequences with U+FFFD in place.
void MakeUtf8Lossy(std::string& text);

} // namespace FseDump
