#include "versioned_decoder.h"

#include <glog/logging.h>

namespace FseDump {

namespace {

constexpr char kReplacementChar[] = "\xEF\xBF\xBD";

uint64_t ReadU64BE(ByteSource& source) {
	uint8_t b[8];
	source.ReadExact(b, sizeof(b));
	uint64_t v = 0;
	for (int i = 0; i < 8; ++i) {
		v = (v << 8) | b[i];
	}
	return v;
}

uint32_t ReadU32BE(ByteSource& source) {
	uint8_t b[4];
	source.ReadExact(b, sizeof(b));
	return (static_cast<uint32_t>(b[0]) << 24) | (static_cast<uint32_t>(b[1]) << 16) |
		(static_cast<uint32_t>(b[2]) << 8) | static_cast<uint32_t>(b[3]);
}

uint64_t ReadU64LE(ByteSource& source) {
	uint8_t b[8];
	source.ReadExact(b, sizeof(b));
	uint64_t v = 0;
	for (int i = 7; i >= 0; --i) {
		v = (v << 8) | b[i];
	}
	return v;
}

uint32_t ReadU32Native(ByteSource& source) {
	uint32_t v;
	source.ReadExact(&v, sizeof(v));
	return v;
}

// Length of the valid UTF-8 sequence starting at s[0], or the length of the
// maximal invalid prefix negated (always <= -1).
int Utf8SequenceLength(const unsigned char* s, size_t avail) {
	const unsigned char c = s[0];
	if (c < 0x80) return 1;

	int len;
	unsigned char lo = 0x80, hi = 0xBF;
	if (c >= 0xC2 && c <= 0xDF) {
		len = 2;
	} else if (c >= 0xE0 && c <= 0xEF) {
		len = 3;
		if (c == 0xE0) lo = 0xA0;
		if (c == 0xED) hi = 0x9F;
	} else if (c >= 0xF0 && c <= 0xF4) {
		len = 4;
		if (c == 0xF0) lo = 0x90;
		if (c == 0xF4) hi = 0x8F;
	} else {
		return -1;
	}

	for (int i = 1; i < len; ++i) {
		if (static_cast<size_t>(i) >= avail) return -i;
		const unsigned char lower = (i == 1) ? lo : 0x80;
		const unsigned char upper = (i == 1) ? hi : 0xBF;
		if (s[i] < lower || s[i] > upper) return -i;
	}
	return len;
}

} // namespace

std::optional<Version> VersionFromTag(std::string_view tag) {
	if (tag == kV1Tag) return Version::kV1;
	if (tag == kV2Tag) return Version::kV2;
	if (tag == kV3Tag) return Version::kV3;
	return std::nullopt;
}

const char* VersionName(Version version) {
	switch (version) {
		case Version::kV1: return "V1";
		case Version::kV2: return "V2";
		case Version::kV3: return "V3";
	}
	return "V?";
}

void MakeUtf8Lossy(std::string& text) {
	const auto* data = reinterpret_cast<const unsigned char*>(text.data());
	const size_t size = text.size();

	size_t i = 0;
	while (i < size) {
		const int n = Utf8SequenceLength(data + i, size - i);
		if (n < 0) break;
		i += n;
	}
	if (i == size) {
		return;
	}

	std::string out;
	out.reserve(size + 8);
	out.append(text, 0, i);
	while (i < size) {
		const int n = Utf8SequenceLength(data + i, size - i);
		if (n > 0) {
			out.append(text, i, n);
			i += n;
		} else {
			out.append(kReplacementChar);
			i += -n;
		}
	}
	text.swap(out);
}

VersionedDecoder::VersionedDecoder(Version version, FlagCodec& codec)
	: version_(version), traits_(TraitsOf(version)), codec_(codec) {
	path_buf_.reserve(256);
}

std::optional<DecodedRecord> VersionedDecoder::DecodeRecord(ByteSource& source) {
	path_buf_.clear();
	const size_t path_len = source.ReadUntil('\0', path_buf_);
	if (path_len == 0 || path_buf_.back() != '\0') {
		VLOG(2) << "End of records in " << source.Describe() << " (read " << path_len << " trailing bytes)";
		return std::nullopt;
	}

	DecodedRecord out;
	Record& rec = out.record;
	rec.path.assign(path_buf_, 0, path_len - 1);
	MakeUtf8Lossy(rec.path);

	rec.event_id = ReadU64BE(source);
	rec.flag_bits = ReadU32BE(source);
	rec.flags = &codec_.Render(rec.flag_bits);

	size_t consumed = path_len + sizeof(uint64_t) + sizeof(uint32_t);

	if (traits_.has_node_id) {
		rec.node_id = ReadU64LE(source);
		consumed += sizeof(uint64_t);
	}

	if (traits_.has_extra_id) {
		rec.extra_id = ReadU32Native(source);
		consumed += sizeof(uint32_t);
	}

	out.bytes_consumed = consumed;
	VLOG(3) << VersionName(version_) << " record " << rec.event_id << " " << rec.path << " [" << rec.FlagText() << "]";
	return out;
}

} // namespace FseDump
