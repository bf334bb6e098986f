#pragma once

#include <stdexcept>
#include <string>

namespace FseDump {

/**
 * Fatal failure while decoding one input. The decode of that input stops;
 * records already published stay delivered.
 */
class DecodeError : public std::runtime_error {
public:
	enum class Kind {
		kIo,                  // open/read failure
		kUnsupportedVersion,  // unknown page tag
		kPageLengthMismatch,  // records overran the declared page length
		kTruncated,           // stream ended inside a record or page header
	};

	DecodeError(Kind kind, const std::string& what)
		: std::runtime_error(what), kind_(kind) {}

	Kind kind() const { return kind_; }

private:
	Kind kind_;
};

inline const char* DecodeErrorKindName(DecodeError::Kind kind) {
	switch (kind) {
		case DecodeError::Kind::kIo: return "io";
		case DecodeError::Kind::kUnsupportedVersion: return "unsupported_version";
		case DecodeError::Kind::kPageLengthMismatch: return "page_length_mismatch";
		case DecodeError::Kind::kTruncated: return "truncated";
	}
	return "unknown";
}

} // namespace FseDump
