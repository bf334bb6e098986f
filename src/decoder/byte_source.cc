#include "byte_source.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <utility>

#include "decode_error.h"

namespace FseDump {

ByteSource::ByteSource(size_t buffer_size) : buffer_(buffer_size) {}

bool ByteSource::Refill() {
	if (eof_) {
		return false;
	}
	begin_ = 0;
	end_ = Fill(buffer_.data(), buffer_.size());
	if (end_ == 0) {
		eof_ = true;
		return false;
	}
	return true;
}

size_t ByteSource::ReadUntil(uint8_t delim, std::string& out) {
	size_t appended = 0;
	while (true) {
		if (begin_ == end_ && !Refill()) {
			return appended;
		}
		const uint8_t* start = buffer_.data() + begin_;
		const size_t avail = end_ - begin_;
		const void* hit = std::memchr(start, delim, avail);
		const size_t take = hit ? static_cast<const uint8_t*>(hit) - start + 1 : avail;
		out.append(reinterpret_cast<const char*>(start), take);
		begin_ += take;
		position_ += take;
		appended += take;
		if (hit) {
			return appended;
		}
	}
}

size_t ByteSource::ReadUpTo(void* dst, size_t n) {
	auto* out = static_cast<uint8_t*>(dst);
	size_t copied = 0;
	while (copied < n) {
		if (begin_ == end_ && !Refill()) {
			break;
		}
		const size_t take = std::min(n - copied, end_ - begin_);
		std::memcpy(out + copied, buffer_.data() + begin_, take);
		begin_ += take;
		copied += take;
	}
	position_ += copied;
	return copied;
}

void ByteSource::ReadExact(void* dst, size_t n) {
	const size_t got = ReadUpTo(dst, n);
	if (got != n) {
		throw DecodeError(DecodeError::Kind::kTruncated,
				"Unexpected end of stream in " + Describe() + ": wanted " + std::to_string(n) +
				" bytes, got " + std::to_string(got) + " at offset " + std::to_string(position_));
	}
}

GzFileSource::GzFileSource(const std::string& path) : path_(path) {
	errno = 0;
	file_ = ScopedGzFile(::gzopen(path.c_str(), "rb"));
	if (!file_.isValid()) {
		const int err = errno;
		throw DecodeError(DecodeError::Kind::kIo,
				"Failed to open " + path + ": " + (err ? std::strerror(err) : "out of memory"));
	}
	::gzbuffer(file_.get(), 128 * 1024);
}

size_t GzFileSource::Fill(uint8_t* dst, size_t cap) {
	const unsigned int want = static_cast<unsigned int>(std::min<size_t>(cap, 1u << 30));
	const int got = ::gzread(file_.get(), dst, want);
	if (got < 0) {
		int errnum = Z_OK;
		const char* msg = ::gzerror(file_.get(), &errnum);
		if (errnum == Z_ERRNO) {
			msg = std::strerror(errno);
		}
		throw DecodeError(DecodeError::Kind::kIo, "Failed to read " + path_ + ": " + msg);
	}
	return static_cast<size_t>(got);
}

MemorySource::MemorySource(std::string data, size_t buffer_size)
	: ByteSource(buffer_size), data_(std::move(data)) {}

size_t MemorySource::Fill(uint8_t* dst, size_t cap) {
	const size_t take = std::min(cap, data_.size() - offset_);
	std::memcpy(dst, data_.data() + offset_, take);
	offset_ += take;
	return take;
}

} // namespace FseDump
