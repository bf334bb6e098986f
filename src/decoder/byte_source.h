#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "common/scoped_gz_file.h"

namespace FseDump {

/**
 * Buffered sequential reader the decoder pulls bytes from.
 *
 * Subclasses only provide Fill(); delimiter scanning and exact reads are
 * done here over an internal buffer.
 */
class ByteSource {
public:
	virtual ~ByteSource() = default;

	ByteSource(const ByteSource&) = delete;
	ByteSource& operator=(const ByteSource&) = delete;

	/**
	 * Append bytes up to and including delim to out.
	 * @return Number of bytes appended. Fewer bytes and no delimiter means the
	 *         stream ended; 0 means it was already at the end.
	 */
	size_t ReadUntil(uint8_t delim, std::string& out);

	/**
	 * Read exactly n bytes.
	 * @throws DecodeError(kTruncated) if the stream ends first
	 */
	void ReadExact(void* dst, size_t n);

	/**
	 * Read up to n bytes; returns fewer only at end of stream.
	 */
	size_t ReadUpTo(void* dst, size_t n);

	// Bytes handed out so far
	uint64_t position() const { return position_; }

	virtual std::string Describe() const = 0;

protected:
	explicit ByteSource(size_t buffer_size = kDefaultBufferSize);

	/**
	 * Copy up to cap bytes from the underlying stream into dst.
	 * @return 0 at end of stream
	 * @throws DecodeError(kIo) on read failure
	 */
	virtual size_t Fill(uint8_t* dst, size_t cap) = 0;

private:
	static constexpr size_t kDefaultBufferSize = 64 * 1024;

	// Returns false at end of stream.
	bool Refill();

	std::vector<uint8_t> buffer_;
	size_t begin_ = 0;
	size_t end_ = 0;
	bool eof_ = false;
	uint64_t position_ = 0;
};

/**
 * Reads a file through zlib: gzip (including concatenated members) is
 * decompressed, anything else is passed through unchanged.
 */
class GzFileSource : public ByteSource {
public:
	// @throws DecodeError(kIo) if the file cannot be opened
	explicit GzFileSource(const std::string& path);

	std::string Describe() const override { return path_; }

protected:
	size_t Fill(uint8_t* dst, size_t cap) override;

private:
	std::string path_;
	ScopedGzFile file_;
};

/**
 * In-memory source, used for tests and already-loaded buffers.
 */
class MemorySource : public ByteSource {
public:
	explicit MemorySource(std::string data, size_t buffer_size = 4096);

	std::string Describe() const override { return "<memory>"; }

protected:
	size_t Fill(uint8_t* dst, size_t cap) override;

private:
	std::string data_;
	size_t offset_ = 0;
};

} // namespace FseDump
