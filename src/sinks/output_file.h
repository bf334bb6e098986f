#pragma once

#include <string>
#include <string_view>

#include "common/scoped_gz_file.h"

namespace FseDump {

/**
 * Output stream for exports. Paths ending in ".gz" are gzip-compressed,
 * anything else is written as plain bytes through zlib's transparent mode.
 */
class OutputFile {
public:
	// @throws std::runtime_error if the file cannot be created
	explicit OutputFile(std::string path);

	// @throws std::runtime_error on a short write
	void Write(std::string_view data);

	// Flush and close. Safe to call twice.
	void Close();

	const std::string& path() const { return path_; }
	bool compressed() const { return compressed_; }

	static bool IsGzipPath(std::string_view path);

private:
	std::string path_;
	bool compressed_;
	ScopedGzFile file_;
};

} // namespace FseDump
