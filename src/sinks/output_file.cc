#include "output_file.h"

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <utility>

#include <glog/logging.h>

namespace FseDump {

bool OutputFile::IsGzipPath(std::string_view path) {
	constexpr std::string_view kSuffix = ".gz";
	return path.size() > kSuffix.size() &&
		path.compare(path.size() - kSuffix.size(), kSuffix.size(), kSuffix) == 0;
}

OutputFile::OutputFile(std::string path)
	: path_(std::move(path)),
	  compressed_(IsGzipPath(path_)) {
	// "T" asks zlib for a plain, uncompressed write
	file_ = ScopedGzFile(::gzopen(path_.c_str(), compressed_ ? "wb" : "wbT"));
	if (!file_.isValid()) {
		throw std::runtime_error("Failed to create " + path_ + ": " + std::strerror(errno));
	}
	VLOG(1) << "Opened " << (compressed_ ? "gzip" : "plain") << " output " << path_;
}

void OutputFile::Write(std::string_view data) {
	if (!file_.isValid()) {
		throw std::runtime_error("Write to closed output " + path_);
	}
	if (data.empty()) {
		return;
	}
	int written = ::gzwrite(file_.get(), data.data(), static_cast<unsigned>(data.size()));
	if (written <= 0 || static_cast<size_t>(written) != data.size()) {
		int errnum = 0;
		const char* msg = ::gzerror(file_.get(), &errnum);
		throw std::runtime_error("Failed to write " + path_ + ": " + (msg ? msg : "unknown error"));
	}
}

void OutputFile::Close() {
	if (!file_.isValid()) {
		return;
	}
	int rc = file_.close();
	if (rc != Z_OK) {
		throw std::runtime_error("Failed to close " + path_ + " (zlib status " + std::to_string(rc) + ")");
	}
}

} // namespace FseDump
