// RAII wrapper for zlib gzFile handles (compressed or transparent plain files).
// Ensures the handle is closed on scope exit; prevents leaks on early return or exception.
#ifndef FSEDUMP_SRC_COMMON_SCOPED_GZ_FILE_H_
#define FSEDUMP_SRC_COMMON_SCOPED_GZ_FILE_H_

#include <zlib.h>

struct ScopedGzFile {
	gzFile file = nullptr;

	ScopedGzFile() = default;
	explicit ScopedGzFile(gzFile f) : file(f) {}

	~ScopedGzFile() {
		if (file != nullptr) {
			::gzclose(file);
			file = nullptr;
		}
	}

	ScopedGzFile(const ScopedGzFile&) = delete;
	ScopedGzFile& operator=(const ScopedGzFile&) = delete;

	ScopedGzFile(ScopedGzFile&& o) noexcept : file(o.file) { o.file = nullptr; }
	ScopedGzFile& operator=(ScopedGzFile&& o) noexcept {
		if (this != &o) {
			if (file != nullptr) ::gzclose(file);
			file = o.file;
			o.file = nullptr;
		}
		return *this;
	}

	gzFile get() const { return file; }
	bool isValid() const { return file != nullptr; }

	// Close now and report zlib's status (Z_OK on success).
	int close() {
		if (file == nullptr) return Z_OK;
		int rc = ::gzclose(file);
		file = nullptr;
		return rc;
	}
};

#endif  // FSEDUMP_SRC_COMMON_SCOPED_GZ_FILE_H_
