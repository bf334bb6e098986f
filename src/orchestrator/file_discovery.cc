#include "file_discovery.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>

#include <glog/logging.h>

namespace FseDump {

namespace fs = std::filesystem;

bool IsFseventsName(const std::string& filename) {
	if (filename.empty()) {
		return false;
	}
	return std::all_of(filename.begin(), filename.end(), [](unsigned char c) {
		return std::isxdigit(c) != 0;
	});
}

namespace {

void CollectDirectory(const fs::path& dir, DiscoveredInputs& out) {
	std::vector<std::string> found;
	std::error_code ec;
	fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
	if (ec) {
		LOG(ERROR) << "Cannot list " << dir << ": " << ec.message();
		out.missing.push_back(dir.string());
		return;
	}

	for (const fs::recursive_directory_iterator end{}; it != end; it.increment(ec)) {
		if (ec) {
			LOG(WARNING) << "Skipping part of " << dir << ": " << ec.message();
			ec.clear();
			continue;
		}
		std::error_code type_ec;
		if (!it->is_regular_file(type_ec)) {
			continue;
		}
		const std::string name = it->path().filename().string();
		if (IsFseventsName(name)) {
			found.push_back(it->path().string());
		} else {
			VLOG(2) << "Ignoring " << it->path() << ": not an fsevents file name";
		}
	}

	std::sort(found.begin(), found.end(), [](const std::string& a, const std::string& b) {
		return fs::path(a).filename() < fs::path(b).filename() ||
			(fs::path(a).filename() == fs::path(b).filename() && a < b);
	});
	LOG(INFO) << "Found " << found.size() << " fsevents files under " << dir;
	out.files.insert(out.files.end(), found.begin(), found.end());
}

} // namespace

DiscoveredInputs DiscoverInputs(const std::vector<std::string>& inputs) {
	DiscoveredInputs out;
	for (const auto& input : inputs) {
		std::error_code ec;
		const fs::path path(input);
		if (fs::is_directory(path, ec)) {
			CollectDirectory(path, out);
		} else if (fs::exists(path, ec)) {
			out.files.push_back(input);
		} else {
			LOG(ERROR) << "Input does not exist: " << input;
			out.missing.push_back(input);
		}
	}
	return out;
}

} // namespace FseDump
