#pragma once

#include <string>
#include <vector>

namespace FseDump {

struct DiscoveredInputs {
	// Files to decode, in command-line order; directory contents sorted by name
	std::vector<std::string> files;
	// Arguments that do not exist or cannot be listed
	std::vector<std::string> missing;
};

// fsevents logs are named by their first event id in hex
bool IsFseventsName(const std::string& filename);

/**
 * Expand command-line inputs. A file is taken as given; a directory is walked
 * recursively for regular files whose names are all hex digits.
 */
DiscoveredInputs DiscoverInputs(const std::vector<std::string>& inputs);

} // namespace FseDump
