#pragma once

#include <cstdint>
#include <optional>
#include <regex>
#include <string>
#include <vector>

#include "record.h"

namespace FseDump {

/**
 * Decides which decoded records are published.
 *
 * A record passes when it carries at least one of the "any" flags (if any
 * were given), all of the "all" flags (if any were given), and its path
 * matches the regex somewhere (if one was given). Immutable after
 * construction, so one instance can be shared by every decoder thread.
 */
class RecordFilter {
public:
	// Accepts everything
	RecordFilter() = default;

	/**
	 * @param path_regex ECMAScript regex searched for anywhere in the path
	 * @param any_flags  Flag names (case-insensitive), record needs one of them
	 * @param all_flags  Flag names (case-insensitive), record needs all of them
	 * @throws std::invalid_argument on an unknown flag name or a bad regex
	 */
	RecordFilter(const std::optional<std::string>& path_regex,
			const std::vector<std::string>& any_flags,
			const std::vector<std::string>& all_flags);

	bool Accepts(const Record& record) const;

	bool IsPassThrough() const { return any_mask_ == 0 && all_mask_ == 0 && !path_regex_; }

	uint32_t any_mask() const { return any_mask_; }
	uint32_t all_mask() const { return all_mask_; }
	const std::string& pattern() const { return pattern_; }

private:
	static uint32_t ResolveMask(const std::vector<std::string>& names);

	uint32_t any_mask_ = 0;
	uint32_t all_mask_ = 0;
	std::string pattern_;
	std::optional<std::regex> path_regex_;
};

} // namespace FseDump
