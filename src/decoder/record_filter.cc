#include "record_filter.h"

#include <stdexcept>

#include <glog/logging.h>

#include "flag_codec.h"

namespace FseDump {

RecordFilter::RecordFilter(const std::optional<std::string>& path_regex,
		const std::vector<std::string>& any_flags,
		const std::vector<std::string>& all_flags)
	: any_mask_(ResolveMask(any_flags)),
	  all_mask_(ResolveMask(all_flags)) {
	if (path_regex.has_value()) {
		pattern_ = *path_regex;
		try {
			path_regex_.emplace(pattern_, std::regex::ECMAScript | std::regex::optimize);
		} catch (const std::regex_error& e) {
			throw std::invalid_argument("Invalid path filter '" + pattern_ + "': " + e.what());
		}
	}

	VLOG(1) << "RecordFilter any_mask=0x" << std::hex << any_mask_
		<< " all_mask=0x" << all_mask_ << std::dec
		<< " regex='" << pattern_ << "'";
}

uint32_t RecordFilter::ResolveMask(const std::vector<std::string>& names) {
	uint32_t mask = 0;
	for (const auto& name : names) {
		auto id = FlagCodec::FlagId(name);
		if (!id.has_value()) {
			throw std::invalid_argument("Unknown flag name: " + name);
		}
		mask |= *id;
	}
	return mask;
}

bool RecordFilter::Accepts(const Record& record) const {
	if (any_mask_ != 0 && (record.flag_bits & any_mask_) == 0) {
		return false;
	}
	if (all_mask_ != 0 && (record.flag_bits & all_mask_) != all_mask_) {
		return false;
	}
	if (path_regex_ && !std::regex_search(record.path, *path_regex_)) {
		return false;
	}
	return true;
}

} // namespace FseDump
