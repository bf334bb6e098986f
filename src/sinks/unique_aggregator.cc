#include "unique_aggregator.h"

#include <algorithm>
#include <stdexcept>

#include <glog/logging.h>
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/time/time.h"
#include "decoder/flag_codec.h"
#include "output_file.h"

namespace FseDump {

UniqueAggregator::UniqueAggregator(FormatOptions options) : options_(options) {}

UniqueAggregator::UniqueAggregator(std::string output_path, OutputFormat format, FormatOptions options)
	: output_path_(std::move(output_path)),
	  format_(format),
	  options_(options) {}

void UniqueAggregator::Write(const Record& record) {
	UniqueAggregate& agg = aggregates_[record.path];
	++agg.count;
	agg.combined_flags |= record.flag_bits;
	if (record.file_timestamp) {
		const int64_t ts = *record.file_timestamp;
		if (!agg.earliest || ts < *agg.earliest) {
			agg.earliest = ts;
		}
		if (!agg.latest || ts > *agg.latest) {
			agg.latest = ts;
		}
	}
}

const UniqueAggregate* UniqueAggregator::Find(const std::string& path) const {
	auto it = aggregates_.find(path);
	return it == aggregates_.end() ? nullptr : &it->second;
}

std::vector<std::pair<std::string, UniqueAggregate>> UniqueAggregator::Sorted() const {
	std::vector<std::pair<std::string, UniqueAggregate>> rows(aggregates_.begin(), aggregates_.end());
	std::sort(rows.begin(), rows.end(), [](const auto& a, const auto& b) {
		const std::string fa = absl::AsciiStrToLower(a.first);
		const std::string fb = absl::AsciiStrToLower(b.first);
		if (fa != fb) {
			return fa < fb;
		}
		return a.first < b.first;
	});
	return rows;
}

std::string UniqueAggregator::FormatTimestamp(const std::optional<int64_t>& seconds) {
	if (!seconds) {
		return "";
	}
	return absl::FormatTime(absl::RFC3339_sec, absl::FromUnixSeconds(*seconds), absl::UTCTimeZone());
}

std::string UniqueAggregator::FormatRow(const std::string& path, const UniqueAggregate& aggregate) const {
	const FlagTexts& flags = FlagCodec::Instance().Render(aggregate.combined_flags);
	const std::string earliest = FormatTimestamp(aggregate.earliest);
	const std::string latest = FormatTimestamp(aggregate.latest);

	switch (format_) {
		case OutputFormat::kCsv: {
			std::string row = absl::StrCat(CsvEscape(path), ",", aggregate.count, ",", CsvEscape(flags.text));
			if (options_.alt_flags) {
				absl::StrAppend(&row, ",", CsvEscape(flags.alt_text));
			}
			absl::StrAppend(&row, ",", earliest, ",", latest, "\n");
			return row;
		}
		case OutputFormat::kJson: {
			nlohmann::ordered_json j;
			j["path"] = path;
			j["counts"] = aggregate.count;
			j["flags"] = flags.text;
			if (options_.alt_flags) {
				j["alt_flags"] = flags.alt_text;
			}
			j["earliest"] = aggregate.earliest ? nlohmann::ordered_json(earliest) : nlohmann::ordered_json(nullptr);
			j["latest"] = aggregate.latest ? nlohmann::ordered_json(latest) : nlohmann::ordered_json(nullptr);
			return j.dump() + "\n";
		}
		case OutputFormat::kYaml: {
			YAML::Emitter out;
			out << YAML::BeginSeq << YAML::BeginMap;
			out << YAML::Key << "path" << YAML::Value << path;
			out << YAML::Key << "counts" << YAML::Value << aggregate.count;
			out << YAML::Key << "flags" << YAML::Value << flags.text;
			if (options_.alt_flags) {
				out << YAML::Key << "alt_flags" << YAML::Value << flags.alt_text;
			}
			out << YAML::Key << "earliest" << YAML::Value;
			if (aggregate.earliest) out << earliest; else out << YAML::Null;
			out << YAML::Key << "latest" << YAML::Value;
			if (aggregate.latest) out << latest; else out << YAML::Null;
			out << YAML::EndMap << YAML::EndSeq;
			if (!out.good()) {
				throw std::runtime_error("YAML emitter error: " + out.GetLastError());
			}
			return std::string(out.c_str()) + "\n";
		}
	}
	throw std::logic_error("Unhandled output format");
}

void UniqueAggregator::Finish() {
	LOG(INFO) << "Collected " << aggregates_.size() << " unique paths";
	if (!output_path_) {
		return;
	}

	OutputFile out(*output_path_);
	if (format_ == OutputFormat::kCsv) {
		out.Write(options_.alt_flags ? "path,counts,flags,alt_flags,earliest,latest\n"
				: "path,counts,flags,earliest,latest\n");
	}

	const auto rows = Sorted();
	for (const auto& [path, aggregate] : rows) {
		out.Write(FormatRow(path, aggregate));
	}
	if (format_ == OutputFormat::kYaml && rows.empty()) {
		out.Write("[]\n");
	}
	out.Close();
	LOG(INFO) << "Wrote " << rows.size() << " unique paths to " << *output_path_;
}

std::string UniqueAggregator::Name() const {
	return "unique aggregator" + (output_path_ ? " " + *output_path_ : std::string());
}

} // namespace FseDump
