#include "formats.h"

#include <stdexcept>

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "common/configuration.h"

namespace FseDump {

std::string_view OutputFormatName(OutputFormat format) {
	switch (format) {
		case OutputFormat::kCsv: return "csv";
		case OutputFormat::kJson: return "json";
		case OutputFormat::kYaml: return "yaml";
	}
	return "unknown";
}

std::optional<OutputFormat> FormatFromPath(std::string_view path) {
	std::string lower = absl::AsciiStrToLower(absl::string_view(path.data(), path.size()));
	absl::string_view name = lower;
	if (absl::EndsWith(name, ".gz")) {
		name.remove_suffix(3);
	}
	if (absl::EndsWith(name, ".csv")) return OutputFormat::kCsv;
	if (absl::EndsWith(name, ".json") || absl::EndsWith(name, ".jsonl")) return OutputFormat::kJson;
	if (absl::EndsWith(name, ".yaml") || absl::EndsWith(name, ".yml")) return OutputFormat::kYaml;
	return std::nullopt;
}

FormatOptions FormatOptions::FromConfig() {
	const auto& output = GetConfig().output;
	FormatOptions options;
	options.hex_ids = output.hex_ids.get();
	options.alt_flags = output.alt_flags.get();
	options.extra_id = output.extra_id.get();
	return options;
}

std::string FormatId(uint64_t id, bool hex) {
	if (!hex) {
		return std::to_string(id);
	}
	return absl::StrCat("0x", absl::AsciiStrToUpper(absl::StrCat(absl::Hex(id))));
}

std::string CsvEscape(std::string_view field) {
	if (field.find_first_of(",\"\r\n") == std::string_view::npos) {
		return std::string(field);
	}
	std::string out;
	out.reserve(field.size() + 2);
	out.push_back('"');
	for (char c : field) {
		if (c == '"') {
			out.push_back('"');
		}
		out.push_back(c);
	}
	out.push_back('"');
	return out;
}

std::string RecordFormatter::Header() const {
	if (format_ != OutputFormat::kCsv) {
		return "";
	}
	std::string header = "path,event_id,flags";
	if (options_.alt_flags) {
		header += ",alt_flags";
	}
	header += ",node_id";
	if (options_.extra_id) {
		header += ",extra_id";
	}
	header += "\n";
	return header;
}

std::string RecordFormatter::Footer(uint64_t records_written) const {
	if (format_ == OutputFormat::kYaml && records_written == 0) {
		return "[]\n";
	}
	return "";
}

std::string RecordFormatter::Format(const Record& record) const {
	switch (format_) {
		case OutputFormat::kCsv: return FormatCsv(record);
		case OutputFormat::kJson: return FormatJson(record);
		case OutputFormat::kYaml: return FormatYaml(record);
	}
	throw std::logic_error("Unhandled output format");
}

std::string RecordFormatter::FormatCsv(const Record& record) const {
	std::string row = CsvEscape(record.path);
	absl::StrAppend(&row, ",", record.event_id, ",", CsvEscape(record.FlagText()));
	if (options_.alt_flags) {
		absl::StrAppend(&row, ",", CsvEscape(record.AltFlagText()));
	}
	row += ",";
	if (record.node_id) {
		row += FormatId(*record.node_id, options_.hex_ids);
	}
	if (options_.extra_id) {
		row += ",";
		if (record.extra_id) {
			row += FormatId(*record.extra_id, options_.hex_ids);
		}
	}
	row += "\n";
	return row;
}

std::string RecordFormatter::FormatJson(const Record& record) const {
	nlohmann::ordered_json j;
	j["path"] = record.path;
	j["event_id"] = record.event_id;
	j["flags"] = record.FlagText();
	if (options_.alt_flags) {
		j["alt_flags"] = record.AltFlagText();
	}

	auto id_value = [this](auto id) -> nlohmann::ordered_json {
		if (options_.hex_ids) {
			return FormatId(id, true);
		}
		return id;
	};
	j["node_id"] = record.node_id ? id_value(*record.node_id) : nlohmann::ordered_json(nullptr);
	if (options_.extra_id) {
		j["extra_id"] = record.extra_id ? id_value(*record.extra_id) : nlohmann::ordered_json(nullptr);
	}
	return j.dump() + "\n";
}

std::string RecordFormatter::FormatYaml(const Record& record) const {
	YAML::Emitter out;
	out << YAML::BeginSeq << YAML::BeginMap;
	out << YAML::Key << "path" << YAML::Value << record.path;
	out << YAML::Key << "event_id" << YAML::Value << record.event_id;
	out << YAML::Key << "flags" << YAML::Value << record.FlagText();
	if (options_.alt_flags) {
		out << YAML::Key << "alt_flags" << YAML::Value << record.AltFlagText();
	}

	out << YAML::Key << "node_id" << YAML::Value;
	if (record.node_id) {
		if (options_.hex_ids) {
			out << FormatId(*record.node_id, true);
		} else {
			out << *record.node_id;
		}
	} else {
		out << YAML::Null;
	}

	if (options_.extra_id) {
		out << YAML::Key << "extra_id" << YAML::Value;
		if (record.extra_id) {
			if (options_.hex_ids) {
				out << FormatId(*record.extra_id, true);
			} else {
				out << *record.extra_id;
			}
		} else {
			out << YAML::Null;
		}
	}
	out << YAML::EndMap << YAML::EndSeq;

	if (!out.good()) {
		throw std::runtime_error("YAML emitter error: " + out.GetLastError());
	}
	return std::string(out.c_str()) + "\n";
}

} // namespace FseDump
