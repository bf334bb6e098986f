#include <cstdio>
#include <exception>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <cxxopts.hpp>
#include <glog/logging.h>

#include "common/configuration.h"
#include "decoder/flag_codec.h"
#include "decoder/record_filter.h"
#include "orchestrator/job_orchestrator.h"

namespace {

std::optional<std::string> OptionalString(const cxxopts::ParseResult& arguments, const std::string& name) {
	if (arguments.count(name)) {
		return arguments[name].as<std::string>();
	}
	return std::nullopt;
}

std::vector<std::string> StringList(const cxxopts::ParseResult& arguments, const std::string& name) {
	if (arguments.count(name)) {
		return arguments[name].as<std::vector<std::string>>();
	}
	return {};
}

void ListFlags() {
	std::printf("Flags:\n");
	for (const auto& [name, bit] : FseDump::kFlags) {
		std::printf("  %-24s 0x%08X\n", std::string(name).c_str(), bit);
	}
	std::printf("Alternate flags:\n");
	for (const auto& [name, bit] : FseDump::kAltFlags) {
		std::printf("  %-24s 0x%08X\n", std::string(name).c_str(), bit);
	}
}

} // end of namespace

int main(int argc, char* argv[]) {
	// Initialize logging
	google::InitGoogleLogging(argv[0]);
	google::InstallFailureSignalHandler();

	cxxopts::Options options("fse_dump", "Decode macOS fsevents logs into CSV, JSON or YAML");
	options.positional_help("<files or directories>...");

	options.add_options()
		("c,csv", "Write all records to one CSV file (.gz to compress)", cxxopts::value<std::string>())
		("j,json", "Write all records to one JSON Lines file", cxxopts::value<std::string>())
		("y,yaml", "Write all records to one YAML file", cxxopts::value<std::string>())
		("csvs", "Write <input>.csv next to each input")
		("jsons", "Write <input>.json next to each input")
		("yamls", "Write <input>.yaml next to each input")
		("u,uniques", "Write one summary row per distinct path", cxxopts::value<std::string>())
		("f,filter", "Only keep records whose path matches this regex", cxxopts::value<std::string>())
		("any_flag", "Keep records carrying any of these flags", cxxopts::value<std::vector<std::string>>())
		("all_flag", "Keep records carrying all of these flags", cxxopts::value<std::vector<std::string>>())
		("p,parallel", "Decode input files concurrently")
		("config", "YAML configuration file", cxxopts::value<std::string>())
		("alt_flags", "Add a column with the alternate flag names")
		("no_hex", "Print node and extra ids in decimal")
		("list_flags", "Print the known flag names and exit")
		("l,log_level", "Log level", cxxopts::value<int>()->default_value("0"))
		("inputs", "Input files or directories", cxxopts::value<std::vector<std::string>>())
		("h,help", "Print usage");
	options.parse_positional({"inputs"});

	std::optional<cxxopts::ParseResult> parsed;
	try {
		parsed.emplace(options.parse(argc, argv));
	} catch (const std::exception& e) {
		std::cerr << e.what() << "\n" << options.help() << std::endl;
		return 2;
	}
	const cxxopts::ParseResult& arguments = *parsed;

	FLAGS_v = arguments["log_level"].as<int>();
	FLAGS_logtostderr = 1; // log only to console, no files

	if (arguments.count("help")) {
		std::cout << options.help() << std::endl;
		return 0;
	}
	if (arguments.count("list_flags")) {
		ListFlags();
		return 0;
	}

	// *************** Configuration **********************
	FseDump::Configuration& config = FseDump::Configuration::getInstance();
	if (arguments.count("config")) {
		if (!config.loadFromFile(arguments["config"].as<std::string>())) {
			LOG(ERROR) << "Invalid configuration, exiting";
			return 1;
		}
	} else if (!config.validate()) {
		for (const auto& error : config.getValidationErrors()) {
			LOG(ERROR) << "Configuration error: " << error;
		}
		return 1;
	}

	FseDump::JobOptions job = FseDump::JobOptions::FromConfig();
	job.inputs = StringList(arguments, "inputs");
	if (job.inputs.empty()) {
		std::cerr << "No input files given\n" << options.help() << std::endl;
		return 2;
	}
	job.csv_path = OptionalString(arguments, "csv");
	job.json_path = OptionalString(arguments, "json");
	job.yaml_path = OptionalString(arguments, "yaml");
	job.uniques_path = OptionalString(arguments, "uniques");
	job.per_file_csv = arguments.count("csvs") > 0;
	job.per_file_json = arguments.count("jsons") > 0;
	job.per_file_yaml = arguments.count("yamls") > 0;
	job.parallel = arguments.count("parallel") > 0;
	if (arguments.count("alt_flags")) {
		job.format.alt_flags = true;
	}
	if (arguments.count("no_hex")) {
		job.format.hex_ids = false;
	}

	if (!job.csv_path && !job.json_path && !job.yaml_path && !job.uniques_path &&
			!job.per_file_csv && !job.per_file_json && !job.per_file_yaml) {
		LOG(WARNING) << "No output requested; records will only be counted";
	}

	// Filter errors surface here, before any file is opened
	std::optional<FseDump::RecordFilter> filter;
	try {
		filter.emplace(OptionalString(arguments, "filter"),
				StringList(arguments, "any_flag"),
				StringList(arguments, "all_flag"));
	} catch (const std::invalid_argument& e) {
		LOG(ERROR) << e.what();
		return 2;
	}

	FseDump::JobReport report;
	try {
		FseDump::JobOrchestrator orchestrator(std::move(job), std::move(*filter));
		report = orchestrator.Run();
	} catch (const std::exception& e) {
		LOG(ERROR) << "fse_dump failed: " << e.what();
		return 1;
	}

	for (const auto& file : report.files) {
		if (!file.ok) {
			LOG(ERROR) << "FAILED " << file.path << ": " << file.error;
		}
	}
	LOG(INFO) << "fse_dump done: " << report.records << " records, " << report.accepted << " kept";
	return report.ok() ? 0 : 1;
}
