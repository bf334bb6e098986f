#include <gtest/gtest.h>
#include "../../src/orchestrator/job_orchestrator.h"
#include "../../src/sinks/unique_aggregator.h"
#include "../test_utils.h"

#include <filesystem>
#include <fstream>

using namespace FseDump;
using namespace FseDump::testing_util;
using namespace std::chrono_literals;

namespace {

// Records every record it sees; node ids checked after the run
class InspectingSink : public RecordSink {
public:
    explicit InspectingSink(std::vector<RecordPtr>* out) : out_(out) {}
    void Write(const Record& record) override {
        out_->push_back(std::make_shared<const Record>(record));
    }
    std::string Name() const override { return "inspecting sink"; }
private:
    std::vector<RecordPtr>* out_;
};

JobOptions BaseOptions() {
    JobOptions options;
    options.queue_capacity = 32;
    options.poll_interval = 5ms;
    return options;
}

} // namespace

TEST(JobOrchestratorTest, MixedFixtureEndToEnd) {
    TempDir dir;
    MakeMixedFixture().WriteFile(dir.File("0000000000001000"), true);

    JobOptions options = BaseOptions();
    options.inputs = {dir.path().string()};
    options.csv_path = dir.File("out.csv");
    options.uniques_path = dir.File("uniques.csv");
    options.decode.stamp_file_time = true;

    std::vector<RecordPtr> seen;
    JobOrchestrator orchestrator(options, RecordFilter());
    orchestrator.AddSink(std::make_unique<InspectingSink>(&seen));
    JobReport report = orchestrator.Run();

    EXPECT_TRUE(report.ok());
    ASSERT_EQ(report.files.size(), 1u);
    EXPECT_EQ(report.records, kMixedFixtureRecords);
    EXPECT_EQ(report.accepted, kMixedFixtureRecords);
    ASSERT_EQ(seen.size(), kMixedFixtureRecords);

    // Pages: 700 V1, 800 V2, 900 V3, 330 V1
    for (size_t i = 0; i < seen.size(); ++i) {
        const bool v2_or_v3 = i >= 700 && i < 2400;
        EXPECT_EQ(seen[i]->node_id.has_value(), v2_or_v3) << "record " << i;
        EXPECT_EQ(seen[i]->extra_id.has_value(), i >= 1500 && i < 2400) << "record " << i;
        EXPECT_TRUE(seen[i]->file_timestamp.has_value());
    }

    auto csv = SplitLines(ReadGzFile(dir.File("out.csv")));
    EXPECT_EQ(csv.size(), kMixedFixtureRecords + 1);
    auto uniques = SplitLines(ReadGzFile(dir.File("uniques.csv")));
    // Every fixture path is distinct
    EXPECT_EQ(uniques.size(), kMixedFixtureRecords + 1);
}

TEST(JobOrchestratorTest, FailedFileDoesNotStopOthers) {
    TempDir dir;
    FseventsBuilder good;
    good.AddPage(Version::kV2, MakeEvents(10, "/good", 1));
    good.WriteFile(dir.File("0000000000000001"), false);

    FseventsBuilder bad;
    bad.AddPage(Version::kV1, MakeEvents(5, "/bad", 100));
    bad.AppendRaw("XXXXjunkjunk");
    bad.WriteFile(dir.File("0000000000000002"), false);

    FseventsBuilder also_good;
    also_good.AddPage(Version::kV3, MakeEvents(7, "/also", 200));
    also_good.WriteFile(dir.File("0000000000000003"), true);

    JobOptions options = BaseOptions();
    options.inputs = {dir.path().string(), dir.File("ffffffffffffffff")};
    std::vector<RecordPtr> seen;
    JobOrchestrator orchestrator(options, RecordFilter());
    orchestrator.AddSink(std::make_unique<InspectingSink>(&seen));
    JobReport report = orchestrator.Run();

    EXPECT_FALSE(report.ok());
    EXPECT_EQ(report.failed_files, 2u);
    ASSERT_EQ(report.files.size(), 4u);
    // Missing inputs are listed first
    EXPECT_EQ(report.files[0].path, dir.File("ffffffffffffffff"));
    EXPECT_EQ(report.files[0].error_kind, DecodeError::Kind::kIo);
    EXPECT_TRUE(report.files[1].ok);
    EXPECT_FALSE(report.files[2].ok);
    EXPECT_EQ(report.files[2].error_kind, DecodeError::Kind::kUnsupportedVersion);
    EXPECT_TRUE(report.files[3].ok);

    // The bad file's first page still reached the sinks and is still counted
    EXPECT_EQ(seen.size(), 10u + 5u + 7u);
    EXPECT_EQ(report.files[2].summary.records, 5u);
    ASSERT_EQ(report.files[2].summary.pages.size(), 1u);
    EXPECT_EQ(report.records, 22u);
    EXPECT_EQ(report.accepted, seen.size());
}

TEST(JobOrchestratorTest, FilterAppliesToEverySink) {
    TempDir dir;
    MakeMixedFixture().WriteFile(dir.File("0000000000000001"), false);

    JobOptions options = BaseOptions();
    options.inputs = {dir.File("0000000000000001")};
    std::vector<RecordPtr> seen;
    // MakeEvents cycles five masks; exactly one in five is Removed only
    JobOrchestrator orchestrator(options, RecordFilter(std::nullopt, {"Removed"}, {}));
    orchestrator.AddSink(std::make_unique<InspectingSink>(&seen));
    JobReport report = orchestrator.Run();

    EXPECT_TRUE(report.ok());
    EXPECT_EQ(report.records, kMixedFixtureRecords);
    EXPECT_EQ(report.accepted, seen.size());
    for (const auto& record : seen) {
        EXPECT_NE(record->flag_bits & 0x02000000u, 0u);
    }
    // 700/5 + 800/5 + 900/5 + 330/5
    EXPECT_EQ(seen.size(), 140u + 160u + 180u + 66u);
}

TEST(JobOrchestratorTest, PerFileOutputsNextToInputs) {
    TempDir dir;
    FseventsBuilder a;
    a.AddPage(Version::kV1, MakeEvents(3, "/a", 1));
    a.WriteFile(dir.File("000000000000000a"), false);
    FseventsBuilder b;
    b.AddPage(Version::kV2, MakeEvents(4, "/b", 1));
    b.WriteFile(dir.File("000000000000000b"), true);

    JobOptions options = BaseOptions();
    options.inputs = {dir.File("000000000000000a"), dir.File("000000000000000b")};
    options.per_file_csv = true;
    options.per_file_json = true;
    options.parallel = true;
    options.worker_threads = 2;

    JobOrchestrator orchestrator(options, RecordFilter());
    JobReport report = orchestrator.Run();
    EXPECT_TRUE(report.ok());

    EXPECT_EQ(SplitLines(ReadGzFile(dir.File("000000000000000a.csv"))).size(), 4u);
    EXPECT_EQ(SplitLines(ReadGzFile(dir.File("000000000000000b.csv"))).size(), 5u);
    EXPECT_EQ(SplitLines(ReadGzFile(dir.File("000000000000000a.json"))).size(), 3u);
    EXPECT_EQ(SplitLines(ReadGzFile(dir.File("000000000000000b.json"))).size(), 4u);
}

TEST(JobOrchestratorTest, ParallelDecodeMatchesSequentialCount) {
    TempDir dir;
    for (int i = 0; i < 4; ++i) {
        FseventsBuilder builder;
        builder.AddPage(Version::kV2, MakeEvents(250, "/f" + std::to_string(i), i * 1000));
        builder.WriteFile(dir.File("000000000000000" + std::to_string(i)), i % 2 == 0);
    }

    JobOptions options = BaseOptions();
    options.inputs = {dir.path().string()};
    options.parallel = true;
    options.worker_threads = 3;

    std::vector<RecordPtr> seen;
    JobOrchestrator orchestrator(options, RecordFilter());
    orchestrator.AddSink(std::make_unique<InspectingSink>(&seen));
    JobReport report = orchestrator.Run();

    EXPECT_TRUE(report.ok());
    EXPECT_EQ(report.records, 1000u);
    EXPECT_EQ(seen.size(), 1000u);
}

TEST(JobOrchestratorTest, BadCombinedOutputFailsBeforeDecoding) {
    JobOptions options = BaseOptions();
    options.inputs = {"/nonexistent"};
    options.csv_path = "/nonexistent-dir/out.csv";
    JobOrchestrator orchestrator(options, RecordFilter());
    EXPECT_THROW(orchestrator.Run(), std::runtime_error);
}
