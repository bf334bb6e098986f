#include <gtest/gtest.h>
#include "../../src/decoder/record_filter.h"

#include <stdexcept>

using namespace FseDump;

namespace {

constexpr uint32_t kCreated = 0x01000000;
constexpr uint32_t kRemoved = 0x02000000;
constexpr uint32_t kRenamed = 0x08000000;
constexpr uint32_t kModified = 0x10000000;
constexpr uint32_t kFileEvent = 0x00008000;

Record MakeRecord(const std::string& path, uint32_t bits) {
    Record record;
    record.path = path;
    record.flag_bits = bits;
    return record;
}

} // namespace

TEST(RecordFilterTest, DefaultAcceptsEverything) {
    RecordFilter filter;
    EXPECT_TRUE(filter.IsPassThrough());
    EXPECT_TRUE(filter.Accepts(MakeRecord("/anything", 0)));
    EXPECT_TRUE(filter.Accepts(MakeRecord("", kRemoved)));
}

TEST(RecordFilterTest, AnyFlag) {
    RecordFilter filter(std::nullopt, {"Modified"}, {});
    EXPECT_FALSE(filter.IsPassThrough());
    EXPECT_TRUE(filter.Accepts(MakeRecord("/a", kModified | kRenamed)));
    EXPECT_FALSE(filter.Accepts(MakeRecord("/a", kRenamed)));
}

TEST(RecordFilterTest, AllFlags) {
    RecordFilter filter(std::nullopt, {}, {"Modified", "FileEvent"});
    EXPECT_EQ(filter.all_mask(), kModified | kFileEvent);
    EXPECT_EQ(filter.any_mask(), 0u);
    EXPECT_FALSE(filter.Accepts(MakeRecord("/a", kModified)));
    EXPECT_FALSE(filter.Accepts(MakeRecord("/a", kFileEvent)));
    EXPECT_TRUE(filter.Accepts(MakeRecord("/a", kModified | kFileEvent)));
    EXPECT_TRUE(filter.Accepts(MakeRecord("/a", kModified | kFileEvent | kCreated | kRenamed)));
}

TEST(RecordFilterTest, AnyMaskCombinesNames) {
    RecordFilter filter(std::nullopt, {"created", "REMOVED"}, {});
    EXPECT_EQ(filter.any_mask(), kCreated | kRemoved);
    EXPECT_TRUE(filter.Accepts(MakeRecord("/a", kRemoved)));
    EXPECT_TRUE(filter.Accepts(MakeRecord("/a", kCreated)));
    EXPECT_FALSE(filter.Accepts(MakeRecord("/a", kModified)));
}

TEST(RecordFilterTest, PathRegexSearchesAnywhere) {
    RecordFilter filter(std::string("Users/[a-z]+/Library"), {}, {});
    EXPECT_TRUE(filter.Accepts(MakeRecord("/Users/alice/Library/Caches", 0)));
    EXPECT_FALSE(filter.Accepts(MakeRecord("/Users/Alice/Library", 0)));
    EXPECT_FALSE(filter.Accepts(MakeRecord("/private/var", 0)));
    EXPECT_EQ(filter.pattern(), "Users/[a-z]+/Library");
}

TEST(RecordFilterTest, AllConditionsMustHold) {
    RecordFilter filter(std::string("\\.plist$"), {"Created", "Modified"}, {"FileEvent"});
    EXPECT_TRUE(filter.Accepts(MakeRecord("/Library/x.plist", kCreated | kFileEvent)));
    EXPECT_FALSE(filter.Accepts(MakeRecord("/Library/x.plist", kCreated)));
    EXPECT_FALSE(filter.Accepts(MakeRecord("/Library/x.plist", kFileEvent)));
    EXPECT_FALSE(filter.Accepts(MakeRecord("/Library/x.txt", kCreated | kFileEvent)));
}

TEST(RecordFilterTest, UnknownFlagNameFailsAtConstruction) {
    EXPECT_THROW(RecordFilter(std::nullopt, {"Modified", "Bogus"}, {}), std::invalid_argument);
    EXPECT_THROW(RecordFilter(std::nullopt, {}, {"Bogus"}), std::invalid_argument);
}

TEST(RecordFilterTest, BadRegexFailsAtConstruction) {
    EXPECT_THROW(RecordFilter(std::string("([unclosed"), {}, {}), std::invalid_argument);
}
