#include <gtest/gtest.h>
#include "../../src/decoder/flag_codec.h"

#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace FseDump;

TEST(FlagCodecTest, EverySingleFlagRendersItsName) {
    FlagCodec codec;
    for (const auto& [name, bit] : kFlags) {
        EXPECT_EQ(codec.Render(bit).text, name) << "bit 0x" << std::hex << bit;
    }
    for (const auto& [name, bit] : kAltFlags) {
        EXPECT_EQ(codec.Render(bit).alt_text, name) << "bit 0x" << std::hex << bit;
    }
}

TEST(FlagCodecTest, ZeroRendersEmpty) {
    FlagCodec codec;
    EXPECT_EQ(codec.Render(0).text, "");
    EXPECT_EQ(codec.Render(0).alt_text, "");
    EXPECT_EQ(FlagCodec::RenderUncached(0, FlagVocabulary::kPrimary), "");
    EXPECT_EQ(FlagCodec::RenderUncached(0, FlagVocabulary::kAlternate), "");
}

TEST(FlagCodecTest, CombinationsFollowTableOrder) {
    FlagCodec codec;
    // FolderCreated is the last entry, FileEvent comes before Created
    const uint32_t bits = 0x80000000 | 0x01000000 | 0x00008000;
    EXPECT_EQ(codec.Render(bits).text, "FileEvent | Created | FolderCreated");

    const uint32_t modified_renamed = 0x10000000 | 0x08000000;
    EXPECT_EQ(codec.Render(modified_renamed).text, "Renamed | Modified");
}

TEST(FlagCodecTest, UnknownBitsAreIgnored) {
    FlagCodec codec;
    // 0x00000008 is not in the primary table
    EXPECT_EQ(codec.Render(0x00000008).text, "");
    EXPECT_EQ(codec.Render(0x00000008 | 0x00000002).text, "Mount");
}

TEST(FlagCodecTest, AlternateVocabularyRenderedAlongside) {
    FlagCodec codec;
    const FlagTexts& texts = codec.Render(0x00000011);
    EXPECT_EQ(texts.text, "FolderEvent");
    EXPECT_EQ(texts.alt_text, "Created | Modified");
}

TEST(FlagCodecTest, RepeatedRenderReturnsSameObject) {
    FlagCodec codec;
    const uint32_t bits = 0x12345678;
    const size_t before = codec.CachedCount();
    const FlagTexts* first = &codec.Render(bits);
    const FlagTexts* second = &codec.Render(bits);
    EXPECT_EQ(first, second);
    EXPECT_EQ(codec.CachedCount(), before + 1);
    EXPECT_EQ(first->text, FlagCodec::RenderUncached(bits));
}

TEST(FlagCodecTest, ConcurrentRendersAgreeOnIdentity) {
    FlagCodec codec;
    constexpr int kThreads = 8;
    constexpr uint32_t kMasks = 500;
    std::vector<std::vector<const FlagTexts*>> seen(kThreads);

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&codec, &seen, t]() {
            for (uint32_t m = 0; m < kMasks; ++m) {
                seen[t].push_back(&codec.Render(0x01000000 | (m << 1)));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    for (int t = 1; t < kThreads; ++t) {
        EXPECT_EQ(seen[t], seen[0]);
    }
    std::set<const FlagTexts*> distinct(seen[0].begin(), seen[0].end());
    EXPECT_EQ(distinct.size(), kMasks);
}

TEST(FlagCodecTest, FlagIdIsCaseInsensitive) {
    EXPECT_EQ(FlagCodec::FlagId("Modified"), 0x10000000u);
    EXPECT_EQ(FlagCodec::FlagId("modified"), 0x10000000u);
    EXPECT_EQ(FlagCodec::FlagId("FOLDERCREATED"), 0x80000000u);
    EXPECT_FALSE(FlagCodec::FlagId("NotAFlag").has_value());
    EXPECT_FALSE(FlagCodec::FlagId("").has_value());
}

TEST(FlagCodecTest, InstanceIsShared) {
    EXPECT_EQ(&FlagCodec::Instance(), &FlagCodec::Instance());
}
