#include <core/model/candidate_record.h>
#include <gtest/gtest.h>

using namespace bridgefinder::core;

// =============================================================================
// NormalizeId
// =============================================================================

TEST(CandidateRecord, NormalizeIdStripsPunctuationAndUppercases) {
    EXPECT_EQ(CandidateRecord::NormalizeId("00:17:88:ff:fe:4a:2b:3c"), "001788FFFE4A2B3C");
    EXPECT_EQ(CandidateRecord::NormalizeId("001788fffe4a2b3c"), "001788FFFE4A2B3C");
    EXPECT_EQ(CandidateRecord::NormalizeId("ecb5-fafffe-1a2b3c"), "ECB5FAFFFE1A2B3C");
    EXPECT_EQ(CandidateRecord::NormalizeId(":-:"), "");
}

TEST(CandidateRecord, MakeFillsNormalizedId) {
    auto record = CandidateRecord::Make("ab:cd", "192.168.1.2", 443, "Hue");
    EXPECT_EQ(record.id, "ab:cd");
    EXPECT_EQ(record.normalized_id, "ABCD");
    EXPECT_EQ(record.address, "192.168.1.2");
    EXPECT_EQ(record.port, 443);
    EXPECT_EQ(record.display_name, "Hue");
}

TEST(CandidateRecord, MergeKeyFallsBackToAddress) {
    auto record = CandidateRecord::Make("", "10.0.0.2");
    EXPECT_EQ(record.MergeKey(), "@10.0.0.2");
}

// =============================================================================
// Deduplicate
// =============================================================================

TEST(Deduplicate, SameDeviceInDifferentCasingIsMerged) {
    std::vector<CandidateRecord> records{
        CandidateRecord::Make("001788fffe4a2b3c", "192.168.1.2", std::nullopt, "first"),
        CandidateRecord::Make("00:17:88:FF:FE:4A:2B:3C", "192.168.1.3", std::nullopt, "second"),
    };

    auto merged = Deduplicate(records);

    ASSERT_EQ(merged.size(), 1u);
    EXPECT_EQ(merged[0].display_name, "first");
    EXPECT_EQ(merged[0].address, "192.168.1.2");
}

TEST(Deduplicate, KeepsOrderOfFirstSighting) {
    std::vector<CandidateRecord> records{
        CandidateRecord::Make("bbb", "10.0.0.2"),
        CandidateRecord::Make("aaa", "10.0.0.3"),
        CandidateRecord::Make("BBB", "10.0.0.4"),
        CandidateRecord::Make("ccc", "10.0.0.5"),
    };

    auto merged = Deduplicate(records);

    ASSERT_EQ(merged.size(), 3u);
    EXPECT_EQ(merged[0].normalized_id, "BBB");
    EXPECT_EQ(merged[1].normalized_id, "AAA");
    EXPECT_EQ(merged[2].normalized_id, "CCC");
}

TEST(Deduplicate, FillsMissingNormalizedId) {
    CandidateRecord raw;
    raw.id = "ab-cd";
    raw.address = "10.0.0.9";

    auto merged = Deduplicate({raw});

    ASSERT_EQ(merged.size(), 1u);
    EXPECT_EQ(merged[0].normalized_id, "ABCD");
}

TEST(Deduplicate, RecordsWithoutIdAreKeyedByAddress) {
    std::vector<CandidateRecord> records{
        CandidateRecord::Make("", "10.0.0.2"),
        CandidateRecord::Make("::", "10.0.0.2"),
        CandidateRecord::Make("", "10.0.0.3"),
    };

    auto merged = Deduplicate(records);

    ASSERT_EQ(merged.size(), 2u);
    EXPECT_EQ(merged[0].address, "10.0.0.2");
    EXPECT_EQ(merged[1].address, "10.0.0.3");
}

TEST(Deduplicate, EmptyInputGivesEmptyOutput) {
    EXPECT_TRUE(Deduplicate({}).empty());
}

// =============================================================================
// JSON
// =============================================================================

TEST(CandidateRecordJson, OptionalFieldsAreOmitted) {
    nlohmann::json j = CandidateRecord::Make("abc", "10.0.0.2");

    EXPECT_EQ(j["id"], "abc");
    EXPECT_EQ(j["normalized_id"], "ABC");
    EXPECT_EQ(j["address"], "10.0.0.2");
    EXPECT_FALSE(j.contains("name"));
    EXPECT_FALSE(j.contains("port"));
}

TEST(CandidateRecordJson, ReadsBackWhatItWrites) {
    auto record = CandidateRecord::Make("ab:cd", "10.0.0.2", 80, "Living room");
    nlohmann::json j = record;

    EXPECT_EQ(j.get<CandidateRecord>(), record);
}
