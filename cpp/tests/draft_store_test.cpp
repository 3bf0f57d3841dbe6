#include "takeoff_test_common.h"

#include "takeoff/persistence/draft_store.h"

#include <cstdio>

using namespace takeoff;

TEST(DraftStoreTest, KeyIsPerJob) {
    EXPECT_EQ(draftKey("42"), "detection-drafts-42");
}

TEST(DraftStoreTest, MemoryStore) {
    MemoryDraftStore store;
    std::vector<std::uint8_t> out;
    EXPECT_EQ(store.load("job-1", out), EngineError::NotFound);
    EXPECT_FALSE(store.contains("job-1"));

    ASSERT_EQ(store.save("job-1", {1, 2, 3}), EngineError::Ok);
    ASSERT_EQ(store.save("job-2", {9}), EngineError::Ok);
    EXPECT_EQ(store.size(), 2u);
    ASSERT_EQ(store.load("job-1", out), EngineError::Ok);
    EXPECT_EQ(out, (std::vector<std::uint8_t>{1, 2, 3}));

    ASSERT_EQ(store.save("job-1", {4}), EngineError::Ok);
    ASSERT_EQ(store.load("job-1", out), EngineError::Ok);
    EXPECT_EQ(out, (std::vector<std::uint8_t>{4}));

    EXPECT_EQ(store.remove("job-1"), EngineError::Ok);
    EXPECT_FALSE(store.contains("job-1"));
    EXPECT_TRUE(store.contains("job-2"));
}

TEST(DraftStoreTest, FileStoreWritesOneFilePerJob) {
    FileDraftStore store(::testing::TempDir());
    const std::string jobId = "file-store-test";
    ASSERT_EQ(store.remove(jobId), EngineError::Ok);
    EXPECT_FALSE(store.contains(jobId));

    const std::vector<std::uint8_t> bytes{0x54, 0x44, 0x52, 0x46, 0, 1, 2, 255};
    ASSERT_EQ(store.save(jobId, bytes), EngineError::Ok);
    EXPECT_TRUE(store.contains(jobId));
    EXPECT_NE(store.pathFor(jobId).find("detection-drafts-file-store-test.tdrf"), std::string::npos);

    std::vector<std::uint8_t> out;
    ASSERT_EQ(store.load(jobId, out), EngineError::Ok);
    EXPECT_EQ(out, bytes);

    ASSERT_EQ(store.remove(jobId), EngineError::Ok);
    EXPECT_FALSE(store.contains(jobId));
    EXPECT_EQ(store.load(jobId, out), EngineError::NotFound);
}

TEST(DraftStoreTest, FileStoreReportsUnwritableDirectory) {
    FileDraftStore store("/nonexistent-takeoff-dir/drafts");
    EXPECT_EQ(store.save("job-1", {1}), EngineError::IoError);
    EXPECT_FALSE(store.contains("job-1"));
}
