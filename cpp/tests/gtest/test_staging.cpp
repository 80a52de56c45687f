// =============================================================================
// Staging and Delivery Tests
// =============================================================================

#include <gtest/gtest.h>
#include "redactor/error.hpp"
#include "redactor/staging.hpp"
#include "test_documents.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;
using namespace redactor;

class StagingTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = fs::temp_directory_path() /
                ("redactor_staging_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) +
                 "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(root_);
        fs::create_directories(root_);
        staging_ = root_ / "stage";
        pipeline_.staging_dir = staging_.string();
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    static std::string slurp(const fs::path& path) {
        std::ifstream in(path, std::ios::binary);
        std::ostringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    size_t staged_files() const {
        if (!fs::exists(staging_)) return 0;
        size_t n = 0;
        for (const auto& entry : fs::directory_iterator(staging_)) {
            (void)entry;
            ++n;
        }
        return n;
    }

    fs::path root_;
    fs::path staging_;
    PipelineConfig pipeline_;
};

TEST_F(StagingTest, CommitMovesFileIntoPlace) {
    const fs::path dest = root_ / "out.pdf";
    {
        StagedOutput staged(staging_);
        staged.write(fixtures::to_bytes("redacted bytes"));
        EXPECT_TRUE(fs::exists(staged.staged_path()));
        EXPECT_EQ(staged.staged_path().filename().string().rfind("stage-", 0), 0u);

        const auto perms = fs::status(staged.staged_path()).permissions();
        EXPECT_EQ(perms & (fs::perms::group_all | fs::perms::others_all), fs::perms::none);

        staged.commit(dest);
        EXPECT_TRUE(staged.committed());
    }
    EXPECT_EQ(slurp(dest), "redacted bytes");
    EXPECT_EQ(staged_files(), 0u);
}

TEST_F(StagingTest, AbandonedStageIsRemoved) {
    fs::path staged_path;
    {
        StagedOutput staged(staging_);
        staged.write(fixtures::to_bytes("partial"));
        staged_path = staged.staged_path();
        ASSERT_TRUE(fs::exists(staged_path));
    }
    EXPECT_FALSE(fs::exists(staged_path));
}

TEST_F(StagingTest, CommitWithoutWriteFails) {
    StagedOutput staged(staging_);
    EXPECT_THROW(staged.commit(root_ / "out.pdf"), RedactorException);
    EXPECT_FALSE(fs::exists(root_ / "out.pdf"));
}

TEST_F(StagingTest, DeliverValidatedDocument) {
    RedactedDocument doc;
    doc.bytes = fixtures::to_bytes("%PDF-1.7 clean");
    doc.report.final_state = DocumentState::Validated;

    deliver_document(doc, pipeline_, root_ / "delivered.pdf");
    EXPECT_EQ(slurp(root_ / "delivered.pdf"), "%PDF-1.7 clean");
    EXPECT_EQ(staged_files(), 0u);
    EXPECT_EQ(doc.report.final_state, DocumentState::Delivered);
}

TEST_F(StagingTest, DeliverRefusesUnvalidatedDocument) {
    RedactedDocument doc;
    doc.bytes = fixtures::to_bytes("unchecked");
    doc.report.final_state = DocumentState::Redacted;

    try {
        deliver_document(doc, pipeline_, root_ / "delivered.pdf");
        FAIL() << "unvalidated document delivered";
    } catch (const RedactorException& e) {
        EXPECT_EQ(e.code(), ErrorCode::SECURITY_VIOLATION);
    }
    EXPECT_FALSE(fs::exists(root_ / "delivered.pdf"));
    EXPECT_EQ(doc.report.final_state, DocumentState::Redacted);
}

TEST_F(StagingTest, PurgeRemovesOnlyStaleStageFiles) {
    fs::create_directories(staging_);
    const fs::path stale = staging_ / "stage-0000000000000001.part";
    const fs::path fresh = staging_ / "stage-0000000000000002.part";
    const fs::path other = staging_ / "notes.txt";
    for (const auto& p : {stale, fresh, other}) std::ofstream(p) << "x";

    const auto old_time = fs::file_time_type::clock::now() - std::chrono::hours(48);
    fs::last_write_time(stale, old_time);
    fs::last_write_time(other, old_time);

    EXPECT_EQ(purge_stale_staging(staging_, std::chrono::hours(24)), 1u);
    EXPECT_FALSE(fs::exists(stale));
    EXPECT_TRUE(fs::exists(fresh));
    EXPECT_TRUE(fs::exists(other));
}

TEST_F(StagingTest, PurgeMissingDirectoryIsNoop) {
    EXPECT_EQ(purge_stale_staging(root_ / "absent", std::chrono::hours(1)), 0u);
}
