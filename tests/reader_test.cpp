#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "lanpaste/index/reader.hpp"
#include "lanpaste/storage/draft.hpp"
#include "lanpaste/storage/files.hpp"
#include "lanpaste/vcs/commit.hpp"
#include "test_support.hpp"

using namespace lanpaste::core;
using lanpaste::test_support::TempDir;

class ReaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        ctx_ = lanpaste::test_support::git_at(tmp_.path() / "repo");
        ASSERT_TRUE(is_ok(lanpaste::vcs::git_bootstrap_repo(ctx_)));
    }

    // Drafts and commits one paste created at `now`.
    PasteDraft add(TimestampMs now, const char* body, std::optional<std::string> tag = std::nullopt) {
        CreatePasteInput in;
        in.bytes = body;
        in.tag = std::move(tag);
        PasteDraft d;
        EXPECT_TRUE(is_ok(lanpaste::storage::build_paste_draft(ctx_.repo, in, now, &d)));
        CommitResult r;
        EXPECT_TRUE(is_ok(lanpaste::vcs::commit_paste(ctx_, d, PushMode::Off, "origin", &r)));
        commits_.push_back(r.commit);
        return d;
    }

    TempDir tmp_;
    lanpaste::vcs::GitContext ctx_;
    std::vector<std::string> commits_;
};

TEST_F(ReaderTest, ReadMetaHydratesCommit) {
    const PasteDraft d = add(1000, "hello");

    PasteMeta m;
    ASSERT_TRUE(is_ok(lanpaste::index::read_meta(ctx_, d.id, &m)));
    EXPECT_EQ(m.id, d.id);
    EXPECT_EQ(m.commit, commits_.back());
    EXPECT_EQ(m.size, 5u);

    // stored record keeps the empty commit
    std::string text;
    ASSERT_TRUE(is_ok(lanpaste::storage::read_file(d.meta_path, &text)));
    EXPECT_NE(text.find("\"commit\": \"\""), std::string::npos);
}

TEST_F(ReaderTest, UnknownAndMalformedIdsAreNotFound) {
    PasteMeta m;
    EXPECT_EQ(lanpaste::index::read_meta(ctx_, "01ARZ3NDEKTSV4RRFFQ69G5FAV", &m).code, StatusCode::NotFound);
    EXPECT_EQ(lanpaste::index::read_meta(ctx_, "../README", &m).code, StatusCode::NotFound);
    EXPECT_EQ(lanpaste::index::read_meta(ctx_, "", &m).code, StatusCode::NotFound);
}

TEST_F(ReaderTest, RecentIsNewestFirstAndLimited) {
    const PasteDraft a = add(1000, "a");
    const PasteDraft b = add(3000, "b");
    const PasteDraft c = add(2000, "c");

    std::vector<PasteMeta> out;
    ASSERT_TRUE(is_ok(lanpaste::index::read_recent(ctx_, 10, std::nullopt, &out)));
    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(out[0].id, b.id);
    EXPECT_EQ(out[1].id, c.id);
    EXPECT_EQ(out[2].id, a.id);
    for (const auto& m : out) {
        EXPECT_EQ(m.commit.size(), 12u);
    }

    ASSERT_TRUE(is_ok(lanpaste::index::read_recent(ctx_, 2, std::nullopt, &out)));
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].id, b.id);

    ASSERT_TRUE(is_ok(lanpaste::index::read_recent(ctx_, 0, std::nullopt, &out)));
    EXPECT_TRUE(out.empty());
}

TEST_F(ReaderTest, RecentFiltersByExactTag) {
    add(1000, "a", std::string("ops"));
    const PasteDraft b = add(2000, "b", std::string("ops"));
    add(3000, "c", std::string("opsx"));
    add(4000, "d");

    std::vector<PasteMeta> out;
    ASSERT_TRUE(is_ok(lanpaste::index::read_recent(ctx_, 10, std::string_view("ops"), &out)));
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].id, b.id);

    ASSERT_TRUE(is_ok(lanpaste::index::read_recent(ctx_, 10, std::string_view("none"), &out)));
    EXPECT_TRUE(out.empty());
}

TEST_F(ReaderTest, RecentSkipsUnparsableRecords) {
    add(1000, "a");
    ASSERT_TRUE(is_ok(lanpaste::storage::write_file(ctx_.repo / "meta" / "broken.json", lanpaste::storage::as_buffer("{nope"))));
    ASSERT_TRUE(is_ok(lanpaste::storage::write_file(ctx_.repo / "meta" / "notes.txt", lanpaste::storage::as_buffer("x"))));

    std::vector<PasteMeta> out;
    ASSERT_TRUE(is_ok(lanpaste::index::read_recent(ctx_, 10, std::nullopt, &out)));
    EXPECT_EQ(out.size(), 1u);
}

TEST_F(ReaderTest, CorruptRecordIsInternalOnDirectRead) {
    const PasteDraft d = add(1000, "a");
    ASSERT_TRUE(is_ok(lanpaste::storage::write_file(d.meta_path, lanpaste::storage::as_buffer("{nope"))));

    PasteMeta m;
    EXPECT_EQ(lanpaste::index::read_meta(ctx_, d.id, &m).code, StatusCode::Internal);
}

TEST_F(ReaderTest, ReadPasteReturnsBytesAndGuardsPath) {
    const PasteDraft d = add(1000, "raw bytes\n");

    PasteMeta m;
    ASSERT_TRUE(is_ok(lanpaste::index::read_meta(ctx_, d.id, &m)));
    std::string bytes;
    ASSERT_TRUE(is_ok(lanpaste::index::read_paste(ctx_.repo, m, &bytes)));
    EXPECT_EQ(bytes, "raw bytes\n");

    m.path = "pastes/../../etc/passwd";
    EXPECT_EQ(lanpaste::index::read_paste(ctx_.repo, m, &bytes).code, StatusCode::Invalid);
    m.path = "README.md";
    EXPECT_EQ(lanpaste::index::read_paste(ctx_.repo, m, &bytes).code, StatusCode::Invalid);
}
