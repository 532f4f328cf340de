#include <filesystem>
#include <string>

#include <gtest/gtest.h>

#include "lanpaste/ledger/idempotency.hpp"
#include "lanpaste/storage/files.hpp"
#include "test_support.hpp"

using namespace lanpaste::core;
using lanpaste::test_support::TempDir;

static IdempotencyRecord sample_record(const char* fingerprint) {
    IdempotencyRecord r;
    r.request_fingerprint = fingerprint;
    r.response.id = "01ARZ3NDEKTSV4RRFFQ69G5FAV";
    r.response.path = "pastes/2025/01/31/01ARZ3NDEKTSV4RRFFQ69G5FAV__paste.txt";
    r.response.commit = "abcdef012345";
    r.response.raw_url = "/api/v1/p/01ARZ3NDEKTSV4RRFFQ69G5FAV/raw";
    r.response.view_url = "/p/01ARZ3NDEKTSV4RRFFQ69G5FAV";
    r.response.meta_url = "/api/v1/p/01ARZ3NDEKTSV4RRFFQ69G5FAV";
    return r;
}

TEST(LedgerIdempotency, MissingKeyIsNotFound) {
    TempDir tmp;
    IdempotencyRecord r;
    bool found = true;
    ASSERT_TRUE(is_ok(lanpaste::ledger::idempotency_read(tmp.path() / "idem", "k1", &r, &found)));
    EXPECT_FALSE(found);
}

TEST(LedgerIdempotency, WriteThenRead) {
    TempDir tmp;
    const auto dir = tmp.path() / "idem";
    ASSERT_TRUE(is_ok(lanpaste::ledger::idempotency_write(dir, "k1", sample_record("fp-1"))));

    IdempotencyRecord r;
    bool found = false;
    ASSERT_TRUE(is_ok(lanpaste::ledger::idempotency_read(dir, "k1", &r, &found)));
    ASSERT_TRUE(found);
    EXPECT_EQ(r.request_fingerprint, "fp-1");
    EXPECT_EQ(r.response.commit, "abcdef012345");
    EXPECT_EQ(r.response.meta_url, "/api/v1/p/01ARZ3NDEKTSV4RRFFQ69G5FAV");
}

TEST(LedgerIdempotency, RecordsAreWriteOnce) {
    TempDir tmp;
    const auto dir = tmp.path() / "idem";
    ASSERT_TRUE(is_ok(lanpaste::ledger::idempotency_write(dir, "k1", sample_record("fp-1"))));

    const Status s = lanpaste::ledger::idempotency_write(dir, "k1", sample_record("fp-2"));
    EXPECT_EQ(s.code, StatusCode::Conflict);
    EXPECT_EQ(s.aux, kConflictIdempotencyMismatch);

    IdempotencyRecord r;
    bool found = false;
    ASSERT_TRUE(is_ok(lanpaste::ledger::idempotency_read(dir, "k1", &r, &found)));
    EXPECT_EQ(r.request_fingerprint, "fp-1");
}

TEST(LedgerIdempotency, KeysNeverReachTheFilesystem) {
    TempDir tmp;
    const auto dir = tmp.path() / "idem";
    const auto path = lanpaste::ledger::idempotency_record_path(dir, "../../etc/passwd");
    EXPECT_EQ(path.parent_path(), dir);
    EXPECT_EQ(path.filename().string().size(), 64u + 5u);

    EXPECT_NE(lanpaste::ledger::idempotency_record_path(dir, "a"), lanpaste::ledger::idempotency_record_path(dir, "b"));
}

TEST(LedgerIdempotency, CorruptRecordIsInternal) {
    TempDir tmp;
    const auto dir = tmp.path() / "idem";
    ASSERT_TRUE(is_ok(lanpaste::storage::create_dirs(dir)));
    ASSERT_TRUE(is_ok(lanpaste::storage::write_file(lanpaste::ledger::idempotency_record_path(dir, "k1"),
        lanpaste::storage::as_buffer("{broken"))));

    IdempotencyRecord r;
    bool found = false;
    EXPECT_EQ(lanpaste::ledger::idempotency_read(dir, "k1", &r, &found).code, StatusCode::Internal);
}
