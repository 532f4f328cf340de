#include <array>
#include <cstddef>
#include <string>

#include <gtest/gtest.h>

#include "lanpaste/storage/hashing.hpp"

static void expect_hash_eq(const lanpaste::core::Hash256& got, const std::array<unsigned char, 32>& exp) {
    for (size_t i = 0; i < 32; ++i) {
        EXPECT_EQ(got.b[i], static_cast<lanpaste::core::u8>(exp[i])) << "byte " << i;
    }
}

static std::string fingerprint(const lanpaste::storage::FingerprintFields& f) {
    std::string out;
    EXPECT_EQ(lanpaste::storage::request_fingerprint(f, &out).code, lanpaste::core::StatusCode::Ok);
    return out;
}

TEST(StorageHashing, EmptyVector) {
    lanpaste::core::Hash256 out{};
    const lanpaste::core::Status s = lanpaste::storage::hash_compute({nullptr, 0}, &out);
    EXPECT_EQ(s.code, lanpaste::core::StatusCode::Ok);

    // BLAKE3("") 32-byte output
    const std::array<unsigned char, 32> expected = {
        0xaf, 0x13, 0x49, 0xb9, 0xf5, 0xf9, 0xa1, 0xa6,
        0xa0, 0x40, 0x4d, 0xea, 0x36, 0xdc, 0xc9, 0x49,
        0x9b, 0xcb, 0x25, 0xc9, 0xad, 0xc1, 0x12, 0xb7,
        0xcc, 0x9a, 0x93, 0xca, 0xe4, 0x1f, 0x32, 0x62,
    };

    expect_hash_eq(out, expected);
    EXPECT_EQ(lanpaste::storage::hash_hex(out), "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262");
}

TEST(StorageHashing, InvalidWhenOutNull) {
    const lanpaste::core::Status s = lanpaste::storage::hash_compute({nullptr, 0}, nullptr);
    EXPECT_EQ(s.domain, lanpaste::core::StatusDomain::Storage);
    EXPECT_EQ(s.code, lanpaste::core::StatusCode::Invalid);
}

TEST(StorageHashing, InvalidWhenDataNullButLenNonZero) {
    lanpaste::core::Hash256 out{};
    const lanpaste::core::Status s = lanpaste::storage::hash_compute({nullptr, 1}, &out);
    EXPECT_EQ(s.domain, lanpaste::core::StatusDomain::Storage);
    EXPECT_EQ(s.code, lanpaste::core::StatusCode::Invalid);
}

TEST(StorageHashing, Sha256KnownVectors) {
    std::string hex;
    ASSERT_EQ(lanpaste::storage::sha256_hex(lanpaste::storage::as_buffer(""), &hex).code, lanpaste::core::StatusCode::Ok);
    EXPECT_EQ(hex, "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");

    ASSERT_EQ(lanpaste::storage::sha256_hex(lanpaste::storage::as_buffer("abc"), &hex).code, lanpaste::core::StatusCode::Ok);
    EXPECT_EQ(hex, "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(StorageHashing, FingerprintIsStableHex) {
    lanpaste::storage::FingerprintFields f;
    f.name = "notes.md";
    f.tag = "ops";
    f.content_type = "text/markdown";
    f.content_sha256 = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";

    const std::string a = fingerprint(f);
    const std::string b = fingerprint(f);
    EXPECT_EQ(a, b);
    EXPECT_EQ(a.size(), 64u);
    EXPECT_EQ(a.find_first_not_of("0123456789abcdef"), std::string::npos);
}

TEST(StorageHashing, FingerprintSeparatesFields) {
    lanpaste::storage::FingerprintFields base;
    base.name = "ab";
    base.tag = "c";
    base.content_sha256 = "00";

    lanpaste::storage::FingerprintFields shifted = base;
    shifted.name = "a";
    shifted.tag = "bc";
    EXPECT_NE(fingerprint(base), fingerprint(shifted));

    lanpaste::storage::FingerprintFields other_content = base;
    other_content.content_sha256 = "01";
    EXPECT_NE(fingerprint(base), fingerprint(other_content));
}

TEST(StorageHashing, FingerprintAbsentDiffersFromEmpty) {
    lanpaste::storage::FingerprintFields absent;
    absent.content_sha256 = "00";

    lanpaste::storage::FingerprintFields empty = absent;
    empty.tag = "";
    EXPECT_NE(fingerprint(absent), fingerprint(empty));
}
