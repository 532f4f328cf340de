#include "lanpaste/storage/hashing.hpp"

#include <cstddef>

#include <blake3.h>
#include <openssl/evp.h>

namespace lanpaste::storage {
    namespace {
        constexpr char kHex[] = "0123456789abcdef";

        void to_hex(const u8* data, size_t len, std::string* out) {
            out->resize(len * 2);
            for (size_t i = 0; i < len; ++i) {
                (*out)[i * 2] = kHex[(data[i] >> 4) & 0xf];
                (*out)[i * 2 + 1] = kHex[data[i] & 0xf];
            }
        }

        void put_u64_be(u8 out[8], u64 v) noexcept {
            for (int i = 0; i < 8; ++i) {
                out[i] = static_cast<u8>((v >> (56 - 8 * i)) & 0xffu);
            }
        }

        void update_field(blake3_hasher* h, const std::optional<std::string_view>& field) noexcept {
            const u8 present = field.has_value() ? 1 : 0;
            blake3_hasher_update(h, &present, 1);
            if (!field.has_value()) {
                return;
            }
            u8 len[8];
            put_u64_be(len, static_cast<u64>(field->size()));
            blake3_hasher_update(h, len, sizeof(len));
            blake3_hasher_update(h, field->data(), field->size());
        }
    } // namespace

    lanpaste::core::Status hash_compute(BufferView data, lanpaste::core::Hash256* out) noexcept {
        if (out == nullptr){
            return lanpaste::core::make_status(lanpaste::core::StatusDomain::Storage, lanpaste::core::StatusCode::Invalid);
        }
        if (data.len > 0 && data.data == nullptr){
            return lanpaste::core::make_status(lanpaste::core::StatusDomain::Storage, lanpaste::core::StatusCode::Invalid);
        }

        blake3_hasher hasher;
        blake3_hasher_init(&hasher);

        if (data.len > 0){
            blake3_hasher_update(&hasher, data.data, static_cast<size_t>(data.len));
        }

        blake3_hasher_finalize(&hasher, out->b.data(), out->b.size());
        return lanpaste::core::ok_status();
    }

    std::string hash_hex(const lanpaste::core::Hash256& h) {
        std::string out;
        to_hex(h.b.data(), h.b.size(), &out);
        return out;
    }

    lanpaste::core::Status sha256_hex(BufferView data, std::string* out) noexcept {
        if (out == nullptr) {
            return lanpaste::core::make_status(lanpaste::core::StatusDomain::Storage, lanpaste::core::StatusCode::Invalid);
        }
        if (data.len > 0 && data.data == nullptr) {
            return lanpaste::core::make_status(lanpaste::core::StatusDomain::Storage, lanpaste::core::StatusCode::Invalid);
        }

        EVP_MD_CTX* ctx = EVP_MD_CTX_new();
        if (ctx == nullptr) {
            return lanpaste::core::make_status(lanpaste::core::StatusDomain::External, lanpaste::core::StatusCode::Internal);
        }

        unsigned char digest[EVP_MAX_MD_SIZE];
        unsigned int digest_len = 0;
        bool ok = EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) == 1;
        if (ok && data.len > 0) {
            ok = EVP_DigestUpdate(ctx, data.data, static_cast<size_t>(data.len)) == 1;
        }
        if (ok) {
            ok = EVP_DigestFinal_ex(ctx, digest, &digest_len) == 1;
        }
        EVP_MD_CTX_free(ctx);

        if (!ok || digest_len != 32) {
            return lanpaste::core::make_status(lanpaste::core::StatusDomain::External, lanpaste::core::StatusCode::Internal);
        }
        to_hex(digest, digest_len, out);
        return lanpaste::core::ok_status();
    }

    lanpaste::core::Status request_fingerprint(const FingerprintFields& f, std::string* out) noexcept {
        if (out == nullptr) {
            return lanpaste::core::make_status(lanpaste::core::StatusDomain::Storage, lanpaste::core::StatusCode::Invalid);
        }

        blake3_hasher h;
        blake3_hasher_init(&h);

        static constexpr char kLabel[] = "lanpaste.request.fingerprint.v1";
        blake3_hasher_update(&h, kLabel, sizeof(kLabel) - 1);

        update_field(&h, f.name);
        update_field(&h, f.tag);
        update_field(&h, f.content_type);
        update_field(&h, f.content_sha256);

        lanpaste::core::Hash256 digest{};
        blake3_hasher_finalize(&h, digest.b.data(), digest.b.size());
        *out = hash_hex(digest);
        return lanpaste::core::ok_status();
    }
} // namespace lanpaste::storage
