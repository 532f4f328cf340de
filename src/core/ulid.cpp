#include "lanpaste/core/ulid.hpp"

#include <sodium.h>

namespace lanpaste::core {
    namespace {
        constexpr char kAlphabet[] = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";
        constexpr i64 kMaxTimestamp = (i64{1} << 48) - 1;

        Status ensure_sodium() noexcept {
            if (sodium_init() < 0) {
                return make_status(StatusDomain::External, StatusCode::Unavailable);
            }
            return ok_status();
        }

        [[nodiscard]] int decode_char(char c) noexcept {
            for (int i = 0; i < 32; ++i) {
                if (kAlphabet[i] == c) {
                    return i;
                }
            }
            return -1;
        }

        // false on overflow of all 80 bits
        [[nodiscard]] bool increment(std::array<u8, 10>& r) noexcept {
            for (size_t i = r.size(); i-- > 0;) {
                if (r[i] != 0xffu) {
                    ++r[i];
                    return true;
                }
                r[i] = 0;
            }
            return false;
        }

        void encode(TimestampMs ts, const std::array<u8, 10>& rand, std::string* out) {
            std::array<u8, 16> bytes{};
            const u64 t = static_cast<u64>(ts);
            for (int i = 0; i < 6; ++i) {
                bytes[static_cast<size_t>(i)] = static_cast<u8>((t >> (40 - 8 * i)) & 0xffu);
            }
            for (size_t i = 0; i < rand.size(); ++i) {
                bytes[6 + i] = rand[i];
            }

            // 128 bits into 26 five-bit groups; the leading group holds 3 bits.
            out->assign(kUlidLength, '0');
            u32 bit = 0;
            for (u32 c = 0; c < kUlidLength; ++c) {
                const u32 width = (c == 0) ? 3u : 5u;
                u32 v = 0;
                for (u32 k = 0; k < width; ++k, ++bit) {
                    const u8 byte = bytes[bit / 8];
                    v = (v << 1) | ((byte >> (7 - (bit % 8))) & 1u);
                }
                (*out)[c] = kAlphabet[v];
            }
        }

        UlidGenerator& process_generator() noexcept {
            static UlidGenerator gen;
            return gen;
        }
    } // namespace

    Status UlidGenerator::next(TimestampMs ts, std::string* out) noexcept {
        if (out == nullptr || ts < 0 || ts > kMaxTimestamp) {
            return make_status(StatusDomain::Core, StatusCode::Invalid);
        }
        const Status init = ensure_sodium();
        if (!is_ok(init)) {
            return init;
        }

        std::lock_guard<std::mutex> lock(mu_);
        if (ts <= last_ts_) {
            if (!increment(last_rand_)) {
                if (last_ts_ >= kMaxTimestamp) {
                    return make_status(StatusDomain::Core, StatusCode::Internal);
                }
                ++last_ts_;
                randombytes_buf(last_rand_.data(), last_rand_.size());
            }
        } else {
            last_ts_ = ts;
            randombytes_buf(last_rand_.data(), last_rand_.size());
        }

        encode(last_ts_, last_rand_, out);
        return ok_status();
    }

    Status ulid_new(TimestampMs ts, std::string* out) noexcept {
        return process_generator().next(ts, out);
    }

    bool ulid_is_valid(std::string_view s) noexcept {
        if (s.size() != kUlidLength) {
            return false;
        }
        if (s[0] > '7') {
            return false;
        }
        for (char c : s) {
            if (decode_char(c) < 0) {
                return false;
            }
        }
        return true;
    }

} // namespace lanpaste::core
