#include "lanpaste/storage/naming.hpp"

#include <cctype>

namespace lanpaste::storage {
    namespace {
        [[nodiscard]] bool is_slug_char(char c) noexcept {
            if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')) {
                return true;
            }
            return c == '.' || c == '_' || c == '-';
        }

        [[nodiscard]] bool is_space(char c) noexcept {
            return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
        }

        [[nodiscard]] std::string_view trim(std::string_view s) noexcept {
            while (!s.empty() && is_space(s.front())) {
                s.remove_prefix(1);
            }
            while (!s.empty() && is_space(s.back())) {
                s.remove_suffix(1);
            }
            return s;
        }

        [[nodiscard]] std::string lower(std::string_view s) {
            std::string out(s);
            for (char& c : out) {
                c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            }
            return out;
        }
    } // namespace

    lanpaste::core::Status sanitize_name(std::string_view name, std::string* out) noexcept {
        if (out == nullptr) {
            return lanpaste::core::make_status(lanpaste::core::StatusDomain::Storage, lanpaste::core::StatusCode::Invalid);
        }
        if (name.find('/') != std::string_view::npos || name.find('\\') != std::string_view::npos ||
            name.find("..") != std::string_view::npos) {
            return lanpaste::core::make_status(lanpaste::core::StatusDomain::Storage, lanpaste::core::StatusCode::Invalid);
        }
        if (!name.empty() && name.front() == '.') {
            return lanpaste::core::make_status(lanpaste::core::StatusDomain::Storage, lanpaste::core::StatusCode::Invalid);
        }

        const std::string_view trimmed = trim(name);
        std::string slug;
        slug.reserve(trimmed.size());
        for (char c : trimmed) {
            const char mapped = is_slug_char(c) ? c : '-';
            // collapse runs of '-' as they are produced
            if (mapped == '-' && !slug.empty() && slug.back() == '-') {
                continue;
            }
            slug.push_back(mapped);
        }

        size_t begin = 0;
        while (begin < slug.size() && slug[begin] == '-') {
            ++begin;
        }
        size_t end = slug.size();
        while (end > begin && slug[end - 1] == '-') {
            --end;
        }
        slug = slug.substr(begin, end - begin);

        if (slug.empty()) {
            slug = kDefaultSlug;
        }
        if (slug.size() > kMaxSlugLen) {
            slug.resize(kMaxSlugLen);
        }
        *out = std::move(slug);
        return lanpaste::core::ok_status();
    }

    const char* choose_extension(std::optional<std::string_view> name,
        std::optional<std::string_view> content_type) noexcept {
        if (content_type.has_value() && lower(*content_type).find("text/markdown") != std::string::npos) {
            return "md";
        }
        if (name.has_value()) {
            const std::string n = lower(*name);
            if (n.size() >= 3 && n.compare(n.size() - 3, 3, ".md") == 0) {
                return "md";
            }
        }
        return "txt";
    }

    std::string paste_rel_path(std::string_view date_path, std::string_view id, std::string_view slug, std::string_view ext) {
        std::string out = "pastes/";
        out += date_path;
        out += '/';
        out += id;
        out += "__";
        out += slug;
        out += '.';
        out += ext;
        return out;
    }

    std::string meta_rel_path(std::string_view id) {
        std::string out = "meta/";
        out += id;
        out += ".json";
        return out;
    }

} // namespace lanpaste::storage
