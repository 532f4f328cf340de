#pragma once

#include <cstdlib>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

#include "lanpaste/vcs/git.hpp"

namespace lanpaste::test_support {

    // mkdtemp-backed scratch directory, removed recursively on destruction.
    class TempDir {
    public:
        TempDir() {
            std::string tmpl = (std::filesystem::temp_directory_path() / "lanpaste-test-XXXXXX").string();
            if (::mkdtemp(tmpl.data()) != nullptr) {
                path_ = tmpl;
            }
        }
        ~TempDir() {
            std::error_code ec;
            if (!path_.empty()) {
                std::filesystem::remove_all(path_, ec);
            }
        }
        TempDir(const TempDir&) = delete;
        TempDir& operator=(const TempDir&) = delete;

        const std::filesystem::path& path() const { return path_; }

    private:
        std::filesystem::path path_;
    };

    inline lanpaste::vcs::GitContext git_at(const std::filesystem::path& repo) {
        lanpaste::vcs::GitContext ctx;
        ctx.repo = repo;
        return ctx;
    }

    // Trimmed stdout of `git <args>` in repo, empty on failure.
    inline std::string git_out(const std::filesystem::path& repo, const std::vector<std::string>& args) {
        lanpaste::vcs::GitOutput out;
        if (!lanpaste::core::is_ok(lanpaste::vcs::git_run(git_at(repo), args, &out))) {
            return {};
        }
        return out.out;
    }

    inline int commit_count(const std::filesystem::path& repo) {
        const std::string n = git_out(repo, {"rev-list", "--count", "HEAD"});
        return n.empty() ? 0 : std::atoi(n.c_str());
    }

} // namespace lanpaste::test_support
