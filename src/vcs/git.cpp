#include "lanpaste/vcs/git.hpp"

#include <array>
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include "lanpaste/core/log.hpp"
#include "lanpaste/storage/files.hpp"

extern char** environ;

namespace lanpaste::vcs {
    using lanpaste::core::is_ok;
    using lanpaste::core::make_status;
    using lanpaste::core::ok_status;
    using lanpaste::core::Status;
    using lanpaste::core::StatusCode;
    using lanpaste::core::StatusDomain;
    using lanpaste::core::u32;

    namespace {
        constexpr const char* kReadme = "# LAN Paste\n\nGit-backed LAN paste store.\n";

        constexpr std::array<const char*, 15> kIgnoreLines = {{
            "# runtime / scratch",
            "../run/",
            "../tmp/",
            "# common temp/intermediate",
            "*.tmp",
            "*.swp",
            "*.bak",
            "*.part",
            "*.lock",
            "*.log",
            "# OS/editor noise",
            ".DS_Store",
            "Thumbs.db",
            ".idea/",
            ".vscode/",
        }};

        [[nodiscard]] bool is_space(char c) noexcept {
            return c == ' ' || c == '\t' || c == '\n' || c == '\r';
        }

        void trim_in_place(std::string* s) {
            size_t end = s->size();
            while (end > 0 && is_space((*s)[end - 1])) {
                --end;
            }
            size_t begin = 0;
            while (begin < end && is_space((*s)[begin])) {
                ++begin;
            }
            *s = s->substr(begin, end - begin);
        }

        [[nodiscard]] bool starts_with(const char* entry, const char* prefix) noexcept {
            return std::strncmp(entry, prefix, std::strlen(prefix)) == 0;
        }

        // Environment for the child: the parent's, minus any inherited git
        // identity, plus ours.
        std::vector<std::string> child_env(const GitContext& ctx) {
            std::vector<std::string> env;
            for (char** e = environ; e != nullptr && *e != nullptr; ++e) {
                if (starts_with(*e, "GIT_AUTHOR_") || starts_with(*e, "GIT_COMMITTER_")) {
                    continue;
                }
                env.emplace_back(*e);
            }
            env.push_back("GIT_AUTHOR_NAME=" + ctx.author_name);
            env.push_back("GIT_AUTHOR_EMAIL=" + ctx.author_email);
            env.push_back("GIT_COMMITTER_NAME=" + ctx.author_name);
            env.push_back("GIT_COMMITTER_EMAIL=" + ctx.author_email);
            return env;
        }

        void close_fd(int* fd) noexcept {
            if (*fd >= 0) {
                ::close(*fd);
                *fd = -1;
            }
        }

        void close_pipe(int p[2]) noexcept {
            close_fd(&p[0]);
            close_fd(&p[1]);
        }

        // Drains both pipes until EOF on each.
        bool drain(int out_fd, int err_fd, std::string* out, std::string* err) {
            std::array<struct pollfd, 2> fds{};
            fds[0] = {out_fd, POLLIN, 0};
            fds[1] = {err_fd, POLLIN, 0};
            std::string* sinks[2] = {out, err};
            int open_count = 2;
            char buf[4096];

            while (open_count > 0) {
                const int rc = ::poll(fds.data(), fds.size(), -1);
                if (rc < 0) {
                    if (errno == EINTR) continue;
                    return false;
                }
                for (size_t i = 0; i < fds.size(); ++i) {
                    if (fds[i].fd < 0 || fds[i].revents == 0) {
                        continue;
                    }
                    const ssize_t n = ::read(fds[i].fd, buf, sizeof(buf));
                    if (n > 0) {
                        sinks[i]->append(buf, static_cast<size_t>(n));
                        continue;
                    }
                    if (n < 0 && errno == EINTR) {
                        continue;
                    }
                    fds[i].fd = -1;
                    --open_count;
                }
            }
            return true;
        }

        Status run_checked(const GitContext& ctx, std::vector<std::string> args, GitOutput* out) noexcept {
            const Status s = git_run(ctx, args, out);
            if (!is_ok(s)) {
                LANPASTE_LOG_DEBUG("git command failed", {
                    lanpaste::core::str_field("arg0", args.empty() ? "" : args.front()),
                    lanpaste::core::status_field(s),
                    lanpaste::core::str_field("stderr", out->err),
                });
            }
            return s;
        }
    } // namespace

    Status git_run(const GitContext& ctx, const std::vector<std::string>& args, GitOutput* out) noexcept {
        if (out == nullptr || ctx.git_bin.empty()) {
            return make_status(StatusDomain::Vcs, StatusCode::Invalid);
        }
        out->out.clear();
        out->err.clear();
        out->exit_code = -1;

        // Everything the child needs is prepared before fork.
        std::vector<std::string> env = child_env(ctx);
        std::vector<char*> envp;
        envp.reserve(env.size() + 1);
        for (auto& e : env) {
            envp.push_back(e.data());
        }
        envp.push_back(nullptr);

        std::string bin = ctx.git_bin;
        std::vector<std::string> argv_store;
        argv_store.reserve(args.size() + 1);
        argv_store.push_back(bin);
        argv_store.insert(argv_store.end(), args.begin(), args.end());
        std::vector<char*> argv;
        argv.reserve(argv_store.size() + 1);
        for (auto& a : argv_store) {
            argv.push_back(a.data());
        }
        argv.push_back(nullptr);

        const std::string cwd = ctx.repo.string();

        // The daemon blocks SIGINT/SIGTERM for its sigwait thread; children start unmasked.
        sigset_t child_mask;
        sigemptyset(&child_mask);

        int out_pipe[2] = {-1, -1};
        int err_pipe[2] = {-1, -1};
        int exec_pipe[2] = {-1, -1};
        if (::pipe2(out_pipe, O_CLOEXEC) != 0 || ::pipe2(err_pipe, O_CLOEXEC) != 0 || ::pipe2(exec_pipe, O_CLOEXEC) != 0) {
            const int err = errno;
            close_pipe(out_pipe);
            close_pipe(err_pipe);
            close_pipe(exec_pipe);
            return make_status(StatusDomain::Vcs, StatusCode::Internal, static_cast<u32>(err));
        }

        const pid_t pid = ::fork();
        if (pid < 0) {
            const int err = errno;
            close_pipe(out_pipe);
            close_pipe(err_pipe);
            close_pipe(exec_pipe);
            return make_status(StatusDomain::Vcs, StatusCode::Internal, static_cast<u32>(err));
        }

        if (pid == 0) {
            int child_errno = 0;
            (void)::sigprocmask(SIG_SETMASK, &child_mask, nullptr);
            const int devnull = ::open("/dev/null", O_RDONLY);
            if (devnull >= 0) {
                (void)::dup2(devnull, STDIN_FILENO);
                ::close(devnull);
            }
            if (::dup2(out_pipe[1], STDOUT_FILENO) < 0 || ::dup2(err_pipe[1], STDERR_FILENO) < 0) {
                child_errno = errno;
            } else if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
                child_errno = errno;
            } else {
                ::execvpe(argv[0], argv.data(), envp.data());
                child_errno = errno;
            }
            (void)!::write(exec_pipe[1], &child_errno, sizeof(child_errno));
            _exit(127);
        }

        close_fd(&out_pipe[1]);
        close_fd(&err_pipe[1]);
        close_fd(&exec_pipe[1]);

        const bool drained = drain(out_pipe[0], err_pipe[0], &out->out, &out->err);
        close_fd(&out_pipe[0]);
        close_fd(&err_pipe[0]);

        int child_errno = 0;
        ssize_t n = 0;
        do {
            n = ::read(exec_pipe[0], &child_errno, sizeof(child_errno));
        } while (n < 0 && errno == EINTR);
        close_fd(&exec_pipe[0]);

        int wstatus = 0;
        pid_t waited = 0;
        do {
            waited = ::waitpid(pid, &wstatus, 0);
        } while (waited < 0 && errno == EINTR);

        if (n == static_cast<ssize_t>(sizeof(child_errno))) {
            return make_status(StatusDomain::Vcs, StatusCode::Internal, static_cast<u32>(child_errno));
        }
        if (waited < 0 || !drained) {
            return make_status(StatusDomain::Vcs, StatusCode::Internal);
        }

        trim_in_place(&out->out);
        if (WIFEXITED(wstatus)) {
            out->exit_code = WEXITSTATUS(wstatus);
        } else {
            out->exit_code = -1;
        }
        if (out->exit_code != 0) {
            return make_status(StatusDomain::Vcs, StatusCode::Internal, static_cast<u32>(out->exit_code));
        }
        return ok_status();
    }

    Status git_check_installed(const GitContext& ctx) noexcept {
        GitContext probe = ctx;
        probe.repo.clear();
        GitOutput out;
        const Status s = git_run(probe, {"--version"}, &out);
        if (!is_ok(s)) {
            return make_status(StatusDomain::Vcs, StatusCode::Unavailable, s.aux);
        }
        return ok_status();
    }

    bool git_is_repository(const GitContext& ctx) noexcept {
        GitOutput out;
        const Status s = git_run(ctx, {"rev-parse", "--is-inside-work-tree"}, &out);
        return is_ok(s) && out.out == "true";
    }

    Status git_commit(const GitContext& ctx,
        const std::vector<std::string>& paths,
        std::string_view subject,
        std::string* commit_id,
        GitOutput* detail) noexcept {
        if (commit_id == nullptr || detail == nullptr || paths.empty()) {
            return make_status(StatusDomain::Vcs, StatusCode::Invalid);
        }

        std::vector<std::string> add_args{"add", "--"};
        add_args.insert(add_args.end(), paths.begin(), paths.end());
        Status s = run_checked(ctx, std::move(add_args), detail);
        if (!is_ok(s)) {
            return s;
        }

        s = run_checked(ctx, {"commit", "-m", std::string(subject)}, detail);
        if (!is_ok(s)) {
            return s;
        }

        s = run_checked(ctx, {"rev-parse", "--short=12", "HEAD"}, detail);
        if (!is_ok(s)) {
            return s;
        }
        *commit_id = detail->out;
        return ok_status();
    }

    Status git_push(const GitContext& ctx, std::string_view remote, GitOutput* detail) noexcept {
        if (detail == nullptr || remote.empty()) {
            return make_status(StatusDomain::Vcs, StatusCode::Invalid);
        }
        return run_checked(ctx, {"push", std::string(remote), "HEAD"}, detail);
    }

    Status git_log_commit_for(const GitContext& ctx, std::string_view path, std::string* commit_id) noexcept {
        if (commit_id == nullptr) {
            return make_status(StatusDomain::Vcs, StatusCode::Invalid);
        }
        GitOutput out;
        const Status s = run_checked(ctx, {"log", "-n", "1", "--format=%H", "--", std::string(path)}, &out);
        if (!is_ok(s)) {
            return s;
        }
        *commit_id = out.out.substr(0, 12);
        return ok_status();
    }

    Status git_bootstrap_repo(const GitContext& ctx) noexcept {
        namespace st = lanpaste::storage;

        Status s = st::create_dirs(ctx.repo);
        if (!is_ok(s)) {
            return s;
        }

        GitOutput out;
        if (!git_is_repository(ctx)) {
            s = run_checked(ctx, {"init"}, &out);
            if (!is_ok(s)) {
                return s;
            }
            LANPASTE_LOG_INFO("initialized git repository", {lanpaste::core::str_field("repo", ctx.repo.string())});
        }

        s = st::create_dirs(ctx.repo / "pastes");
        if (!is_ok(s)) {
            return s;
        }
        s = st::create_dirs(ctx.repo / "meta");
        if (!is_ok(s)) {
            return s;
        }

        const std::filesystem::path readme = ctx.repo / "README.md";
        std::error_code ec;
        if (!std::filesystem::exists(readme, ec)) {
            s = st::write_file(readme, st::as_buffer(kReadme));
            if (!is_ok(s)) {
                return s;
            }
        }

        const std::filesystem::path gitignore = ctx.repo / ".gitignore";
        std::string content;
        s = st::read_file(gitignore, &content);
        if (!is_ok(s) && s.code != StatusCode::NotFound) {
            return s;
        }
        for (const char* line : kIgnoreLines) {
            if (content.find(line) == std::string::npos) {
                if (!content.empty() && content.back() != '\n') {
                    content += '\n';
                }
                content += line;
                content += '\n';
            }
        }
        s = st::write_file(gitignore, st::as_buffer(content));
        if (!is_ok(s)) {
            return s;
        }

        if (!is_ok(git_run(ctx, {"rev-parse", "--verify", "HEAD"}, &out))) {
            s = run_checked(ctx, {"add", "README.md", ".gitignore", "pastes", "meta"}, &out);
            if (!is_ok(s)) {
                return s;
            }
            s = run_checked(ctx, {"commit", "-m", "init lanpaste repository"}, &out);
            if (!is_ok(s)) {
                return s;
            }
            LANPASTE_LOG_INFO("created initial commit", {lanpaste::core::str_field("repo", ctx.repo.string())});
        }
        return ok_status();
    }

} // namespace lanpaste::vcs
