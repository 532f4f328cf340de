#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include <httplib.h>
#include <pthread.h>
#include <unistd.h>

#include "lanpaste/bindings/http.hpp"
#include "lanpaste/cli/commands.hpp"
#include "lanpaste/cli/serve.hpp"
#include "lanpaste/core/errors.hpp"
#include "lanpaste/core/log.hpp"
#include "lanpaste/service/app.hpp"

// ========================================================================
// Output
// ========================================================================

static void print_status_error(const char* context, lanpaste::core::Status s) {
    fprintf(stderr, "error: %s failed: %s (code=%s, domain=%s, aux=%u)\n",
        context,
        lanpaste::core::status_message(s),
        lanpaste::core::status_code_name(s.code),
        lanpaste::core::status_domain_name(s.domain),
        s.aux);
}

static void handle_help() {
    printf("Usage: lanpaste <command> [options]\n");
    printf("\n");
    printf("Commands:\n");
    printf("  serve             Run the paste server\n");
    printf("  help              Show this help\n");
    printf("\n");
    printf("serve options:\n");
    printf("  -d, --dir <path>              Data directory (required)\n");
    printf("  -b, --bind <host:port>        Listen address (default 0.0.0.0:8090)\n");
    printf("  --token <secret>              Shared write token (X-Paste-Token)\n");
    printf("  --api-keys-file <path>        JSON API keys file (X-API-Key)\n");
    printf("  --max-bytes <n>               Largest accepted paste (default 1048576)\n");
    printf("  --push off|best_effort|strict Push policy after each commit (default off)\n");
    printf("  --remote <name>               Push remote (default origin)\n");
    printf("  --allow-cidr <cidr>           Allowed writer network, repeatable\n");
    printf("  --git-author-name <name>      Commit author (default \"LAN Paste\")\n");
    printf("  --git-author-email <email>    Commit email (default paste@lan)\n");
    printf("  --trust-forwarded-for         Take the client IP from X-Forwarded-For\n");
    printf("  --log-level <level>           trace|debug|info|warn|error (default info)\n");
    printf("\n");
    printf("--token and --api-keys-file are mutually exclusive.\n");
}

// ========================================================================
// HTTP transport
// ========================================================================

static std::optional<std::string> client_ip_of(const httplib::Request& req, bool trust_forwarded_for) {
    if (trust_forwarded_for && req.has_header("X-Forwarded-For")) {
        std::string first = req.get_header_value("X-Forwarded-For");
        const size_t comma = first.find(',');
        if (comma != std::string::npos) {
            first.resize(comma);
        }
        const size_t b = first.find_first_not_of(" \t");
        const size_t e = first.find_last_not_of(" \t");
        if (b != std::string::npos) {
            return first.substr(b, e - b + 1);
        }
    }
    if (req.remote_addr.empty()) {
        return std::nullopt;
    }
    return req.remote_addr;
}

static void forward(lanpaste::service::AppState& state, const httplib::Request& req, httplib::Response& res) {
    lanpaste::bindings::http::HttpRequest in;
    in.method = req.method;
    in.path = req.path;
    for (const auto& [key, value] : req.params) {
        in.query.emplace(key, value);  // first occurrence wins
    }
    for (const auto& [key, value] : req.headers) {
        in.headers.emplace_back(key, value);
    }
    in.body = req.body;
    in.client_ip = client_ip_of(req, state.cfg.trust_forwarded_for);

    lanpaste::bindings::http::HttpResponse out;
    (void)lanpaste::bindings::http::handle_http_request(state, in, &out);

    res.status = out.status;
    for (const auto& [key, value] : out.headers) {
        res.set_header(key, value);
    }
    res.set_content(std::move(out.body), out.content_type);
}

// SIGINT/SIGTERM are blocked in every thread and collected here.
static void wait_for_shutdown(sigset_t signals, httplib::Server* server) {
    int sig = 0;
    if (sigwait(&signals, &sig) == 0) {
        LANPASTE_LOG_INFO("shutting down", {lanpaste::core::int_field("signal", sig)});
    }
    server->stop();
}

// ========================================================================
// Commands
// ========================================================================

static int handle_serve(const lanpaste::cli::CliArgs& args) {
    lanpaste::service::ServeConfig cfg;
    bool help = false;
    lanpaste::core::Status s = lanpaste::cli::parse_serve_args(args, &cfg, &help);
    if (!lanpaste::core::is_ok(s)) {
        print_status_error("argument parsing", s);
        fprintf(stderr, "run 'lanpaste help' for usage\n");
        return 2;
    }
    if (help) {
        handle_help();
        return EXIT_SUCCESS;
    }
    if (cfg.dir.empty()) {
        fprintf(stderr, "error: --dir is required\n");
        return 2;
    }

    lanpaste::core::init_logging(cfg.log_level);

    s = lanpaste::service::run_preflight(cfg);
    if (!lanpaste::core::is_ok(s)) {
        print_status_error("preflight", s);
        return EXIT_FAILURE;
    }

    std::unique_ptr<lanpaste::service::AppState> state;
    s = lanpaste::service::build_state(cfg, &state);
    if (!lanpaste::core::is_ok(s)) {
        print_status_error("startup", s);
        return EXIT_FAILURE;
    }

    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    httplib::Server server;
    server.new_task_queue = [] { return new httplib::ThreadPool(8); };
    server.set_payload_max_length(static_cast<size_t>(cfg.max_bytes) + 1);

    lanpaste::service::AppState& st = *state;
    const auto handler = [&st](const httplib::Request& req, httplib::Response& res) { forward(st, req, res); };
    server.Get(".*", handler);
    server.Post(".*", handler);
    server.Put(".*", handler);
    server.Delete(".*", handler);
    server.Patch(".*", handler);

    if (!server.bind_to_port(cfg.bind_host, cfg.bind_port)) {
        LANPASTE_LOG_ERROR("cannot bind", {
            lanpaste::core::str_field("host", cfg.bind_host),
            lanpaste::core::int_field("port", cfg.bind_port),
        });
        return EXIT_FAILURE;
    }

    std::thread stopper(wait_for_shutdown, signals, &server);
    LANPASTE_LOG_INFO("listening", {
        lanpaste::core::str_field("host", cfg.bind_host),
        lanpaste::core::int_field("port", cfg.bind_port),
        lanpaste::core::str_field("repo", state->paths.repo.string()),
    });
    const bool clean = server.listen_after_bind();
    if (!clean) {
        LANPASTE_LOG_ERROR("server stopped unexpectedly");
        // wake the stopper so it can be joined
        kill(getpid(), SIGTERM);
    }
    stopper.join();
    lanpaste::core::shutdown_logging();
    return clean ? EXIT_SUCCESS : EXIT_FAILURE;
}

int main(int argc, char** argv) {
    const lanpaste::cli::CliArgs args{
        const_cast<const char* const*>(argv + 1),
        argc > 0 ? static_cast<lanpaste::core::u32>(argc - 1) : 0,
    };

    lanpaste::cli::CommandInvocation inv{};
    lanpaste::core::u32 consumed = 0;
    const lanpaste::core::Status s =
        lanpaste::cli::parse_command(args, lanpaste::cli::kCommands, lanpaste::cli::kCommandCount, &inv, &consumed);
    if (!lanpaste::core::is_ok(s)) {
        if (args.argc > 0) {
            fprintf(stderr, "error: unknown command '%s'\n", args.argv[0]);
        }
        handle_help();
        return 2;
    }

    switch (inv.id) {
        case lanpaste::cli::CommandId::Serve:
            return handle_serve(inv.args);
        case lanpaste::cli::CommandId::Help:
        case lanpaste::cli::CommandId::None:
            break;
    }
    handle_help();
    return EXIT_SUCCESS;
}
