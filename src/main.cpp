#include <iostream>
#include <string>
#include <vector>
#include <memory>
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <csignal>
#include <atomic>
#include <signal.h>
#include "job_service.hpp"
#include "local_ws_server.hpp"
#include "mcp_stdio_server.hpp"
#include "telemetry.hpp"
#include "tool_dispatcher.hpp"

// Global flag for signal handling
static std::atomic<bool> g_interrupted{false};

static void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_interrupted = true;
    }
}

// Installed without SA_RESTART so a blocking read on stdin returns.
static void install_signal_handlers() {
    struct sigaction sa{};
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
    std::signal(SIGPIPE, SIG_IGN);
}

// Very small CLI parser
struct Args {
    std::string ollama = "ollama";
    std::string telemetry_file;          // empty: default location
    bool telemetry = true;
    int ws_port = 0;                     // 0: listener disabled
    std::string ws_address = "127.0.0.1";
    int ws_threads = 4;
    std::string ws_cert;
    std::string ws_key;
    bool quiet = false;
};

static void print_help(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [--ollama PATH] [--telemetry-file PATH|--no-telemetry]\n"
              << "       [--ws-port N [--ws-address ADDR] [--ws-threads N] [--ws-cert FILE --ws-key FILE]] [--quiet]\n";
    std::cerr << "\nServes the ollama_list_models, ollama_run and ollama_run_many tools as\n"
              << "newline-delimited JSON-RPC on stdin/stdout. Stops on EOF, SIGINT or SIGTERM.\n";
}

static int parse_port(const char* s) {
    int p = std::atoi(s);
    if (p <= 0 || p > 65535) {
        std::cerr << "Invalid port: " << s << "\n";
        std::exit(2);
    }
    return p;
}

static Args parse_args(int argc, char** argv) {
    Args a;
    for (int i = 1; i < argc; ++i) {
        std::string s = argv[i];
        if (s == "--help" || s == "-h") { print_help(argv[0]); std::exit(0); }
        else if (s == "--ollama" && i + 1 < argc) { a.ollama = argv[++i]; }
        else if (s == "--telemetry-file" && i + 1 < argc) { a.telemetry_file = argv[++i]; }
        else if (s == "--no-telemetry") { a.telemetry = false; }
        else if (s == "--ws-port" && i + 1 < argc) { a.ws_port = parse_port(argv[++i]); }
        else if (s == "--ws-address" && i + 1 < argc) { a.ws_address = argv[++i]; }
        else if (s == "--ws-threads" && i + 1 < argc) { a.ws_threads = std::max(1, std::atoi(argv[++i])); }
        else if (s == "--ws-cert" && i + 1 < argc) { a.ws_cert = argv[++i]; }
        else if (s == "--ws-key" && i + 1 < argc) { a.ws_key = argv[++i]; }
        else if (s == "--quiet") { a.quiet = true; }
        else {
            std::cerr << "Unknown arg: " << s << "\n";
            print_help(argv[0]);
            std::exit(2);
        }
    }
    return a;
}

int main(int argc, char** argv) {
    install_signal_handlers();

    auto args = parse_args(argc, argv);
    if (args.quiet) {
        // Diagnostics only; failures still reach callers in protocol replies.
        std::cerr.setstate(std::ios::badbit);
    }

    std::unique_ptr<ITelemetrySink> sink;
    if (args.telemetry) {
        auto path = args.telemetry_file.empty() ? JsonlTelemetrySink::default_path()
                                                : std::filesystem::path(args.telemetry_file);
        sink = std::make_unique<JsonlTelemetrySink>(path);
        std::cerr << "[main] telemetry -> " << path << std::endl;
    } else {
        sink = std::make_unique<NullTelemetrySink>();
    }

    ServiceConfig cfg;
    cfg.ollama = args.ollama;
    JobService service(*sink, cfg);
    ToolDispatcher tools(service);

    std::unique_ptr<LocalWSServer> ws;
    if (args.ws_port > 0) {
        ws = std::make_unique<LocalWSServer>(tools, args.ws_threads);
        ws->start(args.ws_address, static_cast<unsigned short>(args.ws_port), args.ws_cert, args.ws_key);
    }

    std::cerr << "[main] " << McpStdioServer::kServerName << " running on stdio" << std::endl;
    McpStdioServer server(tools, std::cin, std::cout);
    server.run(g_interrupted);

    if (ws) {
        ws->stop();
        ws.reset();
    }
    std::cerr << "[main] shut down" << std::endl;
    return 0;
}
