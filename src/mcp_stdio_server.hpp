#pragma once
#include "tool_dispatcher.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <condition_variable>
#include <istream>
#include <mutex>
#include <ostream>
#include <string>

// Newline-delimited JSON-RPC 2.0 over a pair of streams, speaking the MCP
// tool surface (initialize, tools/list, tools/call, ping). Tool calls run
// concurrently; each response is written as one line.
class McpStdioServer {
public:
    using json = nlohmann::json;

    static constexpr const char* kServerName = "ollama-batch";
    static constexpr const char* kServerVersion = "1.0.0";
    static constexpr const char* kProtocolVersion = "2024-11-05";

    McpStdioServer(ToolDispatcher& tools, std::istream& in, std::ostream& out);

    // Reads until EOF or interrupt, then waits for in-flight calls.
    void run(const std::atomic<bool>& interrupted);

    void handle_line(const std::string& line);

    // Blocks until no tool call is outstanding.
    void wait_idle();

private:
    void handle_request(const json& req);
    void handle_tool_call(const json& id, const json& params);
    void send(const json& msg);
    void reply_result(const json& id, json result);
    void reply_error(const json& id, int code, const std::string& message);

    ToolDispatcher& tools_;
    std::istream& in_;
    std::ostream& out_;

    std::mutex out_mtx_;
    std::mutex inflight_mtx_;
    std::condition_variable idle_;
    int inflight_ = 0;
};
