#include "mcp_stdio_server.hpp"
#include <iostream>

using json = nlohmann::json;

namespace {
constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
}

McpStdioServer::McpStdioServer(ToolDispatcher& tools, std::istream& in, std::ostream& out)
    : tools_(tools), in_(in), out_(out) {}

void McpStdioServer::run(const std::atomic<bool>& interrupted) {
    std::string line;
    while (!interrupted.load() && std::getline(in_, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
        handle_line(line);
    }
    if (interrupted.load()) {
        std::cerr << "[mcp] interrupted, waiting for in-flight calls" << std::endl;
    } else {
        std::cerr << "[mcp] input closed, waiting for in-flight calls" << std::endl;
    }
    wait_idle();
}

void McpStdioServer::wait_idle() {
    std::unique_lock<std::mutex> lk(inflight_mtx_);
    idle_.wait(lk, [this] { return inflight_ == 0; });
}

void McpStdioServer::handle_line(const std::string& line) {
    json req = json::parse(line, nullptr, false);
    if (req.is_discarded()) {
        reply_error(nullptr, kParseError, "Parse error");
        return;
    }
    if (req.is_array()) {
        // Batched JSON-RPC is not used by MCP clients.
        reply_error(nullptr, kInvalidRequest, "Batch requests are not supported");
        return;
    }
    handle_request(req);
}

void McpStdioServer::handle_request(const json& req) {
    const bool is_notification = req.is_object() && !req.contains("id");
    const json id = (req.is_object() && req.contains("id")) ? req["id"] : json(nullptr);

    if (!req.is_object() || !req.contains("method") || !req["method"].is_string()) {
        if (!is_notification) reply_error(id, kInvalidRequest, "Invalid Request");
        return;
    }
    const std::string method = req["method"].get<std::string>();
    const json params = req.value("params", json::object());

    if (is_notification) {
        // notifications/initialized, notifications/cancelled, ...: nothing to answer.
        return;
    }

    if (method == "initialize") {
        std::string version = kProtocolVersion;
        if (params.is_object() && params.contains("protocolVersion") && params["protocolVersion"].is_string()) {
            version = params["protocolVersion"].get<std::string>();
        }
        reply_result(id, {
            {"protocolVersion", version},
            {"capabilities", {{"tools", json::object()}}},
            {"serverInfo", {{"name", kServerName}, {"version", kServerVersion}}}
        });
    } else if (method == "ping") {
        reply_result(id, json::object());
    } else if (method == "tools/list") {
        reply_result(id, {{"tools", ToolDispatcher::tool_definitions()}});
    } else if (method == "tools/call") {
        handle_tool_call(id, params);
    } else {
        reply_error(id, kMethodNotFound, "Method not found: " + method);
    }
}

void McpStdioServer::handle_tool_call(const json& id, const json& params) {
    if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
        reply_error(id, kInvalidParams, "tools/call requires a tool name");
        return;
    }
    const std::string name = params["name"].get<std::string>();
    const json arguments = params.value("arguments", json::object());

    {
        std::lock_guard<std::mutex> lk(inflight_mtx_);
        ++inflight_;
    }
    tools_.call(name, arguments, [this, id](json payload, bool is_error) {
        json result = {
            {"content", json::array({
                {{"type", "text"}, {"text", payload.dump(2, ' ', false, json::error_handler_t::replace)}}
            })}
        };
        if (is_error) result["isError"] = true;
        reply_result(id, std::move(result));

        std::lock_guard<std::mutex> lk(inflight_mtx_);
        if (--inflight_ == 0) idle_.notify_all();
    });
}

void McpStdioServer::send(const json& msg) {
    const std::string text = msg.dump(-1, ' ', false, json::error_handler_t::replace);
    std::lock_guard<std::mutex> lk(out_mtx_);
    out_ << text << '\n';
    out_.flush();
}

void McpStdioServer::reply_result(const json& id, json result) {
    send({{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}});
}

void McpStdioServer::reply_error(const json& id, int code, const std::string& message) {
    send({{"jsonrpc", "2.0"}, {"id", id}, {"error", {{"code", code}, {"message", message}}}});
}
