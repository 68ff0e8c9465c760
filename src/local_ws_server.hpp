#pragma once
#include <boost/asio/io_context.hpp>
#include <thread>
#include <functional>
#include <nlohmann/json.hpp>
#include <memory>
#include <atomic>
#include <string>

class ThreadPool;
class ToolDispatcher;

// Local WebSocket listener: one tool request per connection,
// {"tool": name, "arguments": {...}} in, one JSON reply out.
class LocalWSServer {
public:
    using json = nlohmann::json;
    LocalWSServer(ToolDispatcher& tools, int threads = 4);
    ~LocalWSServer();

    // TLS is used when cert_file is non-empty.
    bool start(const std::string& address = "127.0.0.1", unsigned short port = 8787,
               const std::string& cert_file = "", const std::string& key_file = "");
    void stop();

    int get_threads() const { return threads_; }

    // Blocking; safe to call from any thread.
    json process_request(const json& req);

private:
    void run(const std::string& address, unsigned short port,
             const std::string& cert_file, const std::string& key_file);

    ToolDispatcher& tools_;
    std::atomic<bool> running{false};
    std::thread th;
    // Accepted sockets live on ioc; the pool is declared after it so its
    // queued connections are drained first on destruction.
    boost::asio::io_context ioc;
    std::unique_ptr<ThreadPool> thread_pool;
    int threads_;
    std::atomic<int> active_requests{0};
};
