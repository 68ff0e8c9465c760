#pragma once
#include "../limits.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <sys/types.h>
#include <array>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

struct ProcessSpec {
    std::vector<std::string> argv;      // argv[0] is looked up on PATH
    std::string stdin_data;             // written in full, then stdin is closed
    std::chrono::milliseconds timeout{kDefaultTimeout};
};

// Signaled: the child was reaped after dying from a signal it did not
// receive from our deadline.
enum class ProcessEnd { Exited, TimedOut, Signaled, Failed };

struct ProcessOutcome {
    ProcessEnd end{ProcessEnd::Failed};
    int exit_code{-1};                  // -1 unless end == Exited
    std::string out;
    std::string err;
    std::string error;                  // empty iff end == Exited
};

// One child process driven by an io_context: fork/execvp without a shell,
// stdin fed asynchronously, stdout/stderr accumulated, a deadline timer
// racing the child's exit. The first terminal event wins; later events are
// ignored.
class Subprocess : public std::enable_shared_from_this<Subprocess> {
public:
    using Handler = std::function<void(ProcessOutcome)>;

    // The handler is invoked exactly once, from the io_context, never from
    // inside this call.
    static void async_run(boost::asio::io_context& ioc, ProcessSpec spec, Handler handler);

private:
    struct Token;   // restricts construction to async_run

public:
    Subprocess(const Token&, boost::asio::io_context& ioc, ProcessSpec spec, Handler handler);
    ~Subprocess();

    Subprocess(const Subprocess&) = delete;
    Subprocess& operator=(const Subprocess&) = delete;

private:
    using Strand = boost::asio::strand<boost::asio::io_context::executor_type>;
    using Buffer = std::array<char, 4096>;

    void start();
    bool spawn(std::string& error);
    void write_stdin();
    void read_stream(boost::asio::posix::stream_descriptor& sd, Buffer& buf, std::string& sink);
    void on_stream_closed();
    void poll_exit();
    void on_deadline(const boost::system::error_code& ec);
    void settle(ProcessEnd end, int exit_code, std::string error);
    void release_descriptors();

    boost::asio::io_context& ioc_;
    Strand strand_;
    ProcessSpec spec_;
    Handler handler_;

    pid_t pid_ = -1;
    boost::asio::posix::stream_descriptor stdin_;
    boost::asio::posix::stream_descriptor stdout_;
    boost::asio::posix::stream_descriptor stderr_;
    boost::asio::steady_timer deadline_;
    boost::asio::steady_timer exit_poll_;
    Buffer out_buf_{};
    Buffer err_buf_{};

    ProcessOutcome outcome_;
    int open_streams_ = 0;
    bool settled_ = false;
};
