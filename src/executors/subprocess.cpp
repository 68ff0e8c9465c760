#include "subprocess.hpp"
#include <boost/asio/post.hpp>
#include <boost/asio/write.hpp>
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <mutex>

namespace asio = boost::asio;

namespace {

constexpr std::chrono::milliseconds kExitPollInterval{10};
constexpr std::chrono::milliseconds kReapPollInterval{50};

std::string errno_message(int e) {
    return std::strerror(e);
}

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// Waits for a child that has been sent SIGTERM, escalating to SIGKILL after
// kKillGrace, so a timed-out runtime never lingers as a zombie.
class ChildReaper : public std::enable_shared_from_this<ChildReaper> {
public:
    ChildReaper(asio::io_context& ioc, pid_t pid)
        : timer_(ioc), pid_(pid), kill_at_(std::chrono::steady_clock::now() + kKillGrace) {}

    void poll() {
        int status = 0;
        pid_t r = ::waitpid(pid_, &status, WNOHANG);
        if (r == pid_) return;
        if (r < 0 && errno != EINTR) {
            std::cerr << "[executor] waitpid(" << pid_ << ") failed while reaping: " << errno_message(errno) << std::endl;
            return;
        }
        if (!killed_ && std::chrono::steady_clock::now() >= kill_at_) {
            std::cerr << "[executor] pid " << pid_ << " ignored SIGTERM, sending SIGKILL" << std::endl;
            ::kill(pid_, SIGKILL);
            killed_ = true;
        }
        timer_.expires_after(kReapPollInterval);
        timer_.async_wait([self = shared_from_this()](const boost::system::error_code& ec) {
            if (!ec) self->poll();
        });
    }

private:
    asio::steady_timer timer_;
    pid_t pid_;
    std::chrono::steady_clock::time_point kill_at_;
    bool killed_ = false;
};

void ignore_sigpipe_once() {
    static std::once_flag once;
    std::call_once(once, [] { ::signal(SIGPIPE, SIG_IGN); });
}

} // namespace

struct Subprocess::Token {};

void Subprocess::async_run(asio::io_context& ioc, ProcessSpec spec, Handler handler) {
    ignore_sigpipe_once();
    auto p = std::make_shared<Subprocess>(Token{}, ioc, std::move(spec), std::move(handler));
    asio::post(p->strand_, [p] { p->start(); });
}

Subprocess::Subprocess(const Token&, asio::io_context& ioc, ProcessSpec spec, Handler handler)
    : ioc_(ioc),
      strand_(asio::make_strand(ioc)),
      spec_(std::move(spec)),
      handler_(std::move(handler)),
      stdin_(strand_),
      stdout_(strand_),
      stderr_(strand_),
      deadline_(strand_),
      exit_poll_(strand_) {}

Subprocess::~Subprocess() {
    if (pid_ > 0) {
        // Only reached if the io_context was torn down mid-run.
        ::kill(pid_, SIGKILL);
        int status = 0;
        ::waitpid(pid_, &status, WNOHANG);
    }
}

void Subprocess::start() {
    std::string error;
    if (!spawn(error)) {
        settle(ProcessEnd::Failed, -1, std::move(error));
        return;
    }

    deadline_.expires_after(spec_.timeout);
    deadline_.async_wait([this, self = shared_from_this()](const boost::system::error_code& ec) {
        on_deadline(ec);
    });

    open_streams_ = 2;
    read_stream(stdout_, out_buf_, outcome_.out);
    read_stream(stderr_, err_buf_, outcome_.err);
    write_stdin();
}

bool Subprocess::spawn(std::string& error) {
    if (spec_.argv.empty()) {
        error = "no executable given";
        return false;
    }

    int in[2] = {-1, -1}, out[2] = {-1, -1}, err[2] = {-1, -1}, status[2] = {-1, -1};
    if (::pipe2(in, O_CLOEXEC) == -1 || ::pipe2(out, O_CLOEXEC) == -1 ||
        ::pipe2(err, O_CLOEXEC) == -1 || ::pipe2(status, O_CLOEXEC) == -1) {
        error = "failed to create pipes: " + errno_message(errno);
        for (int* fds : {in, out, err, status}) { close_fd(fds[0]); close_fd(fds[1]); }
        return false;
    }

    std::vector<char*> argv;
    for (auto& a : spec_.argv) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid == 0) {
        // The server ignores SIGPIPE; the runtime gets the default action back.
        ::signal(SIGPIPE, SIG_DFL);
        ::dup2(in[0], STDIN_FILENO);
        ::dup2(out[1], STDOUT_FILENO);
        ::dup2(err[1], STDERR_FILENO);
        ::execvp(argv[0], argv.data());
        int e = errno;
        ssize_t w = ::write(status[1], &e, sizeof(e));
        (void)w;
        ::_exit(127);
    }

    close_fd(in[0]);
    close_fd(out[1]);
    close_fd(err[1]);
    close_fd(status[1]);

    if (pid < 0) {
        error = "fork failed: " + errno_message(errno);
        for (int* fds : {in, out, err, status}) { close_fd(fds[0]); close_fd(fds[1]); }
        return false;
    }

    // The status pipe is closed by a successful exec; otherwise it carries errno.
    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(status[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(status[0]);

    if (n > 0) {
        int st = 0;
        while (::waitpid(pid, &st, 0) < 0 && errno == EINTR) {}
        close_fd(in[1]);
        close_fd(out[0]);
        close_fd(err[0]);
        error = "failed to execute " + spec_.argv[0] + ": " + errno_message(child_errno);
        return false;
    }

    pid_ = pid;
    stdin_.assign(in[1]);
    stdout_.assign(out[0]);
    stderr_.assign(err[0]);
    return true;
}

void Subprocess::write_stdin() {
    if (spec_.stdin_data.empty()) {
        boost::system::error_code ignored;
        stdin_.close(ignored);
        return;
    }
    asio::async_write(stdin_, asio::buffer(spec_.stdin_data),
        [this, self = shared_from_this()](const boost::system::error_code& ec, std::size_t) {
            if (ec && ec != asio::error::operation_aborted && !settled_) {
                // Typically EPIPE: the child exited without reading its input.
                std::cerr << "[executor] stdin write to pid " << pid_ << " failed: " << ec.message() << std::endl;
            }
            boost::system::error_code ignored;
            stdin_.close(ignored);
        });
}

void Subprocess::read_stream(asio::posix::stream_descriptor& sd, Buffer& buf, std::string& sink) {
    sd.async_read_some(asio::buffer(buf),
        [this, self = shared_from_this(), &sd, &buf, &sink](const boost::system::error_code& ec, std::size_t n) {
            if (settled_) return;
            if (n > 0) sink.append(buf.data(), n);
            if (!ec) {
                read_stream(sd, buf, sink);
                return;
            }
            if (ec != asio::error::eof) {
                std::cerr << "[executor] read from pid " << pid_ << " failed: " << ec.message() << std::endl;
            }
            on_stream_closed();
        });
}

void Subprocess::on_stream_closed() {
    if (--open_streams_ == 0) poll_exit();
}

void Subprocess::poll_exit() {
    if (settled_) return;

    int status = 0;
    pid_t r = ::waitpid(pid_, &status, WNOHANG);
    if (r == 0 || (r < 0 && errno == EINTR)) {
        exit_poll_.expires_after(kExitPollInterval);
        exit_poll_.async_wait([this, self = shared_from_this()](const boost::system::error_code& ec) {
            if (!ec) poll_exit();
        });
        return;
    }
    if (r < 0) {
        std::string msg = "waitpid failed: " + errno_message(errno);
        pid_ = -1;
        settle(ProcessEnd::Failed, -1, std::move(msg));
        return;
    }

    pid_ = -1;
    if (WIFEXITED(status)) {
        settle(ProcessEnd::Exited, WEXITSTATUS(status), {});
    } else if (WIFSIGNALED(status)) {
        settle(ProcessEnd::Signaled, -1, "process terminated by signal " + std::to_string(WTERMSIG(status)));
    } else {
        settle(ProcessEnd::Failed, -1, "process terminated abnormally");
    }
}

void Subprocess::on_deadline(const boost::system::error_code& ec) {
    if (ec || settled_) return;

    if (pid_ > 0) {
        if (::kill(pid_, SIGTERM) != 0) {
            std::cerr << "[executor] SIGTERM to pid " << pid_ << " failed: " << errno_message(errno) << std::endl;
        }
        std::make_shared<ChildReaper>(ioc_, pid_)->poll();
        pid_ = -1;
    }
    settle(ProcessEnd::TimedOut, -1, "Timeout exceeded");
}

void Subprocess::settle(ProcessEnd end, int exit_code, std::string error) {
    if (settled_) return;
    settled_ = true;

    deadline_.cancel();
    exit_poll_.cancel();
    release_descriptors();

    outcome_.end = end;
    outcome_.exit_code = exit_code;
    outcome_.error = std::move(error);
    if (end == ProcessEnd::TimedOut) {
        outcome_.err += "\nProcess timed out";
    } else if (end != ProcessEnd::Exited) {
        outcome_.err += "\n" + outcome_.error;
    }

    auto handler = std::move(handler_);
    handler(std::move(outcome_));
}

void Subprocess::release_descriptors() {
    boost::system::error_code ignored;
    stdin_.close(ignored);
    stdout_.close(ignored);
    stderr_.close(ignored);
}
