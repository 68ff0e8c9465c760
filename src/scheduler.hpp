#pragma once
#include "executors/iexecutor.hpp"
#include "job.hpp"
#include <boost/asio/io_context.hpp>
#include <functional>
#include <optional>
#include <string>
#include <vector>

// Runs a batch of jobs through an executor with at most N in flight and
// returns the results in submission order.
class BatchScheduler {
public:
    using Completion = std::function<void(std::vector<RunResult>)>;
    using IdGenerator = std::function<std::string()>;

    BatchScheduler(boost::asio::io_context& ioc, IExecutor& executor, IdGenerator make_id = {});

    BatchScheduler(const BatchScheduler&) = delete;
    BatchScheduler& operator=(const BatchScheduler&) = delete;

    // Validates every job first and throws ValidationError on the first bad
    // one, before anything is admitted. Otherwise returns immediately; done
    // is called from the io_context once every job has finished.
    void async_run_many(std::vector<Job> jobs, std::optional<int> max_concurrency, Completion done);

    // clamp(requested, 1, kMaxConcurrency), kDefaultConcurrency when absent.
    static int effective_concurrency(std::optional<int> requested);

private:
    struct Batch;

    void pump(const std::shared_ptr<Batch>& b);
    void on_finished(const std::shared_ptr<Batch>& b, size_t index, RunResult r);

    boost::asio::io_context& ioc_;
    IExecutor& executor_;
    IdGenerator make_id_;
};
