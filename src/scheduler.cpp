#include "scheduler.hpp"
#include "limits.hpp"
#include "telemetry.hpp"
#include "validation.hpp"
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <algorithm>
#include <iostream>

namespace asio = boost::asio;

namespace {
enum class BatchState { Admitting, Draining, Complete };
}

// Admission state of one batch. Only touched on its strand.
struct BatchScheduler::Batch {
    explicit Batch(asio::io_context& ioc) : strand(asio::make_strand(ioc)) {}

    asio::strand<asio::io_context::executor_type> strand;
    std::vector<Job> jobs;
    std::vector<RunResult> results;   // one slot per job, addressed by input index
    size_t cursor = 0;                // next job to admit
    int active = 0;                   // admitted and not yet finished
    int limit = kDefaultConcurrency;
    RunTag tag;
    BatchState state = BatchState::Admitting;
    Completion done;
};

BatchScheduler::BatchScheduler(asio::io_context& ioc, IExecutor& executor, IdGenerator make_id)
    : ioc_(ioc), executor_(executor), make_id_(std::move(make_id)) {
    if (!make_id_) make_id_ = make_batch_id;
}

int BatchScheduler::effective_concurrency(std::optional<int> requested) {
    if (!requested) return kDefaultConcurrency;
    return std::min(std::max(1, *requested), kMaxConcurrency);
}

void BatchScheduler::async_run_many(std::vector<Job> jobs, std::optional<int> max_concurrency, Completion done) {
    validate_jobs(jobs);

    auto b = std::make_shared<Batch>(ioc_);
    b->limit = effective_concurrency(max_concurrency);
    b->tag.batch_id = make_id_();
    b->tag.concurrency = b->limit;
    b->results.resize(jobs.size());
    b->jobs = std::move(jobs);
    b->done = std::move(done);

    std::cerr << "[scheduler] " << *b->tag.batch_id << ": " << b->jobs.size()
              << " jobs, concurrency " << b->limit << std::endl;

    asio::post(b->strand, [this, b] { pump(b); });
}

void BatchScheduler::pump(const std::shared_ptr<Batch>& b) {
    while (b->state == BatchState::Admitting && b->active < b->limit && b->cursor < b->jobs.size()) {
        const size_t index = b->cursor++;
        ++b->active;
        executor_.async_run(b->jobs[index], b->tag, [this, b, index](RunResult r) {
            asio::post(b->strand, [this, b, index, r = std::move(r)]() mutable {
                on_finished(b, index, std::move(r));
            });
        });
    }

    if (b->cursor == b->jobs.size() && b->state == BatchState::Admitting) {
        b->state = BatchState::Draining;
    }
    if (b->state == BatchState::Draining && b->active == 0) {
        b->state = BatchState::Complete;
        std::cerr << "[scheduler] " << *b->tag.batch_id << ": complete" << std::endl;
        auto done = std::move(b->done);
        done(std::move(b->results));
    }
}

void BatchScheduler::on_finished(const std::shared_ptr<Batch>& b, size_t index, RunResult r) {
    b->results[index] = std::move(r);
    --b->active;
    pump(b);
}
