#pragma once
#include "executors/ollama_executor.hpp"
#include "job.hpp"
#include "model_lister.hpp"
#include "scheduler.hpp"
#include "telemetry.hpp"
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <functional>
#include <optional>
#include <string>
#include <thread>
#include <vector>

struct ServiceConfig {
    std::string ollama = "ollama";          // runtime executable, looked up on PATH
    std::vector<std::string> run_command;   // replaces "<ollama> run" when non-empty
};

// Owns the event loop thread and the engine built on it. The blocking calls
// must not be made from the loop thread itself.
class JobService {
public:
    using OneHandler = std::function<void(RunResult)>;
    using ManyHandler = BatchScheduler::Completion;

    explicit JobService(ITelemetrySink& sink, ServiceConfig cfg = {});
    ~JobService();

    JobService(const JobService&) = delete;
    JobService& operator=(const JobService&) = delete;

    // Throw ValidationError synchronously; otherwise complete on the loop thread.
    void async_run_one(Job job, OneHandler done);
    void async_run_many(std::vector<Job> jobs, std::optional<int> max_concurrency, ManyHandler done);
    void async_list_models(ModelLister::Handler done);

    RunResult run_one(Job job);
    std::vector<RunResult> run_many(std::vector<Job> jobs, std::optional<int> max_concurrency = std::nullopt);
    std::vector<std::string> list_models();   // throws ListError

private:
    void run_loop();

    boost::asio::io_context ioc_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
    OllamaExecutor executor_;
    BatchScheduler scheduler_;
    ModelLister lister_;
    std::thread io_thread_;
};
