#include "job_service.hpp"
#include "validation.hpp"
#include <future>
#include <iostream>

static std::vector<std::string> runtime_for(const ServiceConfig& cfg) {
    if (!cfg.run_command.empty()) return cfg.run_command;
    return OllamaExecutor::default_runtime(cfg.ollama);
}

JobService::JobService(ITelemetrySink& sink, ServiceConfig cfg)
    : work_(boost::asio::make_work_guard(ioc_)),
      executor_(ioc_, sink, runtime_for(cfg)),
      scheduler_(ioc_, executor_),
      lister_(ioc_, cfg.ollama) {
    io_thread_ = std::thread(&JobService::run_loop, this);
}

JobService::~JobService() {
    work_.reset();
    ioc_.stop();
    if (io_thread_.joinable()) io_thread_.join();
}

void JobService::run_loop() {
    for (;;) {
        try {
            ioc_.run();
            return;
        } catch (const std::exception& e) {
            std::cerr << "[service] event loop handler threw: " << e.what() << std::endl;
        }
    }
}

void JobService::async_run_one(Job job, OneHandler done) {
    validate_job(job);
    executor_.async_run(job, RunTag{}, std::move(done));
}

void JobService::async_run_many(std::vector<Job> jobs, std::optional<int> max_concurrency, ManyHandler done) {
    scheduler_.async_run_many(std::move(jobs), max_concurrency, std::move(done));
}

void JobService::async_list_models(ModelLister::Handler done) {
    lister_.async_list(std::move(done));
}

RunResult JobService::run_one(Job job) {
    auto p = std::make_shared<std::promise<RunResult>>();
    auto f = p->get_future();
    async_run_one(std::move(job), [p](RunResult r) { p->set_value(std::move(r)); });
    return f.get();
}

std::vector<RunResult> JobService::run_many(std::vector<Job> jobs, std::optional<int> max_concurrency) {
    auto p = std::make_shared<std::promise<std::vector<RunResult>>>();
    auto f = p->get_future();
    async_run_many(std::move(jobs), max_concurrency, [p](std::vector<RunResult> r) { p->set_value(std::move(r)); });
    return f.get();
}

std::vector<std::string> JobService::list_models() {
    auto p = std::make_shared<std::promise<std::vector<std::string>>>();
    auto f = p->get_future();
    async_list_models([p](std::vector<std::string> models, std::string error) {
        if (!error.empty()) {
            p->set_exception(std::make_exception_ptr(ListError(error)));
            return;
        }
        p->set_value(std::move(models));
    });
    return f.get();
}
