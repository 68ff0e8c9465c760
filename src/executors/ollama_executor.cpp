#include "ollama_executor.hpp"
#include <chrono>
#include <iostream>

OllamaExecutor::OllamaExecutor(boost::asio::io_context& ioc, ITelemetrySink& sink,
                               std::vector<std::string> runtime)
    : ioc_(ioc), sink_(sink), runtime_(std::move(runtime)) {}

std::vector<std::string> OllamaExecutor::default_runtime(const std::string& executable) {
    return {executable, "run"};
}

void OllamaExecutor::async_run(const Job& job, const RunTag& tag, Completion done) {
    ProcessSpec spec;
    spec.argv = runtime_;
    spec.argv.push_back(job.model);
    spec.stdin_data = job.effective_prompt() + "\n";
    spec.timeout = job.effective_timeout();

    // Wall clock for the record, steady clock for the duration.
    const auto started_wall = std::chrono::system_clock::now();
    const auto started = std::chrono::steady_clock::now();

    Subprocess::async_run(ioc_, std::move(spec),
        [this, model = job.model, tag, started_wall, started, done = std::move(done)](ProcessOutcome o) {
            const auto ended = std::chrono::steady_clock::now();

            RunResult r;
            r.stdout_text = std::move(o.out);
            r.stderr_text = std::move(o.err);
            r.exit_code = o.exit_code;
            if (o.end != ProcessEnd::Exited) r.error = std::move(o.error);

            RunTelemetryRecord rec;
            rec.model = model;
            rec.start = started_wall;
            rec.end = std::chrono::system_clock::now();
            rec.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(ended - started).count();
            rec.exit_code = r.exit_code;
            rec.output_chars = char_count(r.stdout_text);
            rec.timed_out = (o.end == ProcessEnd::TimedOut);
            rec.batch_id = tag.batch_id;
            rec.concurrency = tag.concurrency;

            if (r.error) {
                std::cerr << "[executor] " << model << " failed after " << rec.duration_ms << " ms: " << *r.error << std::endl;
            }

            try {
                sink_.record(rec);
            } catch (const std::exception& e) {
                std::cerr << "[executor] telemetry sink threw: " << e.what() << std::endl;
            }

            done(std::move(r));
        });
}
