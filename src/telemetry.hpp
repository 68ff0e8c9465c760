#pragma once
#include "thread_pool.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>

struct RunTelemetryRecord {
    std::string model;
    std::chrono::system_clock::time_point start;
    std::chrono::system_clock::time_point end;
    int64_t duration_ms{0};
    int exit_code{-1};
    size_t output_chars{0};
    bool timed_out{false};
    std::optional<std::string> batch_id;
    std::optional<int> concurrency;
};

void to_json(nlohmann::json& j, const RunTelemetryRecord& r);

// "2025-01-31T12:00:00.123Z"
std::string iso8601_utc(std::chrono::system_clock::time_point tp);

// "batch_<epoch ms>_<8 hex chars>"
std::string make_batch_id();

// Push-only consumer of run records. record() must not block on I/O and
// must not throw.
class ITelemetrySink {
public:
    virtual ~ITelemetrySink() = default;
    virtual void record(const RunTelemetryRecord& rec) = 0;
};

class NullTelemetrySink : public ITelemetrySink {
public:
    void record(const RunTelemetryRecord&) override {}
};

// Appends one JSON object per line. Writes happen on a dedicated thread in
// submission order; I/O failures are logged and dropped.
class JsonlTelemetrySink : public ITelemetrySink {
public:
    explicit JsonlTelemetrySink(std::filesystem::path path);
    ~JsonlTelemetrySink() override;

    void record(const RunTelemetryRecord& rec) override;

    // Blocks until every record submitted so far has been written.
    void flush();

    const std::filesystem::path& path() const { return path_; }

    // $HOME/.cache/ollama-batch/runs.jsonl, or /tmp/ollama-batch/runs.jsonl.
    static std::filesystem::path default_path();

private:
    void append_line(const std::string& line);

    std::filesystem::path path_;
    std::ofstream out_;
    bool open_failed_ = false;
    ThreadPool writer_{1, "telemetry"};
};
