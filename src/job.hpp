#pragma once
#include <nlohmann/json.hpp>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

struct RunOptions {
    std::optional<double> temperature;
    std::optional<int> num_predict;
    std::optional<std::string> system;
    std::optional<std::chrono::milliseconds> timeout;
};

struct Job {
    std::string model;
    std::string prompt;
    RunOptions options;

    // Prompt as sent to the runtime: "<system>\n\n<prompt>" when a system text is set.
    std::string effective_prompt() const;
    // Configured timeout, or the default when absent or not positive.
    std::chrono::milliseconds effective_timeout() const;
};

struct RunResult {
    std::string stdout_text;
    std::string stderr_text;
    int exit_code{-1};
    std::optional<std::string> error;
};

// Per-execution correlation data. Absent for single-job runs.
struct RunTag {
    std::optional<std::string> batch_id;
    std::optional<int> concurrency;
};

// Number of Unicode code points in a UTF-8 string.
std::size_t char_count(const std::string& s);

void to_json(nlohmann::json& j, const RunResult& r);
void to_json(nlohmann::json& j, const Job& job);
