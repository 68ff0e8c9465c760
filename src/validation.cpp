#include "validation.hpp"
#include "limits.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <limits>

using json = nlohmann::json;

void validate_model(const std::string& model) {
    bool blank = std::all_of(model.begin(), model.end(),
                             [](unsigned char c) { return std::isspace(c) != 0; });
    if (model.empty() || blank) {
        throw ValidationError("model", "Model name must be a non-empty string");
    }
    // No shell is involved in the launch; these are rejected outright anyway.
    if (model.find_first_of(";&|") != std::string::npos) {
        throw ValidationError("model", "Invalid model name");
    }
}

void validate_prompt(const std::string& prompt) {
    if (char_count(prompt) > kMaxPromptLength) {
        throw ValidationError("prompt", "Prompt exceeds maximum length of " + std::to_string(kMaxPromptLength));
    }
}

void validate_options(const RunOptions& options) {
    if (options.num_predict) {
        int n = *options.num_predict;
        if (n < kMinNumPredict || n > kMaxNumPredict) {
            throw ValidationError("num_predict", "num_predict must be between 1 and " + std::to_string(kMaxNumPredict));
        }
    }
    if (options.temperature) {
        double t = *options.temperature;
        if (std::isnan(t) || t < kMinTemperature || t > kMaxTemperature) {
            throw ValidationError("temperature", "temperature must be between 0 and 2");
        }
    }
}

void validate_job(const Job& job) {
    validate_model(job.model);
    validate_prompt(job.prompt);
    validate_options(job.options);
}

void validate_jobs(const std::vector<Job>& jobs) {
    for (size_t i = 0; i < jobs.size(); ++i) {
        try {
            validate_job(jobs[i]);
        } catch (const ValidationError& e) {
            throw ValidationError(e.field(), "jobs[" + std::to_string(i) + "]: " + e.what());
        }
    }
}

RunOptions options_from_json(const json& j) {
    RunOptions o;
    if (j.is_null()) return o;
    if (!j.is_object()) throw ValidationError("options", "options must be an object");

    if (j.contains("temperature") && !j["temperature"].is_null()) {
        const auto& v = j["temperature"];
        if (!v.is_number()) throw ValidationError("temperature", "temperature must be between 0 and 2");
        o.temperature = v.get<double>();
    }
    if (j.contains("num_predict") && !j["num_predict"].is_null()) {
        const auto& v = j["num_predict"];
        if (!v.is_number()) {
            throw ValidationError("num_predict", "num_predict must be between 1 and " + std::to_string(kMaxNumPredict));
        }
        // Range is checked on the number as given; in-range fractions are truncated.
        double d = v.get<double>();
        if (d < kMinNumPredict || d > kMaxNumPredict) {
            throw ValidationError("num_predict", "num_predict must be between 1 and " + std::to_string(kMaxNumPredict));
        }
        o.num_predict = static_cast<int>(d);
    }
    if (j.contains("system") && !j["system"].is_null()) {
        if (!j["system"].is_string()) throw ValidationError("system", "system must be a string");
        o.system = j["system"].get<std::string>();
    }
    if (j.contains("timeout") && !j["timeout"].is_null()) {
        const auto& v = j["timeout"];
        if (!v.is_number()) throw ValidationError("timeout", "timeout must be a number of milliseconds");
        double ms = v.get<double>();
        if (ms > 0) {
            ms = std::min(ms, static_cast<double>(std::numeric_limits<int32_t>::max()));
            o.timeout = std::chrono::milliseconds(static_cast<int64_t>(ms));
        }
    }
    return o;
}

Job job_from_json(const json& j) {
    if (!j.is_object()) throw ValidationError("job", "job must be an object");
    Job job;
    if (!j.contains("model") || !j["model"].is_string()) {
        throw ValidationError("model", "Model name must be a non-empty string");
    }
    job.model = j["model"].get<std::string>();
    if (!j.contains("prompt") || !j["prompt"].is_string()) {
        throw ValidationError("prompt", "Prompt must be a string");
    }
    job.prompt = j["prompt"].get<std::string>();
    if (j.contains("options")) job.options = options_from_json(j["options"]);
    return job;
}

std::vector<Job> jobs_from_json(const json& j) {
    if (!j.is_array()) throw ValidationError("jobs", "jobs must be an array");
    std::vector<Job> jobs;
    jobs.reserve(j.size());
    for (size_t i = 0; i < j.size(); ++i) {
        try {
            jobs.push_back(job_from_json(j[i]));
        } catch (const ValidationError& e) {
            throw ValidationError(e.field(), "jobs[" + std::to_string(i) + "]: " + e.what());
        }
    }
    return jobs;
}

std::optional<int> concurrency_from_json(const json& j) {
    if (j.is_null()) return std::nullopt;
    if (!j.is_number()) throw ValidationError("maxConcurrency", "maxConcurrency must be a number");
    double d = j.get<double>();
    d = std::max(1.0, std::min(d, static_cast<double>(kMaxConcurrency)));
    return static_cast<int>(d);
}
