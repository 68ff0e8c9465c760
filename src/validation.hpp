#pragma once
#include "job.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// Raised for a malformed or unsafe job field. Always thrown before any
// process is spawned.
class ValidationError : public std::runtime_error {
public:
    ValidationError(std::string field, const std::string& message)
        : std::runtime_error(message), field_(std::move(field)) {}

    const std::string& field() const noexcept { return field_; }

private:
    std::string field_;
};

void validate_model(const std::string& model);
void validate_prompt(const std::string& prompt);
void validate_options(const RunOptions& options);
void validate_job(const Job& job);

// Validates every job; the first failure rejects the whole batch.
void validate_jobs(const std::vector<Job>& jobs);

// JSON decoding. Wrongly typed fields raise ValidationError; range checks
// are left to validate_job.
RunOptions options_from_json(const nlohmann::json& j);
Job job_from_json(const nlohmann::json& j);
std::vector<Job> jobs_from_json(const nlohmann::json& j);
std::optional<int> concurrency_from_json(const nlohmann::json& j);
