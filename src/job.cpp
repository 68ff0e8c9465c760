#include "job.hpp"
#include "limits.hpp"

using json = nlohmann::json;

std::string Job::effective_prompt() const {
    if (options.system && !options.system->empty()) {
        return *options.system + "\n\n" + prompt;
    }
    return prompt;
}

std::chrono::milliseconds Job::effective_timeout() const {
    if (options.timeout && options.timeout->count() > 0) return *options.timeout;
    return kDefaultTimeout;
}

std::size_t char_count(const std::string& s) {
    std::size_t n = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) ++n;
    }
    return n;
}

void to_json(json& j, const RunResult& r) {
    j = json{
        {"stdout", r.stdout_text},
        {"stderr", r.stderr_text},
        {"exitCode", r.exit_code}
    };
    if (r.error) j["error"] = *r.error;
}

void to_json(json& j, const Job& job) {
    json opts = json::object();
    if (job.options.temperature) opts["temperature"] = *job.options.temperature;
    if (job.options.num_predict) opts["num_predict"] = *job.options.num_predict;
    if (job.options.system) opts["system"] = *job.options.system;
    if (job.options.timeout) opts["timeout"] = job.options.timeout->count();
    j = json{{"model", job.model}, {"prompt", job.prompt}};
    if (!opts.empty()) j["options"] = opts;
}
