#include "tool_dispatcher.hpp"
#include "limits.hpp"
#include "validation.hpp"
#include <iostream>

using json = nlohmann::json;

namespace {

json options_schema(bool described) {
    if (!described) {
        return {
            {"type", "object"},
            {"description", "Optional parameters"},
            {"properties", {
                {"temperature", {{"type", "number"}}},
                {"num_predict", {{"type", "number"}}},
                {"system", {{"type", "string"}}},
                {"timeout", {{"type", "number"}}}
            }}
        };
    }
    return {
        {"type", "object"},
        {"description", "Optional parameters for the model"},
        {"properties", {
            {"temperature", {{"type", "number"}, {"description", "Temperature (0-2)"}}},
            {"num_predict", {{"type", "number"}, {"description", "Maximum tokens to generate"}}},
            {"system", {{"type", "string"}, {"description", "System prompt"}}},
            {"timeout", {{"type", "number"}, {"description", "Timeout in milliseconds (default: 120000)"}}}
        }}
    };
}

json error_payload(const std::string& message) {
    return json{{"error", message}};
}

} // namespace

ToolDispatcher::ToolDispatcher(JobService& service) : service_(service) {}

json ToolDispatcher::tool_definitions() {
    json list_models = {
        {"name", "ollama_list_models"},
        {"description", "List all locally available Ollama models"},
        {"inputSchema", {{"type", "object"}, {"properties", json::object()}}}
    };
    json run = {
        {"name", "ollama_run"},
        {"description", "Run a single Ollama model with a prompt"},
        {"inputSchema", {
            {"type", "object"},
            {"properties", {
                {"model", {{"type", "string"}, {"description", "Name of the Ollama model to run"}}},
                {"prompt", {{"type", "string"}, {"description", "Prompt to send to the model"}}},
                {"options", options_schema(true)}
            }},
            {"required", json::array({"model", "prompt"})}
        }}
    };
    json run_many = {
        {"name", "ollama_run_many"},
        {"description", "Run multiple Ollama models concurrently with a limit"},
        {"inputSchema", {
            {"type", "object"},
            {"properties", {
                {"jobs", {
                    {"type", "array"},
                    {"description", "Array of jobs to run"},
                    {"items", {
                        {"type", "object"},
                        {"properties", {
                            {"model", {{"type", "string"}, {"description", "Model name"}}},
                            {"prompt", {{"type", "string"}, {"description", "Prompt text"}}},
                            {"options", options_schema(false)}
                        }},
                        {"required", json::array({"model", "prompt"})}
                    }}
                }},
                {"maxConcurrency", {
                    {"type", "number"},
                    {"description", "Maximum concurrent jobs (default: " + std::to_string(kDefaultConcurrency) +
                                    ", max: " + std::to_string(kMaxConcurrency) + ")"}
                }}
            }},
            {"required", json::array({"jobs"})}
        }}
    };
    return json::array({list_models, run, run_many});
}

void ToolDispatcher::call(const std::string& name, const json& arguments, Reply reply) {
    const json args = arguments.is_object() ? arguments : json::object();
    try {
        if (name == "ollama_list_models") {
            service_.async_list_models([reply](std::vector<std::string> models, std::string error) {
                if (!error.empty()) {
                    reply(error_payload(error), true);
                    return;
                }
                reply(json{{"models", models}}, false);
            });
        } else if (name == "ollama_run") {
            Job job = job_from_json(args);
            std::cerr << "[ollama_run] model=" << job.model << ", prompt_length=" << char_count(job.prompt) << std::endl;
            service_.async_run_one(std::move(job), [reply](RunResult r) {
                reply(json(r), false);
            });
        } else if (name == "ollama_run_many") {
            std::vector<Job> jobs = jobs_from_json(args.contains("jobs") ? args["jobs"] : json());
            std::optional<int> concurrency = concurrency_from_json(args.value("maxConcurrency", json()));
            std::cerr << "[ollama_run_many] jobs=" << jobs.size()
                      << ", concurrency=" << concurrency.value_or(kDefaultConcurrency) << std::endl;
            service_.async_run_many(std::move(jobs), concurrency, [reply](std::vector<RunResult> results) {
                reply(json{{"results", results}}, false);
            });
        } else {
            reply(error_payload("Unknown tool: " + name), true);
        }
    } catch (const std::exception& e) {
        reply(error_payload(e.what()), true);
    }
}
