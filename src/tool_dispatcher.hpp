#pragma once
#include "job_service.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <string>

// Maps tool calls (name + JSON arguments) onto the job service.
class ToolDispatcher {
public:
    using json = nlohmann::json;
    // payload is the tool's JSON result, or {"error": msg} when is_error.
    using Reply = std::function<void(json payload, bool is_error)>;

    explicit ToolDispatcher(JobService& service);

    // Tool descriptors with their JSON input schemas.
    static json tool_definitions();

    // reply is invoked exactly once, possibly from another thread.
    void call(const std::string& name, const json& arguments, Reply reply);

private:
    JobService& service_;
};
