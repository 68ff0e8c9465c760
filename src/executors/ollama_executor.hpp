#pragma once
#include "iexecutor.hpp"
#include "subprocess.hpp"
#include "../telemetry.hpp"
#include <boost/asio/io_context.hpp>
#include <string>
#include <vector>

// Launches `<runtime...> <model>` per job, feeds the prompt on stdin and
// reports one telemetry record per attempt.
class OllamaExecutor : public IExecutor {
public:
    // {"ollama", "run"}
    static std::vector<std::string> default_runtime(const std::string& executable = "ollama");

    OllamaExecutor(boost::asio::io_context& ioc, ITelemetrySink& sink,
                   std::vector<std::string> runtime = {"ollama", "run"});

    void async_run(const Job& job, const RunTag& tag, Completion done) override;

private:
    boost::asio::io_context& ioc_;
    ITelemetrySink& sink_;
    std::vector<std::string> runtime_;
};
