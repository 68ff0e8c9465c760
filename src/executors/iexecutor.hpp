#pragma once
#include "../job.hpp"
#include <functional>

// Runs one validated job to a terminal RunResult. Implementations never
// throw for process-level failures and invoke the completion exactly once,
// asynchronously.
class IExecutor {
public:
    using Completion = std::function<void(RunResult)>;
    virtual ~IExecutor() = default;
    virtual void async_run(const Job& job, const RunTag& tag, Completion done) = 0;
};
