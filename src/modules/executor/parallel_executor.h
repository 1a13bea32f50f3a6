// modules/executor/parallel_executor.h
#ifndef UCOP_MODULES_EXECUTOR_PARALLEL_EXECUTOR_H
#define UCOP_MODULES_EXECUTOR_PARALLEL_EXECUTOR_H

#include "core/types/context.h"
#include "core/types/job.h"
#include "core/types/step.h"
#include "core/types/workflow.h"
#include "common/steps/step_registry.h"
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ucop {

struct StepResult {
    StepId step_id;
    StepOutcome outcome = StepOutcome::FAILED;
    Value output;
    std::optional<std::string> error;
    int attempts = 0;             // 0 when the inputs could not be rendered
    Timestamp started_at;
    Timestamp finished_at;

    bool succeeded() const { return outcome == StepOutcome::SUCCEEDED; }
};

using LevelResult = std::map<StepId, StepResult>;

struct ExecutorConfig {
    size_t max_concurrency = 4;
    std::chrono::milliseconds retry_backoff{0};
    std::optional<std::chrono::milliseconds> default_timeout;   // used when a step has none
};

// Runs the steps of one level concurrently, at most max_concurrency at a time,
// and blocks until every step has succeeded, failed or timed out.
//
// A timed-out attempt gets its stop token signalled and is abandoned: the
// worker moves on at once and whatever the attempt returns later is dropped.
class ParallelExecutor {
public:
    explicit ParallelExecutor(const StepRegistry& registry, ExecutorConfig config = {});

    LevelResult execute_level(const std::vector<const CompiledStep*>& steps,
                              std::shared_ptr<const Context> context,
                              const JobId& job_id = {}) const;

    LevelResult execute_level(const CompiledGraph& graph,
                              const std::vector<StepId>& step_ids,
                              std::shared_ptr<const Context> context,
                              const JobId& job_id = {}) const;

    const ExecutorConfig& config() const { return config_; }

private:
    struct Attempt {
        StepOutcome outcome = StepOutcome::FAILED;
        Value output;
        std::string error;
    };

    const StepRegistry& registry_;
    ExecutorConfig config_;

    StepResult run_step(const CompiledStep& step, const std::shared_ptr<const Context>& context, const JobId& job_id) const;
    static Attempt run_with_timeout(std::unique_ptr<Step> instance, StepInput input, std::chrono::milliseconds timeout);
    static Attempt invoke(Step& step, const StepInput& input);
};

} // namespace ucop

#endif // UCOP_MODULES_EXECUTOR_PARALLEL_EXECUTOR_H
