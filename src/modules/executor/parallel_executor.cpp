// modules/executor/parallel_executor.cpp
#include "modules/executor/parallel_executor.h"
#include "common/utils/logging.h"
#include "common/utils/template_renderer.h"
#include "common/utils/time_utils.h"
#include <algorithm>
#include <atomic>
#include <future>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>
#include <system_error>
#include <thread>

namespace ucop {

ParallelExecutor::ParallelExecutor(const StepRegistry& registry, ExecutorConfig config)
    : registry_(registry), config_(std::move(config)) {
    if (config_.max_concurrency == 0) {
        throw std::invalid_argument("max_concurrency must be at least 1");
    }
}

LevelResult ParallelExecutor::execute_level(const CompiledGraph& graph,
                                            const std::vector<StepId>& step_ids,
                                            std::shared_ptr<const Context> context,
                                            const JobId& job_id) const {
    std::vector<const CompiledStep*> steps;
    steps.reserve(step_ids.size());
    for (const auto& id : step_ids) {
        steps.push_back(&graph.step(id));
    }
    return execute_level(steps, std::move(context), job_id);
}

LevelResult ParallelExecutor::execute_level(const std::vector<const CompiledStep*>& steps,
                                            std::shared_ptr<const Context> context,
                                            const JobId& job_id) const {
    LevelResult level_result;
    if (steps.empty()) {
        return level_result;
    }
    if (!context) {
        context = std::make_shared<const Context>(Context::object());
    }

    // Exclusive steps without a tag take the level lock uniquely; everything
    // else shares it. Tagged steps additionally serialize on their tag.
    std::shared_mutex level_lock;
    std::map<std::string, std::mutex> tag_locks;
    for (const auto* step : steps) {
        if (step->spec.mutex_tag) {
            tag_locks[*step->spec.mutex_tag];
        }
    }

    std::vector<StepResult> results(steps.size());
    std::atomic<size_t> next{0};

    auto worker = [&]() {
        for (;;) {
            size_t index = next.fetch_add(1);
            if (index >= steps.size()) {
                return;
            }
            const CompiledStep& step = *steps[index];
            try {
                if (step.exclusive && !step.spec.mutex_tag) {
                    std::unique_lock<std::shared_mutex> exclusive(level_lock);
                    results[index] = run_step(step, context, job_id);
                } else if (step.spec.mutex_tag) {
                    std::shared_lock<std::shared_mutex> shared(level_lock);
                    std::lock_guard<std::mutex> tag(tag_locks.at(*step.spec.mutex_tag));
                    results[index] = run_step(step, context, job_id);
                } else {
                    std::shared_lock<std::shared_mutex> shared(level_lock);
                    results[index] = run_step(step, context, job_id);
                }
            } catch (const std::exception& e) {
                // e.g. no thread could be started for a timed attempt
                StepResult failed;
                failed.step_id = step.spec.id;
                failed.outcome = StepOutcome::FAILED;
                failed.error = std::string("Executor error: ") + e.what();
                failed.started_at = failed.finished_at = now();
                results[index] = std::move(failed);
                log_error("executor", "Step '" + step.spec.id + "': " + *results[index].error);
            }
        }
    };

    size_t worker_count = std::min(steps.size(), config_.max_concurrency);
    std::vector<std::thread> workers;
    workers.reserve(worker_count);
    try {
        for (size_t i = 0; i < worker_count; ++i) {
            workers.emplace_back(worker);
        }
    } catch (const std::system_error&) {
        // the workers already running still drain the queue
        for (auto& t : workers) t.join();
        throw;
    }
    for (auto& t : workers) {
        t.join();
    }

    for (auto& result : results) {
        StepId id = result.step_id;
        level_result.emplace(std::move(id), std::move(result));
    }
    return level_result;
}

StepResult ParallelExecutor::run_step(const CompiledStep& step, const std::shared_ptr<const Context>& context, const JobId& job_id) const {
    const StepSpec& spec = step.spec;

    StepResult result;
    result.step_id = spec.id;
    result.started_at = now();

    Value rendered_inputs;
    try {
        rendered_inputs = InjaTemplateRenderer::render_inputs(spec.inputs, *context);
    } catch (const std::exception& e) {
        result.outcome = StepOutcome::FAILED;
        result.error = std::string("Input rendering failed: ") + e.what();
        result.finished_at = now();
        log_warning("executor", "Step '" + spec.id + "': " + *result.error);
        return result;
    }

    std::optional<std::chrono::milliseconds> timeout = spec.timeout ? spec.timeout : config_.default_timeout;
    const int max_attempts = std::clamp(spec.retries, 0, kMaxStepRetries) + 1;

    for (int attempt = 1; attempt <= max_attempts; ++attempt) {
        result.attempts = attempt;

        std::unique_ptr<Step> instance;
        try {
            instance = registry_.create(spec.ref);
        } catch (const std::exception& e) {
            result.outcome = StepOutcome::FAILED;
            result.error = std::string("Cannot instantiate step: ") + e.what();
            break;
        }

        StepInput input;
        input.step_id = spec.id;
        input.ref = spec.ref;
        input.job_id = job_id;
        input.attempt = attempt;
        input.inputs = rendered_inputs;
        input.context = context;

        Attempt outcome = timeout ? run_with_timeout(std::move(instance), std::move(input), *timeout)
                                  : invoke(*instance, input);

        result.outcome = outcome.outcome;
        if (outcome.outcome == StepOutcome::SUCCEEDED) {
            result.output = std::move(outcome.output);
            result.error.reset();
            break;
        }
        result.error = outcome.error;

        if (attempt < max_attempts) {
            log_warning("executor", "Step '" + spec.id + "' attempt " + std::to_string(attempt) + "/" +
                                        std::to_string(max_attempts) + " " + to_string(outcome.outcome) +
                                        ": " + outcome.error + "; retrying");
            if (config_.retry_backoff.count() > 0) {
                std::this_thread::sleep_for(config_.retry_backoff);
            }
        }
    }

    result.finished_at = now();
    if (!result.succeeded()) {
        log_warning("executor", "Step '" + spec.id + "' " + to_string(result.outcome) + " after " +
                                    std::to_string(result.attempts) + " attempt(s): " + result.error.value_or(""));
    }
    return result;
}

ParallelExecutor::Attempt ParallelExecutor::run_with_timeout(std::unique_ptr<Step> instance, StepInput input, std::chrono::milliseconds timeout) {
    // Shared with the attempt thread, which may outlive this call
    struct AttemptState {
        std::promise<Attempt> promise;
        std::stop_source stop;
    };
    auto state = std::make_shared<AttemptState>();
    std::future<Attempt> future = state->promise.get_future();

    input.stop_token = state->stop.get_token();
    std::shared_ptr<Step> step(std::move(instance));
    std::thread([state, step, input = std::move(input)]() {
        state->promise.set_value(invoke(*step, input));
    }).detach();

    if (future.wait_for(timeout) == std::future_status::ready) {
        return future.get();
    }

    state->stop.request_stop();
    Attempt timed_out;
    timed_out.outcome = StepOutcome::TIMED_OUT;
    timed_out.error = "Step timed out after " + std::to_string(timeout.count()) + " ms";
    return timed_out;
}

ParallelExecutor::Attempt ParallelExecutor::invoke(Step& step, const StepInput& input) {
    Attempt attempt;
    try {
        attempt.output = step.execute(input);
        attempt.outcome = StepOutcome::SUCCEEDED;
    } catch (const std::exception& e) {
        attempt.outcome = StepOutcome::FAILED;
        attempt.error = e.what();
    } catch (...) {
        attempt.outcome = StepOutcome::FAILED;
        attempt.error = "unknown error";
    }
    return attempt;
}

} // namespace ucop
