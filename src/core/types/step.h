#ifndef UCOP_CORE_TYPES_STEP_H
#define UCOP_CORE_TYPES_STEP_H

#include "context.h"
#include <functional>
#include <memory>
#include <stop_token>
#include <string>

namespace ucop {

using StopToken = std::stop_token;

// What one attempt of a step gets to see
struct StepInput {
    StepId step_id;
    std::string ref;
    JobId job_id;
    int attempt = 1;
    Value inputs = Value::object();                 // rendered templates
    std::shared_ptr<const Context> context;         // {"job_id", "inputs", "outputs", "state"}
    StopToken stop_token;

    const Context& view() const {
        static const Context empty = Context::object();
        return context ? *context : empty;
    }

    bool stop_requested() const { return stop_token.stop_requested(); }
};

// Uniform interface for every executable unit; one instance serves one attempt
class Step {
public:
    virtual ~Step() = default;
    [[nodiscard]] virtual Value execute(const StepInput& input) = 0;
};

using StepFactory = std::function<std::unique_ptr<Step>()>;
using StepFunction = std::function<Value(const StepInput&)>;

} // namespace ucop

#endif // UCOP_CORE_TYPES_STEP_H
