#ifndef UCOP_CORE_TYPES_CONTEXT_H
#define UCOP_CORE_TYPES_CONTEXT_H

#include <nlohmann/json.hpp>
#include <chrono>
#include <string>

namespace ucop {

// Every piece of runtime data (inputs, step outputs, merged state) is a JSON value
using Value = nlohmann::json;
using Context = nlohmann::json;

using StepId = std::string;
using JobId = std::string;
using CheckpointId = std::string;

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

} // namespace ucop

#endif // UCOP_CORE_TYPES_CONTEXT_H
