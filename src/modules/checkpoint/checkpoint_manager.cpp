// modules/checkpoint/checkpoint_manager.cpp
#include "modules/checkpoint/checkpoint_manager.h"
#include "core/types/errors.h"
#include "common/utils/logging.h"
#include "common/utils/time_utils.h"
#include <algorithm>
#include <fstream>
#include <sstream>

namespace ucop {

namespace fs = std::filesystem;

namespace {

constexpr const char* kExtension = ".json";

void validate_job_id(const JobId& job_id) {
    if (job_id.empty() || job_id == "." || job_id == ".." || job_id.front() == '.' ||
        job_id.find('/') != std::string::npos || job_id.find('\\') != std::string::npos) {
        throw StorageError("Job id is not usable as a checkpoint directory name: '" + job_id + "'");
    }
}

bool newer_first(const Checkpoint& a, const Checkpoint& b) {
    if (a.created_at != b.created_at) return a.created_at > b.created_at;
    return a.sequence > b.sequence;
}

} // namespace

// ————————————————————————
// JSON encoding
// ————————————————————————

nlohmann::json snapshot_to_json(const JobSnapshot& snapshot) {
    nlohmann::json failed = nlohmann::json::object();
    for (const auto& [id, failure] : snapshot.failed_steps) {
        failed[id] = {{"error", failure.error}, {"code", to_string(failure.code)}};
    }
    nlohmann::json outputs = nlohmann::json::object();
    for (const auto& [id, output] : snapshot.outputs) {
        outputs[id] = output;
    }
    return {
        {"workflow_id", snapshot.workflow_id},
        {"workflow_version", snapshot.workflow_version},
        {"status", to_string(snapshot.status)},
        {"next_level", snapshot.next_level},
        {"inputs", snapshot.inputs},
        {"completed_steps", snapshot.completed_steps},
        {"failed_steps", std::move(failed)},
        {"skipped_steps", snapshot.skipped_steps},
        {"outputs", std::move(outputs)}
    };
}

JobSnapshot snapshot_from_json(const nlohmann::json& j) {
    JobSnapshot snapshot;
    snapshot.workflow_id = j.at("workflow_id").get<std::string>();
    snapshot.workflow_version = j.at("workflow_version").get<std::string>();

    auto status = job_status_from_string(j.at("status").get<std::string>());
    if (!status) {
        throw std::runtime_error("Unknown job status in snapshot: " + j.at("status").dump());
    }
    snapshot.status = *status;
    snapshot.next_level = j.at("next_level").get<size_t>();
    snapshot.inputs = j.value("inputs", nlohmann::json::object());
    snapshot.completed_steps = j.at("completed_steps").get<std::set<StepId>>();
    snapshot.skipped_steps = j.value("skipped_steps", std::set<StepId>{});

    if (j.contains("failed_steps")) {
        for (auto it = j["failed_steps"].begin(); it != j["failed_steps"].end(); ++it) {
            StepFailure failure;
            failure.error = it.value().value("error", std::string{});
            failure.code = it.value().value("code", std::string{}) == to_string(ErrorCode::STEP_TIMEOUT)
                               ? ErrorCode::STEP_TIMEOUT
                               : ErrorCode::STEP_FAILURE;
            snapshot.failed_steps.emplace(it.key(), std::move(failure));
        }
    }
    for (auto it = j.at("outputs").begin(); it != j.at("outputs").end(); ++it) {
        snapshot.outputs.emplace(it.key(), it.value());
    }
    return snapshot;
}

nlohmann::json checkpoint_to_json(const Checkpoint& checkpoint) {
    return {
        {"id", checkpoint.id},
        {"job_id", checkpoint.job_id},
        {"marker", checkpoint.marker},
        {"created_at", to_iso8601(checkpoint.created_at)},
        {"created_at_us", to_epoch_micros(checkpoint.created_at)},
        {"sequence", checkpoint.sequence},
        {"snapshot", snapshot_to_json(checkpoint.snapshot)}
    };
}

Checkpoint checkpoint_from_json(const nlohmann::json& j) {
    Checkpoint checkpoint;
    checkpoint.id = j.at("id").get<std::string>();
    checkpoint.job_id = j.at("job_id").get<std::string>();
    checkpoint.marker = j.value("marker", std::string{});
    checkpoint.created_at = from_epoch_micros(j.at("created_at_us").get<int64_t>());
    checkpoint.sequence = j.value("sequence", uint64_t{0});
    checkpoint.snapshot = snapshot_from_json(j.at("snapshot"));
    return checkpoint;
}

// ————————————————————————
// CheckpointManager
// ————————————————————————

CheckpointManager::CheckpointManager(fs::path root)
    : root_(std::move(root)) {}

fs::path CheckpointManager::job_dir(const JobId& job_id) const {
    validate_job_id(job_id);
    return root_ / job_id;
}

CheckpointId CheckpointManager::save(const JobId& job_id, const JobSnapshot& snapshot, const std::string& marker) {
    fs::path dir = job_dir(job_id);

    std::lock_guard<std::mutex> lock(mutex_);

    auto seq_it = last_sequence_.find(job_id);
    if (seq_it == last_sequence_.end()) {
        uint64_t highest = 0;
        for (const auto& existing : read_all(job_id)) {
            highest = std::max(highest, existing.sequence);
        }
        seq_it = last_sequence_.emplace(job_id, highest).first;
    }

    Checkpoint checkpoint;
    checkpoint.id = generate_id("cp");
    checkpoint.job_id = job_id;
    checkpoint.marker = marker.empty() ? "level_" + std::to_string(snapshot.next_level) : marker;
    checkpoint.created_at = now();
    checkpoint.sequence = seq_it->second + 1;
    checkpoint.snapshot = snapshot;

    const std::string data = checkpoint_to_json(checkpoint).dump(2);

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw StorageError("Cannot create checkpoint directory '" + dir.string() + "': " + ec.message());
    }

    const fs::path final_path = dir / (checkpoint.id + kExtension);
    const fs::path temp_path = dir / ("." + checkpoint.id + kExtension + ".tmp");
    {
        std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw StorageError("Cannot open checkpoint file '" + temp_path.string() + "' for writing");
        }
        out << data;
        out.flush();
        if (!out) {
            out.close();
            fs::remove(temp_path, ec);
            throw StorageError("Failed writing checkpoint file '" + temp_path.string() + "'");
        }
    }

    fs::rename(temp_path, final_path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(temp_path, ignored);
        throw StorageError("Cannot move checkpoint into place at '" + final_path.string() + "': " + ec.message());
    }

    seq_it->second = checkpoint.sequence;
    log_debug("checkpoint", "Saved " + checkpoint.id + " (" + checkpoint.marker + ") for job " + job_id);
    return checkpoint.id;
}

Checkpoint CheckpointManager::read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw StorageError("Cannot open checkpoint file '" + path.string() + "'");
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return checkpoint_from_json(nlohmann::json::parse(buffer.str()));
}

std::vector<Checkpoint> CheckpointManager::read_all(const JobId& job_id) const {
    std::vector<Checkpoint> checkpoints;
    fs::path dir = job_dir(job_id);

    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return checkpoints;
    }

    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        const fs::path& path = it->path();
        const std::string name = path.filename().string();
        if (name.empty() || name.front() == '.' || path.extension() != kExtension || !it->is_regular_file()) {
            continue;
        }
        try {
            checkpoints.push_back(read_file(path));
        } catch (const std::exception& e) {
            log_warning("checkpoint", "Skipping unreadable checkpoint '" + path.string() + "': " + e.what());
        }
    }
    if (ec) {
        throw StorageError("Cannot list checkpoints of job " + job_id + ": " + ec.message());
    }

    std::sort(checkpoints.begin(), checkpoints.end(), newer_first);
    return checkpoints;
}

std::vector<Checkpoint> CheckpointManager::list(const JobId& job_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return read_all(job_id);
}

std::optional<Checkpoint> CheckpointManager::latest(const JobId& job_id) const {
    auto all = list(job_id);
    if (all.empty()) {
        return std::nullopt;
    }
    return all.front();
}

std::optional<fs::path> CheckpointManager::find_file(const CheckpointId& checkpoint_id) const {
    if (checkpoint_id.empty() || checkpoint_id.find('/') != std::string::npos || checkpoint_id.front() == '.') {
        return std::nullopt;
    }
    std::error_code ec;
    if (!fs::is_directory(root_, ec)) {
        return std::nullopt;
    }
    for (fs::directory_iterator it(root_, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_directory()) continue;
        fs::path candidate = it->path() / (checkpoint_id + kExtension);
        if (fs::is_regular_file(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

Checkpoint CheckpointManager::get(const CheckpointId& checkpoint_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto path = find_file(checkpoint_id);
    if (!path) {
        throw CheckpointNotFound("Checkpoint not found: " + checkpoint_id);
    }
    try {
        return read_file(*path);
    } catch (const StorageError&) {
        throw;
    } catch (const std::exception& e) {
        throw StorageError("Checkpoint " + checkpoint_id + " is corrupt: " + e.what());
    }
}

JobSnapshot CheckpointManager::restore(const CheckpointId& checkpoint_id, const CompiledGraph* current_graph) const {
    Checkpoint checkpoint = get(checkpoint_id);
    if (current_graph != nullptr) {
        check_compatibility(checkpoint, *current_graph);
    }
    return checkpoint.snapshot;
}

void CheckpointManager::check_compatibility(const Checkpoint& checkpoint, const CompiledGraph& graph) {
    const JobSnapshot& snapshot = checkpoint.snapshot;
    const std::string where = "Checkpoint " + checkpoint.id + ": ";

    if (snapshot.workflow_id != graph.workflow_id) {
        throw VersionMismatch(where + "taken for workflow '" + snapshot.workflow_id +
                              "', not '" + graph.workflow_id + "'");
    }
    if (snapshot.next_level > graph.level_count()) {
        throw VersionMismatch(where + "next level " + std::to_string(snapshot.next_level) +
                              " exceeds the " + std::to_string(graph.level_count()) + " levels of v" + graph.version);
    }

    auto require_step = [&](const StepId& id) {
        if (!graph.has_step(id)) {
            throw VersionMismatch(where + "step '" + id + "' does not exist in workflow '" +
                                  graph.workflow_id + "' v" + graph.version);
        }
    };
    for (const auto& id : snapshot.completed_steps) require_step(id);
    for (const auto& [id, _] : snapshot.failed_steps) require_step(id);
    for (const auto& id : snapshot.skipped_steps) require_step(id);
    for (const auto& [id, _] : snapshot.outputs) require_step(id);

    for (size_t level = 0; level < snapshot.next_level; ++level) {
        for (const auto& id : graph.levels[level]) {
            bool accounted = snapshot.completed_steps.count(id) || snapshot.failed_steps.count(id) ||
                             snapshot.skipped_steps.count(id);
            if (!accounted) {
                throw VersionMismatch(where + "step '" + id + "' of level " + std::to_string(level) +
                                      " has no recorded result");
            }
        }
    }

    if (snapshot.workflow_version != graph.version) {
        log_info("checkpoint", where + "restoring v" + snapshot.workflow_version + " state onto v" + graph.version);
    }
}

CleanupResult CheckpointManager::cleanup(const JobId& job_id, size_t keep_last) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Checkpoint> checkpoints = read_all(job_id);

    CleanupResult result;
    if (checkpoints.size() <= keep_last) {
        result.kept = checkpoints.size();
        return result;
    }

    const fs::path dir = job_dir(job_id);
    // oldest first
    for (size_t i = checkpoints.size(); i-- > keep_last;) {
        std::error_code ec;
        if (fs::remove(dir / (checkpoints[i].id + kExtension), ec)) {
            ++result.deleted;
        } else {
            log_warning("checkpoint", "Cannot delete checkpoint " + checkpoints[i].id + ": " +
                                          (ec ? ec.message() : std::string("file vanished")));
        }
    }
    result.kept = checkpoints.size() - result.deleted;
    log_debug("checkpoint", "Cleanup of job " + job_id + ": kept " + std::to_string(result.kept) +
                                ", deleted " + std::to_string(result.deleted));
    return result;
}

size_t CheckpointManager::remove_job(const JobId& job_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = read_all(job_id).size();

    std::error_code ec;
    fs::remove_all(job_dir(job_id), ec);
    if (ec) {
        throw StorageError("Cannot remove checkpoints of job " + job_id + ": " + ec.message());
    }
    last_sequence_.erase(job_id);
    return count;
}

} // namespace ucop
