// modules/checkpoint/checkpoint_manager.h
#ifndef UCOP_MODULES_CHECKPOINT_CHECKPOINT_MANAGER_H
#define UCOP_MODULES_CHECKPOINT_CHECKPOINT_MANAGER_H

#include "core/types/checkpoint.h"
#include "core/types/workflow.h"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ucop {

// Durable job snapshots, stored as <root>/<job_id>/<checkpoint_id>.json.
// A checkpoint file appears only once fully written (temp file + rename).
class CheckpointManager {
public:
    explicit CheckpointManager(std::filesystem::path root);

    // Throws StorageError; nothing is visible to list/restore on failure.
    // An empty marker becomes "level_<next_level>".
    CheckpointId save(const JobId& job_id, const JobSnapshot& snapshot, const std::string& marker = {});

    // Most recent first, by (created_at, sequence)
    std::vector<Checkpoint> list(const JobId& job_id) const;
    std::optional<Checkpoint> latest(const JobId& job_id) const;

    Checkpoint get(const CheckpointId& checkpoint_id) const;   // throws CheckpointNotFound

    // With a graph, throws VersionMismatch when the snapshot cannot continue on it
    JobSnapshot restore(const CheckpointId& checkpoint_id, const CompiledGraph* current_graph = nullptr) const;

    // Deletes all but the keep_last most recent, oldest first
    CleanupResult cleanup(const JobId& job_id, size_t keep_last);

    size_t remove_job(const JobId& job_id);

    const std::filesystem::path& root() const { return root_; }

    static void check_compatibility(const Checkpoint& checkpoint, const CompiledGraph& graph);

private:
    std::filesystem::path root_;
    mutable std::mutex mutex_;
    std::map<JobId, uint64_t> last_sequence_;

    std::filesystem::path job_dir(const JobId& job_id) const;
    std::vector<Checkpoint> read_all(const JobId& job_id) const;
    std::optional<std::filesystem::path> find_file(const CheckpointId& checkpoint_id) const;
    static Checkpoint read_file(const std::filesystem::path& path);
};

nlohmann::json snapshot_to_json(const JobSnapshot& snapshot);
JobSnapshot snapshot_from_json(const nlohmann::json& j);
nlohmann::json checkpoint_to_json(const Checkpoint& checkpoint);
Checkpoint checkpoint_from_json(const nlohmann::json& j);

} // namespace ucop

#endif // UCOP_MODULES_CHECKPOINT_CHECKPOINT_MANAGER_H
