#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "core/errors/conductor_errors.hpp"
#include "protocol/event_contract.hpp"
#include "session/workflow_run.hpp"

namespace conductor::session {

// Exclusive advisory lock (flock) on <state_dir>/<run_id>.lock, released when
// the object is destroyed. A separate file is used because save() replaces
// the state file by rename, which would orphan a lock held on it.
class RunFileLock {
public:
    RunFileLock() = default;
    explicit RunFileLock(int fd) : fd_(fd) {}
    ~RunFileLock();

    RunFileLock(RunFileLock&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
    RunFileLock& operator=(RunFileLock&& other) noexcept;
    RunFileLock(const RunFileLock&) = delete;
    RunFileLock& operator=(const RunFileLock&) = delete;

private:
    void release();

    int fd_ = -1;
};

// File-backed persistence for runs: one JSON document per run
// (<state_dir>/<run_id>.json) plus an append-only event journal
// (<state_dir>/<run_id>.events.jsonl).
class RunStore {
public:
    explicit RunStore(std::filesystem::path state_dir);

    core::errors::Result<std::filesystem::path> save(const WorkflowRun& run) const;
    core::errors::Result<WorkflowRun> load(const std::string& run_id) const;
    core::errors::Result<std::filesystem::path> append_event(
        const protocol::WorkflowEvent& event) const;
    core::errors::Result<std::vector<std::string>> list_run_ids() const;

    // Blocks until no other holder (thread or process) has the run locked.
    core::errors::Result<RunFileLock> lock(const std::string& run_id) const;

    core::errors::Result<std::filesystem::path> run_file_path(
        const std::string& run_id) const;
    core::errors::Result<std::filesystem::path> journal_path(
        const std::string& run_id) const;

    const std::filesystem::path& state_dir() const { return state_dir_; }

private:
    core::errors::Result<std::filesystem::path> ensure_state_dir() const;

    std::filesystem::path state_dir_;
};

}  // namespace conductor::session
