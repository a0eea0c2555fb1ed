#include "session/run_store.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>
#include <fstream>
#include <sstream>
#include <utility>
#include <nlohmann/json.hpp>
#include "protocol/json_codec.hpp"

namespace conductor::session {

using core::errors::ConductorError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

constexpr const char* kRunSuffix = ".json";
constexpr const char* kJournalSuffix = ".events.jsonl";
constexpr const char* kLockSuffix = ".lock";

std::int64_t now_unix_ms() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch())
                        .count();
    return static_cast<std::int64_t>(ms);
}

bool ends_with(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Run ids become file names, so keep them to a safe alphabet.
bool is_valid_run_id(const std::string& run_id) {
    if (run_id.empty()) {
        return false;
    }
    return std::all_of(run_id.begin(), run_id.end(), [](const char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
               (c >= '0' && c <= '9') || c == '-' || c == '_';
    });
}

}  // namespace

RunFileLock::~RunFileLock() { release(); }

RunFileLock& RunFileLock::operator=(RunFileLock&& other) noexcept {
    if (this != &other) {
        release();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

void RunFileLock::release() {
    if (fd_ >= 0) {
        static_cast<void>(flock(fd_, LOCK_UN));
        static_cast<void>(close(fd_));
        fd_ = -1;
    }
}

RunStore::RunStore(std::filesystem::path state_dir)
    : state_dir_(std::move(state_dir)) {}

core::errors::Result<std::filesystem::path> RunStore::ensure_state_dir() const {
    std::error_code ec;
    std::filesystem::create_directories(state_dir_, ec);
    if (ec) {
        return ConductorError{ErrorCategory::Internal,
                              "Unable to create state directory: " +
                                  state_dir_.string(),
                              "state_dir_create_failed"};
    }
    if (!std::filesystem::is_directory(state_dir_, ec) || ec) {
        return ConductorError{ErrorCategory::Internal,
                              "State path is not a directory: " + state_dir_.string(),
                              "state_dir_create_failed"};
    }
    return state_dir_;
}

core::errors::Result<std::filesystem::path> RunStore::run_file_path(
    const std::string& run_id) const {
    if (!is_valid_run_id(run_id)) {
        return ConductorError{ErrorCategory::Input, "Invalid run ID: '" + run_id + "'",
                              "invalid_run_id"};
    }
    return state_dir_ / (run_id + kRunSuffix);
}

core::errors::Result<std::filesystem::path> RunStore::journal_path(
    const std::string& run_id) const {
    if (!is_valid_run_id(run_id)) {
        return ConductorError{ErrorCategory::Input, "Invalid run ID: '" + run_id + "'",
                              "invalid_run_id"};
    }
    return state_dir_ / (run_id + kJournalSuffix);
}

core::errors::Result<std::filesystem::path> RunStore::save(const WorkflowRun& run) const {
    auto dir = ensure_state_dir();
    if (core::errors::is_error(dir)) {
        return core::errors::get_error(dir);
    }
    auto path_result = run_file_path(run.id);
    if (core::errors::is_error(path_result)) {
        return core::errors::get_error(path_result);
    }
    const auto run_path = core::errors::get_value(path_result);

    json document = protocol::to_json(run.snapshot());
    document["definition"] = protocol::to_json(run.definition);
    document["saved_at"] = now_unix_ms();

    // Write to a sibling file first so a crash never leaves a torn document.
    auto temp_path = run_path;
    temp_path += ".tmp";
    {
        std::ofstream out(temp_path, std::ios::trunc);
        if (!out.is_open()) {
            return ConductorError{ErrorCategory::Internal,
                                  "Unable to open state file: " + temp_path.string(),
                                  "state_write_failed"};
        }
        out << document.dump(2, ' ', false, json::error_handler_t::replace) << "\n";
        if (!out.good()) {
            return ConductorError{ErrorCategory::Internal,
                                  "Unable to write state file: " + temp_path.string(),
                                  "state_write_failed"};
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp_path, run_path, ec);
    if (ec) {
        std::filesystem::remove(temp_path, ec);
        return ConductorError{ErrorCategory::Internal,
                              "Unable to replace state file: " + run_path.string(),
                              "state_write_failed"};
    }
    return run_path;
}

core::errors::Result<WorkflowRun> RunStore::load(const std::string& run_id) const {
    auto path_result = run_file_path(run_id);
    if (core::errors::is_error(path_result)) {
        return core::errors::get_error(path_result);
    }
    const auto run_path = core::errors::get_value(path_result);

    std::error_code ec;
    if (!std::filesystem::exists(run_path, ec) || ec) {
        return ConductorError{ErrorCategory::Input, "Run ID not found: " + run_id,
                              "run_not_found"};
    }

    std::ifstream in(run_path);
    if (!in.is_open()) {
        return ConductorError{ErrorCategory::Internal,
                              "Unable to open state file: " + run_path.string(),
                              "state_read_failed"};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();

    const json document = json::parse(buffer.str(), nullptr, false);
    if (document.is_discarded()) {
        return ConductorError{ErrorCategory::Internal,
                              "State file is not valid JSON: " + run_path.string(),
                              "state_read_failed"};
    }

    auto snapshot_result = protocol::snapshot_from_json(document);
    if (core::errors::is_error(snapshot_result)) {
        return core::errors::get_error(snapshot_result);
    }
    auto snapshot = core::errors::get_value(snapshot_result);
    if (snapshot.run_id != run_id) {
        return ConductorError{ErrorCategory::Internal,
                              "State file " + run_path.string() + " holds run " +
                                  snapshot.run_id,
                              "state_read_failed"};
    }

    WorkflowRun run;
    run.id = snapshot.run_id;
    run.topology = snapshot.topology;
    run.status = snapshot.status;
    run.pending_request = snapshot.pending_request;
    run.error = snapshot.error;

    if (document.contains("definition")) {
        auto definition = protocol::definition_from_json(document.at("definition"));
        if (core::errors::is_error(definition)) {
            return core::errors::get_error(definition);
        }
        run.definition = core::errors::get_value(definition);
    }

    auto transcript = ConversationState::restore(std::move(snapshot.transcript),
                                                 protocol::is_terminal(run.status));
    if (core::errors::is_error(transcript)) {
        return core::errors::get_error(transcript);
    }
    run.transcript = std::move(core::errors::get_value(transcript));
    return run;
}

core::errors::Result<std::filesystem::path> RunStore::append_event(
    const protocol::WorkflowEvent& event) const {
    auto dir = ensure_state_dir();
    if (core::errors::is_error(dir)) {
        return core::errors::get_error(dir);
    }
    auto path_result = journal_path(event.run_id);
    if (core::errors::is_error(path_result)) {
        return core::errors::get_error(path_result);
    }
    const auto journal = core::errors::get_value(path_result);

    json line = protocol::to_json(event);
    line["ts_unix_ms"] = now_unix_ms();

    std::ofstream out(journal, std::ios::app);
    if (!out.is_open()) {
        return ConductorError{ErrorCategory::Internal,
                              "Unable to open journal: " + journal.string(),
                              "journal_open_failed"};
    }
    out << line.dump(-1, ' ', false, json::error_handler_t::replace) << "\n";
    if (!out.good()) {
        return ConductorError{ErrorCategory::Internal,
                              "Unable to write journal event: " + journal.string(),
                              "journal_write_failed"};
    }
    return journal;
}

core::errors::Result<std::vector<std::string>> RunStore::list_run_ids() const {
    std::vector<std::string> ids;
    std::error_code ec;
    if (!std::filesystem::exists(state_dir_, ec) || ec) {
        return ids;
    }

    for (const auto& entry : std::filesystem::directory_iterator(state_dir_, ec)) {
        if (!entry.is_regular_file(ec) || ec) {
            continue;
        }
        const std::string name = entry.path().filename().string();
        if (!ends_with(name, kRunSuffix) || ends_with(name, kJournalSuffix)) {
            continue;
        }
        ids.push_back(name.substr(0, name.size() - std::string(kRunSuffix).size()));
    }
    if (ec) {
        return ConductorError{ErrorCategory::Internal,
                              "Unable to list state directory: " + state_dir_.string(),
                              "state_read_failed"};
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

core::errors::Result<RunFileLock> RunStore::lock(const std::string& run_id) const {
    auto dir = ensure_state_dir();
    if (core::errors::is_error(dir)) {
        return core::errors::get_error(dir);
    }
    auto path_result = run_file_path(run_id);
    if (core::errors::is_error(path_result)) {
        return core::errors::get_error(path_result);
    }
    const auto lock_path = state_dir_ / (run_id + kLockSuffix);

    const int fd = open(lock_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        return ConductorError{ErrorCategory::Internal,
                              "Unable to open lock file: " + lock_path.string(),
                              "state_lock_failed"};
    }
    int rc = 0;
    do {
        rc = flock(fd, LOCK_EX);
    } while (rc != 0 && errno == EINTR);
    if (rc != 0) {
        static_cast<void>(close(fd));
        return ConductorError{ErrorCategory::Internal,
                              "Unable to lock run " + run_id, "state_lock_failed"};
    }
    return RunFileLock(fd);
}

}  // namespace conductor::session
