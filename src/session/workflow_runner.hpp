#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include "core/config/workflow_catalog.hpp"
#include "core/errors/conductor_errors.hpp"
#include "protocol/event_contract.hpp"
#include "protocol/workflow_contract.hpp"
#include "runtime/agent_executor.hpp"
#include "runtime/agent_invoker.hpp"
#include "session/run_store.hpp"
#include "session/workflow_run.hpp"

namespace conductor::session {

struct RunnerOptions {
    core::config::WorkflowCatalog catalog = core::config::default_catalog();
    // When set, every transition is persisted and unknown run ids are looked
    // up on disk, so paused runs survive a restart.
    std::shared_ptr<RunStore> store;
    protocol::EventSink on_event;
};

// Caller-facing facade and owner of the run registry. Calls against the
// same run id are serialized by a per-run mutex; different runs proceed
// independently. With a store attached, submit_decision and cancel also hold
// the run's file lock and re-read its state, so runners in other processes
// sharing the state directory cannot apply the same decision twice.
//
// Event callbacks run on the thread driving the run. From a callback,
// get_status and cancel on that run are allowed; submit_decision returns
// InvalidTransition / run_busy.
class WorkflowRunner {
public:
    WorkflowRunner(std::shared_ptr<runtime::AgentInvoker> invoker,
                   RunnerOptions options = {});

    // Validates the topology configuration before any agent call, then drives
    // the run until it completes, fails or pauses. Agent failures do not
    // surface here: they are visible through get_status().
    core::errors::Result<std::string> start(protocol::Topology topology,
                                            const std::string& initial_input,
                                            const protocol::StartOptions& options = {});

    core::errors::Result<protocol::WorkflowRunSnapshot> get_status(
        const std::string& run_id) const;

    core::errors::Result<protocol::WorkflowRunSnapshot> submit_decision(
        const std::string& run_id, const std::string& request_id,
        protocol::Verdict verdict, const std::optional<std::string>& note = std::nullopt);

    // Paused runs fail immediately. Runs that are executing stop at the next
    // turn boundary, in which case Running is returned.
    core::errors::Result<protocol::RunStatus> cancel(const std::string& run_id);

    // Loads a persisted run into the registry (no-op if already loaded).
    core::errors::Result<protocol::WorkflowRunSnapshot> restore(const std::string& run_id);

    std::vector<std::string> list_runs() const;
    std::size_t run_count() const;

private:
    struct RunSlot {
        std::mutex mutex;
        WorkflowRun run;
        std::shared_ptr<std::atomic_bool> cancel_token;
        // Thread currently driving the run; default-constructed when idle.
        std::atomic<std::thread::id> driver{};
    };

    core::errors::Result<std::shared_ptr<RunSlot>> find_slot(const std::string& run_id) const;
    core::errors::Result<protocol::WorkflowDefinition> resolve_definition(
        protocol::Topology topology, const protocol::StartOptions& options) const;
    void drive(WorkflowRun& run) const;
    std::optional<core::errors::ConductorError> persist(const WorkflowRun& run) const;
    // Takes the run's file lock and re-reads its persisted state, so changes
    // made by other processes are seen. Holds nothing without a store.
    core::errors::Result<std::optional<RunFileLock>> claim(RunSlot& slot) const;
    std::optional<core::errors::ConductorError> reload(RunSlot& slot) const;
    Checkpoint checkpoint() const;
    void publish(const protocol::WorkflowEvent& event) const;
    protocol::EventSink sink() const;

    runtime::AgentExecutor executor_;
    RunnerOptions options_;
    mutable std::mutex registry_mutex_;
    mutable std::unordered_map<std::string, std::shared_ptr<RunSlot>> runs_;
};

}  // namespace conductor::session
