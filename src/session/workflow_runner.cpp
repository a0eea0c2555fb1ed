#include "session/workflow_runner.hpp"

#include <algorithm>
#include <utility>
#include "core/config/run_id.hpp"
#include "core/logging/logger.hpp"
#include "runtime/human_in_loop_orchestrator.hpp"
#include "runtime/round_robin_orchestrator.hpp"
#include "runtime/sequential_orchestrator.hpp"
#include "runtime/turn_driver.hpp"

namespace conductor::session {

using core::errors::ConductorError;
using core::errors::ErrorCategory;
using protocol::EventType;
using protocol::RunStatus;
using protocol::Topology;
using protocol::WorkflowRunSnapshot;

namespace {

runtime::ExecutorOptions executor_options(const core::config::WorkflowCatalog& catalog) {
    runtime::ExecutorOptions options;
    options.max_attempts = catalog.max_attempts;
    options.timeout_ms = catalog.timeout_ms;
    return options;
}

// Marks the calling thread as the run's driver for the guarded scope.
class DriverGuard {
public:
    explicit DriverGuard(std::atomic<std::thread::id>& driver) : driver_(driver) {
        driver_.store(std::this_thread::get_id());
    }
    ~DriverGuard() { driver_.store(std::thread::id()); }

    DriverGuard(const DriverGuard&) = delete;
    DriverGuard& operator=(const DriverGuard&) = delete;

private:
    std::atomic<std::thread::id>& driver_;
};

}  // namespace

WorkflowRunner::WorkflowRunner(std::shared_ptr<runtime::AgentInvoker> invoker,
                               RunnerOptions options)
    : executor_(std::move(invoker), executor_options(options.catalog)),
      options_(std::move(options)) {}

void WorkflowRunner::publish(const protocol::WorkflowEvent& event) const {
    if (options_.store) {
        auto journal = options_.store->append_event(event);
        if (core::errors::is_error(journal)) {
            LOG_WARN("WorkflowRunner: journal write failed " +
                     core::errors::format_error(core::errors::get_error(journal)));
        }
    }
    if (options_.on_event) {
        options_.on_event(event);
    }
}

protocol::EventSink WorkflowRunner::sink() const {
    return [this](const protocol::WorkflowEvent& event) { publish(event); };
}

std::optional<ConductorError> WorkflowRunner::persist(const WorkflowRun& run) const {
    if (!options_.store) {
        return std::nullopt;
    }
    auto saved = options_.store->save(run);
    if (core::errors::is_error(saved)) {
        const auto& err = core::errors::get_error(saved);
        LOG_ERROR("WorkflowRunner: failed to persist run " + run.id + " " +
                  core::errors::format_error(err));
        return err;
    }
    return std::nullopt;
}

Checkpoint WorkflowRunner::checkpoint() const {
    return [this](const WorkflowRun& run) { return persist(run); };
}

core::errors::Result<std::optional<RunFileLock>> WorkflowRunner::claim(RunSlot& slot) const {
    std::optional<RunFileLock> file_lock;
    if (!options_.store) {
        return file_lock;
    }
    auto locked = options_.store->lock(slot.run.id);
    if (core::errors::is_error(locked)) {
        return core::errors::get_error(locked);
    }
    file_lock.emplace(std::move(core::errors::get_value(locked)));
    if (auto reload_error = reload(slot)) {
        return reload_error.value();
    }
    return std::move(file_lock);
}

std::optional<ConductorError> WorkflowRunner::reload(RunSlot& slot) const {
    auto loaded = options_.store->load(slot.run.id);
    if (core::errors::is_error(loaded)) {
        const auto& err = core::errors::get_error(loaded);
        LOG_ERROR("WorkflowRunner: failed to reload run " + slot.run.id + " " +
                  core::errors::format_error(err));
        return err;
    }
    WorkflowRun fresh = std::move(core::errors::get_value(loaded));
    fresh.cancel_token = slot.cancel_token;
    slot.run = std::move(fresh);
    return std::nullopt;
}

core::errors::Result<protocol::WorkflowDefinition> WorkflowRunner::resolve_definition(
    const Topology topology, const protocol::StartOptions& options) const {
    protocol::WorkflowDefinition definition = options_.catalog.definition_for(topology);

    std::optional<ConductorError> invalid;
    switch (topology) {
        case Topology::Sequential:
            invalid = runtime::SequentialOrchestrator::validate(definition);
            break;
        case Topology::HumanInLoop:
            invalid = runtime::HumanInLoopOrchestrator::validate(definition);
            break;
        case Topology::RoundRobin:
            if (options.round_count.has_value()) {
                definition.round_count = options.round_count.value();
            }
            invalid = runtime::RoundRobinOrchestrator::validate(definition);
            break;
    }

    if (topology != Topology::RoundRobin && options.round_count.has_value()) {
        invalid = ConductorError{ErrorCategory::InvalidConfiguration,
                                 "round_count only applies to round-robin workflows.",
                                 "unsupported_option"};
    }
    if (invalid.has_value()) {
        return invalid.value();
    }
    return definition;
}

void WorkflowRunner::drive(WorkflowRun& run) const {
    switch (run.topology) {
        case Topology::Sequential: {
            const runtime::SequentialOrchestrator orchestrator(executor_, sink(),
                                                               checkpoint());
            orchestrator.run(run);
            break;
        }
        case Topology::HumanInLoop: {
            const runtime::HumanInLoopOrchestrator orchestrator(executor_, sink(),
                                                                checkpoint());
            auto started = orchestrator.start(run);
            if (core::errors::is_error(started)) {
                const runtime::TurnDriver driver(executor_, sink(), "WorkflowRunner");
                driver.fail(run, core::errors::get_error(started));
            }
            break;
        }
        case Topology::RoundRobin: {
            const runtime::RoundRobinOrchestrator orchestrator(executor_, sink(),
                                                               checkpoint());
            orchestrator.run(run);
            break;
        }
    }
}

core::errors::Result<std::string> WorkflowRunner::start(
    const Topology topology, const std::string& initial_input,
    const protocol::StartOptions& options) {
    if (initial_input.empty()) {
        return ConductorError{ErrorCategory::Input, "Initial input cannot be empty.",
                              "empty_input"};
    }

    auto definition = resolve_definition(topology, options);
    if (core::errors::is_error(definition)) {
        return core::errors::get_error(definition);
    }

    auto slot = std::make_shared<RunSlot>();
    std::unique_lock<std::mutex> run_lock(slot->mutex);
    slot->cancel_token = slot->run.cancel_token;
    DriverGuard driving(slot->driver);
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        constexpr int kMaxAttempts = 16;
        for (int attempt = 0; attempt < kMaxAttempts && slot->run.id.empty(); ++attempt) {
            const std::string run_id = core::config::generate_run_id();
            if (runs_.find(run_id) != runs_.end()) {
                continue;
            }
            if (options_.store) {
                auto existing = options_.store->load(run_id);
                if (!core::errors::is_error(existing)) {
                    continue;
                }
            }
            slot->run.id = run_id;
        }
        if (slot->run.id.empty()) {
            return ConductorError{ErrorCategory::Internal,
                                  "Unable to allocate unique run ID.",
                                  "run_id_generation_failed"};
        }
        runs_.emplace(slot->run.id, slot);
    }

    WorkflowRun& run = slot->run;
    core::logging::ScopedRunId scoped(run.id);

    run.topology = topology;
    run.definition = std::move(core::errors::get_value(definition));
    const std::string seed =
        topology == Topology::RoundRobin
            ? runtime::RoundRobinOrchestrator::frame_topic(run.definition, initial_input)
            : initial_input;
    auto seeded = run.transcript.append("user", protocol::Role::User, seed);
    if (core::errors::is_error(seeded)) {
        return core::errors::get_error(seeded);
    }

    LOG_INFO("WorkflowRunner: run " + run.id + " started (" +
             protocol::to_string(topology) + ")");
    // On disk before the first agent call, so a crash mid-run leaves a record.
    if (auto persist_error = persist(run)) {
        const runtime::TurnDriver driver(executor_, sink(), "WorkflowRunner");
        driver.fail(run, persist_error.value());
        return persist_error.value();
    }
    publish(protocol::WorkflowEvent{run.id, EventType::RunStarted, "", 0, seed});

    drive(run);

    if (auto persist_error = persist(run)) {
        return persist_error.value();
    }
    return run.id;
}

core::errors::Result<std::shared_ptr<WorkflowRunner::RunSlot>> WorkflowRunner::find_slot(
    const std::string& run_id) const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto it = runs_.find(run_id);
    if (it != runs_.end()) {
        return it->second;
    }
    if (!options_.store) {
        return ConductorError{ErrorCategory::Input, "Run ID not found: " + run_id,
                              "run_not_found"};
    }

    auto loaded = options_.store->load(run_id);
    if (core::errors::is_error(loaded)) {
        return core::errors::get_error(loaded);
    }
    auto slot = std::make_shared<RunSlot>();
    slot->run = std::move(core::errors::get_value(loaded));
    slot->cancel_token = slot->run.cancel_token;
    runs_.emplace(run_id, slot);
    LOG_INFO("WorkflowRunner: restored run " + run_id + " (" +
             protocol::to_string(slot->run.status) + ")");
    return slot;
}

core::errors::Result<WorkflowRunSnapshot> WorkflowRunner::get_status(
    const std::string& run_id) const {
    auto slot_result = find_slot(run_id);
    if (core::errors::is_error(slot_result)) {
        return core::errors::get_error(slot_result);
    }
    const auto slot = core::errors::get_value(slot_result);
    if (slot->driver.load() == std::this_thread::get_id()) {
        // Called from an event callback: this thread already owns the run.
        return slot->run.snapshot();
    }
    std::lock_guard<std::mutex> lock(slot->mutex);
    return slot->run.snapshot();
}

core::errors::Result<WorkflowRunSnapshot> WorkflowRunner::restore(const std::string& run_id) {
    return get_status(run_id);
}

core::errors::Result<WorkflowRunSnapshot> WorkflowRunner::submit_decision(
    const std::string& run_id, const std::string& request_id,
    const protocol::Verdict verdict, const std::optional<std::string>& note) {
    auto slot_result = find_slot(run_id);
    if (core::errors::is_error(slot_result)) {
        return core::errors::get_error(slot_result);
    }
    const auto slot = core::errors::get_value(slot_result);
    if (slot->driver.load() == std::this_thread::get_id()) {
        return ConductorError{ErrorCategory::InvalidTransition,
                              "Run " + run_id + " is being driven by this thread.",
                              "run_busy",
                              "Submit decisions after the current call returns."};
    }
    std::lock_guard<std::mutex> lock(slot->mutex);
    auto claimed = claim(*slot);
    if (core::errors::is_error(claimed)) {
        return core::errors::get_error(claimed);
    }
    const auto file_lock = std::move(core::errors::get_value(claimed));
    WorkflowRun& run = slot->run;
    core::logging::ScopedRunId scoped(run.id);

    if (run.topology != Topology::HumanInLoop) {
        return ConductorError{ErrorCategory::InvalidTransition,
                              "Run " + run_id + " is a " +
                                  protocol::to_string(run.topology) +
                                  " run and never awaits input.",
                              "run_not_paused"};
    }

    protocol::HumanDecision decision;
    decision.request_id = request_id;
    decision.verdict = verdict;
    decision.note = note;

    DriverGuard driving(slot->driver);
    const runtime::HumanInLoopOrchestrator orchestrator(executor_, sink(), checkpoint());
    auto resumed = orchestrator.resume(run, decision);
    if (core::errors::is_error(resumed)) {
        const auto& err = core::errors::get_error(resumed);
        LOG_WARN("WorkflowRunner: decision rejected " + core::errors::format_error(err));
        return err;
    }

    if (auto persist_error = persist(run)) {
        return persist_error.value();
    }
    return run.snapshot();
}

core::errors::Result<RunStatus> WorkflowRunner::cancel(const std::string& run_id) {
    auto slot_result = find_slot(run_id);
    if (core::errors::is_error(slot_result)) {
        return core::errors::get_error(slot_result);
    }
    const auto slot = core::errors::get_value(slot_result);
    slot->cancel_token->store(true);

    if (slot->driver.load() != std::thread::id()) {
        // The driving thread may be this one (e.g. an event callback), so the
        // run mutex must not be taken here.
        LOG_INFO("WorkflowRunner: cancellation requested for in-flight run " + run_id);
        return RunStatus::Running;
    }

    std::lock_guard<std::mutex> lock(slot->mutex);
    auto claimed = claim(*slot);
    if (core::errors::is_error(claimed)) {
        return core::errors::get_error(claimed);
    }
    const auto file_lock = std::move(core::errors::get_value(claimed));
    WorkflowRun& run = slot->run;
    core::logging::ScopedRunId scoped(run.id);
    if (protocol::is_terminal(run.status)) {
        if (run.status == RunStatus::Failed && run.error == std::string("cancelled")) {
            return run.status;
        }
        return ConductorError{ErrorCategory::InvalidTransition,
                              "Run " + run_id + " is already " +
                                  protocol::to_string(run.status) + ".",
                              "run_terminal"};
    }

    const runtime::TurnDriver driver(executor_, sink(), "WorkflowRunner");
    driver.fail(run, ConductorError{ErrorCategory::Cancelled, "Run cancelled by caller.",
                                    "run_cancelled"});
    if (auto persist_error = persist(run)) {
        return persist_error.value();
    }
    return run.status;
}

std::vector<std::string> WorkflowRunner::list_runs() const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    std::vector<std::string> ids;
    ids.reserve(runs_.size());
    for (const auto& entry : runs_) {
        ids.push_back(entry.first);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::size_t WorkflowRunner::run_count() const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    return runs_.size();
}

}  // namespace conductor::session
