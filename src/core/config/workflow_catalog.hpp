#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include "core/errors/conductor_errors.hpp"
#include "protocol/workflow_contract.hpp"

namespace conductor::core::config {

// Agent line-up per topology plus executor policy. Passed by value into the
// runner; there is no process-wide catalog.
struct WorkflowCatalog {
    protocol::WorkflowDefinition sequential;
    protocol::WorkflowDefinition human_in_loop;
    protocol::WorkflowDefinition round_robin;
    int max_attempts = 1;
    std::uint32_t timeout_ms = 0;

    const protocol::WorkflowDefinition& definition_for(
        protocol::Topology topology) const;
};

// Support triage, expense approval and launch brainstorm line-ups.
WorkflowCatalog default_catalog();

// Sections present in the document replace the defaults; absent ones keep
// them. All failures are ErrorCategory::Configuration.
errors::Result<WorkflowCatalog> parse_catalog(const std::string& text);
errors::Result<WorkflowCatalog> load_catalog(const std::filesystem::path& path);

}  // namespace conductor::core::config
