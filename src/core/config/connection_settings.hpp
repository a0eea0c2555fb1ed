#pragma once
#include <cstdlib>
#include <string>
#include "core/errors/conductor_errors.hpp"

namespace conductor::core::config {

    inline constexpr const char* kEndpointEnv = "CONDUCTOR_PROJECT_ENDPOINT";
    inline constexpr const char* kDeploymentEnv = "CONDUCTOR_MODEL_DEPLOYMENT_NAME";

    // Opaque to the orchestration core: only the agent invoker reads it.
    struct ConnectionSettings {
        std::string endpoint;
        std::string deployment = "gpt-4o";
    };

    inline errors::Result<ConnectionSettings> validate_connection(
        const ConnectionSettings& settings) {
        if (settings.endpoint.empty()) {
            return errors::ConductorError{
                errors::ErrorCategory::Configuration,
                "Project endpoint is not configured.", "missing_endpoint",
                std::string("Set ") + kEndpointEnv + "."};
        }
        if (settings.endpoint.find("<your-") != std::string::npos) {
            return errors::ConductorError{
                errors::ErrorCategory::Configuration,
                "Project endpoint still contains a placeholder: " + settings.endpoint,
                "placeholder_endpoint",
                std::string("Replace the placeholder in ") + kEndpointEnv + "."};
        }
        if (settings.deployment.empty()) {
            return errors::ConductorError{errors::ErrorCategory::Configuration,
                                          "Model deployment name is empty.",
                                          "missing_deployment"};
        }
        return settings;
    }

    inline errors::Result<ConnectionSettings> load_connection_from_env() {
        ConnectionSettings settings;
        if (const char* endpoint = std::getenv(kEndpointEnv)) {
            settings.endpoint = endpoint;
        }
        if (const char* deployment = std::getenv(kDeploymentEnv)) {
            if (*deployment != '\0') {
                settings.deployment = deployment;
            }
        }
        return validate_connection(settings);
    }

} // namespace conductor::core::config
