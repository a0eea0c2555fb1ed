#pragma once
#include "protocol/run_request.hpp"
#include "core/errors/conductor_errors.hpp"

namespace conductor::app::cli {
    conductor::core::errors::Result<conductor::protocol::RunRequest> parse_and_validate(int argc, char* argv[]);
}
