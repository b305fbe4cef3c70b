#pragma once
#include "protocol/evaluate_request.hpp"
#include "core/errors/bench_errors.hpp"

namespace shellbench::app::cli {
    shellbench::core::errors::Result<shellbench::protocol::EvaluateRequest> parse_and_validate(int argc, char* argv[]);
}
