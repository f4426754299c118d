#pragma once
#include "protocol/contest_request.hpp"
#include "core/errors/contest_errors.hpp"

namespace arena::app::cli {
    arena::core::errors::Result<arena::protocol::ContestRequest> parse_and_validate(int argc, char* argv[]);
}
