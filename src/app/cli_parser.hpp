#pragma once
#include "protocol/check_request.hpp"
#include "core/errors/engine_errors.hpp"

namespace execpolicy::app::cli {
    execpolicy::core::errors::Result<execpolicy::protocol::CheckRequest> parse_and_validate(int argc, char* argv[]);
}
