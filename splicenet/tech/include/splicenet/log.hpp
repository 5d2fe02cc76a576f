#pragma once

// All splicenet modules log through spdlog.
#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

namespace splicenet {

namespace log = spdlog;

}  // namespace splicenet
