#pragma once

#include <memory>
#include <spdlog/spdlog.h>

namespace clt {

// Library-wide logger named "clt" writing to stderr, created on first use.
// Results printed to stdout are never interleaved with log lines.
std::shared_ptr<spdlog::logger> logger();

void set_log_level(spdlog::level::level_enum level);

}  // namespace clt
