#include "clt/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace clt {

std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = [] {
        auto existing = spdlog::get("clt");
        if (existing) return existing;
        auto created = spdlog::stderr_color_mt("clt");
        created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
        return created;
    }();
    return instance;
}

void set_log_level(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

}  // namespace clt
