// SPDX-License-Identifier: MIT

#include "dataport/logging.hpp"

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace dataport {

namespace {
constexpr const char* kLoggerName = "dataport";
}  // namespace

std::shared_ptr<spdlog::logger> Logger() {
    static std::shared_ptr<spdlog::logger> logger = [] {
        if (auto existing = spdlog::get(kLoggerName)) {
            return existing;
        }
        auto created = spdlog::stderr_color_mt(kLoggerName);
        created->set_level(spdlog::level::info);
        spdlog::cfg::load_env_levels();
        return created;
    }();
    return logger;
}

}  // namespace dataport
