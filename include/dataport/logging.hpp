// SPDX-License-Identifier: MIT

// include/dataport/logging.hpp
#pragma once

#include <memory>

#include <spdlog/spdlog.h>

namespace dataport {

/// Library logger named "dataport", writing to stderr.
///
/// Created on first use.  Levels follow the SPDLOG_LEVEL environment
/// variable (e.g. `SPDLOG_LEVEL=dataport=debug`), defaulting to info.  If the
/// host application already registered a logger under that name, it is
/// used instead.
std::shared_ptr<spdlog::logger> Logger();

}  // namespace dataport
