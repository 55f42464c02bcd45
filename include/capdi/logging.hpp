#pragma once

#include "export.hpp"

#include <memory>

#include <spdlog/logger.h>

namespace capdi {

/// The logger capdi writes its diagnostics to.  Until set_logger() is
/// called this is a logger named "capdi" with no sinks, so nothing is
/// written anywhere.
CAPDI_EXPORT std::shared_ptr<spdlog::logger> logger();

/// Install the logger used for registration, construction and scope
/// events.  Passing nullptr restores the silent default.
CAPDI_EXPORT void set_logger(std::shared_ptr<spdlog::logger> logger);

} // namespace capdi
