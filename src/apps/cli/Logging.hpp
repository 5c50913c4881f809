#pragma once

#include "Logger/Logger.hpp"

namespace notakto::cli {

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

} // namespace notakto::cli
