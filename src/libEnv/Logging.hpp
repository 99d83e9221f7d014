#pragma once

#include "Logger/Logger.hpp"

namespace hex::env {

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

} // namespace hex::env
