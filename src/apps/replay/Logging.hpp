#pragma once

#include "Logger/Logger.hpp"

namespace hex::replay {

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

} // namespace hex::replay
