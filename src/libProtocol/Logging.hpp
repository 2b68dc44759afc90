#pragma once

#include "Logger/Logger.hpp"

namespace hangman::protocol {

//! Returns the logger instance of the protocol library.
Logging::Logger Logger();

} // namespace hangman::protocol
