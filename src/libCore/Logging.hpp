#pragma once

#include "Logger/Logger.hpp"

namespace hangman {

//! Returns the logger instance of the game library.
Logging::Logger Logger();

} // namespace hangman
