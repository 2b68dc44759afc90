#pragma once

#include <string>

namespace hangman {

//! Random game name of NAME_MIN_LENGTH to NAME_MAX_LENGTH characters from [A-Za-z0-9_-].
//! \note Safe to call from multiple threads. Each call draws fresh bytes from std::random_device.
std::string randomName();

} // namespace hangman
