#include "core/errors.hpp"

#include <format>

namespace hangman {

InvalidWord::InvalidWord(const std::string& word)
    : std::invalid_argument(std::format("some characters of '{}' not a-z", word)), m_word{word} {
}

const std::string& InvalidWord::word() const {
	return m_word;
}

InvalidGuess::InvalidGuess(const std::string& guess) : std::invalid_argument(std::format("guess '{}' not a-z", guess)), m_guess{guess} {
}

const std::string& InvalidGuess::guess() const {
	return m_guess;
}

} // namespace hangman
