#pragma once

#include <stdexcept>
#include <string>

namespace hangman {

//! Thrown when a secret word is empty or contains characters outside 'a'-'z'.
class InvalidWord : public std::invalid_argument {
public:
	explicit InvalidWord(const std::string& word);

	const std::string& word() const; //!< The rejected word.

private:
	std::string m_word;
};

//! Thrown when a guess is not exactly one letter 'a'-'z'.
class InvalidGuess : public std::invalid_argument {
public:
	explicit InvalidGuess(const std::string& guess);

	const std::string& guess() const; //!< The rejected guess.

private:
	std::string m_guess;
};

} // namespace hangman
