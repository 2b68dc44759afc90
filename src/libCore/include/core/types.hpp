#pragma once

#include <cstddef>
#include <string_view>

namespace hangman {

using Letter = char; //!< Single lowercase letter 'a'-'z'.

inline constexpr unsigned MAX_TURNS          = 7;   //!< Wrong guesses allowed in a new game.
inline constexpr std::size_t NAME_MIN_LENGTH = 4;   //!< Shortest generated game name.
inline constexpr std::size_t NAME_MAX_LENGTH = 10;  //!< Longest generated game name.
inline constexpr Letter HIDDEN_MARKER        = '_'; //!< Shown for letters not yet guessed.

enum class GameState { Initializing, GoodGuess, BadGuess, AlreadyUsed, Lost, Won };

//! Whether the letter is in the range 'a'-'z'.
inline constexpr bool isLetter(const char c) {
	return c >= 'a' && c <= 'z';
}

//! Won and Lost games do not change anymore.
inline constexpr bool isTerminal(const GameState state) {
	return state == GameState::Won || state == GameState::Lost;
}

//! Lowercase snake case name of the state. Used for logs and messages.
inline constexpr std::string_view toString(const GameState state) {
	switch (state) {
	case GameState::Initializing:
		return "initializing";
	case GameState::GoodGuess:
		return "good_guess";
	case GameState::BadGuess:
		return "bad_guess";
	case GameState::AlreadyUsed:
		return "already_used";
	case GameState::Lost:
		return "lost";
	case GameState::Won:
		return "won";
	}
	return "unknown";
}

} // namespace hangman
