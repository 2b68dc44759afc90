#pragma once

#include "core/types.hpp"

#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace hangman {

//! State of a single hangman game.
//! \note Transitions return a new value. The game is never shared between concurrent callers.
struct Game {
	std::string name;                     //!< Session identifier. Not used by the game logic.
	GameState state{GameState::Initializing};
	unsigned turnsLeft{MAX_TURNS};        //!< Remaining wrong guesses.
	std::vector<Letter> letters;          //!< The secret word. Fixed after construction.
	std::set<Letter> used;                //!< Every distinct letter guessed so far.

	bool operator==(const Game&) const = default;
};

//! How resign treats a game that is already won.
enum class ResignPolicy {
	Always, //!< Resignation always loses the game, even a won one.
	KeepWon //!< A won game stays won.
};

//! Create a game for the secret word with a random name.
//! \throws InvalidWord if the word is empty or has characters outside 'a'-'z'.
Game newGame(std::string_view word);

//! Create a game for the secret word with the given name.
//! \throws InvalidWord if the word is empty or has characters outside 'a'-'z'.
Game newGame(std::string_view word, std::string name);

//! Score a guess and return the resulting game. Won or lost games are returned unchanged.
//! \throws InvalidGuess if guess is not a letter 'a'-'z'. The input game is not affected.
Game makeMove(const Game& game, Letter guess);

//! Same as above for a guess given as text. The text must be exactly one letter.
Game makeMove(const Game& game, std::string_view guess);

//! Give up the game. Turns left and used letters are kept.
Game resign(const Game& game, ResignPolicy policy = ResignPolicy::Always);

//! True when every distinct letter of the word has been guessed.
bool isSolved(const Game& game);

} // namespace hangman
