#pragma once

#include "core/game.hpp"
#include "core/types.hpp"

#include <variant>
#include <vector>

namespace hangman {

//! The player guessed this letter.
struct Guessed {
	Letter letter;
	bool operator==(const Guessed&) const = default;
};
//! Letter shown only because the game was lost.
struct RevealedOnLoss {
	Letter letter;
	bool operator==(const RevealedOnLoss&) const = default;
};
//! Letter not guessed yet.
struct Hidden {
	bool operator==(const Hidden&) const = default;
};

using RevealedLetter = std::variant<Guessed, RevealedOnLoss, Hidden>;

//! Redacted view of a game. This is the only game data handed to clients.
struct Tally {
	GameState state;
	unsigned turnsLeft;
	std::vector<RevealedLetter> letters; //!< One entry per letter of the secret word.
	std::vector<Letter> guesses;         //!< Used letters, sorted.

	bool operator==(const Tally&) const = default;
};

//! Externalize the game without leaking unguessed letters of a running game.
Tally tally(const Game& game);

//! Character to display for a revealed letter. Hidden letters show HIDDEN_MARKER.
Letter displayLetter(const RevealedLetter& letter);

} // namespace hangman
