#include "core/tally.hpp"

namespace hangman {

static RevealedLetter reveal(const Letter letter, const Game& game) {
	if (game.used.contains(letter)) {
		return Guessed{letter};
	}
	if (game.state == GameState::Lost) {
		return RevealedOnLoss{letter};
	}
	return Hidden{};
}

Tally tally(const Game& game) {
	Tally result{
	        .state     = game.state,
	        .turnsLeft = game.turnsLeft,
	        .letters   = {},
	        .guesses   = {game.used.begin(), game.used.end()}, // Set iteration is already sorted.
	};

	result.letters.reserve(game.letters.size());
	for (const auto letter: game.letters) {
		result.letters.push_back(reveal(letter, game));
	}
	return result;
}

Letter displayLetter(const RevealedLetter& letter) {
	if (const auto* guessed = std::get_if<Guessed>(&letter)) {
		return guessed->letter;
	}
	if (const auto* revealed = std::get_if<RevealedOnLoss>(&letter)) {
		return revealed->letter;
	}
	return HIDDEN_MARKER;
}

} // namespace hangman
