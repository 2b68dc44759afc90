#include "core/game.hpp"
#include "core/errors.hpp"
#include "core/randomName.hpp"

#include "Logging.hpp"

#include <algorithm>
#include <format>
#include <utility>

namespace hangman {

static bool containsLetter(const Game& game, const Letter letter) {
	return std::find(game.letters.begin(), game.letters.end(), letter) != game.letters.end();
}

//! Guess is new and in the word.
static Game scoreGoodGuess(Game game) {
	game.state = isSolved(game) ? GameState::Won : GameState::GoodGuess;
	if (game.state == GameState::Won) {
		Logger().Log(Logging::LogLevel::Info, std::format("[Game] '{}' won with {} turns left.", game.name, game.turnsLeft));
	}
	return game;
}

//! Guess is new and not in the word.
static Game scoreBadGuess(Game game) {
	if (game.turnsLeft == 1u) {
		game.state     = GameState::Lost;
		game.turnsLeft = 0u;
		Logger().Log(Logging::LogLevel::Info, std::format("[Game] '{}' lost.", game.name));
	} else {
		game.state = GameState::BadGuess;
		--game.turnsLeft;
	}
	return game;
}

Game newGame(std::string_view word) {
	return newGame(word, randomName());
}

Game newGame(std::string_view word, std::string name) {
	if (word.empty() || !std::all_of(word.begin(), word.end(), isLetter)) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[Game] Rejected word '{}'.", word));
		throw InvalidWord(std::string{word});
	}

	Game game{
	        .name    = std::move(name),
	        .letters = {word.begin(), word.end()},
	};
	Logger().Log(Logging::LogLevel::Info, std::format("[Game] Created '{}' with {} letters.", game.name, game.letters.size()));
	return game;
}

Game makeMove(const Game& game, const Letter guess) {
	if (isTerminal(game.state)) {
		return game;
	}
	if (!isLetter(guess)) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[Game] '{}' rejected guess '{}'.", game.name, guess));
		throw InvalidGuess(std::string(1u, guess));
	}

	if (game.used.contains(guess)) {
		Game next  = game;
		next.state = GameState::AlreadyUsed;
		Logger().Log(Logging::LogLevel::Debug, std::format("[Game] '{}' guess '{}' already used.", game.name, guess));
		return next;
	}

	const bool goodGuess = containsLetter(game, guess);
	if (!goodGuess && game.turnsLeft == 0u) {
		// Only reachable with a hand built game. Never go below zero turns.
		Logger().Log(Logging::LogLevel::Error, std::format("[Game] '{}' has no turns left but is not lost.", game.name));
		return game;
	}

	Game next = game;
	next.used.insert(guess);
	next = goodGuess ? scoreGoodGuess(std::move(next)) : scoreBadGuess(std::move(next));

	Logger().Log(Logging::LogLevel::Debug, std::format("[Game] '{}' guess '{}': {}, {} turns left.", next.name, guess, toString(next.state), next.turnsLeft));
	return next;
}

Game makeMove(const Game& game, std::string_view guess) {
	if (isTerminal(game.state)) {
		return game;
	}
	if (guess.size() != 1u) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[Game] '{}' rejected guess '{}'.", game.name, guess));
		throw InvalidGuess(std::string{guess});
	}
	return makeMove(game, guess.front());
}

Game resign(const Game& game, const ResignPolicy policy) {
	if (policy == ResignPolicy::KeepWon && game.state == GameState::Won) {
		return game;
	}

	Game next  = game;
	next.state = GameState::Lost;
	Logger().Log(Logging::LogLevel::Info, std::format("[Game] '{}' resigned.", game.name));
	return next;
}

bool isSolved(const Game& game) {
	return std::all_of(game.letters.begin(), game.letters.end(), [&](const Letter l) { return game.used.contains(l); });
}

} // namespace hangman
