#include "core/errors.hpp"
#include "core/game.hpp"
#include "core/tally.hpp"

#include <array>
#include <format>
#include <iostream>
#include <random>
#include <string>
#include <string_view>
#include <variant>

using namespace hangman;

// Stub word source for local play.
static constexpr std::array<std::string_view, 8> WORDS{"wibble", "anaconda", "circuit", "hangman", "lantern", "quartz", "rhythm", "zephyr"};

static std::string_view randomWord() {
	std::random_device rd;
	std::mt19937 gen(rd());
	std::uniform_int_distribution<std::size_t> dist(0, WORDS.size() - 1);

	return WORDS[dist(gen)];
}

//! Letters separated by spaces. Letters revealed because the game was lost are bracketed.
static std::string render(const Tally& tally) {
	std::string out;
	for (const auto& letter: tally.letters) {
		if (!out.empty()) {
			out += ' ';
		}
		if (std::holds_alternative<RevealedOnLoss>(letter)) {
			out += std::format("[{}]", displayLetter(letter));
		} else {
			out += displayLetter(letter);
		}
	}
	return out;
}

static void draw(const Game& game) {
	const auto t = tally(game);
	std::cout << std::format("{}\n  state: {}, turns left: {}, guesses: {}\n", render(t), toString(t.state), t.turnsLeft,
	                         std::string(t.guesses.begin(), t.guesses.end()));
}

//! Read guesses from stdin until the game is over or input ends.
static void play(Game game) {
	std::cout << std::format("Game '{}'. Guess a letter or type !resign.\n", game.name);
	draw(game);

	std::string line;
	while (!isTerminal(game.state) && std::cout << "> " && std::getline(std::cin, line)) {
		if (line == "!resign") {
			game = resign(game);
		} else {
			try {
				game = makeMove(game, line);
			} catch (const InvalidGuess& e) {
				std::cout << e.what() << "\n";
				continue;
			}
		}
		draw(game);
	}

	if (game.state == GameState::Won) {
		std::cout << "You won!\n";
	} else if (game.state == GameState::Lost) {
		std::cout << "You lost.\n";
	}
}

int main(int argc, char** argv) {
	const std::string word = argc > 1 ? argv[1] : std::string{randomWord()};

	try {
		play(argc > 2 ? newGame(word, argv[2]) : newGame(word));
	} catch (const InvalidWord& e) {
		std::cerr << e.what() << "\n";
		return 1;
	}
	return 0;
}
