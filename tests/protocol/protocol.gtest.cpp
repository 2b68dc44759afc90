#include "protocol/protocol.hpp"

#include "core/game.hpp"
#include "core/tally.hpp"

#include <gtest/gtest.h>

namespace hangman::protocol::gtest {

TEST(Protocol, TallyMessage_Running) {
	auto game = newGame("anaconda");
	game      = makeMove(game, 'a');
	game      = makeMove(game, 'n');
	game      = makeMove(game, 'x');

	EXPECT_EQ(toMessage(tally(game)), "TALLY:bad_guess;6;ana__n_a;anx");
}

TEST(Protocol, TallyMessage_New) {
	EXPECT_EQ(toMessage(tally(newGame("wibble"))), "TALLY:initializing;7;______;");
}

TEST(Protocol, TallyMessage_Lost) {
	auto game = newGame("anaconda");
	game      = makeMove(game, 'a');
	game      = makeMove(game, 'n');

	EXPECT_EQ(toMessage(tally(resign(game))), "TALLY:lost;7;ana[c][o]n[d]a;an");
}

TEST(Protocol, TallyMessage_Won) {
	auto game = newGame("abba");
	game      = makeMove(game, 'b');
	game      = makeMove(game, 'a');

	EXPECT_EQ(toMessage(tally(game)), "TALLY:won;7;abba;ab");
}

TEST(Protocol, ClientMessage) {
	EXPECT_EQ(toMessage(ClientMessage{GuessMessage{.letter = 'e'}}), "GUESS:e");
	EXPECT_EQ(toMessage(ClientMessage{ResignMessage{}}), "RESIGN");

	EXPECT_EQ(fromMessage("GUESS:e"), ClientMessage{GuessMessage{.letter = 'e'}});
	EXPECT_EQ(fromMessage("RESIGN"), ClientMessage{ResignMessage{}});

	// Letter validity is checked by the game, not the parser.
	EXPECT_EQ(fromMessage("GUESS:E"), ClientMessage{GuessMessage{.letter = 'E'}});
}

TEST(Protocol, ClientMessage_Invalid) {
	EXPECT_FALSE(fromMessage("").has_value());
	EXPECT_FALSE(fromMessage("GUESS:").has_value());
	EXPECT_FALSE(fromMessage("GUESS:ab").has_value());
	EXPECT_FALSE(fromMessage("guess:a").has_value());
	EXPECT_FALSE(fromMessage("RESIGN ").has_value());
	EXPECT_FALSE(fromMessage("PASS").has_value());
}

} // namespace hangman::protocol::gtest
