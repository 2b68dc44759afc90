#include "protocol/protocol.hpp"

#include "Logging.hpp"

#include <format>
#include <string_view>

namespace hangman::protocol {

static constexpr std::string_view MSG_GUESS  = "GUESS:";
static constexpr std::string_view MSG_RESIGN = "RESIGN";
static constexpr std::string_view MSG_TALLY  = "TALLY:";

static std::string toMessage(const GuessMessage& m) {
	return std::format("{}{}", MSG_GUESS, m.letter);
}
static std::string toMessage(const ResignMessage&) {
	return std::string{MSG_RESIGN};
}

static std::string toText(const Guessed& l) {
	return std::string(1u, l.letter);
}
static std::string toText(const RevealedOnLoss& l) {
	return std::format("[{}]", l.letter);
}
static std::string toText(const Hidden&) {
	return std::string(1u, HIDDEN_MARKER);
}

std::string toMessage(const ClientMessage& message) {
	return std::visit([&](auto&& m) { return toMessage(m); }, message);
}

std::optional<ClientMessage> fromMessage(const std::string& message) {
	if (message.rfind(MSG_GUESS, 0) == 0) {
		// Expect "GUESS:c"
		const auto payload = message.substr(MSG_GUESS.size());
		if (payload.size() != 1u) {
			Logger().Log(Logging::LogLevel::Warning, std::format("[Protocol] Guess payload '{}' is not one character.", payload));
			return {};
		}
		return GuessMessage{.letter = payload.front()};
	}

	if (message == MSG_RESIGN) {
		return ResignMessage{};
	}

	Logger().Log(Logging::LogLevel::Warning, std::format("[Protocol] Unknown message '{}'.", message));
	return {};
}

std::string toMessage(const Tally& tally) {
	std::string letters;
	for (const auto& letter: tally.letters) {
		letters += std::visit([&](auto&& l) { return toText(l); }, letter);
	}

	return std::format("{}{};{};{};{}", MSG_TALLY, toString(tally.state), tally.turnsLeft, letters,
	                   std::string(tally.guesses.begin(), tally.guesses.end()));
}

} // namespace hangman::protocol
