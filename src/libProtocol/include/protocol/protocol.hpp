#pragma once

#include "core/tally.hpp"
#include "core/types.hpp"

#include <optional>
#include <string>
#include <variant>

namespace hangman::protocol {

// Client messages
struct GuessMessage {
	Letter letter; //!< Not validated. makeMove rejects anything outside 'a'-'z'.
	bool operator==(const GuessMessage&) const = default;
};
struct ResignMessage {
	bool operator==(const ResignMessage&) const = default;
};

using ClientMessage = std::variant<GuessMessage, ResignMessage>;

//! Client message to message string.
std::string toMessage(const ClientMessage& message);
//! Message string to client message. Empty if the string is not a known message.
std::optional<ClientMessage> fromMessage(const std::string& message);

//! Tally to message string: "TALLY:<state>;<turnsLeft>;<letters>;<guesses>".
//! \note Letters revealed on loss are written as "[x]", hidden letters as HIDDEN_MARKER.
std::string toMessage(const Tally& tally);

} // namespace hangman::protocol
