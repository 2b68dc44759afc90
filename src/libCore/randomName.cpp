#include "core/randomName.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <random>
#include <string_view>
#include <vector>

namespace hangman {

static constexpr std::string_view URL_SAFE_ALPHABET = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

//! Unpadded base64url encoding (RFC 4648 section 5).
static std::string encodeUrlSafe(const std::vector<uint8_t>& bytes) {
	std::string out;
	out.reserve((bytes.size() * 4u + 2u) / 3u);

	std::size_t i = 0;
	for (; i + 3u <= bytes.size(); i += 3u) {
		const uint32_t chunk = (uint32_t{bytes[i]} << 16) | (uint32_t{bytes[i + 1]} << 8) | uint32_t{bytes[i + 2]};
		out += URL_SAFE_ALPHABET[(chunk >> 18) & 0x3F];
		out += URL_SAFE_ALPHABET[(chunk >> 12) & 0x3F];
		out += URL_SAFE_ALPHABET[(chunk >> 6) & 0x3F];
		out += URL_SAFE_ALPHABET[chunk & 0x3F];
	}

	const auto rest = bytes.size() - i;
	if (rest == 1u) {
		const uint32_t chunk = uint32_t{bytes[i]} << 16;
		out += URL_SAFE_ALPHABET[(chunk >> 18) & 0x3F];
		out += URL_SAFE_ALPHABET[(chunk >> 12) & 0x3F];
	} else if (rest == 2u) {
		const uint32_t chunk = (uint32_t{bytes[i]} << 16) | (uint32_t{bytes[i + 1]} << 8);
		out += URL_SAFE_ALPHABET[(chunk >> 18) & 0x3F];
		out += URL_SAFE_ALPHABET[(chunk >> 12) & 0x3F];
		out += URL_SAFE_ALPHABET[(chunk >> 6) & 0x3F];
	}
	return out;
}

std::string randomName() {
	// Local device per call. No shared generator state between threads.
	std::random_device rd;
	std::uniform_int_distribution<std::size_t> lengthDist(NAME_MIN_LENGTH, NAME_MAX_LENGTH);
	const auto length = lengthDist(rd);

	std::vector<uint8_t> bytes(length);
	for (auto& b: bytes) {
		b = static_cast<uint8_t>(rd());
	}

	// n bytes encode to at least n characters.
	return encodeUrlSafe(bytes).substr(0, length);
}

} // namespace hangman
