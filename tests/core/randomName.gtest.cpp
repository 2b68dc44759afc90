#include "core/randomName.hpp"
#include "core/types.hpp"

#include <gtest/gtest.h>

#include <regex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace hangman::gtest {

TEST(RandomName, Length) {
	for (int i = 0; i != 100; ++i) {
		const auto name = randomName();
		EXPECT_GE(name.size(), NAME_MIN_LENGTH);
		EXPECT_LE(name.size(), NAME_MAX_LENGTH);
	}
}

TEST(RandomName, Alphabet) {
	const std::regex pattern{"^[A-Za-z0-9_-]{4,10}$"};
	for (int i = 0; i != 100; ++i) {
		const auto name = randomName();
		EXPECT_TRUE(std::regex_match(name, pattern)) << name;
	}
}

TEST(RandomName, Distinct) {
	std::set<std::string> names;
	for (int i = 0; i != 100; ++i) {
		names.insert(randomName());
	}
	EXPECT_EQ(names.size(), 100u);
}

// Every length in the range shows up eventually.
TEST(RandomName, LengthsCovered) {
	std::set<std::size_t> lengths;
	for (int i = 0; i != 2000 && lengths.size() != NAME_MAX_LENGTH - NAME_MIN_LENGTH + 1; ++i) {
		lengths.insert(randomName().size());
	}
	EXPECT_EQ(lengths.size(), NAME_MAX_LENGTH - NAME_MIN_LENGTH + 1);
}

TEST(RandomName, ConcurrentCalls) {
	constexpr int threadCount = 4;
	std::vector<std::vector<std::string>> results(threadCount);
	std::vector<std::thread> threads;

	for (int t = 0; t != threadCount; ++t) {
		threads.emplace_back([&results, t] {
			for (int i = 0; i != 50; ++i) {
				results[t].push_back(randomName());
			}
		});
	}
	for (auto& thread: threads) {
		thread.join();
	}

	std::set<std::string> names;
	for (const auto& result: results) {
		names.insert(result.begin(), result.end());
	}
	EXPECT_EQ(names.size(), 200u);
}

} // namespace hangman::gtest
