#include <algorithm>
#include <cstring>
#include <memory>
#include <set>
#include <string>

#include <gtest/gtest.h>

#include "meetlink/token_generator.hpp"

namespace {

// 0, 1, 2, ... 순서로 바이트를 채우는 결정적 난수원
meetlink::TokenGenerator::RandomSource SequentialSource() {
  auto next = std::make_shared<unsigned int>(0);
  return [next](unsigned char* buffer, std::size_t len) {
    for (std::size_t i = 0; i < len; ++i) {
      buffer[i] = static_cast<unsigned char>((*next)++ % 256);
    }
  };
}

meetlink::TokenGenerator::RandomSource ZeroSource() {
  return [](unsigned char* buffer, std::size_t len) { std::memset(buffer, 0, len); };
}

}  // namespace

TEST(TokenGeneratorTest, TokensHaveFixedLengthAndAlphabet) {
  meetlink::TokenGenerator generator;
  for (int i = 0; i < 1000; ++i) {
    auto token = generator.NextCandidate();
    ASSERT_EQ(token.size(), meetlink::TokenGenerator::kTokenLength);
    EXPECT_TRUE(meetlink::TokenGenerator::IsWellFormed(token)) << token;
    for (char c : std::string("01IO")) {
      EXPECT_EQ(token.find(c), std::string::npos) << token;
    }
  }
}

TEST(TokenGeneratorTest, AlphabetExcludesConfusableCharacters) {
  constexpr auto alphabet = meetlink::TokenGenerator::kAlphabet;
  EXPECT_EQ(alphabet.size(), 32u);
  for (char c : std::string("01IO")) {
    EXPECT_EQ(alphabet.find(c), std::string_view::npos);
  }
}

TEST(TokenGeneratorTest, MapsRandomBytesOntoAlphabet) {
  meetlink::TokenGenerator generator(4, SequentialSource());
  EXPECT_EQ(generator.NextCandidate(), "ABCDEFGH");
}

TEST(TokenGeneratorTest, RetriesUntilCandidateIsClaimed) {
  meetlink::TokenGenerator generator(5, SequentialSource());
  int calls = 0;
  auto token = generator.Generate([&](const std::string&) { return ++calls == 3; });
  EXPECT_EQ(calls, 3);
  EXPECT_TRUE(meetlink::TokenGenerator::IsWellFormed(token));
}

TEST(TokenGeneratorTest, DegenerateSourceFailsAfterBoundedAttempts) {
  meetlink::TokenGenerator generator(7, ZeroSource());
  std::set<std::string> taken{"AAAAAAAA"};
  int calls = 0;
  try {
    generator.Generate([&](const std::string& candidate) {
      ++calls;
      return taken.insert(candidate).second;
    });
    FAIL() << "TokenExhaustedError 가 발생해야 합니다";
  } catch (const meetlink::TokenExhaustedError& ex) {
    EXPECT_EQ(ex.attempts, 7u);
  }
  EXPECT_EQ(calls, 7);
}

TEST(TokenGeneratorTest, ClaimedTokensAreUnique) {
  meetlink::TokenGenerator generator;
  std::set<std::string> claimed;
  for (int i = 0; i < 500; ++i) {
    generator.Generate([&](const std::string& candidate) { return claimed.insert(candidate).second; });
  }
  EXPECT_EQ(claimed.size(), 500u);
}

TEST(TokenGeneratorTest, WellFormedAndNormalize) {
  EXPECT_TRUE(meetlink::TokenGenerator::IsWellFormed("ABCD2345"));
  EXPECT_FALSE(meetlink::TokenGenerator::IsWellFormed("ABCD0345"));
  EXPECT_FALSE(meetlink::TokenGenerator::IsWellFormed("ABCD234"));
  EXPECT_FALSE(meetlink::TokenGenerator::IsWellFormed("abcd2345"));
  EXPECT_EQ(meetlink::TokenGenerator::Normalize("abcd2345"), "ABCD2345");
}
