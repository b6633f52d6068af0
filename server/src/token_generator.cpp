/*
 * 설명: OpenSSL 난수로 미팅 토큰 후보를 만들고 선점될 때까지 제한적으로 재시도한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/token_generator_test.cpp
 */
#include "meetlink/token_generator.hpp"

#include <algorithm>
#include <array>
#include <cctype>

#include <openssl/rand.h>

namespace meetlink {
namespace {
void OpenSslRandom(unsigned char* buffer, std::size_t len) {
  if (RAND_bytes(buffer, static_cast<int>(len)) != 1) {
    throw std::runtime_error("RAND_bytes 실패");
  }
}
}  // namespace

TokenGenerator::TokenGenerator(std::size_t max_attempts) : TokenGenerator(max_attempts, OpenSslRandom) {}

TokenGenerator::TokenGenerator(std::size_t max_attempts, RandomSource random_source)
    : max_attempts_(std::max<std::size_t>(1, max_attempts)), random_source_(std::move(random_source)) {}

std::string TokenGenerator::NextCandidate() const {
  const std::size_t symbols = kAlphabet.size();
  // 나머지 편향을 피하기 위해 limit 이상의 바이트는 버린다.
  const unsigned int limit = 256 - (256 % symbols);
  std::array<unsigned char, kTokenLength * 2> buffer{};
  std::string token;
  token.reserve(kTokenLength);
  while (token.size() < kTokenLength) {
    random_source_(buffer.data(), buffer.size());
    for (unsigned char byte : buffer) {
      if (byte >= limit) {
        continue;
      }
      token.push_back(kAlphabet[byte % symbols]);
      if (token.size() == kTokenLength) {
        break;
      }
    }
  }
  return token;
}

std::string TokenGenerator::Generate(const ClaimFn& try_claim) const {
  for (std::size_t attempt = 1; attempt <= max_attempts_; ++attempt) {
    auto candidate = NextCandidate();
    if (try_claim(candidate)) {
      return candidate;
    }
  }
  throw TokenExhaustedError(max_attempts_);
}

bool TokenGenerator::IsWellFormed(std::string_view token) {
  if (token.size() != kTokenLength) {
    return false;
  }
  return std::all_of(token.begin(), token.end(),
                     [](char c) { return kAlphabet.find(c) != std::string_view::npos; });
}

std::string TokenGenerator::Normalize(std::string_view token) {
  std::string out(token);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return out;
}

}  // namespace meetlink
