/*
 * 설명: 사람이 옮겨 적기 쉬운 8자리 미팅 토큰을 생성하고 충돌 시 제한 횟수만큼 재시도한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/token_generator_test.cpp
 */
#pragma once

#include <cstddef>
#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace meetlink {

class TokenExhaustedError : public std::runtime_error {
 public:
  explicit TokenExhaustedError(std::size_t attempts)
      : std::runtime_error("미팅 토큰 할당 실패: " + std::to_string(attempts) + "회 모두 충돌"),
        attempts(attempts) {}
  std::size_t attempts;
};

class TokenGenerator {
 public:
  // 0/O, 1/I 처럼 혼동되는 문자를 뺀 숫자+대문자 집합
  static constexpr std::string_view kAlphabet = "ABCDEFGHJKLMNPQRSTUVWXYZ23456789";
  static constexpr std::size_t kTokenLength = 8;
  static constexpr std::size_t kDefaultMaxAttempts = 16;

  // buffer 를 난수 바이트로 채운다.
  using RandomSource = std::function<void(unsigned char*, std::size_t)>;
  // 후보 토큰을 원자적으로 선점하면 true 를 반환한다.
  using ClaimFn = std::function<bool(const std::string&)>;

  explicit TokenGenerator(std::size_t max_attempts = kDefaultMaxAttempts);
  TokenGenerator(std::size_t max_attempts, RandomSource random_source);

  std::string Generate(const ClaimFn& try_claim) const;
  std::string NextCandidate() const;

  std::size_t MaxAttempts() const { return max_attempts_; }

  static bool IsWellFormed(std::string_view token);
  static std::string Normalize(std::string_view token);

 private:
  std::size_t max_attempts_;
  RandomSource random_source_;
};

}  // namespace meetlink
