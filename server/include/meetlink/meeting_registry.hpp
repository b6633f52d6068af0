/*
 * 설명: 초대 세션의 생성, 슬롯 확정, 조회, 만료 검증을 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/meeting_registry_test.cpp
 */
#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "meetlink/meeting.hpp"
#include "meetlink/meeting_store.hpp"
#include "meetlink/token_generator.hpp"

namespace meetlink {

enum class InvalidReason { kNotFound, kExpired };

std::string ToString(InvalidReason reason);

struct SessionValidation {
  bool valid{false};
  std::string meeting_id;
  std::optional<std::string> slot_time;
  std::optional<MeetingStatus> status;
  std::optional<InvalidReason> reason;
};

struct RegistryConfig {
  std::chrono::seconds session_ttl{std::chrono::minutes(30)};
};

class MeetingRegistry {
 public:
  using Clock = std::function<std::chrono::system_clock::time_point()>;

  MeetingRegistry(std::shared_ptr<MeetingStore> store, TokenGenerator generator, const RegistryConfig& config,
                  Clock clock = [] { return std::chrono::system_clock::now(); });

  // 토큰 공간이 고갈되면 TokenExhaustedError 를 던진다.
  Meeting Create(const std::string& contact);
  bool ConfirmSlot(const std::string& id, const std::string& slot_time, std::string& error_code,
                   std::string& error_message);
  std::optional<Meeting> Get(const std::string& id) const;
  SessionValidation Validate(const std::string& id) const;
  std::size_t SweepExpired(std::chrono::seconds retention);
  std::size_t Count() const { return store_->Count(); }

  RegistryConfig GetConfig() const { return config_; }

 private:
  std::shared_ptr<MeetingStore> store_;
  TokenGenerator generator_;
  RegistryConfig config_;
  Clock clock_;
};

}  // namespace meetlink
