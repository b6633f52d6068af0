/*
 * 설명: 초대 링크 전달 경계(이메일/SMS 등)를 추상화한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/lifecycle_service_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <string_view>

#include "meetlink/observability.hpp"

namespace meetlink {

struct Invitation {
  std::string contact;
  std::string join_link;
  std::string meeting_id;
  std::chrono::seconds expires_in;
};

class InvitationNotifier {
 public:
  virtual ~InvitationNotifier() = default;
  virtual bool Send(const Invitation& invitation) = 0;
};

// 로그용으로 연락처를 가린다. 이메일은 첫 글자와 도메인만, 그 외는 끝 4자리만 남긴다.
std::string MaskContact(std::string_view contact);

// 실제 발송 대신 구조화 로그로 초대를 남긴다.
class LoggingNotifier : public InvitationNotifier {
 public:
  explicit LoggingNotifier(std::shared_ptr<Observability> observability);
  bool Send(const Invitation& invitation) override;

 private:
  std::shared_ptr<Observability> observability_;
};

class DisabledNotifier : public InvitationNotifier {
 public:
  bool Send(const Invitation& /*invitation*/) override { return false; }
};

std::shared_ptr<InvitationNotifier> MakeNotifier(const std::string& kind,
                                                 const std::shared_ptr<Observability>& observability);

}  // namespace meetlink
