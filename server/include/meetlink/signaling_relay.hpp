/*
 * 설명: 미팅 토큰을 방 이름으로 하는 2인 방에서 WebRTC offer/answer 시그널을 중계한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/signaling_relay_test.cpp, server/tests/e2e/invite_flow_test.cpp
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "meetlink/observability.hpp"

namespace meetlink {

class SignalingPeer {
 public:
  virtual ~SignalingPeer() = default;
  virtual const std::string& ConnectionId() const = 0;
  virtual void SendServerEvent(const std::string& event, const nlohmann::json& payload) = 0;
};

struct RelayConfig {
  std::size_t room_capacity{2};
  // 같은 방에 있는 연결끼리만 offer/answer 를 허용한다.
  bool require_shared_room{false};
  bool notify_peer_left{false};
};

enum class RelayOutcome { kDelivered, kDropped, kRejected };

class SignalingRelay {
 public:
  explicit SignalingRelay(const RelayConfig& config = RelayConfig{});

  void SetObservability(const std::shared_ptr<Observability>& observability) { observability_ = observability; }

  std::string NextConnectionId();
  void Register(const std::shared_ptr<SignalingPeer>& peer);
  // 연결이 속한 방에서 제거하고 등록을 해제한다.
  void Disconnect(const std::string& conn_id, const SignalingPeer* peer);

  // peers 에는 입장 시점에 이미 방에 있던 연결 id 가 입장 순서대로 담긴다.
  bool Join(const std::string& conn_id, const std::string& room_id, std::vector<std::string>& peers,
            std::string& error_code, std::string& error_message);
  RelayOutcome SendOffer(const std::string& sender_id, const std::string& target_id, const std::string& caller_id,
                         const nlohmann::json& signal, std::string& error_code, std::string& error_message);
  RelayOutcome AcceptOffer(const std::string& responder_id, const std::string& caller_id,
                           const nlohmann::json& signal, std::string& error_code, std::string& error_message);

  std::optional<std::string> RoomOf(const std::string& conn_id) const;
  std::vector<std::string> RoomMembers(const std::string& room_id) const;
  std::size_t ActiveConnections() const;
  std::size_t RoomCount() const;

 private:
  struct Entry {
    std::weak_ptr<SignalingPeer> peer;
    const SignalingPeer* raw{nullptr};
    std::optional<std::string> room;
  };

  // 잠금 해제 후에 소멸되도록 잠금보다 먼저 선언해 peer 참조를 보관한다.
  using PeerRefs = std::vector<std::shared_ptr<SignalingPeer>>;

  void LeaveRoomLocked(const std::string& conn_id, Entry& entry, PeerRefs& refs);
  std::shared_ptr<SignalingPeer> LockPeerLocked(const std::string& conn_id, PeerRefs& refs) const;
  bool SharesRoomLocked(const std::string& a, const std::string& b) const;
  void Record(bool delivered, const std::string& name, const std::string& from, const std::string& to) const;

  RelayConfig config_;
  std::unordered_map<std::string, Entry> connections_;
  // 방 -> 입장 순서대로 정렬된 연결 id
  std::unordered_map<std::string, std::vector<std::string>> rooms_;
  std::uint64_t id_counter_{0};
  mutable std::mutex mutex_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace meetlink
