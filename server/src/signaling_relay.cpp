/*
 * 설명: 연결 등록, 방 입장/퇴장, offer/answer 점대점 전달을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/signaling_relay_test.cpp, server/tests/e2e/invite_flow_test.cpp
 */
#include "meetlink/signaling_relay.hpp"

#include <algorithm>
#include <iomanip>
#include <random>
#include <sstream>

namespace meetlink {
namespace {
std::string RandomConnectionId(std::uint64_t salt) {
  static thread_local std::mt19937_64 gen{std::random_device{}()};
  std::ostringstream oss;
  oss << std::hex << std::setw(16) << std::setfill('0') << (gen() ^ salt);
  return oss.str();
}
}  // namespace

SignalingRelay::SignalingRelay(const RelayConfig& config) : config_(config) {}

std::string SignalingRelay::NextConnectionId() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::string id;
  do {
    id = RandomConnectionId(++id_counter_);
  } while (connections_.count(id) > 0);
  return id;
}

void SignalingRelay::Register(const std::shared_ptr<SignalingPeer>& peer) {
  std::lock_guard<std::mutex> lock(mutex_);
  connections_[peer->ConnectionId()] = Entry{peer, peer.get(), std::nullopt};
  if (observability_) {
    observability_->SetWebsocketActive(connections_.size());
  }
}

void SignalingRelay::Disconnect(const std::string& conn_id, const SignalingPeer* peer) {
  PeerRefs refs;
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = connections_.find(conn_id);
  if (it == connections_.end() || it->second.raw != peer) {
    return;
  }
  LeaveRoomLocked(conn_id, it->second, refs);
  connections_.erase(it);
  if (observability_) {
    observability_->SetWebsocketActive(connections_.size());
    observability_->LogEvent(LogLevel::kDebug, "relay.disconnected", {{"connId", conn_id}});
  }
}

bool SignalingRelay::Join(const std::string& conn_id, const std::string& room_id, std::vector<std::string>& peers,
                          std::string& error_code, std::string& error_message) {
  peers.clear();
  if (room_id.empty()) {
    error_code = "bad_request";
    error_message = "roomId가 필요합니다";
    return false;
  }
  PeerRefs refs;
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = connections_.find(conn_id);
  if (it == connections_.end()) {
    error_code = "not_connected";
    error_message = "등록되지 않은 연결입니다";
    return false;
  }
  if (it->second.room && *it->second.room == room_id) {
    for (const auto& member_id : rooms_[room_id]) {
      if (member_id != conn_id) {
        peers.push_back(member_id);
      }
    }
    return true;
  }
  auto room_it = rooms_.find(room_id);
  std::size_t occupancy = room_it == rooms_.end() ? 0 : room_it->second.size();
  if (config_.room_capacity > 0 && occupancy >= config_.room_capacity) {
    error_code = "room_full";
    error_message = "방 정원이 가득 찼습니다";
    return false;
  }

  LeaveRoomLocked(conn_id, it->second, refs);
  auto& members = rooms_[room_id];
  peers = members;
  // 잠금을 쥔 채 전달해야 동시 입장 시에도 입장 순서대로 알림이 나간다.
  for (const auto& member_id : members) {
    if (auto member = LockPeerLocked(member_id, refs)) {
      member->SendServerEvent("peer-joined", {{"connId", conn_id}});
    }
  }
  members.push_back(conn_id);
  it->second.room = room_id;
  if (observability_) {
    observability_->LogEvent(LogLevel::kInfo, "relay.joined",
                             {{"connId", conn_id}, {"roomId", room_id}, {"members", members.size()}});
  }
  return true;
}

RelayOutcome SignalingRelay::SendOffer(const std::string& sender_id, const std::string& target_id,
                                       const std::string& caller_id, const nlohmann::json& signal,
                                       std::string& error_code, std::string& error_message) {
  PeerRefs refs;
  std::lock_guard<std::mutex> lock(mutex_);
  if (config_.require_shared_room && !SharesRoomLocked(sender_id, target_id)) {
    error_code = "not_in_room";
    error_message = "같은 방에 있는 상대에게만 offer를 보낼 수 있습니다";
    return RelayOutcome::kRejected;
  }
  auto target = LockPeerLocked(target_id, refs);
  if (!target) {
    Record(false, "relay.offer", sender_id, target_id);
    return RelayOutcome::kDropped;
  }
  target->SendServerEvent("receive-offer",
                          {{"callerId", caller_id.empty() ? sender_id : caller_id}, {"signal", signal}});
  Record(true, "relay.offer", sender_id, target_id);
  return RelayOutcome::kDelivered;
}

RelayOutcome SignalingRelay::AcceptOffer(const std::string& responder_id, const std::string& caller_id,
                                         const nlohmann::json& signal, std::string& error_code,
                                         std::string& error_message) {
  PeerRefs refs;
  std::lock_guard<std::mutex> lock(mutex_);
  if (config_.require_shared_room && !SharesRoomLocked(responder_id, caller_id)) {
    error_code = "not_in_room";
    error_message = "같은 방에 있는 상대에게만 answer를 보낼 수 있습니다";
    return RelayOutcome::kRejected;
  }
  auto caller = LockPeerLocked(caller_id, refs);
  if (!caller) {
    Record(false, "relay.answer", responder_id, caller_id);
    return RelayOutcome::kDropped;
  }
  caller->SendServerEvent("call-accepted", {{"responderId", responder_id}, {"signal", signal}});
  Record(true, "relay.answer", responder_id, caller_id);
  return RelayOutcome::kDelivered;
}

std::optional<std::string> SignalingRelay::RoomOf(const std::string& conn_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = connections_.find(conn_id);
  if (it == connections_.end()) {
    return std::nullopt;
  }
  return it->second.room;
}

std::vector<std::string> SignalingRelay::RoomMembers(const std::string& room_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = rooms_.find(room_id);
  if (it == rooms_.end()) {
    return {};
  }
  return it->second;
}

std::size_t SignalingRelay::ActiveConnections() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connections_.size();
}

std::size_t SignalingRelay::RoomCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return rooms_.size();
}

void SignalingRelay::LeaveRoomLocked(const std::string& conn_id, Entry& entry, PeerRefs& refs) {
  if (!entry.room) {
    return;
  }
  auto room_it = rooms_.find(*entry.room);
  entry.room.reset();
  if (room_it == rooms_.end()) {
    return;
  }
  auto& members = room_it->second;
  members.erase(std::remove(members.begin(), members.end(), conn_id), members.end());
  if (config_.notify_peer_left) {
    for (const auto& member_id : members) {
      if (auto member = LockPeerLocked(member_id, refs)) {
        member->SendServerEvent("peer-left", {{"connId", conn_id}});
      }
    }
  }
  if (members.empty()) {
    rooms_.erase(room_it);
  }
}

std::shared_ptr<SignalingPeer> SignalingRelay::LockPeerLocked(const std::string& conn_id, PeerRefs& refs) const {
  auto it = connections_.find(conn_id);
  if (it == connections_.end()) {
    return nullptr;
  }
  auto peer = it->second.peer.lock();
  if (peer) {
    refs.push_back(peer);
  }
  return peer;
}

bool SignalingRelay::SharesRoomLocked(const std::string& a, const std::string& b) const {
  auto a_it = connections_.find(a);
  auto b_it = connections_.find(b);
  if (a_it == connections_.end() || b_it == connections_.end()) {
    return false;
  }
  return a_it->second.room && b_it->second.room && *a_it->second.room == *b_it->second.room;
}

void SignalingRelay::Record(bool delivered, const std::string& name, const std::string& from,
                            const std::string& to) const {
  if (!observability_) {
    return;
  }
  if (delivered) {
    observability_->IncrementSignalRelayed();
  } else {
    observability_->IncrementSignalDropped();
  }
  observability_->LogEvent(delivered ? LogLevel::kDebug : LogLevel::kInfo, name,
                           {{"from", from}, {"to", to}, {"delivered", delivered}});
}

}  // namespace meetlink
