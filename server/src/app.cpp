/*
 * 설명: 서버 수명주기, 구성요소 조립, 리스닝 스레드와 만료 세션 정리 타이머를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp, server/tests/e2e/invite_flow_test.cpp
 */
#include "meetlink/app.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "meetlink/http_session.hpp"
#include "meetlink/mariadb_meeting_store.hpp"
#include "meetlink/token_generator.hpp"

namespace meetlink {

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint, const AppConfig& config,
           std::shared_ptr<MeetingLifecycleService> lifecycle, std::shared_ptr<MeetingRegistry> registry,
           std::shared_ptr<SignalingRelay> relay, std::shared_ptr<Observability> observability)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), config_(config), lifecycle_(std::move(lifecycle)),
        registry_(std::move(registry)), relay_(std::move(relay)), observability_(std::move(observability)) {
    boost::beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }
  }

  void Run() { DoAccept(); }

  void Stop() {
    boost::beast::error_code ec;
    acceptor_.close(ec);
  }

 private:
  void DoAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            std::make_shared<HttpSession>(std::move(socket), self->config_, self->lifecycle_, self->registry_,
                                          self->relay_, self->observability_)
                ->Run();
          }
          if (self->acceptor_.is_open()) {
            self->DoAccept();
          }
        });
  }

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  AppConfig config_;
  std::shared_ptr<MeetingLifecycleService> lifecycle_;
  std::shared_ptr<MeetingRegistry> registry_;
  std::shared_ptr<SignalingRelay> relay_;
  std::shared_ptr<Observability> observability_;
};

ServerApp::ServerApp(const AppConfig& config)
    : config_(config), ioc_(), work_guard_(boost::asio::make_work_guard(ioc_)), sweep_timer_(ioc_) {
  observability_ = std::make_shared<Observability>(ParseLogLevel(config.log_level).value_or(LogLevel::kInfo));
  if (config.store_backend == "mariadb") {
    DbConfig db_config{config.db_host, config.db_port, config.db_user, config.db_password, config.db_name};
    db_client_ = std::make_shared<MariaDbClient>(db_config);
    store_ = std::make_shared<MariaDbMeetingStore>(db_client_);
  } else {
    store_ = std::make_shared<InMemoryMeetingStore>();
  }
  RegistryConfig registry_config;
  registry_config.session_ttl = std::chrono::seconds(config.session_ttl_seconds);
  registry_ = std::make_shared<MeetingRegistry>(store_, TokenGenerator(config.token_max_attempts), registry_config);
  notifier_ = MakeNotifier(config.notifier, observability_);
  lifecycle_ = std::make_shared<MeetingLifecycleService>(registry_, notifier_, observability_, config.join_link_base);
  RelayConfig relay_config;
  relay_config.room_capacity = config.relay_room_capacity;
  relay_config.require_shared_room = config.relay_require_shared_room;
  relay_config.notify_peer_left = config.relay_notify_peer_left;
  relay_ = std::make_shared<SignalingRelay>(relay_config);
  relay_->SetObservability(observability_);
}

ServerApp::~ServerApp() { Stop(); }

void ServerApp::Run() {
  try {
    running_ = true;
    boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::tcp::v4(), config_.port};
    listener_ = std::make_shared<Listener>(ioc_, endpoint, config_, lifecycle_, registry_, relay_, observability_);
    listener_->Run();
    if (config_.sweep_interval_seconds > 0) {
      ScheduleSweep();
    }
    std::cout << "서버 시작: 포트 " << config_.port << ", 저장소 " << config_.store_backend << "\n";
    RunWorkers();
    ioc_.run();
  } catch (const std::exception& ex) {
    std::cerr << "서버 실행 중 예외: " << ex.what() << "\n";
  }
}

void ServerApp::RunWorkers() {
  const unsigned int thread_count =
      config_.worker_threads > 0 ? static_cast<unsigned int>(config_.worker_threads)
                                 : std::max(1u, std::thread::hardware_concurrency());
  // 현재 스레드도 run()을 호출하므로 워커는 thread_count - 1개만 생성한다.
  for (unsigned int i = 0; i + 1 < thread_count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void ServerApp::ScheduleSweep() {
  sweep_timer_.expires_after(std::chrono::seconds(config_.sweep_interval_seconds));
  sweep_timer_.async_wait([this](const boost::system::error_code& ec) { OnSweep(ec); });
}

void ServerApp::OnSweep(const boost::system::error_code& ec) {
  if (ec) {
    return;
  }
  try {
    auto erased = registry_->SweepExpired(std::chrono::seconds(config_.sweep_retention_seconds));
    if (erased > 0) {
      observability_->LogEvent(LogLevel::kInfo, "meeting.swept", {{"erased", erased}});
    }
  } catch (const DbException& ex) {
    observability_->LogEvent(LogLevel::kError, "meeting.sweep_failed", {{"error", ex.what()}});
  }
  ScheduleSweep();
}

void ServerApp::Stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  work_guard_.reset();
  if (listener_) {
    listener_->Stop();
  }
  ioc_.stop();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

AppConfig LoadConfigFromEnv() {
  auto get_env = [](const char* key, const char* def) -> std::string {
    const char* val = std::getenv(key);
    return val ? std::string{val} : std::string{def};
  };
  auto get_flag = [&](const char* key, const char* def) {
    auto value = get_env(key, def);
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return std::tolower(c); });
    return value == "1" || value == "true" || value == "yes";
  };

  // 숫자가 아니거나 [min, max] 밖이면 std::invalid_argument 를 던진다.
  auto get_number = [&](const char* key, const char* def, unsigned long long min, unsigned long long max) {
    auto value = get_env(key, def);
    unsigned long long parsed = 0;
    bool valid = !value.empty() && std::all_of(value.begin(), value.end(), [](unsigned char c) {
      return std::isdigit(c) != 0;
    });
    if (valid) {
      try {
        parsed = std::stoull(value);
      } catch (const std::out_of_range&) {
        valid = false;
      }
    }
    if (!valid || parsed < min || parsed > max) {
      throw std::invalid_argument(std::string(key) + " 는 " + std::to_string(min) + ".." + std::to_string(max) +
                                  " 범위의 정수여야 합니다: " + value);
    }
    return parsed;
  };
  constexpr unsigned long long kMaxPort = 65535;
  constexpr unsigned long long kMaxSeconds = 365ULL * 24 * 60 * 60;

  AppConfig cfg;
  cfg.port = static_cast<unsigned short>(get_number("SERVER_PORT", "8080", 1, kMaxPort));
  cfg.worker_threads = static_cast<std::size_t>(get_number("WORKER_THREADS", "0", 0, 256));
  cfg.join_link_base = get_env("JOIN_LINK_BASE", "http://localhost:3000/schedule");
  cfg.cors_origin = get_env("CORS_ORIGIN", "*");
  cfg.session_ttl_seconds = static_cast<std::size_t>(get_number("SESSION_TTL_SECONDS", "1800", 1, kMaxSeconds));
  cfg.token_max_attempts = static_cast<std::size_t>(get_number("TOKEN_MAX_ATTEMPTS", "16", 1, 1000));
  cfg.store_backend = get_env("STORE_BACKEND", "memory");
  cfg.db_host = get_env("DB_HOST", "mariadb");
  cfg.db_port = static_cast<unsigned short>(get_number("DB_PORT", "3306", 1, kMaxPort));
  cfg.db_user = get_env("DB_USER", "app");
  cfg.db_password = get_env("DB_PASSWORD", "app_pass");
  cfg.db_name = get_env("DB_NAME", "app_db");
  cfg.sweep_interval_seconds =
      static_cast<std::size_t>(get_number("SWEEP_INTERVAL_SECONDS", "0", 0, kMaxSeconds));
  cfg.sweep_retention_seconds =
      static_cast<std::size_t>(get_number("SWEEP_RETENTION_SECONDS", "86400", 0, kMaxSeconds));
  cfg.notifier = get_env("NOTIFIER", "log");
  cfg.log_level = get_env("LOG_LEVEL", "info");
  cfg.ws_queue_limit_messages =
      static_cast<std::size_t>(get_number("WS_QUEUE_LIMIT_MESSAGES", "64", 1, 1000000));
  cfg.ws_queue_limit_bytes =
      static_cast<std::size_t>(get_number("WS_QUEUE_LIMIT_BYTES", "262144", 1, 1ULL << 32));
  cfg.relay_room_capacity = static_cast<std::size_t>(get_number("RELAY_ROOM_CAPACITY", "2", 0, 1000));
  cfg.relay_require_shared_room = get_flag("RELAY_REQUIRE_SHARED_ROOM", "false");
  cfg.relay_notify_peer_left = get_flag("RELAY_NOTIFY_PEER_LEFT", "false");

  if (cfg.store_backend != "memory" && cfg.store_backend != "mariadb") {
    throw std::invalid_argument("STORE_BACKEND 는 memory 또는 mariadb 여야 합니다: " + cfg.store_backend);
  }
  if (cfg.notifier != "log" && cfg.notifier != "disabled") {
    throw std::invalid_argument("NOTIFIER 는 log 또는 disabled 여야 합니다: " + cfg.notifier);
  }
  if (!ParseLogLevel(cfg.log_level)) {
    throw std::invalid_argument("LOG_LEVEL 값이 올바르지 않습니다: " + cfg.log_level);
  }
  return cfg;
}

}  // namespace meetlink
