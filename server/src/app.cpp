/*
 * 설명: 서버 구성 요소를 조립하고 리스너/워커 스레드/시그널 처리를 포함한 수명주기를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/game_flow_test.cpp
 */
#include "chessroom/app.hpp"

#include <algorithm>
#include <csignal>
#include <cstdlib>

#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "chessroom/chess_rules.hpp"
#include "chessroom/game_repository.hpp"
#include "chessroom/http_session.hpp"
#include "chessroom/rating.hpp"

namespace chessroom {

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint, const AppConfig& config,
           std::shared_ptr<SessionManager> session_manager, std::shared_ptr<Observability> observability)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), config_(config),
        session_manager_(std::move(session_manager)), observability_(std::move(observability)) {
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

  unsigned short LocalPort() const {
    boost::beast::error_code ec;
    auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? 0 : endpoint.port();
  }

 private:
  void DoAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            std::make_shared<HttpSession>(std::move(socket), self->config_, self->session_manager_,
                                          self->observability_)
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
  std::shared_ptr<SessionManager> session_manager_;
  std::shared_ptr<Observability> observability_;
};

ServerApp::ServerApp(const AppConfig& config)
    : config_(config), ioc_(), work_guard_(boost::asio::make_work_guard(ioc_)), signals_(ioc_, SIGINT, SIGTERM) {
  DbConfig db_config{config.db_host, config.db_port, config.db_user, config.db_password, config.db_name};
  db_client_ = std::make_shared<MariaDbClient>(db_config);
  auto repository = std::make_shared<GameRepository>(db_client_);
  auto rating_service = std::make_shared<RatingService>(db_client_);
  Assemble(std::make_shared<ResultService>(db_client_, repository, rating_service));
}

ServerApp::ServerApp(const AppConfig& config, std::shared_ptr<GameResultSink> result_sink)
    : config_(config), ioc_(), work_guard_(boost::asio::make_work_guard(ioc_)), signals_(ioc_, SIGINT, SIGTERM) {
  Assemble(std::move(result_sink));
}

ServerApp::~ServerApp() { Stop(); }

void ServerApp::Assemble(std::shared_ptr<GameResultSink> result_sink) {
  observability_ = std::make_shared<Observability>(ParseLogLevel(config_.log_level));
  rules_ = std::make_shared<ChessRules>();
  registry_ = std::make_shared<RoomRegistry>(rules_);
  hub_ = std::make_shared<ConnectionHub>();
  hub_->SetObservability(observability_);
  result_sink_ = std::move(result_sink);
  session_manager_ = std::make_shared<SessionManager>(registry_, hub_, result_sink_, observability_);
}

void ServerApp::Start() {
  if (running_.exchange(true)) {
    return;
  }
  boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::tcp::v4(), config_.port};
  listener_ = std::make_shared<Listener>(ioc_, endpoint, config_, session_manager_, observability_);
  listener_->Run();

  std::size_t thread_count = config_.worker_threads;
  if (thread_count == 0) {
    thread_count = std::max(1u, std::thread::hardware_concurrency());
  }
  RunWorkers(thread_count);
  observability_->Log(LogContext{LogLevel::kInfo, "server.start", "", std::nullopt, std::nullopt, std::nullopt,
                                 "서버 시작: 포트 " + std::to_string(BoundPort()) + ", 워커 " +
                                     std::to_string(thread_count)});
}

void ServerApp::Run() {
  try {
    Start();
    signals_.async_wait([this](const boost::system::error_code& ec, int signal_number) {
      if (ec) {
        return;
      }
      observability_->Log(LogContext{LogLevel::kInfo, "server.signal", "", std::nullopt, std::nullopt, std::nullopt,
                                     "시그널 " + std::to_string(signal_number) + " 수신, 종료합니다"});
      work_guard_.reset();
      if (listener_) {
        listener_->Stop();
      }
      ioc_.stop();
    });
    ioc_.run();
  } catch (const std::exception& ex) {
    observability_->Log(LogContext{LogLevel::kError, "server.failed", "", std::nullopt, std::nullopt, std::nullopt,
                                   std::string("서버 실행 중 예외: ") + ex.what()});
  }
  Stop();
}

void ServerApp::RunWorkers(std::size_t count) {
  for (std::size_t i = 0; i < count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void ServerApp::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  boost::system::error_code ignored;
  signals_.cancel(ignored);
  work_guard_.reset();
  if (listener_) {
    listener_->Stop();
  }
  ioc_.stop();
  for (auto& worker : workers_) {
    if (worker.joinable() && worker.get_id() != std::this_thread::get_id()) {
      worker.join();
    }
  }
  workers_.clear();
}

unsigned short ServerApp::BoundPort() const { return listener_ ? listener_->LocalPort() : 0; }

AppConfig LoadConfigFromEnv() {
  auto get_env = [](const char* key, const char* def) -> std::string {
    const char* val = std::getenv(key);
    return val ? std::string{val} : std::string{def};
  };

  AppConfig cfg;
  cfg.port = static_cast<unsigned short>(std::stoi(get_env("SERVER_PORT", "8000")));
  cfg.db_host = get_env("DB_HOST", "mariadb");
  cfg.db_port = static_cast<unsigned short>(std::stoi(get_env("DB_PORT", "3306")));
  cfg.db_user = get_env("DB_USER", "app");
  cfg.db_password = get_env("DB_PASSWORD", "app_pass");
  cfg.db_name = get_env("DB_NAME", "chess_db");
  cfg.log_level = get_env("LOG_LEVEL", "info");
  cfg.ws_queue_limit_messages = static_cast<std::size_t>(std::stoul(get_env("WS_QUEUE_LIMIT_MESSAGES", "64")));
  cfg.ws_queue_limit_bytes = static_cast<std::size_t>(std::stoul(get_env("WS_QUEUE_LIMIT_BYTES", "262144")));
  cfg.worker_threads = static_cast<std::size_t>(std::stoul(get_env("WORKER_THREADS", "0")));
  return cfg;
}

}  // namespace chessroom
