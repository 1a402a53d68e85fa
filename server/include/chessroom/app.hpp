/*
 * 설명: 서버 전체 수명주기와 구성 요소 조립을 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/game_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>

#include "chessroom/config.hpp"
#include "chessroom/connection_hub.hpp"
#include "chessroom/db_client.hpp"
#include "chessroom/observability.hpp"
#include "chessroom/result_service.hpp"
#include "chessroom/room_registry.hpp"
#include "chessroom/rules_engine.hpp"
#include "chessroom/session_manager.hpp"

namespace chessroom {

class Listener;

class ServerApp {
 public:
  explicit ServerApp(const AppConfig& config);
  // 테스트에서 DB 대신 기록용 싱크를 주입한다.
  ServerApp(const AppConfig& config, std::shared_ptr<GameResultSink> result_sink);
  ~ServerApp();

  // 리스너와 워커 스레드를 띄우고 바로 반환한다.
  void Start();
  // Start 후 SIGINT/SIGTERM 또는 Stop까지 현재 스레드에서 이벤트 루프를 돈다.
  void Run();
  void Stop();

  unsigned short BoundPort() const;

  boost::asio::io_context& GetContext() { return ioc_; }
  const AppConfig& GetConfig() const { return config_; }
  std::shared_ptr<SessionManager> GetSessionManager() { return session_manager_; }
  std::shared_ptr<RoomRegistry> GetRegistry() { return registry_; }
  std::shared_ptr<ConnectionHub> GetHub() { return hub_; }
  std::shared_ptr<Observability> GetObservability() { return observability_; }

 private:
  void Assemble(std::shared_ptr<GameResultSink> result_sink);
  void RunWorkers(std::size_t count);

  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  boost::asio::signal_set signals_;
  std::shared_ptr<Listener> listener_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<const RulesEngine> rules_;
  std::shared_ptr<RoomRegistry> registry_;
  std::shared_ptr<ConnectionHub> hub_;
  std::shared_ptr<MariaDbClient> db_client_;
  std::shared_ptr<GameResultSink> result_sink_;
  std::shared_ptr<SessionManager> session_manager_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
};

}  // namespace chessroom
