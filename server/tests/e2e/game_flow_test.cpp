#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/beast/websocket.hpp>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "chessroom/app.hpp"

namespace {

using WsStream = boost::beast::websocket::stream<boost::beast::tcp_stream>;

class RecordingSink : public chessroom::GameResultSink {
 public:
  bool RecordFinishedGame(const chessroom::GameRecord& record) override {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.push_back(record);
    return false;
  }

  std::vector<chessroom::GameRecord> Records() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_;
  }

 private:
  mutable std::mutex mutex_;
  std::vector<chessroom::GameRecord> records_;
};

struct SimpleHttpResponse {
  boost::beast::http::response<boost::beast::http::string_body> raw;
  nlohmann::json body;
};

class GameFlowFixture : public ::testing::Test {
 protected:
  void SetUp() override {
    chessroom::AppConfig config{};
    config.port = 0;
    config.log_level = "warn";
    config.ws_queue_limit_messages = 64;
    config.ws_queue_limit_bytes = 262144;
    config.worker_threads = 2;
    sink_ = std::make_shared<RecordingSink>();
    app_ = std::make_unique<chessroom::ServerApp>(config, sink_);
    app_->Start();
    port_ = app_->BoundPort();
    ASSERT_NE(port_, 0);
  }

  void TearDown() override {
    if (app_) {
      app_->Stop();
    }
  }

  SimpleHttpResponse Request(boost::beast::http::verb verb, const std::string& target) {
    boost::asio::io_context ioc;
    boost::asio::ip::tcp::resolver resolver{ioc};
    boost::beast::tcp_stream stream{ioc};
    stream.connect(resolver.resolve("127.0.0.1", std::to_string(port_)));

    boost::beast::http::request<boost::beast::http::string_body> req{verb, target, 11};
    req.set(boost::beast::http::field::host, "127.0.0.1");
    req.set(boost::beast::http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    boost::beast::http::write(stream, req);

    boost::beast::flat_buffer buffer;
    SimpleHttpResponse result;
    boost::beast::http::read(stream, buffer, result.raw);
    if (!result.raw.body().empty()) {
      result.body = nlohmann::json::parse(result.raw.body());
    }
    boost::beast::error_code ec;
    stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    return result;
  }

  std::unique_ptr<WsStream> OpenSocket(boost::asio::io_context& ioc, const std::string& target) {
    boost::asio::ip::tcp::resolver resolver{ioc};
    auto ws = std::make_unique<WsStream>(ioc);
    boost::beast::get_lowest_layer(*ws).connect(resolver.resolve("127.0.0.1", std::to_string(port_)));
    boost::beast::get_lowest_layer(*ws).expires_after(std::chrono::seconds(5));
    ws->handshake("127.0.0.1", target);
    return ws;
  }

  static nlohmann::json ReadJson(WsStream& ws) {
    boost::beast::flat_buffer buffer;
    boost::beast::get_lowest_layer(ws).expires_after(std::chrono::seconds(5));
    ws.read(buffer);
    return nlohmann::json::parse(boost::beast::buffers_to_string(buffer.data()));
  }

  static void SendMove(WsStream& ws, const std::string& move) {
    ws.text(true);
    ws.write(boost::asio::buffer(nlohmann::json{{"type", "move"}, {"move", move}}.dump()));
  }

  std::vector<chessroom::GameRecord> WaitForRecords(std::size_t expected) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
    auto records = sink_->Records();
    while (records.size() < expected && std::chrono::steady_clock::now() < deadline) {
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
      records = sink_->Records();
    }
    return records;
  }

  std::shared_ptr<RecordingSink> sink_;
  std::unique_ptr<chessroom::ServerApp> app_;
  unsigned short port_{0};
};

TEST_F(GameFlowFixture, HttpSurfaceAnswersWithCors) {
  auto root = Request(boost::beast::http::verb::get, "/");
  EXPECT_EQ(root.raw.result(), boost::beast::http::status::ok);
  EXPECT_EQ(root.body["message"], "Chess API is running");
  EXPECT_EQ(root.raw[boost::beast::http::field::access_control_allow_origin], "*");

  auto health = Request(boost::beast::http::verb::get, "/api/health");
  EXPECT_EQ(health.raw.result(), boost::beast::http::status::ok);
  EXPECT_TRUE(health.body["success"].get<bool>());
  EXPECT_EQ(health.body["data"]["status"], "ok");

  auto preflight = Request(boost::beast::http::verb::options, "/online-users");
  EXPECT_EQ(preflight.raw.result(), boost::beast::http::status::no_content);
  EXPECT_EQ(preflight.raw[boost::beast::http::field::access_control_allow_origin], "*");

  auto missing = Request(boost::beast::http::verb::get, "/nope");
  EXPECT_EQ(missing.raw.result(), boost::beast::http::status::not_found);
  EXPECT_FALSE(missing.body["success"].get<bool>());
  EXPECT_EQ(missing.body["error"]["code"], "not_found");

  auto users = Request(boost::beast::http::verb::get, "/online-users");
  EXPECT_TRUE(users.body.is_array());
  EXPECT_TRUE(users.body.empty());
}

TEST_F(GameFlowFixture, ScriptedMateReachesEveryoneAndRecordsOnce) {
  boost::asio::io_context ioc;
  auto white = OpenSocket(ioc, "/ws/R1?user_id=1&username=alice&preferred=w");
  auto white_state = ReadJson(*white);
  EXPECT_EQ(white_state["type"], "state");
  EXPECT_EQ(white_state["color"], "w");
  EXPECT_EQ(white_state["fen"], std::string(chessroom::Position::kStartFen));

  auto black = OpenSocket(ioc, "/ws/R1?user_id=2&username=bob&preferred=b");
  EXPECT_EQ(ReadJson(*black)["color"], "b");
  auto watcher = OpenSocket(ioc, "/ws/R1");
  EXPECT_EQ(ReadJson(*watcher)["color"], "spectator");

  SendMove(*black, "e7e5");
  auto turn_error = ReadJson(*black);
  EXPECT_EQ(turn_error["type"], "error");
  EXPECT_EQ(turn_error["message"], "It is not your turn");

  black->text(true);
  black->write(boost::asio::buffer(std::string("{broken")));
  EXPECT_EQ(ReadJson(*black)["message"], "Malformed message");

  SendMove(*watcher, "e2e4");
  EXPECT_EQ(ReadJson(*watcher)["message"], "Spectators cannot make moves");

  const std::vector<std::pair<WsStream*, std::string>> script{
      {white.get(), "f2f3"}, {black.get(), "e7e5"}, {white.get(), "g2g4"}, {black.get(), "d8h4"}};
  nlohmann::json last_white;
  nlohmann::json last_black;
  nlohmann::json last_watcher;
  for (const auto& [sender, move] : script) {
    SendMove(*sender, move);
    last_white = ReadJson(*white);
    last_black = ReadJson(*black);
    last_watcher = ReadJson(*watcher);
    EXPECT_EQ(last_white["last_move"], move);
    EXPECT_EQ(last_black["last_move"], move);
    EXPECT_EQ(last_watcher["last_move"], move);
  }

  EXPECT_EQ(last_white["color"], "w");
  EXPECT_EQ(last_black["color"], "b");
  EXPECT_EQ(last_watcher["color"], "spectator");
  for (const auto& state : {last_white, last_black, last_watcher}) {
    EXPECT_EQ(state["game_over"], true);
    EXPECT_EQ(state["result"], "black");
    EXPECT_EQ(state["reason"], "checkmate");
    EXPECT_EQ(state["fen"], last_white["fen"]);
  }

  SendMove(*white, "a2a3");
  EXPECT_EQ(ReadJson(*white)["message"], "Game is already over");

  auto records = WaitForRecords(1);
  ASSERT_EQ(records.size(), 1u);
  EXPECT_EQ(records[0].room_id, "R1");
  EXPECT_EQ(records[0].moves, "f2f3 e7e5 g2g4 d8h4");
  EXPECT_EQ(records[0].white_user_id, std::optional<int>(1));
  EXPECT_EQ(records[0].black_user_id, std::optional<int>(2));

  auto users = Request(boost::beast::http::verb::get, "/online-users");
  ASSERT_TRUE(users.body.is_array());
  ASSERT_EQ(users.body.size(), 2u);
  EXPECT_EQ(users.body[0]["user_id"], 1);
  EXPECT_EQ(users.body[0]["username"], "alice");
  EXPECT_EQ(users.body[1]["username"], "bob");

  auto metrics = Request(boost::beast::http::verb::get, "/metrics");
  EXPECT_EQ(metrics.body["data"]["games"]["movesApplied"], 4);
  EXPECT_EQ(metrics.body["data"]["games"]["finished"], 1);
  EXPECT_EQ(metrics.body["data"]["connections"]["websocket"], 3);
  EXPECT_EQ(metrics.body["data"]["rooms"]["total"], 1);

  for (auto* ws : {white.get(), black.get(), watcher.get()}) {
    boost::beast::error_code ec;
    ws->close(boost::beast::websocket::close_code::normal, ec);
  }
}

TEST_F(GameFlowFixture, DisconnectFreesSeatForNextPlayer) {
  boost::asio::io_context ioc;
  {
    auto first = OpenSocket(ioc, "/ws/R2?preferred=w");
    EXPECT_EQ(ReadJson(*first)["color"], "w");
    first->close(boost::beast::websocket::close_code::normal);
  }

  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
  while (app_->GetHub()->RoomConnections("R2") != 0 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
  ASSERT_EQ(app_->GetHub()->RoomConnections("R2"), 0u);

  auto second = OpenSocket(ioc, "/ws/R2");
  EXPECT_EQ(ReadJson(*second)["color"], "w");
  boost::beast::error_code ec;
  second->close(boost::beast::websocket::close_code::normal, ec);
}

}  // namespace
