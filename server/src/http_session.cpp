/*
 * 설명: HTTP 요청을 라우팅하고(CORS 포함) 룸 경로의 WS 업그레이드를 WebSocketSession으로 넘긴다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/protocol_test.cpp, server/tests/e2e/game_flow_test.cpp
 */
#include "chessroom/http_session.hpp"

#include <cctype>
#include <stdexcept>
#include <unordered_map>

#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <nlohmann/json.hpp>

#include "chessroom/protocol.hpp"
#include "chessroom/websocket_session.hpp"

namespace chessroom {
namespace {
constexpr const char* kServerName = "chessroom";
constexpr const char* kWebSocketPrefix = "/ws/";

std::unordered_map<std::string, std::string> ParseQueryParams(const std::string& query) {
  std::unordered_map<std::string, std::string> params;
  std::size_t pos = 0;
  while (pos < query.size()) {
    auto amp = query.find('&', pos);
    std::string pair = query.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
    auto eq = pair.find('=');
    if (eq != std::string::npos) {
      params.emplace(PercentDecode(pair.substr(0, eq)), PercentDecode(pair.substr(eq + 1)));
    }
    if (amp == std::string::npos) {
      break;
    }
    pos = amp + 1;
  }
  return params;
}

std::optional<int> ParseUserId(const std::string& value) {
  if (value.empty()) {
    return std::nullopt;
  }
  try {
    std::size_t idx = 0;
    int parsed = std::stoi(value, &idx);
    if (idx != value.size()) {
      return std::nullopt;
    }
    return parsed;
  } catch (const std::logic_error&) {
    return std::nullopt;
  }
}

int HexValue(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  return -1;
}
}  // namespace

std::string PercentDecode(const std::string& text) {
  std::string decoded;
  decoded.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (c == '+') {
      decoded.push_back(' ');
    } else if (c == '%' && i + 2 < text.size() && HexValue(text[i + 1]) >= 0 && HexValue(text[i + 2]) >= 0) {
      decoded.push_back(static_cast<char>(HexValue(text[i + 1]) * 16 + HexValue(text[i + 2])));
      i += 2;
    } else {
      decoded.push_back(c);
    }
  }
  return decoded;
}

std::optional<WebSocketTarget> ParseWebSocketTarget(const std::string& target) {
  std::string path = target;
  std::string query;
  auto qpos = target.find('?');
  if (qpos != std::string::npos) {
    path = target.substr(0, qpos);
    query = target.substr(qpos + 1);
  }
  const std::string prefix = kWebSocketPrefix;
  if (path.size() <= prefix.size() || path.compare(0, prefix.size(), prefix) != 0) {
    return std::nullopt;
  }
  std::string room_id = PercentDecode(path.substr(prefix.size()));
  if (room_id.empty() || room_id.find('/') != std::string::npos) {
    return std::nullopt;
  }

  WebSocketTarget parsed{room_id, JoinRequest{}};
  auto params = ParseQueryParams(query);
  if (auto it = params.find("user_id"); it != params.end()) {
    parsed.request.user_id = ParseUserId(it->second);
  }
  if (auto it = params.find("username"); it != params.end() && !it->second.empty()) {
    parsed.request.username = it->second;
  }
  if (auto it = params.find("preferred"); it != params.end()) {
    parsed.request.preference = ParseSeatPreference(it->second);
  }
  return parsed;
}

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
                         std::shared_ptr<SessionManager> session_manager, std::shared_ptr<Observability> observability)
    : stream_(std::move(socket)), config_(config), session_manager_(std::move(session_manager)),
      observability_(std::move(observability)) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  stream_.expires_after(std::chrono::seconds(30));
  boost::beast::http::async_read(stream_, buffer_, req_,
                                 [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
                                   self->OnRead(ec, bytes_transferred);
                                 });
}

void HttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::http::error::end_of_stream) {
    boost::beast::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
    return;
  }
  if (ec) {
    return;
  }
  if (boost::beast::websocket::is_upgrade(req_)) {
    return HandleWebSocket();
  }
  HandleRequest();
}

void HttpSession::HandleRequest() {
  using namespace boost::beast;
  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = observability_ ? observability_->NextTraceId() : std::string{};
  if (observability_) {
    observability_->IncrementRequest();
  }

  auto res = std::make_shared<Response>();
  res->version(req_.version());
  res->keep_alive(false);
  res->set(http::field::server, kServerName);
  res->set(http::field::access_control_allow_origin, "*");

  std::string target_str = std::string(req_.target());
  std::string path = target_str.substr(0, target_str.find('?'));

  if (req_.method() == http::verb::options) {
    res->set(http::field::access_control_allow_methods, "GET, OPTIONS");
    res->set(http::field::access_control_allow_headers, "*");
    res->result(http::status::no_content);
    res->prepare_payload();
    return SendResponse(res);
  }

  if (req_.method() == http::verb::get && path == "/") {
    nlohmann::json data{{"message", "Chess API is running"}};
    return SendJson(res, http::status::ok, data.dump());
  }

  if (req_.method() == http::verb::get && path == "/api/health") {
    nlohmann::json payload{{"status", "ok"}, {"version", "v1.0.0"}};
    return SendJson(res, http::status::ok, ToWireText(MakeSuccessEnvelope(payload)));
  }

  if (req_.method() == http::verb::get && path == "/online-users") {
    auto users = BuildOnlineUsersMessage(session_manager_->Hub()->OnlineUsers());
    return SendJson(res, http::status::ok, ToWireText(users));
  }

  if (req_.method() == http::verb::get && path == "/metrics") {
    auto snapshot = observability_->Snapshot(session_manager_->Registry()->Count());
    nlohmann::json data{{"requests", {{"total", snapshot.request_total}, {"errors", snapshot.request_errors}}},
                        {"connections", {{"websocket", snapshot.websocket_active}}},
                        {"rooms", {{"total", snapshot.rooms}}},
                        {"games",
                         {{"movesApplied", snapshot.moves_applied},
                          {"finished", snapshot.games_finished},
                          {"finalizeFailures", snapshot.finalize_failures}}}};
    return SendJson(res, http::status::ok, ToWireText(MakeSuccessEnvelope(data)));
  }

  SendJson(res, http::status::not_found, MakeErrorEnvelope("not_found", "요청한 경로를 찾을 수 없습니다").dump());
}

void HttpSession::SendJson(std::shared_ptr<Response> res, boost::beast::http::status status,
                           const std::string& body) {
  res->result(status);
  res->set(boost::beast::http::field::content_type, "application/json; charset=utf-8");
  res->body() = body;
  res->content_length(body.size());
  SendResponse(std::move(res));
}

void HttpSession::SendResponse(std::shared_ptr<Response> res) {
  auto self = shared_from_this();
  if (observability_) {
    bool failed = static_cast<unsigned>(res->result_int()) >= 400;
    if (failed) {
      observability_->IncrementError();
    }
    auto level = failed ? LogLevel::kWarn : LogLevel::kInfo;
    if (observability_->Enabled(level)) {
      auto latency =
          std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - request_start_)
              .count();
      observability_->Log(LogContext{level, "http.request", trace_id_, std::nullopt, std::nullopt, std::nullopt,
                                     std::string(req_.method_string()) + " " + std::string(req_.target()) + " " +
                                         std::to_string(res->result_int()),
                                     latency});
    }
  }
  boost::beast::http::async_write(stream_, *res, [self, res](boost::beast::error_code ec, std::size_t /*bytes*/) {
    if (ec) {
      return;
    }
    self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
  });
}

void HttpSession::HandleWebSocket() {
  auto target = ParseWebSocketTarget(std::string(req_.target()));
  if (!target) {
    request_start_ = std::chrono::steady_clock::now();
    trace_id_ = observability_ ? observability_->NextTraceId() : std::string{};
    auto res = std::make_shared<Response>();
    res->version(req_.version());
    res->set(boost::beast::http::field::server, kServerName);
    res->set(boost::beast::http::field::access_control_allow_origin, "*");
    return SendJson(res, boost::beast::http::status::not_found,
                    MakeErrorEnvelope("not_found", "WS 경로는 /ws/{room_id} 형식이어야 합니다").dump());
  }

  boost::beast::websocket::stream<boost::beast::tcp_stream> ws{std::move(stream_)};
  ws.set_option(boost::beast::websocket::stream_base::timeout::suggested(boost::beast::role_type::server));
  ws.set_option(boost::beast::websocket::stream_base::decorator([](boost::beast::websocket::response_type& res) {
    res.set(boost::beast::http::field::server, kServerName);
  }));
  // 피어가 곧바로 끊을 수 있어 업그레이드 실패는 예외가 아닌 오류 코드로 처리한다.
  boost::beast::error_code ec;
  ws.accept(req_, ec);
  if (ec) {
    if (observability_) {
      observability_->Log(LogContext{LogLevel::kWarn, "ws.accept_failed", "", target->room_id, std::nullopt,
                                     target->request.user_id, ec.message()});
    }
    boost::beast::error_code ignored;
    ws.next_layer().socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored);
    return;
  }
  std::make_shared<WebSocketSession>(std::move(ws), target->room_id, target->request, session_manager_,
                                     observability_, config_.ws_queue_limit_messages, config_.ws_queue_limit_bytes)
      ->Run();
}

}  // namespace chessroom
