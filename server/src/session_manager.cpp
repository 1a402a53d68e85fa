/*
 * 설명: 좌석 배정 후 초기 상태 전송, 수 적용 브로드캐스트, 종료 게임의 결과/레이팅 저장을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/session_manager_test.cpp, server/tests/e2e/game_flow_test.cpp
 */
#include "chessroom/session_manager.hpp"

#include <chrono>
#include <exception>

#include "chessroom/protocol.hpp"

namespace chessroom {

SessionManager::SessionManager(std::shared_ptr<RoomRegistry> registry, std::shared_ptr<ConnectionHub> hub,
                               std::shared_ptr<GameResultSink> result_sink,
                               std::shared_ptr<Observability> observability)
    : registry_(std::move(registry)), hub_(std::move(hub)), result_sink_(std::move(result_sink)),
      observability_(std::move(observability)) {}

Seat SessionManager::Connect(const std::string& room_id, ConnectionId connection, const JoinRequest& request,
                             const std::shared_ptr<ClientConnection>& client) {
  auto room = registry_->GetOrCreate(room_id);
  // 등록과 초기 상태 전송을 룸 잠금 안에서 끝내야 이후 브로드캐스트보다 먼저 도착한다.
  Seat seat = room->Join(connection, request, [&](Seat assigned, const std::string& fen) {
    hub_->Register(room_id, connection, assigned, client, request);
    hub_->SendTo(room_id, connection, ToWireText(BuildStateMessage(fen, assigned)));
  });

  if (observability_ && observability_->Enabled(LogLevel::kInfo)) {
    observability_->Log(LogContext{LogLevel::kInfo, "room.join", observability_->NextTraceId(), room_id, connection,
                                   request.user_id, "seat=" + std::string(ToString(seat))});
  }
  return seat;
}

MoveResult SessionManager::SubmitMove(const std::string& room_id, ConnectionId connection,
                                      std::string_view move_text) {
  auto room = registry_->Find(room_id);
  if (!room) {
    MoveResult missing;
    missing.status = MoveStatus::kNotSeated;
    missing.error_message = "Not seated in this room";
    return missing;
  }

  auto started = std::chrono::steady_clock::now();
  auto result = room->SubmitMove(connection, move_text, [&](const AppliedMove& applied) {
    hub_->Broadcast(room_id, [&applied](Seat seat) { return ToWireText(BuildStateMessage(applied, seat)); });
  });

  if (!result.Accepted()) {
    if (observability_ && observability_->Enabled(LogLevel::kDebug)) {
      observability_->Log(LogContext{LogLevel::kDebug, "move.rejected", observability_->NextTraceId(), room_id,
                                     connection, std::nullopt, result.error_message});
    }
    return result;
  }

  if (observability_) {
    observability_->IncrementMovesApplied();
    if (observability_->Enabled(LogLevel::kDebug)) {
      auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
      observability_->Log(LogContext{LogLevel::kDebug, "move.applied", observability_->NextTraceId(), room_id,
                                     connection, std::nullopt, std::string(move_text), latency.count()});
    }
  }

  // DB I/O는 룸 잠금 밖에서 수행한다.
  if (result.finished_game) {
    FinalizeGame(*result.finished_game);
  }
  return result;
}

void SessionManager::Disconnect(const std::string& room_id, ConnectionId connection) {
  if (auto room = registry_->Find(room_id)) {
    room->Leave(connection);
  }
  hub_->Unregister(room_id, connection);
  if (observability_ && observability_->Enabled(LogLevel::kInfo)) {
    observability_->Log(LogContext{LogLevel::kInfo, "room.leave", observability_->NextTraceId(), room_id, connection,
                                   std::nullopt, "disconnected"});
  }
}

void SessionManager::FinalizeGame(const GameRecord& record) {
  std::string summary = "game_id=" + record.game_id + " result=" + std::string(ToString(record.result)) +
                        " reason=" + std::string(ToString(record.reason));
  if (!result_sink_) {
    if (observability_) {
      observability_->IncrementGamesFinished();
    }
    return;
  }

  try {
    bool rated = result_sink_->RecordFinishedGame(record);
    if (observability_) {
      observability_->IncrementGamesFinished();
      observability_->Log(LogContext{LogLevel::kInfo, "game.finalized", observability_->NextTraceId(), record.room_id,
                                     std::nullopt, std::nullopt, summary + (rated ? " rated=true" : " rated=false")});
    }
  } catch (const DbException& ex) {
    if (observability_) {
      observability_->IncrementFinalizeFailures();
      observability_->Log(LogContext{LogLevel::kError, "game.finalize_failed", observability_->NextTraceId(),
                                     record.room_id, std::nullopt, std::nullopt,
                                     summary + " code=" + std::to_string(ex.code) + " " + ex.what()});
    }
  } catch (const std::exception& ex) {
    if (observability_) {
      observability_->IncrementFinalizeFailures();
      observability_->Log(LogContext{LogLevel::kError, "game.finalize_failed", observability_->NextTraceId(),
                                     record.room_id, std::nullopt, std::nullopt, summary + " " + ex.what()});
    }
  }
}

}  // namespace chessroom
