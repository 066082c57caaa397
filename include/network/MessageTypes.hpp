#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "core/MatchRecord.hpp"
#include "core/MoveSelector.hpp"
#include "core/Types.hpp"

namespace caro::net {

using core::MatchId;
using core::PlayerId;

enum class MessageKind : std::uint8_t {
    Hello,
    Welcome,
    CreateGame,
    JoinGame,
    GameCreated,
    MakeMove,
    MoveBroadcast,
    Forfeit,
    LeaveGame,
    GameOver,
    PlayerDisconnected,
    JoinQueue,
    LeaveQueue,
    QueueStatusRequest,
    QueueStatus,
    RegisterServer,
    UnregisterServer,
    ServerHeartbeat,
    PoolStatsRequest,
    PoolStatsReply,
    Ack,
    Error
};

// ---------- Player / game messages ----------

struct Hello {
    std::string username;
};

struct Welcome {
    PlayerId playerId{};
    std::string username;
    int rating{};
    int rank{};
    int wins{};
    int losses{};
    int draws{};
};

struct CreateGame {
    core::MatchMode mode{core::MatchMode::Ai};
    core::Difficulty difficulty{core::Difficulty::Medium}; // ai only
};

// Take the free seat of a waiting online game.
struct JoinGame {
    MatchId matchId{};
};

struct GameCreated {
    MatchId matchId{};
    core::MatchMode mode{core::MatchMode::Ai};
    core::Symbol yourSymbol{core::Symbol::X};
    std::string opponent;  // empty while waiting
    std::string serverId;  // worker the game was placed on
};

struct MakeMove {
    MatchId matchId{};
    int row{};
    int col{};
};

struct MoveBroadcast {
    MatchId matchId{};
    core::Move move;
    core::Symbol nextTurn{core::Symbol::X};
    bool gameOver{false};
    core::MatchResult result{core::MatchResult::None};
    std::vector<core::Position> winningLine;
    std::vector<core::EloChange> eloChanges;
};

struct Forfeit {
    MatchId matchId{};
};

struct LeaveGame {
    MatchId matchId{};
};

// Sent to both sides when a match ends without a winning move.
struct GameOver {
    MatchId matchId{};
    core::MatchStatus status{core::MatchStatus::Completed};
    core::MatchResult result{core::MatchResult::None};
    std::string reason;    // "forfeit", "disconnect"
    std::vector<core::EloChange> eloChanges;
};

// Sent to the remaining player.
struct PlayerDisconnected {
    MatchId matchId{};
    PlayerId playerId{};
    core::MatchResult result{core::MatchResult::None};
    bool opponentConnected{false};   // the remaining player still has a live connection
    std::vector<core::EloChange> eloChanges;
};

// ---------- Matchmaking ----------

struct JoinQueue {};
struct LeaveQueue {};
struct QueueStatusRequest {};

struct QueueStatus {
    std::string state;     // "matched", "searching", "not_in_queue"
    MatchId matchId{};
    core::Symbol yourSymbol{core::Symbol::X};
    std::string opponent;
    int opponentRating{};
    std::size_t position{};
    std::size_t queueSize{};
    int rangeMin{};
    int rangeMax{};
};

// ---------- Server pool administration ----------

struct RegisterServer {
    std::string serverId;
    std::string address;
    int capacity{};
    std::string region;
};

struct UnregisterServer {
    std::string serverId;
};

struct ServerHeartbeat {
    std::string serverId;
    std::optional<double> cpuPercent;
    std::optional<double> memoryPercent;
    std::optional<int> activeSessions;
};

struct PoolStatsRequest {};

struct RegionStatsDTO {
    std::string region;
    std::size_t servers{};
    int capacity{};
    int activeSessions{};
};

struct PoolStatsReply {
    std::size_t totalServers{};
    std::size_t healthyServers{};
    std::size_t unhealthyServers{};
    int totalCapacity{};
    int totalActive{};
    double utilizationPercent{};
    std::vector<RegionStatsDTO> regions;
};

struct Ack {
    std::string what;
};

struct ErrorMessage {
    std::string description;
};

// ---------- Message envelope ----------

using MessagePayload = std::variant<
    Hello,
    Welcome,
    CreateGame,
    JoinGame,
    GameCreated,
    MakeMove,
    MoveBroadcast,
    Forfeit,
    LeaveGame,
    GameOver,
    PlayerDisconnected,
    JoinQueue,
    LeaveQueue,
    QueueStatusRequest,
    QueueStatus,
    RegisterServer,
    UnregisterServer,
    ServerHeartbeat,
    PoolStatsRequest,
    PoolStatsReply,
    Ack,
    ErrorMessage
>;

struct Message {
    MessageKind kind;
    MessagePayload payload;
};

} // namespace caro::net
