#include "network/Serialization.hpp"

#include <cstdio>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <unordered_map>
#include <vector>

namespace caro::net {

namespace {
    std::string escape(const std::string& s) {
        std::string out;
        out.reserve(s.size());
        for (char c : s) {
            if (c == ';' || c == '\\') {
                out.push_back('\\');
            }
            out.push_back(c);
        }
        return out;
    }

    // Split on unescaped ';' and unescape each field.
    std::vector<std::string> splitFields(const std::string& line) {
        std::vector<std::string> fields(1);
        bool esc = false;
        for (char c : line) {
            if (esc) {
                fields.back().push_back(c);
                esc = false;
            } else if (c == '\\') {
                esc = true;
            } else if (c == ';') {
                fields.emplace_back();
            } else {
                fields.back().push_back(c);
            }
        }
        if (esc) {
            throw std::invalid_argument("dangling escape");
        }
        return fields;
    }

    /// Sequential reader over the fields of one line. Every accessor throws
    /// std::invalid_argument / std::out_of_range on missing or malformed data.
    class FieldReader {
    public:
        explicit FieldReader(std::vector<std::string> fields)
            : m_fields(std::move(fields))
        {
        }

        const std::string& text() {
            if (m_next >= m_fields.size()) {
                throw std::invalid_argument("missing field");
            }
            return m_fields[m_next++];
        }

        long long integer() {
            const std::string& s = text();
            std::size_t used = 0;
            long long value = std::stoll(s, &used);
            if (used != s.size()) {
                throw std::invalid_argument("trailing characters in integer");
            }
            return value;
        }

        int i32() {
            const long long value = integer();
            if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
                throw std::out_of_range("integer field out of range");
            }
            return static_cast<int>(value);
        }

        std::uint64_t u64() {
            const std::string& s = text();
            if (!s.empty() && s[0] == '-') {
                throw std::invalid_argument("negative id");
            }
            std::size_t used = 0;
            auto value = std::stoull(s, &used);
            if (used != s.size()) {
                throw std::invalid_argument("trailing characters in id");
            }
            return static_cast<std::uint64_t>(value);
        }

        std::uint32_t u32() {
            const std::uint64_t value = u64();
            if (value > std::numeric_limits<std::uint32_t>::max()) {
                throw std::out_of_range("counter field out of range");
            }
            return static_cast<std::uint32_t>(value);
        }

        double real() {
            const std::string& s = text();
            std::size_t used = 0;
            double value = std::stod(s, &used);
            if (used != s.size()) {
                throw std::invalid_argument("trailing characters in number");
            }
            return value;
        }

        bool flag() { return i32() != 0; }

        // Empty field means "not reported".
        std::optional<double> optionalReal() {
            if (peekEmpty()) { ++m_next; return std::nullopt; }
            return real();
        }

        std::optional<int> optionalInt() {
            if (peekEmpty()) { ++m_next; return std::nullopt; }
            return i32();
        }

        bool done() const { return m_next == m_fields.size(); }

    private:
        bool peekEmpty() const {
            if (m_next >= m_fields.size()) {
                throw std::invalid_argument("missing field");
            }
            return m_fields[m_next].empty();
        }

        std::vector<std::string> m_fields;
        std::size_t m_next{0};
    };

    core::Symbol parseSymbol(const std::string& s) {
        if (s == "X") return core::Symbol::X;
        if (s == "O") return core::Symbol::O;
        throw std::invalid_argument("bad symbol: " + s);
    }

    core::MatchMode parseMode(const std::string& s) {
        if (s == "local")  return core::MatchMode::Local;
        if (s == "online") return core::MatchMode::Online;
        if (s == "ai")     return core::MatchMode::Ai;
        throw std::invalid_argument("bad mode: " + s);
    }

    core::MatchStatus parseStatus(const std::string& s) {
        if (s == "waiting")     return core::MatchStatus::Waiting;
        if (s == "in_progress") return core::MatchStatus::InProgress;
        if (s == "completed")   return core::MatchStatus::Completed;
        if (s == "abandoned")   return core::MatchStatus::Abandoned;
        throw std::invalid_argument("bad status: " + s);
    }

    core::MatchResult parseResult(const std::string& s) {
        if (s == "none")      return core::MatchResult::None;
        if (s == "black_win") return core::MatchResult::WinX;
        if (s == "white_win") return core::MatchResult::WinO;
        if (s == "draw")      return core::MatchResult::Draw;
        throw std::invalid_argument("bad result: " + s);
    }

    core::Difficulty parseLevel(const std::string& s) {
        auto d = core::parseDifficulty(s);
        if (!d) {
            throw std::invalid_argument("bad difficulty: " + s);
        }
        return *d;
    }

    std::string symbolText(core::Symbol s) {
        return std::string(1, core::toChar(s));
    }

    // "r,c|r,c|..." ; empty string for no cells.
    std::string encodeLine(const std::vector<core::Position>& cells) {
        std::ostringstream os;
        for (std::size_t i = 0; i < cells.size(); ++i) {
            if (i > 0) os << '|';
            os << cells[i].row << ',' << cells[i].col;
        }
        return os.str();
    }

    std::vector<core::Position> decodeLine(const std::string& text) {
        std::vector<core::Position> cells;
        if (text.empty()) {
            return cells;
        }
        std::istringstream is(text);
        std::string cell;
        while (std::getline(is, cell, '|')) {
            auto comma = cell.find(',');
            if (comma == std::string::npos) {
                throw std::invalid_argument("bad cell: " + cell);
            }
            cells.push_back(core::Position{std::stoi(cell.substr(0, comma)),
                                           std::stoi(cell.substr(comma + 1))});
        }
        return cells;
    }

    // count, then seven fields per change
    void writeElo(std::ostringstream& os, const std::vector<core::EloChange>& changes) {
        os << changes.size();
        for (const auto& c : changes) {
            os << ';' << c.userId << ';' << escape(c.username)
               << ';' << c.oldElo << ';' << c.newElo << ';' << c.change
               << ';' << c.oldRank << ';' << c.newRank;
        }
    }

    std::vector<core::EloChange> readElo(FieldReader& in) {
        const long long count = in.integer();
        if (count < 0 || count > 2) {
            throw std::invalid_argument("bad elo change count");
        }
        std::vector<core::EloChange> changes;
        for (long long i = 0; i < count; ++i) {
            core::EloChange c;
            c.userId   = in.u64();
            c.username = in.text();
            c.oldElo   = in.i32();
            c.newElo   = in.i32();
            c.change   = in.i32();
            c.oldRank  = in.i32();
            c.newRank  = in.i32();
            changes.push_back(std::move(c));
        }
        return changes;
    }

    template <typename T>
    std::string optionalText(const std::optional<T>& value) {
        if (!value) return {};
        std::ostringstream os;
        os << *value;
        return os.str();
    }
}

std::string toString(MessageKind kind)
{
    switch (kind) {
    case MessageKind::Hello:              return "HELLO";
    case MessageKind::Welcome:            return "WELCOME";
    case MessageKind::CreateGame:         return "CREATE_GAME";
    case MessageKind::JoinGame:           return "JOIN_GAME";
    case MessageKind::GameCreated:        return "GAME_CREATED";
    case MessageKind::MakeMove:           return "MAKE_MOVE";
    case MessageKind::MoveBroadcast:      return "MOVE";
    case MessageKind::Forfeit:            return "FORFEIT";
    case MessageKind::LeaveGame:          return "LEAVE_GAME";
    case MessageKind::GameOver:           return "GAME_OVER";
    case MessageKind::PlayerDisconnected: return "PLAYER_DISCONNECTED";
    case MessageKind::JoinQueue:          return "JOIN_QUEUE";
    case MessageKind::LeaveQueue:         return "LEAVE_QUEUE";
    case MessageKind::QueueStatusRequest: return "QUEUE_STATUS_REQUEST";
    case MessageKind::QueueStatus:        return "QUEUE_STATUS";
    case MessageKind::RegisterServer:     return "REGISTER_SERVER";
    case MessageKind::UnregisterServer:   return "UNREGISTER_SERVER";
    case MessageKind::ServerHeartbeat:    return "SERVER_HEARTBEAT";
    case MessageKind::PoolStatsRequest:   return "POOL_STATS_REQUEST";
    case MessageKind::PoolStatsReply:     return "POOL_STATS";
    case MessageKind::Ack:                return "ACK";
    case MessageKind::Error:              return "ERROR";
    }
    return "UNKNOWN";
}

std::optional<MessageKind> parseKind(const std::string& tag)
{
    static const std::unordered_map<std::string, MessageKind> byTag = [] {
        std::unordered_map<std::string, MessageKind> out;
        for (int k = 0; k <= static_cast<int>(MessageKind::Error); ++k) {
            const auto kind = static_cast<MessageKind>(k);
            out.emplace(toString(kind), kind);
        }
        return out;
    }();

    auto it = byTag.find(tag);
    if (it == byTag.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string serialize(const Message& msg)
{
    std::ostringstream os;
    os << toString(msg.kind);

    switch (msg.kind) {
    case MessageKind::Hello: {
        const auto& m = std::get<Hello>(msg.payload);
        os << ';' << escape(m.username);
        break;
    }
    case MessageKind::Welcome: {
        const auto& m = std::get<Welcome>(msg.payload);
        os << ';' << m.playerId << ';' << escape(m.username) << ';' << m.rating
           << ';' << m.rank << ';' << m.wins << ';' << m.losses << ';' << m.draws;
        break;
    }
    case MessageKind::CreateGame: {
        const auto& m = std::get<CreateGame>(msg.payload);
        os << ';' << core::toString(m.mode) << ';' << core::toString(m.difficulty);
        break;
    }
    case MessageKind::JoinGame: {
        os << ';' << std::get<JoinGame>(msg.payload).matchId;
        break;
    }
    case MessageKind::GameCreated: {
        const auto& m = std::get<GameCreated>(msg.payload);
        os << ';' << m.matchId << ';' << core::toString(m.mode)
           << ';' << symbolText(m.yourSymbol) << ';' << escape(m.opponent)
           << ';' << escape(m.serverId);
        break;
    }
    case MessageKind::MakeMove: {
        const auto& m = std::get<MakeMove>(msg.payload);
        os << ';' << m.matchId << ';' << m.row << ';' << m.col;
        break;
    }
    case MessageKind::MoveBroadcast: {
        const auto& m = std::get<MoveBroadcast>(msg.payload);
        os << ';' << m.matchId << ';' << m.move.row << ';' << m.move.col
           << ';' << symbolText(m.move.symbol) << ';' << m.move.sequence
           << ';' << symbolText(m.nextTurn) << ';' << (m.gameOver ? 1 : 0)
           << ';' << core::toString(m.result) << ';' << encodeLine(m.winningLine) << ';';
        writeElo(os, m.eloChanges);
        break;
    }
    case MessageKind::Forfeit: {
        os << ';' << std::get<Forfeit>(msg.payload).matchId;
        break;
    }
    case MessageKind::LeaveGame: {
        os << ';' << std::get<LeaveGame>(msg.payload).matchId;
        break;
    }
    case MessageKind::GameOver: {
        const auto& m = std::get<GameOver>(msg.payload);
        os << ';' << m.matchId << ';' << core::toString(m.status)
           << ';' << core::toString(m.result) << ';' << escape(m.reason) << ';';
        writeElo(os, m.eloChanges);
        break;
    }
    case MessageKind::PlayerDisconnected: {
        const auto& m = std::get<PlayerDisconnected>(msg.payload);
        os << ';' << m.matchId << ';' << m.playerId << ';' << core::toString(m.result)
           << ';' << (m.opponentConnected ? 1 : 0) << ';';
        writeElo(os, m.eloChanges);
        break;
    }
    case MessageKind::JoinQueue:
    case MessageKind::LeaveQueue:
    case MessageKind::QueueStatusRequest:
    case MessageKind::PoolStatsRequest:
        break;
    case MessageKind::QueueStatus: {
        const auto& m = std::get<QueueStatus>(msg.payload);
        os << ';' << escape(m.state) << ';' << m.matchId << ';' << symbolText(m.yourSymbol)
           << ';' << escape(m.opponent) << ';' << m.opponentRating
           << ';' << m.position << ';' << m.queueSize
           << ';' << m.rangeMin << ';' << m.rangeMax;
        break;
    }
    case MessageKind::RegisterServer: {
        const auto& m = std::get<RegisterServer>(msg.payload);
        os << ';' << escape(m.serverId) << ';' << escape(m.address)
           << ';' << m.capacity << ';' << escape(m.region);
        break;
    }
    case MessageKind::UnregisterServer: {
        os << ';' << escape(std::get<UnregisterServer>(msg.payload).serverId);
        break;
    }
    case MessageKind::ServerHeartbeat: {
        const auto& m = std::get<ServerHeartbeat>(msg.payload);
        os << ';' << escape(m.serverId) << ';' << optionalText(m.cpuPercent)
           << ';' << optionalText(m.memoryPercent) << ';' << optionalText(m.activeSessions);
        break;
    }
    case MessageKind::PoolStatsReply: {
        const auto& m = std::get<PoolStatsReply>(msg.payload);
        char utilization[32];
        std::snprintf(utilization, sizeof(utilization), "%.2f", m.utilizationPercent);
        os << ';' << m.totalServers << ';' << m.healthyServers << ';' << m.unhealthyServers
           << ';' << m.totalCapacity << ';' << m.totalActive << ';' << utilization
           << ';' << m.regions.size();
        for (const auto& r : m.regions) {
            os << ';' << escape(r.region) << ';' << r.servers
               << ';' << r.capacity << ';' << r.activeSessions;
        }
        break;
    }
    case MessageKind::Ack: {
        os << ';' << escape(std::get<Ack>(msg.payload).what);
        break;
    }
    case MessageKind::Error: {
        os << ';' << escape(std::get<ErrorMessage>(msg.payload).description);
        break;
    }
    }

    return os.str();
}

namespace {
    std::optional<Message> parseFields(FieldReader& in, MessageKind kind)
    {
        Message msg{};

        switch (kind) {
        case MessageKind::Hello: {
            msg = Message{MessageKind::Hello, Hello{in.text()}};
            break;
        }
        case MessageKind::Welcome: {
            Welcome m;
            m.playerId = in.u64();
            m.username = in.text();
            m.rating   = in.i32();
            m.rank     = in.i32();
            m.wins     = in.i32();
            m.losses   = in.i32();
            m.draws    = in.i32();
            msg = Message{MessageKind::Welcome, m};
            break;
        }
        case MessageKind::CreateGame: {
            CreateGame m;
            m.mode = parseMode(in.text());
            m.difficulty = parseLevel(in.text());
            msg = Message{MessageKind::CreateGame, m};
            break;
        }
        case MessageKind::JoinGame: {
            msg = Message{MessageKind::JoinGame, JoinGame{in.u64()}};
            break;
        }
        case MessageKind::GameCreated: {
            GameCreated m;
            m.matchId    = in.u64();
            m.mode       = parseMode(in.text());
            m.yourSymbol = parseSymbol(in.text());
            m.opponent   = in.text();
            m.serverId   = in.text();
            msg = Message{MessageKind::GameCreated, m};
            break;
        }
        case MessageKind::MakeMove: {
            MakeMove m;
            m.matchId = in.u64();
            m.row     = in.i32();
            m.col     = in.i32();
            msg = Message{MessageKind::MakeMove, m};
            break;
        }
        case MessageKind::MoveBroadcast: {
            MoveBroadcast m;
            m.matchId       = in.u64();
            m.move.row      = in.i32();
            m.move.col      = in.i32();
            m.move.symbol   = parseSymbol(in.text());
            m.move.sequence = in.u32();
            m.nextTurn      = parseSymbol(in.text());
            m.gameOver      = in.flag();
            m.result        = parseResult(in.text());
            m.winningLine   = decodeLine(in.text());
            m.eloChanges    = readElo(in);
            msg = Message{MessageKind::MoveBroadcast, m};
            break;
        }
        case MessageKind::Forfeit: {
            msg = Message{MessageKind::Forfeit, Forfeit{in.u64()}};
            break;
        }
        case MessageKind::LeaveGame: {
            msg = Message{MessageKind::LeaveGame, LeaveGame{in.u64()}};
            break;
        }
        case MessageKind::GameOver: {
            GameOver m;
            m.matchId    = in.u64();
            m.status     = parseStatus(in.text());
            m.result     = parseResult(in.text());
            m.reason     = in.text();
            m.eloChanges = readElo(in);
            msg = Message{MessageKind::GameOver, m};
            break;
        }
        case MessageKind::PlayerDisconnected: {
            PlayerDisconnected m;
            m.matchId    = in.u64();
            m.playerId   = in.u64();
            m.result            = parseResult(in.text());
            m.opponentConnected = in.flag();
            m.eloChanges        = readElo(in);
            msg = Message{MessageKind::PlayerDisconnected, m};
            break;
        }
        case MessageKind::JoinQueue: {
            msg = Message{MessageKind::JoinQueue, JoinQueue{}};
            break;
        }
        case MessageKind::LeaveQueue: {
            msg = Message{MessageKind::LeaveQueue, LeaveQueue{}};
            break;
        }
        case MessageKind::QueueStatusRequest: {
            msg = Message{MessageKind::QueueStatusRequest, QueueStatusRequest{}};
            break;
        }
        case MessageKind::QueueStatus: {
            QueueStatus m;
            m.state          = in.text();
            m.matchId        = in.u64();
            m.yourSymbol     = parseSymbol(in.text());
            m.opponent       = in.text();
            m.opponentRating = in.i32();
            m.position       = static_cast<std::size_t>(in.u64());
            m.queueSize      = static_cast<std::size_t>(in.u64());
            m.rangeMin       = in.i32();
            m.rangeMax       = in.i32();
            msg = Message{MessageKind::QueueStatus, m};
            break;
        }
        case MessageKind::RegisterServer: {
            RegisterServer m;
            m.serverId = in.text();
            m.address  = in.text();
            m.capacity = in.i32();
            m.region   = in.text();
            msg = Message{MessageKind::RegisterServer, m};
            break;
        }
        case MessageKind::UnregisterServer: {
            msg = Message{MessageKind::UnregisterServer, UnregisterServer{in.text()}};
            break;
        }
        case MessageKind::ServerHeartbeat: {
            ServerHeartbeat m;
            m.serverId       = in.text();
            m.cpuPercent     = in.optionalReal();
            m.memoryPercent  = in.optionalReal();
            m.activeSessions = in.optionalInt();
            msg = Message{MessageKind::ServerHeartbeat, m};
            break;
        }
        case MessageKind::PoolStatsRequest: {
            msg = Message{MessageKind::PoolStatsRequest, PoolStatsRequest{}};
            break;
        }
        case MessageKind::PoolStatsReply: {
            PoolStatsReply m;
            m.totalServers       = static_cast<std::size_t>(in.u64());
            m.healthyServers     = static_cast<std::size_t>(in.u64());
            m.unhealthyServers   = static_cast<std::size_t>(in.u64());
            m.totalCapacity      = in.i32();
            m.totalActive        = in.i32();
            m.utilizationPercent = in.real();
            const auto regionCount = in.u64();
            for (std::uint64_t i = 0; i < regionCount; ++i) {
                RegionStatsDTO r;
                r.region         = in.text();
                r.servers        = static_cast<std::size_t>(in.u64());
                r.capacity       = in.i32();
                r.activeSessions = in.i32();
                m.regions.push_back(std::move(r));
            }
            msg = Message{MessageKind::PoolStatsReply, m};
            break;
        }
        case MessageKind::Ack: {
            msg = Message{MessageKind::Ack, Ack{in.text()}};
            break;
        }
        case MessageKind::Error: {
            msg = Message{MessageKind::Error, ErrorMessage{in.text()}};
            break;
        }
        }

        if (!in.done()) {
            return std::nullopt;
        }
        return msg;
    }
}

std::optional<Message> deserialize(const std::string& line)
{
    try {
        auto fields = splitFields(line);
        const auto kind = parseKind(fields.front());
        if (!kind) {
            return std::nullopt;
        }
        fields.erase(fields.begin());
        FieldReader in(std::move(fields));
        return parseFields(in, *kind);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

} // namespace caro::net
