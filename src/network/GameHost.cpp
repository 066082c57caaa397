#include "network/GameHost.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

#include "core/Errors.hpp"
#include "network/Serialization.hpp"

namespace caro::net {

namespace {
    bool isTerminal(core::MatchStatus status) {
        return status == core::MatchStatus::Completed || status == core::MatchStatus::Abandoned;
    }

    std::string stateText(matchmaking::QueueState state) {
        switch (state) {
        case matchmaking::QueueState::Matched:    return "matched";
        case matchmaking::QueueState::Searching:  return "searching";
        case matchmaking::QueueState::NotInQueue: return "not_in_queue";
        }
        return "not_in_queue";
    }
}

GameHost::GameHost(const ServerConfig& config,
                   core::IPlayerRepository& players,
                   core::MatchRegistry& matches,
                   matchmaking::MatchmakingQueue& queue,
                   pool::ServerPool& pool,
                   controller::AiController& ai)
    : m_config(config)
    , m_players(players)
    , m_matches(matches)
    , m_queue(queue)
    , m_pool(pool)
    , m_ai(ai)
{
}

GameHost::ConnectionId GameHost::addClient(INetworkSessionPtr session)
{
    ConnectionId assigned = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        assigned = m_nextConnectionId++;
        m_connections.emplace(assigned, Connection{assigned, session, std::nullopt, "", {}});
    }

    session->setMessageHandler(
        [this, assigned](const Message& msg) {
            handleIncoming(assigned, msg);
        }
    );
    session->setDisconnectHandler(
        [this, assigned]() {
            dropClient(assigned);
        }
    );

    std::cout << "[HOST] Connection " << assigned << " opened\n";

    // The peer may have gone before the handlers were in place.
    if (!session->isConnected()) {
        dropClient(assigned);
    }
    return assigned;
}

void GameHost::poll()
{
    std::vector<INetworkSessionPtr> live;
    std::vector<INetworkSessionPtr> closed;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto& [id, conn] : m_connections) {
            (void)id;
            live.push_back(conn.session);
        }
        closed.swap(m_closed);
    }

    for (auto& session : live) {
        if (session->isConnected()) {
            session->poll();
        }
    }
    // `closed` goes out of scope here, outside the lock.
}

std::size_t GameHost::clientCount() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_connections.size();
}

std::optional<PlayerId> GameHost::playerOf(ConnectionId id) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_connections.find(id);
    if (it == m_connections.end()) {
        return std::nullopt;
    }
    return it->second.player;
}

void GameHost::handleIncoming(ConnectionId conn, const Message& msg)
{
    try {
        switch (msg.kind) {
        case MessageKind::Hello:
            handleHello(conn, std::get<Hello>(msg.payload));
            break;
        case MessageKind::CreateGame:
            handleCreateGame(conn, std::get<CreateGame>(msg.payload));
            break;
        case MessageKind::JoinGame:
            handleJoinGame(conn, std::get<JoinGame>(msg.payload));
            break;
        case MessageKind::MakeMove:
            handleMakeMove(conn, std::get<MakeMove>(msg.payload));
            break;
        case MessageKind::Forfeit:
            handleForfeit(conn, std::get<Forfeit>(msg.payload));
            break;
        case MessageKind::LeaveGame:
            handleLeaveGame(conn, std::get<LeaveGame>(msg.payload));
            break;
        case MessageKind::JoinQueue:
            handleJoinQueue(conn);
            break;
        case MessageKind::LeaveQueue:
            handleLeaveQueue(conn);
            break;
        case MessageKind::QueueStatusRequest:
            handleQueueStatus(conn);
            break;
        case MessageKind::RegisterServer:
            handleRegisterServer(conn, std::get<RegisterServer>(msg.payload));
            break;
        case MessageKind::UnregisterServer:
            handleUnregisterServer(conn, std::get<UnregisterServer>(msg.payload));
            break;
        case MessageKind::ServerHeartbeat:
            handleServerHeartbeat(conn, std::get<ServerHeartbeat>(msg.payload));
            break;
        case MessageKind::PoolStatsRequest:
            handlePoolStats(conn);
            break;
        default:
            sendError(conn, "Unexpected message " + toString(msg.kind));
            break;
        }
    } catch (const core::PoolUnavailable& e) {
        std::cerr << "[HOST] " << e.what() << "\n";
        sendError(conn, std::string("No servers available: ") + e.what());
    } catch (const core::CaroError& e) {
        sendError(conn, e.what());
    } catch (const std::exception& e) {
        std::cerr << "[HOST] " << toString(msg.kind) << " from connection " << conn
                  << " failed: " << e.what() << "\n";
        sendError(conn, e.what());
    }
}

// ---------- Players and games ----------

void GameHost::handleHello(ConnectionId conn, const Hello& req)
{
    if (req.username.empty()) {
        throw std::invalid_argument("Username must not be empty");
    }

    PlayerId pid = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_usernames.find(req.username);
        if (it != m_usernames.end()) {
            pid = it->second;
        } else {
            pid = m_nextPlayerId++;
            m_usernames.emplace(req.username, pid);
        }
    }

    auto record = m_players.find(pid);
    if (!record) {
        core::PlayerRecord fresh;
        fresh.id = pid;
        fresh.username = req.username;
        fresh.rating = m_config.rating.initialRating;
        m_players.save(fresh);
        record = fresh;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_connections.find(conn);
        if (it == m_connections.end()) {
            return; // dropped meanwhile
        }
        it->second.player = pid;
        it->second.username = req.username;

        // A reconnect takes over the games bound to the previous connection.
        auto previous = m_playerConnections.find(pid);
        if (previous != m_playerConnections.end() && previous->second != conn) {
            auto old = m_connections.find(previous->second);
            if (old != m_connections.end()) {
                it->second.matches.insert(old->second.matches.begin(), old->second.matches.end());
                old->second.matches.clear();
            }
        }
        m_playerConnections[pid] = conn;
    }

    std::cout << "[HOST] Connection " << conn << " is player " << pid
              << " (" << req.username << ", rating " << record->rating << ")\n";

    Welcome reply;
    reply.playerId = pid;
    reply.username = req.username;
    reply.rating   = record->rating;
    reply.rank     = m_players.rankOf(pid).value_or(0);
    reply.wins     = record->wins;
    reply.losses   = record->losses;
    reply.draws    = record->draws;
    sendTo(conn, Message{MessageKind::Welcome, reply});
}

core::Participant GameHost::requirePlayer(ConnectionId conn, core::Symbol symbol) const
{
    PlayerId pid = 0;
    std::string username;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_connections.find(conn);
        if (it == m_connections.end() || !it->second.player) {
            throw core::InvalidTransition("Say HELLO first");
        }
        pid = *it->second.player;
        username = it->second.username;
    }

    core::Participant p;
    p.id = pid;
    p.username = username;
    p.symbol = symbol;
    p.ratingBefore = m_config.rating.initialRating;
    if (auto record = m_players.find(pid)) {
        p.ratingBefore = record->rating;
    }
    return p;
}

void GameHost::handleCreateGame(ConnectionId conn, const CreateGame& req)
{
    const core::Participant host = requirePlayer(conn, core::Symbol::X);

    GameCreated reply;
    reply.mode = req.mode;
    reply.yourSymbol = core::Symbol::X;

    core::MatchRegistry::SessionPtr session;
    switch (req.mode) {
    case core::MatchMode::Ai:
        session = m_matches.createAi(host);
        reply.opponent = "AI (" + core::toString(req.difficulty) + ")";
        break;
    case core::MatchMode::Online:
        session = m_matches.createWaiting(host);
        break;
    case core::MatchMode::Local:
        throw std::invalid_argument("Local games are played on one terminal");
    }

    reply.matchId = session->id();
    try {
        reply.serverId = placeMatch(session->id());
    } catch (const core::PoolUnavailable&) {
        m_matches.remove(session->id()); // nobody has played yet
        throw;
    }

    if (req.mode == core::MatchMode::Ai) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_aiDifficulty[session->id()] = req.difficulty;
    }
    bindMatch(host.id, session->id());

    std::cout << "[HOST] Player " << host.id << " created " << core::toString(req.mode)
              << " match " << session->id() << " on " << reply.serverId << "\n";
    sendTo(conn, Message{MessageKind::GameCreated, reply});
}

void GameHost::handleJoinGame(ConnectionId conn, const JoinGame& req)
{
    const core::Participant guest = requirePlayer(conn, core::Symbol::O);
    auto session = m_matches.get(req.matchId);
    if (session->mode() != core::MatchMode::Online) {
        throw core::InvalidTransition("Match " + std::to_string(req.matchId) + " is not an online match");
    }

    session->join(guest);
    bindMatch(guest.id, req.matchId);

    const auto host = session->participant(core::Symbol::X);
    const std::string server = m_pool.serverFor(std::to_string(req.matchId)).value_or(m_config.workerId);

    GameCreated toGuest{req.matchId, core::MatchMode::Online, core::Symbol::O,
                        host ? host->username : std::string(), server};
    sendTo(conn, Message{MessageKind::GameCreated, toGuest});

    if (host) {
        GameCreated toHost{req.matchId, core::MatchMode::Online, core::Symbol::X,
                           guest.username, server};
        sendToPlayer(host->id, Message{MessageKind::GameCreated, toHost});
    }
    std::cout << "[HOST] Player " << guest.id << " joined match " << req.matchId << "\n";
}

void GameHost::handleMakeMove(ConnectionId conn, const MakeMove& req)
{
    const core::Participant mover = requirePlayer(conn, core::Symbol::X);
    auto session = m_matches.get(req.matchId);

    const core::MoveOutcome outcome = session->makeMove(mover.id, req.row, req.col);
    broadcastMove(*session, outcome);

    bool over = outcome.gameOver;
    if (!over && session->mode() == core::MatchMode::Ai) {
        core::Difficulty difficulty = m_ai.defaultDifficulty();
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_aiDifficulty.find(req.matchId);
            if (it != m_aiDifficulty.end()) {
                difficulty = it->second;
            }
        }
        if (auto reply = m_ai.respond(*session, difficulty)) {
            broadcastMove(*session, *reply);
            over = reply->gameOver;
        }
    }

    if (over) {
        finishMatch(req.matchId);
    }
}

void GameHost::handleForfeit(ConnectionId conn, const Forfeit& req)
{
    const core::Participant loser = requirePlayer(conn, core::Symbol::X);
    auto session = m_matches.get(req.matchId);

    const core::FinishOutcome outcome = session->forfeit(loser.id);
    GameOver notice{req.matchId, outcome.status, outcome.result, "forfeit", outcome.eloChanges};
    broadcastToMatch(*session, Message{MessageKind::GameOver, notice});

    std::cout << "[HOST] Player " << loser.id << " forfeited match " << req.matchId << "\n";
    finishMatch(req.matchId);
}

void GameHost::handleLeaveGame(ConnectionId conn, const LeaveGame& req)
{
    const core::Participant leaver = requirePlayer(conn, core::Symbol::X);
    const Ack ack{"left match " + std::to_string(req.matchId)};

    auto session = m_matches.find(req.matchId);
    if (!session) {
        // Already finished and archived, typically by the move that won it.
        const auto record = m_matches.lookup(req.matchId);
        if (!record) {
            throw core::SessionNotFound("Match " + std::to_string(req.matchId) + " not found");
        }
        const bool seated = (record->playerX && record->playerX->id == leaver.id)
                         || (record->playerO && record->playerO->id == leaver.id);
        if (!seated) {
            throw core::InvalidTransition("Player " + std::to_string(leaver.id)
                                          + " is not in match " + std::to_string(req.matchId));
        }
        sendTo(conn, Message{MessageKind::Ack, ack});
        return;
    }

    const core::FinishOutcome outcome = session->disconnect(leaver.id);
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_connections.find(conn);
        if (it != m_connections.end()) {
            it->second.matches.erase(req.matchId);
        }
    }

    if (outcome.finishedNow) {
        notifyDisconnect(*session, leaver.id, outcome);
    }
    sendTo(conn, Message{MessageKind::Ack, ack});

    if (isTerminal(outcome.status)) {
        finishMatch(req.matchId);
    }
}

// ---------- Matchmaking ----------

QueueStatus GameHost::toWire(const matchmaking::QueueStatusReport& report) const
{
    QueueStatus out;
    out.state     = stateText(report.state);
    out.position  = report.position;
    out.queueSize = report.queueSize;
    out.rangeMin  = report.rangeMin;
    out.rangeMax  = report.rangeMax;
    if (report.match) {
        out.matchId        = report.match->matchId;
        out.yourSymbol     = report.match->symbol;
        out.opponent       = report.match->opponent.username;
        out.opponentRating = report.match->opponent.rating;
    }
    return out;
}

void GameHost::handleJoinQueue(ConnectionId conn)
{
    const core::Participant me = requirePlayer(conn, core::Symbol::X);
    const auto report = m_queue.requestMatch(
        matchmaking::QueuedPlayer{me.id, me.username, me.ratingBefore}, core::Clock::now());

    if (report.match) {
        const auto& match = *report.match;
        bindMatch(me.id, match.matchId);
        try {
            placeMatch(match.matchId);
        } catch (const core::PoolUnavailable& e) {
            // Already committed in the queue; the coordinator keeps serving it.
            std::cerr << "[HOST] Match " << match.matchId << " not placed on a worker: "
                      << e.what() << "\n";
        }

        bool opponentBound = false;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_playerConnections.find(match.opponent.id);
            if (it != m_playerConnections.end()) {
                auto connIt = m_connections.find(it->second);
                if (connIt != m_connections.end()) {
                    opponentBound = !connIt->second.matches.insert(match.matchId).second;
                }
            }
        }
        if (!opponentBound) {
            QueueStatus notice;
            notice.state          = "matched";
            notice.matchId        = match.matchId;
            notice.yourSymbol     = core::opponentOf(match.symbol);
            notice.opponent       = me.username;
            notice.opponentRating = me.ratingBefore;
            sendToPlayer(match.opponent.id, Message{MessageKind::QueueStatus, notice});
        }
    }
    sendTo(conn, Message{MessageKind::QueueStatus, toWire(report)});
}

void GameHost::handleQueueStatus(ConnectionId conn)
{
    const core::Participant me = requirePlayer(conn, core::Symbol::X);
    const auto report = m_queue.status(me.id, core::Clock::now());

    if (report.match) {
        bindMatch(me.id, report.match->matchId);
        bindMatch(report.match->opponent.id, report.match->matchId);
        try {
            placeMatch(report.match->matchId);
        } catch (const core::PoolUnavailable& e) {
            std::cerr << "[HOST] Match " << report.match->matchId << " not placed on a worker: "
                      << e.what() << "\n";
        }
    }
    sendTo(conn, Message{MessageKind::QueueStatus, toWire(report)});
}

void GameHost::handleLeaveQueue(ConnectionId conn)
{
    const core::Participant me = requirePlayer(conn, core::Symbol::X);
    const bool removed = m_queue.leave(me.id);
    sendTo(conn, Message{MessageKind::Ack, Ack{removed ? "left queue" : "not in queue"}});
}

// ---------- Server pool administration ----------

void GameHost::handleRegisterServer(ConnectionId conn, const RegisterServer& req)
{
    m_pool.registerServer(req.serverId, req.address, req.capacity, req.region, core::Clock::now());
    sendTo(conn, Message{MessageKind::Ack, Ack{"registered " + req.serverId}});
}

void GameHost::handleUnregisterServer(ConnectionId conn, const UnregisterServer& req)
{
    if (!m_pool.unregister(req.serverId)) {
        sendError(conn, "Unknown server " + req.serverId);
        return;
    }
    sendTo(conn, Message{MessageKind::Ack, Ack{"unregistered " + req.serverId}});
}

void GameHost::handleServerHeartbeat(ConnectionId conn, const ServerHeartbeat& req)
{
    pool::HeartbeatMetrics metrics{req.cpuPercent, req.memoryPercent, req.activeSessions};
    if (!m_pool.heartbeat(req.serverId, core::Clock::now(), metrics)) {
        sendError(conn, "Unknown server " + req.serverId + ", register again");
        return;
    }
    sendTo(conn, Message{MessageKind::Ack, Ack{"heartbeat " + req.serverId}});
}

void GameHost::handlePoolStats(ConnectionId conn)
{
    const pool::PoolStats stats = m_pool.stats(core::Clock::now());

    PoolStatsReply reply;
    reply.totalServers       = stats.totalServers;
    reply.healthyServers     = stats.healthyServers;
    reply.unhealthyServers   = stats.unhealthyServers;
    reply.totalCapacity      = stats.totalCapacity;
    reply.totalActive        = stats.totalActive;
    reply.utilizationPercent = stats.utilizationPercent;
    for (const auto& [name, region] : stats.regions) {
        reply.regions.push_back(RegionStatsDTO{name, region.servers, region.capacity,
                                               region.activeSessions});
    }
    sendTo(conn, Message{MessageKind::PoolStatsReply, reply});
}

// ---------- Plumbing ----------

void GameHost::sendTo(ConnectionId conn, const Message& msg)
{
    INetworkSessionPtr session;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_connections.find(conn);
        if (it == m_connections.end()) {
            return;
        }
        session = it->second.session;
    }
    if (session && session->isConnected()) {
        session->send(msg);
    }
}

void GameHost::sendToPlayer(PlayerId player, const Message& msg)
{
    std::optional<ConnectionId> conn;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_playerConnections.find(player);
        if (it != m_playerConnections.end()) {
            conn = it->second;
        }
    }
    if (conn) {
        sendTo(*conn, msg);
    }
}

void GameHost::broadcastToMatch(const core::MatchSession& session, const Message& msg)
{
    for (const auto& p : session.participants()) {
        sendToPlayer(p.id, msg);
    }
}

bool GameHost::isPlayerConnected(PlayerId player) const
{
    INetworkSessionPtr session;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_playerConnections.find(player);
        if (it == m_playerConnections.end()) {
            return false;
        }
        auto connIt = m_connections.find(it->second);
        if (connIt == m_connections.end()) {
            return false;
        }
        session = connIt->second.session;
    }
    return session && session->isConnected();
}

void GameHost::notifyDisconnect(const core::MatchSession& session, PlayerId leaver,
                                const core::FinishOutcome& outcome)
{
    for (const auto& p : session.participants()) {
        if (p.id == leaver) {
            continue;
        }
        PlayerDisconnected notice;
        notice.matchId           = session.id();
        notice.playerId          = leaver;
        notice.result            = outcome.result;
        notice.opponentConnected = isPlayerConnected(p.id);
        notice.eloChanges        = outcome.eloChanges;
        sendToPlayer(p.id, Message{MessageKind::PlayerDisconnected, notice});
    }
}

void GameHost::sendError(ConnectionId conn, const std::string& description)
{
    sendTo(conn, Message{MessageKind::Error, ErrorMessage{description}});
}

void GameHost::bindMatch(PlayerId player, MatchId match)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_playerConnections.find(player);
    if (it == m_playerConnections.end()) {
        return;
    }
    auto connIt = m_connections.find(it->second);
    if (connIt != m_connections.end()) {
        connIt->second.matches.insert(match);
    }
}

std::string GameHost::placeMatch(MatchId match)
{
    return m_pool.assign(std::to_string(match), std::nullopt, std::nullopt,
                         core::Clock::now()).id;
}

void GameHost::broadcastMove(core::MatchSession& session, const core::MoveOutcome& outcome)
{
    MoveBroadcast msg;
    msg.matchId     = session.id();
    msg.move        = outcome.move;
    msg.nextTurn    = session.currentTurn();
    msg.gameOver    = outcome.gameOver;
    msg.result      = outcome.result;
    msg.winningLine = outcome.winningLine;
    msg.eloChanges  = outcome.eloChanges;
    broadcastToMatch(session, Message{MessageKind::MoveBroadcast, msg});
}

void GameHost::finishMatch(MatchId match)
{
    m_pool.release(std::to_string(match));

    try {
        const core::MatchRecord record = m_matches.archive(match);
        std::cout << "[HOST] Match " << match << " archived: "
                  << core::toString(record.status) << ", " << core::toString(record.result)
                  << ", " << record.moves.size() << " moves\n";
    } catch (const core::SessionNotFound&) {
        // Another handler finished and archived it first.
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_aiDifficulty.erase(match);
    for (auto& [id, conn] : m_connections) {
        (void)id;
        conn.matches.erase(match);
    }
}

void GameHost::dropClient(ConnectionId id)
{
    Connection conn;
    bool reconnected = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_connections.find(id);
        if (it == m_connections.end()) {
            return;
        }
        conn = std::move(it->second);
        m_connections.erase(it);
        m_closed.push_back(conn.session);
        if (conn.player) {
            auto pc = m_playerConnections.find(*conn.player);
            if (pc != m_playerConnections.end()) {
                if (pc->second == id) {
                    m_playerConnections.erase(pc);
                } else {
                    reconnected = true;
                }
            }
        }
    }
    std::cout << "[HOST] Connection " << id << " closed\n";

    if (!conn.player) {
        return;
    }
    const PlayerId pid = *conn.player;
    if (reconnected) {
        // The player is still here on a newer connection; nothing to forfeit.
        std::cout << "[HOST] Player " << pid << " continues on another connection\n";
        return;
    }
    m_queue.leave(pid);

    for (MatchId match : conn.matches) {
        auto session = m_matches.find(match);
        if (!session) {
            continue;
        }
        core::FinishOutcome outcome;
        try {
            outcome = session->disconnect(pid);
        } catch (const core::CaroError& e) {
            std::cerr << "[HOST] Disconnect of player " << pid << " from match " << match
                      << " failed: " << e.what() << "\n";
            continue;
        }
        if (outcome.finishedNow) {
            notifyDisconnect(*session, pid, outcome);
        }
        if (isTerminal(outcome.status)) {
            finishMatch(match);
        }
    }
}

} // namespace caro::net
