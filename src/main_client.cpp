#include <cstdint>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "core/MoveSelector.hpp"
#include "network/MessageTypes.hpp"
#include "network/NetworkClient.hpp"
#include "network/Serialization.hpp"
#include "network/TcpSession.hpp"

using namespace caro;
using namespace caro::net;

namespace {

void printEloChanges(const std::vector<core::EloChange>& changes) {
    for (const auto& c : changes) {
        std::cout << "         " << c.username << ": " << c.oldElo << " -> " << c.newElo
                  << " (" << (c.change >= 0 ? "+" : "") << c.change << "), rank "
                  << c.oldRank << " -> " << c.newRank << "\n";
    }
}

// Human-readable line per message kind; anything else is shown raw.
void printMessage(const Message& msg) {
    std::cout << "\n[CLIENT] ";
    switch (msg.kind) {
    case MessageKind::Welcome: {
        const auto& m = std::get<Welcome>(msg.payload);
        std::cout << "Welcome " << m.username << " (id " << m.playerId << ", rating "
                  << m.rating << ", rank " << m.rank << ", " << m.wins << "W/"
                  << m.losses << "L/" << m.draws << "D)\n";
        break;
    }
    case MessageKind::GameCreated: {
        const auto& m = std::get<GameCreated>(msg.payload);
        std::cout << "Match " << m.matchId << " (" << core::toString(m.mode) << ") on "
                  << m.serverId << ": you play " << core::toChar(m.yourSymbol);
        if (m.opponent.empty()) {
            std::cout << ", waiting for an opponent\n";
        } else {
            std::cout << " against " << m.opponent << "\n";
        }
        break;
    }
    case MessageKind::MoveBroadcast: {
        const auto& m = std::get<MoveBroadcast>(msg.payload);
        std::cout << "Move #" << m.move.sequence << ": " << core::toChar(m.move.symbol)
                  << " at " << m.move.row << " " << m.move.col;
        if (m.gameOver) {
            std::cout << " -> game over, " << core::toString(m.result) << "\n";
            printEloChanges(m.eloChanges);
        } else {
            std::cout << ", " << core::toChar(m.nextTurn) << " to play\n";
        }
        break;
    }
    case MessageKind::GameOver: {
        const auto& m = std::get<GameOver>(msg.payload);
        std::cout << "Match " << m.matchId << " ended by " << m.reason << ": "
                  << core::toString(m.result) << "\n";
        printEloChanges(m.eloChanges);
        break;
    }
    case MessageKind::PlayerDisconnected: {
        const auto& m = std::get<PlayerDisconnected>(msg.payload);
        std::cout << "Opponent " << m.playerId << " left match " << m.matchId << ": "
                  << core::toString(m.result) << "\n";
        printEloChanges(m.eloChanges);
        break;
    }
    case MessageKind::QueueStatus: {
        const auto& m = std::get<QueueStatus>(msg.payload);
        if (m.state == "matched") {
            std::cout << "Matched into " << m.matchId << " against " << m.opponent
                      << " (" << m.opponentRating << "), you play " << core::toChar(m.yourSymbol) << "\n";
        } else if (m.state == "searching") {
            std::cout << "Searching: position " << m.position << " of " << m.queueSize
                      << ", range " << m.rangeMin << "-" << m.rangeMax << "\n";
        } else {
            std::cout << "Not in queue\n";
        }
        break;
    }
    case MessageKind::PoolStatsReply: {
        const auto& m = std::get<PoolStatsReply>(msg.payload);
        std::cout << "Pool: " << m.healthyServers << "/" << m.totalServers << " healthy, "
                  << m.totalActive << "/" << m.totalCapacity << " sessions ("
                  << m.utilizationPercent << "%)\n";
        for (const auto& r : m.regions) {
            std::cout << "         " << r.region << ": " << r.servers << " servers, "
                      << r.activeSessions << "/" << r.capacity << "\n";
        }
        break;
    }
    case MessageKind::Ack:
        std::cout << "OK: " << std::get<Ack>(msg.payload).what << "\n";
        break;
    case MessageKind::Error:
        std::cout << "Error: " << std::get<ErrorMessage>(msg.payload).description << "\n";
        break;
    default:
        std::cout << serialize(msg) << "\n";
        break;
    }
}

void printHelp() {
    std::cout << "Commands:\n"
              << "  hello                 introduce yourself again\n"
              << "  queue | status | leave  matchmaking\n"
              << "  ai [easy|medium|hard] play the computer\n"
              << "  host | join <id>      private online game\n"
              << "  move <row> <col>      play in the current match\n"
              << "  forfeit | quit-game   end the current match\n"
              << "  stats                 server pool statistics\n"
              << "  q                     quit\n";
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " <host_ip> <username> [port]\n";
        return 1;
    }

    const std::string hostIp = argv[1];
    const std::string username = argv[2];
    std::uint16_t port = 5000;
    if (argc > 3) {
        try {
            port = static_cast<std::uint16_t>(std::stoi(argv[3]));
        } catch (const std::exception& e) {
            std::cerr << "Invalid port " << argv[3] << ": " << e.what() << "\n";
            return 1;
        }
    }

    std::cout << "[CLIENT] Connecting to " << hostIp << ":" << port
              << " as " << username << "...\n";

    auto session = TcpSession::createClient(hostIp, port);
    if (!session) {
        std::cerr << "[CLIENT] Failed to connect!\n";
        return 1;
    }

    NetworkClient client(session, username);
    client.setMessageHandler(printMessage);
    client.start();
    printHelp();

    std::string line;
    while (client.isConnected() && std::getline(std::cin, line)) {
        std::istringstream is(line);
        std::string cmd;
        if (!(is >> cmd)) {
            continue;
        }

        if (cmd == "q" || cmd == "quit") {
            break;
        } else if (cmd == "hello") {
            client.start();
        } else if (cmd == "queue") {
            client.joinQueue();
        } else if (cmd == "status") {
            client.requestQueueStatus();
        } else if (cmd == "leave") {
            client.leaveQueue();
        } else if (cmd == "ai") {
            std::string level = "medium";
            is >> level;
            auto difficulty = core::parseDifficulty(level);
            if (!difficulty) {
                std::cout << "Unknown difficulty " << level << "\n";
                continue;
            }
            client.createGame(core::MatchMode::Ai, *difficulty);
        } else if (cmd == "host") {
            client.createGame(core::MatchMode::Online);
        } else if (cmd == "join") {
            MatchId match = 0;
            if (!(is >> match)) {
                std::cout << "Usage: join <match id>\n";
                continue;
            }
            client.joinGame(match);
        } else if (cmd == "move") {
            int row = 0;
            int col = 0;
            if (!(is >> row >> col)) {
                std::cout << "Usage: move <row> <col>\n";
                continue;
            }
            if (!client.sendMove(row, col)) {
                std::cout << "No current match\n";
            }
        } else if (cmd == "forfeit") {
            if (!client.forfeit()) {
                std::cout << "No current match\n";
            }
        } else if (cmd == "quit-game") {
            if (!client.leaveGame()) {
                std::cout << "No current match\n";
            }
        } else if (cmd == "stats") {
            client.requestPoolStats();
        } else {
            printHelp();
        }
    }

    return 0;
}
