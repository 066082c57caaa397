#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

#include "controller/AiController.hpp"
#include "core/Errors.hpp"
#include "core/MatchRegistry.hpp"
#include "core/PlayerRecord.hpp"
#include "core/Types.hpp"

using namespace caro::core;

namespace {

// Render the board as ASCII with row/column numbers; winning cells in lower case.
void printBoard(const MatchRecord& record) {
    const Board& board = record.board;
    const int n = board.size();

    auto onWinningLine = [&](int r, int c) {
        for (const auto& p : record.winningLine) {
            if (p.row == r && p.col == c) return true;
        }
        return false;
    };

    std::cout << "\n    ";
    for (int c = 0; c < n; ++c) {
        std::cout << std::setw(3) << c;
    }
    std::cout << '\n';

    for (int r = 0; r < n; ++r) {
        std::cout << std::setw(3) << r << ' ';
        for (int c = 0; c < n; ++c) {
            char ch = '.';
            switch (board.cell(r, c)) {
            case CellState::Empty: ch = '.'; break;
            case CellState::X:     ch = 'X'; break;
            case CellState::O:     ch = 'O'; break;
            }
            if (onWinningLine(r, c)) {
                ch = static_cast<char>(ch == 'X' ? 'x' : 'o');
            }
            std::cout << "  " << ch;
        }
        std::cout << '\n';
    }

    std::cout << "Mode: " << toString(record.mode)
              << " | Moves: " << record.moves.size()
              << " | Status: " << toString(record.status);
    if (record.status == MatchStatus::InProgress) {
        std::cout << " | Turn: " << toChar(record.currentTurn);
    }
    std::cout << '\n';
}

void printResult(const MatchRecord& record) {
    switch (record.result) {
    case MatchResult::WinX: std::cout << "X wins!\n"; break;
    case MatchResult::WinO: std::cout << "O wins!\n"; break;
    case MatchResult::Draw: std::cout << "Draw: the board is full.\n"; break;
    case MatchResult::None: std::cout << "No result.\n"; break;
    }
}

void printUsage(const char* argv0) {
    std::cerr << "Usage:\n"
              << "  " << argv0 << " local\n"
              << "  " << argv0 << " ai [easy|medium|hard]\n";
}

} // namespace

int main(int argc, char* argv[]) {
    const std::string mode = argc > 1 ? argv[1] : "ai";
    Difficulty difficulty = Difficulty::Medium;

    if (mode == "ai" && argc > 2) {
        auto parsed = parseDifficulty(argv[2]);
        if (!parsed) {
            printUsage(argv[0]);
            return 1;
        }
        difficulty = *parsed;
    } else if (mode != "ai" && mode != "local") {
        printUsage(argv[0]);
        return 1;
    }

    InMemoryPlayerRepository players;
    InMemoryMatchArchive archive;
    MatchRegistry registry(players, archive);
    caro::controller::AiController ai(difficulty);

    MatchRegistry::SessionPtr session;
    if (mode == "local") {
        session = registry.createLocal();
    } else {
        const PlayerRecord human = players.findOrCreate(1, "player", RatingConfig{}.initialRating);
        session = registry.createAi(Participant{human.id, human.username, Symbol::X, human.rating});
        std::cout << "You play X against the computer (" << toString(difficulty) << ").\n";
    }

    printBoard(session->snapshot());

    std::string line;
    while (session->status() == MatchStatus::InProgress) {
        std::cout << "\n[" << toChar(session->currentTurn()) << "] row col | f = forfeit | q = quit: ";
        if (!std::getline(std::cin, line)) {
            break; // EOF
        }
        if (line.empty()) {
            continue;
        }

        if (line == "q" || line == "Q") {
            std::cout << "Quitting.\n";
            return 0;
        }
        if (line == "f" || line == "F") {
            session->forfeit(session->currentTurn());
            break;
        }

        std::istringstream is(line);
        int row = 0;
        int col = 0;
        if (!(is >> row >> col)) {
            std::cout << "Unknown command: " << line << '\n';
            continue;
        }

        try {
            // Local games: whoever is at the keyboard plays the side to move.
            session->makeMove(row, col, session->currentTurn());
            if (session->mode() == MatchMode::Ai) {
                if (auto reply = ai.respond(*session)) {
                    std::cout << "Computer plays " << reply->move.row << ' ' << reply->move.col << '\n';
                }
            }
        } catch (const InvalidMove& e) {
            std::cout << "Rejected: " << e.what() << '\n';
            continue;
        }

        printBoard(session->snapshot());
    }

    const MatchRecord record = session->snapshot();
    if (record.status != MatchStatus::InProgress) {
        printBoard(record);
        printResult(record);
    }
    return 0;
}
