#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "core/Errors.hpp"
#include "core/GameState.hpp"
#include "core/Types.hpp"
#include "controller/CellObserver.hpp"
#include "controller/GameConfig.hpp"
#include "controller/GameController.hpp"
#include "persistence/Serialization.hpp"

using namespace sweeper::core;
using sweeper::controller::ActionStatus;
using sweeper::controller::GameController;
using sweeper::controller::InputAction;
using sweeper::controller::fromOneBased;

namespace {

// Prints one-line status messages when the game ends or restarts
class ConsoleObserver final : public sweeper::controller::CellObserver {
public:
    void onGameOver(GameStatus status) override {
        if (status == GameStatus::Won) {
            std::cout << "[GAME] Treasure found or board cleared: you win!\n";
        } else {
            std::cout << "[GAME] Boom! You hit a mine.\n";
        }
    }

    void onRestart(const GameSnapshot& snapshot) override {
        std::cout << "[GAME] " << snapshot.rows << "x" << snapshot.cols << " board, "
                  << snapshot.mineCount << " mines, "
                  << snapshot.treasureCount << " treasure(s)\n";
    }
};

char symbolFor(const CellView& cell, bool gameOver) {
    if (gameOver) {
        // Show everything, marking wrong flags with X
        if (cell.hasTreasure) return cell.flagged ? 'X' : 'T';
        if (cell.isMine) return cell.flagged ? 'F' : 'M';
        if (cell.flagged) return 'X';
    }

    if (cell.revealed) {
        if (cell.isMine) return 'M';
        if (cell.hasTreasure) return 'T';
        return static_cast<char>('0' + cell.adjacentMines);
    }
    if (cell.flagged) return 'F';
    return '#';
}

// Helper: render the current board as ASCII
void printGame(const GameController& controller) {
    const GameSnapshot snap = controller.snapshot();
    const bool over = snap.status == GameStatus::Won || snap.status == GameStatus::Lost;

    std::cout << "\n==== TREASURE SWEEPER ====\n";

    std::cout << "    ";
    for (int c = 0; c < snap.cols; ++c) {
        std::cout << (c + 1) % 10 << ' ';
    }
    std::cout << '\n';

    for (int r = 0; r < snap.rows; ++r) {
        std::cout << (r + 1 < 10 ? "  " : " ") << r + 1 << ' ';
        for (int c = 0; c < snap.cols; ++c) {
            std::cout << symbolFor(snap.at(r, c), over) << ' ';
        }
        std::cout << '\n';
    }

    std::cout << "\nFlags: " << snap.flagCount << " / Mines: " << snap.mineCount
              << " | Treasures: " << snap.treasureCount << '\n';
    std::cout << "Time: " << formatElapsed(controller.game().elapsed()) << " | Status: ";

    switch (snap.status) {
    case GameStatus::NotStarted: std::cout << "NotStarted"; break;
    case GameStatus::InProgress: std::cout << "InProgress"; break;
    case GameStatus::Won:        std::cout << "Won";        break;
    case GameStatus::Lost:       std::cout << "Lost";       break;
    }
    std::cout << '\n';
}

void printCommands(const GameController& controller) {
    const auto& board = controller.game().board();
    std::cout << "Commands (rows 1-" << board.rows() << ", columns 1-" << board.cols() << "):\n"
              << "  r ROW COL = reveal, f ROW COL = flag/unflag\n"
              << "  s FILE = save, l FILE = load\n"
              << "  n = new game, q = quit\n";
}

bool saveToFile(const GameController& controller, const std::string& path) {
    std::ofstream out(path);
    if (!out) {
        std::cerr << "[SAVE] Cannot write " << path << '\n';
        return false;
    }
    out << sweeper::persistence::serialize(controller.save());
    if (!out) {
        std::cerr << "[SAVE] Write failed for " << path << '\n';
        return false;
    }
    std::cout << "[SAVE] Game saved to " << path << '\n';
    return true;
}

bool loadFromFile(GameController& controller, const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        std::cerr << "[SAVE] Cannot read " << path << '\n';
        return false;
    }
    std::ostringstream contents;
    contents << in.rdbuf();

    const auto saved = sweeper::persistence::deserialize(contents.str());
    if (!saved) {
        std::cerr << "[SAVE] " << path << " is not a saved game\n";
        return false;
    }

    try {
        controller.load(*saved);
    } catch (const ConfigurationError& e) {
        std::cerr << "[SAVE] " << e.what() << '\n';
        return false;
    }
    return true;
}

std::optional<GameController> createController(const sweeper::controller::GameConfig& config) {
    std::optional<Layout> layout;

    if (!config.layoutPath.empty()) {
        const auto validation = sweeper::controller::loadLayoutFile(config.layoutPath);
        if (!validation.ok) {
            std::cerr << "[CONFIG] Rejected layout " << config.layoutPath << ": "
                      << validation.message << '\n';
            return std::nullopt;
        }
        std::cout << "[CONFIG] Test mode: using layout " << config.layoutPath << '\n';
        layout = validation.layout;
    }

    const GameParameters params = sweeper::controller::toParameters(config, layout);

    try {
        if (config.seed) {
            return GameController{params, *config.seed};
        }
        return GameController{params};
    } catch (const ConfigurationError& e) {
        std::cerr << "[CONFIG] " << e.what() << '\n';
        return std::nullopt;
    }
}

bool askPlayAgain() {
    std::cout << "Play again? (y/n): ";
    std::string answer;
    if (!std::getline(std::cin, answer)) {
        return false;
    }
    return !answer.empty() && (answer[0] == 'y' || answer[0] == 'Y');
}

} // namespace

int main(int argc, char** argv) {
    const std::vector<std::string> args(argv + 1, argv + argc);
    const auto parsed = sweeper::controller::parseArguments(args);

    if (!parsed.ok) {
        std::cerr << "[CONFIG] " << parsed.error << "\n\n" << sweeper::controller::usage(argv[0]);
        return 2;
    }
    if (parsed.helpRequested) {
        std::cout << sweeper::controller::usage(argv[0]);
        return 0;
    }

    std::cout << "[CONFIG] Level: " << sweeper::controller::levelName(parsed.config.level) << '\n';

    auto controller = createController(parsed.config);
    if (!controller) {
        return 1;
    }

    ConsoleObserver observer;
    controller->setObserver(&observer);

    std::string line;
    printGame(*controller);
    printCommands(*controller);

    while (true) {
        std::cout << "\nEnter command: ";
        if (!std::getline(std::cin, line)) {
            break; // EOF
        }

        std::istringstream is(line);
        std::string cmd;
        if (!(is >> cmd)) {
            continue;
        }

        const char c = cmd[0];
        if (c == 'q' || c == 'Q') {
            std::cout << "Quitting.\n";
            break;
        }

        if (c == 'n' || c == 'N') {
            controller->handleAction(InputAction::Restart);
            printGame(*controller);
            continue;
        }

        if (c == 's' || c == 'S' || c == 'l' || c == 'L') {
            std::string path;
            if (!(is >> path)) {
                std::cout << "Please give a file name, e.g. 's game.sav'.\n";
                continue;
            }
            if (c == 's' || c == 'S') {
                saveToFile(*controller, path);
            } else if (loadFromFile(*controller, path)) {
                printGame(*controller);
            }
            continue;
        }

        if (c != 'r' && c != 'R' && c != 'f' && c != 'F') {
            std::cout << "Unknown command: " << cmd << '\n';
            printCommands(*controller);
            continue;
        }

        int row = 0;
        int col = 0;
        if (!(is >> row >> col)) {
            std::cout << "Invalid command format. Please enter 'r ROW COL' or 'f ROW COL'.\n";
            continue;
        }

        const Position pos = fromOneBased(row, col);
        const InputAction action = (c == 'r' || c == 'R') ? InputAction::Reveal
                                                          : InputAction::ToggleFlag;

        switch (controller->handleAction(action, pos)) {
        case ActionStatus::Applied:
            break;
        case ActionStatus::NoEffect:
            std::cout << (action == InputAction::Reveal ? "Cell already revealed or flagged.\n"
                                                        : "Cell already revealed.\n");
            break;
        case ActionStatus::OutOfBounds:
            std::cout << "Coordinates out of bounds.\n";
            break;
        case ActionStatus::GameOver:
            std::cout << "The game is over. Press 'n' for a new game or 'q' to quit.\n";
            break;
        }

        printGame(*controller);

        if (controller->game().isOver()) {
            if (!askPlayAgain()) {
                break;
            }
            controller->restart();
            printGame(*controller);
        }
    }

    return 0;
}
