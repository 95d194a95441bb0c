#include <iostream>
#include <string>
#include <vector>

#include "core/Grid.hpp"
#include "core/Types.hpp"
#include "controller/GridController.hpp"

using namespace panelrise::core;

namespace {

// One character per occupant: letters for tiles (lower case while moving),
// '*' for tiles being cleared, '#' for garbage.
char cellGlyph(const Grid& grid, GridPos pos) {
    const Occupant occ = grid.board().cell(pos);
    if (occ.isGarbage()) {
        const GarbageBlock* block = grid.garbage().block(occ.id);
        return (block && block->isConverting()) ? '%' : '#';
    }
    if (!occ.isTile()) {
        return '.';
    }
    const Tile* tile = grid.tile(occ.id);
    if (!tile) {
        return '?';
    }
    if (grid.isTileProcessing(tile->id())) {
        return '*';
    }
    const char base = static_cast<char>('A' + tile->type());
    return tile->isIdle() ? base : static_cast<char>(base - 'A' + 'a');
}

// Helper: render the visible rows, top row first, with the cursor in brackets
void printGrid(const Grid& grid) {
    const int w = grid.width();
    const int h = grid.height();
    const GridPos left = grid.cursor().left();
    const GridPos right = grid.cursor().right();

    std::cout << "\n==== PANELRISE CONSOLE VIEW ====\n";
    std::cout << "Score: " << grid.score()
              << " | Speed: " << grid.rise().speedLevel()
              << " | Rise: " << static_cast<int>(grid.riseOffset() * 100.0f) << '%'
              << " | Pending garbage: " << grid.garbage().pendingGarbageCount();
    if (grid.rise().isInGracePeriod()) {
        std::cout << " | DANGER " << grid.rise().graceTimer() << 's';
    }
    if (grid.isGameOver()) {
        std::cout << " | GameOver";
    }
    std::cout << '\n';

    std::cout << '+' << std::string(w * 3, '-') << "+\n";
    for (int y = h - 1; y >= 0; --y) {
        std::cout << '|';
        for (int x = 0; x < w; ++x) {
            const GridPos pos{x, y};
            const bool inCursor = (pos == left || pos == right);
            std::cout << (inCursor ? '[' : ' ')
                      << cellGlyph(grid, pos)
                      << (inCursor ? ']' : ' ');
        }
        std::cout << "|\n";
    }
    std::cout << '+' << std::string(w * 3, '-') << "+\n";

    // Next row, still hidden under the stack
    std::cout << ' ';
    for (int x = 0; x < w; ++x) {
        const Tile* tile = grid.tileAt(GridPos{x, -1});
        std::cout << ' ' << (tile ? static_cast<char>('a' + tile->type()) : ' ') << ' ';
    }
    std::cout << '\n';

    std::cout << "Commands:\n"
              << "  w/a/s/d = move cursor, space = swap\n"
              << "  r = fast rise (toggle), t = advance 0.5s, q = quit\n";
}

} // namespace

int main() {
    GridConfig config;
    Grid grid{config};
    panelrise::controller::GridController controller{grid};

    std::string cmd;
    printGrid(grid);

    while (true) {
        std::cout << "\nEnter command: ";
        if (!std::getline(std::cin, cmd)) {
            break; // EOF
        }
        if (cmd.empty()) {
            continue;
        }

        char c = cmd[0];
        if (c == 'q' || c == 'Q') {
            std::cout << "Quitting.\n";
            break;
        }

        using panelrise::controller::InputAction;

        switch (c) {
        case 'a': case 'A':
            controller.handleAction(InputAction::MoveLeft);
            break;
        case 'd': case 'D':
            controller.handleAction(InputAction::MoveRight);
            break;
        case 'w': case 'W':
            controller.handleAction(InputAction::MoveUp);
            break;
        case 's': case 'S':
            controller.handleAction(InputAction::MoveDown);
            break;
        case ' ':
            if (!controller.handleAction(InputAction::Swap)) {
                std::cout << "Swap rejected.\n";
            }
            break;
        case 'r': case 'R':
            controller.handleAction(grid.rise().isFastRising()
                                        ? InputAction::FastRiseRelease
                                        : InputAction::FastRise);
            break;
        case 't': case 'T':
            controller.update(panelrise::controller::GridController::Duration{500});
            break;
        default:
            std::cout << "Unknown command: " << c << '\n';
            break;
        }

        printGrid(grid);

        if (grid.isGameOver()) {
            std::cout << "GAME OVER. Press 'q' to quit.\n";
        }
    }

    return 0;
}
