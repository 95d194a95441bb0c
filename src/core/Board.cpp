#include "core/Board.hpp"
#include <algorithm>
#include <stdexcept>

namespace panelrise::core {

Board::Board(int width, int height, int preloadRows)
    : width_{width}
    , height_{height}
    , preloadRows_{preloadRows}
{
    if (width <= 0 || height <= 0 || preloadRows < 0) {
        throw std::invalid_argument("Board dimensions must be positive");
    }
    cells_.assign(static_cast<std::size_t>(width * height), Occupant{});
    preload_.assign(static_cast<std::size_t>(width * preloadRows), Occupant{});
}

Occupant Board::cell(int x, int y) const {
    if (!isInside(x, y)) {
        throw std::out_of_range("Board::cell out of range");
    }
    return cells_[index(x, y)];
}

void Board::setCell(int x, int y, Occupant occupant) {
    if (!isInside(x, y)) {
        throw std::out_of_range("Board::setCell out of range");
    }
    cells_[index(x, y)] = occupant;
}

Occupant Board::preloadCell(int x, int depth) const {
    if (x < 0 || x >= width_ || depth < 0 || depth >= preloadRows_) {
        throw std::out_of_range("Board::preloadCell out of range");
    }
    return preload_[preloadIndex(x, depth)];
}

void Board::setPreloadCell(int x, int depth, Occupant occupant) {
    if (x < 0 || x >= width_ || depth < 0 || depth >= preloadRows_) {
        throw std::out_of_range("Board::setPreloadCell out of range");
    }
    preload_[preloadIndex(x, depth)] = occupant;
}

bool Board::rowHasOccupant(int y) const {
    if (y < 0 || y >= height_) {
        throw std::out_of_range("Board::rowHasOccupant out of range");
    }
    for (int x = 0; x < width_; ++x) {
        if (!cells_[index(x, y)].empty()) {
            return true;
        }
    }
    return false;
}

int Board::stackHeight() const noexcept {
    int maxY = 0;
    for (int x = 0; x < width_; ++x) {
        for (int y = height_ - 1; y >= 0; --y) {
            if (!cells_[index(x, y)].empty()) {
                maxY = std::max(maxY, y);
                break;
            }
        }
    }
    return maxY;
}

bool Board::shiftUp() {
    if (rowHasOccupant(height_ - 1)) {
        return false;
    }

    for (int x = 0; x < width_; ++x) {
        for (int y = height_ - 1; y > 0; --y) {
            cells_[index(x, y)] = cells_[index(x, y - 1)];
        }
        cells_[index(x, 0)] = preloadRows_ > 0 ? preload_[preloadIndex(x, 0)] : Occupant{};

        for (int d = 0; d + 1 < preloadRows_; ++d) {
            preload_[preloadIndex(x, d)] = preload_[preloadIndex(x, d + 1)];
        }
        if (preloadRows_ > 0) {
            preload_[preloadIndex(x, preloadRows_ - 1)] = Occupant{};
        }
    }
    return true;
}

void Board::clear() noexcept {
    std::fill(cells_.begin(), cells_.end(), Occupant{});
    std::fill(preload_.begin(), preload_.end(), Occupant{});
}

} // namespace panelrise::core
