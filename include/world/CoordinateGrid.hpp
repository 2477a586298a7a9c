/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COORDINATE_GRID_HPP
#define COORDINATE_GRID_HPP

#include "world/NavTypes.hpp"
#include <algorithm>
#include <cstddef>
#include <utility>
#include <vector>

namespace Wayfarer {

/**
 * @brief Inclusive bounding box of tile coordinates.
 */
struct GridBounds {
    int minX{0};
    int minY{0};
    int maxX{-1};
    int maxY{-1};
    bool empty{true};

    int width() const { return empty ? 0 : maxX - minX + 1; }
    int height() const { return empty ? 0 : maxY - minY + 1; }

    bool contains(const Coordinate& c) const {
        return !empty && c.x >= minX && c.x <= maxX && c.y >= minY && c.y <= maxY;
    }

    void include(const Coordinate& c) {
        if (empty) {
            minX = maxX = c.x;
            minY = maxY = c.y;
            empty = false;
            return;
        }
        minX = std::min(minX, c.x);
        maxX = std::max(maxX, c.x);
        minY = std::min(minY, c.y);
        maxY = std::max(maxY, c.y);
    }

    GridBounds expanded(int margin) const {
        if (empty) return *this;
        return GridBounds{minX - margin, minY - margin, maxX + margin, maxY + margin, false};
    }

    bool operator==(const GridBounds& other) const = default;
};

/**
 * @brief Unbounded 2D tile store addressed by signed area-local coordinates.
 *
 * Backed by a dense row-major vector plus the world coordinate of storage
 * cell (0,0). Reading outside storage returns the default value. Writing
 * outside storage grows the vector on the touched edges with extra slack so
 * that walking steadily in one direction copies the store a logarithmic
 * number of times. Growth never moves previously written values relative to
 * each other. There is no shrink.
 */
template <typename T>
class CoordinateGrid {
public:
    explicit CoordinateGrid(T defaultValue = T{})
        : m_default(std::move(defaultValue)) {}

    const T& get(const Coordinate& c) const {
        if (!inStorage(c)) {
            return m_default;
        }
        return m_cells[index(c)];
    }

    void set(const Coordinate& c, T value) {
        if (!inStorage(c)) {
            growToInclude(c);
        }
        m_cells[index(c)] = std::move(value);
        m_written.include(c);
    }

    // True when c lies inside the bounding box of written coordinates
    bool contains(const Coordinate& c) const { return m_written.contains(c); }

    const GridBounds& bounds() const { return m_written; }
    bool empty() const { return m_written.empty; }
    const T& defaultValue() const { return m_default; }

    int storageWidth() const { return m_width; }
    int storageHeight() const { return m_height; }

    void clear() {
        m_cells.clear();
        m_width = 0;
        m_height = 0;
        m_originX = 0;
        m_originY = 0;
        m_written = GridBounds{};
    }

    // Visits every cell of the written bounding box, row by row
    template <typename Fn>
    void forEachWritten(Fn&& fn) const {
        if (m_written.empty) return;
        for (int y = m_written.minY; y <= m_written.maxY; ++y) {
            for (int x = m_written.minX; x <= m_written.maxX; ++x) {
                Coordinate c{x, y};
                fn(c, get(c));
            }
        }
    }

    template <typename Pred>
    size_t countIf(Pred&& pred) const {
        size_t count = 0;
        forEachWritten([&](const Coordinate&, const T& value) {
            if (pred(value)) ++count;
        });
        return count;
    }

private:
    static constexpr int MIN_GROWTH = 8;

    bool inStorage(const Coordinate& c) const {
        return c.x >= m_originX && c.x < m_originX + m_width &&
               c.y >= m_originY && c.y < m_originY + m_height;
    }

    size_t index(const Coordinate& c) const {
        return static_cast<size_t>(c.y - m_originY) * static_cast<size_t>(m_width) +
               static_cast<size_t>(c.x - m_originX);
    }

    void growToInclude(const Coordinate& c) {
        if (m_width == 0 || m_height == 0) {
            m_originX = c.x;
            m_originY = c.y;
            m_width = 1;
            m_height = 1;
            m_cells.assign(1, m_default);
            return;
        }

        int minX = m_originX;
        int minY = m_originY;
        int maxX = m_originX + m_width - 1;
        int maxY = m_originY + m_height - 1;

        const int slackX = std::max(MIN_GROWTH, m_width / 2);
        const int slackY = std::max(MIN_GROWTH, m_height / 2);

        if (c.x < minX) minX = c.x - slackX;
        if (c.x > maxX) maxX = c.x + slackX;
        if (c.y < minY) minY = c.y - slackY;
        if (c.y > maxY) maxY = c.y + slackY;

        const int newWidth = maxX - minX + 1;
        const int newHeight = maxY - minY + 1;
        std::vector<T> cells(static_cast<size_t>(newWidth) * static_cast<size_t>(newHeight),
                             m_default);

        const int shiftX = m_originX - minX;
        const int shiftY = m_originY - minY;
        for (int row = 0; row < m_height; ++row) {
            auto src = m_cells.begin() + static_cast<ptrdiff_t>(row) * m_width;
            auto dst = cells.begin() +
                       static_cast<ptrdiff_t>(row + shiftY) * newWidth + shiftX;
            std::move(src, src + m_width, dst);
        }

        m_cells = std::move(cells);
        m_originX = minX;
        m_originY = minY;
        m_width = newWidth;
        m_height = newHeight;
    }

    T m_default;
    std::vector<T> m_cells;
    int m_originX{0};
    int m_originY{0};
    int m_width{0};
    int m_height{0};
    GridBounds m_written;
};

} // namespace Wayfarer

#endif // COORDINATE_GRID_HPP
