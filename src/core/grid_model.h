// Character grid model for tomodraw.
//
// A fixed 80x24 grid of single-cell glyphs (Unicode scalars). The grid is
// owned by exactly one GridModel; every canvas constructs its own.
// Blank cells hold U' '.

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace tomo
{
static constexpr int kGridColumns = 80;
static constexpr int kGridRows = 24;

// Cell-space rectangle. Corners are inclusive of (x, y) and exclusive of (x + w, y + h).
struct CellRect
{
    int x = 0;
    int y = 0;
    int w = 0;
    int h = 0;

    bool Contains(int cx, int cy) const { return cx >= x && cy >= y && cx < x + w && cy < y + h; }
};

// Full-buffer value copy of a grid (row-major, size == columns * rows).
struct Grid
{
    int                   columns = kGridColumns;
    int                   rows = kGridRows;
    std::vector<char32_t> cells;

    // Unchecked; callers guarantee (x, y) is in range.
    char32_t At(int x, int y) const { return cells[(size_t)y * (size_t)columns + (size_t)x]; }

    bool operator==(const Grid& other) const = default;
};

class GridModel
{
public:
    GridModel();

    int GetColumns() const { return m_columns; }
    int GetRows() const { return m_rows; }
    bool InBounds(int x, int y) const { return x >= 0 && y >= 0 && x < m_columns && y < m_rows; }

    // Returns false if (x, y) is outside the grid (`out_cp` is left untouched).
    bool GetCell(int x, int y, char32_t& out_cp) const;

    // Overwrites one cell.
    // Returns false (grid unchanged) if (x, y) is outside the grid or `cp` is not
    // a single-cell printable glyph (see glyph::IsCellGlyph).
    bool SetCell(int x, int y, char32_t cp);

    // Independent copy of the whole buffer.
    Grid Snapshot() const;

    // Installs `grid` as the whole buffer.
    // Returns false (grid unchanged) on a dimension mismatch or if any cell is invalid.
    bool Replace(const Grid& grid);

    // Blanks every cell.
    void Clear();

    // UTF-8 text: `rows` lines of exactly `columns` glyphs joined by '\n'.
    // No trailing newline and no trailing-space trimming.
    std::string ToText() const;

    // ---------------------------------------------------------------------
    // Change tracking (for the presentation layer)
    // ---------------------------------------------------------------------
    // Monotonically increasing counter bumped whenever a cell value changes.
    // Writes that store the glyph already present are not changes.
    std::uint64_t GetContentRevision() const { return m_content_revision; }

    // Union of cells changed since the last call. Returns false if nothing changed.
    bool TakeDirtyRect(CellRect& out);

private:
    size_t IndexOf(int x, int y) const { return (size_t)y * (size_t)m_columns + (size_t)x; }
    void   MarkDirty(int x, int y);
    void   MarkAllDirty();
    void   TouchContent()
    {
        ++m_content_revision;
        if (m_content_revision == 0)
            ++m_content_revision;
    }

    int                   m_columns = kGridColumns;
    int                   m_rows = kGridRows;
    std::vector<char32_t> m_cells;

    std::uint64_t m_content_revision = 1;
    bool          m_dirty = false;
    int           m_dirty_x0 = 0;
    int           m_dirty_y0 = 0;
    int           m_dirty_x1 = 0; // inclusive
    int           m_dirty_y1 = 0; // inclusive
};
} // namespace tomo
