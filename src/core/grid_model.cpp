#include "core/grid_model.h"

#include "core/glyph_rules.h"
#include "core/utf8.h"

#include <algorithm>

namespace tomo
{
GridModel::GridModel()
    : m_cells((size_t)kGridColumns * (size_t)kGridRows, glyph::kBlank)
{
}

bool GridModel::GetCell(int x, int y, char32_t& out_cp) const
{
    if (!InBounds(x, y))
        return false;
    out_cp = m_cells[IndexOf(x, y)];
    return true;
}

bool GridModel::SetCell(int x, int y, char32_t cp)
{
    if (!InBounds(x, y))
        return false;
    if (!glyph::IsCellGlyph(cp))
        return false;

    char32_t& cell = m_cells[IndexOf(x, y)];
    if (cell == cp)
        return true;
    cell = cp;
    MarkDirty(x, y);
    TouchContent();
    return true;
}

Grid GridModel::Snapshot() const
{
    Grid g;
    g.columns = m_columns;
    g.rows = m_rows;
    g.cells = m_cells;
    return g;
}

bool GridModel::Replace(const Grid& grid)
{
    if (grid.columns != m_columns || grid.rows != m_rows)
        return false;
    if (grid.cells.size() != m_cells.size())
        return false;
    if (!std::all_of(grid.cells.begin(), grid.cells.end(), glyph::IsCellGlyph))
        return false;

    if (grid.cells == m_cells)
        return true;
    m_cells = grid.cells;
    MarkAllDirty();
    TouchContent();
    return true;
}

void GridModel::Clear()
{
    const bool already_blank =
        std::all_of(m_cells.begin(), m_cells.end(), [](char32_t c) { return c == glyph::kBlank; });
    if (already_blank)
        return;
    std::fill(m_cells.begin(), m_cells.end(), glyph::kBlank);
    MarkAllDirty();
    TouchContent();
}

std::string GridModel::ToText() const
{
    std::string out;
    out.reserve((size_t)(m_columns + 1) * (size_t)m_rows);
    for (int y = 0; y < m_rows; ++y)
    {
        if (y > 0)
            out.push_back('\n');
        for (int x = 0; x < m_columns; ++x)
            utf8::Append(m_cells[IndexOf(x, y)], out);
    }
    return out;
}

bool GridModel::TakeDirtyRect(CellRect& out)
{
    if (!m_dirty)
        return false;
    out.x = m_dirty_x0;
    out.y = m_dirty_y0;
    out.w = (m_dirty_x1 - m_dirty_x0) + 1;
    out.h = (m_dirty_y1 - m_dirty_y0) + 1;
    m_dirty = false;
    return true;
}

void GridModel::MarkDirty(int x, int y)
{
    if (!m_dirty)
    {
        m_dirty = true;
        m_dirty_x0 = m_dirty_x1 = x;
        m_dirty_y0 = m_dirty_y1 = y;
        return;
    }
    m_dirty_x0 = std::min(m_dirty_x0, x);
    m_dirty_y0 = std::min(m_dirty_y0, y);
    m_dirty_x1 = std::max(m_dirty_x1, x);
    m_dirty_y1 = std::max(m_dirty_y1, y);
}

void GridModel::MarkAllDirty()
{
    m_dirty = true;
    m_dirty_x0 = 0;
    m_dirty_y0 = 0;
    m_dirty_x1 = m_columns - 1;
    m_dirty_y1 = m_rows - 1;
}
} // namespace tomo
