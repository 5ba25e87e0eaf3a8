#include "core/preview_patch.h"

#include "core/grid_model.h"

namespace tomo
{
bool PreviewPatch::Write(GridModel& grid, int x, int y, char32_t cp)
{
    char32_t base = U' ';
    if (!grid.GetCell(x, y, base))
        return false;
    if (!grid.SetCell(x, y, cp))
        return false;
    m_saved.push_back(SavedCell{x, y, base});
    return true;
}

void PreviewPatch::Revert(GridModel& grid)
{
    for (auto it = m_saved.rbegin(); it != m_saved.rend(); ++it)
    {
        // Recorded bases came out of the grid, so they are always valid glyphs.
        grid.SetCell(it->x, it->y, it->base);
    }
    m_saved.clear();
}
} // namespace tomo
