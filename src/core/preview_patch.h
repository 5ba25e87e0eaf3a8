#pragma once

#include <vector>

namespace tomo
{
class GridModel;

// Live shape preview over a fixed base.
//
// Each write records the glyph it overwrites, so Revert() restores the grid
// to exactly the state it had before the first write of the current frame.
// Writes that overlap within a frame are handled by restoring in reverse order.
class PreviewPatch
{
public:
    // Writes `cp` at (x, y) through the patch. Returns false if the grid rejected the write.
    bool Write(GridModel& grid, int x, int y, char32_t cp);

    // Restores every recorded cell and forgets the frame.
    void Revert(GridModel& grid);

    // Keeps the current frame as final content.
    void Commit() { m_saved.clear(); }

private:
    struct SavedCell
    {
        int      x = 0;
        int      y = 0;
        char32_t base = U' ';
    };

    std::vector<SavedCell> m_saved;
};
} // namespace tomo
