#include "core/draw_engine.h"

#include "core/grid_model.h"

namespace tomo
{
DrawEngine::DrawEngine(GridModel& grid, const glyph::BoxGlyphs& box_glyphs)
    : m_grid(grid)
    , m_box(box_glyphs)
{
}

DrawResult DrawEngine::SetBrushGlyph(char32_t cp)
{
    if (!glyph::IsCellGlyph(cp))
        return DrawResult::InvalidGlyph;
    m_brush = cp;
    return DrawResult::Ok;
}

DrawResult DrawEngine::HandlePointer(const PointerEvent& ev)
{
    switch (ev.kind)
    {
        case PointerKind::Press:   return Press(ev.x, ev.y, ev.modifier);
        case PointerKind::Move:    return Move(ev.x, ev.y);
        case PointerKind::Release: return Release();
        case PointerKind::Leave:   return Leave();
    }
    return DrawResult::InvalidGestureState;
}

DrawResult DrawEngine::Press(int x, int y, bool modifier)
{
    if (!m_grid.InBounds(x, y))
        return DrawResult::OutOfBounds;

    // A press without a release in between: keep what the lost gesture drew.
    if (m_gesture.active)
        EndGesture();

    m_gesture.active = true;
    m_gesture.tool = m_tool;
    m_gesture.start_x = x;
    m_gesture.start_y = y;
    m_gesture.horizontal_first = modifier;
    m_gesture.box = m_box;
    m_gesture.preview.Commit();

    // A Text press replaces any insertion still waiting for its commit.
    if (m_gesture.tool == ToolKind::Text)
        m_pending_text = PendingText{x, y, m_grid.GetColumns() - x};
    else
        ApplyAt(x, y);
    return DrawResult::Ok;
}

DrawResult DrawEngine::Move(int x, int y)
{
    if (!m_grid.InBounds(x, y))
        return DrawResult::OutOfBounds;
    if (!m_gesture.active)
        return DrawResult::InvalidGestureState;

    ApplyAt(x, y);
    return DrawResult::Ok;
}

DrawResult DrawEngine::Release()
{
    if (!m_gesture.active)
        return DrawResult::InvalidGestureState;
    EndGesture();
    return DrawResult::Ok;
}

DrawResult DrawEngine::Leave()
{
    return Release();
}

void DrawEngine::ApplyAt(int x, int y)
{
    // (x, y) is bounds-checked by the caller and the brush is validated on set,
    // so SetCell cannot reject these writes.
    switch (m_gesture.tool)
    {
        case ToolKind::Pencil:
            m_grid.SetCell(x, y, m_brush);
            break;
        case ToolKind::Eraser:
            m_grid.SetCell(x, y, glyph::kBlank);
            break;
        case ToolKind::Rectangle:
        case ToolKind::Line:
            RedrawShape(x, y);
            break;
        case ToolKind::Text:
            // The insertion is anchored at the press; dragging does not move it.
            break;
    }
}

void DrawEngine::RedrawShape(int x, int y)
{
    m_gesture.preview.Revert(m_grid);

    m_scratch.clear();
    const int x0 = m_gesture.start_x;
    const int y0 = m_gesture.start_y;
    if (m_gesture.tool == ToolKind::Rectangle)
        raster::RasterizeRectangle(x0, y0, x, y, m_gesture.box, m_scratch);
    else
        raster::RasterizeElbowLine(x0, y0, x, y, m_gesture.horizontal_first, m_gesture.box, m_scratch);

    for (const raster::RasterCell& c : m_scratch)
        m_gesture.preview.Write(m_grid, c.x, c.y, c.cp);
}

void DrawEngine::EndGesture()
{
    m_gesture.preview.Commit();
    m_gesture.active = false;
}

DrawResult DrawEngine::CommitText(std::string_view text)
{
    if (!m_pending_text)
        return DrawResult::InvalidGestureState;

    const PendingText pending = *m_pending_text;
    m_pending_text.reset();

    m_scratch.clear();
    raster::LayoutTextStamp(pending.x, pending.y, pending.max_len, text, m_scratch);
    for (const raster::RasterCell& c : m_scratch)
        m_grid.SetCell(c.x, c.y, c.cp);
    return DrawResult::Ok;
}

DrawResult DrawEngine::CancelText()
{
    if (!m_pending_text)
        return DrawResult::InvalidGestureState;
    m_pending_text.reset();
    return DrawResult::Ok;
}

std::string DrawEngine::ExportText() const
{
    return m_grid.ToText();
}
} // namespace tomo
