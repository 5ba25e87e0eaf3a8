// Drawing engine for tomodraw.
//
// Interprets pointer gestures (press, move*, release/leave) into mutations of
// a GridModel using the active tool. The engine never renders; it only decides
// which glyph goes in which cell.
//
// Gesture rules:
//  - Press captures the anchor, the tool, the box glyphs and (for Line) the
//    modifier. Later SetTool()/SetBoxGlyphs() calls or modifier changes do not
//    affect the running gesture.
//  - Move re-derives the shape from the press-time base; earlier preview
//    frames never leave residue.
//  - Release and Leave end the gesture without further mutation.

#pragma once

#include "core/draw_types.h"
#include "core/glyph_rules.h"
#include "core/preview_patch.h"
#include "core/shape_raster.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tomo
{
class GridModel;

class DrawEngine
{
public:
    static constexpr char32_t kDefaultBrushGlyph = U'x';

    // Text insertion spawned by a Text-tool press, waiting for CommitText().
    // Survives presses with other tools; a new Text press replaces it.
    struct PendingText
    {
        int x = 0;
        int y = 0;
        // Longest text that still fits before the right edge (columns - x).
        int max_len = 0;
    };

    explicit DrawEngine(GridModel& grid, const glyph::BoxGlyphs& box_glyphs = glyph::BoxGlyphs{});

    DrawEngine(const DrawEngine&) = delete;
    DrawEngine& operator=(const DrawEngine&) = delete;

    // ---------------------------------------------------------------------
    // Tool selection
    // ---------------------------------------------------------------------
    ToolKind GetTool() const { return m_tool; }
    // Takes effect for the next gesture.
    void     SetTool(ToolKind tool) { m_tool = tool; }

    char32_t   GetBrushGlyph() const { return m_brush; }
    // Takes effect immediately, including mid-stroke.
    // Returns InvalidGlyph (brush unchanged) if `cp` cannot occupy a single cell.
    DrawResult SetBrushGlyph(char32_t cp);

    // Takes effect for the next gesture.
    void SetBoxGlyphs(const glyph::BoxGlyphs& glyphs) { m_box = glyphs; }

    // ---------------------------------------------------------------------
    // Pointer input
    // ---------------------------------------------------------------------
    DrawResult HandlePointer(const PointerEvent& ev);

    DrawResult Press(int x, int y, bool modifier = false);
    DrawResult Move(int x, int y);
    DrawResult Release();
    // Pointer left the canvas: same as Release.
    DrawResult Leave();

    bool     IsGestureActive() const { return m_gesture.active; }
    // Tool captured by the running gesture (meaningful only while active).
    ToolKind GetGestureTool() const { return m_gesture.tool; }

    // ---------------------------------------------------------------------
    // Text insertion
    // ---------------------------------------------------------------------
    const std::optional<PendingText>& GetPendingText() const { return m_pending_text; }

    // Stamps UTF-8 `text` at the pending anchor (truncated to max_len, no wrapping)
    // and discards the pending insertion.
    DrawResult CommitText(std::string_view text);
    // Discards the pending insertion without touching the grid.
    DrawResult CancelText();

    // ---------------------------------------------------------------------
    // Export
    // ---------------------------------------------------------------------
    std::string ExportText() const;

    const GridModel& GetGrid() const { return m_grid; }

private:
    struct GestureState
    {
        bool     active = false;
        ToolKind tool = ToolKind::Pencil;
        int      start_x = 0;
        int      start_y = 0;
        // Line only: bend after the horizontal run (captured from the modifier at press).
        bool     horizontal_first = false;
        // Rectangle/Line glyphs in effect at press.
        glyph::BoxGlyphs box;
        // Cells overwritten by the current preview frame, with their press-time glyphs.
        PreviewPatch preview;
    };

    void ApplyAt(int x, int y);
    void RedrawShape(int x, int y);
    void EndGesture();

    GridModel&       m_grid;
    glyph::BoxGlyphs m_box;
    ToolKind         m_tool = ToolKind::Pencil;
    char32_t         m_brush = kDefaultBrushGlyph;

    GestureState               m_gesture;
    std::optional<PendingText> m_pending_text;

    // Scratch buffer reused across preview frames.
    std::vector<raster::RasterCell> m_scratch;
};
} // namespace tomo
