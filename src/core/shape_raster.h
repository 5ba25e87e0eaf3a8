#pragma once

#include "core/glyph_rules.h"

#include <string_view>
#include <vector>

namespace tomo::raster
{
// One cell write produced by a rasterizer.
struct RasterCell
{
    int      x = 0;
    int      y = 0;
    char32_t cp = U' ';
};

// Rectangle outline through the corners (x0, y0) and (x1, y1).
//
// Rows min(y) and max(y) get `horizontal` when the x span is non-degenerate;
// columns min(x) and max(x) get `vertical` when the y span is non-degenerate.
// Corner glyphs are written last and only when both spans are non-degenerate.
// A zero-size rectangle produces no cells.
void RasterizeRectangle(int x0, int y0, int x1, int y1,
                        const glyph::BoxGlyphs& glyphs,
                        std::vector<RasterCell>& out);

// Orthogonal "elbow" line from (x0, y0) to (x1, y1).
//
// horizontal_first: horizontal run on row y0, vertical run on column x1, bend at (x1, y0).
// otherwise:        horizontal run on row y1, vertical run on column x0, bend at (x0, y1).
// The bend glyph depends on the drag direction. A degenerate span draws a
// single straight run with no bend; a zero-length line produces no cells.
void RasterizeElbowLine(int x0, int y0, int x1, int y1,
                        bool horizontal_first,
                        const glyph::BoxGlyphs& glyphs,
                        std::vector<RasterCell>& out);

// Bend glyph for an elbow line with both spans non-degenerate.
char32_t ElbowCornerGlyph(int dx, int dy, bool horizontal_first, const glyph::BoxGlyphs& glyphs);

// Lays UTF-8 `text` out left-to-right from (x, y), one code point per column,
// no wrapping. At most `max_len` cells are produced. Code points that cannot
// occupy a single cell are replaced with glyph::kUnprintable.
void LayoutTextStamp(int x, int y, int max_len, std::string_view text, std::vector<RasterCell>& out);
} // namespace tomo::raster
