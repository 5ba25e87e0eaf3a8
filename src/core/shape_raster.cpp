#include "core/shape_raster.h"

#include "core/utf8.h"

#include <algorithm>

namespace tomo::raster
{
namespace
{
static void HorizontalRun(int y, int sx, int ex, char32_t cp, std::vector<RasterCell>& out)
{
    for (int x = sx; x <= ex; ++x)
        out.push_back(RasterCell{x, y, cp});
}

static void VerticalRun(int x, int sy, int ey, char32_t cp, std::vector<RasterCell>& out)
{
    for (int y = sy; y <= ey; ++y)
        out.push_back(RasterCell{x, y, cp});
}
} // namespace

void RasterizeRectangle(int x0, int y0, int x1, int y1,
                        const glyph::BoxGlyphs& glyphs,
                        std::vector<RasterCell>& out)
{
    const int sx = std::min(x0, x1);
    const int ex = std::max(x0, x1);
    const int sy = std::min(y0, y1);
    const int ey = std::max(y0, y1);

    const bool has_w = sx != ex;
    const bool has_h = sy != ey;

    if (has_w)
    {
        HorizontalRun(sy, sx, ex, glyphs.horizontal, out);
        if (has_h)
            HorizontalRun(ey, sx, ex, glyphs.horizontal, out);
    }
    if (has_h)
    {
        VerticalRun(sx, sy, ey, glyphs.vertical, out);
        if (has_w)
            VerticalRun(ex, sy, ey, glyphs.vertical, out);
    }
    if (has_w && has_h)
    {
        out.push_back(RasterCell{sx, sy, glyphs.top_left});
        out.push_back(RasterCell{sx, ey, glyphs.bottom_left});
        out.push_back(RasterCell{ex, sy, glyphs.top_right});
        out.push_back(RasterCell{ex, ey, glyphs.bottom_right});
    }
}

char32_t ElbowCornerGlyph(int dx, int dy, bool horizontal_first, const glyph::BoxGlyphs& glyphs)
{
    const bool right = dx > 0;
    const bool down = dy > 0;
    if (horizontal_first)
    {
        // Travel along x first, then turn toward y1.
        if (right)
            return down ? glyphs.top_right : glyphs.bottom_right;
        return down ? glyphs.top_left : glyphs.bottom_left;
    }
    // Travel along y first, then turn toward x1.
    if (right)
        return down ? glyphs.bottom_left : glyphs.top_left;
    return down ? glyphs.bottom_right : glyphs.top_right;
}

void RasterizeElbowLine(int x0, int y0, int x1, int y1,
                        bool horizontal_first,
                        const glyph::BoxGlyphs& glyphs,
                        std::vector<RasterCell>& out)
{
    const int sx = std::min(x0, x1);
    const int ex = std::max(x0, x1);
    const int sy = std::min(y0, y1);
    const int ey = std::max(y0, y1);

    const bool has_w = sx != ex;
    const bool has_h = sy != ey;

    const int row = horizontal_first ? y0 : y1;
    const int col = horizontal_first ? x1 : x0;

    if (has_w)
        HorizontalRun(row, sx, ex, glyphs.horizontal, out);
    if (has_h)
        VerticalRun(col, sy, ey, glyphs.vertical, out);
    if (has_w && has_h)
        out.push_back(RasterCell{col, row, ElbowCornerGlyph(x1 - x0, y1 - y0, horizontal_first, glyphs)});
}

void LayoutTextStamp(int x, int y, int max_len, std::string_view text, std::vector<RasterCell>& out)
{
    if (max_len <= 0)
        return;

    int col = x;
    int n = 0;
    std::size_t pos = 0;
    while (pos < text.size() && n < max_len)
    {
        char32_t cp = 0;
        std::size_t len = 1;
        if (!utf8::DecodeAt(text, pos, cp, len) || !glyph::IsCellGlyph(cp))
            cp = glyph::kUnprintable;
        pos += len;

        out.push_back(RasterCell{col, y, cp});
        ++col;
        ++n;
    }
}
} // namespace tomo::raster
