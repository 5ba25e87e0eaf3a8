#pragma once

#include <string>
#include <vector>

namespace tomo
{
// Brush glyph palette: the grid of glyphs offered by the Pencil brush picker.
//
// Loads/saves a JSON file:
// {
//   "title": "Default",
//   "columns": 10,
//   "chars": ["┌", "┐", ...]
// }
//
// Each entry in "chars" must be exactly one single-cell glyph. Glyphs are laid
// out row-major; the last row may be partial.
class BrushPalette
{
public:
    BrushPalette() = default;

    // Built-in palette: box drawing, arrows, punctuation, letters and digits (11 rows of 10).
    static BrushPalette Default();

    const std::string& GetTitle() const { return m_title; }
    int  Columns() const { return m_columns; }
    int  Rows() const;
    int  Size() const { return (int)m_glyphs.size(); }

    // Returns false if (row, col) holds no glyph.
    bool GlyphAt(int row, int col, char32_t& out_cp) const;

    // Locates `cp`. Returns false if the glyph is not part of the palette.
    bool Find(char32_t cp, int& out_row, int& out_col) const;
    bool Contains(char32_t cp) const;

    bool LoadFromFile(const char* path, std::string& error);
    bool SaveToFile(const char* path, std::string& error) const;

private:
    std::string           m_title;
    int                   m_columns = 10;
    std::vector<char32_t> m_glyphs;
};
} // namespace tomo
