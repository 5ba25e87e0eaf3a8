#include "core/brush_palette.h"

#include "core/glyph_rules.h"
#include "core/utf8.h"

#include <nlohmann/json.hpp>

#include <fstream>
#include <string_view>

using nlohmann::json;

namespace tomo
{
BrushPalette BrushPalette::Default()
{
    static constexpr std::u32string_view kGrid =
        U"┌┐└┘◀▶▲▼│─"
        U"┬┴┤├┼+><^v"
        U".,:;!?\"'-_"
        U"`=*&/\\|~@#"
        U"$%()[]{}ab"
        U"cdefghijkl"
        U"mnopqrstuv"
        U"wxyzABCDEF"
        U"GHIJKLMNOP"
        U"QRSTUVWXYZ"
        U"0123456789";

    BrushPalette p;
    p.m_title = "Default";
    p.m_columns = 10;
    p.m_glyphs.assign(kGrid.begin(), kGrid.end());
    return p;
}

int BrushPalette::Rows() const
{
    if (m_columns <= 0 || m_glyphs.empty())
        return 0;
    return ((int)m_glyphs.size() + m_columns - 1) / m_columns;
}

bool BrushPalette::GlyphAt(int row, int col, char32_t& out_cp) const
{
    if (row < 0 || col < 0 || col >= m_columns)
        return false;
    const long long idx = (long long)row * m_columns + col;
    if (idx >= (long long)m_glyphs.size())
        return false;
    out_cp = m_glyphs[(size_t)idx];
    return true;
}

bool BrushPalette::Find(char32_t cp, int& out_row, int& out_col) const
{
    if (m_columns <= 0)
        return false;
    for (int i = 0; i < (int)m_glyphs.size(); ++i)
    {
        if (m_glyphs[(size_t)i] == cp)
        {
            out_row = i / m_columns;
            out_col = i % m_columns;
            return true;
        }
    }
    return false;
}

bool BrushPalette::Contains(char32_t cp) const
{
    int row = 0;
    int col = 0;
    return Find(cp, row, col);
}

bool BrushPalette::LoadFromFile(const char* path, std::string& error)
{
    error.clear();

    std::ifstream f(path);
    if (!f)
    {
        error = std::string("Failed to open ") + path;
        return false;
    }

    json j;
    try
    {
        f >> j;
    }
    catch (const std::exception& e)
    {
        error = e.what();
        return false;
    }

    if (!j.is_object())
    {
        error = "Expected top-level JSON object in brush palette";
        return false;
    }

    std::string title = "Untitled";
    if (auto it = j.find("title"); it != j.end() && it->is_string())
        title = it->get<std::string>();

    int columns = 10;
    if (auto it = j.find("columns"); it != j.end())
    {
        if (!it->is_number_integer() || it->get<int>() <= 0)
        {
            error = "\"columns\" must be a positive integer";
            return false;
        }
        columns = it->get<int>();
    }

    auto chars = j.find("chars");
    if (chars == j.end() || !chars->is_array())
    {
        error = "Missing \"chars\" array in brush palette";
        return false;
    }

    std::vector<char32_t> glyphs;
    glyphs.reserve(chars->size());
    for (const auto& c : *chars)
    {
        if (!c.is_string())
        {
            error = "Brush palette entries must be strings";
            return false;
        }
        const std::string utf8 = c.get<std::string>();
        const char32_t cp = utf8::DecodeFirst(utf8);
        if (utf8::CountCodePoints(utf8) != 1 || !glyph::IsCellGlyph(cp))
        {
            error = "Invalid brush glyph \"" + utf8 + "\" (expected one single-cell character)";
            return false;
        }
        glyphs.push_back(cp);
    }

    if (glyphs.empty())
    {
        error = "Brush palette has no glyphs";
        return false;
    }

    m_title = std::move(title);
    m_columns = columns;
    m_glyphs = std::move(glyphs);
    return true;
}

bool BrushPalette::SaveToFile(const char* path, std::string& error) const
{
    error.clear();

    json out;
    out["title"] = m_title;
    out["columns"] = m_columns;
    json chars = json::array();
    for (char32_t cp : m_glyphs)
        chars.push_back(utf8::Encode(cp));
    out["chars"] = std::move(chars);

    std::ofstream f(path);
    if (!f)
    {
        error = std::string("Failed to write ") + path;
        return false;
    }

    try
    {
        f << out.dump(2) << "\n";
    }
    catch (const std::exception& e)
    {
        error = e.what();
        return false;
    }

    return true;
}
} // namespace tomo
