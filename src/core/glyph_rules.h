#pragma once

#include <cstdint>
#include <string_view>

namespace tomo::glyph
{
static constexpr char32_t kBlank = U' ';
// Substituted for text input that cannot occupy a cell.
static constexpr char32_t kUnprintable = U'?';

// True if `cp` can occupy exactly one grid cell:
// - a Unicode scalar that ICU classifies as printable (U+0020 included)
// - not East Asian Wide/Fullwidth (those take two terminal columns)
bool IsCellGlyph(char32_t cp);

// Box-drawing glyph sets used by the Rectangle and Line tools.
enum class BoxStyle : std::uint8_t
{
    Light = 0,
    Heavy,
    Double,
    Rounded,
    Ascii,
};

struct BoxGlyphs
{
    char32_t horizontal   = U'─';
    char32_t vertical     = U'│';
    char32_t top_left     = U'┌';
    char32_t top_right    = U'┐';
    char32_t bottom_left  = U'└';
    char32_t bottom_right = U'┘';
};

BoxGlyphs GlyphsForStyle(BoxStyle style);

// Stable lowercase names ("light", "heavy", "double", "rounded", "ascii").
std::string_view ToString(BoxStyle style);
bool ParseBoxStyle(std::string_view name, BoxStyle& out);
} // namespace tomo::glyph
