#include "core/glyph_rules.h"

#include <unicode/uchar.h>

namespace tomo::glyph
{
bool IsCellGlyph(char32_t cp)
{
    if (cp > 0x10FFFFu || (cp >= 0xD800u && cp <= 0xDFFFu))
        return false;
    if (cp == kBlank)
        return true;

    const UChar32 c = static_cast<UChar32>(cp);
    if (!u_isprint(c))
        return false;

    const int32_t eaw = u_getIntPropertyValue(c, UCHAR_EAST_ASIAN_WIDTH);
    if (eaw == U_EA_WIDE || eaw == U_EA_FULLWIDTH)
        return false;

    // Combining marks render on top of the previous cell.
    const int8_t gc = u_charType(c);
    if (gc == U_NON_SPACING_MARK || gc == U_ENCLOSING_MARK || gc == U_COMBINING_SPACING_MARK)
        return false;
    return true;
}

BoxGlyphs GlyphsForStyle(BoxStyle style)
{
    switch (style)
    {
        case BoxStyle::Light:
            return BoxGlyphs{};
        case BoxStyle::Heavy:
            return BoxGlyphs{U'━', U'┃', U'┏', U'┓', U'┗', U'┛'};
        case BoxStyle::Double:
            return BoxGlyphs{U'═', U'║', U'╔', U'╗', U'╚', U'╝'};
        case BoxStyle::Rounded:
            return BoxGlyphs{U'─', U'│', U'╭', U'╮', U'╰', U'╯'};
        case BoxStyle::Ascii:
            return BoxGlyphs{U'-', U'|', U'+', U'+', U'+', U'+'};
    }
    return BoxGlyphs{};
}

std::string_view ToString(BoxStyle style)
{
    switch (style)
    {
        case BoxStyle::Light:   return "light";
        case BoxStyle::Heavy:   return "heavy";
        case BoxStyle::Double:  return "double";
        case BoxStyle::Rounded: return "rounded";
        case BoxStyle::Ascii:   return "ascii";
    }
    return "light";
}

bool ParseBoxStyle(std::string_view name, BoxStyle& out)
{
    static constexpr BoxStyle kAll[] = {
        BoxStyle::Light, BoxStyle::Heavy, BoxStyle::Double, BoxStyle::Rounded, BoxStyle::Ascii,
    };
    for (BoxStyle s : kAll)
    {
        if (ToString(s) == name)
        {
            out = s;
            return true;
        }
    }
    return false;
}
} // namespace tomo::glyph
