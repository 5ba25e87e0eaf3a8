#include "core/draw_types.h"

namespace tomo
{
std::string_view ToString(ToolKind tool)
{
    switch (tool)
    {
        case ToolKind::Pencil:    return "pencil";
        case ToolKind::Eraser:    return "eraser";
        case ToolKind::Rectangle: return "rectangle";
        case ToolKind::Line:      return "line";
        case ToolKind::Text:      return "text";
    }
    return "pencil";
}

std::string_view ToString(DrawResult result)
{
    switch (result)
    {
        case DrawResult::Ok:                  return "ok";
        case DrawResult::OutOfBounds:         return "out of bounds";
        case DrawResult::InvalidGestureState: return "invalid gesture state";
        case DrawResult::InvalidGlyph:        return "invalid glyph";
    }
    return "unknown";
}

bool ParseToolKind(std::string_view name, ToolKind& out)
{
    static constexpr ToolKind kAll[] = {
        ToolKind::Pencil, ToolKind::Eraser, ToolKind::Rectangle, ToolKind::Line, ToolKind::Text,
    };
    for (ToolKind t : kAll)
    {
        if (ToString(t) == name)
        {
            out = t;
            return true;
        }
    }
    return false;
}
} // namespace tomo
