#pragma once

#include <cstdint>
#include <string_view>

namespace tomo
{
// Drawing tools. Closed set: every dispatch over ToolKind is an exhaustive switch.
enum class ToolKind : std::uint8_t
{
    Pencil = 0,
    Eraser,
    Rectangle,
    Line,
    Text,
};

enum class PointerKind : std::uint8_t
{
    Press = 0,
    Move,
    Release,
    Leave,
};

// Pointer input in grid cell coordinates (x = column, y = row).
// `modifier` is only consulted by the Line tool, at Press.
struct PointerEvent
{
    PointerKind kind = PointerKind::Move;
    int         x = 0;
    int         y = 0;
    bool        modifier = false;
};

// Outcome of an engine call. Anything but Ok leaves the grid untouched.
enum class DrawResult : std::uint8_t
{
    Ok = 0,
    // Coordinate outside the grid (caller contract violation; never clamped).
    OutOfBounds,
    // Event that needs an active gesture or pending text when there is none. Harmless no-op.
    InvalidGestureState,
    // Glyph that cannot occupy a single cell.
    InvalidGlyph,
};

std::string_view ToString(ToolKind tool);
std::string_view ToString(DrawResult result);

// Parses the stable lowercase tool name ("pencil", "eraser", "rectangle", "line", "text").
bool ParseToolKind(std::string_view name, ToolKind& out);
} // namespace tomo
