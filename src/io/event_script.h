#pragma once

#include "core/draw_types.h"

#include <string>
#include <vector>

namespace tomo
{
class DrawEngine;

// Recorded engine input, used by tomodraw_replay and tests to drive the engine
// without a UI event source.
//
// {
//   "events": [
//     { "type": "tool", "tool": "rectangle" },
//     { "type": "brush", "glyph": "#" },
//     { "type": "press", "x": 2, "y": 2, "modifier": false },
//     { "type": "move", "x": 6, "y": 5 },
//     { "type": "release" },
//     { "type": "leave" },
//     { "type": "text", "text": "hi" },
//     { "type": "cancel_text" }
//   ]
// }
struct ScriptEvent
{
    enum class Kind : std::uint8_t
    {
        Pointer = 0,
        Tool,
        Brush,
        Text,
        CancelText,
    };

    Kind         kind = Kind::Pointer;
    PointerEvent pointer;
    ToolKind     tool = ToolKind::Pencil;
    char32_t     glyph = U' ';
    std::string  text;
};

struct EventScript
{
    std::vector<ScriptEvent> events;
};

bool ParseEventScript(const std::string& json_text, EventScript& out, std::string& err);
bool LoadEventScriptFromFile(const std::string& path, EventScript& out, std::string& err);

// Delivers one event to `engine`.
DrawResult ApplyScriptEvent(const ScriptEvent& ev, DrawEngine& engine);
} // namespace tomo
