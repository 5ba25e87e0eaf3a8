#include "io/event_script.h"

#include "core/draw_engine.h"
#include "core/utf8.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <fstream>
#include <iterator>
#include <limits>

using json = nlohmann::json;

namespace tomo
{
namespace
{
static bool ReadInt(const json& item, const char* key, int& out, std::string& err)
{
    auto it = item.find(key);
    if (it == item.end() || !it->is_number_integer())
    {
        err = std::string("missing integer \"") + key + "\"";
        return false;
    }
    // get<int>() would narrow silently; out-of-range coordinates must reach the
    // engine's bounds check unchanged or be rejected here.
    const bool in_range = it->is_number_unsigned()
        ? it->get<std::uint64_t>() <= (std::uint64_t)std::numeric_limits<int>::max()
        : it->get<std::int64_t>() >= std::numeric_limits<int>::min() &&
              it->get<std::int64_t>() <= std::numeric_limits<int>::max();
    if (!in_range)
    {
        err = std::string("integer \"") + key + "\" is out of range";
        return false;
    }
    out = (int)it->get<std::int64_t>();
    return true;
}

static bool ParseEvent(const json& item, ScriptEvent& out, std::string& err)
{
    if (!item.is_object())
    {
        err = "event is not an object";
        return false;
    }
    auto type_it = item.find("type");
    if (type_it == item.end() || !type_it->is_string())
    {
        err = "missing string \"type\"";
        return false;
    }
    const std::string type = type_it->get<std::string>();

    if (type == "press" || type == "move")
    {
        out.kind = ScriptEvent::Kind::Pointer;
        out.pointer.kind = (type == "press") ? PointerKind::Press : PointerKind::Move;
        if (!ReadInt(item, "x", out.pointer.x, err) || !ReadInt(item, "y", out.pointer.y, err))
            return false;
        out.pointer.modifier = item.value("modifier", false);
        return true;
    }
    if (type == "release" || type == "leave")
    {
        out.kind = ScriptEvent::Kind::Pointer;
        out.pointer.kind = (type == "release") ? PointerKind::Release : PointerKind::Leave;
        return true;
    }
    if (type == "tool")
    {
        out.kind = ScriptEvent::Kind::Tool;
        const std::string name = item.value("tool", std::string());
        if (!ParseToolKind(name, out.tool))
        {
            err = "unknown tool \"" + name + "\"";
            return false;
        }
        return true;
    }
    if (type == "brush")
    {
        out.kind = ScriptEvent::Kind::Brush;
        const std::string g = item.value("glyph", std::string());
        if (utf8::CountCodePoints(g) != 1)
        {
            err = "\"glyph\" must be exactly one character";
            return false;
        }
        out.glyph = utf8::DecodeFirst(g);
        return true;
    }
    if (type == "text")
    {
        out.kind = ScriptEvent::Kind::Text;
        auto it = item.find("text");
        if (it == item.end() || !it->is_string())
        {
            err = "missing string \"text\"";
            return false;
        }
        out.text = it->get<std::string>();
        return true;
    }
    if (type == "cancel_text")
    {
        out.kind = ScriptEvent::Kind::CancelText;
        return true;
    }

    err = "unknown event type \"" + type + "\"";
    return false;
}
} // namespace

bool ParseEventScript(const std::string& json_text, EventScript& out, std::string& err)
{
    err.clear();

    json j;
    try
    {
        j = json::parse(json_text);
    }
    catch (const std::exception& e)
    {
        err = e.what();
        return false;
    }

    if (!j.is_object())
    {
        err = "Expected top-level JSON object in event script";
        return false;
    }
    auto events = j.find("events");
    if (events == j.end() || !events->is_array())
    {
        err = "Missing \"events\" array in event script";
        return false;
    }

    EventScript parsed;
    parsed.events.reserve(events->size());
    try
    {
        for (std::size_t i = 0; i < events->size(); ++i)
        {
            ScriptEvent ev;
            std::string ev_err;
            if (!ParseEvent((*events)[i], ev, ev_err))
            {
                err = "event " + std::to_string(i) + ": " + ev_err;
                return false;
            }
            parsed.events.push_back(std::move(ev));
        }
    }
    catch (const std::exception& e)
    {
        // json::value() throws on a type mismatch (e.g. "modifier": "yes").
        err = e.what();
        return false;
    }

    out = std::move(parsed);
    return true;
}

bool LoadEventScriptFromFile(const std::string& path, EventScript& out, std::string& err)
{
    std::ifstream f(path, std::ios::binary);
    if (!f)
    {
        err = "Failed to open " + path;
        return false;
    }
    const std::string text((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    if (!ParseEventScript(text, out, err))
    {
        err = path + ": " + err;
        return false;
    }
    return true;
}

DrawResult ApplyScriptEvent(const ScriptEvent& ev, DrawEngine& engine)
{
    switch (ev.kind)
    {
        case ScriptEvent::Kind::Pointer:
            return engine.HandlePointer(ev.pointer);
        case ScriptEvent::Kind::Tool:
            engine.SetTool(ev.tool);
            return DrawResult::Ok;
        case ScriptEvent::Kind::Brush:
            return engine.SetBrushGlyph(ev.glyph);
        case ScriptEvent::Kind::Text:
            return engine.CommitText(ev.text);
        case ScriptEvent::Kind::CancelText:
            return engine.CancelText();
    }
    return DrawResult::InvalidGestureState;
}
} // namespace tomo
