#include "io/settings.h"

#include "core/draw_engine.h"
#include "core/paths.h"
#include "core/utf8.h"

#include <nlohmann/json.hpp>

#include <cstdio>
#include <filesystem>
#include <fstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace tomo
{
namespace
{
static constexpr int kSchemaVersion = 1;

static bool FromJson(const json& j, Settings& out, std::string& err)
{
    if (!j.is_object())
    {
        err = "Expected top-level JSON object in settings";
        return false;
    }

    if (auto it = j.find("schema_version"); it != j.end())
    {
        if (!it->is_number_integer() || it->get<int>() != kSchemaVersion)
        {
            err = "Unsupported settings schema_version";
            return false;
        }
    }

    Settings st = out;

    if (auto it = j.find("brush_glyph"); it != j.end())
    {
        if (!it->is_string())
        {
            err = "\"brush_glyph\" must be a string";
            return false;
        }
        const std::string s = it->get<std::string>();
        const char32_t cp = utf8::DecodeFirst(s);
        if (utf8::CountCodePoints(s) != 1 || !glyph::IsCellGlyph(cp))
        {
            err = "Invalid brush_glyph \"" + s + "\" (expected one single-cell character)";
            return false;
        }
        st.brush_glyph = cp;
    }

    if (auto it = j.find("default_tool"); it != j.end())
    {
        const std::string name = it->is_string() ? it->get<std::string>() : std::string();
        if (!ParseToolKind(name, st.default_tool))
        {
            err = "Unknown default_tool \"" + name + "\"";
            return false;
        }
    }

    if (auto it = j.find("box_style"); it != j.end())
    {
        const std::string name = it->is_string() ? it->get<std::string>() : std::string();
        if (!glyph::ParseBoxStyle(name, st.box_style))
        {
            err = "Unknown box_style \"" + name + "\"";
            return false;
        }
    }

    out = st;
    return true;
}

static json ToJson(const Settings& st)
{
    json j;
    j["schema_version"] = kSchemaVersion;
    j["brush_glyph"] = utf8::Encode(st.brush_glyph);
    j["default_tool"] = std::string(ToString(st.default_tool));
    j["box_style"] = std::string(glyph::ToString(st.box_style));
    return j;
}
} // namespace

std::string GetSettingsPath()
{
    return TomodrawConfigPath("settings.json");
}

bool LoadSettingsFromFile(const std::string& path, Settings& out, std::string& err)
{
    err.clear();

    std::ifstream f(path);
    if (!f)
    {
        err = "Failed to open settings file for reading: " + path;
        return false;
    }

    json j;
    try
    {
        f >> j;
    }
    catch (const std::exception& e)
    {
        err = std::string("Failed to parse settings (") + path + "): " + e.what();
        return false;
    }

    if (!FromJson(j, out, err))
    {
        err = path + ": " + err;
        return false;
    }
    return true;
}

bool SaveSettingsToFile(const std::string& path, const Settings& st, std::string& err)
{
    err.clear();

    try
    {
        fs::path p(path);
        if (p.has_parent_path())
            fs::create_directories(p.parent_path());
    }
    catch (const std::exception& e)
    {
        err = e.what();
        return false;
    }

    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f)
    {
        err = "Failed to open settings file for writing: " + path;
        return false;
    }

    try
    {
        f << ToJson(st).dump(2) << "\n";
    }
    catch (const std::exception& e)
    {
        err = e.what();
        return false;
    }
    return true;
}

bool LoadSettings(Settings& out, std::string& err)
{
    err.clear();
    const std::string path = GetSettingsPath();

    std::error_code ec;
    const bool exists = fs::exists(path, ec);
    if (ec)
    {
        err = "Failed to stat " + path + ": " + ec.message();
        return false;
    }
    if (!exists)
        return true; // first run; use hardcoded defaults

    return LoadSettingsFromFile(path, out, err);
}

void ApplySettings(const Settings& st, DrawEngine& engine)
{
    engine.SetTool(st.default_tool);
    engine.SetBoxGlyphs(glyph::GlyphsForStyle(st.box_style));
    // Validated on load; a hand-built Settings with a bad glyph keeps the current brush.
    if (engine.SetBrushGlyph(st.brush_glyph) != DrawResult::Ok)
        std::fprintf(stderr, "[settings] ignoring invalid brush glyph U+%04X\n", (unsigned)st.brush_glyph);
}
} // namespace tomo
