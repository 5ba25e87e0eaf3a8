#pragma once

#include "core/draw_types.h"
#include "core/glyph_rules.h"

#include <string>

namespace tomo
{
class DrawEngine;

// User preferences (settings.json, schema_version=1):
// {
//   "schema_version": 1,
//   "brush_glyph": "x",
//   "default_tool": "pencil",
//   "box_style": "light"
// }
struct Settings
{
    char32_t        brush_glyph = U'x';
    ToolKind        default_tool = ToolKind::Pencil;
    glyph::BoxStyle box_style = glyph::BoxStyle::Light;
};

// "<config_dir>/settings.json"
std::string GetSettingsPath();

// Missing keys keep the values already in `out`. Unknown tool/style names, an
// invalid brush glyph or an unsupported schema_version fail with `err` set
// (`out` untouched).
bool LoadSettingsFromFile(const std::string& path, Settings& out, std::string& err);
bool SaveSettingsToFile(const std::string& path, const Settings& st, std::string& err);

// Loads the user settings file. A missing file is not an error (defaults are kept).
bool LoadSettings(Settings& out, std::string& err);

// Installs brush glyph, tool and box glyphs into `engine`.
void ApplySettings(const Settings& st, DrawEngine& engine);
} // namespace tomo
