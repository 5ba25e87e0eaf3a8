#include <gtest/gtest.h>
#include "core/draw_engine.h"
#include "core/grid_model.h"
#include "core/paths.h"
#include "io/settings.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

using namespace tomo;
namespace fs = std::filesystem;

namespace {
class SettingsTest : public ::testing::Test {
protected:
    fs::path dir;

    void SetUp() override {
        dir = fs::temp_directory_path() / "tomodraw_settings_test";
        fs::remove_all(dir);
        fs::create_directories(dir);
    }

    void TearDown() override { fs::remove_all(dir); }

    std::string write(const char* name, const std::string& text) {
        const fs::path p = dir / name;
        std::ofstream f(p, std::ios::binary | std::ios::trunc);
        f << text;
        return p.string();
    }
};
} // namespace

TEST_F(SettingsTest, DefaultsMatchEngineDefaults) {
    const Settings st;
    EXPECT_EQ(st.brush_glyph, U'x');
    EXPECT_EQ(st.default_tool, ToolKind::Pencil);
    EXPECT_EQ(st.box_style, glyph::BoxStyle::Light);
}

TEST_F(SettingsTest, LoadsAllKeys) {
    const std::string path = write("settings.json",
        R"({"schema_version": 1, "brush_glyph": "#", "default_tool": "line", "box_style": "double"})");
    Settings st;
    std::string err;
    ASSERT_TRUE(LoadSettingsFromFile(path, st, err)) << err;
    EXPECT_EQ(st.brush_glyph, U'#');
    EXPECT_EQ(st.default_tool, ToolKind::Line);
    EXPECT_EQ(st.box_style, glyph::BoxStyle::Double);
}

TEST_F(SettingsTest, MissingKeysKeepCurrentValues) {
    const std::string path = write("partial.json", R"({"box_style": "rounded"})");
    Settings st;
    st.brush_glyph = U'*';
    std::string err;
    ASSERT_TRUE(LoadSettingsFromFile(path, st, err)) << err;
    EXPECT_EQ(st.brush_glyph, U'*');
    EXPECT_EQ(st.box_style, glyph::BoxStyle::Rounded);
}

TEST_F(SettingsTest, InvalidValuesLeaveSettingsUntouched) {
    Settings st;
    std::string err;

    const char* bad[] = {
        R"({"schema_version": 2})",
        R"({"brush_glyph": "ab"})",
        R"({"brush_glyph": "\t"})",
        R"({"default_tool": "spray"})",
        R"({"box_style": 3})",
        R"([1, 2])",
        R"({"brush_glyph": "#", "default_tool": "nope"})",
    };
    for (const char* text : bad) {
        const std::string path = write("bad.json", text);
        EXPECT_FALSE(LoadSettingsFromFile(path, st, err)) << text;
        EXPECT_NE(err.find(path), std::string::npos) << err;
    }
    EXPECT_EQ(st.brush_glyph, U'x');
    EXPECT_EQ(st.default_tool, ToolKind::Pencil);
}

TEST_F(SettingsTest, ShippedDefaultsMatchBuiltIn) {
    Settings st;
    st.brush_glyph = U'@';
    std::string err;
    ASSERT_TRUE(LoadSettingsFromFile(std::string(TOMODRAW_ASSETS_DIR) + "/settings.json", st, err)) << err;

    const Settings builtin;
    EXPECT_EQ(st.brush_glyph, builtin.brush_glyph);
    EXPECT_EQ(st.default_tool, builtin.default_tool);
    EXPECT_EQ(st.box_style, builtin.box_style);
}

TEST_F(SettingsTest, SaveCreatesDirectoryAndLoadsBack) {
    const std::string path = (dir / "nested" / "settings.json").string();
    Settings st;
    st.brush_glyph = U'▲';
    st.default_tool = ToolKind::Rectangle;
    st.box_style = glyph::BoxStyle::Heavy;

    std::string err;
    ASSERT_TRUE(SaveSettingsToFile(path, st, err)) << err;

    Settings loaded;
    ASSERT_TRUE(LoadSettingsFromFile(path, loaded, err)) << err;
    EXPECT_EQ(loaded.brush_glyph, U'▲');
    EXPECT_EQ(loaded.default_tool, ToolKind::Rectangle);
    EXPECT_EQ(loaded.box_style, glyph::BoxStyle::Heavy);
}

TEST_F(SettingsTest, ConfigDirFollowsXdgConfigHome) {
    ::setenv("XDG_CONFIG_HOME", dir.string().c_str(), 1);
    EXPECT_EQ(GetTomodrawConfigDir(), (dir / "tomodraw").string());
    EXPECT_EQ(GetSettingsPath(), (dir / "tomodraw" / "settings.json").string());

    // First run: no file yet, defaults stay.
    Settings st;
    std::string err;
    EXPECT_TRUE(LoadSettings(st, err)) << err;
    EXPECT_EQ(st.brush_glyph, U'x');

    Settings saved;
    saved.default_tool = ToolKind::Eraser;
    ASSERT_TRUE(SaveSettingsToFile(GetSettingsPath(), saved, err)) << err;
    ASSERT_TRUE(LoadSettings(st, err)) << err;
    EXPECT_EQ(st.default_tool, ToolKind::Eraser);

    ::unsetenv("XDG_CONFIG_HOME");
}

TEST_F(SettingsTest, ApplyInstallsIntoEngine) {
    GridModel grid;
    DrawEngine engine(grid);
    Settings st;
    st.brush_glyph = U'@';
    st.default_tool = ToolKind::Rectangle;
    st.box_style = glyph::BoxStyle::Ascii;
    ApplySettings(st, engine);

    EXPECT_EQ(engine.GetBrushGlyph(), U'@');
    EXPECT_EQ(engine.GetTool(), ToolKind::Rectangle);
    ASSERT_EQ(engine.Press(0, 0), DrawResult::Ok);
    ASSERT_EQ(engine.Move(2, 1), DrawResult::Ok);
    ASSERT_EQ(engine.Release(), DrawResult::Ok);
    char32_t cp = 0;
    ASSERT_TRUE(grid.GetCell(1, 0, cp));
    EXPECT_EQ(cp, U'-');
}
