#include <gtest/gtest.h>
#include "core/brush_palette.h"

#include <filesystem>
#include <fstream>
#include <string>

using namespace tomo;

namespace {
std::string tempPath(const char* name) {
    return (std::filesystem::temp_directory_path() / name).string();
}

void writeFile(const std::string& path, const std::string& text) {
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    f << text;
}
} // namespace

TEST(BrushPaletteTest, DefaultIsElevenRowsOfTen) {
    const BrushPalette p = BrushPalette::Default();
    EXPECT_EQ(p.Columns(), 10);
    EXPECT_EQ(p.Rows(), 11);
    EXPECT_EQ(p.Size(), 110);

    char32_t cp = 0;
    ASSERT_TRUE(p.GlyphAt(0, 0, cp));
    EXPECT_EQ(cp, U'┌');
    ASSERT_TRUE(p.GlyphAt(1, 4, cp));
    EXPECT_EQ(cp, U'┼');
    ASSERT_TRUE(p.GlyphAt(10, 9, cp));
    EXPECT_EQ(cp, U'9');
    EXPECT_FALSE(p.GlyphAt(11, 0, cp));
    EXPECT_FALSE(p.GlyphAt(0, 10, cp));
}

TEST(BrushPaletteTest, FindLocatesGlyph) {
    const BrushPalette p = BrushPalette::Default();
    int row = -1;
    int col = -1;
    ASSERT_TRUE(p.Find(U'x', row, col));
    EXPECT_EQ(row, 7);
    EXPECT_EQ(col, 1);
    EXPECT_TRUE(p.Contains(U'─'));
    EXPECT_FALSE(p.Contains(U'é'));
}

TEST(BrushPaletteTest, SaveThenLoadKeepsLayout) {
    const std::string path = tempPath("tomodraw_brush_palette_test.json");
    const BrushPalette p = BrushPalette::Default();
    std::string err;
    ASSERT_TRUE(p.SaveToFile(path.c_str(), err)) << err;

    BrushPalette loaded;
    ASSERT_TRUE(loaded.LoadFromFile(path.c_str(), err)) << err;
    EXPECT_EQ(loaded.GetTitle(), "Default");
    EXPECT_EQ(loaded.Rows(), 11);
    char32_t cp = 0;
    ASSERT_TRUE(loaded.GlyphAt(2, 6, cp));
    EXPECT_EQ(cp, U'"');
    std::filesystem::remove(path);
}

TEST(BrushPaletteTest, PartialLastRow) {
    const std::string path = tempPath("tomodraw_brush_partial.json");
    writeFile(path, R"({"title": "Boxes", "columns": 4, "chars": ["┌", "┐", "└", "┘", "─", "│"]})");

    BrushPalette p;
    std::string err;
    ASSERT_TRUE(p.LoadFromFile(path.c_str(), err)) << err;
    EXPECT_EQ(p.GetTitle(), "Boxes");
    EXPECT_EQ(p.Rows(), 2);
    char32_t cp = 0;
    EXPECT_TRUE(p.GlyphAt(1, 1, cp));
    EXPECT_EQ(cp, U'│');
    EXPECT_FALSE(p.GlyphAt(1, 2, cp));
    std::filesystem::remove(path);
}

TEST(BrushPaletteTest, RejectsEntriesThatAreNotOneCell) {
    const std::string path = tempPath("tomodraw_brush_bad.json");
    BrushPalette p = BrushPalette::Default();
    std::string err;

    writeFile(path, R"({"chars": ["a", "bc"]})");
    EXPECT_FALSE(p.LoadFromFile(path.c_str(), err));
    EXPECT_NE(err.find("Invalid brush glyph"), std::string::npos);

    writeFile(path, R"({"chars": ["漢"]})");
    EXPECT_FALSE(p.LoadFromFile(path.c_str(), err));

    writeFile(path, R"({"columns": 0, "chars": ["a"]})");
    EXPECT_FALSE(p.LoadFromFile(path.c_str(), err));

    writeFile(path, R"({"chars": []})");
    EXPECT_FALSE(p.LoadFromFile(path.c_str(), err));

    writeFile(path, "not json");
    EXPECT_FALSE(p.LoadFromFile(path.c_str(), err));
    EXPECT_FALSE(err.empty());

    // Failed loads leave the palette as it was.
    EXPECT_EQ(p.Size(), 110);
    std::filesystem::remove(path);
}

TEST(BrushPaletteTest, ShippedAssetMatchesDefault) {
    const std::string path = std::string(TOMODRAW_ASSETS_DIR) + "/brush-palette.json";
    BrushPalette shipped;
    std::string err;
    ASSERT_TRUE(shipped.LoadFromFile(path.c_str(), err)) << err;

    const BrushPalette builtin = BrushPalette::Default();
    EXPECT_EQ(shipped.GetTitle(), builtin.GetTitle());
    ASSERT_EQ(shipped.Columns(), builtin.Columns());
    ASSERT_EQ(shipped.Size(), builtin.Size());
    for (int row = 0; row < builtin.Rows(); ++row) {
        for (int col = 0; col < builtin.Columns(); ++col) {
            char32_t a = 0;
            char32_t b = 0;
            ASSERT_TRUE(builtin.GlyphAt(row, col, a));
            ASSERT_TRUE(shipped.GlyphAt(row, col, b));
            EXPECT_EQ(a, b) << "row " << row << " col " << col;
        }
    }
}

TEST(BrushPaletteTest, MissingFileIsAnError) {
    BrushPalette p;
    std::string err;
    EXPECT_FALSE(p.LoadFromFile("/nonexistent/tomodraw/palette.json", err));
    EXPECT_NE(err.find("Failed to open"), std::string::npos);
}
