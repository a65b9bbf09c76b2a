// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <filesystem>
#include <fstream>
#include <map>

#include <gtest/gtest.h>

#include <npbind/asset.hpp>
#include <npbind/exception.hpp>

namespace fs = std::filesystem;

namespace npbindtest {

class AssetTest : public ::testing::Test
{
protected:
    fs::path root_;

    void SetUp() override
    {
        root_ = fs::temp_directory_path() /
                ("npbind_assets_" +
                 std::string(::testing::UnitTest::GetInstance()
                                 ->current_test_info()
                                 ->name()));
        fs::remove_all(root_);
        fs::create_directories(root_);
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    void put(const fs::path& rel, const std::string& content)
    {
        auto path = root_ / rel;
        fs::create_directories(path.parent_path());
        std::ofstream(path, std::ios_base::binary) << content;
    }

    static std::string str(const npbind::Bytes& b)
    {
        return std::string(b.begin(), b.end());
    }
};

// In-memory source, records what was asked for
class MapAssetSource : public npbind::AssetSource
{
public:
    std::map<std::string, std::string> files;
    std::vector<std::string> requested;

    npbind::Bytes open(std::string_view name) override
    {
        requested.emplace_back(name);
        auto it = files.find(std::string(name));
        if (it == files.end())
            throw npbind::ExceptionAssetNotFound(std::string(name));
        return npbind::Bytes(it->second.begin(), it->second.end());
    }
};

TEST_F(AssetTest, ReadsFiles)
{
    put("hello.txt", "Hello, Assets.\n");
    put("sub/dir/data.bin", std::string("\x00\x01\x02", 3));

    npbind::FileAssetSource assets(root_);
    EXPECT_EQ(str(assets.open("hello.txt")), "Hello, Assets.\n");

    auto data = assets.open("sub/dir/data.bin");
    EXPECT_EQ(data, (npbind::Bytes{0, 1, 2}));
}

TEST_F(AssetTest, EmptyFile)
{
    put("empty", "");
    npbind::FileAssetSource assets(root_);
    EXPECT_TRUE(assets.open("empty").empty());
}

TEST_F(AssetTest, Missing)
{
    npbind::FileAssetSource assets(root_);
    EXPECT_THROW(assets.open("nope.txt"), npbind::ExceptionAssetNotFound);

    // directories are not assets
    fs::create_directories(root_ / "dir");
    EXPECT_THROW(assets.open("dir"), npbind::ExceptionAssetNotFound);
}

TEST_F(AssetTest, StaysInsideRoot)
{
    put("inner/secret.txt", "x");
    auto outside = root_.parent_path() / "npbind_outside.txt";
    std::ofstream(outside) << "outside";

    npbind::FileAssetSource assets(root_ / "inner");
    EXPECT_THROW(assets.open(""), npbind::ExceptionAssetNotFound);
    EXPECT_THROW(assets.open("../../npbind_outside.txt"),
                 npbind::ExceptionAssetNotFound);
    EXPECT_THROW(assets.open("a/../../secret.txt"),
                 npbind::ExceptionAssetNotFound);
    EXPECT_THROW(assets.open(outside.string()), npbind::ExceptionAssetNotFound);
    EXPECT_EQ(str(assets.open("secret.txt")), "x");

    fs::remove(outside);
}

TEST_F(AssetTest, DefaultFontPrefersNoto)
{
    MapAssetSource fonts;
    fonts.files["noto/NotoSans-Regular.ttf"] = "noto";
    fonts.files["droid/DroidSans.ttf"] = "droid";

    EXPECT_EQ(str(npbind::font::default_font(fonts)), "noto");
    EXPECT_EQ(fonts.requested.size(), 1u);
}

TEST_F(AssetTest, DefaultFontFallsBackToDroid)
{
    put("droid/DroidSans.ttf", "droid sans");
    put("droid/DroidSansMono.ttf", "droid mono");

    npbind::FileAssetSource fonts(root_);
    EXPECT_EQ(str(npbind::font::default_font(fonts)), "droid sans");
    EXPECT_EQ(str(npbind::font::monospace_font(fonts)), "droid mono");
}

TEST_F(AssetTest, MonospaceFontPrefersNoto)
{
    put("noto/NotoMono-Regular.ttf", "noto mono");
    put("droid/DroidSansMono.ttf", "droid mono");

    npbind::FileAssetSource fonts(root_);
    EXPECT_EQ(str(npbind::font::monospace_font(fonts)), "noto mono");
}

TEST_F(AssetTest, NoFontReportsPreferred)
{
    MapAssetSource fonts;
    try {
        npbind::font::default_font(fonts);
        FAIL() << "expected ExceptionAssetNotFound";
    } catch (npbind::ExceptionAssetNotFound& ex) {
        EXPECT_NE(std::string(ex.what()).find("NotoSans-Regular.ttf"),
                  std::string::npos);
    }
    EXPECT_EQ(fonts.requested,
              (std::vector<std::string>{"noto/NotoSans-Regular.ttf",
                                        "droid/DroidSans.ttf"}));
}

TEST_F(AssetTest, SystemFonts)
{
    // depends on the fonts installed on the machine
    try {
        auto font = npbind::font::default_font();
        EXPECT_FALSE(font.empty());
    } catch (npbind::ExceptionAssetNotFound& ex) {
        GTEST_SKIP() << "no system font: " << ex.what();
    }
}

} // namespace npbindtest

int main(int argc, char** argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
