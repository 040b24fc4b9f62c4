#include <fstream>

#include <gtest/gtest.h>

#include "zTestSupport.h"
#include "zUserConfig.h"

namespace apkc {
namespace {

TEST(UserConfigTest, ParsesStringKeys) {
    const config::UserConfig cfg = config::UserConfig::parse(
        "{\"apkeditor_path\": \"/opt/APKEditor.jar\", \"keystore_dir\": \"/keys\"}");
    EXPECT_FALSE(cfg.empty());
    EXPECT_EQ(cfg.getString("apkeditor_path").value_or(""), "/opt/APKEditor.jar");
    EXPECT_EQ(cfg.getString("keystore_dir").value_or(""), "/keys");
    EXPECT_FALSE(cfg.getString("android_home").has_value());
}

TEST(UserConfigTest, NonStringValueIsAbsent) {
    const config::UserConfig cfg =
        config::UserConfig::parse("{\"apkeditor_path\": 42, \"android_home\": null}");
    EXPECT_FALSE(cfg.getString("apkeditor_path").has_value());
    EXPECT_FALSE(cfg.getString("android_home").has_value());
}

TEST(UserConfigTest, InvalidDocumentsAreEmpty) {
    EXPECT_TRUE(config::UserConfig::parse("").empty());
    EXPECT_TRUE(config::UserConfig::parse("{not json").empty());
    EXPECT_TRUE(config::UserConfig::parse("[\"a\", \"b\"]").empty());
    EXPECT_TRUE(config::UserConfig::parse("\"text\"").empty());
    // 严格模式：注释不被接受。
    EXPECT_TRUE(config::UserConfig::parse("// c\n{\"keystore_dir\": \"/k\"}").empty());
}

TEST(UserConfigTest, LoadMissingFileIsEmpty) {
    test::TempDir dir;
    EXPECT_TRUE(config::UserConfig::load(dir.file("absent.json")).empty());
}

TEST(UserConfigTest, LoadReadsFile) {
    test::TempDir dir;
    const std::string path = dir.file("config.json");
    std::ofstream(path) << "{\"android_home\": \"/sdk\"}\n";
    EXPECT_EQ(config::UserConfig::load(path).getString("android_home").value_or(""), "/sdk");
}

TEST(UserConfigTest, ApplyFillsOnlyEmptyFields) {
    const config::UserConfig cfg = config::UserConfig::parse(
        "{\"keystore_dir\": \"/cfg/keys\", \"android_home\": \"/cfg/sdk\"}");

    ToolchainConfig toolchain;
    toolchain.keystoreDir = "/cli/keys";
    config::applyUserConfig(cfg, toolchain);
    EXPECT_EQ(toolchain.keystoreDir, "/cli/keys");
    EXPECT_EQ(toolchain.androidHome, "/cfg/sdk");
    // apkeditor_path 只在工具解析链中使用。
    EXPECT_TRUE(toolchain.apkeditorJar.empty());
}

}  // namespace
}  // namespace apkc
