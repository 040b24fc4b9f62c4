#include <fstream>

#include <gtest/gtest.h>

#include "zFile.h"
#include "zSplitArtifacts.h"
#include "zSplitMerge.h"
#include "zTestSupport.h"

namespace apkc {
namespace {

class SplitMergeTest : public test::PipelineTest {
protected:
    void SetUp() override {
        PipelineTest::SetUp();
        // 包装脚本模式：merge -i <dir> -o <out>，把输入文件名写进输出。
        toolchain_.apkeditorWrapper =
            tool("APKEditor",
                 "echo \"$@\" >> '" + callLog("APKEditor") + "'\n"
                 "[ \"$1\" = merge ] || exit 2\n"
                 "ls \"$3\" > \"$5\"\n");
        splitDir_ = tmp_.makeDir("splits");
    }

    void addApk(const std::string& name) {
        std::ofstream(splitDir_ + "/" + name) << name;
    }

    std::string splitDir_;
};

TEST_F(SplitMergeTest, MergesIntoDefaultOutput) {
    addApk("base.apk");
    addApk("split_config.arm64_v8a.apk");
    addApk("split_config.en.apk");
    MergeResult result;
    PipelineError error;
    test::ScopedEnv env(toolchain_.apkeditorEnvVar, std::nullopt);
    ASSERT_TRUE(runSplitMerge(splitDir_, "", toolchain_, &result, &error)) << error.describe();
    EXPECT_EQ(result.outputPath, tmp_.file("splits.merged.apk"));
    EXPECT_TRUE(base::file::fileExists(result.outputPath));
    EXPECT_EQ(result.artifacts.base, splitDir_ + "/base.apk");
    EXPECT_EQ(result.artifacts.splits.size(), 2u);
    EXPECT_EQ(result.toolCommand, (std::vector<std::string>{toolchain_.apkeditorWrapper}));
    EXPECT_FALSE(result.replacedExisting);
}

TEST_F(SplitMergeTest, EmptyDirectoryFailsBeforeAnyTool) {
    std::ofstream(splitDir_ + "/readme.txt") << "no apks here";
    PipelineError error;
    EXPECT_FALSE(runSplitMerge(splitDir_, "", toolchain_, nullptr, &error));
    EXPECT_EQ(error.kind, ErrorKind::kMerge);
    EXPECT_EQ(error.reason, ErrorReason::kPrecondition);
    EXPECT_FALSE(base::file::pathExists(callLog("APKEditor")));
}

TEST_F(SplitMergeTest, MissingDirectoryIsMergeErrorEvenWithoutTool) {
    toolchain_.apkeditorWrapper = tmp_.file("tools/none");
    PipelineError error;
    EXPECT_FALSE(runSplitMerge(tmp_.file("nope"), "", toolchain_, nullptr, &error));
    EXPECT_EQ(error.kind, ErrorKind::kMerge);
}

TEST_F(SplitMergeTest, ExistingOutputIsReplaced) {
    addApk("base.apk");
    addApk("split_config.xxhdpi.apk");
    const std::string output = tmp_.file("out/merged.apk");
    ASSERT_TRUE(base::file::ensureParentDirectory(output));
    std::ofstream(output) << "STALE CONTENT\n";

    MergeResult result;
    PipelineError error;
    ASSERT_TRUE(runSplitMerge(splitDir_, output, toolchain_, &result, &error)) << error.describe();
    EXPECT_TRUE(result.replacedExisting);
    const std::string merged = test::readText(output);
    EXPECT_EQ(merged.find("STALE"), std::string::npos);
    EXPECT_NE(merged.find("base.apk"), std::string::npos);
    EXPECT_EQ(test::countEntries(tmp_.file("out")), 1u);
}

TEST_F(SplitMergeTest, UnresolvableToolIsConfigError) {
    addApk("base.apk");
    toolchain_.apkeditorWrapper = tmp_.file("tools/none");
    test::ScopedEnv env(toolchain_.apkeditorEnvVar, std::nullopt);
    PipelineError error;
    EXPECT_FALSE(runSplitMerge(splitDir_, "", toolchain_, nullptr, &error));
    EXPECT_EQ(error.kind, ErrorKind::kConfig);
}

TEST_F(SplitMergeTest, JarModeUsesJava) {
    addApk("base.apk");
    const std::string jarDir = tmp_.makeDir("apkeditor");
    std::ofstream(jarDir + "/APKEditor.jar") << "jar";
    // 假 java：-jar <jar> merge -i <dir> -o <out>
    toolchain_.java = tool("java", "echo \"$@\" >> '" + callLog("java") + "'\nprintf merged > \"$7\"\n");
    test::ScopedEnv env(toolchain_.apkeditorEnvVar, jarDir);
    MergeResult result;
    PipelineError error;
    ASSERT_TRUE(runSplitMerge(splitDir_, "", toolchain_, &result, &error)) << error.describe();
    EXPECT_EQ(result.toolCommand,
              (std::vector<std::string>{toolchain_.java, "-jar", jarDir + "/APKEditor.jar"}));
    EXPECT_EQ(test::readText(result.outputPath), "merged");
}

TEST_F(SplitMergeTest, ToolFailureIsMergeError) {
    addApk("base.apk");
    toolchain_.apkeditorWrapper = tool("APKEditor", "echo 'merge failed' 1>&2\nexit 1\n");
    PipelineError error;
    EXPECT_FALSE(runSplitMerge(splitDir_, "", toolchain_, nullptr, &error));
    EXPECT_EQ(error.kind, ErrorKind::kMerge);
    EXPECT_EQ(error.reason, ErrorReason::kNonZeroExit);
    EXPECT_NE(error.message.find("merge failed"), std::string::npos);
}

TEST(SplitArtifactsTest, ClassifiesBaseAndSplits) {
    const SplitArtifactSet set = classifySplitArtifacts(
        {"/d/base.apk", "/d/split_config.en.apk", "/d/extra.apk", "/d/split_feature.apk"});
    EXPECT_EQ(set.base, "/d/base.apk");
    EXPECT_EQ(set.splits,
              (std::vector<std::string>{"/d/split_config.en.apk", "/d/split_feature.apk", "/d/extra.apk"}));
    EXPECT_TRUE(set.isSplit());
    EXPECT_EQ(set.all().front(), "/d/base.apk");
}

TEST(SplitArtifactsTest, MarkerOnlyCountsInFileName) {
    EXPECT_TRUE(isSplitArtifactName("/x/split_config.en.apk"));
    EXPECT_FALSE(isSplitArtifactName("/split_dir/base.apk"));
    const SplitArtifactSet single = classifySplitArtifacts({"/d/app.apk"});
    EXPECT_EQ(single.base, "/d/app.apk");
    EXPECT_FALSE(single.isSplit());
    EXPECT_TRUE(classifySplitArtifacts({}).empty());
}

}  // namespace
}  // namespace apkc
