#include <fstream>

#include <gtest/gtest.h>

#include "zBuildAlignSign.h"
#include "zFile.h"
#include "zTestSupport.h"

namespace apkc {
namespace {

class BuildAlignSignTest : public test::PipelineTest {
protected:
    void SetUp() override {
        PipelineTest::SetUp();
        installFakeApktool();
        installFakeZipalign();
        installFakeApksigner();
        installFakeKeytool();
        project_ = makeProject("project");
    }

    std::string project_;
};

TEST_F(BuildAlignSignTest, DefaultOptionsProduceSignedOutput) {
    const std::string output = defaultPatchedOutputPath(project_);
    EXPECT_EQ(output, tmp_.file("project-patched.apk"));
    ASSERT_FALSE(base::file::pathExists(output));

    BuildResult result;
    PipelineError error;
    ASSERT_TRUE(runBuildAlignSign(project_, "", BuildOptions{}, toolchain_, &result, &error))
        << error.describe();

    EXPECT_EQ(result.outputPath, output);
    EXPECT_EQ(test::readText(output), "BUILT:" + project_ + "\nALIGNED\nSIGNED\n");
    EXPECT_TRUE(result.alignRan);
    EXPECT_TRUE(result.signRan);
    EXPECT_TRUE(result.keystoreGenerated);
    EXPECT_EQ(result.keystorePath, toolchain_.keystoreDir + "/debug.keystore");
    EXPECT_EQ(result.verification, Verification::kNotAttempted);
    ASSERT_EQ(result.stages.size(), 3u);
    EXPECT_EQ(result.stages[0].name, "build");
    EXPECT_EQ(result.stages[1].name, "align");
    EXPECT_EQ(result.stages[2].name, "sign");
    // 中间产物都在 staging 区内，且已随 staging 区删除。
    EXPECT_NE(result.stages[0].artifact, output);
    EXPECT_NE(result.stages[1].artifact, output);
    EXPECT_FALSE(base::file::pathExists(result.stages[0].artifact));
    EXPECT_FALSE(base::file::pathExists(result.stages[1].artifact));
    EXPECT_EQ(test::countEntries(toolchain_.stagingRoot), 0u);

    const std::string signerCalls = test::readText(callLog("apksigner"));
    EXPECT_NE(signerCalls.find("--ks-key-alias androiddebugkey"), std::string::npos);
    EXPECT_NE(signerCalls.find("--ks-pass pass:android"), std::string::npos);
    EXPECT_NE(test::readText(callLog("zipalign")).find("-P 16 4 "), std::string::npos);
}

TEST_F(BuildAlignSignTest, MissingMarkerFailsWithoutOutput) {
    const std::string plain = tmp_.makeDir("plain");
    const std::string output = defaultPatchedOutputPath(plain);
    BuildResult result;
    PipelineError error;
    EXPECT_FALSE(runBuildAlignSign(plain, "", BuildOptions{}, toolchain_, &result, &error));
    EXPECT_EQ(error.kind, ErrorKind::kBuild);
    EXPECT_EQ(error.reason, ErrorReason::kPrecondition);
    EXPECT_NE(error.message.find("apktool.yml"), std::string::npos);
    EXPECT_FALSE(base::file::pathExists(output));
    EXPECT_FALSE(base::file::pathExists(callLog("apktool")));
    EXPECT_EQ(test::countEntries(toolchain_.stagingRoot), 0u);
}

TEST_F(BuildAlignSignTest, NonDirectorySourceIsBuildError) {
    const std::string file = tmp_.file("file.txt");
    std::ofstream(file) << "x";
    PipelineError error;
    EXPECT_FALSE(runBuildAlignSign(file, "", BuildOptions{}, toolchain_, nullptr, &error));
    EXPECT_EQ(error.kind, ErrorKind::kBuild);
}

TEST_F(BuildAlignSignTest, SkippingAlignAndSignCopiesRawBuild) {
    BuildOptions options;
    options.align = false;
    options.sign = false;
    const std::string output = tmp_.file("out/unsigned.apk");
    BuildResult result;
    PipelineError error;
    ASSERT_TRUE(runBuildAlignSign(project_, output, options, toolchain_, &result, &error))
        << error.describe();
    EXPECT_EQ(test::readText(output), "BUILT:" + project_ + "\n");
    EXPECT_FALSE(result.alignRan);
    EXPECT_FALSE(result.signRan);
    EXPECT_TRUE(result.keystorePath.empty());
    EXPECT_FALSE(base::file::pathExists(callLog("zipalign")));
    EXPECT_FALSE(base::file::pathExists(callLog("apksigner")));
    EXPECT_FALSE(base::file::pathExists(callLog("keytool")));
}

TEST_F(BuildAlignSignTest, VerifyOutcomeIsRecorded) {
    BuildOptions options;
    options.verify = true;
    BuildResult result;
    PipelineError error;
    ASSERT_TRUE(runBuildAlignSign(project_, "", options, toolchain_, &result, &error));
    EXPECT_EQ(result.verification, Verification::kPassed);

    installFakeApksigner(1);
    ASSERT_TRUE(runBuildAlignSign(project_, "", options, toolchain_, &result, &error));
    EXPECT_EQ(result.verification, Verification::kFailed);
    EXPECT_EQ(result.stages.back().name, "verify");
}

TEST_F(BuildAlignSignTest, VerifyIsSkippedWithoutSigning) {
    BuildOptions options;
    options.sign = false;
    options.verify = true;
    BuildResult result;
    ASSERT_TRUE(runBuildAlignSign(project_, "", options, toolchain_, &result, nullptr));
    EXPECT_EQ(result.verification, Verification::kNotAttempted);
}

TEST_F(BuildAlignSignTest, AlignFailureIsAlignError) {
    toolchain_.zipalign = tool("zipalign", "echo 'zip error' 1>&2\nexit 1\n");
    const std::string output = defaultPatchedOutputPath(project_);
    BuildResult result;
    PipelineError error;
    EXPECT_FALSE(runBuildAlignSign(project_, "", BuildOptions{}, toolchain_, &result, &error));
    EXPECT_EQ(error.kind, ErrorKind::kAlign);
    EXPECT_EQ(error.reason, ErrorReason::kNonZeroExit);
    EXPECT_FALSE(base::file::pathExists(output));
    EXPECT_EQ(test::countEntries(toolchain_.stagingRoot), 0u);
    ASSERT_EQ(result.stages.size(), 2u);
    EXPECT_FALSE(result.stages[1].succeeded);
}

TEST_F(BuildAlignSignTest, BuildWithoutArtifactKeepsReason) {
    toolchain_.apktool = tool("apktool", "exit 0\n");
    PipelineError error;
    EXPECT_FALSE(runBuildAlignSign(project_, "", BuildOptions{}, toolchain_, nullptr, &error));
    EXPECT_EQ(error.kind, ErrorKind::kBuild);
    EXPECT_EQ(error.reason, ErrorReason::kArtifactMissing);
}

TEST_F(BuildAlignSignTest, SignFailureIsSignError) {
    toolchain_.apksigner = tool("apksigner", "exit 2\n");
    PipelineError error;
    EXPECT_FALSE(runBuildAlignSign(project_, "", BuildOptions{}, toolchain_, nullptr, &error));
    EXPECT_EQ(error.kind, ErrorKind::kSign);
    EXPECT_FALSE(base::file::pathExists(defaultPatchedOutputPath(project_)));
}

TEST_F(BuildAlignSignTest, StaleOutputIsNotTakenAsSigned) {
    const std::string output = defaultPatchedOutputPath(project_);
    std::ofstream(output) << "STALE";
    // 退出码 0 但不写 --out。
    toolchain_.apksigner = tool("apksigner", "exit 0\n");
    BuildResult result;
    PipelineError error;
    EXPECT_FALSE(runBuildAlignSign(project_, "", BuildOptions{}, toolchain_, &result, &error));
    EXPECT_EQ(error.kind, ErrorKind::kSign);
    EXPECT_EQ(error.reason, ErrorReason::kArtifactMissing);
    EXPECT_EQ(error.artifact, output);
    EXPECT_FALSE(base::file::pathExists(output));
    EXPECT_FALSE(result.signRan);
}

TEST_F(BuildAlignSignTest, UnsignedCopyReplacesStaleOutput) {
    BuildOptions options;
    options.sign = false;
    const std::string output = tmp_.file("unsigned.apk");
    std::ofstream(output) << "STALE";
    PipelineError error;
    ASSERT_TRUE(runBuildAlignSign(project_, output, options, toolchain_, nullptr, &error))
        << error.describe();
    EXPECT_EQ(test::readText(output), "BUILT:" + project_ + "\nALIGNED\n");
}

TEST_F(BuildAlignSignTest, OutputThatCannotBeRemovedIsBuildIoError) {
    // 输出路径是目录：removeFile 拒绝删除。
    const std::string output = tmp_.makeDir("occupied.apk");
    PipelineError error;
    EXPECT_FALSE(runBuildAlignSign(project_, output, BuildOptions{}, toolchain_, nullptr, &error));
    EXPECT_EQ(error.kind, ErrorKind::kBuild);
    EXPECT_EQ(error.reason, ErrorReason::kIo);
    EXPECT_EQ(error.artifact, output);
    EXPECT_TRUE(base::file::directoryExists(output));
    EXPECT_FALSE(base::file::pathExists(callLog("apksigner")));
    EXPECT_EQ(test::countEntries(toolchain_.stagingRoot), 0u);
}

TEST_F(BuildAlignSignTest, UnresolvableToolFailsBeforeBuild) {
    toolchain_.zipalign.clear();
    test::ScopedEnv path("PATH", tmp_.makeDir("empty-bin"));
    PipelineError error;
    EXPECT_FALSE(runBuildAlignSign(project_, "", BuildOptions{}, toolchain_, nullptr, &error));
    EXPECT_EQ(error.kind, ErrorKind::kConfig);
    EXPECT_EQ(error.tool, "zipalign");
    EXPECT_FALSE(base::file::pathExists(callLog("apktool")));
}

TEST_F(BuildAlignSignTest, CallerIdentityIsUsed) {
    SigningIdentity identity;
    identity.keystorePath = tmp_.file("release.jks");
    identity.alias = "release";
    identity.storePass = "secret";
    identity.keyPass = "secret";
    std::ofstream(identity.keystorePath) << "ks";

    BuildOptions options;
    options.identity = identity;
    BuildResult result;
    PipelineError error;
    ASSERT_TRUE(runBuildAlignSign(project_, "", options, toolchain_, &result, &error))
        << error.describe();
    EXPECT_FALSE(result.keystoreGenerated);
    EXPECT_EQ(result.keystorePath, identity.keystorePath);
    EXPECT_NE(test::readText(callLog("apksigner")).find("--ks-key-alias release"), std::string::npos);
    EXPECT_FALSE(base::file::pathExists(callLog("keytool")));
}

TEST_F(BuildAlignSignTest, MissingCallerKeystoreIsSignError) {
    SigningIdentity identity;
    identity.keystorePath = tmp_.file("missing.jks");
    identity.alias = "release";
    BuildOptions options;
    options.identity = identity;
    PipelineError error;
    EXPECT_FALSE(runBuildAlignSign(project_, "", options, toolchain_, nullptr, &error));
    EXPECT_EQ(error.kind, ErrorKind::kSign);
    EXPECT_FALSE(base::file::pathExists(callLog("apktool")));
}

}  // namespace
}  // namespace apkc
