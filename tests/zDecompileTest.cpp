#include <fstream>

#include <gtest/gtest.h>

#include "zDecompile.h"
#include "zFile.h"
#include "zTestSupport.h"

namespace apkc {
namespace {

class DecompileTest : public test::PipelineTest {
protected:
    void SetUp() override {
        PipelineTest::SetUp();
        apk_ = tmp_.file("app.apk");
        test::writeZip(apk_, {{"AndroidManifest.xml", "manifest"}, {"classes.dex", "dex"}});
        options_.outputDir = tmp_.file("out");
    }

    void installFakeJadx() {
        toolchain_.jadx = tool("jadx",
                               "echo \"$@\" >> '" + callLog("jadx") + "'\n"
                               "mkdir -p \"$2\" && printf 'class A {}' > \"$2/A.java\"\n");
    }

    void installFailingJadx() {
        toolchain_.jadx = tool("jadx",
                               "echo \"$@\" >> '" + callLog("jadx") + "'\n"
                               "echo 'jadx crashed' 1>&2\nexit 1\n");
    }

    std::string apk_;
    DecompileOptions options_;
};

TEST_F(DecompileTest, BothStagesSucceed) {
    installFakeJadx();
    installFakeApktool();
    DecompileResult result;
    PipelineError error;
    ASSERT_TRUE(runDecompile(apk_, options_, toolchain_, &result, &error)) << error.describe();
    EXPECT_TRUE(result.javaSuccess);
    EXPECT_TRUE(result.smaliSuccess);
    EXPECT_EQ(result.javaDir, options_.outputDir + "/java");
    EXPECT_EQ(result.smaliDir, options_.outputDir + "/smali");
    EXPECT_TRUE(base::file::fileExists(result.javaDir + "/A.java"));
    EXPECT_TRUE(base::file::fileExists(result.smaliDir + "/apktool.yml"));
    EXPECT_NE(test::readText(callLog("apktool")).find("d -o " + result.smaliDir + " " + apk_ + " -f"),
              std::string::npos);
}

TEST_F(DecompileTest, JavaFailureDoesNotStopSmali) {
    installFailingJadx();
    installFakeApktool();
    DecompileResult result;
    PipelineError error;
    EXPECT_TRUE(runDecompile(apk_, options_, toolchain_, &result, &error));
    EXPECT_FALSE(error.isSet());
    EXPECT_FALSE(result.javaSuccess);
    EXPECT_TRUE(result.smaliSuccess);
    EXPECT_TRUE(result.javaDir.empty());
    EXPECT_NE(result.javaError.find("jadx crashed"), std::string::npos);
    EXPECT_TRUE(result.smaliError.empty());
}

TEST_F(DecompileTest, BothStagesFailingIsFatal) {
    installFailingJadx();
    toolchain_.apktool = tool("apktool", "exit 1\n");
    DecompileResult result;
    PipelineError error;
    EXPECT_FALSE(runDecompile(apk_, options_, toolchain_, &result, &error));
    EXPECT_EQ(error.kind, ErrorKind::kDecompile);
    EXPECT_FALSE(result.javaSuccess);
    EXPECT_FALSE(result.smaliSuccess);
    EXPECT_FALSE(result.javaError.empty());
    EXPECT_FALSE(result.smaliError.empty());
}

TEST_F(DecompileTest, SingleRequestedStageFailurePropagates) {
    installFailingJadx();
    options_.smali = false;
    PipelineError error;
    EXPECT_FALSE(runDecompile(apk_, options_, toolchain_, nullptr, &error));
    EXPECT_EQ(error.kind, ErrorKind::kDecompile);
    EXPECT_EQ(error.tool, "jadx");
    EXPECT_EQ(error.reason, ErrorReason::kNonZeroExit);
}

TEST_F(DecompileTest, OnlySmaliRequestedSkipsJadx) {
    installFakeJadx();
    installFakeApktool();
    options_.java = false;
    DecompileResult result;
    ASSERT_TRUE(runDecompile(apk_, options_, toolchain_, &result, nullptr));
    EXPECT_FALSE(result.javaRequested);
    EXPECT_TRUE(result.smaliSuccess);
    EXPECT_FALSE(base::file::pathExists(callLog("jadx")));
}

TEST_F(DecompileTest, NothingRequestedIsConfigError) {
    options_.java = false;
    options_.smali = false;
    PipelineError error;
    EXPECT_FALSE(runDecompile(apk_, options_, toolchain_, nullptr, &error));
    EXPECT_EQ(error.kind, ErrorKind::kConfig);
}

TEST_F(DecompileTest, BadHeaderFailsBeforeAnyTool) {
    installFakeJadx();
    installFakeApktool();
    const std::string fake = tmp_.file("fake.apk");
    std::ofstream(fake) << "this is not a zip";
    PipelineError error;
    EXPECT_FALSE(runDecompile(fake, options_, toolchain_, nullptr, &error));
    EXPECT_EQ(error.kind, ErrorKind::kValidation);
    EXPECT_NE(error.message.find("PK\\x03\\x04"), std::string::npos);
    EXPECT_FALSE(base::file::pathExists(callLog("jadx")));
    EXPECT_FALSE(base::file::pathExists(callLog("apktool")));
}

TEST_F(DecompileTest, WrongExtensionIsValidationError) {
    const std::string zip = tmp_.file("app.zip");
    test::writeZip(zip, {{"a", "b"}});
    PipelineError error;
    EXPECT_FALSE(runDecompile(zip, options_, toolchain_, nullptr, &error));
    EXPECT_EQ(error.kind, ErrorKind::kValidation);
}

TEST(DecompileDefaultsTest, DefaultOutputDirIsApkStem) {
    EXPECT_EQ(defaultDecompileOutputDir("/x/y/com.example.app.apk"),
              base::file::joinPath(base::file::currentDirectory(), "com.example.app"));
}

}  // namespace
}  // namespace apkc
