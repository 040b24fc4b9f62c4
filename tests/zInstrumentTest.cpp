#include <filesystem>
#include <fstream>
#include <system_error>

#include <gtest/gtest.h>

#include "zFile.h"
#include "zInstrument.h"
#include "zProcess.h"
#include "zTestSupport.h"

namespace apkc {
namespace {

class InstrumentTest : public test::PipelineTest {
protected:
    void SetUp() override {
        PipelineTest::SetUp();
        installFakeApktool();
        installFakeZipalign();
        installFakeApksigner();
        installFakeKeytool();
        // reflutter 在工作目录产出 release.RE.apk。
        toolchain_.reflutter = tool("reflutter",
                                    "echo \"$@\" >> '" + callLog("reflutter") + "'\n"
                                    "printf 'PATCHED' > release.RE.apk\n");

        apk_ = tmp_.file("app.apk");
        test::writeZip(apk_, {{"AndroidManifest.xml", "m"},
                              {"lib/arm64-v8a/libflutter.so", "elf"},
                              {"lib/arm64-v8a/libapp.so", "elf"}});

        options_.apkPath = apk_;
        options_.packageName = "com.example.flutter";
        options_.outputDir = tmp_.file("out");
        options_.startGraceSeconds = 0;
        options_.prompt = [this](const std::string& message) {
            ++promptCalls_;
            lastPrompt_ = message;
        };
    }

    void setDeviceDump(const std::string& content) {
        std::ofstream(deviceDumpFile(), std::ios::binary) << content;
    }

    std::string adbCalls() const { return test::readText(callLog("adb")); }

    std::string apk_;
    InstrumentOptions options_;
    int promptCalls_ = 0;
    std::string lastPrompt_;
};

TEST_F(InstrumentTest, FullWorkflowWithDump) {
    installFakeAdb();
    setDeviceDump("{\"classes\":[]}");
    InstrumentResult result;
    PipelineError error;
    ASSERT_TRUE(runInstrumentation(options_, toolchain_, &result, &error)) << error.describe();

    const std::string signedApk = options_.outputDir + "/com.example.flutter-reflutter-signed.apk";
    EXPECT_EQ(result.signedApk, signedApk);
    EXPECT_TRUE(base::file::fileExists(signedApk));
    EXPECT_TRUE(result.installed);
    EXPECT_TRUE(result.autoStarted);
    EXPECT_TRUE(result.dumpAttempted);
    ASSERT_TRUE(result.dump.has_value());
    EXPECT_EQ(result.dump->dumpPath, options_.outputDir + "/com.example.flutter_dump.dart");
    EXPECT_FALSE(result.dump->formattedPath.empty());
    EXPECT_TRUE(result.dumpError.empty());
    EXPECT_TRUE(result.signing.signRan);
    EXPECT_EQ(promptCalls_, 0);
    EXPECT_EQ(test::countEntries(toolchain_.stagingRoot), 0u);

    const std::string calls = adbCalls();
    const size_t uninstall = calls.find("uninstall com.example.flutter");
    const size_t install = calls.find("install " + signedApk);
    const size_t monkey = calls.find("shell monkey -p com.example.flutter");
    ASSERT_NE(uninstall, std::string::npos);
    ASSERT_NE(install, std::string::npos);
    ASSERT_NE(monkey, std::string::npos);
    EXPECT_LT(uninstall, install);
    EXPECT_LT(install, monkey);
}

TEST_F(InstrumentTest, EmptyDumpKeepsOverallSuccessAndInstall) {
    installFakeAdb();
    InstrumentResult result;
    PipelineError error;
    ASSERT_TRUE(runInstrumentation(options_, toolchain_, &result, &error)) << error.describe();
    EXPECT_FALSE(error.isSet());
    EXPECT_TRUE(result.installed);
    EXPECT_TRUE(result.dumpAttempted);
    EXPECT_FALSE(result.dump.has_value());
    EXPECT_NE(result.dumpError.find("DumpError"), std::string::npos);
    EXPECT_NE(result.dumpError.find("empty content"), std::string::npos);
    EXPECT_TRUE(base::file::fileExists(result.signedApk));

    // 安装之后不再有卸载调用。
    const std::string calls = adbCalls();
    const size_t install = calls.find("install " + result.signedApk);
    ASSERT_NE(install, std::string::npos);
    EXPECT_EQ(calls.find("uninstall", install), std::string::npos);
    ASSERT_FALSE(result.stages.empty());
    EXPECT_EQ(result.stages.back().name, "dump");
    EXPECT_FALSE(result.stages.back().succeeded);
}

TEST_F(InstrumentTest, InstallFailureIsInstallError) {
    test::FakeAdbBehavior behavior;
    behavior.installExit = 1;
    installFakeAdb(behavior);
    InstrumentResult result;
    PipelineError error;
    EXPECT_FALSE(runInstrumentation(options_, toolchain_, &result, &error));
    EXPECT_EQ(error.kind, ErrorKind::kInstall);
    EXPECT_EQ(error.reason, ErrorReason::kNonZeroExit);
    EXPECT_FALSE(result.installed);
    EXPECT_FALSE(result.dumpAttempted);
    EXPECT_EQ(adbCalls().find("monkey"), std::string::npos);
}

TEST_F(InstrumentTest, FrameworkMismatchListsDetectedFrameworks) {
    installFakeAdb();
    const std::string rn = tmp_.file("rn.apk");
    test::writeZip(rn, {{"AndroidManifest.xml", "m"}, {"assets/index.android.bundle", "js"}});
    options_.apkPath = rn;
    PipelineError error;
    EXPECT_FALSE(runInstrumentation(options_, toolchain_, nullptr, &error));
    EXPECT_EQ(error.kind, ErrorKind::kFrameworkMismatch);
    EXPECT_NE(error.message.find("Detected frameworks: React Native"), std::string::npos);
    EXPECT_FALSE(base::file::pathExists(callLog("reflutter")));
}

TEST_F(InstrumentTest, PlainApkReportsNoFrameworks) {
    const std::string plain = tmp_.file("plain.apk");
    test::writeZip(plain, {{"AndroidManifest.xml", "m"}});
    options_.apkPath = plain;
    PipelineError error;
    EXPECT_FALSE(runInstrumentation(options_, toolchain_, nullptr, &error));
    EXPECT_EQ(error.kind, ErrorKind::kFrameworkMismatch);
    EXPECT_NE(error.message.find("Detected frameworks: None"), std::string::npos);
}

TEST_F(InstrumentTest, ForceSkipsFrameworkCheck) {
    installFakeAdb();
    const std::string plain = tmp_.file("plain.apk");
    test::writeZip(plain, {{"AndroidManifest.xml", "m"}});
    options_.apkPath = plain;
    options_.force = true;
    options_.skipDump = true;
    InstrumentResult result;
    PipelineError error;
    ASSERT_TRUE(runInstrumentation(options_, toolchain_, &result, &error)) << error.describe();
    EXPECT_TRUE(base::file::pathExists(callLog("reflutter")));
    EXPECT_TRUE(result.installed);
}

TEST_F(InstrumentTest, BadHeaderFailsBeforeAnyToolEvenWithForce) {
    installFakeAdb();
    const std::string fake = tmp_.file("fake.apk");
    std::ofstream(fake) << "MZ not a zip";
    options_.apkPath = fake;
    options_.force = true;
    PipelineError error;
    EXPECT_FALSE(runInstrumentation(options_, toolchain_, nullptr, &error));
    EXPECT_EQ(error.kind, ErrorKind::kValidation);
    EXPECT_NE(error.message.find("header mismatch"), std::string::npos);
    EXPECT_FALSE(base::file::pathExists(callLog("reflutter")));
    EXPECT_FALSE(base::file::pathExists(callLog("adb")));
    EXPECT_FALSE(base::file::pathExists(callLog("apktool")));
}

TEST_F(InstrumentTest, AutoStartFailureFallsBackToPrompt) {
    test::FakeAdbBehavior behavior;
    behavior.monkeyExit = 252;
    installFakeAdb(behavior);
    setDeviceDump("{}");
    InstrumentResult result;
    PipelineError error;
    ASSERT_TRUE(runInstrumentation(options_, toolchain_, &result, &error)) << error.describe();
    EXPECT_FALSE(result.autoStarted);
    EXPECT_EQ(promptCalls_, 1);
    EXPECT_NE(lastPrompt_.find("com.example.flutter"), std::string::npos);
    EXPECT_TRUE(result.dump.has_value());
}

TEST_F(InstrumentTest, WaitForUserSkipsAutoStart) {
    installFakeAdb();
    setDeviceDump("{}");
    options_.waitForUser = true;
    InstrumentResult result;
    ASSERT_TRUE(runInstrumentation(options_, toolchain_, &result, nullptr));
    EXPECT_EQ(promptCalls_, 1);
    EXPECT_FALSE(result.autoStarted);
    EXPECT_EQ(adbCalls().find("monkey"), std::string::npos);
}

TEST_F(InstrumentTest, SkipDumpStopsAfterInstall) {
    installFakeAdb();
    options_.skipDump = true;
    InstrumentResult result;
    ASSERT_TRUE(runInstrumentation(options_, toolchain_, &result, nullptr));
    EXPECT_TRUE(result.installed);
    EXPECT_FALSE(result.dumpAttempted);
    EXPECT_EQ(adbCalls().find("su -c"), std::string::npos);
    EXPECT_EQ(promptCalls_, 0);
}

TEST_F(InstrumentTest, MissingPatchedApkIsInstrumentError) {
    installFakeAdb();
    toolchain_.reflutter = tool("reflutter", "exit 0\n");
    PipelineError error;
    EXPECT_FALSE(runInstrumentation(options_, toolchain_, nullptr, &error));
    EXPECT_EQ(error.kind, ErrorKind::kInstrument);
    EXPECT_EQ(error.reason, ErrorReason::kArtifactMissing);
    EXPECT_EQ(adbCalls().find("install"), std::string::npos);
    EXPECT_EQ(test::countEntries(toolchain_.stagingRoot), 0u);
}

TEST_F(InstrumentTest, ResignFailureIsInstrumentError) {
    installFakeAdb();
    toolchain_.apksigner = tool("apksigner", "exit 1\n");
    PipelineError error;
    EXPECT_FALSE(runInstrumentation(options_, toolchain_, nullptr, &error));
    EXPECT_EQ(error.kind, ErrorKind::kInstrument);
    EXPECT_EQ(error.reason, ErrorReason::kNonZeroExit);
    EXPECT_EQ(test::countEntries(toolchain_.stagingRoot), 0u);
}

TEST_F(InstrumentTest, UnresolvableBuildToolStaysConfigError) {
    installFakeAdb();
    // 受限 PATH：只有假 apktool 需要的 mkdir，没有 zipalign。
    const std::string bin = tmp_.makeDir("restricted-bin");
    const std::string mkdirPath = process::findOnPath("mkdir");
    ASSERT_FALSE(mkdirPath.empty());
    std::error_code ec;
    std::filesystem::create_symlink(mkdirPath, bin + "/mkdir", ec);
    ASSERT_FALSE(ec) << ec.message();
    toolchain_.zipalign.clear();
    test::ScopedEnv path("PATH", bin);

    PipelineError error;
    EXPECT_FALSE(runInstrumentation(options_, toolchain_, nullptr, &error));
    EXPECT_EQ(error.kind, ErrorKind::kConfig);
    EXPECT_EQ(error.tool, "zipalign");
    EXPECT_NE(error.message.find("failed to re-sign instrumented APK"), std::string::npos);
    EXPECT_TRUE(base::file::pathExists(callLog("reflutter")));
    EXPECT_EQ(adbCalls().find("install"), std::string::npos);
    EXPECT_EQ(test::countEntries(toolchain_.stagingRoot), 0u);
}

TEST(InstrumentNamingTest, OutputName) {
    EXPECT_EQ(instrumentedOutputName("com.a.b"), "com.a.b-reflutter-signed.apk");
}

}  // namespace
}  // namespace apkc
