#include "zInstrument.h"

#include <chrono>
#include <iostream>
#include <thread>

#include "zBuildAlignSign.h"
#include "zFile.h"
#include "zFrameworkDetect.h"
#include "zLog.h"
#include "zPackageName.h"
#include "zRuntimeDump.h"
#include "zStageRunner.h"
#include "zStagingArea.h"
#include "zValidationGate.h"

namespace apkc {

namespace {

// 1) 目标框架校验。
bool checkTargetFramework(const std::string& apkPath,
                          const std::string& targetFramework,
                          PipelineError* error) {
    FrameworkReport report;
    if (!detectFrameworks(apkPath, false, &report, error)) {
        return false;
    }
    if (!report.hasFramework(targetFramework)) {
        return setError(error, ErrorKind::kFrameworkMismatch, ErrorReason::kPrecondition,
                        "framework-check",
                        "APK is not a " + targetFramework +
                            " application. Detected frameworks: " + report.frameworkNames(),
                        apkPath);
    }
    return true;
}

// 2) 插桩：reflutter 在 staging 区内运行，产物名固定。
bool runInstrumentStage(const std::string& apkPath,
                        const StagingArea& staging,
                        const InstrumentOptions& options,
                        const ToolchainConfig& toolchain,
                        std::string* patchedApk,
                        PipelineError* error) {
    StageSpec spec;
    spec.name = "instrument";
    spec.tool = "reflutter";
    spec.invocation = makeInvocation({toolchain.reflutter, apkPath}, toolchain, staging.path());
    spec.expectedArtifact = staging.file(options.instrumentedApkName);
    if (!runStage(spec, nullptr, error)) {
        return retagError(error, ErrorKind::kInstrument, "reflutter patching failed");
    }
    *patchedApk = spec.expectedArtifact;
    return true;
}

// 3) 重签：反解成工程目录后复用 Build-Align-Sign。
bool resignInstrumentedApk(const std::string& patchedApk,
                           const std::string& signedApk,
                           const InstrumentOptions& options,
                           const ToolchainConfig& toolchain,
                           BuildResult* signing,
                           PipelineError* error) {
    return withStagingArea(
        toolchain.stagingRoot, "apkchain-resign-",
        [&](const StagingArea& staging, PipelineError* stageError) {
            const std::string decodedDir = staging.file("decoded");
            StageSpec decode;
            decode.name = "decode";
            decode.tool = "apktool";
            decode.gates = {gateIsFile(patchedApk)};
            decode.invocation = makeInvocation(
                {toolchain.apktool, "d", "-o", decodedDir, patchedApk, "-f"}, toolchain);
            decode.expectedArtifact = decodedDir;
            decode.artifactType = ArtifactType::kDirectory;
            if (!runStage(decode, nullptr, stageError)) {
                return retagError(stageError, ErrorKind::kInstrument,
                                  "failed to decode instrumented APK");
            }

            BuildOptions buildOptions;
            buildOptions.align = true;
            buildOptions.sign = true;
            buildOptions.identity = options.identity;
            if (!runBuildAlignSign(decodedDir, signedApk, buildOptions, toolchain, signing,
                                   stageError)) {
                return retagError(stageError, ErrorKind::kInstrument,
                                  "failed to re-sign instrumented APK");
            }
            return true;
        },
        error);
}

// 4) 卸载旧包：包可能本来就没装，结果只记日志。
void uninstallExisting(const InstrumentOptions& options,
                       const std::string& packageName,
                       const ToolchainConfig& toolchain) {
    process::ToolInvocation invocation = makeInvocation(
        buildAdbCommand(toolchain, options.deviceSerial, {"uninstall", packageName}), toolchain);
    invocation.checkExit = false;
    const process::ToolResult result = process::runTool(invocation);
    if (!result.succeeded()) {
        LOGD("uninstall %s skipped (exit %d)", packageName.c_str(), result.exitCode);
    }
}

// 5) 安装：失败即整体失败。
bool installSigned(const InstrumentOptions& options,
                   const std::string& signedApk,
                   const ToolchainConfig& toolchain,
                   PipelineError* error) {
    StageSpec spec;
    spec.name = "install";
    spec.tool = "adb";
    spec.gates = {gateIsFile(signedApk)};
    spec.invocation = makeInvocation(
        buildAdbCommand(toolchain, options.deviceSerial, {"install", signedApk}), toolchain);
    spec.artifactType = ArtifactType::kNone;
    if (!runStage(spec, nullptr, error)) {
        if (error != nullptr) {
            error->artifact = signedApk;
        }
        return retagError(error, ErrorKind::kInstall, "failed to install instrumented APK");
    }
    return true;
}

// 6) 自动拉起：monkey 发一次 LAUNCHER 事件后等待初始化。
bool autoStartApp(const InstrumentOptions& options,
                  const std::string& packageName,
                  const ToolchainConfig& toolchain) {
    process::ToolInvocation invocation = makeInvocation(
        buildAdbCommand(toolchain, options.deviceSerial,
                        {"shell", "monkey", "-p", packageName, "-c",
                         "android.intent.category.LAUNCHER", "1"}),
        toolchain);
    const process::ToolResult result = process::runTool(invocation);
    if (!result.succeeded()) {
        LOGD("monkey launch failed for %s (exit %d)", packageName.c_str(), result.exitCode);
        return false;
    }
    if (options.startGraceSeconds > 0) {
        LOGI("waiting %us for %s to initialize", options.startGraceSeconds, packageName.c_str());
        std::this_thread::sleep_for(std::chrono::seconds(options.startGraceSeconds));
    }
    return true;
}

}  // namespace

void defaultUserPrompt(const std::string& message) {
    std::cout << "\n" << message << "\n" << "Press Enter when the app has started..." << std::flush;
    std::string line;
    std::getline(std::cin, line);
}

std::string instrumentedOutputName(const std::string& packageName) {
    return packageName + "-reflutter-signed.apk";
}

bool runInstrumentation(const InstrumentOptions& options,
                        const ToolchainConfig& toolchain,
                        InstrumentResult* result,
                        PipelineError* error) {
    InstrumentResult local;
    local.originalApk = base::file::absolutePath(options.apkPath);
    const UserPrompt prompt = options.prompt ? options.prompt : UserPrompt(defaultUserPrompt);
    auto finish = [&](bool ok) {
        if (result != nullptr) {
            *result = local;
        }
        return ok;
    };

    // 1) 校验：ZIP 头检查即使 force 也会执行。
    if (!validateApkPath(local.originalApk, true, "instrument", error)) {
        return finish(false);
    }
    if (!options.force) {
        const bool matched = checkTargetFramework(local.originalApk, options.targetFramework, error);
        recordStage(&local.stages, "framework-check", matched, local.originalApk, error);
        if (!matched) {
            return finish(false);
        }
    } else {
        LOGW("framework check skipped (--force)");
    }

    local.packageName = options.packageName;
    if (local.packageName.empty() &&
        !resolvePackageName(local.originalApk, toolchain, &local.packageName, error)) {
        return finish(false);
    }
    LOGI("target package: %s", local.packageName.c_str());

    const std::string outputDir = options.outputDir.empty()
                                      ? base::file::currentDirectory()
                                      : base::file::absolutePath(options.outputDir);
    if (!base::file::ensureDirectory(outputDir)) {
        setError(error, ErrorKind::kInstrument, ErrorReason::kIo, "instrument",
                 "failed to create output directory", outputDir);
        return finish(false);
    }
    const std::string signedApk =
        base::file::joinPath(outputDir, instrumentedOutputName(local.packageName));

    // 2)+3) 插桩与重签：两个 staging 区都在这里结束生命周期。
    const bool patched = withStagingArea(
        toolchain.stagingRoot, "apkchain-instrument-",
        [&](const StagingArea& staging, PipelineError* stageError) {
            std::string patchedApk;
            LOGI("instrumenting %s", local.originalApk.c_str());
            const bool instrumented =
                runInstrumentStage(local.originalApk, staging, options, toolchain, &patchedApk,
                                   stageError);
            recordStage(&local.stages, "instrument", instrumented, patchedApk, stageError);
            if (!instrumented) {
                return false;
            }
            LOGI("re-signing instrumented APK");
            const bool resigned = resignInstrumentedApk(patchedApk, signedApk, options, toolchain,
                                                        &local.signing, stageError);
            recordStage(&local.stages, "resign", resigned, signedApk, stageError);
            return resigned;
        },
        error);
    if (!patched) {
        return finish(false);
    }
    local.signedApk = signedApk;

    // 4)+5) 卸载旧包并安装。
    uninstallExisting(options, local.packageName, toolchain);
    LOGI("installing %s", signedApk.c_str());
    const bool installed = installSigned(options, signedApk, toolchain, error);
    recordStage(&local.stages, "install", installed, signedApk, error);
    if (!installed) {
        return finish(false);
    }
    local.installed = true;

    if (options.skipDump) {
        LOGI("dump skipped");
        return finish(true);
    }

    // 6) 拉起应用。
    if (options.waitForUser) {
        prompt("Please start the app '" + local.packageName + "' on the device.");
    } else {
        local.autoStarted = autoStartApp(options, local.packageName, toolchain);
        if (!local.autoStarted) {
            prompt("Could not auto-start app. Please start '" + local.packageName + "' manually.");
        }
    }

    // 7) dump：失败不影响整体结果。
    local.dumpAttempted = true;
    DumpOptions dumpOptions;
    dumpOptions.packageName = local.packageName;
    dumpOptions.outputDir = outputDir;
    dumpOptions.deviceSerial = options.deviceSerial;
    dumpOptions.checkRoot = options.checkRoot;
    dumpOptions.formatJson = options.formatJson;
    dumpOptions.remotePathTemplate = options.remoteDumpTemplate;
    DumpResult dump;
    PipelineError dumpError;
    if (dumpRuntimeData(dumpOptions, toolchain, &dump, &dumpError)) {
        dump.autoStarted = local.autoStarted;
        local.dump = dump;
        recordStage(&local.stages, "dump", true, dump.dumpPath, nullptr);
    } else {
        local.dumpError = dumpError.describe();
        recordStage(&local.stages, "dump", false, std::string(), &dumpError);
        LOGW("%s", local.dumpError.c_str());
        LOGW("you can dump later with: ApkChain dump %s", local.packageName.c_str());
    }
    return finish(true);
}

}  // namespace apkc
