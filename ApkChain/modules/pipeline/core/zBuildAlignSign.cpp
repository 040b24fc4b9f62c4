#include "zBuildAlignSign.h"

#include "zFile.h"
#include "zLog.h"
#include "zSigningIdentity.h"
#include "zStageRunner.h"
#include "zStagingArea.h"
#include "zToolResolver.h"
#include "zValidationGate.h"

namespace apkc {

namespace {

// staging 区内的固定文件名。
constexpr const char* kBuiltApkName = "built.apk";
constexpr const char* kAlignedApkName = "aligned.apk";

// 去掉目录末尾的 '/'，避免拼出 "dir/-patched.apk"。
std::string trimTrailingSlash(std::string path) {
    while (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }
    return path;
}

bool runBuildStage(const std::string& sourceDir,
                   const std::string& builtApk,
                   const ToolchainConfig& toolchain,
                   PipelineError* error) {
    StageSpec spec;
    spec.name = "build";
    spec.tool = "apktool";
    spec.invocation = makeInvocation({toolchain.apktool, "b", sourceDir, "-o", builtApk}, toolchain);
    spec.expectedArtifact = builtApk;
    if (!runStage(spec, nullptr, error)) {
        return retagError(error, ErrorKind::kBuild, "failed to build APK");
    }
    return true;
}

bool runAlignStage(const std::string& zipalign,
                   const std::string& inputApk,
                   const std::string& alignedApk,
                   const ToolchainConfig& toolchain,
                   PipelineError* error) {
    StageSpec spec;
    spec.name = "align";
    spec.tool = "zipalign";
    spec.gates = {gateIsFile(inputApk)};
    // -P 16：.so 按 16KiB 页对齐；4：普通条目 4 字节对齐。
    spec.invocation =
        makeInvocation({zipalign, "-P", "16", "4", inputApk, alignedApk}, toolchain);
    spec.expectedArtifact = alignedApk;
    if (!runStage(spec, nullptr, error)) {
        return retagError(error, ErrorKind::kAlign, "failed to align APK");
    }
    return true;
}

bool runSignStage(const std::string& apksigner,
                  const SigningIdentity& identity,
                  const std::string& inputApk,
                  const std::string& outputApk,
                  const ToolchainConfig& toolchain,
                  PipelineError* error) {
    StageSpec spec;
    spec.name = "sign";
    spec.tool = "apksigner";
    spec.gates = {gateIsFile(inputApk), gateIsFile(identity.keystorePath)};
    spec.invocation = makeInvocation({apksigner,
                                      "sign",
                                      "--ks",
                                      identity.keystorePath,
                                      "--ks-key-alias",
                                      identity.alias,
                                      "--ks-pass",
                                      "pass:" + identity.storePass,
                                      "--key-pass",
                                      "pass:" + identity.keyPass,
                                      "--out",
                                      outputApk,
                                      inputApk},
                                     toolchain);
    spec.expectedArtifact = outputApk;
    if (!runStage(spec, nullptr, error)) {
        return retagError(error, ErrorKind::kSign, "failed to sign APK");
    }
    return true;
}

// 验签结果只记录不抛错；只有验签器本身跑不起来（找不到/超时）才算失败。
bool runVerifyStage(const std::string& apksigner,
                    const std::string& apk,
                    const ToolchainConfig& toolchain,
                    Verification* verification,
                    PipelineError* error) {
    process::ToolInvocation invocation =
        makeInvocation({apksigner, "verify", "--verbose", apk}, toolchain);
    invocation.checkExit = false;
    LOGD("[verify] %s", process::formatCommandLine(invocation.argv).c_str());
    const process::ToolResult result = process::runTool(invocation);
    if (!interpretToolResult(result, invocation, "verify", "apksigner", error)) {
        if (error != nullptr) {
            error->artifact = apk;
        }
        return retagError(error, ErrorKind::kSign, "failed to verify APK");
    }
    *verification = result.exitCode == 0 ? Verification::kPassed : Verification::kFailed;
    return true;
}

}  // namespace

std::string defaultPatchedOutputPath(const std::string& sourceDir) {
    return trimTrailingSlash(base::file::absolutePath(trimTrailingSlash(sourceDir))) + "-patched.apk";
}

bool runBuildAlignSign(const std::string& sourceDir,
                       const std::string& outputPath,
                       const BuildOptions& options,
                       const ToolchainConfig& toolchain,
                       BuildResult* result,
                       PipelineError* error) {
    BuildResult local;
    local.sourceDir = base::file::absolutePath(trimTrailingSlash(sourceDir));
    local.outputPath = outputPath.empty() ? defaultPatchedOutputPath(sourceDir)
                                          : base::file::absolutePath(outputPath);

    // 工程目录校验：任何外部进程启动前完成。
    const std::vector<ValidationGate> projectGates = {
        gateExists(local.sourceDir),
        gateIsDirectory(local.sourceDir),
        gateMarkerFile(local.sourceDir, kApktoolMarkerFile),
    };
    if (!evaluateGates(projectGates, "build", error)) {
        if (error != nullptr) {
            error->tool = "apktool";
        }
        return retagError(error, ErrorKind::kBuild, "not a valid apktool project directory");
    }

    // 先解析所需工具，避免 build 完成后才发现缺工具。
    std::string zipalign;
    if (options.align && !resolveBuildTool(toolchain, "zipalign", &zipalign, error)) {
        return false;
    }
    std::string apksigner;
    if (options.sign && !resolveBuildTool(toolchain, "apksigner", &apksigner, error)) {
        return false;
    }

    // 签名身份：调用方提供优先，否则惰性供给调试身份。
    SigningIdentity identity;
    if (options.sign) {
        if (options.identity.has_value()) {
            identity = *options.identity;
            if (!validateSigningIdentity(identity, error)) {
                return false;
            }
        } else {
            bool generated = false;
            if (!ensureDebugIdentity(options.debugIdentity, toolchain, &identity, &generated, error)) {
                return false;
            }
            local.keystoreGenerated = generated;
        }
        local.keystorePath = identity.keystorePath;
    }

    if (!base::file::ensureParentDirectory(local.outputPath)) {
        return setError(error, ErrorKind::kBuild, ErrorReason::kIo, "build",
                        "failed to create output directory", local.outputPath);
    }

    LOGI("building %s", local.sourceDir.c_str());
    const bool ok = withStagingArea(
        toolchain.stagingRoot, "apkchain-build-",
        [&](const StagingArea& staging, PipelineError* stageError) {
            // 1) build
            std::string current = staging.file(kBuiltApkName);
            const bool built = runBuildStage(local.sourceDir, current, toolchain, stageError);
            recordStage(&local.stages, "build", built, current, stageError);
            if (!built) {
                return false;
            }

            // 2) align
            if (options.align) {
                const std::string aligned = staging.file(kAlignedApkName);
                const bool alignedOk = runAlignStage(zipalign, current, aligned, toolchain, stageError);
                recordStage(&local.stages, "align", alignedOk, aligned, stageError);
                if (!alignedOk) {
                    return false;
                }
                local.alignRan = true;
                current = aligned;
            }

            // 3) 输出路径上的旧文件先删除：产物检查只能认本次写出的文件。
            if (base::file::pathExists(local.outputPath)) {
                std::string removeError;
                if (!base::file::removeFile(local.outputPath, &removeError)) {
                    return setError(stageError, ErrorKind::kBuild, ErrorReason::kIo, "build",
                                    "failed to remove existing output: " + removeError,
                                    local.outputPath);
                }
                LOGD("removed previous output: %s", local.outputPath.c_str());
            }

            // 4) sign：直接写到最终输出；跳过时原样复制。
            if (options.sign) {
                const bool signedOk =
                    runSignStage(apksigner, identity, current, local.outputPath, toolchain, stageError);
                recordStage(&local.stages, "sign", signedOk, local.outputPath, stageError);
                if (!signedOk) {
                    return false;
                }
                local.signRan = true;
            } else {
                if (!staging.copyOut(current, local.outputPath, stageError)) {
                    return retagError(stageError, ErrorKind::kBuild, "failed to copy unsigned APK");
                }
                LOGI("signing skipped, unsigned APK copied to %s", local.outputPath.c_str());
            }
            return true;
        },
        error);
    if (!ok) {
        if (result != nullptr) {
            *result = local;
        }
        return false;
    }

    // 5) verify：只在签名执行后有意义。
    if (options.verify && local.signRan) {
        Verification verification = Verification::kNotAttempted;
        if (!runVerifyStage(apksigner, local.outputPath, toolchain, &verification, error)) {
            recordStage(&local.stages, "verify", false, local.outputPath, error);
            if (result != nullptr) {
                *result = local;
            }
            return false;
        }
        local.verification = verification;
        recordStage(&local.stages, "verify", true, local.outputPath, nullptr);
        if (verification == Verification::kFailed) {
            LOGW("signature verification failed: %s", local.outputPath.c_str());
        }
    } else if (options.verify) {
        LOGW("verification requested but signing was skipped");
    }

    LOGI("APK written: %s", local.outputPath.c_str());
    if (result != nullptr) {
        *result = local;
    }
    return true;
}

}  // namespace apkc
