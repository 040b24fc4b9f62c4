#include "zDecompile.h"

#include "zFile.h"
#include "zLog.h"
#include "zStageRunner.h"
#include "zValidationGate.h"

namespace apkc {

namespace {

StageOutcome runJavaStage(const std::string& apk,
                          const std::string& javaDir,
                          const ToolchainConfig& toolchain) {
    StageOutcome outcome;
    outcome.attempted = true;
    StageSpec spec;
    spec.name = "java";
    spec.tool = "jadx";
    spec.invocation = makeInvocation({toolchain.jadx, "-d", javaDir, apk}, toolchain);
    spec.expectedArtifact = javaDir;
    spec.artifactType = ArtifactType::kDirectory;
    outcome.succeeded = runStage(spec, nullptr, &outcome.error);
    if (!outcome.succeeded) {
        retagError(&outcome.error, ErrorKind::kDecompile, "jadx decompilation failed");
    }
    return outcome;
}

StageOutcome runSmaliStage(const std::string& apk,
                           const std::string& smaliDir,
                           const ToolchainConfig& toolchain) {
    StageOutcome outcome;
    outcome.attempted = true;
    StageSpec spec;
    spec.name = "smali";
    spec.tool = "apktool";
    // -f：覆盖已存在的输出目录。
    spec.invocation = makeInvocation({toolchain.apktool, "d", "-o", smaliDir, apk, "-f"}, toolchain);
    spec.expectedArtifact = smaliDir;
    spec.artifactType = ArtifactType::kDirectory;
    outcome.succeeded = runStage(spec, nullptr, &outcome.error);
    if (!outcome.succeeded) {
        retagError(&outcome.error, ErrorKind::kDecompile, "apktool decompilation failed");
    }
    return outcome;
}

}  // namespace

std::string defaultDecompileOutputDir(const std::string& apkPath) {
    return base::file::joinPath(base::file::currentDirectory(), base::file::fileStem(apkPath));
}

bool runDecompile(const std::string& apkPath,
                  const DecompileOptions& options,
                  const ToolchainConfig& toolchain,
                  DecompileResult* result,
                  PipelineError* error) {
    // 参数组合检查先于一切文件系统校验。
    if (!options.java && !options.smali) {
        return setError(error, ErrorKind::kConfig, ErrorReason::kPrecondition, "decompile",
                        "at least one of java or smali output must be requested");
    }
    if (!validateApkPath(apkPath, true, "decompile", error)) {
        return false;
    }

    DecompileResult local;
    local.apkPath = base::file::absolutePath(apkPath);
    local.outputDir = options.outputDir.empty() ? defaultDecompileOutputDir(apkPath)
                                                : base::file::absolutePath(options.outputDir);
    local.javaRequested = options.java;
    local.smaliRequested = options.smali;
    if (!base::file::ensureDirectory(local.outputDir)) {
        return setError(error, ErrorKind::kDecompile, ErrorReason::kIo, "decompile",
                        "failed to create output directory", local.outputDir);
    }

    const std::string javaDir = base::file::joinPath(local.outputDir, "java");
    const std::string smaliDir = base::file::joinPath(local.outputDir, "smali");

    // 每个请求的阶段都执行，结果最后汇总。
    StageOutcome java;
    StageOutcome smali;
    if (options.java) {
        LOGI("decompiling to Java sources: %s", javaDir.c_str());
        java = runJavaStage(local.apkPath, javaDir, toolchain);
        if (!java.succeeded) {
            LOGW("%s", java.error.describe().c_str());
        }
    }
    if (options.smali) {
        LOGI("decompiling to smali/resources: %s", smaliDir.c_str());
        smali = runSmaliStage(local.apkPath, smaliDir, toolchain);
        if (!smali.succeeded) {
            LOGW("%s", smali.error.describe().c_str());
        }
    }

    local.javaSuccess = java.succeeded;
    local.smaliSuccess = smali.succeeded;
    local.javaDir = java.succeeded ? javaDir : std::string();
    local.smaliDir = smali.succeeded ? smaliDir : std::string();
    local.javaError = java.attempted && !java.succeeded ? java.error.describe() : std::string();
    local.smaliError = smali.attempted && !smali.succeeded ? smali.error.describe() : std::string();
    if (result != nullptr) {
        *result = local;
    }

    const bool anySucceeded = java.succeeded || smali.succeeded;
    if (anySucceeded) {
        return true;
    }
    // 只请求了一个阶段：原样上抛该阶段错误。
    if (java.attempted && !smali.attempted) {
        if (error != nullptr) {
            *error = java.error;
        }
        return false;
    }
    if (smali.attempted && !java.attempted) {
        if (error != nullptr) {
            *error = smali.error;
        }
        return false;
    }
    setError(error, ErrorKind::kDecompile, smali.error.reason, "decompile",
             "both jadx and apktool decompilation failed", local.outputDir);
    return false;
}

}  // namespace apkc
