#include "zSplitMerge.h"

#include "zFile.h"
#include "zLog.h"
#include "zSplitArtifacts.h"
#include "zStageRunner.h"
#include "zToolResolver.h"
#include "zValidationGate.h"

namespace apkc {

namespace {

std::string trimTrailingSlash(std::string path) {
    while (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }
    return path;
}

}  // namespace

std::string defaultMergedOutputPath(const std::string& splitDir) {
    return base::file::absolutePath(trimTrailingSlash(splitDir)) + ".merged.apk";
}

bool runSplitMerge(const std::string& splitDir,
                   const std::string& outputPath,
                   const ToolchainConfig& toolchain,
                   MergeResult* result,
                   PipelineError* error) {
    MergeResult local;
    local.splitDir = base::file::absolutePath(trimTrailingSlash(splitDir));
    local.outputPath = outputPath.empty() ? defaultMergedOutputPath(splitDir)
                                          : base::file::absolutePath(outputPath);

    // 1) 目录校验：区分“目录不对”和“工具失败”。
    const std::vector<ValidationGate> gates = {
        gateExists(local.splitDir),
        gateIsDirectory(local.splitDir),
        gateContainsExtension(local.splitDir, ".apk"),
    };
    if (!evaluateGates(gates, "merge", error)) {
        if (error != nullptr) {
            error->tool = "APKEditor";
        }
        return retagError(error, ErrorKind::kMerge, "invalid split APK directory");
    }
    local.artifacts = classifySplitArtifacts(listFilesWithExtension(local.splitDir, ".apk"));
    LOGI("merging %zu APK(s) from %s (base: %s)", local.artifacts.all().size(),
         local.splitDir.c_str(),
         local.artifacts.base.empty() ? "none" : base::file::fileName(local.artifacts.base).c_str());

    // 2) 解析 APKEditor。
    std::string source;
    if (!resolveApkEditorCommand(toolchain, &local.toolCommand, &source, error)) {
        return false;
    }

    // 3) 合并不是增量操作：先删掉旧输出。
    if (!base::file::ensureParentDirectory(local.outputPath)) {
        return setError(error, ErrorKind::kMerge, ErrorReason::kIo, "merge",
                        "failed to create output directory", local.outputPath);
    }
    if (base::file::pathExists(local.outputPath)) {
        std::string removeError;
        if (!base::file::removeFile(local.outputPath, &removeError)) {
            return setError(error, ErrorKind::kMerge, ErrorReason::kIo, "merge",
                            "failed to remove existing output: " + removeError, local.outputPath);
        }
        local.replacedExisting = true;
    }

    // 4) merge。
    std::vector<std::string> argv = local.toolCommand;
    argv.insert(argv.end(), {"merge", "-i", local.splitDir, "-o", local.outputPath});
    StageSpec spec;
    spec.name = "merge";
    spec.tool = "APKEditor";
    spec.invocation = makeInvocation(argv, toolchain);
    spec.expectedArtifact = local.outputPath;
    if (!runStage(spec, nullptr, error)) {
        if (result != nullptr) {
            *result = local;
        }
        return retagError(error, ErrorKind::kMerge, "APKEditor merge failed");
    }

    LOGI("merged APK written: %s", local.outputPath.c_str());
    if (result != nullptr) {
        *result = local;
    }
    return true;
}

}  // namespace apkc
