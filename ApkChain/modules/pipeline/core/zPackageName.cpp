#include "zPackageName.h"

#include <regex>

#include "zFile.h"
#include "zLog.h"
#include "zProcess.h"
#include "zStageRunner.h"
#include "zToolResolver.h"

namespace apkc {

namespace {

// 文件名中常见的重打包标记。
const char* const kArtifactSuffixes[] = {"_merged", "-merged", "-signed", "-aligned", "-debugSigned"};

void eraseAll(std::string* text, const std::string& needle) {
    size_t pos = 0;
    while ((pos = text->find(needle, pos)) != std::string::npos) {
        text->erase(pos, needle.size());
    }
}

}  // namespace

std::string parseBadgingPackageName(const std::string& badgingOutput) {
    static const std::regex kPackagePattern("package: name='([^']+)'");
    std::smatch match;
    if (std::regex_search(badgingOutput, match, kPackagePattern)) {
        return match[1].str();
    }
    return std::string();
}

std::string packageNameFromFileName(const std::string& apkPath) {
    std::string stem = base::file::fileStem(apkPath);
    // 版本号后缀，如 -4.7.1 / -1.0-release。
    static const std::regex kVersionSuffix("-\\d+\\.\\d+.*$");
    stem = std::regex_replace(stem, kVersionSuffix, "");
    for (const char* suffix : kArtifactSuffixes) {
        eraseAll(&stem, suffix);
    }
    if (stem.find('_') != std::string::npos && stem.find('.') == std::string::npos) {
        for (char& c : stem) {
            if (c == '_') {
                c = '.';
            }
        }
    }
    return stem;
}

bool resolvePackageName(const std::string& apkPath,
                        const ToolchainConfig& toolchain,
                        std::string* packageName,
                        PipelineError* error) {
    // 1) aapt：不可用或失败都静默回退。
    std::string aapt;
    if (resolveBuildTool(toolchain, "aapt", &aapt, nullptr)) {
        process::ToolInvocation invocation =
            makeInvocation({aapt, "dump", "badging", apkPath}, toolchain);
        invocation.checkExit = false;
        const process::ToolResult result = process::runTool(invocation);
        if (result.succeeded()) {
            const std::string name = parseBadgingPackageName(result.stdoutText);
            if (!name.empty()) {
                LOGD("package name from aapt: %s", name.c_str());
                if (packageName != nullptr) {
                    *packageName = name;
                }
                return true;
            }
        }
        LOGD("aapt could not report a package name, falling back to file name");
    }

    // 2) 文件名启发式。
    const std::string guess = packageNameFromFileName(apkPath);
    if (guess.find('.') == std::string::npos) {
        return setError(error, ErrorKind::kValidation, ErrorReason::kPrecondition, "package",
                        "could not extract package name from APK: file name heuristic gave '" +
                            guess + "' which does not look like a package name; pass --package",
                        apkPath);
    }
    LOGD("package name from file name: %s", guess.c_str());
    if (packageName != nullptr) {
        *packageName = guess;
    }
    return true;
}

}  // namespace apkc
