#include "zToolResolver.h"

#include <algorithm>
#include <cstdlib>
#include <filesystem>

#include "zFile.h"
#include "zLog.h"
#include "zProcess.h"
#include "zUserConfig.h"

namespace fs = std::filesystem;

namespace apkc {

namespace {

// APKEditor 目录模式下的 jar 文件名。
constexpr const char* kApkEditorJarName = "APKEditor.jar";

std::string envValue(const std::string& name) {
    if (name.empty()) {
        return std::string();
    }
    const char* value = std::getenv(name.c_str());
    return value != nullptr ? std::string(value) : std::string();
}

// 解析 "30.0.3" 这样的版本号；任一段不是纯数字即判定非法。
bool parseVersion(const std::string& text, std::vector<long>* parts) {
    parts->clear();
    if (text.empty()) {
        return false;
    }
    size_t begin = 0;
    while (begin <= text.size()) {
        const size_t dot = text.find('.', begin);
        const std::string piece =
            text.substr(begin, dot == std::string::npos ? std::string::npos : dot - begin);
        if (piece.empty() ||
            !std::all_of(piece.begin(), piece.end(), [](char c) { return c >= '0' && c <= '9'; })) {
            return false;
        }
        parts->push_back(std::strtol(piece.c_str(), nullptr, 10));
        if (dot == std::string::npos) {
            break;
        }
        begin = dot + 1;
    }
    return true;
}

// 工具名 → 显式覆盖字段。
std::string buildToolOverride(const ToolchainConfig& toolchain, const std::string& toolName) {
    if (toolName == "zipalign") {
        return toolchain.zipalign;
    }
    if (toolName == "apksigner") {
        return toolchain.apksigner;
    }
    if (toolName == "aapt") {
        return toolchain.aapt;
    }
    return std::string();
}

std::optional<std::vector<std::string>> jarCommand(const ToolchainConfig& toolchain,
                                                   const std::string& rawValue) {
    const std::string jar = resolveApkEditorJar(rawValue);
    if (jar.empty()) {
        return std::nullopt;
    }
    return std::vector<std::string>{toolchain.java, "-jar", jar};
}

}  // namespace

std::optional<std::vector<std::string>> resolveFirst(const std::vector<ResolverStep>& steps,
                                                     std::string* source) {
    for (const ResolverStep& step : steps) {
        if (!step.resolve) {
            continue;
        }
        std::optional<std::vector<std::string>> command = step.resolve();
        if (command.has_value() && !command->empty()) {
            if (source != nullptr) {
                *source = step.name;
            }
            return command;
        }
        LOGD("resolver step '%s' yielded nothing", step.name.c_str());
    }
    return std::nullopt;
}

std::string resolveApkEditorJar(const std::string& rawValue) {
    if (rawValue.empty()) {
        return std::string();
    }
    // 支持 ~ 前缀。
    std::string candidate = rawValue;
    if (candidate[0] == '~') {
        const std::string home = base::file::homeDirectory();
        if (!home.empty()) {
            candidate = home + candidate.substr(1);
        }
    }
    if (base::file::fileExists(candidate)) {
        return candidate;
    }
    if (base::file::directoryExists(candidate)) {
        const std::string jar = base::file::joinPath(candidate, kApkEditorJarName);
        if (base::file::fileExists(jar)) {
            return jar;
        }
    }
    return std::string();
}

std::vector<ResolverStep> apkEditorResolverSteps(const ToolchainConfig& toolchain) {
    std::vector<ResolverStep> steps;
    // 1) 调用方显式覆盖。
    steps.push_back({"override", [toolchain]() { return jarCommand(toolchain, toolchain.apkeditorJar); }});
    // 2) 环境变量。
    steps.push_back({"env:" + toolchain.apkeditorEnvVar, [toolchain]() {
                         return jarCommand(toolchain, envValue(toolchain.apkeditorEnvVar));
                     }});
    // 3) 用户配置文件（只读）。
    steps.push_back({"config:" + toolchain.apkeditorConfigKey,
                     [toolchain]() -> std::optional<std::vector<std::string>> {
                         if (toolchain.userConfigPath.empty()) {
                             return std::nullopt;
                         }
                         const config::UserConfig userConfig =
                             config::UserConfig::load(toolchain.userConfigPath);
                         const std::optional<std::string> value =
                             userConfig.getString(toolchain.apkeditorConfigKey);
                         if (!value.has_value()) {
                             return std::nullopt;
                         }
                         return jarCommand(toolchain, *value);
                     }});
    // 4) PATH 中的包装脚本。
    steps.push_back({"path:" + toolchain.apkeditorWrapper,
                     [toolchain]() -> std::optional<std::vector<std::string>> {
                         const std::string wrapper = process::findOnPath(toolchain.apkeditorWrapper);
                         if (wrapper.empty()) {
                             return std::nullopt;
                         }
                         return std::vector<std::string>{wrapper};
                     }});
    return steps;
}

bool resolveApkEditorCommand(const ToolchainConfig& toolchain,
                             std::vector<std::string>* command,
                             std::string* source,
                             PipelineError* error) {
    std::string winner;
    std::optional<std::vector<std::string>> resolved =
        resolveFirst(apkEditorResolverSteps(toolchain), &winner);
    if (!resolved.has_value()) {
        return setError(error, ErrorKind::kConfig, ErrorReason::kPrecondition, "merge",
                        "APKEditor command could not be resolved. Set " + toolchain.apkeditorEnvVar +
                            ", configure " + toolchain.apkeditorConfigKey + " in " +
                            (toolchain.userConfigPath.empty() ? std::string("the user config")
                                                              : toolchain.userConfigPath) +
                            ", or add an " + toolchain.apkeditorWrapper + " wrapper to PATH",
                        std::string(), "APKEditor");
    }
    LOGD("APKEditor resolved via %s: %s", winner.c_str(),
         process::formatCommandLine(*resolved).c_str());
    if (command != nullptr) {
        *command = *resolved;
    }
    if (source != nullptr) {
        *source = winner;
    }
    return true;
}

std::optional<int> compareVersions(const std::string& a, const std::string& b) {
    std::vector<long> left;
    std::vector<long> right;
    if (!parseVersion(a, &left) || !parseVersion(b, &right)) {
        return std::nullopt;
    }
    // 按段比较，缺失段视为 0（30.0 == 30.0.0）。
    const size_t count = std::max(left.size(), right.size());
    for (size_t i = 0; i < count; ++i) {
        const long l = i < left.size() ? left[i] : 0;
        const long r = i < right.size() ? right[i] : 0;
        if (l != r) {
            return l < r ? -1 : 1;
        }
    }
    return 0;
}

std::string findAndroidSdkRoot(const ToolchainConfig& toolchain) {
    if (!toolchain.androidHome.empty()) {
        // 显式覆盖不回退：指错了就是配置问题。
        return base::file::directoryExists(toolchain.androidHome) ? toolchain.androidHome
                                                                   : std::string();
    }
    for (const char* name : {"ANDROID_HOME", "ANDROID_SDK_ROOT"}) {
        const std::string value = envValue(name);
        if (!value.empty() && base::file::directoryExists(value)) {
            return value;
        }
    }
    std::vector<std::string> candidates;
    const std::string home = base::file::homeDirectory();
    if (!home.empty()) {
        candidates.push_back(base::file::joinPath(home, "Android/Sdk"));
        candidates.push_back(base::file::joinPath(home, "android-sdk"));
    }
    candidates.emplace_back("/opt/android-sdk");
    for (const std::string& candidate : candidates) {
        if (base::file::directoryExists(candidate)) {
            return candidate;
        }
    }
    return std::string();
}

std::string findLatestBuildTools(const std::string& sdkRoot, const std::string& minVersion) {
    if (sdkRoot.empty()) {
        return std::string();
    }
    const std::string buildToolsDir = base::file::joinPath(sdkRoot, "build-tools");
    std::error_code ec;
    if (!fs::is_directory(buildToolsDir, ec)) {
        return std::string();
    }
    std::string bestName;
    std::string bestPath;
    for (fs::directory_iterator it(buildToolsDir, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code typeEc;
        if (!it->is_directory(typeEc)) {
            continue;
        }
        const std::string name = it->path().filename().string();
        // 非版本目录（如 "preview"）直接跳过。
        const std::optional<int> vsMin = compareVersions(name, minVersion);
        if (!vsMin.has_value() || *vsMin < 0) {
            continue;
        }
        if (bestName.empty() || compareVersions(name, bestName).value_or(0) > 0) {
            bestName = name;
            bestPath = it->path().string();
        }
    }
    return bestPath;
}

bool resolveBuildTool(const ToolchainConfig& toolchain,
                      const std::string& toolName,
                      std::string* path,
                      PipelineError* error) {
    std::vector<ResolverStep> steps;
    steps.push_back({"override", [&]() -> std::optional<std::vector<std::string>> {
                         const std::string value = buildToolOverride(toolchain, toolName);
                         if (value.empty()) {
                             return std::nullopt;
                         }
                         return std::vector<std::string>{value};
                     }});
    steps.push_back({"sdk", [&]() -> std::optional<std::vector<std::string>> {
                         const std::string buildTools = findLatestBuildTools(
                             findAndroidSdkRoot(toolchain), toolchain.minBuildToolsVersion);
                         if (buildTools.empty()) {
                             return std::nullopt;
                         }
                         const std::string candidate = base::file::joinPath(buildTools, toolName);
                         if (!base::file::fileExists(candidate)) {
                             return std::nullopt;
                         }
                         return std::vector<std::string>{candidate};
                     }});
    steps.push_back({"path", [&]() -> std::optional<std::vector<std::string>> {
                         const std::string found = process::findOnPath(toolName);
                         if (found.empty()) {
                             return std::nullopt;
                         }
                         return std::vector<std::string>{found};
                     }});

    std::string winner;
    std::optional<std::vector<std::string>> resolved = resolveFirst(steps, &winner);
    if (!resolved.has_value()) {
        return setError(error, ErrorKind::kConfig, ErrorReason::kPrecondition, "resolve",
                        toolName + " not found: set ANDROID_HOME to an SDK with build-tools >= " +
                            toolchain.minBuildToolsVersion + " or add it to PATH",
                        std::string(), toolName);
    }
    LOGD("%s resolved via %s: %s", toolName.c_str(), winner.c_str(), resolved->front().c_str());
    if (path != nullptr) {
        *path = resolved->front();
    }
    return true;
}

}  // namespace apkc
