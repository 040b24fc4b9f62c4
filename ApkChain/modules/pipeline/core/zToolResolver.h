/*
 * [APKCHAIN_FLOW_NOTE] 文件级流程注释
 * - 外部工具定位：把“工具名”解析成可直接执行的命令前缀。
 * - 解析链是有序步骤表，首个给出非空结果的步骤胜出：
 *   1) APKEditor：显式覆盖 → 环境变量 APKEDITOR_JAR → 用户配置 apkeditor_path → PATH 包装脚本；
 *   2) SDK build-tools（zipalign/apksigner/aapt）：显式覆盖 → 最新 build-tools（>= 最低版本）→ PATH。
 * - 全部步骤落空时返回 kConfig，与运行期失败区分。
 */
#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "zPipelineError.h"
#include "zPipelineTypes.h"

namespace apkc {

// 解析链中的一步。
struct ResolverStep {
    // 步骤名（日志与结果来源说明）。
    std::string name;
    // 返回命令前缀；无法解析时返回 std::nullopt。
    std::function<std::optional<std::vector<std::string>>()> resolve;
};

// 顺序执行解析链，返回首个非空结果；source 回填胜出步骤名。
std::optional<std::vector<std::string>> resolveFirst(const std::vector<ResolverStep>& steps,
                                                     std::string* source);

// 把 jar 配置值解析为 jar 文件：值本身是文件，或是包含 APKEditor.jar 的目录。
// 无法解析时返回空串。
std::string resolveApkEditorJar(const std::string& rawValue);

// APKEditor 解析链（按优先级排好）。
std::vector<ResolverStep> apkEditorResolverSteps(const ToolchainConfig& toolchain);

// 解析 APKEditor 命令前缀（如 {"java", "-jar", "/x/APKEditor.jar"}）。
bool resolveApkEditorCommand(const ToolchainConfig& toolchain,
                             std::vector<std::string>* command,
                             std::string* source,
                             PipelineError* error);

// 比较点分数字版本；非法版本返回 std::nullopt。
// 返回值 <0 / 0 / >0 分别表示 a<b / a==b / a>b。
std::optional<int> compareVersions(const std::string& a, const std::string& b);

// 定位 Android SDK 根目录：显式覆盖 → ANDROID_HOME → ANDROID_SDK_ROOT → 常见安装位置。
// 找不到返回空串。
std::string findAndroidSdkRoot(const ToolchainConfig& toolchain);

// 返回版本号不低于 minVersion 的最新 build-tools 目录；找不到返回空串。
std::string findLatestBuildTools(const std::string& sdkRoot, const std::string& minVersion);

// 解析 SDK build-tools 中的工具（zipalign / apksigner / aapt）。
bool resolveBuildTool(const ToolchainConfig& toolchain,
                      const std::string& toolName,
                      std::string* path,
                      PipelineError* error);

}  // namespace apkc
