/*
 * [APKCHAIN_FLOW_NOTE] 文件级流程注释
 * - 跨平台框架识别：读取 APK 中央目录条目名，与各框架特征路径比对。
 * - 特征以 '/' 结尾时按前缀匹配（目录特征），否则精确匹配。
 * - 输出按框架名排序，证据列表排序去重；可选附带全部 .so 条目。
 */
#pragma once

#include <string>
#include <utility>
#include <vector>

#include "zPipelineError.h"

namespace apkc {

// 单个框架的特征表。
struct FrameworkSignature {
    std::string name;
    std::vector<std::string> paths;
};

// 单个框架命中结果。
struct FrameworkMatch {
    std::string name;
    // 命中的特征路径（排序去重）。
    std::vector<std::string> matchedFiles;
};

// 检测报告。
struct FrameworkReport {
    std::string apkPath;
    // 按框架名排序。
    std::vector<FrameworkMatch> frameworks;
    // 全部 .so 条目（排序）；未请求时为空。
    std::vector<std::string> nativeLibraries;

    bool hasFramework(const std::string& name) const;
    // 逗号分隔的框架名；为空时返回 "None"。
    std::string frameworkNames() const;
};

// 内置框架特征表。
const std::vector<FrameworkSignature>& builtinFrameworkSignatures();

// 对条目名列表做匹配（纯函数，便于测试）。
std::vector<FrameworkMatch> matchFrameworks(const std::vector<std::string>& entryNames,
                                            const std::vector<FrameworkSignature>& signatures);

// 收集 .so 条目（排序）。
std::vector<std::string> collectNativeLibraries(const std::vector<std::string>& entryNames);

// 检测 APK：路径校验（存在/普通文件/.apk）→ 读取中央目录 → 匹配。
// 非法或无法读取的归档返回 kValidation。
bool detectFrameworks(const std::string& apkPath,
                      bool includeNativeLibs,
                      FrameworkReport* report,
                      PipelineError* error);

}  // namespace apkc
