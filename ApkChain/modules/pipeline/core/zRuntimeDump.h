/*
 * [APKCHAIN_FLOW_NOTE] 文件级流程注释
 * - 运行时 dump：从已插桩并启动过的应用私有目录读出注入代码写下的 dump 文件。
 * - 顺序：（可选）root 检查 → adb shell su -c "cat <remote>" → 写原始文件 →（可选）JSON 格式化副本。
 * - 失败分类：
 *   1) 无 root：DumpError + kPrecondition；
 *   2) adb 找不到/超时/传输失败：ToolExecutionError；
 *   3) 读到空内容（应用从未启动）：DumpError + kEmptyContent。
 * - JSON 解析失败不算错误，原始文件始终是权威产物。
 */
#pragma once

#include <string>
#include <vector>

#include "zPipelineError.h"
#include "zPipelineTypes.h"

namespace apkc {

// adb 命令前缀：adb [-s serial] <args...>。
std::vector<std::string> buildAdbCommand(const ToolchainConfig& toolchain,
                                         const std::string& deviceSerial,
                                         const std::vector<std::string>& args);

// 用包名展开远端路径模板中的 {package}。
std::string expandRemotePath(const std::string& pathTemplate, const std::string& packageName);

// 默认本地 dump 路径：<outputDir|cwd>/<package>_dump.dart。
std::string defaultDumpPath(const std::string& outputDir, const std::string& packageName);

// 尝试把 text 解析为 JSON 并以缩进格式写到 jsonPath；解析失败返回 false 且不写文件。
bool writeFormattedJson(const std::string& text, const std::string& jsonPath);

// 执行 dump。
bool dumpRuntimeData(const DumpOptions& options,
                     const ToolchainConfig& toolchain,
                     DumpResult* result,
                     PipelineError* error);

}  // namespace apkc
