#pragma once

#include <string>

#include "zPipelineError.h"
#include "zPipelineTypes.h"

namespace apkc {

// 从 "aapt dump badging" 输出中提取 package: name='...'；找不到返回空串。
std::string parseBadgingPackageName(const std::string& badgingOutput);

// 文件名启发式：去掉版本后缀与 _merged/-signed 等标记，必要时把 '_' 换成 '.'。
std::string packageNameFromFileName(const std::string& apkPath);

// 解析包名：aapt（可用时）→ 文件名启发式；结果不含 '.' 时返回 kValidation。
bool resolvePackageName(const std::string& apkPath,
                        const ToolchainConfig& toolchain,
                        std::string* packageName,
                        PipelineError* error);

}  // namespace apkc
