/*
 * [APKCHAIN_FLOW_NOTE] 文件级流程注释
 * - 插桩复合流程：框架校验 → reflutter 插桩 → 反解 + Build-Align-Sign 重签 → 卸载旧包 → 安装
 *   → 拉起应用（自动或人工）→ 运行时 dump。
 * - 致命失败：校验（ValidationError/FrameworkMismatchError）、插桩与重签（InstrumentError）、
 *   安装（InstallError）。
 * - 非致命：卸载失败被忽略；自动拉起失败回退到人工等待；dump 失败只记录到 dumpError，
 *   流程仍返回成功且不回滚安装。
 * - 人工等待没有超时，只能通过中断整个进程取消。
 */
#pragma once

#include <string>

#include "zPipelineError.h"
#include "zPipelineTypes.h"

namespace apkc {

// 默认人工等待：打印提示并阻塞读取一行标准输入。
void defaultUserPrompt(const std::string& message);

// 重签后 APK 默认文件名：<package>-reflutter-signed.apk。
std::string instrumentedOutputName(const std::string& packageName);

bool runInstrumentation(const InstrumentOptions& options,
                        const ToolchainConfig& toolchain,
                        InstrumentResult* result,
                        PipelineError* error);

}  // namespace apkc
