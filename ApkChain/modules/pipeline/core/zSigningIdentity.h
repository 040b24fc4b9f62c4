/*
 * [APKCHAIN_FLOW_NOTE] 文件级流程注释
 * - 调试签名身份的惰性供给：<keystoreDir>/debug.keystore 不存在时调用 keytool 生成。
 * - 幂等：已存在的密钥库直接复用，不会被改写。
 * - 并发：检查与生成在 <keystoreDir>/debug.keystore.lock 的排他 flock 内完成，
 *   同进程多线程与多进程都只会有一个生成者。
 * - 失败统一归类为 kSign（原因保留）。
 */
#pragma once

#include <string>
#include <vector>

#include "zPipelineError.h"
#include "zPipelineTypes.h"

namespace apkc {

// 调试密钥库完整路径。
std::string debugKeystorePath(const DebugIdentityDefaults& defaults, const ToolchainConfig& toolchain);

// keytool 生成命令（便于日志与测试核对）。
std::vector<std::string> buildKeytoolCommand(const DebugIdentityDefaults& defaults,
                                             const ToolchainConfig& toolchain,
                                             const std::string& keystorePath);

// 确保调试身份可用；generated 回填本次调用是否真正生成了密钥库。
bool ensureDebugIdentity(const DebugIdentityDefaults& defaults,
                         const ToolchainConfig& toolchain,
                         SigningIdentity* identity,
                         bool* generated,
                         PipelineError* error);

// 校验调用方提供的签名身份（密钥库存在且别名非空）。
bool validateSigningIdentity(const SigningIdentity& identity, PipelineError* error);

}  // namespace apkc
