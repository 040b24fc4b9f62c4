// 防止头文件重复包含。
#pragma once

// 引入固定宽度整数。
#include <cstdint>
// 引入字符串类型。
#include <string>

// 引入 pipeline 类型定义。
#include "zPipelineTypes.h"

// 进入 pipeline 命名空间。
namespace apkc {

// 子命令。
enum class CliCommand {
    kNone = 0,
    kBuild,
    kDecompile,
    kMerge,
    kInstrument,
    kDump,
    kAnalyze,
};

// 命令行解析结果。
struct CliOptions {
    // 子命令。
    CliCommand command = CliCommand::kNone;
    // 位置参数（目录 / APK / 包名）。
    std::string target;
    // -o 输出路径。
    std::string output;
    // -d 设备序列号。
    std::string deviceSerial;
    // --package 包名。
    std::string packageName;

    // build 选项。
    bool noAlign = false;
    bool noSign = false;
    bool verify = false;
    std::string keystore;
    std::string keyAlias;
    std::string storePass;
    std::string keyPass;

    // decompile 选项。
    bool noJava = false;
    bool noSmali = false;

    // instrument / dump 选项。
    bool force = false;
    bool skipDump = false;
    bool waitForUser = false;
    bool noRootCheck = false;
    bool noFormat = false;

    // analyze 选项。
    bool noNativeLibs = false;

    // 全局选项。
    bool timeoutSet = false;
    uint32_t timeoutSeconds = 0;
    std::string configPath;
    std::string tempDir;
    bool verbose = false;
    bool json = false;
    bool showHelp = false;
};

// 子命令名 → 枚举；未知名返回 kNone。
CliCommand parseCommandName(const std::string& name);
// 枚举 → 子命令名。
const char* commandName(CliCommand command);
// 解析命令行。
bool parseCommandLine(int argc, char* argv[], CliOptions& cli, std::string& error);
// 打印命令行帮助。
void printUsage();
// 组装工具链配置：默认值 → 用户配置文件 → 命令行覆盖。
void buildToolchainConfig(const CliOptions& cli, ToolchainConfig& toolchain);

// 结束命名空间。
}  // namespace apkc
