/*
 * [APKCHAIN_FLOW_NOTE] 文件级流程注释
 * - ApkChain CLI 主入口：解析参数、组装工具链配置、分发到各流水线。
 * - 输入：子命令 + 目标路径/包名 + 选项。
 * - 输出：流水线产物；--json 时在标准输出打印结果对象。
 * - 退出码：成功 0，任何失败 1（失败时先输出 describe()）。
 */

// 错误输出流。
#include <iostream>
// std::string。
#include <string>

// Build-Align-Sign 流水线。
#include "zBuildAlignSign.h"
// 反编译流水线。
#include "zDecompile.h"
// 框架检测。
#include "zFrameworkDetect.h"
// 插桩复合流程。
#include "zInstrument.h"
// 日志。
#include "zLog.h"
// CLI 解析与 usage。
#include "zPipelineCli.h"
// 结果渲染。
#include "zPipelineReport.h"
// 配置结构与结果类型。
#include "zPipelineTypes.h"
// 运行时 dump。
#include "zRuntimeDump.h"
// split 合并流水线。
#include "zSplitMerge.h"

namespace apkc {

namespace {

// 根据 --verbose / --json 调整日志阈值。
void configureLogging(const CliOptions& cli) {
    if (cli.json) {
        // --verbose 在 JSON 模式下不生效。
        zLogSetLevel(LOG_LEVEL_JSON_OUTPUT);
        return;
    }
    if (cli.verbose) {
        zLogSetLevel(LOG_LEVEL_DEBUG);
    }
}

// 统一输出：成功时打印结果，失败时打印错误。
template <typename Result>
int finishCommand(const CliOptions& cli, bool ok, const Result& result, const PipelineError& error) {
    if (!ok) {
        LOGE("%s", error.describe().c_str());
        if (cli.json) {
            Json::Value root(Json::objectValue);
            root["success"] = false;
            root["error"] = toJson(error);
            std::cout << renderJson(root) << std::endl;
        }
        return 1;
    }
    if (cli.json) {
        Json::Value root = toJson(result);
        root["success"] = true;
        std::cout << renderJson(root) << std::endl;
    } else {
        printSummary(result);
    }
    return 0;
}

int runBuildCommand(const CliOptions& cli, const ToolchainConfig& toolchain) {
    BuildOptions options;
    options.align = !cli.noAlign;
    options.sign = !cli.noSign;
    options.verify = cli.verify;
    if (!cli.keystore.empty()) {
        SigningIdentity identity;
        identity.keystorePath = cli.keystore;
        identity.alias = cli.keyAlias;
        identity.storePass = cli.storePass;
        identity.keyPass = cli.keyPass.empty() ? cli.storePass : cli.keyPass;
        options.identity = identity;
    }
    BuildResult result;
    PipelineError error;
    const bool ok = runBuildAlignSign(cli.target, cli.output, options, toolchain, &result, &error);
    return finishCommand(cli, ok, result, error);
}

int runDecompileCommand(const CliOptions& cli, const ToolchainConfig& toolchain) {
    DecompileOptions options;
    options.java = !cli.noJava;
    options.smali = !cli.noSmali;
    options.outputDir = cli.output;
    DecompileResult result;
    PipelineError error;
    const bool ok = runDecompile(cli.target, options, toolchain, &result, &error);
    return finishCommand(cli, ok, result, error);
}

int runMergeCommand(const CliOptions& cli, const ToolchainConfig& toolchain) {
    MergeResult result;
    PipelineError error;
    const bool ok = runSplitMerge(cli.target, cli.output, toolchain, &result, &error);
    return finishCommand(cli, ok, result, error);
}

int runInstrumentCommand(const CliOptions& cli, const ToolchainConfig& toolchain) {
    InstrumentOptions options;
    options.apkPath = cli.target;
    options.packageName = cli.packageName;
    options.outputDir = cli.output;
    options.deviceSerial = cli.deviceSerial;
    options.force = cli.force;
    options.skipDump = cli.skipDump;
    options.waitForUser = cli.waitForUser;
    options.checkRoot = !cli.noRootCheck;
    options.formatJson = !cli.noFormat;
    // JSON 模式下提示写到 stderr，保持 stdout 干净。
    if (cli.json) {
        options.prompt = [](const std::string& message) {
            std::cerr << "\n" << message << "\nPress Enter when the app has started..." << std::flush;
            std::string line;
            std::getline(std::cin, line);
        };
    }
    InstrumentResult result;
    PipelineError error;
    const bool ok = runInstrumentation(options, toolchain, &result, &error);
    return finishCommand(cli, ok, result, error);
}

int runDumpCommand(const CliOptions& cli, const ToolchainConfig& toolchain) {
    DumpOptions options;
    options.packageName = cli.target;
    options.outputPath = cli.output;
    options.deviceSerial = cli.deviceSerial;
    options.checkRoot = !cli.noRootCheck;
    options.formatJson = !cli.noFormat;
    DumpResult result;
    PipelineError error;
    const bool ok = dumpRuntimeData(options, toolchain, &result, &error);
    return finishCommand(cli, ok, result, error);
}

int runAnalyzeCommand(const CliOptions& cli) {
    FrameworkReport report;
    PipelineError error;
    const bool ok = detectFrameworks(cli.target, !cli.noNativeLibs, &report, &error);
    return finishCommand(cli, ok, report, error);
}

}  // namespace

}  // namespace apkc

// 程序主入口。
int main(int argc, char* argv[]) {
    // 命令行解析结果。
    apkc::CliOptions cli;
    // CLI 解析错误文本。
    std::string cliError;
    if (!apkc::parseCommandLine(argc, argv, cli, cliError)) {
        std::cerr << cliError << "\n";
        apkc::printUsage();
        return 1;
    }
    // --help 直接打印并退出。
    if (cli.showHelp) {
        apkc::printUsage();
        return 0;
    }
    apkc::configureLogging(cli);

    // 默认值 → 用户配置 → 命令行覆盖。
    apkc::ToolchainConfig toolchain;
    apkc::buildToolchainConfig(cli, toolchain);

    switch (cli.command) {
        case apkc::CliCommand::kBuild:
            return apkc::runBuildCommand(cli, toolchain);
        case apkc::CliCommand::kDecompile:
            return apkc::runDecompileCommand(cli, toolchain);
        case apkc::CliCommand::kMerge:
            return apkc::runMergeCommand(cli, toolchain);
        case apkc::CliCommand::kInstrument:
            return apkc::runInstrumentCommand(cli, toolchain);
        case apkc::CliCommand::kDump:
            return apkc::runDumpCommand(cli, toolchain);
        case apkc::CliCommand::kAnalyze:
            return apkc::runAnalyzeCommand(cli);
        case apkc::CliCommand::kNone:
            break;
    }
    apkc::printUsage();
    return 1;
}
