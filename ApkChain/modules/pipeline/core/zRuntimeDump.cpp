#include "zRuntimeDump.h"

#include <memory>

#include <json/reader.h>
#include <json/writer.h>

#include "zFile.h"
#include "zLog.h"
#include "zStageRunner.h"

namespace apkc {

namespace {

constexpr const char* kPackagePlaceholder = "{package}";

bool isBlank(const std::string& text) {
    return text.find_first_not_of(" \t\r\n") == std::string::npos;
}

// 执行一条 adb 命令；启动失败/超时为传输错误，非零退出交给调用方决定。
bool runAdb(const std::vector<std::string>& argv,
            const ToolchainConfig& toolchain,
            const std::string& stage,
            process::ToolResult* result,
            PipelineError* error) {
    process::ToolInvocation invocation = makeInvocation(argv, toolchain);
    invocation.checkExit = false;
    LOGD("[%s] %s", stage.c_str(), process::formatCommandLine(argv).c_str());
    *result = process::runTool(invocation);
    return interpretToolResult(*result, invocation, stage, "adb", error);
}

}  // namespace

std::vector<std::string> buildAdbCommand(const ToolchainConfig& toolchain,
                                         const std::string& deviceSerial,
                                         const std::vector<std::string>& args) {
    std::vector<std::string> argv{toolchain.adb};
    if (!deviceSerial.empty()) {
        argv.push_back("-s");
        argv.push_back(deviceSerial);
    }
    argv.insert(argv.end(), args.begin(), args.end());
    return argv;
}

std::string expandRemotePath(const std::string& pathTemplate, const std::string& packageName) {
    std::string path = pathTemplate;
    const std::string placeholder = kPackagePlaceholder;
    size_t pos = 0;
    while ((pos = path.find(placeholder, pos)) != std::string::npos) {
        path.replace(pos, placeholder.size(), packageName);
        pos += packageName.size();
    }
    return path;
}

std::string defaultDumpPath(const std::string& outputDir, const std::string& packageName) {
    const std::string dir = outputDir.empty() ? base::file::currentDirectory() : outputDir;
    return base::file::joinPath(dir, packageName + "_dump.dart");
}

bool writeFormattedJson(const std::string& text, const std::string& jsonPath) {
    Json::CharReaderBuilder readerBuilder;
    // 合法 JSON 之后还有尾随文本时视为非 JSON。
    readerBuilder["failIfExtra"] = true;
    std::unique_ptr<Json::CharReader> reader(readerBuilder.newCharReader());
    Json::Value root;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
        LOGD("dump is not JSON: %s", errors.c_str());
        return false;
    }
    Json::StreamWriterBuilder writerBuilder;
    writerBuilder["indentation"] = "  ";
    const std::string formatted = Json::writeString(writerBuilder, root) + "\n";
    if (!base::file::writeFileText(jsonPath, formatted)) {
        LOGW("failed to write formatted dump: %s", jsonPath.c_str());
        return false;
    }
    return true;
}

bool dumpRuntimeData(const DumpOptions& options,
                     const ToolchainConfig& toolchain,
                     DumpResult* result,
                     PipelineError* error) {
    if (options.packageName.empty()) {
        return setError(error, ErrorKind::kDump, ErrorReason::kPrecondition, "dump",
                        "package name is empty");
    }
    DumpResult local;
    local.packageName = options.packageName;
    local.dumpPath = options.outputPath.empty()
                         ? defaultDumpPath(options.outputDir, options.packageName)
                         : base::file::absolutePath(options.outputPath);

    // 1) root 检查。
    if (options.checkRoot) {
        process::ToolResult rootResult;
        const std::vector<std::string> argv =
            buildAdbCommand(toolchain, options.deviceSerial, {"shell", "su", "-c", "id"});
        if (!runAdb(argv, toolchain, "root-check", &rootResult, error)) {
            return false;
        }
        if (rootResult.exitCode != 0) {
            return setError(error, ErrorKind::kDump, ErrorReason::kPrecondition, "root-check",
                            "root access required for dump: ensure the device is rooted and "
                            "'su' is available (exit " +
                                std::to_string(rootResult.exitCode) + ")",
                            std::string(), "adb");
        }
    }

    // 2) 读取远端文件。
    const std::string remotePath = expandRemotePath(options.remotePathTemplate, options.packageName);
    process::ToolResult catResult;
    const std::vector<std::string> catArgv =
        buildAdbCommand(toolchain, options.deviceSerial, {"shell", "su", "-c", "cat " + remotePath});
    if (!runAdb(catArgv, toolchain, "dump", &catResult, error)) {
        return false;
    }
    if (catResult.exitCode != 0) {
        const std::string detail =
            catResult.stderrText.empty() ? catResult.stdoutText : catResult.stderrText;
        setError(error, ErrorKind::kToolExecution, ErrorReason::kNonZeroExit, "dump",
                 "failed to read " + remotePath + ": " + detail, remotePath, "adb");
        if (error != nullptr) {
            error->exitCode = catResult.exitCode;
        }
        return false;
    }
    if (isBlank(catResult.stdoutText)) {
        return setError(error, ErrorKind::kDump, ErrorReason::kEmptyContent, "dump",
                        "dump file is empty: ensure the app has been started at least once "
                        "after installation",
                        remotePath, "adb");
    }

    // 3) 原始内容落盘。
    if (!base::file::writeFileText(local.dumpPath, catResult.stdoutText)) {
        return setError(error, ErrorKind::kDump, ErrorReason::kIo, "dump",
                        "failed to write dump file", local.dumpPath);
    }
    local.bytes = catResult.stdoutText.size();
    local.success = true;
    LOGI("dump written: %s (%zu bytes)", local.dumpPath.c_str(), local.bytes);

    // 4) 可选 JSON 格式化副本。
    if (options.formatJson) {
        const std::string jsonPath = base::file::replaceExtension(local.dumpPath, ".json");
        if (writeFormattedJson(catResult.stdoutText, jsonPath)) {
            local.formattedPath = jsonPath;
            LOGI("formatted dump written: %s", jsonPath.c_str());
        }
    }

    if (result != nullptr) {
        *result = local;
    }
    return true;
}

}  // namespace apkc
