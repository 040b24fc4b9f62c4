// 引入结果渲染声明。
#include "zPipelineReport.h"

// 引入控制台输出。
#include <iostream>

// jsoncpp 写出器。
#include <json/writer.h>

// 进入 pipeline 命名空间。
namespace apkc {

// 内部辅助命名空间，仅当前编译单元可见。
namespace {

// 空串输出为 null，便于脚本区分“未产出”。
Json::Value pathOrNull(const std::string& path) {
    return path.empty() ? Json::Value(Json::nullValue) : Json::Value(path);
}

Json::Value stringArray(const std::vector<std::string>& values) {
    Json::Value array(Json::arrayValue);
    for (const std::string& value : values) {
        array.append(value);
    }
    return array;
}

Json::Value stagesToJson(const std::vector<StageRecord>& stages) {
    Json::Value array(Json::arrayValue);
    for (const StageRecord& stage : stages) {
        Json::Value item(Json::objectValue);
        item["name"] = stage.name;
        item["ran"] = stage.ran;
        item["succeeded"] = stage.succeeded;
        item["artifact"] = pathOrNull(stage.artifact);
        if (!stage.message.empty()) {
            item["message"] = stage.message;
        }
        array.append(item);
    }
    return array;
}

const char* yesNo(bool value) {
    return value ? "yes" : "no";
}

// 结束匿名命名空间。
}  // namespace

Json::Value toJson(const BuildResult& result) {
    Json::Value root(Json::objectValue);
    root["source_dir"] = result.sourceDir;
    root["output_path"] = result.outputPath;
    root["aligned"] = result.alignRan;
    root["signed"] = result.signRan;
    root["keystore_generated"] = result.keystoreGenerated;
    root["keystore"] = pathOrNull(result.keystorePath);
    root["verification"] = verificationName(result.verification);
    root["stages"] = stagesToJson(result.stages);
    return root;
}

Json::Value toJson(const DecompileResult& result) {
    Json::Value root(Json::objectValue);
    root["apk_path"] = result.apkPath;
    root["output_dir"] = result.outputDir;
    root["java_dir"] = pathOrNull(result.javaDir);
    root["smali_dir"] = pathOrNull(result.smaliDir);
    root["java_success"] = result.javaSuccess;
    root["smali_success"] = result.smaliSuccess;
    if (!result.javaError.empty()) {
        root["java_error"] = result.javaError;
    }
    if (!result.smaliError.empty()) {
        root["smali_error"] = result.smaliError;
    }
    return root;
}

Json::Value toJson(const MergeResult& result) {
    Json::Value root(Json::objectValue);
    root["split_dir"] = result.splitDir;
    root["output_path"] = result.outputPath;
    root["base"] = pathOrNull(result.artifacts.base);
    root["splits"] = stringArray(result.artifacts.splits);
    root["tool_command"] = stringArray(result.toolCommand);
    root["replaced_existing"] = result.replacedExisting;
    return root;
}

Json::Value toJson(const DumpResult& result) {
    Json::Value root(Json::objectValue);
    root["package_name"] = result.packageName;
    root["dump_path"] = pathOrNull(result.dumpPath);
    root["formatted_path"] = pathOrNull(result.formattedPath);
    root["success"] = result.success;
    root["auto_started"] = result.autoStarted;
    root["bytes"] = static_cast<Json::UInt64>(result.bytes);
    return root;
}

Json::Value toJson(const InstrumentResult& result) {
    Json::Value root(Json::objectValue);
    root["package_name"] = result.packageName;
    root["original_apk"] = result.originalApk;
    root["signed_apk"] = pathOrNull(result.signedApk);
    root["installed"] = result.installed;
    root["auto_started"] = result.autoStarted;
    root["dump_attempted"] = result.dumpAttempted;
    root["dump"] = result.dump.has_value() ? toJson(*result.dump) : Json::Value(Json::nullValue);
    if (!result.dumpError.empty()) {
        root["dump_error"] = result.dumpError;
    }
    root["signing"] = toJson(result.signing);
    root["stages"] = stagesToJson(result.stages);
    return root;
}

Json::Value toJson(const FrameworkReport& report) {
    Json::Value root(Json::objectValue);
    root["apk_path"] = report.apkPath;
    Json::Value frameworks(Json::arrayValue);
    for (const FrameworkMatch& match : report.frameworks) {
        Json::Value item(Json::objectValue);
        item["name"] = match.name;
        item["matched_files"] = stringArray(match.matchedFiles);
        frameworks.append(item);
    }
    root["detected_frameworks"] = frameworks;
    root["native_libraries"] = stringArray(report.nativeLibraries);
    return root;
}

Json::Value toJson(const PipelineError& error) {
    Json::Value root(Json::objectValue);
    root["kind"] = errorKindName(error.kind);
    root["reason"] = errorReasonName(error.reason);
    root["stage"] = error.stage;
    root["tool"] = pathOrNull(error.tool);
    root["artifact"] = pathOrNull(error.artifact);
    if (error.reason == ErrorReason::kNonZeroExit) {
        root["exit_code"] = error.exitCode;
    }
    root["message"] = error.message;
    return root;
}

std::string renderJson(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    return Json::writeString(builder, value);
}

void printSummary(const BuildResult& result) {
    std::cout << "Output:       " << result.outputPath << "\n"
              << "Aligned:      " << yesNo(result.alignRan) << "\n"
              << "Signed:       " << yesNo(result.signRan) << "\n";
    if (result.signRan) {
        std::cout << "Keystore:     " << result.keystorePath
                  << (result.keystoreGenerated ? " (generated)" : "") << "\n";
    }
    std::cout << "Verification: " << verificationName(result.verification) << "\n";
}

void printSummary(const DecompileResult& result) {
    std::cout << "Output:       " << result.outputDir << "\n";
    if (result.javaRequested) {
        std::cout << "Java:         " << (result.javaSuccess ? result.javaDir : "failed") << "\n";
    }
    if (result.smaliRequested) {
        std::cout << "Smali:        " << (result.smaliSuccess ? result.smaliDir : "failed") << "\n";
    }
}

void printSummary(const MergeResult& result) {
    std::cout << "Output:       " << result.outputPath << "\n"
              << "Base:         " << (result.artifacts.base.empty() ? "none" : result.artifacts.base)
              << "\n"
              << "Splits:       " << result.artifacts.splits.size() << "\n";
}

void printSummary(const DumpResult& result) {
    std::cout << "Dump:         " << result.dumpPath << " (" << result.bytes << " bytes)\n";
    if (!result.formattedPath.empty()) {
        std::cout << "Formatted:    " << result.formattedPath << "\n";
    }
}

void printSummary(const InstrumentResult& result) {
    std::cout << "Package:      " << result.packageName << "\n"
              << "Signed APK:   " << result.signedApk << "\n"
              << "Installed:    " << yesNo(result.installed) << "\n";
    if (result.dump.has_value()) {
        printSummary(*result.dump);
    } else if (result.dumpAttempted) {
        std::cout << "Dump:         failed\n";
    }
}

void printSummary(const FrameworkReport& report) {
    std::cout << "APK:          " << report.apkPath << "\n"
              << "Frameworks:   " << report.frameworkNames() << "\n";
    for (const FrameworkMatch& match : report.frameworks) {
        for (const std::string& file : match.matchedFiles) {
            std::cout << "  [" << match.name << "] " << file << "\n";
        }
    }
    if (!report.nativeLibraries.empty()) {
        std::cout << "Native libs:  " << report.nativeLibraries.size() << "\n";
        for (const std::string& lib : report.nativeLibraries) {
            std::cout << "  " << lib << "\n";
        }
    }
}

// 结束命名空间。
}  // namespace apkc
