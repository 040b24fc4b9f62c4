/*
 * [APKCHAIN_FLOW_NOTE] 文件级流程注释
 * - 阶段前置校验门：在启动任何外部进程前检查文件系统产物。
 * - 输入：门类型 + 路径 + 参数（扩展名 / 标记文件名）。
 * - 输出：通过 / 失败（kValidation + kPrecondition，附带描述性信息）。
 */
#pragma once

#include <string>
#include <vector>

#include "zPipelineError.h"

namespace apkc {

// ZIP 本地文件头 magic：PK\x03\x04。
extern const unsigned char kZipLocalHeaderMagic[4];
// apktool 工程标记文件名。
extern const char* const kApktoolMarkerFile;

// 校验门类型。
enum class GateKind {
    // 路径存在（任意类型）。
    kExists,
    // 路径是普通文件。
    kIsFile,
    // 路径是目录。
    kIsDirectory,
    // 扩展名匹配（param 为含点扩展名，不区分大小写）。
    kExtension,
    // 文件开头为 ZIP 本地文件头。
    kZipHeader,
    // 目录内存在标记文件（param 为文件名）。
    kMarkerFile,
    // 目录内至少有一个指定扩展名的文件（param 为含点扩展名）。
    kContainsExtension,
};

// 单个校验门。
struct ValidationGate {
    GateKind kind = GateKind::kExists;
    std::string path;
    std::string param;
};

// 便捷构造。
ValidationGate gateExists(const std::string& path);
ValidationGate gateIsFile(const std::string& path);
ValidationGate gateIsDirectory(const std::string& path);
ValidationGate gateExtension(const std::string& path, const std::string& ext);
ValidationGate gateZipHeader(const std::string& path);
ValidationGate gateMarkerFile(const std::string& dir, const std::string& marker);
ValidationGate gateContainsExtension(const std::string& dir, const std::string& ext);

// 评估单个门；失败时回填 message。
bool evaluateGate(const ValidationGate& gate, std::string* message);

// 顺序评估门列表，首个失败即返回 kValidation 错误。
bool evaluateGates(const std::vector<ValidationGate>& gates,
                   const std::string& stage,
                   PipelineError* error);

// APK 输入校验组合：存在 → 普通文件 → .apk 扩展名 →（可选）ZIP 头。
std::vector<ValidationGate> apkInputGates(const std::string& apkPath, bool requireZipHeader);

// 直接校验 APK 路径。
bool validateApkPath(const std::string& apkPath,
                     bool requireZipHeader,
                     const std::string& stage,
                     PipelineError* error);

// 列出目录下指定扩展名的普通文件（按文件名排序，不递归）。
std::vector<std::string> listFilesWithExtension(const std::string& dir, const std::string& ext);

}  // namespace apkc
