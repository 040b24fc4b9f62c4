// 防止头文件重复包含。
#pragma once

// 引入 size_t。
#include <cstddef>
// 引入固定宽度整数。
#include <cstdint>
// 引入回调类型。
#include <functional>
// 引入可选值。
#include <optional>
// 引入字符串类型。
#include <string>
// 引入动态数组容器。
#include <vector>

// 引入统一错误对象。
#include "zPipelineError.h"

// 进入 pipeline 顶层命名空间。
namespace apkc {

// 外部工具链配置。
// 所有默认路径都在这里集中给出，调用方（含测试）可逐项覆盖。
struct ToolchainConfig {
    // apktool 可执行名或路径。
    std::string apktool = "apktool";
    // jadx 可执行名或路径。
    std::string jadx = "jadx";
    // keytool 可执行名或路径。
    std::string keytool = "keytool";
    // adb 可执行名或路径。
    std::string adb = "adb";
    // reflutter 可执行名或路径。
    std::string reflutter = "reflutter";
    // java 可执行名或路径（APKEditor jar 模式使用）。
    std::string java = "java";
    // zipalign 显式路径；空串表示走 SDK/PATH 解析。
    std::string zipalign;
    // apksigner 显式路径；空串表示走 SDK/PATH 解析。
    std::string apksigner;
    // aapt 显式路径；空串表示走 SDK/PATH 解析。
    std::string aapt;
    // Android SDK 根目录显式覆盖。
    std::string androidHome;
    // build-tools 最低版本。
    std::string minBuildToolsVersion = "30.0.0";
    // APKEditor jar 显式覆盖（最高优先级）。
    std::string apkeditorJar;
    // APKEditor jar 环境变量名。
    std::string apkeditorEnvVar = "APKEDITOR_JAR";
    // 用户配置中的 APKEditor 键名。
    std::string apkeditorConfigKey = "apkeditor_path";
    // PATH 中的 APKEditor 包装脚本名。
    std::string apkeditorWrapper = "APKEditor";
    // 用户配置文件路径（默认 ~/.apkchain/config.json）。
    std::string userConfigPath;
    // 调试密钥库目录（默认 ~/.apkchain）。
    std::string keystoreDir;
    // staging 根目录（默认系统临时目录）。
    std::string stagingRoot;
    // 单次外部调用超时毫秒数，0 表示不限时。
    uint32_t timeoutMs = 0;
};

// 签名身份：密钥库 + 别名 + 两个口令。
struct SigningIdentity {
    // 密钥库文件路径。
    std::string keystorePath;
    // 密钥别名。
    std::string alias;
    // 密钥库口令。
    std::string storePass;
    // 密钥口令。
    std::string keyPass;
    // true 表示由本工具生成并管理（调试身份），false 表示调用方提供。
    bool systemOwned = false;
};

// 调试签名身份默认参数。
struct DebugIdentityDefaults {
    std::string keystoreFileName = "debug.keystore";
    std::string alias = "androiddebugkey";
    std::string storePass = "android";
    std::string keyPass = "android";
    std::string distinguishedName = "CN=Debug, OU=Debug, O=Debug, L=Debug, ST=Debug, C=US";
    std::string keyAlgorithm = "RSA";
    uint32_t keySize = 2048;
    uint32_t validityDays = 10000;
};

// 验签三态。
enum class Verification {
    kNotAttempted = 0,
    kPassed,
    kFailed,
};

// 单阶段执行记录。
struct StageRecord {
    // 阶段名。
    std::string name;
    // 是否执行。
    bool ran = false;
    // 是否成功。
    bool succeeded = false;
    // 阶段产物路径。
    std::string artifact;
    // 失败信息或备注。
    std::string message;
};

// Build-Align-Sign 选项。
struct BuildOptions {
    // 是否对齐。
    bool align = true;
    // 是否签名。
    bool sign = true;
    // 签名后是否验签。
    bool verify = false;
    // 调用方提供的签名身份；为空时使用调试身份。
    std::optional<SigningIdentity> identity;
    // 调试身份参数。
    DebugIdentityDefaults debugIdentity;
};

// Build-Align-Sign 结果。
struct BuildResult {
    // 源工程目录。
    std::string sourceDir;
    // 最终输出 APK。
    std::string outputPath;
    // 是否执行了对齐。
    bool alignRan = false;
    // 是否执行了签名。
    bool signRan = false;
    // 本次运行是否新生成了调试密钥库。
    bool keystoreGenerated = false;
    // 实际使用的密钥库（未签名时为空）。
    std::string keystorePath;
    // 验签结果。
    Verification verification = Verification::kNotAttempted;
    // 阶段记录（按执行顺序）。
    std::vector<StageRecord> stages;
};

// 反编译选项。
struct DecompileOptions {
    // 是否导出 Java 源码（jadx）。
    bool java = true;
    // 是否导出 smali/资源（apktool）。
    bool smali = true;
    // 输出根目录；空串表示 ./<apk 名>。
    std::string outputDir;
};

// 反编译结果。
struct DecompileResult {
    std::string apkPath;
    std::string outputDir;
    // Java 输出目录（仅成功时非空）。
    std::string javaDir;
    // smali 输出目录（仅成功时非空）。
    std::string smaliDir;
    bool javaRequested = false;
    bool smaliRequested = false;
    bool javaSuccess = false;
    bool smaliSuccess = false;
    // 失败阶段的错误描述。
    std::string javaError;
    std::string smaliError;
};

// split 产物集合：一个 base + 若干 split。
struct SplitArtifactSet {
    // base APK 路径（集合为空时为空串）。
    std::string base;
    // split APK 路径（保持输入顺序）。
    std::vector<std::string> splits;

    bool empty() const { return base.empty() && splits.empty(); }
    bool isSplit() const { return !splits.empty(); }
    // base 在前，split 按原顺序在后。
    std::vector<std::string> all() const;
};

// 合并结果。
struct MergeResult {
    std::string splitDir;
    std::string outputPath;
    // 输入目录中识别到的产物集合。
    SplitArtifactSet artifacts;
    // 实际使用的合并命令前缀（如 java -jar APKEditor.jar）。
    std::vector<std::string> toolCommand;
    // 是否替换了已存在的输出文件。
    bool replacedExisting = false;
};

// 运行时 dump 选项。
struct DumpOptions {
    // 目标包名。
    std::string packageName;
    // 本地输出文件；空串表示 <outputDir>/<package>_dump.dart。
    std::string outputPath;
    // 默认输出目录；空串表示当前目录。
    std::string outputDir;
    // 设备序列号；空串表示默认设备。
    std::string deviceSerial;
    // 是否尝试 JSON 格式化。
    bool formatJson = true;
    // 是否先检查 root。
    bool checkRoot = true;
    // 设备端 dump 路径模板，{package} 会被替换。
    std::string remotePathTemplate = "/data/data/{package}/dump.dart";
};

// 运行时 dump 结果。
struct DumpResult {
    std::string packageName;
    // 原始 dump 文件。
    std::string dumpPath;
    // 格式化 JSON 文件（仅解析成功时非空）。
    std::string formattedPath;
    bool success = false;
    // 应用是否由工具自动拉起。
    bool autoStarted = false;
    // 原始内容字节数。
    size_t bytes = 0;
};

// 等待用户手动操作的回调（阻塞，无超时）。
using UserPrompt = std::function<void(const std::string& message)>;

// 插桩流程选项。
struct InstrumentOptions {
    // 输入 APK。
    std::string apkPath;
    // 包名；空串表示自动解析。
    std::string packageName;
    // 输出目录；空串表示当前目录。
    std::string outputDir;
    // 设备序列号。
    std::string deviceSerial;
    // 跳过框架校验。
    bool force = false;
    // 跳过 dump。
    bool skipDump = false;
    // 等待用户手动启动应用（不自动拉起）。
    bool waitForUser = false;
    // dump 前检查 root。
    bool checkRoot = true;
    // dump 后尝试 JSON 格式化。
    bool formatJson = true;
    // 目标框架名。
    std::string targetFramework = "Flutter";
    // 插桩工具在工作目录中产出的固定文件名。
    std::string instrumentedApkName = "release.RE.apk";
    // 自动拉起后的等待秒数。
    uint32_t startGraceSeconds = 8;
    // 设备端 dump 路径模板。
    std::string remoteDumpTemplate = "/data/data/{package}/dump.dart";
    // 重签身份；为空时使用调试身份。
    std::optional<SigningIdentity> identity;
    // 等待用户回调；为空时使用标准输入提示。
    UserPrompt prompt;
};

// 插桩流程结果。
struct InstrumentResult {
    std::string packageName;
    std::string originalApk;
    // 重签后的可安装 APK。
    std::string signedApk;
    bool installed = false;
    // 是否自动拉起成功。
    bool autoStarted = false;
    // 是否尝试了 dump。
    bool dumpAttempted = false;
    // dump 结果（失败或跳过时为空）。
    std::optional<DumpResult> dump;
    // dump 失败描述（非致命）。
    std::string dumpError;
    // 重签子流程结果。
    BuildResult signing;
    // 阶段记录。
    std::vector<StageRecord> stages;
};

// 验签三态名。
const char* verificationName(Verification verification);

// 填充工具链默认路径（主目录、临时目录等）。
void fillToolchainDefaults(ToolchainConfig& config);

// 结束命名空间。
}  // namespace apkc
