// 引入 CLI 相关接口声明。
#include "zPipelineCli.h"

// 引入 strtoul。
#include <cstdlib>
// 引入控制台输出。
#include <iostream>

// 引入用户配置读取。
#include "zUserConfig.h"

// 进入 pipeline 命名空间。
namespace apkc {

// 内部辅助命名空间，仅当前编译单元可见。
namespace {

// 读取带值选项；缺值时回填错误。
bool takeValue(int argc, char* argv[], int* argIndex, const std::string& option,
               std::string* out, std::string& error) {
    if (*argIndex + 1 >= argc || argv[*argIndex + 1] == nullptr) {
        error = "missing value for " + option;
        return false;
    }
    *out = argv[++(*argIndex)];
    return true;
}

// 解析超时秒数（正整数）。
bool parseTimeoutValue(const std::string& value, uint32_t* out, std::string& error) {
    char* end = nullptr;
    const unsigned long parsed = std::strtoul(value.c_str(), &end, 10);
    if (value.empty() || end == nullptr || *end != '\0' || parsed == 0 || parsed > 86400UL) {
        error = "invalid --timeout value: " + value + " (expected seconds in 1..86400)";
        return false;
    }
    *out = static_cast<uint32_t>(parsed);
    return true;
}

// 校验选项与子命令的组合。
bool validateCombination(const CliOptions& cli, std::string& error) {
    // 帮助模式不做任何组合校验。
    if (cli.showHelp) {
        return true;
    }
    if (cli.command == CliCommand::kNone) {
        error = "missing command";
        return false;
    }
    if (cli.target.empty()) {
        error = std::string("missing argument for ") + commandName(cli.command);
        return false;
    }
    // 自定义签名身份必须给全别名与口令。
    if (!cli.keystore.empty() && (cli.keyAlias.empty() || cli.storePass.empty())) {
        error = "--keystore requires --ks-alias and --ks-pass";
        return false;
    }
    if (cli.keystore.empty() &&
        (!cli.keyAlias.empty() || !cli.storePass.empty() || !cli.keyPass.empty())) {
        error = "--ks-alias/--ks-pass/--key-pass require --keystore";
        return false;
    }
    if (cli.command == CliCommand::kDecompile && cli.noJava && cli.noSmali) {
        error = "cannot use both --no-java and --no-smali";
        return false;
    }
    return true;
}

// 结束匿名命名空间。
}  // namespace

CliCommand parseCommandName(const std::string& name) {
    if (name == "build") {
        return CliCommand::kBuild;
    }
    if (name == "decompile") {
        return CliCommand::kDecompile;
    }
    if (name == "merge") {
        return CliCommand::kMerge;
    }
    if (name == "instrument") {
        return CliCommand::kInstrument;
    }
    if (name == "dump") {
        return CliCommand::kDump;
    }
    if (name == "analyze") {
        return CliCommand::kAnalyze;
    }
    return CliCommand::kNone;
}

const char* commandName(CliCommand command) {
    switch (command) {
        case CliCommand::kBuild: return "build";
        case CliCommand::kDecompile: return "decompile";
        case CliCommand::kMerge: return "merge";
        case CliCommand::kInstrument: return "instrument";
        case CliCommand::kDump: return "dump";
        case CliCommand::kAnalyze: return "analyze";
        case CliCommand::kNone: break;
    }
    return "none";
}

// 解析命令行参数：首个位置参数为子命令，第二个为目标，选项可出现在任意位置。
bool parseCommandLine(int argc, char* argv[], CliOptions& cli, std::string& error) {
    for (int argIndex = 1; argIndex < argc; ++argIndex) {
        // 读取当前参数，空指针时回退空字符串。
        const std::string arg = argv[argIndex] ? argv[argIndex] : "";
        if (arg.empty()) {
            continue;
        }
        if (arg == "-h" || arg == "--help") {
            cli.showHelp = true;
            continue;
        }
        // 带值选项。
        if (arg == "-o" || arg == "--output") {
            if (!takeValue(argc, argv, &argIndex, arg, &cli.output, error)) {
                return false;
            }
            continue;
        }
        if (arg == "-d" || arg == "--device") {
            if (!takeValue(argc, argv, &argIndex, arg, &cli.deviceSerial, error)) {
                return false;
            }
            continue;
        }
        if (arg == "--package") {
            if (!takeValue(argc, argv, &argIndex, arg, &cli.packageName, error)) {
                return false;
            }
            continue;
        }
        if (arg == "--keystore") {
            if (!takeValue(argc, argv, &argIndex, arg, &cli.keystore, error)) {
                return false;
            }
            continue;
        }
        if (arg == "--ks-alias") {
            if (!takeValue(argc, argv, &argIndex, arg, &cli.keyAlias, error)) {
                return false;
            }
            continue;
        }
        if (arg == "--ks-pass") {
            if (!takeValue(argc, argv, &argIndex, arg, &cli.storePass, error)) {
                return false;
            }
            continue;
        }
        if (arg == "--key-pass") {
            if (!takeValue(argc, argv, &argIndex, arg, &cli.keyPass, error)) {
                return false;
            }
            continue;
        }
        if (arg == "--config") {
            if (!takeValue(argc, argv, &argIndex, arg, &cli.configPath, error)) {
                return false;
            }
            continue;
        }
        if (arg == "--temp-dir") {
            if (!takeValue(argc, argv, &argIndex, arg, &cli.tempDir, error)) {
                return false;
            }
            continue;
        }
        if (arg == "--timeout") {
            std::string value;
            if (!takeValue(argc, argv, &argIndex, arg, &value, error) ||
                !parseTimeoutValue(value, &cli.timeoutSeconds, error)) {
                return false;
            }
            cli.timeoutSet = true;
            continue;
        }
        // 开关选项。
        if (arg == "--no-align") {
            cli.noAlign = true;
            continue;
        }
        if (arg == "--no-sign") {
            cli.noSign = true;
            continue;
        }
        if (arg == "--verify") {
            cli.verify = true;
            continue;
        }
        if (arg == "--no-java") {
            cli.noJava = true;
            continue;
        }
        if (arg == "--no-smali") {
            cli.noSmali = true;
            continue;
        }
        if (arg == "--force") {
            cli.force = true;
            continue;
        }
        if (arg == "--skip-dump") {
            cli.skipDump = true;
            continue;
        }
        if (arg == "--wait") {
            cli.waitForUser = true;
            continue;
        }
        if (arg == "--no-root-check") {
            cli.noRootCheck = true;
            continue;
        }
        if (arg == "--no-format") {
            cli.noFormat = true;
            continue;
        }
        if (arg == "--no-native-libs") {
            cli.noNativeLibs = true;
            continue;
        }
        if (arg == "--verbose" || arg == "-v") {
            cli.verbose = true;
            continue;
        }
        if (arg == "--json") {
            cli.json = true;
            continue;
        }
        // 任何未知选项都立即报错。
        if (arg[0] == '-') {
            error = "unknown option: " + arg;
            return false;
        }
        // 位置参数：先子命令，后目标。
        if (cli.command == CliCommand::kNone) {
            cli.command = parseCommandName(arg);
            if (cli.command == CliCommand::kNone) {
                error = "unknown command: " + arg;
                return false;
            }
            continue;
        }
        if (cli.target.empty()) {
            cli.target = arg;
            continue;
        }
        error = "unexpected positional argument: " + arg;
        return false;
    }
    return validateCombination(cli, error);
}

// 打印命令行帮助文本。
void printUsage() {
    std::cout
        << "Usage:\n"
        << "  ApkChain <command> <target> [options]\n\n"
        << "Commands:\n"
        << "  build <dir>                  Rebuild an apktool project, align and sign it\n"
        << "  decompile <apk>              Decompile to Java (jadx) and smali/resources (apktool)\n"
        << "  merge <dir>                  Merge a directory of split APKs (APKEditor)\n"
        << "  instrument <apk>             reFlutter instrument, re-sign, install and dump\n"
        << "  dump <package>               Dump runtime data of an instrumented app\n"
        << "  analyze <apk>                Detect cross-platform frameworks and native libs\n\n"
        << "build options:\n"
        << "  -o, --output <file>          Output APK (default: <dir>-patched.apk)\n"
        << "  --no-align                   Skip zipalign\n"
        << "  --no-sign                    Skip signing (unsigned APK is copied out)\n"
        << "  --verify                     Verify the signature after signing\n"
        << "  --keystore <file>            Keystore (default: debug keystore in ~/.apkchain)\n"
        << "  --ks-alias <alias>           Key alias (required with --keystore)\n"
        << "  --ks-pass <pass>             Keystore password (required with --keystore)\n"
        << "  --key-pass <pass>            Key password (default: keystore password)\n\n"
        << "decompile options:\n"
        << "  -o, --output <dir>           Output root (default: ./<apk name>)\n"
        << "  --no-java                    Skip jadx\n"
        << "  --no-smali                   Skip apktool\n\n"
        << "merge options:\n"
        << "  -o, --output <file>          Output APK (default: <dir>.merged.apk)\n\n"
        << "instrument options:\n"
        << "  --package <name>             Package name (default: resolved from the APK)\n"
        << "  -o, --output <dir>           Output directory (default: current directory)\n"
        << "  -d, --device <serial>        Target device\n"
        << "  --force                      Skip the Flutter framework check\n"
        << "  --skip-dump                  Stop after installation\n"
        << "  --wait                       Wait for a manual app start instead of auto-start\n"
        << "  --no-root-check              Do not check for root before dumping\n\n"
        << "dump options:\n"
        << "  -o, --output <file>          Output file (default: ./<package>_dump.dart)\n"
        << "  -d, --device <serial>        Target device\n"
        << "  --no-format                  Do not write the formatted .json copy\n"
        << "  --no-root-check              Do not check for root before dumping\n\n"
        << "analyze options:\n"
        << "  --no-native-libs             Do not list native libraries\n\n"
        << "Global options:\n"
        << "  --timeout <sec>              Timeout for each external tool invocation\n"
        << "  --config <file>              User config (default: ~/.apkchain/config.json)\n"
        << "  --temp-dir <dir>             Staging root (default: system temp directory)\n"
        << "  -v, --verbose                Debug logging\n"
        << "  --json                       Print the result as JSON\n"
        << "  -h, --help                   Show this help\n";
}

void buildToolchainConfig(const CliOptions& cli, ToolchainConfig& toolchain) {
    // 命令行覆盖项先写入，后续步骤只填空字段。
    if (!cli.configPath.empty()) {
        toolchain.userConfigPath = cli.configPath;
    }
    if (!cli.tempDir.empty()) {
        toolchain.stagingRoot = cli.tempDir;
    }
    if (cli.timeoutSet) {
        toolchain.timeoutMs = cli.timeoutSeconds * 1000U;
    }
    // 用户配置文件路径需要先确定才能读取。
    if (toolchain.userConfigPath.empty()) {
        ToolchainConfig defaults;
        fillToolchainDefaults(defaults);
        toolchain.userConfigPath = defaults.userConfigPath;
    }
    config::applyUserConfig(config::UserConfig::load(toolchain.userConfigPath), toolchain);
    fillToolchainDefaults(toolchain);
}

// 结束命名空间。
}  // namespace apkc
