// 引入 pipeline 类型定义。
#include "zPipelineTypes.h"

// 引入临时目录查询。
#include <filesystem>

// 引入主目录与路径拼接。
#include "zFile.h"

// 进入 pipeline 命名空间。
namespace apkc {

std::vector<std::string> SplitArtifactSet::all() const {
    std::vector<std::string> paths;
    paths.reserve(splits.size() + 1);
    if (!base.empty()) {
        paths.push_back(base);
    }
    paths.insert(paths.end(), splits.begin(), splits.end());
    return paths;
}

const char* verificationName(Verification verification) {
    switch (verification) {
        case Verification::kNotAttempted: return "not-attempted";
        case Verification::kPassed: return "passed";
        case Verification::kFailed: return "failed";
    }
    return "unknown";
}

// 只填空字段，已被调用方覆盖的字段保持原值。
void fillToolchainDefaults(ToolchainConfig& config) {
    // 工具私有目录：~/.apkchain；取不到主目录时退回当前目录。
    std::string home = base::file::homeDirectory();
    const std::string appDir =
        base::file::joinPath(home.empty() ? base::file::currentDirectory() : home, ".apkchain");
    if (config.keystoreDir.empty()) {
        config.keystoreDir = appDir;
    }
    if (config.userConfigPath.empty()) {
        config.userConfigPath = base::file::joinPath(appDir, "config.json");
    }
    if (config.stagingRoot.empty()) {
        std::error_code ec;
        const std::filesystem::path tmp = std::filesystem::temp_directory_path(ec);
        config.stagingRoot = ec ? std::string("/tmp") : tmp.string();
    }
}

// 结束命名空间。
}  // namespace apkc
