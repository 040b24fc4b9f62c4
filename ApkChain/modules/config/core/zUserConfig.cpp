// 引入用户配置声明。
#include "zUserConfig.h"

// 引入 unique_ptr。
#include <memory>

// jsoncpp 读取器。
#include <json/reader.h>

// 引入文件读取。
#include "zFile.h"
// 引入日志。
#include "zLog.h"

// 进入用户配置命名空间。
namespace apkc::config {

UserConfig UserConfig::load(const std::string& path) {
    // 文件不存在是常态（未配置），不算错误。
    if (!base::file::fileExists(path)) {
        LOGD("user config not found: %s", path.c_str());
        return UserConfig();
    }
    std::string text;
    if (!base::file::readFileText(path, &text)) {
        LOGD("user config unreadable: %s", path.c_str());
        return UserConfig();
    }
    return parse(text);
}

UserConfig UserConfig::parse(const std::string& text) {
    UserConfig config;
    Json::CharReaderBuilder builder;
    // 严格模式下不接受注释等扩展语法，与 JSON 标准保持一致。
    Json::CharReaderBuilder::strictMode(&builder.settings_);
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;
    const char* begin = text.data();
    const char* end = begin + text.size();
    if (!reader->parse(begin, end, &root, &errors)) {
        LOGD("user config is not valid JSON: %s", errors.c_str());
        return config;
    }
    // 顶层必须是对象。
    if (!root.isObject()) {
        LOGD("user config top level is not an object");
        return config;
    }
    config.root_ = root;
    return config;
}

std::optional<std::string> UserConfig::getString(const std::string& key) const {
    if (!root_.isMember(key)) {
        return std::nullopt;
    }
    const Json::Value& value = root_[key];
    if (!value.isString()) {
        return std::nullopt;
    }
    return value.asString();
}

bool UserConfig::empty() const {
    return root_.empty();
}

void applyUserConfig(const UserConfig& userConfig, ToolchainConfig& toolchain) {
    // 密钥库目录。
    if (toolchain.keystoreDir.empty()) {
        if (auto value = userConfig.getString("keystore_dir")) {
            toolchain.keystoreDir = *value;
        }
    }
    // SDK 根目录。
    if (toolchain.androidHome.empty()) {
        if (auto value = userConfig.getString("android_home")) {
            toolchain.androidHome = *value;
        }
    }
    // APKEditor 不在这里合并：它有独立的 env → config → PATH 解析链，
    // 配置项只能排在环境变量之后。
}

// 结束命名空间。
}  // namespace apkc::config
