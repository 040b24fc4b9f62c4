// 防止头文件重复包含。
#pragma once

// 引入可选值。
#include <optional>
// 引入字符串类型。
#include <string>

// jsoncpp 文档对象。
#include <json/value.h>

// 引入工具链配置。
#include "zPipelineTypes.h"

// 用户配置命名空间（~/.apkchain/config.json，只读）。
namespace apkc::config {

// 用户配置快照。
// 文件缺失、读取失败、JSON 非法或顶层不是对象时都视为空配置。
class UserConfig {
public:
    UserConfig() = default;

    // 从文件加载；永不失败，异常情况下返回空配置并打 DEBUG 日志。
    static UserConfig load(const std::string& path);
    // 从文本解析（测试与 load 共用）。
    static UserConfig parse(const std::string& text);

    // 读取字符串键；键缺失或类型不是字符串时返回空。
    std::optional<std::string> getString(const std::string& key) const;
    // 是否为空配置。
    bool empty() const;

private:
    // 顶层 JSON 对象。
    Json::Value root_{Json::objectValue};
};

// 把用户配置中的路径类设置合并到工具链配置（仅填充调用方未显式设置的字段）。
// 识别键：keystore_dir、android_home；apkeditor_path 由工具解析链单独读取。
void applyUserConfig(const UserConfig& userConfig, ToolchainConfig& toolchain);

// 结束命名空间。
}  // namespace apkc::config
