/*
 * [APKCHAIN_FLOW_NOTE] 文件级流程注释
 * - 测试公共设施：临时目录、假外部工具脚本、内存 ZIP 构造、环境变量守卫。
 * - 假工具是 /bin/sh 脚本，经 ToolchainConfig 注入，真实走 fork/exec 路径。
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "zPipelineTypes.h"

namespace apkc::test {

// 测试用临时目录，析构时递归删除。
class TempDir {
public:
    TempDir();
    ~TempDir();
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::string& path() const { return path_; }
    // 目录内路径（不创建）。
    std::string file(const std::string& name) const;
    // 在目录内创建子目录并返回其路径。
    std::string makeDir(const std::string& name) const;

private:
    std::string path_;
};

// 写一个可执行 sh 脚本（自动补 shebang）。
std::string writeScript(const std::string& path, const std::string& body);

// 构造只含 stored 条目的 ZIP 字节流。
std::vector<uint8_t> buildStoredZip(const std::vector<std::pair<std::string, std::string>>& entries);

// 把 ZIP 写到文件。
void writeZip(const std::string& path,
              const std::vector<std::pair<std::string, std::string>>& entries);

// 读文本文件；失败返回空串。
std::string readText(const std::string& path);

// 目录内直接子项数量（目录不存在返回 0）。
size_t countEntries(const std::string& dir);

// 环境变量守卫：构造时设置或清除，析构时恢复。
class ScopedEnv {
public:
    ScopedEnv(const std::string& name, const std::optional<std::string>& value);
    ~ScopedEnv();
    ScopedEnv(const ScopedEnv&) = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;

private:
    std::string name_;
    std::optional<std::string> saved_;
};

// 假 adb 的各子命令退出码。
struct FakeAdbBehavior {
    int rootExit = 0;
    int catExit = 0;
    int installExit = 0;
    int monkeyExit = 0;
};

// 流水线测试基类：每个用例独立的工具目录、staging 根、密钥库目录与空 SDK。
class PipelineTest : public ::testing::Test {
protected:
    void SetUp() override;

    // 在 tools/ 下写一个假工具并返回路径。
    std::string tool(const std::string& name, const std::string& body) const;
    // 假工具追加调用记录的日志文件。
    std::string callLog(const std::string& name) const;
    // 最小 apktool 工程目录（含 apktool.yml）。
    std::string makeProject(const std::string& name) const;

    // 常用假工具：全部按真实命令行约定读写产物。
    void installFakeApktool();
    void installFakeZipalign();
    void installFakeApksigner(int verifyExit = 0);
    void installFakeKeytool();
    // 设备端 dump 内容取自 deviceDumpFile()，文件不存在时输出为空。
    void installFakeAdb(const FakeAdbBehavior& behavior = FakeAdbBehavior());
    std::string deviceDumpFile() const;

    TempDir tmp_;
    std::string toolsDir_;
    ToolchainConfig toolchain_;
};

}  // namespace apkc::test
