/*
 * [APKCHAIN_FLOW_NOTE] 文件级流程注释
 * - staging 区管理：为单次流水线运行创建独占临时目录，并在所有退出路径上递归删除。
 * - 链路位置：Build/Decompile/Instrument 的中间产物容器。
 * - 约束：
 *   1) 只有这里允许递归删除目录；阶段代码不得删除调用方拥有的路径。
 *   2) 产物只能通过 copyOut 显式复制到调用方路径后才能在销毁后保留。
 *   3) staging 区不在并发运行之间共享。
 */
#pragma once

#include <string>
#include <utility>

#include "zPipelineError.h"

namespace apkc {

// RAII 临时目录。
class StagingArea {
public:
    // 空对象，isValid() 为 false。
    StagingArea() = default;
    // 析构时递归删除目录。
    ~StagingArea();

    // 禁止拷贝，避免重复删除。
    StagingArea(const StagingArea&) = delete;
    StagingArea& operator=(const StagingArea&) = delete;
    // 允许移动，所有权随之转移。
    StagingArea(StagingArea&& other) noexcept;
    StagingArea& operator=(StagingArea&& other) noexcept;

    // 在 root 下创建 <prefix>XXXXXX 唯一目录。
    static bool create(const std::string& root,
                       const std::string& prefix,
                       StagingArea* out,
                       PipelineError* error);

    bool isValid() const { return !path_.empty(); }
    const std::string& path() const { return path_; }
    // 返回 staging 内文件路径。
    std::string file(const std::string& name) const;
    // 把 staging 内产物复制到调用方可见路径（覆盖已有文件）。
    bool copyOut(const std::string& stagedPath,
                 const std::string& destination,
                 PipelineError* error) const;
    // 立即删除目录（析构也会调用）；返回是否删除干净。
    bool destroy();

private:
    std::string path_;
};

// 在 staging 区内执行 fn，所有退出路径都会删除 staging 目录。
// fn 签名：bool(const StagingArea&, PipelineError*)。
template <typename Fn>
bool withStagingArea(const std::string& root,
                     const std::string& prefix,
                     Fn&& fn,
                     PipelineError* error) {
    StagingArea area;
    if (!StagingArea::create(root, prefix, &area, error)) {
        return false;
    }
    // area 在离开作用域时析构，覆盖正常返回与失败返回。
    return std::forward<Fn>(fn)(static_cast<const StagingArea&>(area), error);
}

}  // namespace apkc
