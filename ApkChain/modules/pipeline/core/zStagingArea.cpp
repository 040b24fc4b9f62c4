#include "zStagingArea.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <vector>

#include "zFile.h"
#include "zLog.h"

namespace fs = std::filesystem;

namespace apkc {

StagingArea::~StagingArea() {
    destroy();
}

StagingArea::StagingArea(StagingArea&& other) noexcept : path_(std::move(other.path_)) {
    other.path_.clear();
}

StagingArea& StagingArea::operator=(StagingArea&& other) noexcept {
    if (this != &other) {
        destroy();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

bool StagingArea::create(const std::string& root,
                         const std::string& prefix,
                         StagingArea* out,
                         PipelineError* error) {
    if (out == nullptr) {
        return setError(error, ErrorKind::kValidation, ErrorReason::kPrecondition,
                        "staging", "internal error: null staging output");
    }
    std::string baseDir = root;
    if (baseDir.empty()) {
        std::error_code ec;
        const fs::path tmp = fs::temp_directory_path(ec);
        baseDir = ec ? std::string("/tmp") : tmp.string();
    }
    if (!base::file::ensureDirectory(baseDir)) {
        return setError(error, ErrorKind::kToolExecution, ErrorReason::kIo, "staging",
                        "failed to create staging root", baseDir);
    }
    // mkdtemp 需要可写的 char 缓冲，模板以 XXXXXX 结尾。
    const std::string pattern = base::file::joinPath(baseDir, prefix + "XXXXXX");
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    if (::mkdtemp(buffer.data()) == nullptr) {
        return setError(error, ErrorKind::kToolExecution, ErrorReason::kIo, "staging",
                        std::string("mkdtemp failed: ") + std::strerror(errno), pattern);
    }
    // 先清理旧对象再接管新目录。
    out->destroy();
    out->path_ = buffer.data();
    LOGD("staging area created: %s", out->path_.c_str());
    return true;
}

std::string StagingArea::file(const std::string& name) const {
    return base::file::joinPath(path_, name);
}

bool StagingArea::copyOut(const std::string& stagedPath,
                          const std::string& destination,
                          PipelineError* error) const {
    std::string message;
    if (!base::file::copyFile(stagedPath, destination, &message)) {
        return setError(error, ErrorKind::kToolExecution, ErrorReason::kIo, "staging",
                        message, destination);
    }
    return true;
}

bool StagingArea::destroy() {
    if (path_.empty()) {
        return true;
    }
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
        // 删除失败只告警：调用方的主结果已经确定，不能被清理失败覆盖。
        LOGW("failed to remove staging area %s: %s", path_.c_str(), ec.message().c_str());
    } else {
        LOGD("staging area removed: %s", path_.c_str());
    }
    path_.clear();
    return !ec;
}

}  // namespace apkc
