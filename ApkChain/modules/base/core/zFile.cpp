// 引入基础文件 IO 接口声明。
#include "zFile.h"

// 引入 tolower。
#include <cctype>
// 引入 getenv。
#include <cstdlib>
// 引入文件系统 API。
#include <filesystem>
// 引入文件流。
#include <fstream>
// 引入 istreambuf_iterator。
#include <iterator>

// 文件系统命名空间别名，缩短代码书写。
namespace fs = std::filesystem;

// 进入基础 IO 命名空间。
namespace apkc::base::file {

// 判断 path 是否存在且是普通文件。
bool fileExists(const std::string& path) {
    // 使用 error_code 避免抛异常。
    std::error_code ec;
    return !path.empty() && fs::is_regular_file(path, ec);
}

// 判断 path 是否存在且是目录。
bool directoryExists(const std::string& path) {
    std::error_code ec;
    return !path.empty() && fs::is_directory(path, ec);
}

bool pathExists(const std::string& path) {
    std::error_code ec;
    return !path.empty() && fs::exists(path, ec);
}

// 确保目录存在；若不存在则递归创建。
bool ensureDirectory(const std::string& path) {
    std::error_code ec;
    // 空路径直接失败。
    if (path.empty()) {
        return false;
    }
    // 目录已存在时仅校验它确实是目录。
    if (fs::exists(path, ec)) {
        return fs::is_directory(path, ec);
    }
    // 不存在则递归创建。
    return fs::create_directories(path, ec);
}

// 确保输出文件的父目录存在。
bool ensureParentDirectory(const std::string& path) {
    const fs::path p(path);
    // 无父目录（相对文件名）视为已满足。
    if (!p.has_parent_path()) {
        return true;
    }
    return ensureDirectory(p.parent_path().string());
}

// 读取文件到字节数组。
bool readFileBytes(const std::string& path, std::vector<uint8_t>* out) {
    if (out == nullptr) {
        return false;
    }
    out->clear();
    if (path.empty()) {
        return false;
    }
    // 以二进制模式打开输入流。
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return false;
    }
    // 光标移到文件末尾，准备计算总长度。
    in.seekg(0, std::ios::end);
    const std::streamoff size = in.tellg();
    if (size < 0) {
        return false;
    }
    in.seekg(0, std::ios::beg);
    out->resize(static_cast<size_t>(size));
    if (!out->empty()) {
        in.read(reinterpret_cast<char*>(out->data()),
                static_cast<std::streamsize>(out->size()));
    }
    return static_cast<bool>(in);
}

// 只读文件头部，用于 magic 校验，避免整包读入内存。
bool readFileHead(const std::string& path, size_t count, std::vector<uint8_t>* out) {
    if (out == nullptr) {
        return false;
    }
    out->assign(count, 0);
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        out->clear();
        return false;
    }
    in.read(reinterpret_cast<char*>(out->data()), static_cast<std::streamsize>(count));
    // 短文件：按实际读到的长度截断，不视为 IO 失败。
    out->resize(static_cast<size_t>(in.gcount()));
    return !in.bad();
}

bool readFileText(const std::string& path, std::string* out) {
    if (out == nullptr) {
        return false;
    }
    out->clear();
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return false;
    }
    out->assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    return !in.bad();
}

// 把字节数组写入目标文件（覆盖模式）。
bool writeFileBytes(const std::string& path, const std::vector<uint8_t>& data) {
    if (path.empty() || !ensureParentDirectory(path)) {
        return false;
    }
    // 以二进制 + 截断模式打开输出流。
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return false;
    }
    if (!data.empty()) {
        out.write(reinterpret_cast<const char*>(data.data()),
                  static_cast<std::streamsize>(data.size()));
    }
    return static_cast<bool>(out);
}

bool writeFileText(const std::string& path, const std::string& text) {
    if (path.empty() || !ensureParentDirectory(path)) {
        return false;
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return false;
    }
    out << text;
    return static_cast<bool>(out);
}

// 复制文件：目标存在时覆盖。
bool copyFile(const std::string& from, const std::string& to, std::string* error) {
    if (!ensureParentDirectory(to)) {
        if (error != nullptr) {
            *error = "failed to create parent directory of " + to;
        }
        return false;
    }
    std::error_code ec;
    fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        if (error != nullptr) {
            *error = "copy " + from + " -> " + to + " failed: " + ec.message();
        }
        return false;
    }
    return true;
}

// 删除单个文件（不递归）。
bool removeFile(const std::string& path, std::string* error) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return true;
    }
    // 目录不在本函数职责内，递归删除只允许出现在 staging 管理器。
    if (fs::is_directory(path, ec)) {
        if (error != nullptr) {
            *error = "refusing to remove directory: " + path;
        }
        return false;
    }
    fs::remove(path, ec);
    if (ec) {
        if (error != nullptr) {
            *error = "remove " + path + " failed: " + ec.message();
        }
        return false;
    }
    return true;
}

std::string fileName(const std::string& path) {
    return fs::path(path).filename().string();
}

std::string fileStem(const std::string& path) {
    return fs::path(path).stem().string();
}

std::string lowerExtension(const std::string& path) {
    std::string ext = fs::path(path).extension().string();
    for (char& c : ext) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return ext;
}

std::string replaceExtension(const std::string& path, const std::string& newExt) {
    fs::path p(path);
    p.replace_extension(newExt);
    return p.string();
}

std::string joinPath(const std::string& base, const std::string& name) {
    return (fs::path(base) / name).string();
}

std::string absolutePath(const std::string& path) {
    std::error_code ec;
    const fs::path abs = fs::absolute(path, ec);
    if (ec) {
        return path;
    }
    return abs.lexically_normal().string();
}

std::string homeDirectory() {
    const char* home = std::getenv("HOME");
    return home != nullptr ? std::string(home) : std::string();
}

std::string currentDirectory() {
    std::error_code ec;
    const fs::path cwd = fs::current_path(ec);
    return ec ? std::string(".") : cwd.string();
}

// 结束命名空间。
}  // namespace apkc::base::file
