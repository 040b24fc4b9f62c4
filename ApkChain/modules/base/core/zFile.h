// 防止头文件重复包含。
#pragma once

// 引入固定宽度整数定义。
#include <cstdint>
// 引入字符串类型。
#include <string>
// 引入字节数组容器。
#include <vector>

// 基础层文件 IO 工具命名空间。
namespace apkc::base::file {

// 判断路径是否存在且为普通文件。
bool fileExists(const std::string& path);
// 判断路径是否存在且为目录。
bool directoryExists(const std::string& path);
// 判断路径是否存在（任意类型）。
bool pathExists(const std::string& path);
// 确保目录存在（不存在则递归创建）。
bool ensureDirectory(const std::string& path);
// 确保文件的父目录存在。
bool ensureParentDirectory(const std::string& path);
// 读取文件为字节数组。
bool readFileBytes(const std::string& path, std::vector<uint8_t>* out);
// 读取文件开头最多 count 字节（文件更短时返回实际长度）。
bool readFileHead(const std::string& path, size_t count, std::vector<uint8_t>* out);
// 读取文本文件。
bool readFileText(const std::string& path, std::string* out);
// 把字节数组写入文件（覆盖写）。
bool writeFileBytes(const std::string& path, const std::vector<uint8_t>& data);
// 把文本写入文件（覆盖写）。
bool writeFileText(const std::string& path, const std::string& text);
// 复制单个文件到目标路径（覆盖已有目标）。
bool copyFile(const std::string& from, const std::string& to, std::string* error);
// 删除单个普通文件；不存在视为成功。
bool removeFile(const std::string& path, std::string* error);

// 取文件名（含扩展名）。
std::string fileName(const std::string& path);
// 取不含扩展名的文件名。
std::string fileStem(const std::string& path);
// 取小写扩展名（含点，如 ".apk"）。
std::string lowerExtension(const std::string& path);
// 替换扩展名（newExt 含点）。
std::string replaceExtension(const std::string& path, const std::string& newExt);
// 拼接两级路径。
std::string joinPath(const std::string& base, const std::string& name);
// 转为绝对、词法规范化的路径；失败时原样返回。
std::string absolutePath(const std::string& path);
// 当前用户主目录（$HOME），取不到时返回空串。
std::string homeDirectory();
// 当前工作目录。
std::string currentDirectory();

// 结束命名空间。
}  // namespace apkc::base::file
