// 防止头文件重复包含。
#pragma once

// 引入 size_t。
#include <cstddef>
// 引入固定宽度整数定义。
#include <cstdint>
// 引入字符串类型。
#include <string>
// 引入动态数组容器。
#include <vector>

// 归档层 ZIP 目录读取命名空间。
namespace apkc::archive {

// ZIP 中央目录结束记录（EOCD）签名 PK\x05\x06。
constexpr uint32_t kZipEndOfCentralDirSignature = 0x06054b50u;
// 中央目录文件头签名 PK\x01\x02。
constexpr uint32_t kZipCentralDirEntrySignature = 0x02014b50u;
// EOCD 固定部分长度。
constexpr size_t kZipEndOfCentralDirSize = 22;
// EOCD 注释最大长度。
constexpr size_t kZipMaxCommentSize = 0xFFFF;
// 中央目录文件头固定部分长度。
constexpr size_t kZipCentralDirEntrySize = 46;

// 中央目录中的一条记录（只保留检测需要的字段）。
struct ZipEntryInfo {
    // 条目名（归档内相对路径，目录以 '/' 结尾）。
    std::string name;
    // 压缩方式（0=stored，8=deflate）。
    uint16_t method = 0;
    // 压缩后大小。
    uint32_t compressedSize = 0;
    // 原始大小。
    uint32_t uncompressedSize = 0;
};

// 从内存中的完整 ZIP 字节解析中央目录。
// 不支持 ZIP64；条目数/偏移为 0xFFFF/0xFFFFFFFF 时视为非法。
bool parseZipCentralDirectory(const std::vector<uint8_t>& bytes,
                              std::vector<ZipEntryInfo>* entries,
                              std::string* error);

// 从文件读取中央目录：只读取尾部与中央目录区间，不加载整个归档。
bool readZipEntries(const std::string& path,
                    std::vector<ZipEntryInfo>* entries,
                    std::string* error);

// 只取条目名。
bool readZipEntryNames(const std::string& path,
                       std::vector<std::string>* names,
                       std::string* error);

// 结束命名空间。
}  // namespace apkc::archive
