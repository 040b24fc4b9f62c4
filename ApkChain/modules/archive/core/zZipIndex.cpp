// 引入 ZIP 目录读取接口声明。
#include "zZipIndex.h"

// 引入文件流。
#include <fstream>
// 引入 std::move。
#include <utility>

// 进入归档命名空间。
namespace apkc::archive {

// 内部辅助命名空间，仅当前编译单元可见。
namespace {

// EOCD 解析结果。
struct EndRecord {
    // 中央目录条目总数。
    uint16_t entryCount = 0;
    // 中央目录字节数。
    uint32_t dirSize = 0;
    // 中央目录在文件中的偏移。
    uint32_t dirOffset = 0;
    // EOCD 自身在文件中的偏移。
    uint64_t recordOffset = 0;
};

// 统一构造错误消息。
bool setZipError(const std::string& message, std::string* error) {
    if (error != nullptr) {
        *error = message;
    }
    return false;
}

// 小端读取 u16。
uint16_t readLe16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

// 小端读取 u32。
uint32_t readLe32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

// 在文件尾部窗口中从后向前查找 EOCD。
// tailOffset 为窗口在文件中的起始偏移。
bool locateEndRecord(const uint8_t* tail,
                     size_t tailSize,
                     uint64_t tailOffset,
                     EndRecord* out,
                     std::string* error) {
    if (tailSize < kZipEndOfCentralDirSize) {
        return setZipError("file is too small to be a ZIP archive", error);
    }
    for (size_t pos = tailSize - kZipEndOfCentralDirSize + 1; pos-- > 0;) {
        if (readLe32(tail + pos) != kZipEndOfCentralDirSignature) {
            continue;
        }
        // 注释长度必须落在窗口内，否则是注释里的伪签名。
        const uint16_t commentSize = readLe16(tail + pos + 20);
        if (pos + kZipEndOfCentralDirSize + commentSize > tailSize) {
            continue;
        }
        const uint16_t diskEntries = readLe16(tail + pos + 8);
        const uint16_t totalEntries = readLe16(tail + pos + 10);
        const uint32_t dirSize = readLe32(tail + pos + 12);
        const uint32_t dirOffset = readLe32(tail + pos + 16);
        // ZIP64 哨兵值。
        if (totalEntries == 0xFFFF || dirSize == 0xFFFFFFFFu || dirOffset == 0xFFFFFFFFu) {
            return setZipError("ZIP64 archives are not supported", error);
        }
        // 多卷归档。
        if (diskEntries != totalEntries) {
            return setZipError("multi-disk ZIP archives are not supported", error);
        }
        out->entryCount = totalEntries;
        out->dirSize = dirSize;
        out->dirOffset = dirOffset;
        out->recordOffset = tailOffset + pos;
        // 中央目录必须整体位于 EOCD 之前。
        if (static_cast<uint64_t>(dirOffset) + dirSize > out->recordOffset) {
            return setZipError("central directory range is out of bounds", error);
        }
        return true;
    }
    return setZipError("end of central directory record not found", error);
}

// 逐条解析中央目录。
bool parseEntries(const uint8_t* dir,
                  size_t dirSize,
                  uint16_t entryCount,
                  std::vector<ZipEntryInfo>* entries,
                  std::string* error) {
    entries->clear();
    entries->reserve(entryCount);
    size_t cursor = 0;
    for (uint16_t index = 0; index < entryCount; ++index) {
        if (cursor + kZipCentralDirEntrySize > dirSize) {
            return setZipError("central directory entry " + std::to_string(index) + " is truncated",
                               error);
        }
        const uint8_t* p = dir + cursor;
        if (readLe32(p) != kZipCentralDirEntrySignature) {
            return setZipError("bad central directory signature at entry " + std::to_string(index),
                               error);
        }
        const uint16_t nameSize = readLe16(p + 28);
        const uint16_t extraSize = readLe16(p + 30);
        const uint16_t commentSize = readLe16(p + 32);
        const size_t recordSize = kZipCentralDirEntrySize + nameSize + extraSize + commentSize;
        if (cursor + recordSize > dirSize) {
            return setZipError("central directory entry " + std::to_string(index) + " is truncated",
                               error);
        }
        ZipEntryInfo entry;
        entry.method = readLe16(p + 10);
        entry.compressedSize = readLe32(p + 20);
        entry.uncompressedSize = readLe32(p + 24);
        entry.name.assign(reinterpret_cast<const char*>(p + kZipCentralDirEntrySize), nameSize);
        entries->push_back(std::move(entry));
        cursor += recordSize;
    }
    return true;
}

// 结束匿名命名空间。
}  // namespace

bool parseZipCentralDirectory(const std::vector<uint8_t>& bytes,
                              std::vector<ZipEntryInfo>* entries,
                              std::string* error) {
    if (entries == nullptr) {
        return setZipError("internal error: null entries output", error);
    }
    // 只在末尾 64KiB + 22 字节内查找 EOCD。
    const size_t window = kZipEndOfCentralDirSize + kZipMaxCommentSize;
    const size_t tailSize = bytes.size() < window ? bytes.size() : window;
    const size_t tailOffset = bytes.size() - tailSize;
    EndRecord record;
    if (!locateEndRecord(bytes.data() + tailOffset, tailSize, tailOffset, &record, error)) {
        return false;
    }
    return parseEntries(bytes.data() + record.dirOffset, record.dirSize, record.entryCount, entries,
                        error);
}

bool readZipEntries(const std::string& path,
                    std::vector<ZipEntryInfo>* entries,
                    std::string* error) {
    if (entries == nullptr) {
        return setZipError("internal error: null entries output", error);
    }
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return setZipError("cannot open archive: " + path, error);
    }
    in.seekg(0, std::ios::end);
    const std::streamoff fileSize = in.tellg();
    if (fileSize < 0) {
        return setZipError("cannot determine archive size: " + path, error);
    }

    // 1) 读取尾部窗口并定位 EOCD。
    const uint64_t window = kZipEndOfCentralDirSize + kZipMaxCommentSize;
    const uint64_t size = static_cast<uint64_t>(fileSize);
    const uint64_t tailSize = size < window ? size : window;
    const uint64_t tailOffset = size - tailSize;
    std::vector<uint8_t> tail(static_cast<size_t>(tailSize));
    in.seekg(static_cast<std::streamoff>(tailOffset), std::ios::beg);
    if (tailSize > 0 && !in.read(reinterpret_cast<char*>(tail.data()),
                                 static_cast<std::streamsize>(tailSize))) {
        return setZipError("failed to read archive tail: " + path, error);
    }
    EndRecord record;
    if (!locateEndRecord(tail.data(), tail.size(), tailOffset, &record, error)) {
        return false;
    }

    // 2) 读取中央目录区间。
    std::vector<uint8_t> dir(record.dirSize);
    in.seekg(static_cast<std::streamoff>(record.dirOffset), std::ios::beg);
    if (record.dirSize > 0 && !in.read(reinterpret_cast<char*>(dir.data()),
                                       static_cast<std::streamsize>(record.dirSize))) {
        return setZipError("failed to read central directory: " + path, error);
    }
    return parseEntries(dir.data(), dir.size(), record.entryCount, entries, error);
}

bool readZipEntryNames(const std::string& path,
                       std::vector<std::string>* names,
                       std::string* error) {
    if (names == nullptr) {
        return setZipError("internal error: null names output", error);
    }
    std::vector<ZipEntryInfo> entries;
    if (!readZipEntries(path, &entries, error)) {
        return false;
    }
    names->clear();
    names->reserve(entries.size());
    for (ZipEntryInfo& entry : entries) {
        names->push_back(std::move(entry.name));
    }
    return true;
}

// 结束命名空间。
}  // namespace apkc::archive
