#include "zValidationGate.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <filesystem>

#include "zFile.h"

namespace fs = std::filesystem;

namespace apkc {

const unsigned char kZipLocalHeaderMagic[4] = {'P', 'K', 0x03, 0x04};
const char* const kApktoolMarkerFile = "apktool.yml";

namespace {

// 把字节转成可读形式（可打印字符原样，其余 \xNN）。
std::string renderBytes(const std::vector<uint8_t>& bytes) {
    std::string out;
    for (uint8_t b : bytes) {
        if (b >= 0x20 && b < 0x7f && b != '\\') {
            out.push_back(static_cast<char>(b));
        } else {
            char hex[8];
            std::snprintf(hex, sizeof(hex), "\\x%02x", b);
            out += hex;
        }
    }
    return out;
}

bool fail(std::string* message, const std::string& text) {
    if (message != nullptr) {
        *message = text;
    }
    return false;
}

}  // namespace

ValidationGate gateExists(const std::string& path) {
    return ValidationGate{GateKind::kExists, path, std::string()};
}

ValidationGate gateIsFile(const std::string& path) {
    return ValidationGate{GateKind::kIsFile, path, std::string()};
}

ValidationGate gateIsDirectory(const std::string& path) {
    return ValidationGate{GateKind::kIsDirectory, path, std::string()};
}

ValidationGate gateExtension(const std::string& path, const std::string& ext) {
    return ValidationGate{GateKind::kExtension, path, ext};
}

ValidationGate gateZipHeader(const std::string& path) {
    return ValidationGate{GateKind::kZipHeader, path, std::string()};
}

ValidationGate gateMarkerFile(const std::string& dir, const std::string& marker) {
    return ValidationGate{GateKind::kMarkerFile, dir, marker};
}

ValidationGate gateContainsExtension(const std::string& dir, const std::string& ext) {
    return ValidationGate{GateKind::kContainsExtension, dir, ext};
}

bool evaluateGate(const ValidationGate& gate, std::string* message) {
    switch (gate.kind) {
        case GateKind::kExists:
            if (!base::file::pathExists(gate.path)) {
                return fail(message, "not found: " + gate.path);
            }
            return true;
        case GateKind::kIsFile:
            if (!base::file::fileExists(gate.path)) {
                return fail(message, "not a file: " + gate.path);
            }
            return true;
        case GateKind::kIsDirectory:
            if (!base::file::directoryExists(gate.path)) {
                return fail(message, "not a directory: " + gate.path);
            }
            return true;
        case GateKind::kExtension: {
            std::string want = gate.param;
            std::transform(want.begin(), want.end(), want.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            if (base::file::lowerExtension(gate.path) != want) {
                return fail(message, "expected " + gate.param + " extension: " + gate.path);
            }
            return true;
        }
        case GateKind::kZipHeader: {
            std::vector<uint8_t> head;
            if (!base::file::readFileHead(gate.path, sizeof(kZipLocalHeaderMagic), &head)) {
                return fail(message, "failed to read header: " + gate.path);
            }
            if (head.size() < sizeof(kZipLocalHeaderMagic)) {
                return fail(message, "file is too small to be a valid APK: " + gate.path);
            }
            if (!std::equal(head.begin(), head.end(), kZipLocalHeaderMagic)) {
                return fail(message, "header mismatch, expected PK\\x03\\x04, got " +
                                         renderBytes(head) + ": " + gate.path);
            }
            return true;
        }
        case GateKind::kMarkerFile:
            if (!base::file::directoryExists(gate.path)) {
                return fail(message, "directory not found: " + gate.path);
            }
            if (!base::file::fileExists(base::file::joinPath(gate.path, gate.param))) {
                return fail(message, "missing " + gate.param + " in " + gate.path);
            }
            return true;
        case GateKind::kContainsExtension:
            if (listFilesWithExtension(gate.path, gate.param).empty()) {
                return fail(message, "no " + gate.param + " files found in " + gate.path);
            }
            return true;
    }
    return fail(message, "unknown gate");
}

bool evaluateGates(const std::vector<ValidationGate>& gates,
                   const std::string& stage,
                   PipelineError* error) {
    for (const ValidationGate& gate : gates) {
        std::string message;
        if (!evaluateGate(gate, &message)) {
            return setError(error, ErrorKind::kValidation, ErrorReason::kPrecondition,
                            stage, message, gate.path);
        }
    }
    return true;
}

std::vector<ValidationGate> apkInputGates(const std::string& apkPath, bool requireZipHeader) {
    std::vector<ValidationGate> gates = {
        gateExists(apkPath),
        gateIsFile(apkPath),
        gateExtension(apkPath, ".apk"),
    };
    if (requireZipHeader) {
        gates.push_back(gateZipHeader(apkPath));
    }
    return gates;
}

bool validateApkPath(const std::string& apkPath,
                     bool requireZipHeader,
                     const std::string& stage,
                     PipelineError* error) {
    return evaluateGates(apkInputGates(apkPath, requireZipHeader), stage, error);
}

std::vector<std::string> listFilesWithExtension(const std::string& dir, const std::string& ext) {
    std::vector<std::string> files;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return files;
    }
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec)) {
            continue;
        }
        const std::string path = it->path().string();
        if (base::file::lowerExtension(path) == ext) {
            files.push_back(path);
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

}  // namespace apkc
