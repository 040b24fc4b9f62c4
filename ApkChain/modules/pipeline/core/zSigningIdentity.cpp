#include "zSigningIdentity.h"

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "zFile.h"
#include "zLog.h"
#include "zStageRunner.h"

namespace apkc {

namespace {

// flock 排他锁；析构时解锁并关闭。
class ScopedFileLock {
public:
    ScopedFileLock() = default;
    ~ScopedFileLock() {
        if (fd_ >= 0) {
            ::flock(fd_, LOCK_UN);
            ::close(fd_);
        }
    }
    ScopedFileLock(const ScopedFileLock&) = delete;
    ScopedFileLock& operator=(const ScopedFileLock&) = delete;

    bool acquire(const std::string& path, std::string* message) {
        fd_ = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
        if (fd_ < 0) {
            *message = std::string("open lock file failed: ") + std::strerror(errno);
            return false;
        }
        // 被信号打断时重试，其余错误直接失败。
        int rc = 0;
        do {
            rc = ::flock(fd_, LOCK_EX);
        } while (rc != 0 && errno == EINTR);
        if (rc != 0) {
            *message = std::string("flock failed: ") + std::strerror(errno);
            ::close(fd_);
            fd_ = -1;
            return false;
        }
        return true;
    }

private:
    int fd_ = -1;
};

void fillIdentity(const DebugIdentityDefaults& defaults,
                  const std::string& keystorePath,
                  SigningIdentity* identity) {
    if (identity == nullptr) {
        return;
    }
    identity->keystorePath = keystorePath;
    identity->alias = defaults.alias;
    identity->storePass = defaults.storePass;
    identity->keyPass = defaults.keyPass;
    identity->systemOwned = true;
}

}  // namespace

std::string debugKeystorePath(const DebugIdentityDefaults& defaults, const ToolchainConfig& toolchain) {
    return base::file::joinPath(toolchain.keystoreDir, defaults.keystoreFileName);
}

std::vector<std::string> buildKeytoolCommand(const DebugIdentityDefaults& defaults,
                                             const ToolchainConfig& toolchain,
                                             const std::string& keystorePath) {
    return {toolchain.keytool,
            "-genkey",
            "-v",
            "-keystore",
            keystorePath,
            "-alias",
            defaults.alias,
            "-keyalg",
            defaults.keyAlgorithm,
            "-keysize",
            std::to_string(defaults.keySize),
            "-validity",
            std::to_string(defaults.validityDays),
            "-storepass",
            defaults.storePass,
            "-keypass",
            defaults.keyPass,
            "-dname",
            defaults.distinguishedName};
}

bool ensureDebugIdentity(const DebugIdentityDefaults& defaults,
                         const ToolchainConfig& toolchain,
                         SigningIdentity* identity,
                         bool* generated,
                         PipelineError* error) {
    if (generated != nullptr) {
        *generated = false;
    }
    if (toolchain.keystoreDir.empty()) {
        return setError(error, ErrorKind::kSign, ErrorReason::kPrecondition, "keystore",
                        "keystore directory is not configured");
    }
    if (!base::file::ensureDirectory(toolchain.keystoreDir)) {
        return setError(error, ErrorKind::kSign, ErrorReason::kIo, "keystore",
                        "failed to create keystore directory", toolchain.keystoreDir);
    }
    const std::string keystorePath = debugKeystorePath(defaults, toolchain);

    // 检查与生成放在同一把锁内。
    ScopedFileLock lock;
    std::string lockMessage;
    if (!lock.acquire(keystorePath + ".lock", &lockMessage)) {
        return setError(error, ErrorKind::kSign, ErrorReason::kIo, "keystore", lockMessage,
                        keystorePath + ".lock");
    }

    if (base::file::fileExists(keystorePath)) {
        LOGD("reusing debug keystore: %s", keystorePath.c_str());
        fillIdentity(defaults, keystorePath, identity);
        return true;
    }

    LOGI("generating debug keystore: %s", keystorePath.c_str());
    StageSpec spec;
    spec.name = "keystore";
    spec.tool = "keytool";
    spec.invocation = makeInvocation(buildKeytoolCommand(defaults, toolchain, keystorePath), toolchain);
    spec.expectedArtifact = keystorePath;
    spec.artifactType = ArtifactType::kFile;
    if (!runStage(spec, nullptr, error)) {
        return retagError(error, ErrorKind::kSign, "failed to generate debug keystore");
    }
    fillIdentity(defaults, keystorePath, identity);
    if (generated != nullptr) {
        *generated = true;
    }
    return true;
}

bool validateSigningIdentity(const SigningIdentity& identity, PipelineError* error) {
    if (identity.keystorePath.empty() || !base::file::fileExists(identity.keystorePath)) {
        return setError(error, ErrorKind::kSign, ErrorReason::kPrecondition, "sign",
                        "keystore not found", identity.keystorePath);
    }
    if (identity.alias.empty()) {
        return setError(error, ErrorKind::kSign, ErrorReason::kPrecondition, "sign",
                        "key alias is empty", identity.keystorePath);
    }
    return true;
}

}  // namespace apkc
