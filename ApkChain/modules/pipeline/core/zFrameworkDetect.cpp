#include "zFrameworkDetect.h"

#include <algorithm>
#include <set>
#include <unordered_set>

#include "zLog.h"
#include "zValidationGate.h"
#include "zZipIndex.h"

namespace apkc {

namespace {

bool endsWith(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool startsWith(const std::string& text, const std::string& prefix) {
    return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

}  // namespace

bool FrameworkReport::hasFramework(const std::string& name) const {
    return std::any_of(frameworks.begin(), frameworks.end(),
                       [&](const FrameworkMatch& match) { return match.name == name; });
}

std::string FrameworkReport::frameworkNames() const {
    if (frameworks.empty()) {
        return "None";
    }
    std::string joined;
    for (const FrameworkMatch& match : frameworks) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += match.name;
    }
    return joined;
}

const std::vector<FrameworkSignature>& builtinFrameworkSignatures() {
    static const std::vector<FrameworkSignature> kSignatures = {
        {"Flutter",
         {"lib/arm64-v8a/libflutter.so",
          "lib/armeabi-v7a/libflutter.so",
          "lib/x86_64/libflutter.so",
          "assets/flutter_assets/"}},
        {"React Native",
         {"lib/arm64-v8a/libreactnativejni.so",
          "lib/armeabi-v7a/libreactnativejni.so",
          "lib/x86/libreactnativejni.so",
          "lib/x86_64/libreactnativejni.so",
          "assets/index.android.bundle"}},
        {"Xamarin",
         {"assemblies/Xamarin.Android.dll",
          "assemblies/Mono.Android.dll",
          "lib/arm64-v8a/libmonosgen-2.0.so",
          "lib/armeabi-v7a/libmonosgen-2.0.so"}},
        {"Cordova", {"assets/www/cordova.js", "assets/www/cordova_plugins.js"}},
        {"Unity",
         {"lib/arm64-v8a/libunity.so", "lib/armeabi-v7a/libunity.so", "assets/bin/Data/"}},
    };
    return kSignatures;
}

std::vector<FrameworkMatch> matchFrameworks(const std::vector<std::string>& entryNames,
                                            const std::vector<FrameworkSignature>& signatures) {
    const std::unordered_set<std::string> entrySet(entryNames.begin(), entryNames.end());
    std::vector<FrameworkMatch> matches;
    for (const FrameworkSignature& signature : signatures) {
        std::set<std::string> evidence;
        for (const std::string& path : signature.paths) {
            if (endsWith(path, "/")) {
                // 目录特征：任一条目以该前缀开头即命中。
                const bool hit = std::any_of(entryNames.begin(), entryNames.end(),
                                             [&](const std::string& entry) { return startsWith(entry, path); });
                if (hit) {
                    evidence.insert(path);
                }
            } else if (entrySet.count(path) != 0) {
                evidence.insert(path);
            }
        }
        if (!evidence.empty()) {
            matches.push_back({signature.name, std::vector<std::string>(evidence.begin(), evidence.end())});
        }
    }
    std::sort(matches.begin(), matches.end(),
              [](const FrameworkMatch& a, const FrameworkMatch& b) { return a.name < b.name; });
    return matches;
}

std::vector<std::string> collectNativeLibraries(const std::vector<std::string>& entryNames) {
    std::vector<std::string> libs;
    for (const std::string& entry : entryNames) {
        if (endsWith(entry, ".so")) {
            libs.push_back(entry);
        }
    }
    std::sort(libs.begin(), libs.end());
    return libs;
}

bool detectFrameworks(const std::string& apkPath,
                      bool includeNativeLibs,
                      FrameworkReport* report,
                      PipelineError* error) {
    if (!validateApkPath(apkPath, false, "analyze", error)) {
        return false;
    }
    std::vector<std::string> names;
    std::string zipError;
    if (!archive::readZipEntryNames(apkPath, &names, &zipError)) {
        return setError(error, ErrorKind::kValidation, ErrorReason::kPrecondition, "analyze",
                        "invalid APK (not a valid ZIP file): " + zipError, apkPath);
    }
    FrameworkReport local;
    local.apkPath = apkPath;
    local.frameworks = matchFrameworks(names, builtinFrameworkSignatures());
    if (includeNativeLibs) {
        local.nativeLibraries = collectNativeLibraries(names);
    }
    LOGD("%s: %zu entries, frameworks: %s", apkPath.c_str(), names.size(),
         local.frameworkNames().c_str());
    if (report != nullptr) {
        *report = std::move(local);
    }
    return true;
}

}  // namespace apkc
