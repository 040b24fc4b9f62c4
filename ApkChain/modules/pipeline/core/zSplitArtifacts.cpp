#include "zSplitArtifacts.h"

#include "zFile.h"

namespace apkc {

const char* const kSplitNameMarker = "split_";

bool isSplitArtifactName(const std::string& path) {
    return base::file::fileName(path).find(kSplitNameMarker) != std::string::npos;
}

SplitArtifactSet classifySplitArtifacts(const std::vector<std::string>& apkPaths) {
    SplitArtifactSet set;
    // 非 split 的额外文件排在 split 之后，保持各自的输入顺序。
    std::vector<std::string> extras;
    for (const std::string& path : apkPaths) {
        if (isSplitArtifactName(path)) {
            set.splits.push_back(path);
        } else if (set.base.empty()) {
            set.base = path;
        } else {
            extras.push_back(path);
        }
    }
    set.splits.insert(set.splits.end(), extras.begin(), extras.end());
    return set;
}

}  // namespace apkc
