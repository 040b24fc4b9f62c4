#pragma once

#include <string>
#include <vector>

#include "zPipelineTypes.h"

namespace apkc {

// split 文件名标记。
extern const char* const kSplitNameMarker;

// 文件名（不含目录）包含 "split_" 即视为 split。
bool isSplitArtifactName(const std::string& path);

// 分类 APK 路径列表：首个非 split 为 base，其余非 split 追加到 splits 尾部。
SplitArtifactSet classifySplitArtifacts(const std::vector<std::string>& apkPaths);

}  // namespace apkc
