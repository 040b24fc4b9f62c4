#include <fstream>
#include <utility>

#include <gtest/gtest.h>

#include "zFile.h"
#include "zStagingArea.h"
#include "zTestSupport.h"

namespace apkc {
namespace {

TEST(StagingAreaTest, CreateAndDestroyOnScopeExit) {
    test::TempDir root;
    std::string stagedPath;
    {
        StagingArea area;
        PipelineError error;
        ASSERT_TRUE(StagingArea::create(root.path(), "apkchain-t-", &area, &error));
        ASSERT_TRUE(area.isValid());
        stagedPath = area.path();
        EXPECT_TRUE(base::file::directoryExists(stagedPath));
        EXPECT_NE(base::file::fileName(stagedPath).find("apkchain-t-"), std::string::npos);
        std::ofstream(area.file("nested.txt")) << "data";
    }
    EXPECT_FALSE(base::file::pathExists(stagedPath));
    EXPECT_EQ(test::countEntries(root.path()), 0u);
}

TEST(StagingAreaTest, MoveTransfersOwnership) {
    test::TempDir root;
    StagingArea first;
    ASSERT_TRUE(StagingArea::create(root.path(), "apkchain-t-", &first, nullptr));
    const std::string path = first.path();
    StagingArea second(std::move(first));
    EXPECT_FALSE(first.isValid());
    EXPECT_EQ(second.path(), path);
    EXPECT_TRUE(base::file::directoryExists(path));
    EXPECT_TRUE(second.destroy());
    EXPECT_FALSE(base::file::pathExists(path));
}

TEST(StagingAreaTest, CopyOutSurvivesDestruction) {
    test::TempDir root;
    const std::string destination = root.file("out/result.apk");
    ASSERT_TRUE(base::file::ensureParentDirectory(destination));
    {
        StagingArea area;
        ASSERT_TRUE(StagingArea::create(root.file("staging"), "apkchain-t-", &area, nullptr));
        std::ofstream(area.file("built.apk")) << "payload";
        PipelineError error;
        ASSERT_TRUE(area.copyOut(area.file("built.apk"), destination, &error));
    }
    EXPECT_EQ(test::readText(destination), "payload");
    EXPECT_EQ(test::countEntries(root.file("staging")), 0u);
}

TEST(StagingAreaTest, WithStagingAreaRemovesOnSuccessAndFailure) {
    test::TempDir root;
    std::string seen;
    PipelineError error;
    EXPECT_TRUE(withStagingArea(
        root.path(), "apkchain-t-",
        [&](const StagingArea& area, PipelineError*) {
            seen = area.path();
            return base::file::directoryExists(seen);
        },
        &error));
    EXPECT_FALSE(base::file::pathExists(seen));

    EXPECT_FALSE(withStagingArea(
        root.path(), "apkchain-t-",
        [&](const StagingArea& area, PipelineError* stageError) {
            seen = area.path();
            std::ofstream(area.file("partial.apk")) << "x";
            return setError(stageError, ErrorKind::kBuild, ErrorReason::kNonZeroExit, "build",
                            "boom");
        },
        &error));
    EXPECT_FALSE(base::file::pathExists(seen));
    EXPECT_EQ(error.kind, ErrorKind::kBuild);
    EXPECT_EQ(test::countEntries(root.path()), 0u);
}

}  // namespace
}  // namespace apkc
