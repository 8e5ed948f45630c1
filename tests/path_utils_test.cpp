#include <gtest/gtest.h>

#include "landrop/PathUtils.h"
#include "test_support.h"

using namespace LanDrop;

TEST(PathUtilsTest, StripsFileUrlPrefix) {
    EXPECT_EQ(PathUtils::stripFileUrl("file:///home/a/b.txt"), "/home/a/b.txt");
    EXPECT_EQ(PathUtils::stripFileUrl("/home/a/b.txt"), "/home/a/b.txt");
    EXPECT_EQ(PathUtils::stripFileUrl(""), "");
}

TEST(PathUtilsTest, SafeFileNameKeepsLastComponent) {
    EXPECT_EQ(PathUtils::safeFileName("report.txt"), "report.txt");
    EXPECT_EQ(PathUtils::safeFileName("../../etc/passwd"), "passwd");
    EXPECT_EQ(PathUtils::safeFileName("C:\\Users\\bob\\photo.jpg"), "photo.jpg");
    EXPECT_EQ(PathUtils::safeFileName("dir/"), "dir");
}

TEST(PathUtilsTest, SafeFileNameRejectsUnusableNames) {
    EXPECT_EQ(PathUtils::safeFileName(""), "");
    EXPECT_EQ(PathUtils::safeFileName("."), "");
    EXPECT_EQ(PathUtils::safeFileName(".."), "");
    EXPECT_EQ(PathUtils::safeFileName("/"), "");
}

class UniqueFilePathTest : public LanDropTest::TempDirTest {};

TEST_F(UniqueFilePathTest, FreeNameIsUsedAsIs) {
    EXPECT_EQ(PathUtils::uniqueFilePath(m_dir, "report.txt"), m_dir / "report.txt");
}

/**
 * @test report.txt, then report_1.txt, then report_2.txt
 */
TEST_F(UniqueFilePathTest, CollisionsGetCounterBeforeExtension) {
    writeFile(m_dir / "report.txt", "a");
    const auto first = PathUtils::uniqueFilePath(m_dir, "report.txt");
    EXPECT_EQ(first, m_dir / "report_1.txt");

    writeFile(first, "b");
    EXPECT_EQ(PathUtils::uniqueFilePath(m_dir, "report.txt"), m_dir / "report_2.txt");
}

TEST_F(UniqueFilePathTest, NamesWithoutExtension) {
    writeFile(m_dir / "README", "a");
    EXPECT_EQ(PathUtils::uniqueFilePath(m_dir, "README"), m_dir / "README_1");
}
