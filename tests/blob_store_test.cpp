#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>

#include "storage/blob_store.hpp"
#include "test_support.hpp"

namespace scriptbox::storage {
namespace {

TEST(BlobStoreTest, SanitizeReplacesUnsafeBytes) {
    EXPECT_EQ(SanitizeUploadName("hello world.py"), "hello_world.py");
    EXPECT_EQ(SanitizeUploadName("a/b\\c.sh"), "a_b_c.sh");
    EXPECT_EQ(SanitizeUploadName("ok-name_1.js"), "ok-name_1.js");
}

TEST(BlobStoreTest, CreatesMissingRoot) {
    testing::TempDir dir("scriptbox_store");
    const auto root = dir.Path() / "nested" / "uploads";
    DirectoryBlobStore store(root);
    EXPECT_TRUE(std::filesystem::is_directory(root));
    EXPECT_TRUE(store.List().empty());
}

TEST(BlobStoreTest, SaveStoresExecutableFileUnderPrefixedName) {
    testing::TempDir dir("scriptbox_store");
    DirectoryBlobStore store(dir.Path());

    const auto name = store.Save("my script.sh", "echo hi\n");
    ASSERT_TRUE(name.has_value());
    EXPECT_NE(name->find("_my_script.sh"), std::string::npos);
    EXPECT_EQ(name->find('/'), std::string::npos);

    const auto path = store.Resolve(*name);
    ASSERT_TRUE(path.has_value());
    std::ifstream input(*path, std::ios::binary);
    const std::string content((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
    EXPECT_EQ(content, "echo hi\n");

    const auto perms = std::filesystem::status(*path).permissions();
    EXPECT_NE(perms & std::filesystem::perms::owner_exec, std::filesystem::perms::none);
}

TEST(BlobStoreTest, SaveNeutralizesTraversalInUploadName) {
    testing::TempDir dir("scriptbox_store");
    DirectoryBlobStore store(dir.Path());

    const auto name = store.Save("../../etc/passwd", "x");
    ASSERT_TRUE(name.has_value());
    EXPECT_EQ(name->find(".."), std::string::npos);
    EXPECT_TRUE(std::filesystem::exists(dir.Path() / *name));
}

TEST(BlobStoreTest, ListReportsSizeNewestFirst) {
    testing::TempDir dir("scriptbox_store");
    DirectoryBlobStore store(dir.Path());
    dir.Write("old.sh", "12345");
    std::filesystem::last_write_time(
        dir.Path() / "old.sh",
        std::filesystem::file_time_type::clock::now() - std::chrono::hours(1));
    dir.Write("new.sh", "1");
    std::filesystem::create_directory(dir.Path() / "subdir");

    const auto entries = store.List();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].name, "new.sh");
    EXPECT_EQ(entries[0].size, 1u);
    EXPECT_EQ(entries[1].name, "old.sh");
    EXPECT_EQ(entries[1].size, 5u);
    EXPECT_GT(entries[0].mtime_ms, entries[1].mtime_ms);
}

TEST(BlobStoreTest, ResolveRejectsInvalidAndMissingNames) {
    testing::TempDir dir("scriptbox_store");
    DirectoryBlobStore store(dir.Path());
    dir.Write("present.py", "print(1)\n");
    std::filesystem::create_directory(dir.Path() / "folder");

    EXPECT_TRUE(store.Resolve("present.py").has_value());
    EXPECT_FALSE(store.Resolve("absent.py").has_value());
    EXPECT_FALSE(store.Resolve("../present.py").has_value());
    EXPECT_FALSE(store.Resolve("folder").has_value());
    EXPECT_FALSE(store.Resolve("").has_value());
}

TEST(BlobStoreTest, RemoveReportsOutcome) {
    testing::TempDir dir("scriptbox_store");
    DirectoryBlobStore store(dir.Path());
    dir.Write("gone.sh", "true\n");

    EXPECT_EQ(store.Remove("gone.sh").status, RemoveStatus::kRemoved);
    EXPECT_FALSE(std::filesystem::exists(dir.Path() / "gone.sh"));
    EXPECT_EQ(store.Remove("gone.sh").status, RemoveStatus::kNotFound);
    EXPECT_EQ(store.Remove("../gone.sh").status, RemoveStatus::kNotFound);
}

}  // namespace
}  // namespace scriptbox::storage
