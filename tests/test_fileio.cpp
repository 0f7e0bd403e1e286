#include <gtest/gtest.h>
#include <idscrub/fileio.hpp>

#include "test_support.hpp"

#include <cerrno>

namespace idscrub {
namespace fileio {
namespace {

using testing_support::permission_bits;
using testing_support::read_text;
using testing_support::TempDirectory;
using testing_support::write_text;

namespace fs = std::filesystem;

std::size_t count_entries(const fs::path& dir) {
    std::size_t count = 0;
    for (const auto& entry : fs::directory_iterator(dir)) {
        (void)entry;
        ++count;
    }
    return count;
}

TEST(AtomicReplaceTest, ReplacesContent) {
    TempDirectory temp;
    auto path = temp.path() / "storage.json";
    write_text(path, "old");

    auto result = atomic_replace(path, "new content");

    ASSERT_TRUE(result.is_ok()) << result.error_message();
    EXPECT_EQ(read_text(path), "new content");
    EXPECT_EQ(count_entries(temp.path()), 1u);
}

TEST(AtomicReplaceTest, CreatesMissingFile) {
    TempDirectory temp;
    auto path = temp.path() / "fresh.json";

    ASSERT_TRUE(atomic_replace(path, "{}").is_ok());
    EXPECT_EQ(read_text(path), "{}");
    EXPECT_EQ(permission_bits(path), 0644u);
}

TEST(AtomicReplaceTest, PreservesExistingMode) {
    TempDirectory temp;
    auto path = temp.path() / "storage.json";
    write_text(path, "old");
    fs::permissions(path, static_cast<fs::perms>(0444), fs::perm_options::replace);

    ASSERT_TRUE(atomic_replace(path, "new").is_ok());
    EXPECT_EQ(read_text(path), "new");
    EXPECT_EQ(permission_bits(path), 0444u);
}

TEST(AtomicReplaceTest, ExplicitModeWins) {
    TempDirectory temp;
    auto path = temp.path() / "lock.json";

    ReplaceOptions options;
    options.mode = 0600;
    ASSERT_TRUE(atomic_replace(path, "{}", options).is_ok());
    EXPECT_EQ(permission_bits(path), 0600u);
}

TEST(AtomicReplaceTest, InterruptedBeforeRenameLeavesOriginal) {
    TempDirectory temp;
    auto path = temp.path() / "storage.json";
    write_text(path, "original");

    fs::path seen_temp;
    ReplaceOptions options;
    options.before_rename = [&](const fs::path& temp_path) {
        seen_temp = temp_path;
        EXPECT_EQ(read_text(temp_path), "replacement");
        return false;
    };

    auto result = atomic_replace(path, "replacement", options);

    EXPECT_TRUE(result.is_error());
    EXPECT_EQ(result.error_code(), ErrorCode::WriteFailure);
    EXPECT_EQ(read_text(path), "original");
    EXPECT_EQ(seen_temp.parent_path(), temp.path());
    EXPECT_EQ(seen_temp.filename().string().rfind(".storage.json.idscrub-", 0), 0u);
    EXPECT_FALSE(fs::exists(seen_temp));
    EXPECT_EQ(count_entries(temp.path()), 1u);
}

TEST(AtomicReplaceTest, MissingDirectoryIsNotFound) {
    TempDirectory temp;
    auto result = atomic_replace(temp.path() / "absent" / "storage.json", "{}");
    EXPECT_EQ(result.error_code(), ErrorCode::NotFound);
}

TEST(AtomicReplaceTest, EmptyTargetIsInvalid) {
    EXPECT_EQ(atomic_replace("", "x").error_code(), ErrorCode::InvalidParameter);
}

TEST(ReadFileTest, ReadsBytes) {
    TempDirectory temp;
    auto path = temp.path() / "data.bin";
    write_text(path, std::string("a\0b\n", 4));

    auto content = read_file(path);

    ASSERT_TRUE(content.is_ok());
    EXPECT_EQ(content.value(), std::string("a\0b\n", 4));
}

TEST(ReadFileTest, MissingFileIsNotFound) {
    TempDirectory temp;
    EXPECT_EQ(read_file(temp.path() / "absent").error_code(), ErrorCode::NotFound);
}

TEST(ErrorMappingTest, Errno) {
    EXPECT_EQ(error_from_errno(0), ErrorCode::Success);
    EXPECT_EQ(error_from_errno(ENOENT), ErrorCode::NotFound);
    EXPECT_EQ(error_from_errno(EACCES), ErrorCode::PermissionDenied);
    EXPECT_EQ(error_from_errno(EROFS), ErrorCode::PermissionDenied);
    EXPECT_EQ(error_from_errno(ENOSPC), ErrorCode::WriteFailure);
}

TEST(ErrorMappingTest, FilesystemErrorCode) {
    EXPECT_EQ(error_from_error_code({}), ErrorCode::Success);
    EXPECT_EQ(error_from_error_code(std::make_error_code(std::errc::no_such_file_or_directory)),
              ErrorCode::NotFound);
    EXPECT_EQ(error_from_error_code(std::make_error_code(std::errc::permission_denied)),
              ErrorCode::PermissionDenied);
    EXPECT_EQ(error_from_error_code(std::make_error_code(std::errc::no_space_on_device)),
              ErrorCode::WriteFailure);
}

}  // namespace
}  // namespace fileio
}  // namespace idscrub
