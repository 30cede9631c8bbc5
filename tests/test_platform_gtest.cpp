// ==============================================================================
// test_platform_gtest.cpp - Тесты платформенного модуля (GoogleTest)
// ==============================================================================

#include "domaindump/platform.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <iostream>
#include <sstream>
#include <string>

namespace domaindump::platform::test {

namespace {

// Временная подмена буфера std::cin
class CinRedirect {
public:
    explicit CinRedirect(const std::string& input) : input_(input), saved_(std::cin.rdbuf()) {
        std::cin.rdbuf(input_.rdbuf());
    }
    ~CinRedirect() {
        std::cin.rdbuf(saved_);
        std::cin.clear();
    }

    CinRedirect(const CinRedirect&) = delete;
    CinRedirect& operator=(const CinRedirect&) = delete;

private:
    std::istringstream input_;
    std::streambuf* saved_;
};

}  // anonymous namespace

// ==============================================================================
// Пути
// ==============================================================================

TEST(PlatformTest, PathConversion_Roundtrip) {
    std::string original = "/tmp/dump/domain_users.html";
    EXPECT_EQ(path_to_utf8(path_from_utf8(original)), original);
}

TEST(PlatformTest, PathConversion_RoundtripWithCyrillic) {
    std::string original = "/tmp/отчёты/пользователи.json";
    EXPECT_EQ(path_to_utf8(path_from_utf8(original)), original);
}

TEST(PlatformTest, PathFromUtf8_WithSpaces) {
    auto p = path_from_utf8("out dir/domain users.grep");
    EXPECT_EQ(p.filename().string(), "domain users.grep");
}

TEST(PlatformTest, PathFromUtf8_EmptyString) {
    EXPECT_TRUE(path_from_utf8("").empty());
}

// ==============================================================================
// Временные каталоги
// ==============================================================================

TEST(PlatformTest, MakeTempDir_CreatesDirectory) {
    auto dir = make_temp_dir("domaindump_test");

    EXPECT_TRUE(std::filesystem::is_directory(dir));
    EXPECT_EQ(dir.filename().string().rfind("domaindump_test_", 0), 0u);

    std::filesystem::remove_all(dir);
}

TEST(PlatformTest, MakeTempDir_Unique) {
    auto a = make_temp_dir("domaindump_test");
    auto b = make_temp_dir("domaindump_test");

    EXPECT_NE(a, b);

    std::filesystem::remove_all(a);
    std::filesystem::remove_all(b);
}

TEST(PlatformTest, MakeTempDir_IsWritable) {
    auto dir = make_temp_dir("domaindump_test");
    auto file = dir / "writable.txt";
    {
        std::ofstream out(file);
        out << "ok";
    }
    EXPECT_TRUE(std::filesystem::exists(file));

    std::filesystem::remove_all(dir);
}

// ==============================================================================
// Пароль
// ==============================================================================

TEST(PlatformTest, ReadPassword_ReadsLine) {
    CinRedirect input("s3cret\r\nignored\n");
    ::testing::internal::CaptureStderr();
    auto password = read_password("Password: ");
    std::string prompt = ::testing::internal::GetCapturedStderr();

    ASSERT_TRUE(password.has_value());
    EXPECT_EQ(*password, "s3cret");
    EXPECT_EQ(prompt.rfind("Password: ", 0), 0u);
}

TEST(PlatformTest, ReadPassword_EofIsNullopt) {
    CinRedirect input("");
    ::testing::internal::CaptureStderr();
    auto password = read_password("Password: ");
    ::testing::internal::GetCapturedStderr();

    EXPECT_FALSE(password.has_value());
}

}  // namespace domaindump::platform::test
