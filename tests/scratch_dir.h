#ifndef SOURCER_TESTS_SCRATCH_DIR_H
#define SOURCER_TESTS_SCRATCH_DIR_H

#include <unistd.h>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>

#include <gtest/gtest.h>

namespace sourcer::test {

// A fresh directory that tests run inside of; removed again on teardown.
class ScratchDirTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();

        m_root = std::filesystem::temp_directory_path() /
                 (std::string{"sourcer-"} + info->test_suite_name() + "-" +
                  info->name() + "-" + std::to_string(getpid()));

        std::filesystem::remove_all(m_root);
        std::filesystem::create_directories(m_root);

        m_previous = std::filesystem::current_path();
        std::filesystem::current_path(m_root);
    }

    void TearDown() override {
        std::filesystem::current_path(m_previous);

        std::error_code code;
        std::filesystem::remove_all(m_root, code);
    }

    void touch(const std::filesystem::path& path, std::string_view content = "") {
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }

        std::ofstream file{path};
        file << content;
    }

    [[nodiscard]] const std::filesystem::path& root() const { return m_root; }

private:
    std::filesystem::path m_root;
    std::filesystem::path m_previous;
};

[[nodiscard]] inline std::string read_stream(std::FILE* stream) {
    std::string result;
    std::rewind(stream);

    char buffer[256];
    std::size_t count = 0;

    while ((count = std::fread(buffer, 1, sizeof buffer, stream)) > 0) {
        result.append(buffer, count);
    }

    return result;
}

} // namespace sourcer::test

#endif
