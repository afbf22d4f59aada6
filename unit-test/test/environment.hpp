#pragma once

#include <filesystem>
#include <string>
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"

/**
 * 测试用的环境
 * 测试使用 fixtures/fake_isolate.sh 代替 isolate，沙箱是 FAKE_ISOLATE_ROOT 下的普通文件夹，
 * 因此不需要 root 权限就可以完整地运行评测流程。
 */
namespace grader::fixture {

inline std::filesystem::path &test_root() {
    static std::filesystem::path root = std::filesystem::temp_directory_path() / ("grader-test-" + random_token());
    return root;
}

inline void setup_test_environment() {
    std::filesystem::create_directories(test_root() / "boxes");
    set_env("FAKE_ISOLATE_ROOT", (test_root() / "boxes").string());
    ISOLATE_PATH = GRADER_FAKE_ISOLATE;
    BOX_ID = 0;
    USE_CGROUPS = true;
}

inline void teardown_test_environment() {
    std::error_code ec;
    std::filesystem::remove_all(test_root(), ec);
}

/**
 * @brief 测试用的临时文件夹，析构时删除
 */
struct temp_dir {
    std::filesystem::path path;

    temp_dir() : path(test_root() / random_token()) {
        std::filesystem::create_directories(path);
    }

    temp_dir(const temp_dir &) = delete;

    ~temp_dir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::filesystem::path operator/(const std::string &name) const {
        return path / name;
    }

    std::filesystem::path write(const std::string &name, const std::string &content) const {
        write_file_content(path / name, content);
        return path / name;
    }

    /**
     * @brief 写入可执行的脚本
     */
    std::filesystem::path write_executable(const std::string &name, const std::string &content) const {
        write_file_content(path / name, content);
        std::filesystem::permissions(path / name,
                                     std::filesystem::perms::owner_all | std::filesystem::perms::group_read | std::filesystem::perms::group_exec |
                                         std::filesystem::perms::others_read | std::filesystem::perms::others_exec);
        return path / name;
    }
};

}  // namespace grader::fixture
