#pragma once

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <string>

namespace grader {

/**
 * @brief 读取文件的全部内容
 * @param path 文件路径
 * @return 文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 将字符串写入文件，文件所在的文件夹不存在时会自动创建
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 复制文件，目标文件所在的文件夹不存在时会自动创建，目标文件存在时覆盖
 */
void place_file(const std::filesystem::path &from, const std::filesystem::path &to);

/**
 * @brief 删除并重新创建文件夹，保证文件夹中不会有上次运行残留的文件
 * @throw std::filesystem::filesystem_error 无法删除旧的内容或无法创建文件夹时
 */
void recreate_directory(const std::filesystem::path &dir);

/**
 * @brief 将字符串中非法的 UTF-8 字节序列替换为 U+FFFD
 * 选手程序的输出可能包含任意字节，写入 JSON 报告前必须先处理
 */
std::string sanitize_utf8(const std::string &string);

/**
 * @brief 截断字符串，最多保留 max_bytes 个字节
 */
std::string truncate(const std::string &string, std::size_t max_bytes);

/**
 * @brief 断言 subpath 一定不会出现返回上一层目录的情况
 * 这里用于确保计算沙箱内路径时不会出现目录遍历攻击，题目配置中的
 * 文件名如果包含 "../"，那么有可能覆盖沙箱外的文件。
 * @param subpath 被检查的文件名
 * @return subpath
 */
std::string assert_safe_path(const std::string &subpath);

/**
 * @brief 生成一个随机的字符串，用于生成不会冲突的文件名
 */
std::string random_token();

/**
 * @brief 随机命名的临时文件，离开作用域时（包括异常）自动删除
 */
struct temporary_file {
    /**
     * @param dir 临时文件所在的文件夹
     * @param suffix 临时文件名后缀
     */
    temporary_file(const std::filesystem::path &dir, const std::string &suffix);
    temporary_file(const temporary_file &) = delete;
    ~temporary_file();

    const std::filesystem::path &path() const;

    std::fstream &stream();

private:
    std::filesystem::path file;
    std::fstream handle;
};

}  // namespace grader
