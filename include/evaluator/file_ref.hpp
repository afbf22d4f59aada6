#pragma once

#include <filesystem>
#include <fstream>
#include <istream>
#include <iterator>
#include <memory>
#include <sstream>
#include <string>

/**
 * 这个头文件包含表示期望内容的文件引用
 * 期望内容可以保存在题目文件夹中，也可以由 generator 在内存中生成。
 * 这里的类全部在头文件中实现，以便题目提供的扩展程序（共享库）直接使用。
 */
namespace grader {

/**
 * @brief 对一段可读内容的引用，不拥有底层存储
 */
struct file_ref {
    virtual ~file_ref() = default;

    /**
     * @brief 打开文件以读取内容
     */
    virtual std::unique_ptr<std::istream> open() const = 0;

    /**
     * @brief 将内容写入到 dest，dest 所在的文件夹必须存在
     */
    virtual void save(const std::filesystem::path &dest) const = 0;

    /**
     * @brief 文件在磁盘上的路径，内存中的内容返回空路径
     */
    virtual std::filesystem::path path() const = 0;

    /**
     * @brief 读取全部内容
     */
    std::string read() const {
        auto stream = open();
        return std::string((std::istreambuf_iterator<char>(*stream)), std::istreambuf_iterator<char>());
    }
};

/**
 * @brief 表示一个已经在本地磁盘上的文件
 */
struct local_file : public file_ref {
    std::filesystem::path file;

    explicit local_file(const std::filesystem::path &file) : file(file) {}

    std::unique_ptr<std::istream> open() const override {
        return std::make_unique<std::ifstream>(file, std::ios::binary);
    }

    void save(const std::filesystem::path &dest) const override {
        std::filesystem::copy_file(file, dest, std::filesystem::copy_options::overwrite_existing);
    }

    std::filesystem::path path() const override {
        return file;
    }
};

/**
 * @brief 表示已经知道内容的文本（不在磁盘上）
 */
struct text_file : public file_ref {
    std::string text;

    explicit text_file(const std::string &text) : text(text) {}

    std::unique_ptr<std::istream> open() const override {
        return std::make_unique<std::istringstream>(text);
    }

    void save(const std::filesystem::path &dest) const override {
        std::ofstream fout(dest, std::ios::binary | std::ios::trunc);
        fout << text;
    }

    std::filesystem::path path() const override {
        return {};
    }
};

typedef std::shared_ptr<file_ref> file_ptr;

}  // namespace grader
