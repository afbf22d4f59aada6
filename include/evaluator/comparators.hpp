#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "evaluator/filters.hpp"

namespace grader {

/**
 * @brief 一次比较的结果
 */
struct comparison {
    bool success = false;

    /**
     * @brief 比较器生成的可视化结果（HTML），比如图片比较器会并排展示两张图片
     */
    std::optional<std::string> output;

    /**
     * @brief 期望内容和实际内容的差异
     */
    std::optional<std::string> diff;
};

/**
 * @brief 比较期望文件和实际文件的比较器
 */
struct comparator {
    virtual ~comparator() = default;

    /**
     * @brief 比较器的类型，config.yml 中 comparators 的 type 使用这个名称
     */
    virtual std::string type() const = 0;

    /**
     * @param expected 期望文件
     * @param actual 选手程序生成的文件
     * @param filters 比较前对文本应用的过滤器，只有文本比较器使用
     */
    virtual comparison compare(const std::filesystem::path &expected, const std::filesystem::path &actual, const std::vector<filter_ptr> &filters) const = 0;
};

/**
 * @brief 注册比较器，同类型的比较器会被覆盖
 * 内置比较器：text、binary、image
 */
void register_comparator(std::unique_ptr<comparator> &&comparator);

/**
 * @brief 根据类型查找比较器
 * @throw configuration_error 比较器不存在时
 */
const comparator &get_comparator(const std::string &type);

/**
 * @brief 判断比较器是否存在
 */
bool has_comparator(const std::string &type);

/**
 * @brief 对两段文本应用过滤器后比较是否完全一致
 */
bool text_equals(const std::string &expected, const std::string &actual, const std::vector<filter_ptr> &filters);

/**
 * @brief 生成逐行的差异，以 '-' 开头的行仅在 expected 中出现，以 '+' 开头的行仅在 actual 中出现
 */
std::string line_diff(const std::string &expected, const std::string &actual);

/**
 * @brief 默认的比较器，对两个文件应用过滤器后逐字节比较
 */
struct text_comparator : public comparator {
    std::string type() const override;
    comparison compare(const std::filesystem::path &expected, const std::filesystem::path &actual, const std::vector<filter_ptr> &filters) const override;
};

/**
 * @brief 逐字节比较，不应用过滤器
 */
struct binary_comparator : public comparator {
    std::string type() const override;
    comparison compare(const std::filesystem::path &expected, const std::filesystem::path &actual, const std::vector<filter_ptr> &filters) const override;
};

/**
 * @brief 比较两张图片，并生成并排展示两张图片的 HTML
 */
struct image_comparator : public comparator {
    std::string type() const override;
    comparison compare(const std::filesystem::path &expected, const std::filesystem::path &actual, const std::vector<filter_ptr> &filters) const override;
};

}  // namespace grader
