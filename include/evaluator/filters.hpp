#pragma once

#include <memory>
#include <string>
#include <vector>

namespace grader {

/**
 * @brief 比较之前对文本进行规范化的过滤器
 * 过滤器必须是无状态的，且对同一文本应用两次的结果与应用一次相同
 */
struct filter {
    virtual ~filter() = default;

    /**
     * @brief 过滤器的名称，config.yml 中 filters 列表使用这个名称（不区分大小写）
     */
    virtual std::string name() const = 0;

    virtual std::string apply(const std::string &text) const = 0;
};

typedef std::shared_ptr<const filter> filter_ptr;

/**
 * @brief 按顺序依次应用过滤器
 */
std::string apply_filters(std::string text, const std::vector<filter_ptr> &filters);

/**
 * @brief 注册过滤器，同名的过滤器会被覆盖
 * 内置过滤器：whitespace、trim、lowercase、crlf
 */
void register_filter(std::unique_ptr<filter> &&filter);

/**
 * @brief 根据名称查找过滤器
 * @throw configuration_error 过滤器不存在时
 */
filter_ptr get_filter(const std::string &name);

/**
 * @brief 将连续的空格和制表符合并为一个空格，并删除行末的空白字符
 */
struct whitespace_filter : public filter {
    std::string name() const override;
    std::string apply(const std::string &text) const override;
};

/**
 * @brief 删除每行行末的空白字符，以及文末的空行
 */
struct trim_filter : public filter {
    std::string name() const override;
    std::string apply(const std::string &text) const override;
};

struct lowercase_filter : public filter {
    std::string name() const override;
    std::string apply(const std::string &text) const override;
};

/**
 * @brief 将 Windows 换行符 CRLF 转换为 LF
 */
struct crlf_filter : public filter {
    std::string name() const override;
    std::string apply(const std::string &text) const override;
};

}  // namespace grader
