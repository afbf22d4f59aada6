#pragma once

#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace grader {

/**
 * @brief isolate 运行选手程序后产生的 metadata 文件的解析结果
 * metadata 文件的每一行为 key:value，key 中的 '-' 会被删除，
 * 比如 time-wall 会变成 timewall，max-rss 会变成 maxrss
 */
struct isolate_result {
    /**
     * @brief 程序的返回值，程序被信号终止时没有返回值
     */
    std::optional<int> exit_code;

    /**
     * @brief 终止程序的信号
     */
    std::optional<int> exit_signal;

    /**
     * @brief CPU 时间
     * 单位为秒，如果是多线程程序，所有线程的 CPU 时间会累加
     */
    std::optional<double> cpu_time;

    /**
     * @brief 时钟时间
     * 单位为秒
     */
    std::optional<double> wall_time;

    /**
     * @brief control group 统计的内存使用
     * 单位为 KB
     */
    std::optional<long long> memory;

    /**
     * @brief isolate 给出的运行状态
     * RE: 返回值非零，SG: 被信号终止，TO: 超时，XX: isolate 内部错误
     */
    std::optional<std::string> status;

    /**
     * @brief isolate 给出的状态描述
     */
    std::optional<std::string> message;

    /**
     * @brief 其他无法识别的键值对，原样保留
     * isolate 新版本可能会增加新的键，比如 csw-voluntary、killed
     */
    std::map<std::string, std::string> extras;
};

/**
 * @brief 读入 isolate 产生的 metadata 文件
 * @param metafile metadata 文件路径，文件不存在时返回空表
 * @return 键（已经删除了 '-'）到值的映射
 */
std::map<std::string, std::string> read_isolate_metadata(const std::filesystem::path &metafile);

/**
 * @brief 读入并解析 isolate 产生的 metadata 文件
 */
isolate_result read_isolate_result(const std::filesystem::path &metafile);

/**
 * @brief 将 metadata 的键值对解析为 isolate_result
 */
isolate_result parse_isolate_metadata(const std::map<std::string, std::string> &metadata);

/**
 * @brief isolate 表示段错误的信号值（SIGSEGV）
 */
constexpr int SEGMENTATION_FAULT_SIGNAL = 11;

void to_json(nlohmann::json &j, const isolate_result &result);

}  // namespace grader
