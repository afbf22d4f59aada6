#pragma once

#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <nlohmann/json.hpp>

namespace grader {

/**
 * @brief 将 YAML 文档转换为 json，以便复用 json_utils 中的访问函数
 * 未加引号的标量会被推断为 null、布尔值、整数或者浮点数，加了引号的标量总是字符串
 */
nlohmann::json yaml_to_json(const YAML::Node &node);

/**
 * @brief 读取并解析 YAML 文件
 * @throw YAML::Exception 文件格式错误时
 */
nlohmann::json load_yaml_file(const std::filesystem::path &path);

}  // namespace grader
