#pragma once

#include <boost/lexical_cast.hpp>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace nlohmann {

namespace detail_grader {

template <typename Key>
const json *step(const json *ref, const Key &key) {
    if (!ref || ref->is_null()) return nullptr;
    if constexpr (std::is_integral_v<Key>) {
        if (ref->is_array() && static_cast<std::size_t>(key) < ref->size())
            return &(*ref)[key];
        return nullptr;
    } else {
        if (ref->is_object() && ref->count(key))
            return &ref->at(key);
        return nullptr;
    }
}

template <typename... Keys>
const json *find(const json &j, Keys &&... keys) {
    const json *ref = &j;
    ((ref = step(ref, keys)), ...);
    return ref;
}

}  // namespace detail_grader

template <typename... Keys>
bool exists(const json &j, Keys &&... keys) {
    const json *ref = detail_grader::find(j, keys...);
    return ref && !ref->is_null();
}

template <typename... Keys>
json access_optional(const json &j, Keys &&... keys) {
    const json *ref = detail_grader::find(j, keys...);
    return !ref ? json{} : *ref;
}

template <typename... Keys>
std::invalid_argument build_invalid_argument(const json &j, Keys &&... keys) {
    std::string msg = "Unexpected value type of: ";
    ((msg += boost::lexical_cast<std::string>(keys) + "."), ...);
    msg += " in " + j.dump(2);
    return std::invalid_argument(msg);
}

template <typename... Keys>
const json &access(const json &j, Keys &&... keys) {
    const json *ref = detail_grader::find(j, keys...);
    if (!ref)
        throw build_invalid_argument(j, keys...);
    else
        return *ref;
}

template <typename T, typename... Keys>
T get_value(const json &j, Keys &&... keys) {
    const json &res = access(j, keys...);
    try {
        return res.get<T>();
    } catch (json::exception &e) {
        throw build_invalid_argument(j, keys...);
    }
}

template <typename T, typename... Keys>
T get_value_def(const json &j, const T &def_value, Keys &&... keys) {
    json res = access_optional(j, keys...);
    if (res.is_null()) return def_value;
    try {
        return res.get<T>();
    } catch (json::exception &e) {
        throw build_invalid_argument(j, keys...);
    }
}

/**
 * @brief 将 json 中的标量值转换为字符串，数字保持原有的写法
 * 配置文件中的命令行参数可以是数字，比如 args: [1, 2]
 */
inline std::string to_plain_string(const json &value) {
    if (value.is_string()) return value.get<std::string>();
    if (value.is_null()) return "";
    return value.dump();
}

}  // namespace nlohmann
