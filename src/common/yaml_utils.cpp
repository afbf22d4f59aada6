#include "common/yaml_utils.hpp"
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/lexical_cast.hpp>

namespace grader {
using namespace std;
using namespace nlohmann;

static json scalar_to_json(const YAML::Node &node) {
    const string &text = node.Scalar();
    // 加了引号的标量，yaml-cpp 会将 tag 设置为 "!"
    if (node.Tag() == "!") return text;

    string lower = boost::algorithm::to_lower_copy(text);
    if (lower == "~" || lower == "null") return nullptr;
    if (lower == "true" || lower == "yes") return true;
    if (lower == "false" || lower == "no") return false;

    long long integer;
    if (boost::conversion::try_lexical_convert(text, integer)) return integer;
    double number;
    if (boost::conversion::try_lexical_convert(text, number)) return number;
    return text;
}

json yaml_to_json(const YAML::Node &node) {
    switch (node.Type()) {
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
            return nullptr;
        case YAML::NodeType::Scalar:
            return scalar_to_json(node);
        case YAML::NodeType::Sequence: {
            json array = json::array();
            for (const auto &item : node)
                array.push_back(yaml_to_json(item));
            return array;
        }
        case YAML::NodeType::Map: {
            json object = json::object();
            for (const auto &item : node)
                object[item.first.as<string>()] = yaml_to_json(item.second);
            return object;
        }
    }
    return nullptr;
}

json load_yaml_file(const filesystem::path &path) {
    return yaml_to_json(YAML::LoadFile(path.string()));
}

}  // namespace grader
