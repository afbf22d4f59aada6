#include "isolate.hpp"
#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>
#include <algorithm>
#include <fstream>

namespace grader {
using namespace std;

map<string, string> read_isolate_metadata(const filesystem::path &metafile) {
    map<string, string> mp;
    ifstream fin(metafile);
    string line;
    while (getline(fin, line)) {
        size_t colon = line.find(':');
        if (colon == string::npos) continue;
        string key = boost::algorithm::trim_copy(line.substr(0, colon));
        key.erase(remove(key.begin(), key.end(), '-'), key.end());
        if (key.empty()) continue;
        mp[key] = boost::algorithm::trim_copy(line.substr(colon + 1));
    }
    return mp;
}

template <typename T>
static bool try_to_parse(const string &text, optional<T> &value) {
    T parsed;
    if (!boost::conversion::try_lexical_convert(text, parsed)) return false;
    value = parsed;
    return true;
}

isolate_result parse_isolate_metadata(const map<string, string> &metadata) {
    isolate_result result;
    for (auto &[key, value] : metadata) {
        bool parsed = false;
        if (key == "exitcode")
            parsed = try_to_parse(value, result.exit_code);
        else if (key == "exitsig")
            parsed = try_to_parse(value, result.exit_signal);
        else if (key == "time")
            parsed = try_to_parse(value, result.cpu_time);
        else if (key == "timewall")
            parsed = try_to_parse(value, result.wall_time);
        else if (key == "cgmem")
            parsed = try_to_parse(value, result.memory);
        else if (key == "status")
            result.status = value, parsed = true;
        else if (key == "message")
            result.message = value, parsed = true;

        // 无法解析的值同样原样保留，不丢失信息
        if (!parsed) result.extras[key] = value;
    }

    // isolate 只在返回值非零时写入 exitcode，正常退出时没有 status
    if (!metadata.empty() && !result.exit_code && !result.exit_signal && !result.status)
        result.exit_code = 0;
    return result;
}

isolate_result read_isolate_result(const filesystem::path &metafile) {
    return parse_isolate_metadata(read_isolate_metadata(metafile));
}

void to_json(nlohmann::json &j, const isolate_result &result) {
    j = nlohmann::json::object();
    for (auto &[key, value] : result.extras)
        j[key] = value;
    if (result.exit_code) j["exit_code"] = *result.exit_code;
    if (result.exit_signal) j["exitsig"] = *result.exit_signal;
    if (result.cpu_time) j["time"] = *result.cpu_time;
    if (result.wall_time) j["timewall"] = *result.wall_time;
    if (result.memory) j["cgmem"] = *result.memory;
    if (result.status) j["status"] = *result.status;
    if (result.message) j["message"] = *result.message;
}

}  // namespace grader
