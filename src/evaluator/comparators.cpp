#include "evaluator/comparators.hpp"
#include <fmt/core.h>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/transform_width.hpp>
#include <algorithm>
#include <map>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace grader {
using namespace std;
namespace fs = std::filesystem;

// 超过这个规模的差异不再计算最长公共子序列，只展示第一处不同
static constexpr size_t MAX_DIFF_CELLS = 4 * 1024 * 1024;

static map<string, unique_ptr<comparator>> &comparators() {
    static map<string, unique_ptr<comparator>> comparators = [] {
        map<string, unique_ptr<comparator>> builtin;
        builtin["text"] = make_unique<text_comparator>();
        builtin["binary"] = make_unique<binary_comparator>();
        builtin["image"] = make_unique<image_comparator>();
        return builtin;
    }();
    return comparators;
}

void register_comparator(unique_ptr<comparator> &&comparator) {
    string type = comparator->type();
    comparators()[type] = move(comparator);
}

const comparator &get_comparator(const string &type) {
    auto it = comparators().find(type);
    if (it == comparators().end())
        throw configuration_error("unknown comparator " + type);
    return *it->second;
}

bool has_comparator(const string &type) {
    return comparators().count(type) > 0;
}

bool text_equals(const string &expected, const string &actual, const vector<filter_ptr> &filters) {
    return apply_filters(actual, filters) == apply_filters(expected, filters);
}

static vector<string> split_lines(const string &text) {
    vector<string> lines;
    if (text.empty()) return lines;
    boost::algorithm::split(lines, text, [](char c) { return c == '\n'; });
    if (text.back() == '\n') lines.pop_back();
    return lines;
}

string line_diff(const string &expected, const string &actual) {
    vector<string> a = split_lines(expected), b = split_lines(actual);
    string diff = "--- expected\n+++ actual\n";

    if ((a.size() + 1) * (b.size() + 1) > MAX_DIFF_CELLS) {
        size_t i = 0;
        while (i < a.size() && i < b.size() && a[i] == b[i]) ++i;
        diff += fmt::format("@@ first difference at line {} @@\n", i + 1);
        if (i < a.size()) diff += "-" + a[i] + "\n";
        if (i < b.size()) diff += "+" + b[i] + "\n";
        return diff;
    }

    // lcs[i][j] 表示 a[i..] 与 b[j..] 的最长公共子序列长度
    vector<vector<unsigned>> lcs(a.size() + 1, vector<unsigned>(b.size() + 1, 0));
    for (size_t i = a.size(); i-- > 0;)
        for (size_t j = b.size(); j-- > 0;)
            lcs[i][j] = a[i] == b[j] ? lcs[i + 1][j + 1] + 1 : max(lcs[i + 1][j], lcs[i][j + 1]);

    size_t i = 0, j = 0;
    while (i < a.size() || j < b.size()) {
        if (i < a.size() && j < b.size() && a[i] == b[j]) {
            diff += " " + a[i++] + "\n";
            ++j;
        } else if (i < a.size() && (j == b.size() || lcs[i + 1][j] >= lcs[i][j + 1])) {
            diff += "-" + a[i++] + "\n";
        } else {
            diff += "+" + b[j++] + "\n";
        }
    }
    return diff;
}

string text_comparator::type() const {
    return "text";
}

comparison text_comparator::compare(const fs::path &expected, const fs::path &actual, const vector<filter_ptr> &filters) const {
    string expected_text = apply_filters(read_file_content(expected), filters);
    string actual_text = apply_filters(read_file_content(actual), filters);

    comparison result;
    result.success = expected_text == actual_text;
    if (!result.success)
        result.diff = line_diff(expected_text, actual_text);
    return result;
}

string binary_comparator::type() const {
    return "binary";
}

comparison binary_comparator::compare(const fs::path &expected, const fs::path &actual, const vector<filter_ptr> &) const {
    string expected_data = read_file_content(expected);
    string actual_data = read_file_content(actual);

    comparison result;
    result.success = expected_data == actual_data;
    if (!result.success) {
        auto [e, a] = mismatch(expected_data.begin(), expected_data.end(), actual_data.begin(), actual_data.end());
        result.diff = fmt::format("files differ at byte {}: expected {} bytes, got {} bytes\n",
                                  e - expected_data.begin(), expected_data.size(), actual_data.size());
    }
    return result;
}

static string base64_encode(const string &data) {
    using namespace boost::archive::iterators;
    typedef base64_from_binary<transform_width<string::const_iterator, 6, 8>> base64_iterator;
    string encoded(base64_iterator(data.begin()), base64_iterator(data.end()));
    encoded.append((3 - data.size() % 3) % 3, '=');
    return encoded;
}

static string mime_type(fs::path path) {
    // 结果文件夹中的副本命名为 <name>.actual 或 <name>.expected
    if (path.extension() == ".actual" || path.extension() == ".expected")
        path = path.stem();
    string ext = boost::algorithm::to_lower_copy(path.extension().string());
    if (ext == ".png") return "image/png";
    if (ext == ".jpg" || ext == ".jpeg") return "image/jpeg";
    if (ext == ".gif") return "image/gif";
    if (ext == ".bmp") return "image/bmp";
    if (ext == ".svg") return "image/svg+xml";
    return "application/octet-stream";
}

string image_comparator::type() const {
    return "image";
}

comparison image_comparator::compare(const fs::path &expected, const fs::path &actual, const vector<filter_ptr> &) const {
    string expected_data = read_file_content(expected);
    string actual_data = read_file_content(actual);

    comparison result;
    result.success = expected_data == actual_data;
    result.output = fmt::format(
        "<div class=\"image-comparison\">"
        "<figure><figcaption>expected</figcaption><img src=\"data:{};base64,{}\"></figure>"
        "<figure><figcaption>actual</figcaption><img src=\"data:{};base64,{}\"></figure>"
        "</div>",
        mime_type(expected), base64_encode(expected_data),
        mime_type(actual), base64_encode(actual_data));
    return result;
}

}  // namespace grader
