#include "evaluator/filters.hpp"
#include <boost/algorithm/string/case_conv.hpp>
#include <cctype>
#include <map>
#include "common/exceptions.hpp"

namespace grader {
using namespace std;

static map<string, filter_ptr> &filters() {
    static map<string, filter_ptr> filters = [] {
        map<string, filter_ptr> builtin;
        for (filter_ptr f : {filter_ptr(make_shared<whitespace_filter>()),
                             filter_ptr(make_shared<trim_filter>()),
                             filter_ptr(make_shared<lowercase_filter>()),
                             filter_ptr(make_shared<crlf_filter>())})
            builtin[f->name()] = f;
        return builtin;
    }();
    return filters;
}

void register_filter(unique_ptr<filter> &&filter) {
    string name = boost::algorithm::to_lower_copy(filter->name());
    filters()[name] = move(filter);
}

filter_ptr get_filter(const string &name) {
    auto it = filters().find(boost::algorithm::to_lower_copy(name));
    if (it == filters().end())
        throw configuration_error("unknown filter " + name);
    return it->second;
}

string apply_filters(string text, const vector<filter_ptr> &filters) {
    for (auto &f : filters)
        text = f->apply(text);
    return text;
}

string whitespace_filter::name() const {
    return "whitespace";
}

string whitespace_filter::apply(const string &text) const {
    string result;
    bool pending_space = false;
    for (char c : text) {
        if (c == ' ' || c == '\t') {
            pending_space = true;
            continue;
        }
        if (pending_space && c != '\n')
            result += ' ';
        pending_space = false;
        result += c;
    }
    return result;
}

string trim_filter::name() const {
    return "trim";
}

string trim_filter::apply(const string &text) const {
    string result;
    size_t line_begin = 0;
    while (line_begin < text.length()) {
        size_t line_end = text.find('\n', line_begin);
        bool has_newline = line_end != string::npos;
        if (!has_newline) line_end = text.length();

        size_t content_end = line_end;
        while (content_end > line_begin && isspace((unsigned char)text[content_end - 1]))
            --content_end;
        result.append(text, line_begin, content_end - line_begin);
        if (has_newline) result += '\n';
        line_begin = line_end + 1;
    }

    while (!result.empty() && result.back() == '\n')
        result.pop_back();
    if (!result.empty()) result += '\n';
    return result;
}

string lowercase_filter::name() const {
    return "lowercase";
}

string lowercase_filter::apply(const string &text) const {
    return boost::algorithm::to_lower_copy(text);
}

string crlf_filter::name() const {
    return "crlf";
}

string crlf_filter::apply(const string &text) const {
    string result;
    result.reserve(text.length());
    for (size_t i = 0; i < text.length(); ++i) {
        if (text[i] == '\r' && i + 1 < text.length() && text[i + 1] == '\n') continue;
        result += text[i];
    }
    return result;
}

}  // namespace grader
