#include "common/io_utils.hpp"
#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <algorithm>
#include <system_error>

namespace grader {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(const fs::path &path) {
    ifstream fin(path.string(), ios::binary);
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

void write_file_content(const fs::path &path, const string &content) {
    if (path.has_parent_path())
        fs::create_directories(path.parent_path());
    ofstream fout(path, ios::binary | ios::trunc);
    if (!fout)
        throw system_error(errno, system_category(), "unable to write " + path.string());
    fout << content;
}

void place_file(const fs::path &from, const fs::path &to) {
    if (to.has_parent_path())
        fs::create_directories(to.parent_path());
    fs::copy_file(from, to, fs::copy_options::overwrite_existing);
}

void recreate_directory(const fs::path &dir) {
    fs::remove_all(dir);
    fs::create_directories(dir);
}

// 返回以 string[i] 开头的合法 UTF-8 字符的字节数，不合法时返回 0
static size_t utf8_sequence_length(const string &string, size_t i) {
    size_t ix = string.length(), n;
    int c = (unsigned char)string[i];
    if (c <= 0x7f)
        return 1;  // 0bbbbbbb
    else if ((c & 0xE0) == 0xC0)
        n = 1;  // 110bbbbb
    else if (c == 0xed && i < (ix - 1) && ((unsigned char)string[i + 1] & 0xa0) == 0xa0)
        return 0;  // U+d800 to U+dfff
    else if ((c & 0xF0) == 0xE0)
        n = 2;  // 1110bbbb
    else if ((c & 0xF8) == 0xF0)
        n = 3;  // 11110bbb
    else
        return 0;
    for (size_t j = 1; j <= n; j++) {  // n bytes matching 10bbbbbb follow ?
        if (i + j >= ix || (((unsigned char)string[i + j] & 0xC0) != 0x80))
            return 0;
    }
    return n + 1;
}

string sanitize_utf8(const string &string) {
    std::string result;
    result.reserve(string.length());
    for (size_t i = 0; i < string.length();) {
        size_t len = utf8_sequence_length(string, i);
        if (len == 0) {
            result += "\xEF\xBF\xBD";
            ++i;
        } else {
            result.append(string, i, len);
            i += len;
        }
    }
    return result;
}

string truncate(const string &string, size_t max_bytes) {
    if (string.length() <= max_bytes) return string;
    return string.substr(0, max_bytes);
}

string assert_safe_path(const string &subpath) {
    fs::path p(subpath);
    if (p.is_absolute())
        throw runtime_error("subpath is not safe " + subpath);
    for (auto &part : p)
        if (part == "..")
            throw runtime_error("subpath is not safe " + subpath);
    return subpath;
}

string random_token() {
    string uuid = boost::lexical_cast<string>(boost::uuids::random_generator()());
    uuid.erase(remove(uuid.begin(), uuid.end(), '-'), uuid.end());
    return uuid;
}

temporary_file::temporary_file(const fs::path &dir, const string &suffix)
    : file(dir / (random_token().substr(0, 10) + "_" + suffix)) {
    handle.open(file, ios::in | ios::out | ios::trunc);
    if (!handle)
        throw system_error(errno, system_category(), "unable to create temporary file " + file.string());
}

temporary_file::~temporary_file() {
    handle.close();
    error_code ec;
    fs::remove(file, ec);
}

const fs::path &temporary_file::path() const {
    return file;
}

fstream &temporary_file::stream() {
    return handle;
}

}  // namespace grader
