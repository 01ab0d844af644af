#include "common/io_utils.hpp"
#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <fstream>
#include <system_error>

namespace arena {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(fs::path const &path) {
    ifstream fin(path.string(), ios::binary);
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

void write_file_content(const fs::path &path, const string &content) {
    ofstream fout(path, ios::binary | ios::trunc);
    if (!fout)
        throw system_error(errno, system_category(), "unable to open " + path.string());
    fout << content;
    fout.close();
    if (!fout)
        throw system_error(errno, system_category(), "unable to write " + path.string());
}

// 返回以 i 开头的合法 UTF-8 字符的字节数，不合法时返回 0
static size_t utf8_sequence_length(const string &string, size_t i) {
    unsigned char c = string[i];
    size_t n;
    if (c <= 0x7f)
        return 1;  // 0bbbbbbb
    else if ((c & 0xE0) == 0xC0)
        n = 1;  // 110bbbbb
    else if (c == 0xed && i + 1 < string.length() && ((unsigned char)string[i + 1] & 0xa0) == 0xa0)
        return 0;  // U+d800 to U+dfff
    else if ((c & 0xF0) == 0xE0)
        n = 2;  // 1110bbbb
    else if ((c & 0xF8) == 0xF0)
        n = 3;  // 11110bbb
    else
        return 0;
    for (size_t j = 1; j <= n; ++j) {  // n bytes matching 10bbbbbb follow ?
        if (i + j >= string.length() || ((unsigned char)string[i + j] & 0xC0) != 0x80)
            return 0;
    }
    return n + 1;
}

bool utf8_check_is_valid(const string &string) {
    for (size_t i = 0; i < string.length();) {
        size_t n = utf8_sequence_length(string, i);
        if (n == 0) return false;
        i += n;
    }
    return true;
}

string utf8_sanitize(const string &str) {
    if (utf8_check_is_valid(str)) return str;
    string result;
    result.reserve(str.length());
    for (size_t i = 0; i < str.length();) {
        size_t n = utf8_sequence_length(str, i);
        if (n == 0) {
            result.push_back('?');
            ++i;
        } else {
            result.append(str, i, n);
            i += n;
        }
    }
    return result;
}

string assert_safe_path(const string &subpath) {
    if (subpath.empty() || subpath.find("..") != string::npos || subpath.front() == '/')
        throw runtime_error("subpath is not safe " + subpath);
    return subpath;
}

scoped_directory::scoped_directory(const fs::path &parent)
    : dir(parent / boost::lexical_cast<string>(boost::uuids::random_generator()())), valid(true) {
    fs::create_directories(dir);
}

scoped_directory::scoped_directory(scoped_directory &&other)
    : dir(move(other.dir)), valid(other.valid) {
    other.valid = false;
}

scoped_directory::~scoped_directory() {
    release();
}

const fs::path &scoped_directory::path() const {
    return dir;
}

bool scoped_directory::release() {
    if (!valid) return true;
    valid = false;
    error_code ec;
    fs::remove_all(dir, ec);
    if (ec) {
        LOG(ERROR) << "Unable to remove artifact directory " << dir << ": " << ec.message();
        return false;
    }
    return true;
}

void scoped_directory::keep() {
    valid = false;
}

}  // namespace arena
