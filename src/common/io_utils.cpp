#include "common/io_utils.hpp"
#include <fstream>
#include <iterator>
#include "common/exceptions.hpp"

namespace streamjudge {
using namespace std;

string read_file_content(filesystem::path const &path) {
    ifstream fin(path.string(), ios::binary);
    if (!fin)
        throw internal_error("Unable to open file " + path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

string assert_safe_path(const string &subpath) {
    if (subpath.find("../") != string::npos || subpath == ".." || filesystem::path(subpath).is_absolute())
        throw internal_error("subpath is not safe " + subpath);
    return subpath;
}

// 返回从 i 开始的 UTF-8 字符占用的字节数
static size_t utf8_sequence_length(const string &str, size_t i) {
    unsigned char c = (unsigned char)str[i];
    size_t n;
    if (c <= 0x7f)
        n = 1;  // 0bbbbbbb
    else if ((c & 0xE0) == 0xC0)
        n = 2;  // 110bbbbb
    else if ((c & 0xF0) == 0xE0)
        n = 3;  // 1110bbbb
    else if ((c & 0xF8) == 0xF0)
        n = 4;  // 11110bbb
    else
        return 1;
    for (size_t j = 1; j < n; ++j) {  // 后续字节必须是 10bbbbbb
        if (i + j >= str.size() || ((unsigned char)str[i + j] & 0xC0) != 0x80)
            return 1;
    }
    return n;
}

string utf8_truncate(const string &str, size_t max_chars) {
    size_t i = 0, count = 0;
    while (i < str.size() && count < max_chars) {
        i += utf8_sequence_length(str, i);
        ++count;
    }
    return str.substr(0, i);
}

}  // namespace streamjudge
