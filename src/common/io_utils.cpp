#include "common/io_utils.hpp"
#include <stdlib.h>
#include <fstream>
#include <system_error>
#include <vector>

namespace grader {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(const fs::path &path) {
    ifstream fin(path.string(), ios::binary);
    if (!fin)
        throw system_error(errno, system_category(), "unable to open file " + path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

void write_file_content(const fs::path &path, const string &content) {
    ofstream fout(path.string(), ios::binary | ios::trunc);
    if (!fout)
        throw system_error(errno, system_category(), "unable to create file " + path.string());
    fout.write(content.data(), content.size());
    if (!fout)
        throw system_error(errno, system_category(), "unable to write file " + path.string());
}

bool is_safe_path(const string &name) {
    return !name.empty() && name != "." && name != ".." &&
           name.find('/') == string::npos && name.find('\0') == string::npos;
}

string assert_safe_path(const string &name) {
    if (!is_safe_path(name))
        throw runtime_error("file name is not safe " + name);
    return name;
}

fs::path make_temp_directory(const string &prefix) {
    string pattern = (fs::temp_directory_path() / (prefix + "XXXXXX")).string();
    vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    if (mkdtemp(buffer.data()) == nullptr)
        throw system_error(errno, system_category(), "unable to create temporary directory " + pattern);
    return fs::path(buffer.data());
}

}  // namespace grader
