#include "project/source_file.hpp"
#include <boost/algorithm/string.hpp>
#include <filesystem>
#include <regex>
#include <set>

namespace grader {
using namespace std;

static const set<string> header_extensions = {".ads", ".h", ".hpp", ".hh", ".hxx"};

// 上下文子句：with A.B; use C; limited with D; private with E; pragma F (...);
static const regex ada_context_clause(R"(^\s*((limited\s+|private\s+)*with|use|pragma)\b[^;]*;)", regex::icase);
// 主程序：无参数的 procedure，或者返回 Integer 的无参数 function，名字和 is 之间可以有 with 方面说明
static const regex ada_main_subprogram(R"(^\s*(procedure\s+[A-Za-z]\w*|function\s+[A-Za-z]\w*\s+return\s+Integer)(\s+with\s[^;]*?)?\s+is\b)", regex::icase);
static const regex c_main_function(R"(\bint\s+main\s*\()");

/**
 * @brief 删除 Ada 的行注释 "--"，字符串常量内的 "--" 不是注释
 */
static string strip_ada_comments(const string &content) {
    string result;
    bool in_string = false;
    for (size_t i = 0; i < content.size(); ++i) {
        char c = content[i];
        if (c == '\n') in_string = false;
        if (c == '"') in_string = !in_string;
        if (!in_string && c == '-' && i + 1 < content.size() && content[i + 1] == '-') {
            while (i < content.size() && content[i] != '\n') ++i;
            if (i < content.size()) result += '\n';
            continue;
        }
        result += c;
    }
    return result;
}

/**
 * @brief 删除 C/C++ 的注释和字符串常量
 */
static string strip_c_comments(const string &content) {
    string result;
    size_t i = 0, n = content.size();
    while (i < n) {
        if (content.compare(i, 2, "//") == 0) {
            while (i < n && content[i] != '\n') ++i;
        } else if (content.compare(i, 2, "/*") == 0) {
            size_t end = content.find("*/", i + 2);
            i = end == string::npos ? n : end + 2;
            result += ' ';
        } else if (content[i] == '"' || content[i] == '\'') {
            char quote = content[i++];
            while (i < n && content[i] != quote && content[i] != '\n') {
                if (content[i] == '\\') ++i;
                ++i;
            }
            ++i;
            result += ' ';
        } else {
            result += content[i++];
        }
    }
    return result;
}

static bool is_ada_main(const string &content) {
    string rest = strip_ada_comments(content);
    smatch match;
    while (regex_search(rest, match, ada_context_clause, regex_constants::match_continuous))
        rest = match.suffix().str();
    return regex_search(rest, ada_main_subprogram, regex_constants::match_continuous);
}

source_file::source_file(const string &name, const string &content)
    : source_file(name, content, detect_language(name, content)) {}

source_file::source_file(const string &name, const string &content, language lang)
    : file_name(name), file_content(content), file_language(lang) {}

const string &source_file::name() const {
    return file_name;
}

const string &source_file::content() const {
    return file_content;
}

language source_file::lang() const {
    return file_language;
}

string source_file::stem() const {
    return filesystem::path(file_name).stem().string();
}

bool source_file::is_header() const {
    string ext = boost::algorithm::to_lower_copy(filesystem::path(file_name).extension().string());
    return header_extensions.count(ext) > 0;
}

bool source_file::is_entry_point() const {
    if (is_header()) return false;
    switch (file_language) {
        case language::ADA:
            return is_ada_main(file_content);
        case language::C:
        case language::CPP:
            return regex_search(strip_c_comments(file_content), c_main_function);
        default:
            return false;
    }
}

}  // namespace grader
