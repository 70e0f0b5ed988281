#include "project/language.hpp"
#include <boost/algorithm/string.hpp>
#include <boost/assign.hpp>
#include <filesystem>
#include <regex>
#include <unordered_map>

namespace grader {
using namespace std;

// clang-format off
static const unordered_map<language, const char *> language_name = boost::assign::map_list_of
    (language::ADA, "Ada")
    (language::C, "C")
    (language::CPP, "C++")
    (language::UNKNOWN, "")
    (language::MANIFEST, "")
    (language::CONFIG, "");

static const unordered_map<string, language> extension_language = boost::assign::map_list_of
    (".adb", language::ADA)
    (".ads", language::ADA)
    (".ada", language::ADA)
    (".c", language::C)
    (".cpp", language::CPP)
    (".cc", language::CPP)
    (".cxx", language::CPP)
    (".c++", language::CPP)
    (".hpp", language::CPP)
    (".hh", language::CPP)
    (".hxx", language::CPP)
    (".gpr", language::MANIFEST)
    (".adc", language::CONFIG);
// clang-format on

// class、namespace、template <...>，或者 #include <iostream> 这样没有扩展名的标准头文件
static const regex cpp_construct(R"((^|\W)(class|namespace)\s+\w|template\s*<|#\s*include\s*<\w+>)");

const char *get_language_name(language lang) {
    return language_name.at(lang);
}

bool is_compiled_language(language lang) {
    return lang == language::ADA || lang == language::C || lang == language::CPP;
}

language detect_language(const string &name, const string &content) {
    string ext = boost::algorithm::to_lower_copy(filesystem::path(name).extension().string());
    if (ext == ".h")
        return regex_search(content, cpp_construct) ? language::CPP : language::C;
    auto it = extension_language.find(ext);
    if (it == extension_language.end()) return language::UNKNOWN;
    return it->second;
}

}  // namespace grader
