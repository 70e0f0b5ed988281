#include "common/utils.hpp"
#include <stdlib.h>
#include <boost/algorithm/string.hpp>

namespace grader {
using namespace std;

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

void set_env(const string &key, const string &value, bool replace) {
    setenv(key.c_str(), value.c_str(), replace);
}

vector<string> split_arguments(const string &text) {
    vector<string> tokens;
    string trimmed = boost::algorithm::trim_copy(text);
    if (trimmed.empty()) return tokens;
    boost::algorithm::split(tokens, trimmed, boost::algorithm::is_space(), boost::algorithm::token_compress_on);
    return tokens;
}

string shell_quote(const string &arg) {
    string quoted = "'";
    for (char c : arg) {
        if (c == '\'')
            quoted += "'\\''";
        else
            quoted += c;
    }
    quoted += "'";
    return quoted;
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

}  // namespace grader
