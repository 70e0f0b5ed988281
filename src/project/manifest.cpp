#include "project/manifest.hpp"
#include <boost/algorithm/string.hpp>

namespace grader {
using namespace std;

const char *LANGUAGE_PLACEHOLDER = "--LANGUAGE_PLACEHOLDER--";
const char *MAIN_PLACEHOLDER = "--MAIN_PLACEHOLDER--";

static string quoted_list(const vector<string> &items) {
    vector<string> quoted;
    for (auto &item : items)
        quoted.push_back("\"" + item + "\"");
    return boost::algorithm::join(quoted, ", ");
}

manifest::manifest(const string &template_content) : text(template_content) {}

void manifest::insert_languages(const vector<string> &languages) {
    boost::algorithm::replace_all(text, LANGUAGE_PLACEHOLDER, "for Languages use (" + quoted_list(languages) + ");");
}

void manifest::define_mains(const vector<string> &mains) {
    boost::algorithm::replace_all(text, MAIN_PLACEHOLDER, "for Main use (" + quoted_list(mains) + ");");
}

const string &manifest::content() const {
    return text;
}

}  // namespace grader
