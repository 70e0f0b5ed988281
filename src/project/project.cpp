#include "project/project.hpp"
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include <set>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "project/manifest.hpp"

namespace grader {
using namespace std;

project_assembler::project_assembler(const project_config &config) : config(config) {}

string project_assembler::restrictions(bool verification_mode) const {
    string content = config.baseline_restrictions;
    if (verification_mode)
        content += "\n" + config.verification_restrictions;
    return content;
}

project project_assembler::assemble(const vector<uploaded_file> &files, bool verification_mode) const {
    project result;
    result.verification_mode = verification_mode;
    result.manifest_name = config.manifest_file_name();

    set<string> names;
    for (auto &file : files) {
        if (!is_safe_path(file.name))
            throw assembly_error("Invalid file name: " + file.name);
        if (file.name == result.manifest_name || file.name == config.restrictions_file_name)
            throw assembly_error("File name " + file.name + " is reserved");
        if (names.count(file.name))
            throw assembly_error("Duplicate file: " + file.name);
        names.insert(file.name);

        if (file.name == config.cli_file_name) {
            result.cli_args = split_arguments(file.content);
        } else if (file.name == config.lab_file_name) {
            result.test_cases = test_case_set::parse(file.content);
        } else {
            result.files.emplace_back(file.name, file.content);
        }
    }

    // 语言列表的顺序是固定的
    vector<string> languages;
    for (language lang : {language::ADA, language::C, language::CPP}) {
        for (auto &file : result.files) {
            if (file.lang() == lang) {
                languages.push_back(get_language_name(lang));
                break;
            }
        }
    }

    vector<string> mains, entry_points;
    for (auto &file : result.files) {
        if (file.is_entry_point()) {
            mains.push_back(file.name());
            entry_points.push_back(file.stem());
        }
    }
    if (mains.size() > 1)
        throw assembly_error("More than one main found in project: " + boost::algorithm::join(mains, ", "));

    manifest gpr(config.manifest_template);
    gpr.insert_languages(languages);
    if (mains.size() == 1) {
        result.entry_point = entry_points[0];
        gpr.define_mains(entry_points);
    }

    result.files.emplace_back(result.manifest_name, gpr.content(), language::MANIFEST);
    result.files.emplace_back(config.restrictions_file_name, restrictions(verification_mode), language::CONFIG);

    DLOG(INFO) << "Assembled project with " << result.files.size() << " files, languages ["
               << boost::algorithm::join(languages, ", ") << "], entry point "
               << result.entry_point.value_or("<none>");
    return result;
}

}  // namespace grader
