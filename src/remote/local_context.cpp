#include "remote/local_context.hpp"
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/process.hpp"

namespace grader {
using namespace std;
namespace fs = std::filesystem;

execution_context::~execution_context() = default;

void local_context::mkdir(const fs::path &path) {
    error_code ec;
    fs::create_directories(path, ec);
    if (ec)
        throw execution_error("Unable to create directory " + path.string() + ": " + ec.message());
}

void local_context::push_files(const vector<source_file> &files, const fs::path &path) {
    for (auto &file : files) {
        try {
            write_file_content(path / assert_safe_path(file.name()), file.content());
        } catch (std::exception &e) {
            throw execution_error("Unable to push file " + file.name() + " to " + path.string() + ": " + e.what());
        }
    }
}

void local_context::rmdir(const fs::path &path) {
    error_code ec;
    fs::remove_all(path, ec);
    if (ec)
        throw execution_error("Unable to remove directory " + path.string() + ": " + ec.message());
}

execution_result local_context::execute(const vector<string> &argv, reporter &rep, bool inherit_env) {
    DLOG(INFO) << "Executing " << boost::algorithm::join(argv, " ");
    process_result proc;
    try {
        proc = exec_program(
            argv, {}, inherit_env,
            [&](const string &line) { rep.out(line); },
            [&](const string &line) { rep.err(line); });
    } catch (system_error &e) {
        throw execution_error("Unable to execute " + argv.front() + ": " + e.what());
    }
    return {proc.exit_code, proc.out, proc.err};
}

}  // namespace grader
