#include "remote/orchestrator.hpp"
#include <fmt/format.h>
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include <boost/assign.hpp>
#include <unordered_map>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"

namespace grader {
using namespace std;
namespace fs = std::filesystem;

// clang-format off
static const unordered_map<remote_orchestrator::state, const char *> state_string = boost::assign::map_list_of
    (remote_orchestrator::state::UNSTAGED, "unstaged")
    (remote_orchestrator::state::STAGED, "staged")
    (remote_orchestrator::state::DESTROYED, "destroyed");
// clang-format on

const char *get_state_name(remote_orchestrator::state st) {
    return state_string.at(st);
}

/**
 * @brief 回显给选手的工具名，不暴露执行环境中的安装路径
 */
static string tool_name(const string &tool_path) {
    return fs::path(tool_path).filename().string();
}

remote_orchestrator::remote_orchestrator(const project &proj, const project_config &config, execution_context &context, reporter &rep)
    : proj(proj), config(config), context(context), rep(rep) {}

remote_orchestrator::~remote_orchestrator() {
    try {
        destroy();
    } catch (std::exception &e) {
        LOG(ERROR) << "Unable to destroy workspace " << (ws ? ws->remote_path.string() : string()) << ": " << e.what();
    }
}

const remote_workspace &remote_orchestrator::stage() {
    if (st != state::UNSTAGED)
        throw internal_error(string("Cannot stage a project in state ") + get_state_name(st));

    fs::path local_path = make_temp_directory("grader-");
    remote_workspace workspace;
    workspace.id = local_path.filename().string();
    workspace.remote_path = config.workspace_dir / workspace.id;
    workspace.local_path = local_path;
    ws = workspace;
    // 从这里开始，即使推送失败也可以通过 destroy 清理
    st = state::STAGED;

    LOG(INFO) << "Staging project into " << ws->remote_path;
    context.mkdir(ws->remote_path);
    context.push_files(proj.files, ws->remote_path);
    return *ws;
}

void remote_orchestrator::require_staged(const char *operation) const {
    if (st != state::STAGED)
        throw internal_error(string("Cannot ") + operation + " a project in state " + get_state_name(st));
}

int remote_orchestrator::build() {
    require_staged("build");

    rep.console(fmt::format("{} -q -P {} -gnatwa -gnata", tool_name(config.build_tool_path), proj.manifest_name));
    vector<string> argv = {config.build_tool_path, "-q", "-P", (ws->remote_path / proj.manifest_name).string(), "-gnatwa", "-gnata"};
    LOG(INFO) << "Building project: " << boost::algorithm::join(argv, " ");

    execution_result result = context.execute(argv, rep, true);
    if (result.exit_code != 0) {
        LOG(WARNING) << "Build of " << ws->id << " failed with error code " << result.exit_code;
        build_error ex(result.exit_code);
        rep.err(ex.what());
        throw ex;
    }
    return result.exit_code;
}

run_result remote_orchestrator::run(const optional<vector<string>> &cli_args, const optional<string> &lab_ref) {
    reporter lab_rep = rep.with_lab_ref(lab_ref);
    if (!proj.entry_point) {
        lab_rep.err("Cannot run program without main");
        throw run_error("Cannot run program without main");
    }
    require_staged("run");

    vector<string> args;
    if (cli_args)
        args = *cli_args;
    else if (proj.cli_args)
        args = *proj.cli_args;

    vector<string> console_args = {"./" + *proj.entry_point};
    console_args.insert(console_args.end(), args.begin(), args.end());
    lab_rep.console(boost::algorithm::join(console_args, " "));

    vector<string> quoted;
    for (auto &arg : args)
        quoted.push_back(shell_quote(arg));
    string executable = (ws->remote_path / *proj.entry_point).string();
    string command = fmt::format("LD_PRELOAD={} {} `echo {}`", config.preload_library_path, executable, boost::algorithm::join(quoted, " "));

    vector<string> argv = {
        "sudo", "-u", config.run_user,
        "timeout", fmt::format("{}s", config.run_timeout_seconds),
        "bash", "-c", command};
    LOG(INFO) << "Running project: " << boost::algorithm::join(argv, " ");

    execution_result result = context.execute(argv, lab_rep, false);
    if (result.exit_code == E_TIMEOUT) {
        LOG(INFO) << "Program " << ws->id << " timed out";
        lab_rep.err(fmt::format("Program timed out after {} seconds", config.run_timeout_seconds));
    }
    return {result.exit_code, result.out};
}

int remote_orchestrator::prove(const vector<string> &extra_args) {
    if (!proj.verification_mode) {
        rep.err("Project is not configured for verification");
        throw prove_error("Project is not configured for verification");
    }
    require_staged("prove");

    vector<string> options = {"--checks-as-errors", "--level=0", "--no-axiom-guard"};
    options.insert(options.end(), extra_args.begin(), extra_args.end());

    rep.console(fmt::format("{} -P {} {}", tool_name(config.prover_path), proj.manifest_name, boost::algorithm::join(options, " ")));
    vector<string> argv = {config.prover_path, "-P", (ws->remote_path / proj.manifest_name).string()};
    argv.insert(argv.end(), options.begin(), options.end());
    LOG(INFO) << "Proving project: " << boost::algorithm::join(argv, " ");

    execution_result result = context.execute(argv, rep, true);
    return result.exit_code;
}

void remote_orchestrator::destroy() {
    if (st == state::DESTROYED) return;
    st = state::DESTROYED;
    if (!ws) return;

    LOG(INFO) << "Destroying workspace " << ws->remote_path;
    error_code ec;
    fs::remove_all(ws->local_path, ec);
    if (ec)
        LOG(WARNING) << "Unable to remove local directory " << ws->local_path << ": " << ec.message();
    context.rmdir(ws->remote_path);
}

remote_orchestrator::state remote_orchestrator::current_state() const {
    return st;
}

const project &remote_orchestrator::get_project() const {
    return proj;
}

const optional<remote_workspace> &remote_orchestrator::workspace() const {
    return ws;
}

reporter &remote_orchestrator::get_reporter() {
    return rep;
}

}  // namespace grader
