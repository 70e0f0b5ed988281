#include "task.hpp"
#include <glog/logging.h>
#include <boost/assign.hpp>
#include <unordered_map>
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "remote/grader.hpp"
#include "remote/orchestrator.hpp"

namespace grader {
using namespace std;

// clang-format off
static const unordered_map<run_mode, const char *> run_mode_string = boost::assign::map_list_of
    (run_mode::RUN, "run")
    (run_mode::SUBMIT, "submit")
    (run_mode::PROVE, "prove")
    (run_mode::PROVE_FLOW, "prove_flow")
    (run_mode::PROVE_REPORT_ALL, "prove_report_all")
    (run_mode::PROVE_FLOW_REPORT_ALL, "prove_flow_report_all");
// clang-format on

run_mode parse_run_mode(const string &name) {
    for (auto &[mode, mode_name] : run_mode_string)
        if (name == mode_name) return mode;
    throw invalid_argument("Unknown mode " + name);
}

const char *get_run_mode_name(run_mode mode) {
    return run_mode_string.at(mode);
}

bool is_prove_mode(run_mode mode) {
    return mode != run_mode::RUN && mode != run_mode::SUBMIT;
}

vector<string> prove_arguments(run_mode mode) {
    switch (mode) {
        case run_mode::PROVE_FLOW:
            return {"--mode=flow"};
        case run_mode::PROVE_REPORT_ALL:
            return {"--report=all"};
        case run_mode::PROVE_FLOW_REPORT_ALL:
            return {"--mode=flow", "--report=all"};
        default:
            return {};
    }
}

static int execute_mode(remote_orchestrator &orchestrator, run_mode mode) {
    orchestrator.stage();
    switch (mode) {
        case run_mode::RUN: {
            orchestrator.build();
            return orchestrator.run().exit_code;
        }
        case run_mode::SUBMIT: {
            orchestrator.build();
            return submit(orchestrator).success ? 0 : 1;
        }
        default:
            return orchestrator.prove(prove_arguments(mode));
    }
}

int process_request(const request &req, const project_config &config, execution_context &context, channel &chan) {
    reporter rep(chan, req.task_id);
    elapsed_time timer;
    LOG(INFO) << "Processing task " << req.task_id << " in mode " << get_run_mode_name(req.mode)
              << " with " << req.files.size() << " files";

    try {
        project_assembler assembler(config);
        project proj = assembler.assemble(req.files, is_prove_mode(req.mode));

        remote_orchestrator orchestrator(proj, config, context, rep);
        int code = execute_mode(orchestrator, req.mode);
        orchestrator.destroy();
        LOG(INFO) << "Task " << req.task_id << " finished with code " << code << " in "
                  << timer.duration<chrono::milliseconds>().count() << "ms";
        return code;
    } catch (build_error &ex) {
        // 构建失败的信息已经发布过了
        LOG(INFO) << "Task " << req.task_id << ": " << ex.what();
        return ex.code() == 0 ? 1 : ex.code();
    } catch (assembly_error &ex) {
        LOG(INFO) << "Task " << req.task_id << ": " << ex.what();
        rep.err(ex.what());
        return 1;
    } catch (project_error &ex) {
        LOG(INFO) << "Task " << req.task_id << ": " << ex.what();
        return 1;
    } catch (grader_exception &ex) {
        LOG(ERROR) << "Task " << req.task_id << " failed: " << ex;
        rep.internal_error(ex.what());
        throw;
    } catch (std::exception &ex) {
        LOG(ERROR) << "Task " << req.task_id << " failed: " << ex.what();
        rep.internal_error(ex.what());
        throw;
    }
}

}  // namespace grader
