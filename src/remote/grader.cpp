#include "remote/grader.hpp"
#include <glog/logging.h>
#include "common/exceptions.hpp"

namespace grader {
using namespace std;

submission_result submit(remote_orchestrator &orchestrator) {
    const project &proj = orchestrator.get_project();
    reporter &rep = orchestrator.get_reporter();
    if (!proj.entry_point) {
        rep.err("Cannot run program without main");
        throw submit_error("Cannot run program without main");
    }
    if (!proj.test_cases) {
        rep.err("No lab io sent with project");
        throw submit_error("No lab io sent with project");
    }

    submission_result result{true, *proj.test_cases};
    for (auto &tc : result.cases.cases) {
        run_result run = orchestrator.run(tc.input, tc.key);
        tc.record(run.out, run.exit_code);
        bool passed = tc.passed();
        DLOG(INFO) << "Test case [" << tc.key << "] " << (passed ? "passed" : "failed");
        result.success = result.success && passed;
    }

    LOG(INFO) << "Submission graded, " << result.cases.size() << " test cases, " << (result.success ? "passed" : "failed");
    rep.lab(result.success, result.cases);
    return result;
}

}  // namespace grader
