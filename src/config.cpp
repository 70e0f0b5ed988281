#include "config.hpp"
#include <glog/logging.h>
#include <fstream>
#include "common/io_utils.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;

const char *BASELINE_RESTRICTIONS =
    "pragma Restrictions (No_Specification_of_Aspect => Import);\n"
    "pragma Restrictions (No_Use_Of_Pragma => Import);\n"
    "pragma Restrictions (No_Use_Of_Pragma => Interface);\n"
    "pragma Restrictions (No_Dependence => System.Machine_Code);\n"
    "pragma Restrictions (No_Dependence => Machine_Code);\n";

const char *VERIFICATION_RESTRICTIONS =
    "pragma Profile(GNAT_Extended_Ravenscar);\n"
    "pragma Partition_Elaboration_Policy(Sequential);\n"
    "pragma SPARK_Mode (On);\n"
    "pragma Warnings (Off, \"no Global contract available\");\n"
    "pragma Warnings (Off, \"subprogram * has no effect\");\n"
    "pragma Warnings (Off, \"file name does not match\");\n";

string project_config::manifest_file_name() const {
    return manifest_template_path.filename().string();
}

void from_json(const json &j, project_config &config) {
    if (j.count("buildTool"))
        j.at("buildTool").get_to(config.build_tool_path);
    if (j.count("prover"))
        j.at("prover").get_to(config.prover_path);
    if (j.count("manifestTemplate"))
        config.manifest_template_path = j.at("manifestTemplate").get<string>();
    if (j.count("baselineRestrictions"))
        j.at("baselineRestrictions").get_to(config.baseline_restrictions);
    if (j.count("verificationRestrictions"))
        j.at("verificationRestrictions").get_to(config.verification_restrictions);
    if (j.count("runTimeout"))
        j.at("runTimeout").get_to(config.run_timeout_seconds);
    if (j.count("preloadLibrary"))
        j.at("preloadLibrary").get_to(config.preload_library_path);
    if (j.count("runUser"))
        j.at("runUser").get_to(config.run_user);
    if (j.count("workspaceDir"))
        config.workspace_dir = j.at("workspaceDir").get<string>();
    if (j.count("cliFile"))
        j.at("cliFile").get_to(config.cli_file_name);
    if (j.count("labFile"))
        j.at("labFile").get_to(config.lab_file_name);
    if (j.count("restrictionsFile"))
        j.at("restrictionsFile").get_to(config.restrictions_file_name);

    if (config.run_timeout_seconds <= 0)
        throw invalid_argument("runTimeout must be positive");
}

void load_manifest_template(project_config &config) {
    config.manifest_template = read_file_content(config.manifest_template_path);
}

project_config load_project_config(const filesystem::path &config_path) {
    if (!filesystem::exists(config_path))
        throw runtime_error("Unable to find configuration file " + config_path.string());
    ifstream fin(config_path);
    json j;
    fin >> j;

    project_config config = j.get<project_config>();
    if (config.manifest_template_path.is_relative())
        config.manifest_template_path = config_path.parent_path() / config.manifest_template_path;
    load_manifest_template(config);

    LOG(INFO) << "Loaded configuration " << config_path << ", manifest template " << config.manifest_template_path;
    return config;
}

}  // namespace grader
