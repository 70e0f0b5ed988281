#include <glog/logging.h>
#include <boost/program_options.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <algorithm>
#include <fstream>
#include <iostream>
#include <memory>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "config.hpp"
#include "remote/local_context.hpp"
#include "report/mq_channel.hpp"
#include "report/stream_channel.hpp"
#include "task.hpp"
using namespace std;

/**
 * @brief 读取文件夹下的所有文件作为选手上传的文件，不递归子文件夹
 */
static vector<grader::uploaded_file> read_uploaded_files(const filesystem::path &dir) {
    vector<grader::uploaded_file> files;
    for (auto &p : filesystem::directory_iterator(dir)) {
        if (!filesystem::is_regular_file(p)) continue;
        files.push_back({p.path().filename().string(), grader::read_file_content(p.path())});
    }
    // directory_iterator 的顺序不确定，按文件名排序保证项目是确定的
    sort(files.begin(), files.end(), [](const grader::uploaded_file &a, const grader::uploaded_file &b) {
        return a.name < b.name;
    });
    return files;
}

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);

    namespace po = boost::program_options;
    po::options_description desc("grader-worker options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("mode", po::value<string>()->default_value("run"), "set the request mode: run, submit, prove, prove_flow, prove_report_all, prove_flow_report_all")
        ("files", po::value<string>(), "set the directory containing the uploaded files, including cli.txt and lab_io.txt")
        ("task-id", po::value<string>(), "set the task id attached to every reported message, default to a random uuid")
        ("config", po::value<string>(), "set the project configuration file path")
        ("report-queue", po::value<string>(), "publish messages to the RabbitMQ queue described by the given configuration file, instead of writing JSON lines to stdout")
        ("workspace-dir", po::value<string>(), "set the directory to create workspaces in, overrides workspaceDir in configuration file")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error &e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "grader-worker: build, run, prove and grade a submitted project" << endl
             << "Usage: " << argv[0] << " --files <dir> [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "grader-worker 1.0" << endl;
        return EXIT_SUCCESS;
    }

    if (!vm.count("files")) {
        cerr << "--files is required" << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    grader::request req;
    try {
        req.mode = grader::parse_run_mode(vm.at("mode").as<string>());
    } catch (invalid_argument &e) {
        cerr << e.what() << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("task-id"))
        req.task_id = vm.at("task-id").as<string>();
    else
        req.task_id = boost::uuids::to_string(boost::uuids::random_generator()());

    filesystem::path files_dir(vm.at("files").as<string>());
    CHECK(filesystem::is_directory(files_dir))
        << "Files directory " << files_dir << " does not exist";
    req.files = read_uploaded_files(files_dir);

    grader::project_config config;
    unique_ptr<grader::channel> chan;
    try {
        if (vm.count("config")) {
            config = grader::load_project_config(vm.at("config").as<string>());
        } else {
            grader::load_manifest_template(config);
        }
        if (vm.count("workspace-dir"))
            config.workspace_dir = vm.at("workspace-dir").as<string>();

        if (vm.count("report-queue")) {
            string queue_config = vm.at("report-queue").as<string>();
            ifstream fin(queue_config);
            if (!fin) throw runtime_error("Unable to open report queue configuration " + queue_config);
            nlohmann::json j;
            fin >> j;
            chan = make_unique<grader::mq_channel>(j.get<grader::server::amqp>());
        } else {
            chan = make_unique<grader::stream_channel>(cout);
        }
    } catch (std::exception &e) {
        LOG(ERROR) << "Unable to load configuration: " << e.what();
        return EXIT_FAILURE;
    }

    grader::local_context context;
    try {
        int code = grader::process_request(req, config, context, *chan);
        return code == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
    } catch (grader::grader_exception &e) {
        LOG(ERROR) << "Task " << req.task_id << " aborted: " << e;
        return EXIT_FAILURE;
    } catch (std::exception &e) {
        LOG(ERROR) << "Task " << req.task_id << " aborted: " << e.what();
        return EXIT_FAILURE;
    }
}
