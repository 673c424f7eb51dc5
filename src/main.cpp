#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/program_options.hpp>
#include <algorithm>
#include <filesystem>
#include <iostream>
#include <thread>
#include "arbiter/expected_verdicts.hpp"
#include "arbiter/problem.hpp"
#include "arbiter/submission_judger.hpp"
#include "arbiter/tester.hpp"
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "monitor/console.hpp"
using namespace std;
namespace fs = std::filesystem;

/**
 * @brief 列出数据文件夹下所有的 *.in 文件作为测试点，按名称排序
 * 同名的 *.ans 文件作为标准输出
 */
static vector<arbiter::testcase> list_testcases(const fs::path &data_dir) {
    vector<arbiter::testcase> testcases;
    for (auto &entry : fs::recursive_directory_iterator(data_dir)) {
        if (!entry.is_regular_file() || entry.path().extension() != ".in") continue;
        arbiter::testcase tc;
        fs::path relative = fs::relative(entry.path(), data_dir);
        tc.name = relative.replace_extension().string();
        tc.in_path = entry.path();
        fs::path ans_path = entry.path();
        ans_path.replace_extension(".ans");
        if (fs::is_regular_file(ans_path)) tc.ans_path = ans_path;
        testcases.push_back(tc);
    }
    sort(testcases.begin(), testcases.end(), [](auto &a, auto &b) { return a.name < b.name; });
    return testcases;
}

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);

    namespace po = boost::program_options;
    po::options_description desc("arbiter options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("problem", po::value<string>()->required(), "problem configuration file in json format")
        ("data", po::value<string>(), "directory of testcases, every *.in file is a testcase with optional *.ans answer file")
        ("submission", po::value<vector<string>>()->multitoken()->required(), "command to run the submission, followed by its arguments")
        ("name", po::value<string>(), "name of the submission, default to file name of the submission command")
        ("annotation", po::value<string>(), "source file or directory of the submission to look for @EXPECTED_RESULTS@")
        ("jobs,j", po::value<size_t>(), "number of testcases judged in parallel, default to number of cpu cores")
        ("verbose,v", "print all testcases and disable lazy judging")
        ("table", "record which testcases are accepted and disable lazy judging")
        ("error,e", "print full stderr of submissions, and keep large output files")
        ("test", "run the submission on every testcase without validating, printing its output to terminal")
        ("run-dir", po::value<string>(), "set the directory to store outputs and feedback directories. You can either pass it from environ RUNDIR")
        ("debug", "turn on the debug mode to keep output files of submissions")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        if (vm.count("help")) {
            cout << "arbiter: Run a submission on testcases, validate its output and report the verdict" << endl
                 << "Usage: " << argv[0] << " --problem problem.json --data data/ --submission ./a.out [options]" << endl;
            cout << desc << endl;
            return EXIT_SUCCESS;
        }
        if (vm.count("version")) {
            cout << "arbiter 1.0" << endl;
            return EXIT_SUCCESS;
        }
        po::notify(vm);
    } catch (po::error &e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("debug")) {
        arbiter::DEBUG = true;
    } else if (getenv("DEBUG")) {
        arbiter::DEBUG = true;
    }

    if (vm.count("run-dir")) {
        arbiter::RUN_DIR = fs::path(vm.at("run-dir").as<string>());
    } else {
        arbiter::RUN_DIR = arbiter::get_env("RUNDIR", arbiter::RUN_DIR.string());
    }
    fs::create_directories(arbiter::RUN_DIR);
    CHECK(fs::is_directory(arbiter::RUN_DIR))
        << "Run directory " << arbiter::RUN_DIR << " does not exist";

    arbiter::judge_options options;
    if (vm.count("jobs")) options.jobs = vm.at("jobs").as<size_t>();
    options.verbose = vm.count("verbose");
    options.table = vm.count("table");
    options.show_errors = vm.count("error");

    try {
        arbiter::problem prob = arbiter::load_problem(vm.at("problem").as<string>());

        vector<arbiter::testcase> testcases;
        if (vm.count("data")) {
            fs::path data_dir = vm.at("data").as<string>();
            CHECK(fs::is_directory(data_dir))
                << "Data directory " << data_dir << " does not exist";
            testcases = list_testcases(data_dir);
        }
        LOG(INFO) << "Loaded problem " << prob.name << " with " << testcases.size() << " testcases";

        arbiter::judge_statistics stats;
        arbiter::submission sub;
        sub.cmd.argv = vm.at("submission").as<vector<string>>();
        sub.name = vm.count("name") ? vm.at("name").as<string>() : sub.cmd.name();
        if (vm.count("annotation"))
            sub.expected_verdicts = arbiter::get_expected_verdicts(vm.at("annotation").as<string>(), stats);

        if (vm.count("test")) {
            arbiter::submission_tester tester(prob);
            tester.test_all(sub, testcases, stats);
            fmt::print(stderr, "{} errors, {} warnings\n", stats.errors, stats.warnings);
            return stats.errors ? EXIT_FAILURE : EXIT_SUCCESS;
        }

        arbiter::console_monitor mon(options);
        arbiter::submission_judger judger(prob, options, mon);
        arbiter::submission_run_outcome outcome = judger.judge_all(sub, testcases);
        stats.merge(outcome.statistics);

        if (stats.errors || stats.warnings)
            fmt::print(stderr, "{} errors, {} warnings\n", stats.errors, stats.warnings);
        return outcome.got_expected && !stats.errors ? EXIT_SUCCESS : EXIT_FAILURE;
    } catch (arbiter::configuration_error &e) {
        LOG(ERROR) << e;
        return EXIT_FAILURE;
    } catch (exception &e) {
        LOG(ERROR) << "Unexpected error: " << boost::diagnostic_information(e);
        return EXIT_FAILURE;
    }
}
