#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <iostream>
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "evaluator/evaluation.hpp"
using namespace std;

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    namespace po = boost::program_options;
    po::options_description desc("grader options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("task", po::value<string>()->required(), "set the task directory containing tests and config.yml")
        ("submission", po::value<string>()->required(), "set the directory containing the submitted source files")
        ("result", po::value<string>()->required(), "set the directory to store result.json and test artifacts, will be cleared before evaluation")
        ("meta", po::value<vector<string>>(), "pass extra information key=value to generators and checkers")
        ("isolate", po::value<string>(), "set the path of isolate executable. You can either pass it from environ ISOLATE")
        ("box-id", po::value<int>(), "set the isolate box id, default to 0. You can either pass it from environ BOXID")
        ("no-cgroups", "do not use control groups of isolate, cg-mem limit will not take effect. You can either pass it from environ NOCGROUP")
        ("compiler", po::value<string>(), "set the compiler used by compile stage, default to /usr/bin/gcc")
        ("debug", "turn on the debug mode to print every command executed in sandbox. You can either pass it from environ DEBUG")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        if (vm.count("help")) {
            cout << "grader: evaluate a submission against a task in isolate sandbox" << endl
                 << "Usage: " << argv[0] << " --task <dir> --submission <dir> --result <dir> [options]" << endl;
            cout << desc << endl;
            return EXIT_SUCCESS;
        }
        if (vm.count("version")) {
            cout << "grader 1.0" << endl;
            return EXIT_SUCCESS;
        }
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("debug") || !grader::get_env("DEBUG", "").empty())
        grader::DEBUG = true;

    if (vm.count("isolate")) {
        grader::ISOLATE_PATH = vm.at("isolate").as<string>();
    } else {
        grader::ISOLATE_PATH = grader::get_env("ISOLATE", grader::ISOLATE_PATH.string());
    }

    if (vm.count("box-id")) {
        grader::BOX_ID = vm.at("box-id").as<int>();
    } else if (string box_id = grader::get_env("BOXID", ""); !box_id.empty()) {
        CHECK(boost::conversion::try_lexical_convert(box_id, grader::BOX_ID)) << "BOXID should be an integer";
    }
    CHECK(grader::BOX_ID >= 0) << "Box id should be non-negative";

    if (vm.count("no-cgroups") || !grader::get_env("NOCGROUP", "").empty())
        grader::USE_CGROUPS = false;

    if (vm.count("compiler"))
        grader::COMPILER_PATH = vm.at("compiler").as<string>();

    map<string, string> meta;
    if (vm.count("meta")) {
        for (auto& item : vm.at("meta").as<vector<string>>()) {
            auto pos = item.find('=');
            CHECK(pos != string::npos) << "Meta " << item << " should be in form key=value";
            meta[item.substr(0, pos)] = item.substr(pos + 1);
        }
    }

    filesystem::path task = vm.at("task").as<string>();
    filesystem::path submission = vm.at("submission").as<string>();
    filesystem::path result = vm.at("result").as<string>();

    try {
        auto evaluated = grader::evaluate(task, submission, result, meta);
        size_t passed = 0, total = 0;
        for (auto& stage : evaluated.pipelines)
            for (auto& test : stage.tests) {
                ++total;
                if (test.success()) ++passed;
            }
        cout << (result / "result.json").string() << endl;
        LOG(INFO) << "Evaluation finished, " << passed << "/" << total << " tests passed";
        return EXIT_SUCCESS;
    } catch (grader::grader_exception& e) {
        LOG(ERROR) << "Evaluation failed: " << e;
        cerr << e.what() << endl;
    } catch (std::exception& e) {
        LOG(ERROR) << "Evaluation failed: " << boost::diagnostic_information(e);
        cerr << e.what() << endl;
    }
    return EXIT_FAILURE;
}
