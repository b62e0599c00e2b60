#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <filesystem>
#include <fstream>
#include <iostream>
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "engine/evaluator.hpp"
#include "monitor/logging.hpp"
using namespace std;

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    namespace po = boost::program_options;
    po::options_description desc("grader options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("submission", po::value<string>(), "path of the student's source file")
        ("name", po::value<string>(), "declared file name of the submission, default to the file name of --submission")
        ("student", po::value<string>(), "student id, letters, digits, '_' and '-' only")
        ("assignment", po::value<string>(), "assignment id, letters, digits, '_' and '-' only")
        ("test", po::value<vector<string>>(), "path of a GoogleTest test unit or a support header, can be specified multiple times")
        ("config", po::value<string>(), "load evaluation and toolchain configuration from the given JSON file. You can either pass it from environ GRADER_CONFIG")
        ("timeout", po::value<int64_t>(), "set the time limit of test execution in milliseconds, default to 30000. You can either pass it from environ GRADER_TIMEOUT_MS")
        ("max-file-size", po::value<size_t>(), "set the size limit of each file in bytes, default to 1048576. You can either pass it from environ GRADER_MAX_FILE_SIZE")
        ("allowed-ext", po::value<vector<string>>(), "allowed extensions of source files, default to .cpp .cc .cxx")
        ("sandbox-root", po::value<string>(), "set the directory to create sandboxes in. You can either pass it from environ GRADER_SANDBOX_ROOT")
        ("compiler", po::value<string>(), "set the compiler driver, default to the compiler the grader is built with. You can either pass it from environ GRADER_COMPILER")
        ("workers", po::value<size_t>()->default_value(0), "set the number of workers of each pool, 0 means the number of cores")
        ("output", po::value<string>(), "write the report to the given file instead of stdout")
        ("debug", "turn on the debug mode not to delete the sandbox directory to check the generated files.")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "grader: Compile a C++ submission in a sandbox, run GoogleTest test units against it and score the result" << endl
             << "Usage: " << argv[0] << " --student <id> --assignment <id> --submission <file> --test <file>... [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "grader 1.0" << endl;
        return EXIT_SUCCESS;
    }

    if (!vm.count("submission") || !vm.count("student") || !vm.count("assignment") || !vm.count("test")) {
        cerr << "--submission, --student, --assignment and --test are required" << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    grader::evaluation_config config;
    grader::toolchain_config toolchain;

    string config_file = vm.count("config") ? vm.at("config").as<string>() : grader::get_env("GRADER_CONFIG", "");
    if (!config_file.empty()) {
        try {
            grader::load_configuration(config_file, config, toolchain);
        } catch (grader::configuration_error& ex) {
            LOG(ERROR) << ex;
            cerr << ex.what() << endl;
            return EXIT_FAILURE;
        }
    }

    if (vm.count("timeout")) {
        config.timeout = chrono::milliseconds(vm["timeout"].as<int64_t>());
    } else if (getenv("GRADER_TIMEOUT_MS")) {
        config.timeout = chrono::milliseconds(boost::lexical_cast<int64_t>(getenv("GRADER_TIMEOUT_MS")));
    }
    CHECK(config.timeout.count() > 0) << "Timeout should be positive";

    if (vm.count("max-file-size")) {
        config.max_file_size_bytes = vm["max-file-size"].as<size_t>();
    } else if (getenv("GRADER_MAX_FILE_SIZE")) {
        config.max_file_size_bytes = boost::lexical_cast<size_t>(getenv("GRADER_MAX_FILE_SIZE"));
    }

    if (vm.count("allowed-ext")) {
        config.allowed_extensions.clear();
        for (string ext : vm["allowed-ext"].as<vector<string>>()) {
            boost::algorithm::trim(ext);
            if (!ext.empty() && ext[0] != '.') ext = "." + ext;
            config.allowed_extensions.push_back(ext);
        }
    }

    if (vm.count("sandbox-root")) {
        config.sandbox_root = filesystem::path(vm.at("sandbox-root").as<string>());
    } else if (getenv("GRADER_SANDBOX_ROOT")) {
        config.sandbox_root = filesystem::path(getenv("GRADER_SANDBOX_ROOT"));
    }

    if (vm.count("compiler")) {
        toolchain.compiler = vm.at("compiler").as<string>();
    } else if (getenv("GRADER_COMPILER")) {
        toolchain.compiler = getenv("GRADER_COMPILER");
    }
    CHECK(!grader::find_executable(toolchain.compiler).empty())
        << "Compiler " << toolchain.compiler << " does not exist";
    CHECK(filesystem::is_regular_file(toolchain.runtime_library))
        << "Runtime support library " << toolchain.runtime_library << " does not exist";
    CHECK(filesystem::is_regular_file(toolchain.gtest_library))
        << "GoogleTest library " << toolchain.gtest_library << " does not exist";

    if (vm.count("debug") || getenv("DEBUG")) {
        config.keep_sandbox = true;
    }

    grader::submission_unit submission;
    submission.student_id = vm["student"].as<string>();
    submission.assignment_id = vm["assignment"].as<string>();
    submission.path = vm["submission"].as<string>();
    submission.name = vm.count("name") ? vm["name"].as<string>() : submission.path.filename().string();

    vector<grader::test_unit> tests;
    for (const string& test_file : vm["test"].as<vector<string>>()) {
        grader::test_unit unit;
        unit.assignment_id = submission.assignment_id;
        unit.path = test_file;
        unit.name = unit.path.filename().string();
        tests.push_back(unit);
    }

    grader::evaluator engine(toolchain, vm["workers"].as<size_t>());
    engine.register_monitor(make_unique<grader::logging_monitor>());

    grader::evaluation_report report = engine.evaluate_async(submission, tests, config).get();
    nlohmann::json j = report;

    if (vm.count("output")) {
        ofstream fout(vm["output"].as<string>());
        CHECK(fout) << "Unable to write report to " << vm["output"].as<string>();
        fout << j.dump(4) << endl;
    } else {
        cout << j.dump(4) << endl;
    }

    return report.status == grader::evaluation_state::RUNNER_ERROR ? EXIT_FAILURE : EXIT_SUCCESS;
}
