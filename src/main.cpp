#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <future>
#include <iostream>
#include <thread>
#include "arbiter/common/io_utils.hpp"
#include "arbiter/config.hpp"
#include "arbiter/judge/engine.hpp"
#include "arbiter/worker.hpp"
using namespace std;

static nlohmann::json judge_all(const arbiter::engine& eng, const arbiter::language_registry& languages, const nlohmann::json& requests, size_t workers, size_t capacity) {
    arbiter::worker_pool pool(eng, workers, capacity);
    vector<future<arbiter::judge_report>> reports;
    // 请求文件可以只包含一个请求，也可以是请求数组
    bool single = !requests.is_array();
    nlohmann::json list = single ? nlohmann::json::array({requests}) : requests;

    for (auto& item : list) {
        arbiter::judge_request request = arbiter::parse_judge_request(item, languages);
        int64_t problem_id = request.prob.id;
        reports.push_back(pool.submit(move(request), [problem_id](const arbiter::testcase_result& result) {
            LOG(INFO) << "Problem " << problem_id << " testcase finished: " << nlohmann::json(result).dump();
        }));
    }

    nlohmann::json result = nlohmann::json::array();
    for (auto& report : reports)
        result.push_back(nlohmann::json(report.get()));
    pool.stop();
    return single ? result.at(0) : result;
}

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    namespace po = boost::program_options;
    po::options_description desc("arbiter-judge options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("languages", po::value<string>()->required(), "set the JSON file with language definitions")
        ("request", po::value<string>()->required(), "set the JSON file with the judging request (or an array of requests)")
        ("mode", po::value<string>()->default_value("judge"), "judge: judge the submission against the testcases; run: run the code with custom input")
        ("workers", po::value<size_t>(), "set the number of judge workers, default to the number of CPU cores. You can either pass it from environ WORKERS")
        ("queue-capacity", po::value<size_t>()->default_value(64), "set the maximum number of pending requests")
        ("run-dir", po::value<string>(), "set the directory to create workspaces in, default to /tmp. You can either pass it from environ RUNDIR")
        ("time-command", po::value<string>(), "set the path of GNU time used to measure memory, default to /usr/bin/time. You can either pass it from environ TIMECOMMAND")
        ("no-memory-probe", "do not measure memory usage of programs")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        if (vm.count("help")) {
            cout << "arbiter-judge: judge a submission with the given languages and testcases" << endl
                 << "Usage: " << argv[0] << " --languages <file> --request <file> [options]" << endl;
            cout << desc << endl;
            return EXIT_SUCCESS;
        }
        if (vm.count("version")) {
            cout << "arbiter-judge 1.0" << endl;
            return EXIT_SUCCESS;
        }
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("run-dir")) {
        arbiter::RUN_DIR = filesystem::path(vm.at("run-dir").as<string>());
    } else if (getenv("RUNDIR")) {
        arbiter::RUN_DIR = filesystem::path(getenv("RUNDIR"));
    }
    CHECK(filesystem::is_directory(arbiter::RUN_DIR))
        << "Run directory " << arbiter::RUN_DIR << " does not exist";

    if (vm.count("time-command")) {
        arbiter::TIME_COMMAND_PATH = filesystem::path(vm.at("time-command").as<string>());
    } else if (getenv("TIMECOMMAND")) {
        arbiter::TIME_COMMAND_PATH = filesystem::path(getenv("TIMECOMMAND"));
    }

    size_t workers = max(1u, thread::hardware_concurrency());
    if (vm.count("workers")) {
        workers = vm.at("workers").as<size_t>();
    } else if (getenv("WORKERS")) {
        workers = boost::lexical_cast<size_t>(getenv("WORKERS"));
    }
    CHECK(workers > 0) << "At least one worker is required";

    string mode = vm.at("mode").as<string>();
    CHECK(mode == "judge" || mode == "run") << "Unrecognized mode " << mode;

    arbiter::engine eng(vm.count("no-memory-probe") ? arbiter::memory_probe::disabled() : arbiter::memory_probe::detect());

    try {
        arbiter::language_registry languages;
        languages.load(vm.at("languages").as<string>());

        auto request = nlohmann::json::parse(arbiter::read_file_content(vm.at("request").as<string>()));

        nlohmann::json output;
        if (mode == "run") {
            output = nlohmann::json(eng.run_code(arbiter::parse_run_request(request, languages)));
        } else {
            output = judge_all(eng, languages, request, workers, vm.at("queue-capacity").as<size_t>());
        }
        cout << output.dump(2) << endl;
    } catch (std::exception& ex) {
        LOG(ERROR) << "Unable to judge request: " << ex.what() << endl
                   << boost::diagnostic_information(ex);
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
