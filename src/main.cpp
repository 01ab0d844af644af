#include <glog/logging.h>
#include <signal.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <iostream>
#include "common/cancellation.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "contest/json.hpp"
#include "judge/grader.hpp"
#include "judge/json.hpp"
#include "runtime/language.hpp"
#include "runtime/sandbox.hpp"
using namespace std;
using namespace nlohmann;

static arena::cancellation_token interrupt_token;

void sigintHandler(int /* signum */) {
    interrupt_token.cancel();
}

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    namespace po = boost::program_options;
    po::options_description desc("arena-judge options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("problem", po::value<string>(), "problem JSON file to grade against")
        ("language", po::value<string>(), "language of the source file: python, javascript, cpp, java or one defined by --languages")
        ("source", po::value<string>(), "source file of the submission")
        ("contest-result", po::value<string>(), "contest result JSON file, the graded submission will be merged into it and the updated contest result printed")
        ("problem-id", po::value<string>(), "problem id used when merging into the contest result, default to the id of the problem")
        ("languages", po::value<string>(), "JSON file overriding the built-in language commands. You can either pass it from environ LANGUAGES")
        ("run-dir", po::value<string>(), "set the directory to compile and run user programs in. You can either pass it from environ RUNDIR")
        ("max-grading-time", po::value<long long>(), "reject submissions whose test count times time limit exceeds this value in milliseconds, default to 120000. You can either pass it from environ MAXGRADINGTIME")
        ("compile-time-limit", po::value<int>(), "set time limit in milliseconds for compilers, default to 10000. You can either pass it from environ COMPILETIMELIMIT")
        ("enforce-memory", "enforce the memory limit with setrlimit and measure peak memory, instead of estimating memory from output size")
        ("debug", "turn on the debug mode to keep the artifact directories of each run")
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
        cout << "arena-judge: grade a submission against the test cases of a problem" << endl
             << "Usage: " << argv[0] << " --problem problem.json --language python --source main.py [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "arena-judge 1.0" << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("debug")) {
        arena::DEBUG = true;
    } else if (getenv("DEBUG")) {
        arena::DEBUG = true;
    }

    if (vm.count("run-dir")) {
        arena::RUN_DIR = filesystem::path(vm.at("run-dir").as<string>());
    } else if (getenv("RUNDIR")) {
        arena::RUN_DIR = filesystem::path(getenv("RUNDIR"));
    }
    filesystem::create_directories(arena::RUN_DIR);
    CHECK(filesystem::is_directory(arena::RUN_DIR))
        << "Run directory " << arena::RUN_DIR << " does not exist";

    if (vm.count("max-grading-time")) {
        arena::MAX_GRADING_TIME_MS = vm["max-grading-time"].as<long long>();
    } else if (getenv("MAXGRADINGTIME")) {
        arena::MAX_GRADING_TIME_MS = boost::lexical_cast<long long>(getenv("MAXGRADINGTIME"));
    }

    if (vm.count("compile-time-limit")) {
        arena::COMPILE_TIME_LIMIT_MS = vm["compile-time-limit"].as<int>();
    } else if (getenv("COMPILETIMELIMIT")) {
        arena::COMPILE_TIME_LIMIT_MS = boost::lexical_cast<int>(getenv("COMPILETIMELIMIT"));
    }

    arena::language_registry languages = arena::language_registry::with_defaults();
    if (vm.count("languages")) {
        languages.load_json(vm.at("languages").as<string>());
    } else if (getenv("LANGUAGES")) {
        languages.load_json(getenv("LANGUAGES"));
    }

    if (!vm.count("problem") || !vm.count("language") || !vm.count("source")) {
        cerr << "--problem, --language and --source are required" << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    signal(SIGINT, sigintHandler);

    shared_ptr<arena::resource_policy> policy;
    if (vm.count("enforce-memory"))
        policy = make_shared<arena::rlimit_policy>();
    else
        policy = make_shared<arena::resource_policy>();
    arena::local_sandbox box(arena::RUN_DIR, policy);
    arena::grader judge(languages, box);

    try {
        arena::problem prob = json::parse(arena::read_file_content(vm.at("problem").as<string>())).get<arena::problem>();
        string code = arena::read_file_content(vm.at("source").as<string>());

        arena::submission submit = judge.grade(code, vm.at("language").as<string>(), prob, interrupt_token);

        if (vm.count("contest-result")) {
            filesystem::path result_path = vm.at("contest-result").as<string>();
            auto previous = json::parse(arena::read_file_content(result_path)).get<arena::contest_result>();
            string problem_id = vm.count("problem-id") ? vm.at("problem-id").as<string>() : prob.id;
            bool is_first_accept = submit.max_score > 0 && submit.score == submit.max_score;
            auto updated = arena::apply_submission(previous, problem_id, arena::outcome_of(submit), is_first_accept,
                                                   chrono::system_clock::now());
            cout << json({{"submission", submit}, {"contest_result", updated}}).dump(4) << endl;
        } else {
            cout << json(submit).dump(4) << endl;
        }
    } catch (arena::judge_exception& ex) {
        LOG(ERROR) << ex;
        cerr << ex.what() << endl;
        return EXIT_FAILURE;
    } catch (exception& ex) {
        LOG(ERROR) << boost::diagnostic_information(ex);
        cerr << ex.what() << endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
