#include "test/environment.hpp"
#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include "config.hpp"

namespace arena {
using namespace std;
namespace fs = std::filesystem;

static fs::path test_root;

void setup_test_environment() {
    test_root = fs::temp_directory_path() / ("arena-judge-test-" + boost::lexical_cast<string>(boost::uuids::random_generator()()));
    RUN_DIR = test_root / "run";
    fs::create_directories(RUN_DIR);
    DEBUG = false;
}

void teardown_test_environment() {
    error_code ec;
    fs::remove_all(test_root, ec);
}

const language_registry &test_languages() {
    static language_registry registry = [] {
        language_registry registry = language_registry::with_defaults();
        registry.register_language(make_unique<interpreted_language>("shell", "main.sh", "#", vector<string>{"/bin/sh", "{source}"}));
        registry.register_language(make_unique<compiled_language>(
            "shell-compiled", "main.sh", "main.sh", "#",
            vector<string>{"/bin/sh", "-n", "{source}"},
            vector<string>{"/bin/sh", "{binary}"}));
        return registry;
    }();
    return registry;
}

size_t count_entries(const fs::path &dir) {
    if (!fs::exists(dir)) return 0;
    return distance(fs::directory_iterator(dir), fs::directory_iterator());
}

test_case make_test_case(const string &id, const string &input, const string &expected_output, int points) {
    test_case testcase;
    testcase.id = id;
    testcase.input = input;
    testcase.expected_output = expected_output;
    testcase.points = points;
    return testcase;
}

}  // namespace arena
