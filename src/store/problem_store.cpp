#include "store/problem_store.hpp"
#include <glog/logging.h>
#include <fstream>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "judge/json.hpp"

namespace arena::store {
using namespace std;
using namespace nlohmann;
namespace fs = std::filesystem;

problem_store::~problem_store() {}

contest_store::~contest_store() {}

void memory_problem_store::put(const problem &prob) {
    scoped_lock guard(mut);
    problems[prob.id] = prob;
}

optional<problem> memory_problem_store::find_problem(const string &problem_id) {
    scoped_lock guard(mut);
    auto it = problems.find(problem_id);
    if (it == problems.end()) return nullopt;
    return it->second;
}

void memory_contest_store::put(const contest &c) {
    scoped_lock guard(mut);
    contests[c.id] = c;
}

optional<contest> memory_contest_store::find_contest(const string &contest_id) {
    scoped_lock guard(mut);
    auto it = contests.find(contest_id);
    if (it == contests.end()) return nullopt;
    return it->second;
}

json_problem_store::json_problem_store(const fs::path &problem_dir)
    : problem_dir(problem_dir) {}

optional<problem> json_problem_store::find_problem(const string &problem_id) {
    fs::path path = problem_dir / (assert_safe_path(problem_id) + ".json");
    if (!fs::exists(path)) return nullopt;

    try {
        problem prob = json::parse(read_file_content(path)).get<problem>();
        if (prob.id != problem_id)
            LOG(WARNING) << "Problem file " << path << " declares id " << prob.id;
        return prob;
    } catch (exception &e) {
        throw store_error("Unable to load problem " + problem_id + " from " + path.string() + ": " + e.what());
    }
}

}  // namespace arena::store
