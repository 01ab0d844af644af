#include "store/contest_result_store.hpp"
#include "common/exceptions.hpp"

namespace arena::store {
using namespace std;

contest_result_store::~contest_result_store() {}

optional<contest_result> memory_contest_result_store::find(const string &user_id, const string &contest_id) {
    scoped_lock guard(mut);
    auto it = results.find({user_id, contest_id});
    if (it == results.end()) return nullopt;
    return it->second;
}

contest_result memory_contest_result_store::create(const contest_result &initial) {
    scoped_lock guard(mut);
    auto [it, inserted] = results.insert({{initial.user_id, initial.contest_id}, initial});
    if (inserted) it->second.version = 0;
    return it->second;
}

bool memory_contest_result_store::save(contest_result &result) {
    scoped_lock guard(mut);
    auto it = results.find({result.user_id, result.contest_id});
    if (it == results.end())
        throw store_error("Contest result of user " + result.user_id + " in contest " + result.contest_id + " does not exist");
    if (it->second.version != result.version) return false;

    ++result.version;
    it->second = result;
    return true;
}

vector<contest_result> memory_contest_result_store::list(const string &contest_id) {
    scoped_lock guard(mut);
    vector<contest_result> list;
    for (auto &[key, result] : results)
        if (key.second == contest_id) list.push_back(result);
    return list;
}

}  // namespace arena::store
