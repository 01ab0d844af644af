#include "common/utils.hpp"
#include <unistd.h>
#include <boost/algorithm/string.hpp>
#include <cstdlib>

namespace arena {
using namespace std;
namespace fs = std::filesystem;

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

fs::path which(const string &name) {
    if (name.empty()) return {};
    if (name.find('/') != string::npos)
        return access(name.c_str(), X_OK) == 0 ? fs::path(name) : fs::path();

    vector<string> dirs;
    string path = get_env("PATH", "/usr/local/bin:/usr/bin:/bin");
    boost::split(dirs, path, boost::is_any_of(":"));
    for (auto &dir : dirs) {
        if (dir.empty()) continue;
        fs::path candidate = fs::path(dir) / name;
        if (access(candidate.c_str(), X_OK) == 0 && !fs::is_directory(candidate))
            return candidate;
    }
    return {};
}

vector<string> expand_command(const vector<string> &templ, const map<string, string> &values) {
    vector<string> result;
    result.reserve(templ.size());
    for (auto arg : templ) {
        for (auto &[key, value] : values)
            boost::replace_all(arg, "{" + key + "}", value);
        result.push_back(move(arg));
    }
    return result;
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

}  // namespace arena
