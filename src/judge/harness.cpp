#include "judge/harness.hpp"
#include <boost/algorithm/string/trim.hpp>

namespace arena {
using namespace std;

struct harness_visitor {
    const string &language;

    string operator()(const string &harness) const {
        return harness;
    }

    string operator()(const map<string, string> &harness) const {
        auto it = harness.find(language);
        return it == harness.end() ? "" : it->second;
    }
};

string resolve_harness(const problem &prob, const string &language) {
    return visit(harness_visitor{language}, prob.harness);
}

string compose_harness(const string &user_code, const language_runtime &language, const problem &prob) {
    string harness = boost::algorithm::trim_copy(resolve_harness(prob, language.name()));
    if (harness.empty())
        return user_code;

    const string &comment = language.comment_prefix();
    return user_code + "\n" +
           comment + " HARNESS START\n" +
           harness + "\n" +
           comment + " HARNESS END";
}

string compose_harness(const string &user_code, const string &language, const problem &prob, const language_registry &registry) {
    return compose_harness(user_code, registry.at(language), prob);
}

}  // namespace arena
