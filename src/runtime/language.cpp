#include "runtime/language.hpp"
#include <glog/logging.h>
#include <fstream>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"
#include "common/utils.hpp"

namespace arena {
using namespace std;
using namespace nlohmann;
namespace fs = std::filesystem;

compilation_error::compilation_error(const string &what, const string &error_log)
    : runtime_error(what), error_log(error_log) {}

language_runtime::~language_runtime() {}

template_language::template_language(const string &name, const string &source_name, const string &comment, const vector<string> &run)
    : lang(name), source_name(assert_safe_path(source_name)), comment(comment), run(run) {
    if (run.empty())
        throw invalid_argument("Language " + name + " has no run command");
}

const string &template_language::name() const {
    return lang;
}

string template_language::source_suffix() const {
    return fs::path(source_name).extension().string();
}

const string &template_language::comment_prefix() const {
    return comment;
}

map<string, string> template_language::placeholders(const artifact_set &artifacts) const {
    return {{"source", artifacts.source.string()},
            {"binary", artifacts.binary.string()},
            {"dir", artifacts.dir.string()},
            {"stem", artifacts.source.stem().string()}};
}

vector<string> template_language::run_command(const artifact_set &artifacts) const {
    return expand_command(run, placeholders(artifacts));
}

interpreted_language::interpreted_language(const string &name, const string &source_name, const string &comment, const vector<string> &run)
    : template_language(name, source_name, comment, run) {}

bool interpreted_language::needs_compilation() const {
    return false;
}

artifact_set interpreted_language::materialize(const fs::path &dir, const string &source) const {
    artifact_set artifacts;
    artifacts.dir = dir;
    artifacts.source = dir / source_name;
    write_file_content(artifacts.source, source);
    return artifacts;
}

vector<string> interpreted_language::compile_command(const artifact_set &) const {
    return {};
}

compiled_language::compiled_language(const string &name, const string &source_name, const string &binary_name, const string &comment,
                                     const vector<string> &compile, const vector<string> &run)
    : template_language(name, source_name, comment, run), binary_name(assert_safe_path(binary_name)), compile(compile) {
    if (compile.empty())
        throw invalid_argument("Compiled language " + name + " has no compile command");
}

bool compiled_language::needs_compilation() const {
    return true;
}

artifact_set compiled_language::materialize(const fs::path &dir, const string &source) const {
    artifact_set artifacts;
    artifacts.dir = dir;
    artifacts.source = dir / source_name;
    artifacts.binary = dir / binary_name;
    write_file_content(artifacts.source, source);
    return artifacts;
}

vector<string> compiled_language::compile_command(const artifact_set &artifacts) const {
    return expand_command(compile, placeholders(artifacts));
}

void language_registry::register_language(unique_ptr<language_runtime> &&language) {
    string name = language->name();
    languages[name] = move(language);
}

const language_runtime &language_registry::at(const string &name) const {
    auto language = find(name);
    if (!language) throw unsupported_language(name);
    return *language;
}

const language_runtime *language_registry::find(const string &name) const {
    auto it = languages.find(name);
    return it == languages.end() ? nullptr : it->second.get();
}

bool language_registry::contains(const string &name) const {
    return languages.count(name);
}

vector<string> language_registry::names() const {
    vector<string> result;
    for (auto &[name, language] : languages)
        result.push_back(name);
    return result;
}

void language_registry::load_defaults() {
    register_language(make_unique<interpreted_language>("python", "main.py", "#", vector<string>{"python3", "{source}"}));
    register_language(make_unique<interpreted_language>("javascript", "main.js", "//", vector<string>{"node", "{source}"}));
    register_language(make_unique<compiled_language>(
        "cpp", "main.cpp", "main", "//",
        vector<string>{"g++", "-O2", "-std=c++17", "-o", "{binary}", "{source}"},
        vector<string>{"{binary}"}));
    // Java 的主类必须和文件名一致，因此源文件固定为 Main.java
    register_language(make_unique<compiled_language>(
        "java", "Main.java", "Main.class", "//",
        vector<string>{"javac", "-encoding", "UTF-8", "-d", "{dir}", "{source}"},
        vector<string>{"java", "-cp", "{dir}", "Main"}));
}

static unique_ptr<language_runtime> language_from_json(const string &name, const json &j) {
    string type = get_value<string>(j, "type");
    string source = get_value<string>(j, "source");
    string comment = get_value_def<string>(j, "//", "comment");
    auto run = get_value<vector<string>>(j, "run");
    if (type == "interpreted") {
        return make_unique<interpreted_language>(name, source, comment, run);
    } else if (type == "compiled") {
        return make_unique<compiled_language>(name, source, get_value<string>(j, "binary"), comment,
                                              get_value<vector<string>>(j, "compile"), run);
    } else {
        throw invalid_argument("Unrecognized language type " + type);
    }
}

void language_registry::load_json(const fs::path &config_path) {
    if (!fs::exists(config_path))
        throw runtime_error("Unable to find language configuration file " + config_path.string());
    ifstream fin(config_path);
    json config;
    fin >> config;

    for (auto &[name, value] : config.items()) {
        register_language(language_from_json(name, value));
        LOG(INFO) << "Loaded language " << name << " from " << config_path;
    }
}

language_registry language_registry::with_defaults() {
    language_registry registry;
    registry.load_defaults();
    return registry;
}

}  // namespace arena
