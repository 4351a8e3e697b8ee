#include "arbiter/judge/command.hpp"
#include <glog/logging.h>
#include <regex>

namespace arbiter {
using namespace std;
using namespace nlohmann;

map<string, string> command_paths::substitutions() const {
    return {{"src", src.string()},
            {"exe", exe.string()},
            {"workdir", workdir.string()}};
}

optional<command_template> parse_command_template(const json &value) {
    if (value.is_string()) {
        json parsed = json::parse(value.get<string>(), nullptr, /* allow_exceptions */ false);
        if (parsed.is_discarded()) {
            LOG(WARNING) << "Malformed command template " << value.get<string>();
            return nullopt;
        }
        return parse_command_template(parsed);
    }

    if (!value.is_array()) return nullopt;

    command_template result;
    for (auto &token : value) {
        if (!token.is_string()) {
            LOG(WARNING) << "Command template contains non-string token " << value.dump();
            return nullopt;
        }
        result.push_back(token.get<string>());
    }
    return result;
}

static string fill_placeholders(const string &token, const map<string, string> &substitutions) {
    static const regex placeholder(R"(\{(\w+)\})");
    string result;
    auto begin = sregex_iterator(token.begin(), token.end(), placeholder);
    size_t last = 0;
    for (auto it = begin; it != sregex_iterator(); ++it) {
        auto &match = *it;
        result.append(token, last, match.position(0) - last);
        auto value = substitutions.find(match[1].str());
        if (value != substitutions.end()) result += value->second;
        last = match.position(0) + match.length(0);
    }
    result.append(token, last, string::npos);
    return result;
}

optional<vector<string>> resolve_command(const optional<command_template> &tmpl, const map<string, string> &substitutions) {
    if (!tmpl || tmpl->empty()) return nullopt;

    vector<string> argv;
    for (auto &token : *tmpl)
        argv.push_back(fill_placeholders(token, substitutions));
    return argv;
}

optional<vector<string>> resolve_command(const optional<command_template> &tmpl, const command_paths &paths) {
    return resolve_command(tmpl, paths.substitutions());
}

}  // namespace arbiter
