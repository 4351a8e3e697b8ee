#include "arbiter/judge/language.hpp"
#include <glog/logging.h>
#include "arbiter/common/exceptions.hpp"
#include "arbiter/common/io_utils.hpp"
#include "arbiter/common/json_utils.hpp"

namespace arbiter {
using namespace std;
using namespace nlohmann;

void from_json(const json &j, language &lang) {
    j.at("key").get_to(lang.key);
    lang.name = get_value_def<string>(j, lang.key, "name");
    lang.version = get_value_def<string>(j, "", "version");
    j.at("source_ext").get_to(lang.source_ext);
    lang.compile_command = parse_command_template(access_optional(j, "compile_command"));
    lang.run_command = parse_command_template(access_optional(j, "run_command"));
    lang.interpreted = get_value_def<bool>(j, !lang.compile_command, "is_interpreted");
    lang.default_time_limit_ms = get_optional<int>(j, "default_time_limit_ms");
    lang.default_memory_limit_kb = get_optional<int>(j, "default_memory_limit_kb");
}

void to_json(json &j, const language &lang) {
    j = json{{"key", lang.key},
             {"name", lang.name},
             {"version", lang.version},
             {"source_ext", lang.source_ext},
             {"is_interpreted", lang.interpreted}};
    put_optional(j, "compile_command", lang.compile_command);
    put_optional(j, "run_command", lang.run_command);
    put_optional(j, "default_time_limit_ms", lang.default_time_limit_ms);
    put_optional(j, "default_memory_limit_kb", lang.default_memory_limit_kb);
}

void language_registry::load(const filesystem::path &config_path) {
    json config;
    try {
        config = json::parse(read_file_content(config_path));
    } catch (std::exception &ex) {
        throw config_error("unable to load language configuration " + config_path.string() + ": " + ex.what());
    }

    const json &list = config.is_object() ? access_optional(config, "languages") : config;
    if (!list.is_array())
        throw config_error("language configuration " + config_path.string() + " should contain an array of languages");

    for (auto &item : list) {
        try {
            add(item.get<language>());
        } catch (std::exception &ex) {
            throw config_error("malformed language " + item.dump() + ": " + ex.what());
        }
    }
    LOG(INFO) << "Loaded " << list.size() << " languages from " << config_path;
}

void language_registry::add(language lang) {
    if (!lang.run_command)
        LOG(WARNING) << "Language " << lang.key << " does not have a usable run command";
    string key = lang.key;
    languages[key] = move(lang);
}

const language *language_registry::find(const string &key) const {
    auto it = languages.find(key);
    return it == languages.end() ? nullptr : &it->second;
}

const language &language_registry::at(const string &key) const {
    auto lang = find(key);
    if (!lang) throw config_error("Language not found: " + key);
    return *lang;
}

size_t language_registry::size() const {
    return languages.size();
}

}  // namespace arbiter
