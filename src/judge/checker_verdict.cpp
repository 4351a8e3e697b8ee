#include "arbiter/judge/checker_verdict.hpp"
#include <boost/algorithm/string.hpp>
#include <set>

namespace arbiter {
using namespace std;
using namespace nlohmann;

static const set<string> accepted_words = {"accepted", "ac", "ok", "pass", "passed", "true"};
static const set<string> wrong_answer_words = {"wrong answer", "wrong", "wa", "fail", "failed", "false"};

static const char *verdict_fields[] = {"status", "result", "verdict"};

optional<checker_reply> classify_checker_reply(const string &output) {
    string trimmed = boost::algorithm::trim_copy(output);
    if (trimmed.empty()) return nullopt;

    json payload = json::parse(trimmed, nullptr, /* allow_exceptions */ false);
    if (payload.is_boolean()) return checker_reply(payload.get<bool>());
    if (payload.is_string()) return checker_reply(payload.get<string>());
    if (payload.is_object()) return checker_reply(checker_object_reply{payload});
    return checker_reply(checker_text_reply{trimmed});
}

static optional<status> resolve_value(const json &value) {
    if (value.is_boolean()) return value.get<bool>() ? status::ACCEPTED : status::WRONG_ANSWER;
    if (value.is_string()) return parse_checker_verdict(value.get<string>());
    return nullopt;
}

optional<status> resolve_checker_reply(const checker_reply &reply) {
    if (auto value = get_if<bool>(&reply)) {
        return *value ? status::ACCEPTED : status::WRONG_ANSWER;
    } else if (auto text = get_if<string>(&reply)) {
        // JSON 字符串比原始输出至少少了两个引号，因此递归一定会结束
        return parse_checker_verdict(*text);
    } else if (auto object = get_if<checker_object_reply>(&reply)) {
        for (auto field : verdict_fields) {
            auto it = object->fields.find(field);
            if (it != object->fields.end() && !it->is_null()) return resolve_value(*it);
        }
        return nullopt;
    } else {
        string word = boost::algorithm::to_lower_copy(get<checker_text_reply>(reply).text);
        if (accepted_words.count(word)) return status::ACCEPTED;
        if (wrong_answer_words.count(word)) return status::WRONG_ANSWER;
        return nullopt;
    }
}

optional<status> parse_checker_verdict(const string &output) {
    auto reply = classify_checker_reply(output);
    if (!reply) return nullopt;
    return resolve_checker_reply(*reply);
}

}  // namespace arbiter
