#include "arbiter/common/text_utils.hpp"
#include <boost/algorithm/string/replace.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <utility>

namespace arbiter {
using namespace std;

string normalize_output(const string &text) {
    string result = boost::algorithm::replace_all_copy(text, "\r\n", "\n");
    boost::algorithm::trim_right(result);
    return result;
}

string decode_testcase_text(const string &text) {
    if (text.find('\n') != string::npos || text.find('\r') != string::npos)
        return text;

    // 二次转义的序列必须先替换，否则 "\\n" 会被拆成 "\" 和换行符
    static const pair<const char *, const char *> escapes[] = {
        {R"(\\r\\n)", "\n"},
        {R"(\\n)", "\n"},
        {R"(\\r)", "\n"},
        {R"(\\t)", "\t"},
        {R"(\r\n)", "\n"},
        {R"(\n)", "\n"},
        {R"(\r)", "\n"},
        {R"(\t)", "\t"}};

    string result = text;
    for (auto &[from, to] : escapes)
        boost::algorithm::replace_all(result, from, to);
    return result;
}

}  // namespace arbiter
