#include "common/utils.hpp"
#include <cstdlib>

namespace arbiter {
using namespace std;

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

void set_env(const string &key, const string &value, bool replace) {
    setenv(key.c_str(), value.c_str(), replace);
}

string replace_all(string text, const string &from, const string &to) {
    if (from.empty()) return text;
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != string::npos) {
        text.replace(pos, from.length(), to);
        pos += to.length();
    }
    return text;
}

string truncate_text(const string &text, size_t max_length) {
    if (text.size() <= max_length) return text;
    return text.substr(0, max_length) + "\n... (truncated)";
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

}  // namespace arbiter
