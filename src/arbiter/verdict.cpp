#include "arbiter/verdict.hpp"
#include <boost/assign.hpp>
#include <algorithm>
#include <map>

namespace arbiter {
using namespace std;

struct verdict_info {
    int priority;
    const char *name;
    const char *display;
};

// clang-format off
static const map<verdict, verdict_info> verdict_table = boost::assign::map_list_of
    (verdict::ACCEPTED, verdict_info{0, "ACCEPTED", "Accepted"})
    (verdict::WRONG_ANSWER, verdict_info{99, "WRONG_ANSWER", "Wrong Answer"})
    (verdict::TIME_LIMIT_EXCEEDED, verdict_info{100, "TIME_LIMIT_EXCEEDED", "Time Limit Exceeded"})
    (verdict::RUN_TIME_ERROR, verdict_info{99, "RUN_TIME_ERROR", "Run Time Error"})
    (verdict::VALIDATOR_CRASH, verdict_info{100, "VALIDATOR_CRASH", "Validator Crash"});
// clang-format on

int get_priority(verdict v) {
    return verdict_table.at(v).priority;
}

int get_max_priority() {
    static const int max_priority = max_element(verdict_table.begin(), verdict_table.end(), [](auto &a, auto &b) {
                                        return a.second.priority < b.second.priority;
                                    })->second.priority;
    return max_priority;
}

bool is_max_priority(verdict v) {
    return get_priority(v) == get_max_priority();
}

const char *get_verdict_name(verdict v) {
    return verdict_table.at(v).name;
}

const char *get_display_message(verdict v) {
    return verdict_table.at(v).display;
}

optional<verdict> parse_verdict(const string &name) {
    for (auto &[v, info] : verdict_table)
        if (name == info.name) return v;
    return nullopt;
}

const vector<verdict> &all_verdicts() {
    static const vector<verdict> verdicts = {
        verdict::ACCEPTED,
        verdict::WRONG_ANSWER,
        verdict::TIME_LIMIT_EXCEEDED,
        verdict::RUN_TIME_ERROR,
        verdict::VALIDATOR_CRASH};
    return verdicts;
}

ostream &operator<<(ostream &os, verdict v) {
    return os << get_verdict_name(v);
}

}  // namespace arbiter
