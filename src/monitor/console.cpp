#include "monitor/console.hpp"
#include <fmt/core.h>

namespace arbiter {
using namespace std;

console_monitor::console_monitor(const judge_options &options, FILE *out) : options(options), out(out) {}

void console_monitor::start_submission(const submission &sub, size_t testcases) {
    fmt::print(out, "Running {} on {} testcases\n", sub.name, testcases);
    fflush(out);
}

void console_monitor::end_testcase(const submission &sub, const testcase_report &report) {
    // 符合预期的测试点只在 verbose 模式下输出
    if (!options.verbose && report.got_expected) return;

    fmt::print(out, "{}/{}: {:6.3f}s {}{}\n", sub.name, report.name, report.duration, report.print_verdict,
               report.got_expected ? "" : " (unexpected)");
    if (!report.data.empty()) fmt::print(out, "{}", report.data);
    fflush(out);
}

void console_monitor::end_submission(const submission &sub, const submission_run_outcome &outcome) {
    string at = outcome.representative ? " @ " + outcome.representative->name : "";
    fmt::print(out, "{}: {:6.3f}s {:<20}{}{}\n", sub.name, outcome.duration, outcome.print_verdict, at,
               outcome.got_expected ? "" : " (unexpected)");
    // 不符合预期的测试点在 end_testcase 中已经输出过
    if (outcome.representative && !options.verbose && outcome.representative->got_expected &&
        !outcome.representative->data.empty())
        fmt::print(out, "{}", outcome.representative->data);
    if (outcome.aborted)
        fmt::print(out, "{} testcases skipped\n", outcome.skipped);
    if (options.table) {
        for (auto &[name, accepted] : outcome.table)
            fmt::print(out, "  {:<30} {}\n", name, accepted ? "ok" : "failed");
    }
    fflush(out);
}

}  // namespace arbiter
