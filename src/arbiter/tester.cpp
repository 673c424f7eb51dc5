#include "arbiter/tester.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <cstdio>
#include "arbiter/options.hpp"
#include "arbiter/process_runner.hpp"
#include "arbiter/run.hpp"
#include "common/exceptions.hpp"

namespace arbiter {
using namespace std;

const char *get_display_message(test_status status) {
    switch (status) {
        case test_status::DONE:
            return "Done";
        case test_status::DONE_TLE:
            return "Done (TLE)";
        case test_status::RUN_TIME_ERROR:
            return "Run time error!";
        case test_status::ABORTED:
            return "Aborted!";
    }
    return "Unknown";
}

submission_tester::submission_tester(const problem &prob) : prob(prob) {}

test_report submission_tester::test(const submission &sub, const testcase &tc, judge_statistics &stats, const cancellation_token &token) const {
    test_report report;
    report.name = tc.name;

    if (prob.interactive) {
        judge_options options;
        testcase_run run(prob, sub, tc, options);
        execution_result result = run.run(stats, token);
        report.duration = result.duration;
        report.exit_code = result.exit_code;
        report.interactive_verdict = result.result;
        // VALIDATOR_CRASH 已经在评测时计入错误
        if (result.result != verdict::ACCEPTED && result.result != verdict::VALIDATOR_CRASH) ++stats.errors;
        return report;
    }

    process_io io;
    io.stdin_file = tc.in_path;
    io.capture_output = false;
    io.crop = false;
    execution_result result = run_process(sub.cmd, io, prob.timeout, token);
    report.duration = result.duration;
    report.exit_code = result.exit_code;

    if (result.timeout_expired || result.duration > prob.timeout) {
        report.status = test_status::ABORTED;
        ++stats.errors;
    } else if (!result.ok()) {
        report.status = test_status::RUN_TIME_ERROR;
        ++stats.errors;
    } else if (result.duration > prob.time_limit) {
        report.status = test_status::DONE_TLE;
        ++stats.warnings;
    } else {
        report.status = test_status::DONE;
    }
    return report;
}

vector<test_report> submission_tester::test_all(const submission &sub, const vector<testcase> &testcases, judge_statistics &stats) const {
    cancellation_token token;
    vector<test_report> reports;
    fmt::print(stderr, "Running {}\n", sub.name);

    for (auto &tc : testcases) {
        fmt::print(stderr, "Running {}: {}\n", sub.name, tc.name);
        fflush(stderr);

        test_report report;
        try {
            report = test(sub, tc, stats, token);
        } catch (spawn_error &e) {
            LOG(ERROR) << "Unable to run submission " << sub.name << " on testcase " << tc.name << ": " << e.what();
            ++stats.errors;
            continue;
        }

        if (report.interactive_verdict) {
            fmt::print(stderr, "{} {:6.3f}s\n\n", get_verdict_name(*report.interactive_verdict), report.duration);
        } else if (report.status == test_status::RUN_TIME_ERROR) {
            fmt::print(stderr, "{} exit code {} {:6.3f}s\n\n", get_display_message(report.status), report.exit_code.value_or(0), report.duration);
        } else {
            fmt::print(stderr, "{} {:6.3f}s\n\n", get_display_message(report.status), report.duration);
        }
        reports.push_back(move(report));
    }
    return reports;
}

}  // namespace arbiter
