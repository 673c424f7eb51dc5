#include "arbiter/submission_judger.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <algorithm>
#include <mutex>
#include <thread>
#include "arbiter/expected_verdicts.hpp"
#include "arbiter/run.hpp"
#include "common/concurrent_queue.hpp"
#include "common/exceptions.hpp"

namespace arbiter {
using namespace std;

struct submission_judger::judge_state {
    /**
     * @brief 保护 outcome、best_index 以及 monitor 的调用
     */
    mutex mut;

    cancellation_token token;

    /**
     * @brief 待评测的测试点下标
     */
    concurrent_queue<size_t> queue;

    submission_run_outcome outcome;

    vector<verdict> expected;

    bool has_best = false;

    size_t best_index = 0;
};

submission_judger::submission_judger(const problem &prob, const judge_options &options, monitor &mon)
    : prob(prob), options(options), mon(mon) {}

bool submission_judger::should_abort(const execution_result &result) const {
    if (options.verbose || options.table) return false;
    if (!result.result || !is_max_priority(*result.result)) return false;
    // 仅超过时间限制的程序还不能确定最终结果一定是 TLE，还可能有测试点比较器崩溃
    if (*result.result == verdict::TIME_LIMIT_EXCEEDED && !result.timeout_expired) return false;
    return true;
}

void submission_judger::fold(judge_state &state, const submission &sub, testcase_report report) {
    submission_run_outcome &outcome = state.outcome;
    ++outcome.judged;
    outcome.duration = max(outcome.duration, report.duration);
    if (options.table) outcome.table[report.name] = report.result == verdict::ACCEPTED;

    int priority = get_priority(report.result);
    if (!state.has_best || priority > outcome.priority ||
        (priority == outcome.priority && report.index < state.best_index)) {
        state.has_best = true;
        state.best_index = report.index;
        outcome.result = report.result;
        outcome.priority = priority;
        outcome.print_verdict = report.print_verdict;
        outcome.representative = report;
    }

    mon.end_testcase(sub, report);
}

void submission_judger::worker_loop(judge_state &state, const submission &sub, const vector<testcase> &testcases) {
    size_t index;
    while (state.queue.pop(index)) {
        const testcase &tc = testcases[index];
        {
            scoped_lock guard(state.mut);
            if (state.token.cancelled()) continue;
            mon.start_testcase(sub, tc);
        }

        judge_statistics stats;
        testcase_run run(prob, sub, tc, options);
        execution_result result;
        vector<feedback_artifact> artifacts;
        try {
            result = run.run(stats, state.token);
            artifacts = run.collect_feedback(stats);
        } catch (judge_cancelled &) {
            DLOG(INFO) << fmt::format("Testcase {} of submission {} cancelled", tc.name, sub.name);
            continue;
        } catch (arbiter_exception &e) {
            LOG(ERROR) << "Unable to judge testcase " << tc.name << ": " << e;
            ++stats.errors;
            result.result = verdict::VALIDATOR_CRASH;
            result.err = e.what();
        } catch (exception &e) {
            LOG(ERROR) << "Unable to judge testcase " << tc.name << ": " << e.what();
            ++stats.errors;
            result.result = verdict::VALIDATOR_CRASH;
            result.err = e.what();
        }

        testcase_report report;
        report.name = tc.name;
        report.index = index;
        report.result = *result.result;
        report.print_verdict = result.print_verdict();
        report.duration = result.duration;
        report.timeout_expired = result.timeout_expired;
        report.ambiguous = result.ambiguous;
        report.data = format_report_data(result, artifacts, prob.interactive);
        report.artifacts = move(artifacts);
        report.got_expected = testcase_got_expected(state.expected, report.result, report.ambiguous);

        scoped_lock guard(state.mut);
        // 评测已经被其他测试点提前结束，丢弃该测试点的结果
        if (state.token.cancelled()) continue;

        state.outcome.statistics.merge(stats);
        fold(state, sub, move(report));

        if (should_abort(result)) {
            size_t dropped = state.queue.clear();
            state.token.cancel();
            state.outcome.aborted = true;
            LOG(INFO) << fmt::format("Submission {} got {} on testcase {}, skipping {} queued testcases",
                                     sub.name, result.print_verdict(), tc.name, dropped);
        }
    }
}

submission_run_outcome submission_judger::judge_all(const submission &sub, const vector<testcase> &testcases) {
    judge_state state;
    state.expected = sub.expected_verdicts;
    if (prob.interactive && !prob.precise_interactive_diagnosis)
        expand_ambiguous_verdicts(state.expected);

    mon.start_submission(sub, testcases.size());
    LOG(INFO) << fmt::format("Judging submission {} on {} testcases", sub.name, testcases.size());

    for (size_t i = 0; i < testcases.size(); ++i)
        state.queue.push(i);
    state.queue.close();

    size_t jobs = options.jobs;
    if (jobs == 0) jobs = max(1u, thread::hardware_concurrency());
    jobs = min(jobs, testcases.size());

    vector<thread> workers;
    for (size_t i = 0; i < jobs; ++i)
        workers.emplace_back([&] { worker_loop(state, sub, testcases); });
    for (auto &worker : workers)
        worker.join();

    submission_run_outcome &outcome = state.outcome;
    outcome.skipped = testcases.size() - outcome.judged;
    outcome.got_expected = submission_got_expected(
        state.expected, outcome.result, outcome.representative && outcome.representative->ambiguous);

    LOG(INFO) << fmt::format("Submission {} finished: {} ({} judged, {} skipped, {} errors, {} warnings)",
                             sub.name, outcome.print_verdict, outcome.judged, outcome.skipped,
                             outcome.statistics.errors, outcome.statistics.warnings);
    mon.end_submission(sub, outcome);
    return move(outcome);
}

}  // namespace arbiter
