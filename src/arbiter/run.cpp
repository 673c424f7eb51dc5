#include "arbiter/run.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <algorithm>
#include <system_error>
#include "arbiter/interactive.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"

namespace arbiter {
using namespace std;
namespace fs = std::filesystem;

// 超过该大小的输出不再检查内容
const uintmax_t SANITY_CHECK_SIZE_LIMIT = 20'000'000;

vector<string> check_output_sanity(const string &content) {
    vector<string> problems;
    if (content.empty()) return problems;
    for (unsigned char c : content) {
        if ((c < 0x20 && c != '\n' && c != '\t' && c != '\r') || c == 0x7f) {
            problems.push_back("contains non-printable characters");
            break;
        }
    }
    if (content.back() != '\n') problems.push_back("does not end with a newline");
    return problems;
}

testcase_run::testcase_run(const problem &prob, const submission &sub, const testcase &tc, const judge_options &options)
    : prob(prob), sub(sub), tc(tc), options(options) {
    fs::path tmp_path = RUN_DIR / "runs" / sub.name / tc.name;
    out_path = tmp_path;
    out_path += ".out";
    feedbackdir = tmp_path;
    feedbackdir += ".feedbackdir";
}

const testcase &testcase_run::get_testcase() const {
    return tc;
}

const fs::path &testcase_run::get_output_path() const {
    return out_path;
}

const fs::path &testcase_run::get_feedback_dir() const {
    return feedbackdir;
}

execution_result testcase_run::run(judge_statistics &stats, const cancellation_token &token) {
    execution_result result;
    try {
        clear_directory(feedbackdir);
        if (prob.interactive) {
            result = run_interactive(stats, token);
        } else {
            result = run_batch(stats, token);
        }
    } catch (spawn_error &e) {
        LOG(ERROR) << fmt::format("Unable to judge submission {} on testcase {}: {}", sub.name, tc.name, e.what());
        ++stats.errors;
        result.result = verdict::VALIDATOR_CRASH;
        result.err = e.what();
    } catch (configuration_error &e) {
        LOG(ERROR) << fmt::format("{} (testcase {})", e.what(), tc.name);
        ++stats.errors;
        result.result = verdict::VALIDATOR_CRASH;
        result.err = e.what();
    } catch (system_error &e) {
        LOG(ERROR) << fmt::format("System error while judging submission {} on testcase {}: {}", sub.name, tc.name, e.what());
        ++stats.errors;
        result.result = verdict::VALIDATOR_CRASH;
        result.err = e.what();
    }

    DLOG(INFO) << fmt::format("Submission {} testcase {}: {} {:.3f}s", sub.name, tc.name, result.print_verdict(), result.duration);
    return result;
}

execution_result testcase_run::run_batch(judge_statistics &stats, const cancellation_token &token) {
    fs::create_directories(out_path.parent_path());

    process_io io;
    io.stdin_file = tc.in_path;
    io.stdout_file = out_path;
    execution_result result = run_process(sub.cmd, io, prob.timeout, token);

    if (result.duration > prob.time_limit) {
        result.result = verdict::TIME_LIMIT_EXCEEDED;
        if (result.timeout_expired) result.print_verdict_override = "TLE (aborted)";
    } else if (!result.ok()) {
        result.result = verdict::RUN_TIME_ERROR;
        string message = fmt::format("Exited with code {}", result.exit_code.value_or(0));
        if (options.show_errors)
            result.err = message + ":\n" + result.err.value_or("");
        else
            result.err = message;
    } else {
        validate(result, stats, token);
        if (result.result == verdict::ACCEPTED) check_output(stats);
    }

    cleanup_output();
    return result;
}

void testcase_run::validate(execution_result &result, judge_statistics &stats, const cancellation_token &token) {
    const output_validator &validator = prob.validator();
    execution_result validated = validator.run(tc, out_path, feedbackdir, tc.validator_flags, token);
    // 比较器的运行时间与评测结果无关，保留选手程序的运行时间
    validated.duration = result.duration;

    switch (classify_validator(validated)) {
        case validator_status::ACCEPTED:
            validated.result = verdict::ACCEPTED;
            break;
        case validator_status::REJECTED:
            validated.result = verdict::WRONG_ANSWER;
            break;
        case validator_status::CRASHED:
            LOG(ERROR) << fmt::format("Validator {} crashed on testcase {}: {}, exit code {}",
                                      validator.name, tc.name, get_display_message(validated.status), validated.exit_code.value_or(0));
            ++stats.errors;
            validated.result = verdict::VALIDATOR_CRASH;
            break;
    }
    result = move(validated);
}

execution_result testcase_run::run_interactive(judge_statistics &stats, const cancellation_token &token) {
    interactive_session session(sub.cmd, prob.validator());
    interaction_result interaction = session.run(tc, feedbackdir, tc.validator_flags, prob.timeout, token);
    return judge_interaction(interaction, prob.time_limit, prob.precise_interactive_diagnosis, stats);
}

void testcase_run::check_output(judge_statistics &stats) {
    error_code ec;
    uintmax_t size = fs::file_size(out_path, ec);
    if (ec) return;
    if (size > SANITY_CHECK_SIZE_LIMIT) {
        LOG(WARNING) << fmt::format("Output of {} on testcase {} is larger than {} bytes", sub.name, tc.name, SANITY_CHECK_SIZE_LIMIT);
        ++stats.warnings;
        return;
    }
    for (auto &issue : check_output_sanity(read_file_content(out_path))) {
        LOG(WARNING) << fmt::format("Output of {} on testcase {} {}", sub.name, tc.name, issue);
        ++stats.warnings;
    }
}

void testcase_run::cleanup_output() {
    if (options.show_errors || DEBUG) return;
    error_code ec;
    if (fs::is_regular_file(out_path, ec) && fs::file_size(out_path, ec) > OUTPUT_CLEANUP_THRESHOLD) {
        LOG(INFO) << "Removing oversized output file " << out_path;
        fs::remove(out_path, ec);
    }
}

vector<feedback_artifact> testcase_run::collect_feedback(judge_statistics &stats) {
    vector<feedback_artifact> artifacts;
    if (!fs::is_directory(feedbackdir)) return artifacts;

    vector<fs::path> entries;
    for (auto &entry : fs::directory_iterator(feedbackdir))
        entries.push_back(entry.path());
    sort(entries.begin(), entries.end());

    for (auto &path : entries) {
        if (!fs::is_regular_file(path)) {
            LOG(WARNING) << "Validator wrote to " << path << " but it's not a file";
            ++stats.warnings;
            continue;
        }
        string content = read_file_content(path);
        if (!utf8_check_is_valid(content)) {
            LOG(ERROR) << "Validator wrote to " << path << " but it cannot be parsed as unicode text";
            ++stats.errors;
            continue;
        }
        fs::remove(path);
        if (content.empty()) continue;
        artifacts.push_back({path.filename().string(), content});
    }
    return artifacts;
}

}  // namespace arbiter
