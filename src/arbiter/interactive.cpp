#include "arbiter/interactive.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"

namespace arbiter {
using namespace std;
namespace fs = std::filesystem;

const int POLL_INTERVAL_MS = 5;
const int DRAIN_TIMEOUT_MS = 100;

interactive_session::interactive_session(const command &submission_cmd, const output_validator &interactor)
    : submission_cmd(submission_cmd), interactor(interactor) {}

interaction_result interactive_session::run(const testcase &tc, const fs::path &feedbackdir, const vector<string> &extra_flags,
                                            double hard_timeout, const cancellation_token &token) const {
    token.throw_if_cancelled();

    // touser: 交互器 stdout -> 选手程序 stdin
    // fromuser: 选手程序 stdout -> 交互器 stdin
    scoped_fd touser_read, touser_write, fromuser_read, fromuser_write;
    scoped_fd submission_err_read, submission_err_write, validator_err_read, validator_err_write;
    make_pipe(touser_read, touser_write);
    make_pipe(fromuser_read, fromuser_write);
    make_pipe(submission_err_read, submission_err_write);
    make_pipe(validator_err_read, validator_err_write);

    command validator_cmd = interactor.build_command(tc, feedbackdir, extra_flags);

    elapsed_time timer;
    child_process validator = spawn_process(validator_cmd, fromuser_read.get(), touser_write.get(), validator_err_write.get());
    child_process user = spawn_process(submission_cmd, touser_read.get(), fromuser_write.get(), submission_err_write.get());

    // touser_read 一直持有到两个进程都退出，选手程序提前退出后交互器仍然可以写入而不会收到 SIGPIPE
    submission_err_write.reset();
    validator_err_write.reset();

    string submission_err, validator_err;
    pipe_reader reader;
    reader.add(move(submission_err_read), &submission_err);
    reader.add(move(validator_err_read), &validator_err);

    interaction_result result;
    bool user_done = false, validator_done = false;
    while (!user_done || !validator_done) {
        reader.pump(POLL_INTERVAL_MS);

        if (!user_done && user.try_wait()) {
            user_done = true;
            result.submission.duration = timer.seconds();
            // 选手程序已经退出，交互器可以读到 EOF 了
            fromuser_write.reset();
        }

        if (!validator_done && validator.try_wait()) {
            validator_done = true;
            result.validator.duration = timer.seconds();
            if (!user_done) result.validator_first = true;
            touser_write.reset();

            execution_result status;
            fill_exit_status(status, validator.wait_status());
            if (classify_validator(status) != validator_status::ACCEPTED)
                fromuser_read.reset();
        }

        if (user_done && validator_done) break;

        if (token.cancelled()) {
            user.kill();
            validator.kill();
            user.wait();
            validator.wait();
            throw judge_cancelled();
        }

        if (timer.seconds() >= hard_timeout) {
            LOG(INFO) << fmt::format("Interaction on testcase {} exceeded hard timeout {:.3f}s, killing", tc.name, hard_timeout);
            result.timeout_expired = true;
            double now = timer.seconds();
            if (!user_done) {
                user.kill();
                user.wait();
                result.submission.duration = now;
                result.submission.timeout_expired = true;
                result.submission.status = exec_status::TIMED_OUT;
            }
            if (!validator_done) {
                validator.kill();
                validator.wait();
                result.validator.duration = now;
                result.validator.timeout_expired = true;
                result.validator.status = exec_status::TIMED_OUT;
            }
            break;
        }
    }
    result.duration = timer.seconds();

    touser_read.reset();
    touser_write.reset();
    fromuser_write.reset();
    fromuser_read.reset();

    reader.drain(DRAIN_TIMEOUT_MS);

    if (!result.submission.timeout_expired) fill_exit_status(result.submission, user.wait_status());
    if (!result.validator.timeout_expired) fill_exit_status(result.validator, validator.wait_status());

    result.submission.err = submission_err;
    result.validator.err = validator_err;
    merge_judge_messages(result.validator, feedbackdir);
    return result;
}

execution_result judge_interaction(const interaction_result &result, double time_limit, bool precise, judge_statistics &stats) {
    execution_result judged = result.submission;
    judged.duration = result.duration;
    judged.timeout_expired = result.timeout_expired;
    judged.out = crop_output(result.submission.err.value_or(""));
    judged.err = crop_output(result.validator.err.value_or(""));

    validator_status validator = classify_validator(result.validator);

    if (!precise) {
        if (validator == validator_status::ACCEPTED && result.submission.ok() && result.duration <= time_limit) {
            judged.result = verdict::ACCEPTED;
        } else if (validator == validator_status::CRASHED && !result.validator.timeout_expired) {
            LOG(ERROR) << "Interactor crashed: " << get_display_message(result.validator.status)
                       << ", exit code " << result.validator.exit_code.value_or(0);
            ++stats.errors;
            judged.result = verdict::VALIDATOR_CRASH;
        } else {
            judged.result = verdict::WRONG_ANSWER;
            judged.print_verdict_override = "INCORRECT";
            judged.ambiguous = true;
        }
        return judged;
    }

    if (result.validator_first && validator == validator_status::REJECTED) {
        judged.result = verdict::WRONG_ANSWER;
    } else if (result.validator_first && validator == validator_status::CRASHED) {
        // 交互器先崩溃时选手程序随后读到 EOF 或收到 SIGPIPE，不能归咎于选手程序
        LOG(ERROR) << "Interactor crashed before submission exited: " << get_display_message(result.validator.status)
                   << ", exit code " << result.validator.exit_code.value_or(0);
        ++stats.errors;
        judged.result = verdict::VALIDATOR_CRASH;
    } else if (result.duration > time_limit) {
        judged.result = verdict::TIME_LIMIT_EXCEEDED;
        if (result.timeout_expired) judged.print_verdict_override = "TLE (aborted)";
    } else if (!result.submission.ok()) {
        judged.result = verdict::RUN_TIME_ERROR;
    } else if (validator == validator_status::ACCEPTED) {
        judged.result = verdict::ACCEPTED;
    } else if (validator == validator_status::REJECTED) {
        judged.result = verdict::WRONG_ANSWER;
    } else {
        LOG(ERROR) << "Interactor crashed: " << get_display_message(result.validator.status)
                   << ", exit code " << result.validator.exit_code.value_or(0);
        ++stats.errors;
        judged.result = verdict::VALIDATOR_CRASH;
    }
    return judged;
}

}  // namespace arbiter
