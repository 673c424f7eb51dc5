#include "arbiter/interactive.hpp"
#include <gtest/gtest.h>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "test/environment.hpp"

using namespace std;
using namespace arbiter;
using namespace arbiter::test;
namespace fs = std::filesystem;

static const char *INTERACTOR_SCRIPT = R"SH(read n < "$1"
echo "$n"
read reply
if [ "$reply" = "$((n * 2))" ]; then exit 42; fi
echo "got $reply" > "$3/judgemessage.txt"
echo "interactor rejected" >&2
exit 43
)SH";

class InteractiveSessionTest : public ::testing::Test {
protected:
    scratch_directory dir;
    cancellation_token token;
    fs::path feedbackdir;
    testcase tc;

    void SetUp() override {
        feedbackdir = dir.path() / "feedbackdir";
        clear_directory(feedbackdir);
        tc.name = "1";
        tc.in_path = dir.write_file("1.in", "21\n");
    }

    output_validator make_interactor(const string &body) {
        output_validator interactor;
        interactor.name = "interactor";
        interactor.cmd.argv = {dir.write_script("interactor.sh", body).string()};
        return interactor;
    }

    static command shell(const string &script) {
        command cmd;
        cmd.argv = {"/bin/sh", "-c", script};
        return cmd;
    }

    execution_result judge(const string &submission_script, const string &interactor_script, bool precise,
                           judge_statistics &stats, double time_limit = 1, double timeout = 3) {
        command submission_cmd = shell(submission_script);
        output_validator interactor = make_interactor(interactor_script);
        interactive_session session(submission_cmd, interactor);
        interaction_result result = session.run(tc, feedbackdir, {}, timeout, token);
        return judge_interaction(result, time_limit, precise, stats);
    }
};

TEST_F(InteractiveSessionTest, Accepted) {
    judge_statistics stats;
    execution_result result = judge("read n; echo debug >&2; echo $((n * 2))", INTERACTOR_SCRIPT, true, stats);

    EXPECT_EQ(verdict::ACCEPTED, result.result);
    EXPECT_EQ("debug\n", result.out.value_or(""));
    EXPECT_EQ(0u, stats.errors);
}

TEST_F(InteractiveSessionTest, WrongAnswer) {
    judge_statistics stats;
    execution_result result = judge("read n; echo 0", INTERACTOR_SCRIPT, true, stats);

    EXPECT_EQ(verdict::WRONG_ANSWER, result.result);
    EXPECT_EQ("interactor rejected\ngot 0\n", result.err.value_or(""));
    EXPECT_FALSE(fs::exists(feedbackdir / JUDGE_MESSAGE_FILE));
}

TEST_F(InteractiveSessionTest, SubmissionExitsFirstWithError) {
    command submission_cmd = shell("read n; exit 3");
    output_validator interactor = make_interactor(INTERACTOR_SCRIPT);
    interactive_session session(submission_cmd, interactor);
    interaction_result interaction = session.run(tc, feedbackdir, {}, 3, token);

    // 交互器只有在选手程序退出并被回收后才能读到 EOF
    EXPECT_FALSE(interaction.validator_first);
    EXPECT_EQ(exec_status::NONZERO_EXIT, interaction.submission.status);
    EXPECT_EQ(3, interaction.submission.exit_code.value_or(0));
    EXPECT_EQ(validator_status::REJECTED, classify_validator(interaction.validator));

    judge_statistics stats;
    EXPECT_EQ(verdict::RUN_TIME_ERROR, judge_interaction(interaction, 1, true, stats).result);
}

TEST_F(InteractiveSessionTest, InteractorRejectsFirst) {
    judge_statistics stats;
    command submission_cmd = shell("read n; sleep 30");
    output_validator interactor = make_interactor(R"(read n < "$1"; echo "$n"; exit 43)");
    interactive_session session(submission_cmd, interactor);
    interaction_result interaction = session.run(tc, feedbackdir, {}, 1, token);

    EXPECT_TRUE(interaction.validator_first);
    EXPECT_TRUE(interaction.timeout_expired);

    execution_result precise = judge_interaction(interaction, 0.5, true, stats);
    EXPECT_EQ(verdict::WRONG_ANSWER, precise.result);
    EXPECT_FALSE(precise.ambiguous);

    execution_result imprecise = judge_interaction(interaction, 0.5, false, stats);
    EXPECT_EQ(verdict::WRONG_ANSWER, imprecise.result);
    EXPECT_EQ("INCORRECT", imprecise.print_verdict());
    EXPECT_TRUE(imprecise.ambiguous);
    EXPECT_EQ(0u, stats.errors);
}

TEST_F(InteractiveSessionTest, InteractorWritesAfterSubmissionExits) {
    judge_statistics stats;
    execution_result result = judge("read n; echo $((n * 2))", R"SH(read n < "$1"
echo "$n"
read reply
sleep 0.2
echo correct
[ "$reply" = "$((n * 2))" ] && exit 42
exit 43
)SH", true, stats);

    EXPECT_EQ(verdict::ACCEPTED, result.result);
    EXPECT_EQ(0u, stats.errors);
}

TEST_F(InteractiveSessionTest, InteractorCrashesFirst) {
    command submission_cmd = shell("read n || exit 1; echo $((n * 2))");
    output_validator interactor = make_interactor("exit 1");
    interactive_session session(submission_cmd, interactor);
    interaction_result interaction = session.run(tc, feedbackdir, {}, 3, token);

    EXPECT_TRUE(interaction.validator_first);
    EXPECT_EQ(exec_status::NONZERO_EXIT, interaction.submission.status);

    judge_statistics stats;
    EXPECT_EQ(verdict::VALIDATOR_CRASH, judge_interaction(interaction, 1, true, stats).result);
    EXPECT_EQ(1u, stats.errors);
}

TEST_F(InteractiveSessionTest, HardTimeoutKillsBoth) {
    judge_statistics stats;
    execution_result result = judge("read n; sleep 30", INTERACTOR_SCRIPT, true, stats, 0.2, 0.5);

    EXPECT_EQ(verdict::TIME_LIMIT_EXCEEDED, result.result);
    EXPECT_TRUE(result.timeout_expired);
    EXPECT_EQ("TLE (aborted)", result.print_verdict());
    EXPECT_LT(result.duration, 5);
}

TEST_F(InteractiveSessionTest, InteractorCrash) {
    judge_statistics stats;
    execution_result result = judge("read n; exit 0", "exit 1", true, stats);

    EXPECT_EQ(verdict::VALIDATOR_CRASH, result.result);
    EXPECT_EQ(1u, stats.errors);
}

TEST_F(InteractiveSessionTest, MissingSubmissionThrowsSpawnError) {
    command submission_cmd;
    submission_cmd.argv = {(dir.path() / "no-such-program").string()};
    output_validator interactor = make_interactor(INTERACTOR_SCRIPT);
    interactive_session session(submission_cmd, interactor);
    EXPECT_THROW(session.run(tc, feedbackdir, {}, 3, token), spawn_error);
}

TEST_F(InteractiveSessionTest, Cancelled) {
    command submission_cmd = shell("read n; echo $((n * 2))");
    output_validator interactor = make_interactor(INTERACTOR_SCRIPT);
    interactive_session session(submission_cmd, interactor);
    token.cancel();
    EXPECT_THROW(session.run(tc, feedbackdir, {}, 3, token), judge_cancelled);
}

static interaction_result make_interaction(int validator_exit, bool validator_first, exec_status submission_status, double duration) {
    interaction_result result;
    result.validator.status = exec_status::NONZERO_EXIT;
    result.validator.exit_code = validator_exit;
    result.validator_first = validator_first;
    result.submission.status = submission_status;
    result.submission.exit_code = submission_status == exec_status::OK ? 0 : 1;
    result.duration = duration;
    return result;
}

TEST(JudgeInteractionTest, PreciseMapping) {
    judge_statistics stats;
    EXPECT_EQ(verdict::ACCEPTED, judge_interaction(make_interaction(42, false, exec_status::OK, 0.5), 1, true, stats).result);
    EXPECT_EQ(verdict::WRONG_ANSWER, judge_interaction(make_interaction(43, false, exec_status::OK, 0.5), 1, true, stats).result);
    // 交互器先退出并判定错误时，选手程序随后的错误不影响结果
    EXPECT_EQ(verdict::WRONG_ANSWER, judge_interaction(make_interaction(43, true, exec_status::NONZERO_EXIT, 2), 1, true, stats).result);
    EXPECT_EQ(verdict::TIME_LIMIT_EXCEEDED, judge_interaction(make_interaction(43, false, exec_status::OK, 2), 1, true, stats).result);
    // 选手程序崩溃时，无论交互器的判定如何都是 RUN_TIME_ERROR
    EXPECT_EQ(verdict::RUN_TIME_ERROR, judge_interaction(make_interaction(42, false, exec_status::CRASHED, 0.5), 1, true, stats).result);
    EXPECT_EQ(verdict::RUN_TIME_ERROR, judge_interaction(make_interaction(42, true, exec_status::NONZERO_EXIT, 0.5), 1, true, stats).result);
    EXPECT_EQ(0u, stats.errors);

    EXPECT_EQ(verdict::VALIDATOR_CRASH, judge_interaction(make_interaction(3, false, exec_status::OK, 0.5), 1, true, stats).result);
    EXPECT_EQ(1u, stats.errors);

    // 交互器先崩溃，选手程序随后读到 EOF 而非正常退出
    EXPECT_EQ(verdict::VALIDATOR_CRASH, judge_interaction(make_interaction(1, true, exec_status::NONZERO_EXIT, 0.5), 1, true, stats).result);
    EXPECT_EQ(verdict::VALIDATOR_CRASH, judge_interaction(make_interaction(1, true, exec_status::CRASHED, 2), 1, true, stats).result);
    EXPECT_EQ(3u, stats.errors);
}

TEST(JudgeInteractionTest, ImpreciseMapping) {
    judge_statistics stats;
    execution_result accepted = judge_interaction(make_interaction(42, false, exec_status::OK, 0.5), 1, false, stats);
    EXPECT_EQ(verdict::ACCEPTED, accepted.result);
    EXPECT_FALSE(accepted.ambiguous);

    for (auto result : {judge_interaction(make_interaction(43, false, exec_status::OK, 0.5), 1, false, stats),
                        judge_interaction(make_interaction(42, false, exec_status::OK, 2), 1, false, stats),
                        judge_interaction(make_interaction(42, false, exec_status::CRASHED, 0.5), 1, false, stats)}) {
        EXPECT_EQ(verdict::WRONG_ANSWER, result.result);
        EXPECT_EQ("INCORRECT", result.print_verdict());
        EXPECT_TRUE(result.ambiguous);
    }
    EXPECT_EQ(0u, stats.errors);

    EXPECT_EQ(verdict::VALIDATOR_CRASH, judge_interaction(make_interaction(1, false, exec_status::OK, 0.5), 1, false, stats).result);
    EXPECT_EQ(1u, stats.errors);
}
