#include "arbiter/run.hpp"
#include <gtest/gtest.h>
#include <fstream>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "config.hpp"
#include "test/environment.hpp"

using namespace std;
using namespace arbiter;
using namespace arbiter::test;
namespace fs = std::filesystem;

class RunTest : public ::testing::Test {
protected:
    scratch_directory dir;
    cancellation_token token;
    judge_options options;
    judge_statistics stats;

    execution_result judge(const problem &prob, const submission &sub, const testcase &tc) {
        testcase_run run(prob, sub, tc, options);
        return run.run(stats, token);
    }
};

TEST_F(RunTest, Accepted) {
    problem prob = make_problem(dir);
    submission sub = make_submission(dir);
    testcase tc = make_testcase(dir, "1", "ac");

    testcase_run run(prob, sub, tc, options);
    execution_result result = run.run(stats, token);
    EXPECT_EQ(verdict::ACCEPTED, result.result);
    EXPECT_EQ(RUN_DIR / "runs" / "submission" / "1.out", run.get_output_path());
    EXPECT_EQ(RUN_DIR / "runs" / "submission" / "1.feedbackdir", run.get_feedback_dir());
    EXPECT_EQ("ok\n", read_file_content(run.get_output_path()));
    EXPECT_EQ(0u, stats.errors);
}

TEST_F(RunTest, WrongAnswer) {
    problem prob = make_problem(dir);
    submission sub = make_submission(dir);
    testcase tc = make_testcase(dir, "1", "wa");

    execution_result result = judge(prob, sub, tc);
    EXPECT_EQ(verdict::WRONG_ANSWER, result.result);
    EXPECT_EQ("expected ok, got wrong\n", result.err.value_or(""));
}

TEST_F(RunTest, RunTimeError) {
    problem prob = make_problem(dir);
    submission sub = make_submission(dir);
    testcase tc = make_testcase(dir, "1", "rte");

    execution_result result = judge(prob, sub, tc);
    EXPECT_EQ(verdict::RUN_TIME_ERROR, result.result);
    EXPECT_EQ("Exited with code 3", result.err.value_or(""));

    options.show_errors = true;
    result = judge(prob, sub, tc);
    EXPECT_EQ("Exited with code 3:\nboom\n", result.err.value_or(""));
}

TEST_F(RunTest, SoftTimeLimitExceeded) {
    problem prob = make_problem(dir, 0.1, 3);
    submission sub = make_submission(dir);
    testcase tc = make_testcase(dir, "1", "slow");

    execution_result result = judge(prob, sub, tc);
    EXPECT_EQ(verdict::TIME_LIMIT_EXCEEDED, result.result);
    EXPECT_FALSE(result.timeout_expired);
    EXPECT_EQ("TIME_LIMIT_EXCEEDED", result.print_verdict());
}

TEST_F(RunTest, HardTimeoutAborted) {
    problem prob = make_problem(dir, 0.1, 0.3);
    submission sub = make_submission(dir);
    testcase tc = make_testcase(dir, "1", "hang");

    execution_result result = judge(prob, sub, tc);
    EXPECT_EQ(verdict::TIME_LIMIT_EXCEEDED, result.result);
    EXPECT_TRUE(result.timeout_expired);
    EXPECT_EQ("TLE (aborted)", result.print_verdict());
}

TEST_F(RunTest, ValidatorCrash) {
    problem prob = make_problem(dir);
    submission sub = make_submission(dir);
    testcase tc = make_testcase(dir, "1", "crash-validator");

    execution_result result = judge(prob, sub, tc);
    EXPECT_EQ(verdict::VALIDATOR_CRASH, result.result);
    EXPECT_EQ(1u, stats.errors);
}

TEST_F(RunTest, MissingValidator) {
    problem prob = make_problem(dir);
    prob.validators.clear();
    submission sub = make_submission(dir);
    testcase tc = make_testcase(dir, "1", "ac");

    execution_result result = judge(prob, sub, tc);
    EXPECT_EQ(verdict::VALIDATOR_CRASH, result.result);
    EXPECT_EQ(1u, stats.errors);
}

TEST_F(RunTest, MissingSubmission) {
    problem prob = make_problem(dir);
    submission sub = make_submission(dir);
    sub.cmd.argv = {(dir.path() / "no-such-program").string()};
    testcase tc = make_testcase(dir, "1", "ac");

    execution_result result = judge(prob, sub, tc);
    EXPECT_EQ(verdict::VALIDATOR_CRASH, result.result);
    EXPECT_EQ(1u, stats.errors);
    EXPECT_NE(string::npos, result.err.value_or("").find("no-such-program"));
}

TEST_F(RunTest, FeedbackDirectoryClearedBeforeRun) {
    problem prob = make_problem(dir);
    prob.validators[0].cmd.argv = {dir.write_script("empty.sh", R"SH(cat > /dev/null; [ -z "$(ls -A "$3")" ] && exit 42; exit 43)SH").string()};
    submission sub = make_submission(dir);
    testcase tc = make_testcase(dir, "1", "ac");

    testcase_run run(prob, sub, tc, options);
    fs::create_directories(run.get_feedback_dir() / "stale");
    ofstream(run.get_feedback_dir() / "teammessage.txt") << "stale";

    execution_result result = run.run(stats, token);
    EXPECT_EQ(verdict::ACCEPTED, result.result);
}

TEST_F(RunTest, CollectFeedback) {
    problem prob = make_problem(dir);
    prob.validators[0].cmd.argv = {dir.write_script("feedback.sh", R"(cat > /dev/null
echo hello > "$3/teammessage.txt"
touch "$3/empty.txt"
mkdir "$3/subdir"
printf '\377\376' > "$3/binary.txt"
exit 42
)").string()};
    submission sub = make_submission(dir);
    testcase tc = make_testcase(dir, "1", "ac");

    testcase_run run(prob, sub, tc, options);
    execution_result result = run.run(stats, token);
    EXPECT_EQ(verdict::ACCEPTED, result.result);

    vector<feedback_artifact> artifacts = run.collect_feedback(stats);
    ASSERT_EQ(1u, artifacts.size());
    EXPECT_EQ("teammessage.txt", artifacts[0].name);
    EXPECT_EQ("hello\n", artifacts[0].content);
    EXPECT_EQ(1u, stats.warnings);
    EXPECT_EQ(1u, stats.errors);
    EXPECT_FALSE(fs::exists(run.get_feedback_dir() / "teammessage.txt"));
    EXPECT_FALSE(fs::exists(run.get_feedback_dir() / "empty.txt"));
}

TEST_F(RunTest, OversizedOutputRemoved) {
    problem prob = make_problem(dir);
    submission sub = make_submission(dir);
    testcase tc = make_testcase(dir, "1", "ac");

    size_t threshold = OUTPUT_CLEANUP_THRESHOLD;
    OUTPUT_CLEANUP_THRESHOLD = 1;

    testcase_run run(prob, sub, tc, options);
    execution_result result = run.run(stats, token);
    EXPECT_EQ(verdict::ACCEPTED, result.result);
    EXPECT_FALSE(fs::exists(run.get_output_path()));

    options.show_errors = true;
    result = run.run(stats, token);
    EXPECT_TRUE(fs::exists(run.get_output_path()));

    OUTPUT_CLEANUP_THRESHOLD = threshold;
}

TEST_F(RunTest, CancelledRunThrows) {
    problem prob = make_problem(dir);
    submission sub = make_submission(dir);
    testcase tc = make_testcase(dir, "1", "ac");

    token.cancel();
    EXPECT_THROW(judge(prob, sub, tc), judge_cancelled);
}

TEST_F(RunTest, InteractiveProblem) {
    problem prob = make_problem(dir);
    prob.interactive = true;
    prob.validators[0].cmd.argv = {dir.write_script("interactor.sh", R"(read mode < "$1"
echo "$mode"
read reply
[ "$reply" = ok ] && exit 42
exit 43
)").string()};
    submission sub = make_submission(dir);

    EXPECT_EQ(verdict::ACCEPTED, judge(prob, sub, make_testcase(dir, "1", "ac")).result);
    EXPECT_EQ(verdict::WRONG_ANSWER, judge(prob, sub, make_testcase(dir, "2", "wa")).result);
    EXPECT_EQ(0u, stats.errors);
}

TEST_F(RunTest, AcceptedOutputWithoutNewlineWarns) {
    problem prob = make_problem(dir);
    submission sub = make_submission(dir);
    sub.cmd.argv = {"/bin/sh", "-c", "printf ok"};

    EXPECT_EQ(verdict::ACCEPTED, judge(prob, sub, make_testcase(dir, "1", "ac")).result);
    EXPECT_EQ(1u, stats.warnings);
    EXPECT_EQ(0u, stats.errors);
}

TEST_F(RunTest, WrongAnswerOutputNotChecked) {
    problem prob = make_problem(dir);
    submission sub = make_submission(dir);
    sub.cmd.argv = {"/bin/sh", "-c", "printf wrong"};

    EXPECT_EQ(verdict::WRONG_ANSWER, judge(prob, sub, make_testcase(dir, "1", "ac")).result);
    EXPECT_EQ(0u, stats.warnings);
}

TEST(CheckOutputSanityTest, ReportsEachProblem) {
    EXPECT_TRUE(check_output_sanity("").empty());
    EXPECT_TRUE(check_output_sanity("1 2\r\n3\t4\n").empty());
    EXPECT_EQ(vector<string>{"does not end with a newline"}, check_output_sanity("42"));
    EXPECT_EQ(vector<string>{"contains non-printable characters"}, check_output_sanity(string("4\0002\n", 4)));
    EXPECT_EQ(2u, check_output_sanity("\x01\x02").size());
}
