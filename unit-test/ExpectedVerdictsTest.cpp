#include "arbiter/expected_verdicts.hpp"
#include <gtest/gtest.h>
#include "test/environment.hpp"

using namespace std;
using namespace arbiter;
using namespace arbiter::test;

TEST(ExpectedVerdictsTest, ParseAnnotation) {
    judge_statistics stats;
    auto result = parse_expected_results("int main() {}\n// @expected_results@: Wrong_Answer, TIMELIMIT\n", stats);
    ASSERT_TRUE(result);
    EXPECT_EQ((vector<verdict>{verdict::WRONG_ANSWER, verdict::TIME_LIMIT_EXCEEDED}), *result);
    EXPECT_EQ(0u, stats.errors);
}

TEST(ExpectedVerdictsTest, DomjudgeNames) {
    judge_statistics stats;
    auto result = parse_expected_results("# @EXPECTED_RESULTS@: CORRECT, RUN-ERROR, NO-OUTPUT, CHECK-MANUALLY", stats);
    ASSERT_TRUE(result);
    EXPECT_EQ((vector<verdict>{verdict::ACCEPTED, verdict::RUN_TIME_ERROR, verdict::WRONG_ANSWER}), *result);
}

TEST(ExpectedVerdictsTest, InvalidVerdictIsError) {
    judge_statistics stats;
    auto result = parse_expected_results("@EXPECTED_RESULTS@: WRONG_ANSWER, MEMORY_LIMIT\n", stats);
    ASSERT_TRUE(result);
    EXPECT_EQ(vector<verdict>{verdict::WRONG_ANSWER}, *result);
    EXPECT_EQ(1u, stats.errors);
}

TEST(ExpectedVerdictsTest, NoAnnotation) {
    judge_statistics stats;
    EXPECT_FALSE(parse_expected_results("int main() {}\n", stats));
}

TEST(ExpectedVerdictsTest, DirectoryOverridesAnnotation) {
    scratch_directory dir;
    judge_statistics stats;
    auto path = dir.write_file("submissions/time_limit_exceeded/slow.cpp", "// @EXPECTED_RESULTS@: WRONG_ANSWER\n");

    EXPECT_EQ(vector<verdict>{verdict::TIME_LIMIT_EXCEEDED}, get_expected_verdicts(path, stats));
    EXPECT_EQ(1u, stats.warnings);
}

TEST(ExpectedVerdictsTest, AnnotationInDirectory) {
    scratch_directory dir;
    judge_statistics stats;
    dir.write_file("submissions/mixed/sol/main.py", "print(1)\n");
    dir.write_file("submissions/mixed/sol/util.py", "# @EXPECTED_RESULTS@: RUN_TIME_ERROR\n");

    EXPECT_EQ(vector<verdict>{verdict::RUN_TIME_ERROR}, get_expected_verdicts(dir.path() / "submissions/mixed/sol", stats));
}

TEST(ExpectedVerdictsTest, DefaultAccepted) {
    scratch_directory dir;
    judge_statistics stats;
    auto path = dir.write_file("main.cpp", "int main() {}\n");
    EXPECT_EQ(vector<verdict>{verdict::ACCEPTED}, get_expected_verdicts(path, stats));
    EXPECT_EQ(0u, stats.errors);

    // submissions/ 下无法识别的文件夹必须带有注释
    auto unknown = dir.write_file("submissions/mixed/main.cpp", "int main() {}\n");
    EXPECT_EQ(vector<verdict>{verdict::ACCEPTED}, get_expected_verdicts(unknown, stats));
    EXPECT_EQ(1u, stats.errors);
}

TEST(ExpectedVerdictsTest, ExpandAmbiguous) {
    vector<verdict> expected = {verdict::ACCEPTED};
    expand_ambiguous_verdicts(expected);
    EXPECT_EQ(vector<verdict>{verdict::ACCEPTED}, expected);

    expected = {verdict::TIME_LIMIT_EXCEEDED};
    expand_ambiguous_verdicts(expected);
    EXPECT_EQ((vector<verdict>{verdict::TIME_LIMIT_EXCEEDED, verdict::WRONG_ANSWER, verdict::RUN_TIME_ERROR}), expected);
}

TEST(ExpectedVerdictsTest, GotExpected) {
    vector<verdict> expected = {verdict::TIME_LIMIT_EXCEEDED};
    EXPECT_TRUE(testcase_got_expected(expected, verdict::ACCEPTED, false));
    EXPECT_TRUE(testcase_got_expected(expected, verdict::TIME_LIMIT_EXCEEDED, false));
    EXPECT_FALSE(testcase_got_expected(expected, verdict::WRONG_ANSWER, false));
    EXPECT_TRUE(testcase_got_expected(expected, verdict::WRONG_ANSWER, true));

    EXPECT_FALSE(submission_got_expected(expected, verdict::ACCEPTED, false));
    EXPECT_TRUE(submission_got_expected(expected, verdict::WRONG_ANSWER, true));
    EXPECT_FALSE(submission_got_expected({verdict::ACCEPTED}, verdict::WRONG_ANSWER, true));
}
