#include "arbiter/verdict.hpp"
#include <gtest/gtest.h>
#include <sstream>
#include "arbiter/execution_result.hpp"

using namespace std;
using namespace arbiter;

TEST(VerdictTest, PriorityOrder) {
    EXPECT_EQ(0, get_priority(verdict::ACCEPTED));
    EXPECT_EQ(99, get_priority(verdict::WRONG_ANSWER));
    EXPECT_EQ(99, get_priority(verdict::RUN_TIME_ERROR));
    EXPECT_EQ(100, get_priority(verdict::TIME_LIMIT_EXCEEDED));
    EXPECT_EQ(100, get_priority(verdict::VALIDATOR_CRASH));
    EXPECT_EQ(100, get_max_priority());
}

TEST(VerdictTest, MaxPriorityClass) {
    EXPECT_TRUE(is_max_priority(verdict::TIME_LIMIT_EXCEEDED));
    EXPECT_TRUE(is_max_priority(verdict::VALIDATOR_CRASH));
    EXPECT_FALSE(is_max_priority(verdict::ACCEPTED));
    EXPECT_FALSE(is_max_priority(verdict::WRONG_ANSWER));
    EXPECT_FALSE(is_max_priority(verdict::RUN_TIME_ERROR));
}

TEST(VerdictTest, NamesParseBack) {
    for (verdict v : all_verdicts()) {
        auto parsed = parse_verdict(get_verdict_name(v));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(v, *parsed);
    }
    EXPECT_FALSE(parse_verdict("wrong_answer").has_value());
    EXPECT_FALSE(parse_verdict("CORRECT").has_value());
}

TEST(VerdictTest, DisplayMessage) {
    EXPECT_STREQ("Wrong Answer", get_display_message(verdict::WRONG_ANSWER));
    EXPECT_STREQ("TIME_LIMIT_EXCEEDED", get_verdict_name(verdict::TIME_LIMIT_EXCEEDED));

    stringstream ss;
    ss << verdict::RUN_TIME_ERROR;
    EXPECT_EQ("RUN_TIME_ERROR", ss.str());
}

TEST(VerdictTest, PrintVerdictOverride) {
    execution_result result;
    EXPECT_EQ("OK", result.print_verdict());

    result.result = verdict::TIME_LIMIT_EXCEEDED;
    EXPECT_EQ("TIME_LIMIT_EXCEEDED", result.print_verdict());

    result.print_verdict_override = "TLE (aborted)";
    EXPECT_EQ("TLE (aborted)", result.print_verdict());
}

TEST(VerdictTest, ClassifyValidatorExitCode) {
    execution_result result;
    result.status = exec_status::NONZERO_EXIT;
    result.exit_code = 42;
    EXPECT_EQ(validator_status::ACCEPTED, classify_validator(result));

    result.exit_code = 43;
    EXPECT_EQ(validator_status::REJECTED, classify_validator(result));

    result.exit_code = 1;
    EXPECT_EQ(validator_status::CRASHED, classify_validator(result));

    result.status = exec_status::OK;
    result.exit_code = 0;
    EXPECT_EQ(validator_status::CRASHED, classify_validator(result));

    result.status = exec_status::CRASHED;
    result.exit_code = -9;
    EXPECT_EQ(validator_status::CRASHED, classify_validator(result));

    result.status = exec_status::TIMED_OUT;
    result.exit_code.reset();
    EXPECT_EQ(validator_status::CRASHED, classify_validator(result));
}
