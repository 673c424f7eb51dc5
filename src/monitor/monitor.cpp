#include "monitor/monitor.hpp"

namespace arbiter {

monitor::~monitor() {}

void monitor::start_submission(const submission &, std::size_t) {}

void monitor::start_testcase(const submission &, const testcase &) {}

void monitor::end_testcase(const submission &, const testcase_report &) {}

void monitor::end_submission(const submission &, const submission_run_outcome &) {}

}  // namespace arbiter
