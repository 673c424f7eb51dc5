#include "arbiter/validator.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"

namespace arbiter {
using namespace std;
namespace fs = std::filesystem;

const char *JUDGE_MESSAGE_FILE = "judgemessage.txt";
const char *JUDGE_ERROR_FILE = "judgeerror.txt";

command output_validator::build_command(const testcase &tc, const fs::path &feedbackdir, const vector<string> &extra_flags) const {
    command result;
    result.cwd = cmd.cwd;
    fs::path ans_path = tc.ans_path ? *tc.ans_path : fs::path("/dev/null");
    to_string_list(result.argv, cmd.argv, tc.in_path, ans_path, feedbackdir, flags, extra_flags);
    return result;
}

execution_result output_validator::run(const testcase &tc, const fs::path &output_path, const fs::path &feedbackdir,
                                       const vector<string> &extra_flags, const cancellation_token &token) const {
    process_io io;
    io.stdin_file = output_path;

    command validator_cmd = build_command(tc, feedbackdir, extra_flags);
    DLOG(INFO) << "Running validator " << name << " on testcase " << tc.name;
    execution_result result = run_process(validator_cmd, io, VALIDATOR_TIME_LIMIT, token);
    if (result.timeout_expired)
        LOG(WARNING) << fmt::format("Validator {} exceeded {}s on testcase {}", name, VALIDATOR_TIME_LIMIT, tc.name);

    merge_judge_messages(result, feedbackdir);
    return result;
}

void merge_judge_messages(execution_result &result, const fs::path &feedbackdir) {
    fs::path judgemessage = feedbackdir / JUDGE_MESSAGE_FILE;
    fs::path judgeerror = feedbackdir / JUDGE_ERROR_FILE;

    string err = result.err.value_or("");
    if (fs::is_regular_file(judgemessage)) {
        err += read_file_content(judgemessage);
        fs::remove(judgemessage);
    }
    if (fs::is_regular_file(judgeerror)) {
        // judgeerror.txt 中的信息比比较器的 stderr 更准确
        err = read_file_content(judgeerror);
        fs::remove(judgeerror);
    }
    result.err = err;
}

}  // namespace arbiter
