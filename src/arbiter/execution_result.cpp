#include "arbiter/execution_result.hpp"
#include "config.hpp"

namespace arbiter {
using namespace std;

const char *get_display_message(exec_status status) {
    switch (status) {
        case exec_status::OK:
            return "OK";
        case exec_status::NONZERO_EXIT:
            return "Nonzero Exit";
        case exec_status::TIMED_OUT:
            return "Timed Out";
        case exec_status::CRASHED:
            return "Crashed";
    }
    return "Unknown";
}

bool execution_result::ok() const {
    return status == exec_status::OK;
}

string execution_result::print_verdict() const {
    if (!print_verdict_override.empty()) return print_verdict_override;
    if (result) return get_verdict_name(*result);
    return get_display_message(status);
}

validator_status classify_validator(const execution_result &result) {
    if (result.status == exec_status::NONZERO_EXIT && result.exit_code) {
        if (*result.exit_code == E_ACCEPTED) return validator_status::ACCEPTED;
        if (*result.exit_code == E_WRONG_ANSWER) return validator_status::REJECTED;
    }
    return validator_status::CRASHED;
}

}  // namespace arbiter
