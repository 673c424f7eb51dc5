#include "arbiter/report.hpp"
#include "common/io_utils.hpp"

namespace arbiter {
using namespace std;

string format_report_data(const execution_result &result, const vector<feedback_artifact> &artifacts, bool interactive) {
    string out = result.out.value_or("");
    string err = result.err.value_or("");

    string data;
    if (!out.empty() && !err.empty()) {
        const char *output_type = interactive ? "PROGRAM STDERR" : "STDOUT";
        data = "STDERR:" + format_data(err) + "\n" + output_type + ":" + format_data(out) + "\n";
    } else if (!out.empty()) {
        data = crop_output(out);
    } else if (!err.empty()) {
        data = crop_output(err);
    }

    for (auto &artifact : artifacts) {
        if (!data.empty() && data.back() != '\n') data += '\n';
        data += artifact.name + ":" + format_data(artifact.content) + "\n";
    }
    return data;
}

}  // namespace arbiter
