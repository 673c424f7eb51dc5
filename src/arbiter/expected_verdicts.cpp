#include "arbiter/expected_verdicts.hpp"
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include <boost/assign.hpp>
#include <algorithm>
#include <cstring>
#include <map>
#include "common/io_utils.hpp"

namespace arbiter {
using namespace std;
namespace fs = std::filesystem;

const char *EXPECTED_RESULTS_KEY = "@EXPECTED_RESULTS@: ";

// DOMjudge 使用的评测结果名称，映射为空表示该名称不对应任何评测结果，直接忽略
// clang-format off
static const map<string, optional<verdict>> domjudge_verdicts = boost::assign::map_list_of
    ("CORRECT", optional<verdict>(verdict::ACCEPTED))
    ("WRONG-ANSWER", optional<verdict>(verdict::WRONG_ANSWER))
    ("TIMELIMIT", optional<verdict>(verdict::TIME_LIMIT_EXCEEDED))
    ("RUN-ERROR", optional<verdict>(verdict::RUN_TIME_ERROR))
    ("NO-OUTPUT", optional<verdict>(verdict::WRONG_ANSWER))
    ("CHECK-MANUALLY", optional<verdict>())
    ("COMPILER-ERROR", optional<verdict>());
// clang-format on

static const vector<verdict> ambiguous_verdicts = {
    verdict::WRONG_ANSWER,
    verdict::TIME_LIMIT_EXCEEDED,
    verdict::RUN_TIME_ERROR};

static bool contains(const vector<verdict> &verdicts, verdict v) {
    return find(verdicts.begin(), verdicts.end(), v) != verdicts.end();
}

optional<vector<verdict>> parse_expected_results(const string &text, judge_statistics &stats) {
    string upper = boost::to_upper_copy(text);
    size_t beginpos = upper.find(EXPECTED_RESULTS_KEY);
    if (beginpos == string::npos) return nullopt;
    beginpos += strlen(EXPECTED_RESULTS_KEY);
    size_t endpos = upper.find('\n', beginpos);
    string line = upper.substr(beginpos, endpos == string::npos ? string::npos : endpos - beginpos);

    vector<string> arguments;
    boost::split(arguments, line, boost::is_any_of(","));

    vector<verdict> result;
    for (auto &arg : arguments) {
        boost::trim(arg);
        if (domjudge_verdicts.count(arg)) {
            auto mapped = domjudge_verdicts.at(arg);
            if (mapped) result.push_back(*mapped);
            continue;
        }
        auto v = parse_verdict(arg);
        if (!v) {
            LOG(ERROR) << "@EXPECTED_RESULTS@: `" << arg << "` is not a valid verdict";
            ++stats.errors;
            continue;
        }
        result.push_back(*v);
    }
    return result;
}

optional<verdict> verdict_from_directory(const fs::path &path) {
    fs::path dir = path.parent_path();
    if (dir.parent_path().filename() != "submissions") return nullopt;
    return parse_verdict(boost::to_upper_copy(dir.filename().string()));
}

static optional<vector<verdict>> scan_annotation(const fs::path &path, judge_statistics &stats) {
    vector<fs::path> files;
    if (fs::is_regular_file(path)) {
        files.push_back(path);
    } else if (fs::is_directory(path)) {
        for (auto &entry : fs::recursive_directory_iterator(path))
            if (entry.is_regular_file()) files.push_back(entry.path());
        sort(files.begin(), files.end());
    }

    for (auto &file : files) {
        string text = read_file_content(file);
        // 跳过二进制文件
        if (!utf8_check_is_valid(text)) continue;
        auto result = parse_expected_results(text, stats);
        if (result) return result;
    }
    return nullopt;
}

vector<verdict> get_expected_verdicts(const fs::path &path, judge_statistics &stats) {
    auto annotated = scan_annotation(path, stats);
    vector<verdict> verdicts = annotated.value_or(vector<verdict>());

    if (auto dir_verdict = verdict_from_directory(path)) {
        if (annotated && !annotated->empty()) {
            LOG(WARNING) << "@EXPECTED_RESULTS@ in submission " << path << " is ignored";
            ++stats.warnings;
        }
        verdicts = {*dir_verdict};
    } else if (path.parent_path().parent_path().filename() == "submissions" && verdicts.empty()) {
        LOG(ERROR) << "Submission " << path << " must have @EXPECTED_RESULTS@. Defaulting to ACCEPTED";
        ++stats.errors;
    }

    if (verdicts.empty()) verdicts = {verdict::ACCEPTED};
    return verdicts;
}

void expand_ambiguous_verdicts(vector<verdict> &expected) {
    bool any = any_of(ambiguous_verdicts.begin(), ambiguous_verdicts.end(), [&](verdict v) {
        return contains(expected, v);
    });
    if (!any) return;
    for (verdict v : ambiguous_verdicts)
        if (!contains(expected, v)) expected.push_back(v);
}

bool submission_got_expected(const vector<verdict> &expected, verdict v, bool ambiguous) {
    if (contains(expected, v)) return true;
    if (ambiguous)
        return any_of(ambiguous_verdicts.begin(), ambiguous_verdicts.end(), [&](verdict w) {
            return contains(expected, w);
        });
    return false;
}

bool testcase_got_expected(const vector<verdict> &expected, verdict v, bool ambiguous) {
    return v == verdict::ACCEPTED || submission_got_expected(expected, v, ambiguous);
}

}  // namespace arbiter
