#include "arbiter/problem.hpp"
#include <fmt/core.h>
#include <fstream>
#include "common/exceptions.hpp"
#include "common/json_utils.hpp"
#include "common/utils.hpp"

namespace arbiter {
using namespace std;
using namespace nlohmann;
namespace fs = std::filesystem;

const output_validator &problem::validator() const {
    if (validators.empty())
        throw configuration_error(fmt::format("no output validator found for problem {}", name));
    if (validators.size() > 1)
        throw configuration_error(fmt::format("problem {} has {} output validators, expected exactly one", name, validators.size()));
    return validators.front();
}

bool problem::default_precise_interactive_diagnosis() {
#ifdef __linux__
    return true;
#else
    return false;
#endif
}

double default_timeout(double time_limit) {
    return (int)(1.5 * time_limit + 1);
}

void from_json(const json &j, output_validator &value) {
    j.at("command").get_to(value.cmd.argv);
    if (value.cmd.argv.empty())
        throw configuration_error("validator command should not be empty");
    value.name = get_value_def(j, value.cmd.name(), "name");
    assign_optional(j, value.flags, "flags");
    if (exists(j, "cwd")) value.cmd.cwd = j.at("cwd").get<string>();
}

void from_json(const json &j, problem &value) {
    j.at("name").get_to(value.name);
    j.at("time_limit").get_to(value.time_limit);
    if (value.time_limit <= 0)
        throw configuration_error(fmt::format("time limit of problem {} should be positive, got {}", value.name, value.time_limit));

    value.timeout = get_value_def(j, default_timeout(value.time_limit), "timeout");
    if (value.timeout < value.time_limit)
        throw configuration_error(fmt::format("timeout {} of problem {} is less than time limit {}", value.timeout, value.name, value.time_limit));

    assign_optional(j, value.interactive, "interactive");
    assign_optional(j, value.precise_interactive_diagnosis, "precise_interactive_diagnosis");
    assign_optional(j, value.validators, "validators");
}

problem load_problem(const fs::path &path) {
    ifstream fin(path);
    if (!fin) throw configuration_error(fmt::format("unable to open problem configuration {}", path));

    problem result;
    try {
        from_json(json::parse(fin), result);
    } catch (json::exception &e) {
        throw configuration_error(fmt::format("malformed problem configuration {}: {}", path, e.what()));
    } catch (invalid_argument &e) {
        throw configuration_error(fmt::format("malformed problem configuration {}: {}", path, e.what()));
    }
    return result;
}

}  // namespace arbiter
