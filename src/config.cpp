#include "config.hpp"

namespace arbiter {
using namespace std;

double VALIDATOR_TIME_LIMIT = 10;                   // 10s
size_t OUTPUT_CLEANUP_THRESHOLD = 1'000'000'000;    // 1GB

filesystem::path RUN_DIR = "/tmp/arbiter";
bool DEBUG = false;

}  // namespace arbiter
