#include "config.hpp"

namespace arbiter {
using namespace std;

filesystem::path SCRATCH_DIR = "/tmp/arbiter";
filesystem::path HISTORY_FILE;
bool DEBUG = false;
size_t MAX_COMPILE_ERROR_LENGTH = 4096;

}  // namespace arbiter
