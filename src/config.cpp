#include "config.hpp"

namespace arena {
using namespace std;

int DEFAULT_TIME_LIMIT_MS = 5000;        // 5s
int DEFAULT_MEMORY_LIMIT_MB = 256;       // 256M
int COMPILE_TIME_LIMIT_MS = 10000;       // 10s
long long MAX_GRADING_TIME_MS = 120000;  // 2min
size_t MAX_OUTPUT_BYTES = 64 << 20;      // 64M
int STORE_MAX_RETRIES = 8;

filesystem::path RUN_DIR = filesystem::temp_directory_path() / "arena-judge";
bool DEBUG = false;

}  // namespace arena
