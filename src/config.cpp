#include "config.hpp"

namespace grader {
using namespace std;

filesystem::path ISOLATE_PATH = "isolate";
int BOX_ID = 0;
bool USE_CGROUPS = true;
string SANDBOX_PATH_ENV = "/usr/bin/:/bin";
int SANDBOX_PROCESS_LIMIT = 100;
filesystem::path COMPILER_PATH = "/usr/bin/gcc";
size_t COMPILER_STDERR_LIMIT = 10 * 1024;  // 10K
bool DEBUG = false;

}  // namespace grader
