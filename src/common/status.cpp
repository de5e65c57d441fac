#include "common/status.hpp"
#include <boost/assign.hpp>
#include <unordered_map>

namespace hjudge {
using namespace std;

// clang-format off
static const unordered_map<status, const char *> status_string = boost::assign::map_list_of
    (status::WAITING, "Waiting")
    (status::JUDGING, "Judging")
    (status::SKIPPED, "Skipped")
    (status::ACCEPTED, "Accepted")
    (status::WRONG_ANSWER, "Wrong Answer")
    (status::TIME_LIMIT_EXCEEDED, "Time Limit Exceeded")
    (status::MEMORY_LIMIT_EXCEEDED, "Memory Limit Exceeded")
    (status::RUNTIME_ERROR, "Runtime Error")
    (status::OUTPUT_LIMIT_EXCEEDED, "Output Limit Exceeded")
    (status::COMPILE_ERROR, "Compile Error")
    (status::SYSTEM_ERROR, "System Error");

static const unordered_map<status, int> status_severity = boost::assign::map_list_of
    (status::WAITING, 0)
    (status::JUDGING, 0)
    (status::SKIPPED, 0)
    (status::ACCEPTED, 1)
    (status::WRONG_ANSWER, 2)
    (status::OUTPUT_LIMIT_EXCEEDED, 3)
    (status::MEMORY_LIMIT_EXCEEDED, 4)
    (status::TIME_LIMIT_EXCEEDED, 5)
    (status::RUNTIME_ERROR, 6)
    (status::COMPILE_ERROR, 7)
    (status::SYSTEM_ERROR, 8);
// clang-format on

const char *get_display_message(status stat) {
    return status_string.at(stat);
}

int severity(status stat) {
    return status_severity.at(stat);
}

bool is_final(status stat) {
    return stat != status::WAITING && stat != status::JUDGING && stat != status::SKIPPED;
}

}  // namespace hjudge
