#include "common/utils.hpp"
#include <glog/logging.h>
#include <sys/wait.h>
#include <unistd.h>
#include <boost/algorithm/string/join.hpp>
#include <boost/archive/iterators/binary_from_base64.hpp>
#include <boost/archive/iterators/dataflow_exception.hpp>
#include <boost/archive/iterators/transform_width.hpp>
#include <algorithm>
#include <cctype>
#include <csignal>
#include <stdexcept>
#include <system_error>

namespace hjudge {
using namespace std;

int exec_program(const map<string, string> &env, const char **argv) {
    // 使用 POSIX 提供的函数来实现外部程序调用
    pid_t pid;
    switch (pid = fork()) {
        case -1:  // fork 失败
            throw system_error(errno, system_category(), "fork");
        case 0:  // 子进程
            // 避免子进程被终止，要求父进程处理中断信号
            signal(SIGINT, SIG_IGN);
            for (auto &[key, value] : env)
                setenv(key.c_str(), value.c_str(), 1);
            execvp(argv[0], (char **)argv);
            _exit(EXIT_FAILURE);
        default:  // 父进程
            int status;
            if (waitpid(pid, &status, 0) < 0)
                throw system_error(errno, system_category(), "waitpid");
            if (WIFEXITED(status))
                return WEXITSTATUS(status);
            else
                return -1;
    }
}

int call_process(const vector<string> &args, const map<string, string> &env) {
    vector<const char *> argv;
    for (auto &arg : args) argv.push_back(arg.c_str());
    argv.push_back(nullptr);

    DLOG(INFO) << boost::algorithm::join(args, " ");
    return exec_program(env, argv.data());
}

string base64_decode(const string &text) {
    using namespace boost::archive::iterators;
    using base64_iterator = transform_width<binary_from_base64<string::const_iterator>, 8, 6>;

    string input;
    input.reserve(text.size());
    for (char c : text)
        if (!isspace(static_cast<unsigned char>(c))) input.push_back(c);
    if (input.size() % 4 != 0)
        throw invalid_argument("base64 text length is not a multiple of 4");

    size_t padding = 0;
    while (padding < 2 && padding < input.size() && input[input.size() - 1 - padding] == '=') ++padding;
    replace(input.end() - padding, input.end(), '=', 'A');

    try {
        string output(base64_iterator(input.cbegin()), base64_iterator(input.cend()));
        output.erase(output.end() - padding, output.end());
        return output;
    } catch (dataflow_exception &ex) {
        throw invalid_argument(string("malformed base64 text: ") + ex.what());
    }
}

/**
 * @brief 计算从 pos 开始的 UTF-8 字符的长度
 * @return 若不是合法的 UTF-8 字符，返回 0
 */
static size_t utf8_sequence_length(const string &text, size_t pos) {
    unsigned char lead = static_cast<unsigned char>(text[pos]);
    if (lead < 0x80) return 1;

    size_t length;
    unsigned int code;
    if ((lead & 0xE0) == 0xC0) {
        length = 2;
        code = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        length = 3;
        code = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        length = 4;
        code = lead & 0x07;
    } else {
        return 0;
    }

    if (pos + length > text.size()) return 0;
    for (size_t i = 1; i < length; ++i) {
        unsigned char c = static_cast<unsigned char>(text[pos + i]);
        if ((c & 0xC0) != 0x80) return 0;
        code = (code << 6) | (c & 0x3F);
    }
    // 过长编码、代理区和超出 Unicode 范围的码点都不合法
    static const unsigned int min_code[] = {0, 0, 0x80, 0x800, 0x10000};
    if (code < min_code[length] || (code >= 0xD800 && code <= 0xDFFF) || code > 0x10FFFF) return 0;
    return length;
}

string sanitize_utf8(const string &text) {
    string result;
    result.reserve(text.size());
    for (size_t pos = 0; pos < text.size();) {
        size_t length = utf8_sequence_length(text, pos);
        if (length == 0) {
            result += "\xEF\xBF\xBD";
            ++pos;
        } else {
            result.append(text, pos, length);
            pos += length;
        }
    }
    return result;
}

static bool is_continuation_byte(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

string truncate_text(const string &text, size_t limit) {
    if (text.size() <= limit) return text;
    // 回退到字符的起始字节，不截断多字节字符
    size_t end = limit;
    while (end > 0 && limit - end < 3 && is_continuation_byte(text[end])) --end;
    if (is_continuation_byte(text[end])) end = limit;
    return text.substr(0, end) + "\n[Truncated]";
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

}  // namespace hjudge
