#pragma once

#include <fmt/format.h>
#include <chrono>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace fmt {
template <>
struct formatter<std::filesystem::path> : formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const std::filesystem::path &p, FormatContext &ctx) const {
        return formatter<std::string_view>::format(p.string(), ctx);
    }
};
}  // namespace fmt

namespace hjudge {

/**
 * @brief 执行外部命令
 * @param env 额外的环境变量
 * @param argv 外部命令的路径 (argv[0]) 和 参数 (argv)，以 nullptr 结尾
 * @return 外部命令的返回值，如果外部命令因为信号崩溃而没有返回码，则返回 -1
 */
int exec_program(const std::map<std::string, std::string> &env, const char **argv);

/**
 * @brief 调用外部程序
 * @note 与 system(cmd) 的区别是，这个函数避免了转义导致的安全问题
 * @code{.cpp}
 *     // 相当于 system("unzip -j -o -q answer.zip -d answers");
 *     int exitcode = call_process({"unzip", "-j", "-o", "-q", "answer.zip", "-d", "answers"});
 * @endcode
 */
int call_process(const std::vector<std::string> &args, const std::map<std::string, std::string> &env = {});

/**
 * @brief 解码 base64 字符串，忽略其中的空白字符
 * @throw std::invalid_argument 若包含非法字符
 */
std::string base64_decode(const std::string &text);

/**
 * @brief 截断字符串，超出部分用提示替代
 * 截断位置落在 UTF-8 多字节字符中间时向前移动到字符的起始位置。
 */
std::string truncate_text(const std::string &text, std::size_t limit);

/**
 * @brief 将不合法的 UTF-8 字节替换为 U+FFFD
 * 用户程序和 Special Judge 的输出可能不是 UTF-8，发送给评测网站之前需要处理。
 */
std::string sanitize_utf8(const std::string &text);

struct elapsed_time {
    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

private:
    std::chrono::steady_clock::time_point start;
};

}  // namespace hjudge
