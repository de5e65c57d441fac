#include "judge/comparator.hpp"
#include <fmt/core.h>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <cmath>
#include <vector>
#include "common/exceptions.hpp"
#include "common/utils.hpp"

namespace hjudge {
using namespace std;

// Special Judge 的 message 文件最多读取的字节数
static constexpr size_t MESSAGE_LIMIT = 4096;

comparator::~comparator() = default;

static vector<string> split_lines(const string &text) {
    vector<string> lines;
    boost::algorithm::split(lines, text, boost::is_any_of("\n"));
    for (auto &line : lines) boost::algorithm::trim_right(line);
    while (!lines.empty() && lines.back().empty()) lines.pop_back();
    return lines;
}

compare_result simple_line_comparator::compare(const string &user_out, const string &answer, const string &, int64_t full_score) {
    vector<string> user_lines = split_lines(user_out), answer_lines = split_lines(answer);
    if (user_lines.size() != answer_lines.size())
        return {false, 0, fmt::format("Expected {} lines, received {} lines", answer_lines.size(), user_lines.size())};

    for (size_t i = 0; i < user_lines.size(); ++i)
        if (user_lines[i] != answer_lines[i])
            return {false, 0, fmt::format("Different at line {}.", i + 1)};

    return {true, full_score, "OK!"};
}

special_judge_comparator::special_judge_comparator(sandbox::sandbox_runner &runner, sandbox::sandbox &box, const language_config &lang, const sandbox::execution_limits &limits)
    : runner(runner), box(box), lang(lang), limits(limits) {}

void special_judge_comparator::compile(const filesystem::path &source) {
    string source_name = lang.source_name(PROGRAM_FILENAME);
    string output_name = lang.output_name(PROGRAM_FILENAME);
    box.copy_file(source, source_name, true);

    sandbox::execution_limits compile_limits;
    compile_limits.cpu_time = 10;
    compile_limits.wall_time = 20;
    compile_limits.memory = 1LL << 30;
    compile_limits.capture = 4096;
    auto result = runner.run(box, lang.compile_command(PROGRAM_FILENAME, ""), compile_limits);
    if (result.cause == sandbox::termination_cause::SANDBOX_INTERNAL_ERROR)
        BOOST_THROW_EXCEPTION(sandbox_error() << "unable to compile special judge: " << result.error);
    if (result.cause != sandbox::termination_cause::NORMAL_EXIT || !box.exists(output_name))
        BOOST_THROW_EXCEPTION(checker_error() << "Failed to compile special judge program (" << sandbox::get_display_message(result.cause)
                                              << ", exit code = " << result.exit_code << "):\n"
                                              << result.stdout_text << result.stderr_text);
    box.keep(output_name);
}

compare_result special_judge_comparator::compare(const string &user_out, const string &answer, const string &input, int64_t full_score) {
    box.reset();
    box.put_file("input", input);
    box.put_file("user_out", user_out);
    box.put_file("answer", answer);

    auto result = runner.run(box, lang.run_command(lang.output_name(PROGRAM_FILENAME), ""), limits);
    if (result.cause == sandbox::termination_cause::SANDBOX_INTERNAL_ERROR)
        BOOST_THROW_EXCEPTION(sandbox_error() << "unable to run special judge: " << result.error);

    string usage = fmt::format("{} MB, {} ms", result.memory / 1024 / 1024, static_cast<int64_t>(result.time * 1000));
    if (result.cause != sandbox::termination_cause::NORMAL_EXIT)
        BOOST_THROW_EXCEPTION(checker_error() << "Special judge exited: " << sandbox::get_display_message(result.cause)
                                              << ", exit code " << result.exit_code << " (" << usage << ")");

    if (!box.exists("score"))
        BOOST_THROW_EXCEPTION(checker_error("Special judge exited with no score file"));

    string score_text = boost::algorithm::trim_copy(box.read_file("score"));
    int64_t score;
    try {
        score = boost::lexical_cast<int64_t>(score_text);
    } catch (boost::bad_lexical_cast &) {
        BOOST_THROW_EXCEPTION(checker_error() << "Special judge gives malformed score: " << truncate_text(score_text, 32));
    }
    if (score < 0 || score > 100)
        BOOST_THROW_EXCEPTION(checker_error() << "Special judge gives invalid score: " << score);

    compare_result ret;
    ret.accepted = score == 100;
    ret.score = static_cast<int64_t>(floor(score / 100.0 * full_score));
    if (box.exists("message"))
        ret.message = sanitize_utf8(truncate_text(box.read_file("message", MESSAGE_LIMIT + 4), MESSAGE_LIMIT));
    return ret;
}

string special_judge_language(const string &spj_filename) {
    string name = filesystem::path(spj_filename).stem().string();
    if (!boost::algorithm::starts_with(name, "spj_") || name.size() <= 4)
        BOOST_THROW_EXCEPTION(internal_error() << "Malformed special judge file name: " << spj_filename);
    return name.substr(4);
}

}  // namespace hjudge
