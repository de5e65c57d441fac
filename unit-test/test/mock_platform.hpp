#pragma once

#include <mutex>
#include <vector>
#include "gmock/gmock.h"
#include "server/platform.hpp"

namespace hjudge::test {

struct mock_platform : public server::platform {
    MOCK_METHOD(language_config, get_language_config, (const std::string &lang_id), (override));
    MOCK_METHOD(problem_info, get_problem_info, (std::int64_t problem_id), (override));
    MOCK_METHOD(void, sync_problem_files, (std::int64_t problem_id, const std::filesystem::path &dir), (override));
    MOCK_METHOD(void, send_progress, (const task &t, const submission_report &report, const std::string &message), (override));
    MOCK_METHOD(bool, send_result, (const task &t, const submission_report &report), (override));
};

/**
 * @brief 记录所有进度消息和评测结果的评测网站
 * 使用时包装为 ::testing::NiceMock<recording_platform>
 */
struct recording_platform : public mock_platform {
    recording_platform() {
        using ::testing::_;
        ON_CALL(*this, send_progress(_, _, _)).WillByDefault(::testing::Invoke([this](const task &, const submission_report &, const std::string &message) {
            std::scoped_lock<std::mutex> lock(mut);
            progress.push_back(message);
        }));
        ON_CALL(*this, send_result(_, _)).WillByDefault(::testing::Invoke([this](const task &, const submission_report &report) {
            std::scoped_lock<std::mutex> lock(mut);
            results.push_back(report);
            return true;
        }));
    }

    std::vector<std::string> progress_messages() {
        std::scoped_lock<std::mutex> lock(mut);
        return progress;
    }

    std::vector<submission_report> delivered() {
        std::scoped_lock<std::mutex> lock(mut);
        return results;
    }

private:
    std::mutex mut;
    std::vector<std::string> progress;
    std::vector<submission_report> results;
};

}  // namespace hjudge::test
