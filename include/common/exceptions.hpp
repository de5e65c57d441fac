#pragma once

#include <boost/lexical_cast.hpp>
#include <boost/stacktrace.hpp>
#include <boost/throw_exception.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <type_traits>

namespace hjudge {

/**
 * @brief 评测系统所有异常的基类
 * 构造时记录调用栈，可以通过 operator<< 追加错误信息：
 * @code{.cpp}
 *     BOOST_THROW_EXCEPTION(network_error() << "unable to post " << url);
 * @endcode
 */
struct judge_exception : std::exception {
    judge_exception();
    explicit judge_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const judge_exception &ex);

    void append(const std::string &text);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 追加错误信息，保持异常的实际类型不变
 */
template <typename E, typename T>
std::enable_if_t<std::is_base_of_v<judge_exception, E>, E> operator<<(E ex, const T &t) {
    ex.append(boost::lexical_cast<std::string>(t));
    return ex;
}

/**
 * @brief 表示评测系统的内部错误
 * 一般是评测数据或者语言配置本身有问题
 */
struct internal_error : public judge_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示网络错误，通常由 CURL 产生
 */
struct network_error : public judge_exception {
    network_error();
    explicit network_error(const std::string &message);
};

/**
 * @brief 评测网站返回了 code != 0 的响应
 * 这种错误不是暂时性的，不需要重试
 */
struct platform_error : public judge_exception {
    platform_error();
    explicit platform_error(const std::string &message);
};

/**
 * @brief 消息队列中的评测任务格式错误或者不受支持
 * 这种任务会被拒绝，而且不会发送评测结果
 */
struct protocol_error : public judge_exception {
    protocol_error();
    explicit protocol_error(const std::string &message);
};

/**
 * @brief 沙箱（容器）创建、执行、销毁失败
 * 用户程序的异常退出不属于此类错误
 */
struct sandbox_error : public judge_exception {
    sandbox_error();
    explicit sandbox_error(const std::string &message);
};

/**
 * @brief 表示 Special Judge 本身崩溃、超时或者输出了非法的分数
 */
struct checker_error : public judge_exception {
    checker_error();
    explicit checker_error(const std::string &message);
};

}  // namespace hjudge
