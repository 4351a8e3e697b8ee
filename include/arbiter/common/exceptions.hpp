#pragma once

#include <boost/stacktrace.hpp>
#include <memory>
#include <ostream>
#include <string>
#include <stdexcept>

namespace arbiter {

struct judge_exception : std::exception {
    judge_exception();
    explicit judge_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const judge_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示评测系统的内部错误
 * 不属于任何一个测试点的错误，比如工作区读写失败
 */
struct internal_error : public judge_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示无法启动子进程
 * 比如可执行文件不存在、没有执行权限、工作路径不存在。
 * 这类错误是整个评测的系统错误，而不是某个测试点的评测结果
 */
struct process_error : public judge_exception {
    process_error();
    explicit process_error(const std::string &message);
};

/**
 * @brief 表示无法创建或写入评测工作区
 */
struct workspace_error : public judge_exception {
    workspace_error();
    explicit workspace_error(const std::string &message);
};

/**
 * @brief 表示配置文件错误，比如语言配置文件格式不正确或者找不到对应的语言
 */
struct config_error : public judge_exception {
    config_error();
    explicit config_error(const std::string &message);
};

}  // namespace arbiter
