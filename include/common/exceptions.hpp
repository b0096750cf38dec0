#pragma once

#include <boost/lexical_cast.hpp>
#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace arbiter {

struct arbiter_exception : std::exception {
    arbiter_exception();
    explicit arbiter_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const arbiter_exception &ex);

    template <typename T>
    arbiter_exception operator<<(const T &t) const {
        return arbiter_exception(message + boost::lexical_cast<std::string>(t));
    }

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示比赛配置错误
 * 语言、题目、测试数据的定义不合法，只会在加载配置时抛出，
 * 会导致该配置加载失败，但不影响正在运行的服务。
 */
struct configuration_error : public arbiter_exception {
    configuration_error();
    explicit configuration_error(const std::string &message);
};

/**
 * @brief 表示沙箱基础设施的不可恢复错误
 * 比如无法创建临时工作目录，或者要求严格隔离但内核不支持。
 * 子进程启动失败不属于此类，会作为 execution_report 返回。
 */
struct sandbox_error : public arbiter_exception {
    sandbox_error();
    explicit sandbox_error(const std::string &message);
};

/**
 * @brief 表示评测系统的内部错误
 */
struct internal_error : public arbiter_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

}  // namespace arbiter
