#pragma once

#include <atomic>
#include "sandbox/limits.hpp"
#include "sandbox/restrictions.hpp"

namespace arbiter::sandbox {

/**
 * @brief 取消信号
 * 流水线被关闭时设置，正在运行的受限执行会在下一次轮询时杀死子进程。
 */
struct cancellation_token {
    void cancel();
    bool is_cancelled() const;

private:
    std::atomic<bool> cancelled{false};
};

/**
 * @brief 受限执行的抽象接口
 * 进程隔离的实现与平台相关，评测逻辑只依赖这个接口。
 */
struct sandbox {
    virtual ~sandbox();

    /**
     * @brief 在资源限制下执行一条命令，返回时子进程及其所有后代进程都已经被杀死并回收
     * @param request 命令、工作目录、标准输入和资源限制
     * @param cancel 取消信号，可以为空
     * @return 执行结果，启动失败也通过结果返回
     * @throw sandbox_error 严格模式下要求的隔离手段不可用时
     * @throw std::system_error 创建管道等系统调用失败时
     */
    virtual execution_report run(const execution_request &request, const cancellation_token *cancel = nullptr) = 0;

    /**
     * @brief 当前沙箱实际能提供的隔离手段
     */
    virtual const isolation_support &support() const = 0;
};

}  // namespace arbiter::sandbox
