#pragma once

namespace arbiter {

/**
 * @brief 表示单个测试点的评测结果
 * 判定顺序固定为 TIMEOUT > RESOURCE_EXCEEDED > RUNTIME_ERROR > PASS/FAIL，
 * 参见 classify。
 */
enum class test_result_kind {
    /**
     * @brief 输出与标准答案一致
     */
    PASS = 0,

    /**
     * @brief 程序正常退出，但输出与标准答案不一致
     */
    FAIL = 1,

    /**
     * @brief 程序运行时间超出限制
     * 包括墙上时钟超时和 CPU 时间超时（SIGXCPU）。
     */
    TIMEOUT = 2,

    /**
     * @brief 程序以非零返回值退出，或者因为信号崩溃
     */
    RUNTIME_ERROR = 3,

    /**
     * @brief 程序内存使用或输出大小超出限制
     */
    RESOURCE_EXCEEDED = 4
};

/**
 * @brief 表示一个提交在流水线中的状态
 *
 * QUEUED -> COMPILING -> COMPILE_FAILED
 *                     -> RUNNING -> COMPLETED
 * 任意非终止状态都可能转入 CANCELLED（服务器关闭）或 FAILED（沙箱基础设施错误）。
 * REJECTED 表示提交在准入检查时被拒绝，不会进入流水线。
 */
enum class submission_state {
    QUEUED = 0,
    COMPILING = 1,
    COMPILE_FAILED = 2,
    RUNNING = 3,
    COMPLETED = 4,
    CANCELLED = 5,
    FAILED = 6,
    REJECTED = 7
};

/**
 * @brief 提交被准入控制拒绝的原因
 */
enum class rejection_reason {
    NONE = 0,

    /**
     * @brief 选手在该题目上已经有一个正在评测的提交
     */
    ALREADY_IN_FLIGHT = 1,

    /**
     * @brief 提交 id 与正在评测的提交重复
     */
    DUPLICATE_ID = 2,

    /**
     * @brief 选手在该题目上的提交次数已经用完
     */
    ATTEMPTS_EXHAUSTED = 3,

    UNKNOWN_LANGUAGE = 4,

    UNKNOWN_PROBLEM = 5,

    /**
     * @brief 该题目不允许使用此语言
     */
    LANGUAGE_NOT_ALLOWED = 6,

    /**
     * @brief 流水线正在关闭，不再接受新的提交
     */
    SHUTTING_DOWN = 7
};

/**
 * @brief 资源限制器观察到的超限类型
 * 多个限制同时可能成立时，按照监控循环中先观察到的类型记录：
 * 时间限制总是先于内存限制被判定。
 */
enum class limit_violation {
    NONE = 0,
    WALL_TIME = 1,
    CPU_TIME = 2,
    MEMORY = 3,
    OUTPUT = 4
};

/**
 * @brief 排行榜上一支队伍在一道题目上的状态
 * 由最近一次计入提交次数的提交决定，没有这样的提交但是做过测试运行时为 IN_PROGRESS。
 */
enum class problem_state {
    NOT_ATTEMPTED = 0,
    IN_PROGRESS = 1,
    PASS = 2,
    FAIL = 3
};

const char *get_display_message(test_result_kind kind);

const char *get_display_message(submission_state state);

const char *get_display_message(rejection_reason reason);

const char *get_display_message(limit_violation violation);

const char *get_display_message(problem_state state);

/**
 * @brief 是否为终止状态
 */
bool is_terminal(submission_state state);

}  // namespace arbiter
