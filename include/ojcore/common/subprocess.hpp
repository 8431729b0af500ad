#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

/**
 * 这个头文件包含调用外部程序的函数
 * 执行器通过 run_process 编译、运行选手程序，Docker 客户端通过 run_process 调用 docker 命令行。
 */
namespace ojcore {

struct process_options {
    /**
     * @brief 外部命令的路径 (command[0]) 和参数
     * command[0] 不包含 '/' 时会在 PATH 中查找
     */
    std::vector<std::string> command;

    /**
     * @brief 子进程的工作路径，为空时继承当前进程的工作路径
     */
    std::filesystem::path work_dir;

    /**
     * @brief 喂给子进程 stdin 的数据，写完后关闭 stdin
     */
    std::string input;

    /**
     * @brief 时钟时间限制，单位为秒，为空表示不限制
     * 超时后整个进程组会被 SIGKILL 杀死
     */
    std::optional<double> wall_limit;

    /**
     * @brief stdout 和 stderr 各自最多保存多少字节，小于 0 表示不限制
     * 超出的数据仍然会被读出（避免子进程因为管道写满而阻塞），但会被丢弃
     */
    int64_t stream_size = -1;

    /**
     * @brief 子进程最多能写入多大的文件（RLIMIT_FSIZE），单位为字节，小于 0 表示不限制
     */
    int64_t file_limit = -1;

    bool no_core_dumps = true;
};

struct process_result {
    /**
     * @brief 子进程的返回值，如果子进程因为信号终止则为 -1
     */
    int exitcode = -1;

    /**
     * @brief 终止子进程的信号，正常退出时为 -1
     */
    int signal = -1;

    /**
     * @brief 是否因为超出时钟时间限制而被杀死
     */
    bool timed_out = false;

    std::string stdout_text;

    std::string stderr_text;

    /**
     * @brief stdout 或 stderr 是否因为超出 stream_size 而被截断
     */
    bool output_truncated = false;

    /**
     * @brief 时钟时间，单位为秒
     */
    double wall_time = 0;

    /**
     * @brief 子进程是否正常退出且返回值为 0
     */
    bool success() const;
};

/**
 * @brief 运行外部程序并等待其结束
 * 1. 通过管道连接子进程的 stdin/stdout/stderr
 * 2. 子进程被放入独立的进程组，以便通过 kill(-pgid) 杀死选手程序 fork 出来的所有进程
 * 3. 超出 wall_limit 时杀死整个进程组
 * 4. 子进程结束后同样会杀死整个进程组，确保不会有进程残留在系统中
 * @note 与 system(cmd) 的区别是，这个函数避免了转义导致的安全问题
 * @throw std::system_error 如果无法创建管道、fork 失败，或者程序无法启动（比如程序不存在）
 */
process_result run_process(const process_options &opt);

}  // namespace ojcore
