#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ojcore {

/**
 * @brief 创建沙箱容器的参数
 */
struct container_options {
    std::string image;

    /**
     * @brief 容器的主进程，只是为了让容器保持运行，比如 sleep 300
     */
    std::vector<std::string> command;

    /**
     * @brief 容器内运行进程的用户
     */
    std::string user;

    /**
     * @brief 容器内的工作路径，会挂载为可执行的 tmpfs
     */
    std::string work_dir;

    std::string work_dir_size;

    /**
     * @brief /tmp 的大小，/tmp 挂载为不可执行的 tmpfs
     */
    std::string tmp_size;

    /**
     * @brief 内存限制，单位为字节，swap 限制与之相同以禁止使用 swap
     */
    int64_t memory_limit = 0;

    int64_t cpu_period = 100000;
    int64_t cpu_quota = 50000;

    int pids_limit = 50;
    int nproc_limit = 64;
    int nofile_limit = 64;

    /**
     * @brief 单个文件的最大大小，单位为字节
     */
    int64_t file_size_limit = 0;
};

struct exec_result {
    int exit_code = -1;
    std::string stdout_text;
    std::string stderr_text;
    bool timed_out = false;
};

/**
 * @brief 容器运行时，管理沙箱容器的生命周期
 * 实现必须是线程安全的，整个进程共享同一个容器运行时。
 * 除 ping、image_exists 外，所有操作失败时都抛出 infrastructure_error。
 */
struct container_runtime {
    virtual ~container_runtime();

    /**
     * @brief 容器运行时是否可以连接
     */
    virtual bool ping() = 0;

    virtual bool image_exists(const std::string &image) = 0;

    /**
     * @brief 从构建上下文文件夹构建镜像
     */
    virtual void build_image(const std::string &image, const std::filesystem::path &context_dir) = 0;

    /**
     * @brief 创建容器，但不启动
     * @return 容器 id
     */
    virtual std::string create_container(const container_options &options) = 0;

    virtual void start_container(const std::string &id) = 0;

    /**
     * @brief 向容器中写入文件
     * @param path 容器内的绝对路径，所在的文件夹必须可写
     */
    virtual void write_file(const std::string &id, const std::string &path, const std::string &content) = 0;

    /**
     * @brief 在容器中执行命令并等待其结束
     * @param timeout 等待时间，单位为秒，为空表示一直等待；超时后 docker 客户端进程会被杀死
     * @param output_limit stdout 和 stderr 各自最多保存多少字节，小于 0 表示不限制
     */
    virtual exec_result exec(const std::string &id, const std::vector<std::string> &command, const std::string &input, std::optional<double> timeout, int64_t output_limit) = 0;

    /**
     * @brief 强制停止并删除容器，容器内正在执行的命令也会结束
     */
    virtual void remove_container(const std::string &id) = 0;
};

/**
 * @brief 生成 docker create 命令的参数（不包含 docker 本身）
 * 容器没有网络，根文件系统只读，以非特权用户运行，禁止提权，
 * 并限制内存、CPU、进程数、文件描述符数和文件大小。
 */
std::vector<std::string> docker_create_arguments(const container_options &options);

/**
 * @brief 通过 docker 命令行实现的容器运行时
 * 对象本身不保存可变状态，因此可以被多个评测线程同时使用。
 */
struct docker_runtime : public container_runtime {
    explicit docker_runtime(std::string docker_binary = "docker");

    /**
     * @brief 进程内共享的容器运行时，第一次调用时决定 docker 命令行的路径
     */
    static std::shared_ptr<docker_runtime> instance(const std::string &docker_binary = "docker");

    bool ping() override;
    bool image_exists(const std::string &image) override;
    void build_image(const std::string &image, const std::filesystem::path &context_dir) override;
    std::string create_container(const container_options &options) override;
    void start_container(const std::string &id) override;
    void write_file(const std::string &id, const std::string &path, const std::string &content) override;
    exec_result exec(const std::string &id, const std::vector<std::string> &command, const std::string &input, std::optional<double> timeout, int64_t output_limit) override;
    void remove_container(const std::string &id) override;

private:
    std::vector<std::string> docker(std::vector<std::string> args) const;

    std::string docker_binary;
};

}  // namespace ojcore
