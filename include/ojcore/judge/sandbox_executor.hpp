#pragma once

#include <map>
#include <memory>
#include <string>
#include "ojcore/config.hpp"
#include "ojcore/judge/container_runtime.hpp"
#include "ojcore/judge/executor.hpp"
#include "ojcore/language/language_registry.hpp"

namespace ojcore {

/**
 * @brief 沙箱的状态
 */
struct sandbox_status {
    /**
     * @brief 容器运行时是否可以连接
     */
    bool runtime_available = false;

    /**
     * @brief 每个镜像是否存在
     */
    std::map<std::string, bool> images;
};

/**
 * @brief 沙箱执行器，在一次性的 Docker 容器中编译运行选手程序
 *
 * 每次运行的流程：
 * 1. 从语言对应的镜像创建容器并启动
 * 2. 将源代码写入容器的工作路径
 * 3. 如果语言需要编译，在容器内编译，编译失败则直接返回编译错误
 * 4. 在后台线程中运行选手程序，评测线程最多等待时间限制那么久，
 *    超时后直接返回超时结果，不再等待后台线程
 * 5. 无论如何退出，容器都会被强制删除，容器内仍在运行的进程也随之结束
 */
struct sandbox_executor : public executor {
    /**
     * @param registry 语言注册表，必须比执行器活得更久
     * @param config 沙箱配置
     * @param runtime 容器运行时，一般是 docker_runtime::instance()
     */
    sandbox_executor(const language_registry &registry, const sandbox_config &config, std::shared_ptr<container_runtime> runtime);

    std::string name() const override;

    bool available() const override;

    execution_outcome run(const std::string &source, const std::string &language, const std::string &input, const resource_limits &limits) const override;

    /**
     * @brief 检查注册表中所有语言的镜像是否存在，不存在则从构建上下文构建
     * 构建上下文不存在时，如果 require_images 为 true 则抛出异常，否则打印警告并跳过这门语言
     * @throw configuration_error 如果 require_images 为 true 且构建上下文不存在
     * @throw infrastructure_error 如果 require_images 为 true 且镜像构建失败
     */
    void provision_images() const;

    sandbox_status check_status() const;

private:
    container_options make_container_options(const language_spec &language, const resource_limits &limits) const;

    const language_registry &registry;
    sandbox_config config;
    std::shared_ptr<container_runtime> runtime;
};

}  // namespace ojcore
