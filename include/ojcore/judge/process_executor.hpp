#pragma once

#include <filesystem>
#include <map>
#include <string>
#include "ojcore/judge/executor.hpp"
#include "ojcore/language/language_registry.hpp"

namespace ojcore {

/**
 * @brief 本地执行器，直接在评测机上以子进程的方式编译运行选手程序
 * 每次运行都在一个独占的临时文件夹中进行，运行结束后临时文件夹会被删除。
 * 只限制时钟时间和输出大小，没有内存隔离，因此只适合运行可信的代码，
 * 或者在通过 security_validator 的检查后运行。
 */
struct process_executor : public executor {
    /**
     * @param registry 语言注册表，必须比执行器活得更久
     * @param work_root 临时文件夹的父文件夹，为空时使用系统的临时文件夹
     */
    explicit process_executor(const language_registry &registry, std::filesystem::path work_root = {});

    std::string name() const override;

    bool available() const override;

    execution_outcome run(const std::string &source, const std::string &language, const std::string &input, const resource_limits &limits) const override;

    /**
     * @brief 检查每门语言的编译器、解释器是否能在 PATH 中找到
     * @return 键为规范标识符，值为该语言是否可用
     */
    std::map<std::string, bool> check_requirements() const;

private:
    /**
     * @brief 编译选手程序
     * @throw compilation_error 如果编译失败或者编译超时
     */
    void compile(const language_spec &language, const command_context &context, const resource_limits &limits) const;

    const language_registry &registry;
    std::filesystem::path work_root;
};

}  // namespace ojcore
