#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "ojcore/language/language_registry.hpp"

/**
 * 这个头文件包含评测系统的配置
 * 配置可以来自 JSON 配置文件，也可以被环境变量覆盖：
 * JUDGE_DEFAULT_TIME_LIMIT    默认时间限制，单位为秒
 * JUDGE_DEFAULT_MEMORY_LIMIT  默认内存限制，比如 128m
 * JUDGE_COMPILE_TIMEOUT       默认编译时间限制，单位为秒
 * JUDGE_SUPPORTED_LANGUAGES   逗号分隔的支持语言列表
 * JUDGE_REQUIRE_SANDBOX       是否必须使用沙箱执行器
 */
namespace ojcore {

/**
 * @brief 某一门语言的资源限制，没有设置的项使用全局默认值
 */
struct language_limits {
    /**
     * @brief 运行时间限制，单位为秒
     */
    std::optional<int> time_limit;

    /**
     * @brief 内存限制，格式同 parse_memory_limit，比如 256m
     */
    std::optional<std::string> memory_limit;

    /**
     * @brief 编译时间限制，单位为秒
     */
    std::optional<int> compile_timeout;
};

void from_json(const nlohmann::json &j, language_limits &limits);

/**
 * @brief 源代码安全检查的配置
 */
struct security_config {
    /**
     * @brief 禁止导入的模块，只对 scan_imports 的语言生效
     * 源代码中出现 "import X" 或 "from X" 时拒绝提交
     */
    std::vector<std::string> blocked_imports;

    /**
     * @brief 禁止出现的代码片段，大小写不敏感，对所有语言生效
     */
    std::vector<std::string> blocked_patterns;

    /**
     * @brief 额外进行 import 检查的语言，语言本身标记了 scan_imports 时总会检查
     */
    std::vector<std::string> import_scan_languages;
};

void from_json(const nlohmann::json &j, security_config &security);

/**
 * @brief Docker 沙箱的配置
 */
struct sandbox_config {
    /**
     * @brief docker 命令行的路径
     */
    std::string docker_binary = "docker";

    /**
     * @brief 沙箱镜像构建上下文的根目录，每门语言一个子文件夹
     *
     * image_context_dir
     * ├── python // Dockerfile
     * ├── cpp // C 和 C++ 共用
     * ├── java
     * └── javascript
     */
    std::filesystem::path image_context_dir = "docker";

    /**
     * @brief 构建上下文不存在时是否视为配置错误
     * 为 false 时只打印警告，这门语言的评测会在运行时失败
     */
    bool require_images = false;

    /**
     * @brief 容器内运行选手程序的用户，必须是非特权用户
     */
    std::string user = "sandbox";

    /**
     * @brief 容器内的工作路径，是一个可写可执行的 tmpfs
     */
    std::string work_dir = "/sandbox";

    std::string work_dir_size = "64m";

    std::string tmp_size = "10m";

    /**
     * @brief CPU 配额，cpu_quota / cpu_period 为可用的 CPU 核数
     */
    int64_t cpu_period = 100000;
    int64_t cpu_quota = 50000;

    /**
     * @brief 单个容器内的进程数上限（--pids-limit），按容器计数
     */
    int pids_limit = 50;

    /**
     * @brief RLIMIT_NPROC（--ulimit nproc）
     * 内核按 UID 统计整个宿主机上的进程数，所有容器共用同一个 user，
     * 所以这个值是同时运行的所有选手程序共享的上限，需要不小于 pids_limit 乘以工作线程数。
     * 单个程序的 fork 炸弹由 pids_limit 限制。
     */
    int nproc_limit = 64;

    int nofile_limit = 64;

    /**
     * @brief 单个文件的最大大小，单位为字节
     */
    int64_t file_size_limit = 10 * 1024 * 1024;

    /**
     * @brief 容器保持运行的最长时间，单位为秒，防止容器在评测系统崩溃后残留
     */
    int keep_alive = 300;
};

void from_json(const nlohmann::json &j, sandbox_config &sandbox);

struct judge_config {
    /**
     * @brief 默认时间限制，单位为秒
     */
    int default_time_limit = 5;

    /**
     * @brief 默认内存限制
     */
    std::string default_memory_limit = "128m";

    /**
     * @brief 默认编译时间限制，单位为秒
     */
    int default_compile_timeout = 15;

    /**
     * @brief 源代码的最大长度，单位为字节
     */
    int64_t max_source_size = 65536;

    /**
     * @brief 选手程序 stdout/stderr 各自最多保存多少字节
     */
    int64_t max_output_size = 1024 * 1024;

    /**
     * @brief 是否禁止使用本地执行器
     */
    bool require_sandbox = false;

    /**
     * @brief 评测系统支持的语言，可以使用别名
     */
    std::vector<std::string> supported_languages;

    /**
     * @brief 每门语言的资源限制，键为语言标识符（可以是别名）
     */
    std::map<std::string, language_limits> languages_limits;

    /**
     * @brief 额外的语言定义，与内置语言同名时覆盖内置语言
     */
    std::vector<language_spec> languages;

    security_config security;

    sandbox_config sandbox;
};

void from_json(const nlohmann::json &j, judge_config &config);

/**
 * @brief 默认配置，包含内置语言的资源限制和安全检查规则
 */
judge_config default_config();

/**
 * @brief 从 JSON 配置文件中读取配置，未出现的项使用默认配置
 * @throw configuration_error 如果配置文件无法读取、格式不正确或者数值不合法
 */
judge_config load_config(const std::filesystem::path &path);

/**
 * @brief 用环境变量覆盖配置
 * @throw configuration_error 如果环境变量的值不合法
 */
void apply_env_overrides(judge_config &config);

/**
 * @brief 检查配置中的数值是否合法
 * @throw configuration_error 如果时间限制不是正数、内存限制格式不正确等
 */
void validate_config(const judge_config &config);

/**
 * @brief 根据配置构造语言注册表：内置语言 + 配置文件中的语言，再按 supported_languages 过滤
 * @throw configuration_error 如果语言定义冲突或者没有任何可用语言
 */
language_registry build_registry(const judge_config &config);

}  // namespace ojcore
