#include "ojcore/config.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <set>
#include "ojcore/common/exceptions.hpp"
#include "ojcore/common/io_utils.hpp"
#include "ojcore/common/utils.hpp"
#include "ojcore/judge/resource_limits.hpp"

namespace ojcore {
using namespace std;
using namespace nlohmann;

void from_json(const json &j, language_limits &limits) {
    if (j.count("timeLimit"))
        limits.time_limit = j.at("timeLimit").get<int>();
    if (j.count("memoryLimit"))
        limits.memory_limit = j.at("memoryLimit").get<string>();
    if (j.count("compileTimeout"))
        limits.compile_timeout = j.at("compileTimeout").get<int>();
}

void from_json(const json &j, security_config &security) {
    if (j.count("blockedImports"))
        j.at("blockedImports").get_to(security.blocked_imports);
    if (j.count("blockedPatterns"))
        j.at("blockedPatterns").get_to(security.blocked_patterns);
    if (j.count("importScanLanguages"))
        j.at("importScanLanguages").get_to(security.import_scan_languages);
}

void from_json(const json &j, sandbox_config &sandbox) {
    if (j.count("dockerBinary"))
        j.at("dockerBinary").get_to(sandbox.docker_binary);
    if (j.count("imageContextDir"))
        sandbox.image_context_dir = j.at("imageContextDir").get<string>();
    if (j.count("requireImages"))
        j.at("requireImages").get_to(sandbox.require_images);
    if (j.count("user"))
        j.at("user").get_to(sandbox.user);
    if (j.count("workDir"))
        j.at("workDir").get_to(sandbox.work_dir);
    if (j.count("workDirSize"))
        j.at("workDirSize").get_to(sandbox.work_dir_size);
    if (j.count("tmpSize"))
        j.at("tmpSize").get_to(sandbox.tmp_size);
    if (j.count("cpuPeriod"))
        j.at("cpuPeriod").get_to(sandbox.cpu_period);
    if (j.count("cpuQuota"))
        j.at("cpuQuota").get_to(sandbox.cpu_quota);
    if (j.count("pidsLimit"))
        j.at("pidsLimit").get_to(sandbox.pids_limit);
    if (j.count("nprocLimit"))
        j.at("nprocLimit").get_to(sandbox.nproc_limit);
    if (j.count("nofileLimit"))
        j.at("nofileLimit").get_to(sandbox.nofile_limit);
    if (j.count("fileSizeLimit"))
        j.at("fileSizeLimit").get_to(sandbox.file_size_limit);
    if (j.count("keepAlive"))
        j.at("keepAlive").get_to(sandbox.keep_alive);
}

void from_json(const json &j, judge_config &config) {
    if (j.count("defaultTimeLimit"))
        j.at("defaultTimeLimit").get_to(config.default_time_limit);
    if (j.count("defaultMemoryLimit"))
        j.at("defaultMemoryLimit").get_to(config.default_memory_limit);
    if (j.count("defaultCompileTimeout"))
        j.at("defaultCompileTimeout").get_to(config.default_compile_timeout);
    if (j.count("maxSourceSize"))
        j.at("maxSourceSize").get_to(config.max_source_size);
    if (j.count("maxOutputSize"))
        j.at("maxOutputSize").get_to(config.max_output_size);
    if (j.count("requireSandbox"))
        j.at("requireSandbox").get_to(config.require_sandbox);
    if (j.count("supportedLanguages"))
        j.at("supportedLanguages").get_to(config.supported_languages);
    if (j.count("languageLimits")) {
        // 只覆盖配置文件中出现的项，其余保留内置的语言限制
        for (auto &[id, value] : j.at("languageLimits").items())
            from_json(value, config.languages_limits[id]);
    }
    if (j.count("languages"))
        j.at("languages").get_to(config.languages);
    if (j.count("security"))
        from_json(j.at("security"), config.security);
    if (j.count("sandbox"))
        from_json(j.at("sandbox"), config.sandbox);
}

judge_config default_config() {
    judge_config config;
    config.supported_languages = {"python", "cpp", "c", "java", "javascript"};
    config.languages_limits = {
        {"python", {10, "256m", nullopt}},
        {"cpp", {5, "128m", 15}},
        {"c", {5, "128m", 15}},
        {"java", {8, "512m", 20}},
        {"javascript", {10, "256m", nullopt}}};
    config.security.blocked_imports = {
        "os", "subprocess", "shutil", "socket", "urllib", "http", "requests",
        "pickle", "marshal", "shelve", "ctypes", "importlib", "inspect",
        "multiprocessing", "pty", "signal", "resource"};
    config.security.blocked_patterns = {
        "__import__", "eval(", "exec(", "os.system", "popen", "fork(",
        "system(", "execve", "execvp", "Runtime.getRuntime", "ProcessBuilder",
        "getDeclaredMethod", "setAccessible", "child_process", "process.binding"};
    return config;
}

judge_config load_config(const filesystem::path &path) {
    if (!filesystem::is_regular_file(path))
        throw configuration_error(fmt::format("Config file {} does not exist", path));

    judge_config config = default_config();
    try {
        json j = json::parse(read_file_content(path));
        from_json(j, config);
    } catch (json::exception &ex) {
        throw configuration_error(fmt::format("Malformed config file {}: {}", path, ex.what()));
    }
    validate_config(config);
    return config;
}

template <typename T>
static optional<T> env_value(const string &key) {
    auto value = get_env(key);
    if (!value) return nullopt;
    try {
        return boost::lexical_cast<T>(boost::algorithm::trim_copy(*value));
    } catch (boost::bad_lexical_cast &) {
        throw configuration_error(fmt::format("Malformed environment variable {}={}", key, *value));
    }
}

static bool parse_bool(const string &key, const string &value) {
    string text = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(value));
    if (text == "1" || text == "true" || text == "yes" || text == "on") return true;
    if (text == "0" || text == "false" || text == "no" || text == "off" || text.empty()) return false;
    throw configuration_error(fmt::format("Malformed environment variable {}={}", key, value));
}

void apply_env_overrides(judge_config &config) {
    if (auto value = env_value<int>("JUDGE_DEFAULT_TIME_LIMIT"))
        config.default_time_limit = *value;
    if (auto value = get_env("JUDGE_DEFAULT_MEMORY_LIMIT"))
        config.default_memory_limit = *value;
    if (auto value = env_value<int>("JUDGE_COMPILE_TIMEOUT"))
        config.default_compile_timeout = *value;
    if (auto value = get_env("JUDGE_SUPPORTED_LANGUAGES"))
        config.supported_languages = split_list(*value);
    if (auto value = get_env("JUDGE_REQUIRE_SANDBOX"))
        config.require_sandbox = parse_bool("JUDGE_REQUIRE_SANDBOX", *value);
    validate_config(config);
}

void validate_config(const judge_config &config) {
    if (config.default_time_limit < 1)
        throw configuration_error(fmt::format("Default time limit must be at least 1 second, got {}", config.default_time_limit));
    if (config.default_compile_timeout < 1)
        throw configuration_error(fmt::format("Default compile timeout must be at least 1 second, got {}", config.default_compile_timeout));
    if (config.max_source_size <= 0)
        throw configuration_error("Maximum source size must be positive");
    if (config.max_output_size <= 0)
        throw configuration_error("Maximum output size must be positive");
    parse_program_memory_limit(config.default_memory_limit);

    for (auto &[id, limits] : config.languages_limits) {
        if (limits.time_limit && *limits.time_limit < 1)
            throw configuration_error(fmt::format("Time limit of language '{}' must be at least 1 second", id));
        if (limits.compile_timeout && *limits.compile_timeout < 1)
            throw configuration_error(fmt::format("Compile timeout of language '{}' must be at least 1 second", id));
        if (limits.memory_limit)
            parse_program_memory_limit(*limits.memory_limit);
    }

    parse_memory_limit(config.sandbox.work_dir_size);
    parse_memory_limit(config.sandbox.tmp_size);
    if (config.sandbox.file_size_limit <= 0)
        throw configuration_error("Sandbox file size limit must be positive");
    if (config.sandbox.user.empty() || config.sandbox.user == "root" || config.sandbox.user == "0")
        throw configuration_error("Sandbox must run as an unprivileged user");
}

language_registry build_registry(const judge_config &config) {
    vector<language_spec> languages;
    set<string> overridden;
    for (auto &spec : config.languages)
        overridden.insert(normalize_language_id(spec.id));
    for (auto &spec : builtin_languages())
        if (!overridden.count(spec.id))
            languages.push_back(spec);
    for (auto &spec : config.languages) {
        LOG(INFO) << "Registering language " << spec.id << " from configuration";
        languages.push_back(spec);
    }

    language_registry all(languages);
    language_registry registry = config.supported_languages.empty() ? all : all.restrict_to(config.supported_languages);
    if (registry.empty())
        throw configuration_error("No supported language is available");
    return registry;
}

}  // namespace ojcore
