#include "ojcore/judge/resource_limits.hpp"
#include <fmt/core.h>
#include <algorithm>
#include <boost/algorithm/string.hpp>
#include <cctype>
#include <limits>
#include "ojcore/common/exceptions.hpp"
#include "ojcore/language/language_registry.hpp"

namespace ojcore {
using namespace std;

int64_t parse_memory_limit(const string &text) {
    string value = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(text));
    if (value.empty())
        throw configuration_error("Empty memory limit");

    int64_t multiplier = 1;
    switch (value.back()) {
        case 'k': multiplier = 1024LL; break;
        case 'm': multiplier = 1024LL * 1024; break;
        case 'g': multiplier = 1024LL * 1024 * 1024; break;
        default: break;
    }
    string digits = multiplier == 1 ? value : value.substr(0, value.size() - 1);
    if (digits.empty() || !all_of(digits.begin(), digits.end(), [](char c) { return isdigit((unsigned char)c); }))
        throw configuration_error(fmt::format("Malformed memory limit '{}'", text));

    int64_t number = 0;
    for (char c : digits) {
        int digit = c - '0';
        if (number > (numeric_limits<int64_t>::max() - digit) / 10)
            throw configuration_error(fmt::format("Memory limit '{}' is too large", text));
        number = number * 10 + digit;
    }
    if (number == 0)
        throw configuration_error(fmt::format("Memory limit '{}' must be positive", text));
    if (number > numeric_limits<int64_t>::max() / multiplier)
        throw configuration_error(fmt::format("Memory limit '{}' is too large", text));
    return number * multiplier;
}

int64_t parse_program_memory_limit(const string &text) {
    int64_t bytes = parse_memory_limit(text);
    if (bytes < MIN_MEMORY_LIMIT)
        throw configuration_error(fmt::format("Memory limit '{}' is below the minimum of {} bytes", text, MIN_MEMORY_LIMIT));
    return bytes;
}

resource_limit_resolver::resource_limit_resolver(const judge_config &config)
    : default_time_limit(config.default_time_limit),
      default_memory_limit(config.default_memory_limit),
      default_compile_timeout(config.default_compile_timeout),
      max_source_size(config.max_source_size),
      max_output_size(config.max_output_size),
      max_file_size(config.sandbox.file_size_limit) {
    for (auto &[id, language_limit] : config.languages_limits)
        limits[normalize_language_id(id)] = language_limit;
}

const language_limits *resource_limit_resolver::find_limits(const language_spec &language) const {
    auto it = limits.find(normalize_language_id(language.id));
    if (it != limits.end()) return &it->second;
    // 配置文件中可能使用别名作为键
    for (auto &alias : language.aliases) {
        it = limits.find(normalize_language_id(alias));
        if (it != limits.end()) return &it->second;
    }
    return nullptr;
}

int resource_limit_resolver::resolve_time_limit(const language_spec &language, optional<int> problem_override) const {
    if (problem_override && *problem_override > 0)
        return *problem_override;
    auto language_limit = find_limits(language);
    if (language_limit && language_limit->time_limit)
        return max(1, *language_limit->time_limit);
    return max(1, default_time_limit);
}

int64_t resource_limit_resolver::resolve_memory_limit(const language_spec &language, const optional<string> &problem_override) const {
    if (problem_override && !boost::algorithm::trim_copy(*problem_override).empty())
        return parse_program_memory_limit(*problem_override);
    auto language_limit = find_limits(language);
    if (language_limit && language_limit->memory_limit)
        return parse_program_memory_limit(*language_limit->memory_limit);
    return parse_program_memory_limit(default_memory_limit);
}

optional<int> resource_limit_resolver::resolve_compile_timeout(const language_spec &language) const {
    if (!language.needs_compile())
        return nullopt;
    auto language_limit = find_limits(language);
    if (language_limit && language_limit->compile_timeout)
        return max(1, *language_limit->compile_timeout);
    return max(1, default_compile_timeout);
}

resource_limits resource_limit_resolver::resolve(const language_spec &language, const problem_overrides &overrides) const {
    resource_limits result;
    result.time_limit = resolve_time_limit(language, overrides.time_limit);
    result.memory_limit = resolve_memory_limit(language, overrides.memory_limit);
    result.compile_timeout = resolve_compile_timeout(language);
    result.max_source_size = max_source_size;
    result.max_output_size = max_output_size;
    result.max_file_size = max_file_size;
    return result;
}

}  // namespace ojcore
