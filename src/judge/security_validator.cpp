#include "ojcore/judge/security_validator.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include "ojcore/language/language_registry.hpp"

namespace ojcore {
using namespace std;

validation_result validation_result::accept() {
    return {true, ""};
}

validation_result validation_result::reject(const string &reason) {
    return {false, reason};
}

security_validator::security_validator(const security_config &config, int64_t max_source_size)
    : blocked_imports(config.blocked_imports), max_source_size(max_source_size) {
    for (auto &pattern : config.blocked_patterns)
        if (!pattern.empty())
            blocked_patterns.push_back(boost::algorithm::to_lower_copy(pattern));
    for (auto &id : config.import_scan_languages)
        import_scan_languages.insert(normalize_language_id(id));
}

bool security_validator::should_scan_imports(const language_spec &language) const {
    if (language.scan_imports) return true;
    if (import_scan_languages.count(normalize_language_id(language.id))) return true;
    for (auto &alias : language.aliases)
        if (import_scan_languages.count(normalize_language_id(alias))) return true;
    return false;
}

validation_result security_validator::validate(const string &source, const language_spec &language) const {
    if ((int64_t)source.size() > max_source_size)
        return validation_result::reject(fmt::format("Code size ({} bytes) exceeds the maximum of {} bytes", source.size(), max_source_size));

    if (should_scan_imports(language)) {
        for (auto &module : blocked_imports) {
            if (source.find("import " + module) != string::npos || source.find("from " + module) != string::npos) {
                LOG(INFO) << "Rejected " << language.id << " submission importing " << module;
                return validation_result::reject(fmt::format("Blocked import: {}", module));
            }
        }
    }

    string lowered = boost::algorithm::to_lower_copy(source);
    for (auto &pattern : blocked_patterns) {
        if (lowered.find(pattern) != string::npos) {
            LOG(INFO) << "Rejected " << language.id << " submission containing " << pattern;
            return validation_result::reject(fmt::format("Blocked pattern: {}", pattern));
        }
    }

    if (language.requires_public_class && !find_public_class(source))
        return validation_result::reject("No public class found in Java code");

    return validation_result::accept();
}

}  // namespace ojcore
