#include "ojcore/language/language_registry.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include "ojcore/common/exceptions.hpp"

namespace ojcore {
using namespace std;

string normalize_language_id(const string &identifier) {
    return boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(identifier));
}

language_registry::language_registry(const vector<language_spec> &specs) {
    for (auto &spec : specs) {
        string id = normalize_language_id(spec.id);
        if (id.empty())
            throw configuration_error("Language definition without id");
        if (spec.run_command.empty())
            throw configuration_error(fmt::format("Language '{}' has no run command", id));
        if (aliases.count(id))
            throw configuration_error(fmt::format("Language '{}' is defined more than once", id));

        language_spec &stored = languages[id] = spec;
        stored.id = id;
        aliases[id] = id;

        for (auto &alias : spec.aliases) {
            string key = normalize_language_id(alias);
            if (key.empty() || key == id) continue;
            auto it = aliases.find(key);
            if (it != aliases.end())
                throw configuration_error(fmt::format("Alias '{}' of language '{}' conflicts with language '{}'", key, id, it->second));
            aliases[key] = id;
        }
    }
}

language_registry language_registry::builtin() {
    return language_registry(builtin_languages());
}

optional<string> language_registry::canonical_id(const string &identifier) const {
    auto it = aliases.find(normalize_language_id(identifier));
    if (it == aliases.end()) return nullopt;
    return it->second;
}

const language_spec &language_registry::resolve(const string &identifier) const {
    auto id = canonical_id(identifier);
    if (!id) throw not_supported_error(identifier);
    return languages.at(*id);
}

bool language_registry::supports(const string &identifier) const {
    return canonical_id(identifier).has_value();
}

vector<string> language_registry::identifiers() const {
    vector<string> result;
    for (auto &[id, spec] : languages) result.push_back(id);
    return result;
}

set<string> language_registry::images() const {
    set<string> result;
    for (auto &[id, spec] : languages)
        if (!spec.image.empty()) result.insert(spec.image);
    return result;
}

language_registry language_registry::restrict_to(const vector<string> &supported) const {
    vector<language_spec> kept;
    set<string> seen;
    for (auto &identifier : supported) {
        auto id = canonical_id(identifier);
        if (!id) {
            LOG(WARNING) << "Ignoring unknown language '" << identifier << "' in supported languages";
            continue;
        }
        if (seen.insert(*id).second)
            kept.push_back(languages.at(*id));
    }
    return language_registry(kept);
}

bool language_registry::empty() const {
    return languages.empty();
}

}  // namespace ojcore
