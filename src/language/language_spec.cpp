#include "ojcore/language/language_spec.hpp"
#include <fmt/core.h>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <cstring>
#include <regex>
#include "ojcore/common/exceptions.hpp"

namespace ojcore {
using namespace std;
using namespace nlohmann;

static const regex public_class_matcher(R"(public\s+(?:(?:final|abstract|static)\s+)*class\s+(\w+))");

bool language_spec::needs_compile() const {
    return !compile_command.empty();
}

string language_spec::context_name() const {
    return image_context.empty() ? id : image_context;
}

void from_json(const json &j, language_spec &spec) {
    j.at("id").get_to(spec.id);
    j.at("extension").get_to(spec.extension);
    j.at("run").get_to(spec.run_command);
    if (j.count("aliases"))
        j.at("aliases").get_to(spec.aliases);
    if (j.count("compile") && !j.at("compile").is_null())
        j.at("compile").get_to(spec.compile_command);
    if (j.count("image"))
        j.at("image").get_to(spec.image);
    if (j.count("imageContext"))
        j.at("imageContext").get_to(spec.image_context);
    if (j.count("requiresPublicClass"))
        j.at("requiresPublicClass").get_to(spec.requires_public_class);
    if (j.count("scanImports"))
        j.at("scanImports").get_to(spec.scan_imports);
}

void to_json(json &j, const language_spec &spec) {
    j = {{"id", spec.id},
         {"aliases", spec.aliases},
         {"extension", spec.extension},
         {"run", spec.run_command},
         {"image", spec.image},
         {"imageContext", spec.context_name()},
         {"requiresPublicClass", spec.requires_public_class},
         {"scanImports", spec.scan_imports}};
    if (spec.needs_compile())
        j["compile"] = spec.compile_command;
    else
        j["compile"] = nullptr;
}

vector<string> expand_command(const vector<string> &command, const command_context &context) {
    vector<string> result;
    result.reserve(command.size());
    for (auto &arg : command) {
        try {
            result.push_back(fmt::format(fmt::runtime(arg),
                                         fmt::arg("file", context.file.string()),
                                         fmt::arg("output", context.output.string()),
                                         fmt::arg("dir", context.dir.string()),
                                         fmt::arg("class", context.class_name)));
        } catch (fmt::format_error &ex) {
            throw configuration_error(fmt::format("Malformed command template '{}': {}", arg, ex.what()));
        }
    }
    return result;
}

optional<string> find_public_class(const string &source) {
    smatch matches;
    if (regex_search(source, matches, public_class_matcher))
        return matches[1].str();
    return nullopt;
}

static bool is_identifier_char(char c) {
    return isalnum((unsigned char)c) || c == '_' || c == '$';
}

/**
 * @brief 跳过从 pos 开始的字符串、字符常量或者注释
 * @return 跳过的部分之后的位置，pos 处不是字符串、字符常量或注释时返回 pos
 */
static size_t skip_literal(const string &source, size_t pos) {
    auto find_end = [&](const char *terminator, size_t from) {
        size_t end = source.find(terminator, from);
        return end == string::npos ? source.size() : end + strlen(terminator);
    };
    if (source.compare(pos, 2, "//") == 0) return find_end("\n", pos + 2);
    if (source.compare(pos, 2, "/*") == 0) return find_end("*/", pos + 2);
    if (source.compare(pos, 3, "\"\"\"") == 0) return find_end("\"\"\"", pos + 3);
    char quote = source[pos];
    if (quote != '"' && quote != '\'') return pos;
    size_t i = pos + 1;
    while (i < source.size() && source[i] != quote && source[i] != '\n')
        i += source[i] == '\\' ? 2 : 1;
    return min(i + 1, source.size());
}

string rename_public_class(const string &source, const string &new_name) {
    auto old_name = find_public_class(source);
    if (!old_name || *old_name == new_name)
        return source;

    string result;
    result.reserve(source.size());
    size_t i = 0;
    while (i < source.size()) {
        size_t skipped = skip_literal(source, i);
        if (skipped != i) {
            result.append(source, i, skipped - i);
            i = skipped;
        } else if (is_identifier_char(source[i])) {
            size_t end = i;
            while (end < source.size() && is_identifier_char(source[end])) ++end;
            if (source.compare(i, end - i, *old_name) == 0 && end - i == old_name->size())
                result += new_name;
            else
                result.append(source, i, end - i);
            i = end;
        } else {
            result += source[i++];
        }
    }
    return result;
}

vector<language_spec> builtin_languages() {
    vector<language_spec> languages;

    {
        language_spec python;
        python.id = "python";
        python.aliases = {"py", "python3"};
        python.extension = ".py";
        python.run_command = {"python3", "{file}"};
        python.image = "ojcore-judge-python";
        python.scan_imports = true;
        languages.push_back(python);
    }

    {
        language_spec cpp;
        cpp.id = "cpp";
        cpp.aliases = {"c++", "cxx"};
        cpp.extension = ".cpp";
        cpp.compile_command = {"g++", "-o", "{output}", "{file}", "-std=c++17", "-O2"};
        cpp.run_command = {"{output}"};
        cpp.image = "ojcore-judge-cpp";
        languages.push_back(cpp);
    }

    {
        // C 和 C++ 共用同一个镜像
        language_spec c;
        c.id = "c";
        c.extension = ".c";
        c.compile_command = {"gcc", "-o", "{output}", "{file}", "-std=c99", "-O2"};
        c.run_command = {"{output}"};
        c.image = "ojcore-judge-cpp";
        c.image_context = "cpp";
        languages.push_back(c);
    }

    {
        language_spec java;
        java.id = "java";
        java.extension = ".java";
        java.compile_command = {"javac", "{file}"};
        java.run_command = {"java", "-cp", "{dir}", "{class}"};
        java.image = "ojcore-judge-java";
        java.requires_public_class = true;
        languages.push_back(java);
    }

    {
        language_spec javascript;
        javascript.id = "javascript";
        javascript.aliases = {"js", "node"};
        javascript.extension = ".js";
        javascript.run_command = {"node", "{file}"};
        javascript.image = "ojcore-judge-javascript";
        languages.push_back(javascript);
    }

    return languages;
}

}  // namespace ojcore
