#include "test/languages.hpp"
#include "ojcore/common/utils.hpp"

namespace ojcore::test {
using namespace std;

language_spec shell_language() {
    language_spec spec;
    spec.id = "shell";
    spec.aliases = {"sh"};
    spec.extension = ".sh";
    spec.run_command = {"sh", "{file}"};
    spec.image = "ojcore-judge-shell";
    return spec;
}

language_spec compiled_shell_language() {
    language_spec spec;
    spec.id = "shellc";
    spec.extension = ".sh";
    spec.compile_command = {"sh", "-c", "sh -n \"$0\" && cp \"$0\" \"$1\"", "{file}", "{output}"};
    spec.run_command = {"sh", "{output}"};
    spec.image = "ojcore-judge-shell";
    return spec;
}

language_registry test_registry() {
    vector<language_spec> languages = builtin_languages();
    languages.push_back(shell_language());
    languages.push_back(compiled_shell_language());
    return language_registry(languages);
}

judge_config test_config() {
    judge_config config = default_config();
    config.languages_limits["shell"] = {1, "64m", nullopt};
    config.languages_limits["shellc"] = {1, "64m", 5};
    return config;
}

bool has_program(const string &program) {
    return find_executable(program).has_value();
}

}  // namespace ojcore::test
