#include "ojcore/judge/process_executor.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string/join.hpp>
#include <boost/exception/diagnostic_information.hpp>
#include "ojcore/common/exceptions.hpp"
#include "ojcore/common/io_utils.hpp"
#include "ojcore/common/subprocess.hpp"
#include "ojcore/common/utils.hpp"

namespace ojcore {
using namespace std;
namespace fs = std::filesystem;

process_executor::process_executor(const language_registry &registry, fs::path work_root)
    : registry(registry), work_root(move(work_root)) {}

string process_executor::name() const {
    return "local";
}

bool process_executor::available() const {
    return true;
}

void process_executor::compile(const language_spec &language, const command_context &context, const resource_limits &limits) const {
    process_options opt;
    opt.command = expand_command(language.compile_command, context);
    opt.work_dir = context.dir;
    if (limits.compile_timeout) opt.wall_limit = *limits.compile_timeout;
    opt.stream_size = limits.max_output_size;

    LOG(INFO) << "Compiling " << language.id << " submission: " << boost::algorithm::join(opt.command, " ");
    process_result result = run_process(opt);
    if (result.timed_out)
        throw compilation_error("compilation timed out", fmt::format("Compilation timed out after {} seconds", *limits.compile_timeout));
    if (!result.success()) {
        string log = result.stderr_text.empty() ? result.stdout_text : result.stderr_text;
        throw compilation_error("compiler returned non-zero", log);
    }
}

execution_outcome process_executor::run(const string &source, const string &language_id, const string &input, const resource_limits &limits) const {
    try {
        const language_spec &language = registry.resolve(language_id);

        string class_name = "Main";
        if (language.requires_public_class) {
            auto found = find_public_class(source);
            if (!found) return execution_outcome::failure("No public class found in Java code");
            class_name = *found;
        }

        // 选手程序运行在独占的临时文件夹中，函数退出时文件夹会被删除
        scoped_temp_directory dir("ojcore-run-", work_root);
        string file_name = (language.requires_public_class ? class_name : "solution") + language.extension;

        command_context context;
        context.dir = dir.path();
        context.file = dir.path() / file_name;
        context.output = dir.path() / "solution";
        context.class_name = class_name;
        write_file_content(context.file, source);

        if (language.needs_compile()) {
            try {
                compile(language, context, limits);
            } catch (compilation_error &ex) {
                LOG(INFO) << "Compilation of " << language.id << " submission failed: " << ex.what();
                return execution_outcome::compilation_failed(ex.error_log);
            }
        }

        process_options opt;
        opt.command = expand_command(language.run_command, context);
        opt.work_dir = dir.path();
        opt.input = input;
        opt.wall_limit = limits.time_limit;
        opt.stream_size = limits.max_output_size;
        opt.file_limit = limits.max_file_size;

        LOG(INFO) << "Running " << language.id << " submission: " << boost::algorithm::join(opt.command, " ");
        process_result result = run_process(opt);
        if (result.timed_out) {
            LOG(WARNING) << "Submission exceeded time limit of " << limits.time_limit << "s, process group killed";
            return execution_outcome::time_limit_exceeded(limits.time_limit);
        }

        execution_outcome outcome;
        outcome.stdout_text = move(result.stdout_text);
        outcome.stderr_text = move(result.stderr_text);
        outcome.elapsed = result.wall_time;
        outcome.success = result.success();
        outcome.exit_code = result.exitcode;
        outcome.reason = termination::EXITED;
        if (result.signal >= 0)
            LOG(INFO) << "Submission killed by signal " << result.signal;
        return outcome;
    } catch (not_supported_error &ex) {
        return execution_outcome::failure(ex.what());
    } catch (system_error &ex) {
        // 一般是编译器或者解释器不存在
        LOG(ERROR) << "Unable to run " << language_id << " submission: " << ex.what();
        return execution_outcome::failure(fmt::format("Execution error: {}", ex.what()));
    } catch (exception &ex) {
        LOG(ERROR) << "Unexpected error running " << language_id << " submission: " << boost::diagnostic_information(ex);
        return execution_outcome::failure(fmt::format("Execution error: {}", ex.what()));
    }
}

map<string, bool> process_executor::check_requirements() const {
    map<string, bool> result;
    for (auto &id : registry.identifiers()) {
        const language_spec &language = registry.resolve(id);
        bool ok = true;
        if (language.needs_compile())
            ok = ok && find_executable(language.compile_command.front()).has_value();
        // 运行命令的第一个参数是编译产物时不需要检查
        const string &program = language.run_command.front();
        if (program.find('{') == string::npos)
            ok = ok && find_executable(program).has_value();
        result[id] = ok;
    }
    return result;
}

}  // namespace ojcore
