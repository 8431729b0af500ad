#include "ojcore/judge/sandbox_executor.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string/join.hpp>
#include <boost/exception/diagnostic_information.hpp>
#include <chrono>
#include <future>
#include <thread>
#include "ojcore/common/defer.hpp"
#include "ojcore/common/exceptions.hpp"
#include "ojcore/common/utils.hpp"
#include "ojcore/judge/resource_limits.hpp"

namespace ojcore {
using namespace std;
namespace fs = std::filesystem;

// 容器内 Java 主类的类名，运行命令不依赖选手选择的类名
const string SANDBOX_CLASS_NAME = "Solution";

sandbox_executor::sandbox_executor(const language_registry &registry, const sandbox_config &config, shared_ptr<container_runtime> runtime)
    : registry(registry), config(config), runtime(move(runtime)) {}

string sandbox_executor::name() const {
    return "sandbox";
}

bool sandbox_executor::available() const {
    return runtime->ping();
}

container_options sandbox_executor::make_container_options(const language_spec &language, const resource_limits &limits) const {
    container_options options;
    options.image = language.image;
    options.command = {"sleep", to_string(config.keep_alive)};
    options.user = config.user;
    options.work_dir = config.work_dir;
    options.work_dir_size = config.work_dir_size;
    options.tmp_size = config.tmp_size;
    options.memory_limit = limits.memory_limit;
    options.cpu_period = config.cpu_period;
    options.cpu_quota = config.cpu_quota;
    options.pids_limit = config.pids_limit;
    options.nproc_limit = config.nproc_limit;
    options.nofile_limit = config.nofile_limit;
    options.file_size_limit = config.file_size_limit;
    return options;
}

execution_outcome sandbox_executor::run(const string &source, const string &language_id, const string &input, const resource_limits &limits) const {
    try {
        const language_spec &language = registry.resolve(language_id);
        if (language.image.empty())
            return execution_outcome::failure(fmt::format("Language '{}' has no sandbox image", language.id));

        string code = source;
        string class_name = SANDBOX_CLASS_NAME;
        string file_name = "solution" + language.extension;
        if (language.requires_public_class) {
            // 必须在创建容器之前检查
            if (!find_public_class(source))
                return execution_outcome::failure("No public class found in Java code");
            code = rename_public_class(source, SANDBOX_CLASS_NAME);
            file_name = SANDBOX_CLASS_NAME + language.extension;
        }

        fs::path work_dir = config.work_dir;
        command_context context;
        context.dir = work_dir;
        context.file = work_dir / file_name;
        context.output = work_dir / "solution";
        context.class_name = class_name;

        vector<string> compile_command;
        if (language.needs_compile())
            compile_command = expand_command(language.compile_command, context);
        vector<string> run_command = expand_command(language.run_command, context);

        string id = runtime->create_container(make_container_options(language, limits));
        DLOG(INFO) << "Created container " << id << " from " << language.image;
        defer {
            try {
                runtime->remove_container(id);
            } catch (exception &ex) {
                LOG(WARNING) << "Unable to remove container " << id << ": " << ex.what();
            }
        };

        runtime->start_container(id);
        runtime->write_file(id, context.file.string(), code);

        if (!compile_command.empty()) {
            LOG(INFO) << "Compiling " << language.id << " submission in container " << id << ": " << boost::algorithm::join(compile_command, " ");
            optional<double> compile_timeout;
            if (limits.compile_timeout) compile_timeout = *limits.compile_timeout;
            exec_result result = runtime->exec(id, compile_command, "", compile_timeout, limits.max_output_size);
            if (result.timed_out)
                return execution_outcome::compilation_failed(fmt::format("Compilation timed out after {} seconds", *limits.compile_timeout));
            if (result.exit_code != 0)
                return execution_outcome::compilation_failed(result.stderr_text.empty() ? result.stdout_text : result.stderr_text);
        }

        LOG(INFO) << "Running " << language.id << " submission in container " << id << ": " << boost::algorithm::join(run_command, " ");

        // 选手程序在后台线程中运行，评测线程只等待时间限制那么久。
        // 后台线程持有容器运行时的引用，超时后被放弃，容器删除后它会自行结束。
        auto promise = make_shared<std::promise<exec_result>>();
        future<exec_result> result_future = promise->get_future();
        shared_ptr<container_runtime> rt = runtime;
        double worker_timeout = limits.time_limit * 2.0 + 10;
        int64_t output_limit = limits.max_output_size;
        elapsed_time timer;
        thread([rt, promise, id, run_command, input, worker_timeout, output_limit] {
            try {
                promise->set_value(rt->exec(id, run_command, input, worker_timeout, output_limit));
            } catch (...) {
                promise->set_exception(current_exception());
            }
        }).detach();

        if (result_future.wait_for(chrono::seconds(limits.time_limit)) != future_status::ready) {
            LOG(WARNING) << "Submission in container " << id << " exceeded time limit of " << limits.time_limit << "s, abandoning execution";
            return execution_outcome::time_limit_exceeded(limits.time_limit);
        }

        exec_result result = result_future.get();
        double elapsed = timer.seconds();
        if (result.timed_out)
            return execution_outcome::time_limit_exceeded(limits.time_limit);

        execution_outcome outcome;
        outcome.stdout_text = move(result.stdout_text);
        outcome.stderr_text = move(result.stderr_text);
        outcome.elapsed = elapsed;
        outcome.exit_code = result.exit_code;
        outcome.success = result.exit_code == 0;
        outcome.reason = termination::EXITED;
        return outcome;
    } catch (not_supported_error &ex) {
        return execution_outcome::failure(ex.what());
    } catch (infrastructure_error &ex) {
        LOG(ERROR) << "Container execution of " << language_id << " submission failed: " << ex.what();
        return execution_outcome::failure(fmt::format("Container execution error: {}", ex.what()));
    } catch (exception &ex) {
        LOG(ERROR) << "Unexpected error running " << language_id << " submission in sandbox: " << boost::diagnostic_information(ex);
        return execution_outcome::failure(fmt::format("Container execution error: {}", ex.what()));
    }
}

void sandbox_executor::provision_images() const {
    // 多门语言可能共用一个镜像，只构建一次
    map<string, string> contexts;
    for (auto &id : registry.identifiers()) {
        const language_spec &language = registry.resolve(id);
        if (!language.image.empty() && !contexts.count(language.image))
            contexts[language.image] = language.context_name();
    }

    for (auto &[image, context_name] : contexts) {
        if (runtime->image_exists(image)) {
            LOG(INFO) << "Image " << image << " is present";
            continue;
        }

        fs::path context_dir = config.image_context_dir / context_name;
        if (!fs::exists(context_dir / "Dockerfile")) {
            if (config.require_images)
                throw configuration_error(fmt::format("Build context {} for image {} does not exist", context_dir, image));
            LOG(WARNING) << "Build context " << context_dir.string() << " for image " << image << " does not exist, languages using it are unavailable";
            continue;
        }

        try {
            runtime->build_image(image, context_dir);
        } catch (infrastructure_error &ex) {
            if (config.require_images) throw;
            LOG(ERROR) << ex.what();
        }
    }
}

sandbox_status sandbox_executor::check_status() const {
    sandbox_status status;
    status.runtime_available = runtime->ping();
    for (auto &image : registry.images())
        status.images[image] = status.runtime_available && runtime->image_exists(image);
    return status;
}

}  // namespace ojcore
