#include "ojcore/judge/container_runtime.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include <mutex>
#include "ojcore/common/exceptions.hpp"
#include "ojcore/common/subprocess.hpp"
#include "ojcore/common/utils.hpp"

namespace ojcore {
using namespace std;
namespace fs = std::filesystem;

// docker 管理命令（create、start、rm）的超时时间，单位为秒
const double DOCKER_COMMAND_TIMEOUT = 60;

// 构建镜像的超时时间，单位为秒
const double DOCKER_BUILD_TIMEOUT = 1800;

container_runtime::~container_runtime() = default;

vector<string> docker_create_arguments(const container_options &options) {
    vector<string> args = {
        "create",
        "--network", "none",
        "--read-only",
        "--tmpfs", fmt::format("/tmp:rw,noexec,nosuid,size={}", options.tmp_size),
        "--tmpfs", fmt::format("{}:rw,exec,nosuid,size={},mode=1777", options.work_dir, options.work_dir_size),
        "--memory", to_string(options.memory_limit),
        "--memory-swap", to_string(options.memory_limit),
        "--cpu-period", to_string(options.cpu_period),
        "--cpu-quota", to_string(options.cpu_quota),
        "--pids-limit", to_string(options.pids_limit),
        "--ulimit", fmt::format("nproc={0}:{0}", options.nproc_limit),
        "--ulimit", fmt::format("nofile={0}:{0}", options.nofile_limit),
        "--ulimit", fmt::format("fsize={0}:{0}", options.file_size_limit),
        "--security-opt", "no-new-privileges:true",
        "--cap-drop", "ALL",
        "--user", options.user,
        "--workdir", options.work_dir,
        options.image};
    args.insert(args.end(), options.command.begin(), options.command.end());
    return args;
}

docker_runtime::docker_runtime(string docker_binary)
    : docker_binary(move(docker_binary)) {}

shared_ptr<docker_runtime> docker_runtime::instance(const string &docker_binary) {
    static once_flag flag;
    static shared_ptr<docker_runtime> runtime;
    call_once(flag, [&] { runtime = make_shared<docker_runtime>(docker_binary); });
    return runtime;
}

vector<string> docker_runtime::docker(vector<string> args) const {
    args.insert(args.begin(), docker_binary);
    return args;
}

/**
 * @brief 运行 docker 命令，失败时抛出 infrastructure_error
 */
static process_result run_docker(const vector<string> &command, const string &action, double timeout, const string &input = "") {
    process_options opt;
    opt.command = command;
    opt.input = input;
    opt.wall_limit = timeout;
    process_result result;
    try {
        result = run_process(opt);
    } catch (system_error &ex) {
        throw infrastructure_error(fmt::format("Unable to {}: {}", action, ex.what()));
    }
    if (result.timed_out)
        throw infrastructure_error(fmt::format("Unable to {}: docker did not respond in {} seconds", action, timeout));
    if (!result.success())
        throw infrastructure_error(fmt::format("Unable to {}: {}", action, boost::algorithm::trim_copy(result.stderr_text)));
    return result;
}

bool docker_runtime::ping() {
    process_options opt;
    opt.command = docker({"version", "--format", "{{.Server.Version}}"});
    opt.wall_limit = 10;
    try {
        process_result result = run_process(opt);
        if (!result.success()) {
            LOG(WARNING) << "Docker daemon is not reachable: " << boost::algorithm::trim_copy(result.stderr_text);
            return false;
        }
        return true;
    } catch (system_error &ex) {
        LOG(WARNING) << "Unable to run " << docker_binary << ": " << ex.what();
        return false;
    }
}

bool docker_runtime::image_exists(const string &image) {
    process_options opt;
    opt.command = docker({"image", "inspect", "--format", "{{.Id}}", image});
    opt.wall_limit = DOCKER_COMMAND_TIMEOUT;
    try {
        return run_process(opt).success();
    } catch (system_error &ex) {
        LOG(WARNING) << "Unable to inspect image " << image << ": " << ex.what();
        return false;
    }
}

void docker_runtime::build_image(const string &image, const fs::path &context_dir) {
    LOG(INFO) << "Building image " << image << " from " << context_dir.string();
    run_docker(docker({"build", "-t", image, context_dir.string()}), "build image " + image, DOCKER_BUILD_TIMEOUT);
    LOG(INFO) << "Built image " << image;
}

string docker_runtime::create_container(const container_options &options) {
    process_result result = run_docker(docker(docker_create_arguments(options)), "create container from " + options.image, DOCKER_COMMAND_TIMEOUT);
    string id = boost::algorithm::trim_copy(result.stdout_text);
    if (id.empty())
        throw infrastructure_error("Unable to create container from " + options.image + ": docker returned no container id");
    return id;
}

void docker_runtime::start_container(const string &id) {
    run_docker(docker({"start", id}), "start container " + id, DOCKER_COMMAND_TIMEOUT);
}

void docker_runtime::write_file(const string &id, const string &path, const string &content) {
    // docker cp 无法写入 tmpfs，因此通过容器内的 shell 把 stdin 写入文件
    run_docker(docker({"exec", "-i", id, "sh", "-c", "cat > \"$0\"", path}), "write " + path + " into container " + id, DOCKER_COMMAND_TIMEOUT, content);
}

exec_result docker_runtime::exec(const string &id, const vector<string> &command, const string &input, optional<double> timeout, int64_t output_limit) {
    process_options opt;
    opt.command = docker({"exec", "-i", id});
    opt.command.insert(opt.command.end(), command.begin(), command.end());
    opt.input = input;
    opt.wall_limit = timeout;
    opt.stream_size = output_limit;

    process_result result;
    try {
        result = run_process(opt);
    } catch (system_error &ex) {
        throw infrastructure_error(fmt::format("Unable to execute command in container {}: {}", id, ex.what()));
    }

    exec_result ret;
    ret.exit_code = result.exitcode;
    ret.stdout_text = move(result.stdout_text);
    ret.stderr_text = move(result.stderr_text);
    ret.timed_out = result.timed_out;
    return ret;
}

void docker_runtime::remove_container(const string &id) {
    run_docker(docker({"rm", "-f", id}), "remove container " + id, DOCKER_COMMAND_TIMEOUT);
}

}  // namespace ojcore
