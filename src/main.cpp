#include <glog/logging.h>
#include <boost/program_options.hpp>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <thread>
#include "ojcore/common/concurrent_queue.hpp"
#include "ojcore/common/exceptions.hpp"
#include "ojcore/common/io_utils.hpp"
#include "ojcore/common/utils.hpp"
#include "ojcore/config.hpp"
#include "ojcore/judge/container_runtime.hpp"
#include "ojcore/judge/judge_engine.hpp"
#include "ojcore/judge/process_executor.hpp"
#include "ojcore/judge/sandbox_executor.hpp"
#include "ojcore/judge/submission.hpp"
#include "ojcore/worker.hpp"
using namespace std;

/**
 * @brief 读取提交文件，文件可以是一个提交或者提交数组
 */
static vector<unique_ptr<ojcore::submission>> read_submissions(const filesystem::path& path) {
    vector<unique_ptr<ojcore::submission>> result;
    nlohmann::json j = nlohmann::json::parse(ojcore::read_file_content(path));
    if (j.is_array()) {
        for (auto& item : j) {
            auto submit = make_unique<ojcore::submission>();
            from_json(item, *submit);
            result.push_back(move(submit));
        }
    } else {
        auto submit = make_unique<ojcore::submission>();
        from_json(j, *submit);
        result.push_back(move(submit));
    }
    return result;
}

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    namespace po = boost::program_options;
    po::options_description desc("ojcore-judge options");
    po::positional_options_description positional;
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("config", po::value<string>(), "set the JSON configuration file. You can either pass it from environ JUDGE_CONFIG")
        ("executor", po::value<string>(), "select the executor, local or sandbox. You can either pass it from environ JUDGE_EXECUTOR, defaults to sandbox if requireSandbox is set, otherwise local")
        ("workers", po::value<size_t>(), "set the number of submissions judged concurrently, default to the number of CPU cores")
        ("output-dir", po::value<string>(), "set the directory to write verdicts to, one [submission id].json for each submission. Verdicts are printed to stdout if not set")
        ("provision-images", "build missing sandbox images and exit")
        ("check", "print the availability of compilers, interpreters and sandbox images and exit")
        ("submission", po::value<vector<string>>(), "submission files to judge")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on
    positional.add("submission", -1);

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .positional(positional)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "ojcore-judge: Judge submissions against their test cases" << endl
             << "Usage: " << argv[0] << " [options] submission.json..." << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "ojcore-judge 1.0" << endl;
        return EXIT_SUCCESS;
    }

    ojcore::judge_config config = ojcore::default_config();
    optional<string> config_path;
    if (vm.count("config")) {
        config_path = vm.at("config").as<string>();
    } else {
        config_path = ojcore::get_env("JUDGE_CONFIG");
    }
    try {
        if (config_path) config = ojcore::load_config(*config_path);
        ojcore::apply_env_overrides(config);
    } catch (ojcore::configuration_error& e) {
        LOG(FATAL) << "Configuration is malformed: " << e.what();
    }

    ojcore::language_registry registry;
    try {
        registry = ojcore::build_registry(config);
    } catch (ojcore::configuration_error& e) {
        LOG(FATAL) << "Unable to register languages: " << e.what();
    }

    string executor_name = config.require_sandbox ? "sandbox" : "local";
    if (vm.count("executor")) {
        executor_name = vm.at("executor").as<string>();
    } else if (auto env = ojcore::get_env("JUDGE_EXECUTOR")) {
        executor_name = *env;
    }
    CHECK(executor_name == "local" || executor_name == "sandbox")
        << "Unrecognized executor " << executor_name;
    CHECK(!(config.require_sandbox && executor_name == "local"))
        << "requireSandbox is set, local executor is not allowed";

    ojcore::resource_limit_resolver resolver(config);
    ojcore::security_validator validator(config.security, config.max_source_size);
    ojcore::process_executor local(registry);
    auto runtime = ojcore::docker_runtime::instance(config.sandbox.docker_binary);
    ojcore::sandbox_executor sandbox(registry, config.sandbox, runtime);

    if (vm.count("check")) {
        ojcore::sandbox_status status = sandbox.check_status();
        nlohmann::json j = {{"executor", executor_name},
                            {"languages", registry.identifiers()},
                            {"local", local.check_requirements()},
                            {"sandbox", {{"runtimeAvailable", status.runtime_available}, {"images", status.images}}}};
        cout << j.dump(4) << endl;
        return EXIT_SUCCESS;
    }

    if (executor_name == "sandbox" || vm.count("provision-images")) {
        if (!runtime->ping()) {
            LOG(ERROR) << "Container runtime is unavailable, sandboxed judging is disabled";
            if (vm.count("provision-images")) return EXIT_FAILURE;
        } else {
            try {
                sandbox.provision_images();
            } catch (ojcore::judge_exception& e) {
                LOG(FATAL) << "Unable to provision sandbox images: " << e;
            }
        }
        if (vm.count("provision-images")) return EXIT_SUCCESS;
    }

    const ojcore::executor& exec = executor_name == "sandbox" ? static_cast<const ojcore::executor&>(sandbox) : local;
    ojcore::judge_engine engine(registry, resolver, validator, exec);

    optional<filesystem::path> output_dir;
    if (vm.count("output-dir")) {
        output_dir = filesystem::path(vm.at("output-dir").as<string>());
        CHECK(filesystem::is_directory(*output_dir))
            << "Output directory " << *output_dir << " does not exist";
    }

    mutex output_mutex;
    auto on_finished = [&](ojcore::submission& submit) {
        nlohmann::json j = submit;
        if (output_dir) {
            ojcore::write_file_content(*output_dir / (ojcore::assert_safe_path(submit.sub_id) + ".json"), j.dump(4));
        } else {
            scoped_lock guard(output_mutex);
            cout << j.dump() << endl;
        }
    };

    size_t workers = max(1u, thread::hardware_concurrency());
    if (vm.count("workers")) workers = max<size_t>(1, vm.at("workers").as<size_t>());
    // 所有容器使用同一个用户，RLIMIT_NPROC 由所有同时运行的选手程序共享
    if (executor_name == "sandbox" && (size_t)config.sandbox.nproc_limit < (size_t)config.sandbox.pids_limit * workers)
        LOG(WARNING) << "nprocLimit " << config.sandbox.nproc_limit << " is shared by " << workers
                     << " workers running as user " << config.sandbox.user << ", concurrent submissions may fail to spawn processes";

    ojcore::concurrent_queue<unique_ptr<ojcore::submission>> task_queue;
    vector<thread> worker_threads;
    for (size_t i = 0; i < workers; ++i)
        worker_threads.push_back(ojcore::start_worker(i, task_queue, engine, on_finished));

    int exit_code = EXIT_SUCCESS;
    if (vm.count("submission")) {
        for (auto& file : vm.at("submission").as<vector<string>>()) {
            try {
                for (auto& submit : read_submissions(file))
                    task_queue.push(move(submit));
            } catch (std::exception& e) {
                LOG(ERROR) << "Submission file " << file << " is malformed: " << e.what();
                exit_code = EXIT_FAILURE;
            }
        }
    }
    task_queue.close();

    for (auto& th : worker_threads)
        th.join();

    return exit_code;
}
