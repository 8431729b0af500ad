#include "ojcore/worker.hpp"
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include "ojcore/common/exceptions.hpp"

namespace ojcore {
using namespace std;

void judge_submission(const judge_engine &engine, submission &submit) {
    submit.begin_judging();

    if (submit.test_cases.empty()) {
        LOG(WARNING) << "Submission " << submit.sub_id << " has no test cases";
        submit.fail("No test cases available for this problem");
        return;
    }

    try {
        judge_verdict verdict = engine.judge(submit.source, submit.language, submit.test_cases, submit.overrides);
        submit.finish(move(verdict));
    } catch (validation_error &ex) {
        LOG(INFO) << "Submission " << submit.sub_id << " rejected: " << ex.reason;
        submit.fail(ex.what());
    } catch (not_supported_error &ex) {
        LOG(INFO) << "Submission " << submit.sub_id << ": " << ex.what();
        submit.fail(ex.what());
    } catch (judge_unavailable_error &ex) {
        LOG(ERROR) << "Unable to judge submission " << submit.sub_id << ": " << ex.what();
        submit.fail(ex.what());
    } catch (exception &ex) {
        LOG(ERROR) << "Submission " << submit.sub_id << " has crashed: " << boost::diagnostic_information(ex);
        submit.fail(ex.what());
    }
}

static void worker_loop(size_t worker_id, concurrent_queue<unique_ptr<submission>> &task_queue, const judge_engine &engine, const finish_callback &on_finished) {
    LOG(INFO) << "Worker " << worker_id << " started";

    while (true) {
        // 队列关闭且取空之后退出
        auto task = task_queue.pop();
        if (!task) break;
        unique_ptr<submission> &submit = *task;

        LOG(INFO) << "Worker " << worker_id << " judging submission " << submit->sub_id;
        judge_submission(engine, *submit);
        LOG(INFO) << "Worker " << worker_id << " finished submission " << submit->sub_id << ": " << get_display_message(submit->state);

        try {
            on_finished(*submit);
        } catch (exception &ex) {
            LOG(ERROR) << "Worker " << worker_id << " has crashed when reporting submission " << submit->sub_id << ", " << ex.what();
        }
    }

    LOG(INFO) << "Worker " << worker_id << " stopped";
}

thread start_worker(size_t worker_id, concurrent_queue<unique_ptr<submission>> &task_queue, const judge_engine &engine, finish_callback on_finished) {
    return thread([worker_id, &task_queue, &engine, on_finished = move(on_finished)] {
        worker_loop(worker_id, task_queue, engine, on_finished);
    });
}

}  // namespace ojcore
