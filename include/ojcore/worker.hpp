#pragma once

#include <functional>
#include <memory>
#include <thread>
#include "ojcore/common/concurrent_queue.hpp"
#include "ojcore/judge/judge_engine.hpp"
#include "ojcore/judge/submission.hpp"

/**
 * 评测 worker 相关函数
 * 主线程读入提交后推入评测队列，固定数量的 worker 从队列中取出提交并评测，
 * 因此同一时间最多只有 worker 数量那么多的编译器、选手程序或者容器在运行。
 * 主线程关闭评测队列后，worker 在队列取空时退出。
 */
namespace ojcore {

/**
 * @brief 提交评测完成（或者评测失败）后的回调，由调用方负责持久化评测结果
 * 会被多个 worker 同时调用
 */
using finish_callback = std::function<void(submission &)>;

/**
 * @brief 评测一个提交，驱动提交的状态机
 * 提交被拒绝、语言不受支持、评测后端不可用时，提交进入 ERROR 状态并记录原因，
 * 这些情况不会被误报为选手程序的错误。
 */
void judge_submission(const judge_engine &engine, submission &submit);

/**
 * @brief 启动评测 worker 线程
 * @param worker_id worker 的编号，只用于日志
 * @param task_queue 评测队列，关闭后 worker 会在取空队列后退出
 * @param engine 评测引擎，必须比 worker 活得更久
 * @param on_finished 提交评测完成后的回调
 * @return 产生的线程
 */
std::thread start_worker(std::size_t worker_id, concurrent_queue<std::unique_ptr<submission>> &task_queue, const judge_engine &engine, finish_callback on_finished);

}  // namespace ojcore
