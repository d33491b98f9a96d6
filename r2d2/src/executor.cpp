#include "executor.hpp"
#include "log.hpp"
#include <exception>
#include <stdexcept>

Executor::Executor(unsigned workers) {
    if (workers == 0)
        workers = std::thread::hardware_concurrency();
    if (workers == 0)
        workers = 1;

    threads_.reserve(workers);
    try {
        for (unsigned i = 0; i < workers; ++i)
            threads_.emplace_back(&Executor::worker_main, this, i);
    } catch (...) {
        {
            std::lock_guard<std::mutex> lock(mu_);
            stopping_ = true;
        }
        cv_.notify_all();
        for (auto& t : threads_)
            t.join();
        throw;
    }
    logging::debug("executor started with " + std::to_string(workers) + " workers");
}

Executor::~Executor() {
    {
        std::lock_guard<std::mutex> lock(mu_);
        stopping_ = true;
    }
    cv_.notify_all();
    for (auto& t : threads_)
        t.join();
}

std::future<TaskResult> Executor::enqueue_locked(uint64_t id, TaskType type,
                                                 TaskPayload&& payload)
{
    if (stopping_)
        throw std::runtime_error("executor is shutting down");

    std::promise<TaskResult> promise;
    std::future<TaskResult> fut = promise.get_future();
    pending_.emplace(id, std::move(promise));
    queue_.push_back(Job{id, type, std::move(payload)});
    return fut;
}

std::future<TaskResult> Executor::submit(uint64_t request_id, TaskType type,
                                         TaskPayload payload)
{
    std::future<TaskResult> fut;
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (pending_.count(request_id))
            throw std::invalid_argument("request id " + std::to_string(request_id) +
                                        " is already in flight");
        fut = enqueue_locked(request_id, type, std::move(payload));
    }
    cv_.notify_one();
    return fut;
}

std::future<TaskResult> Executor::submit(TaskType type, TaskPayload payload) {
    std::future<TaskResult> fut;
    {
        std::lock_guard<std::mutex> lock(mu_);
        while (pending_.count(next_id_))
            ++next_id_;
        fut = enqueue_locked(next_id_++, type, std::move(payload));
    }
    cv_.notify_one();
    return fut;
}

size_t Executor::in_flight() const {
    std::lock_guard<std::mutex> lock(mu_);
    return pending_.size();
}

TaskResult Executor::execute(const Job& job) {
    TaskResult r;
    r.request_id = job.id;
    r.type       = job.type;
    try {
        r.value = run_task(job.type, job.payload);
        r.ok    = true;
    } catch (const CryptoError& e) {
        r.error = TaskError{e.kind(), e.what()};
    } catch (const std::exception& e) {
        r.error = TaskError{ErrorKind::Internal, e.what()};
    } catch (...) {
        r.error = TaskError{ErrorKind::Internal, "non-standard exception"};
    }
    return r;
}

void Executor::worker_main(unsigned index) {
    for (;;) {
        Job job{0, TaskType::UnlockNode, TaskPayload()};
        {
            std::unique_lock<std::mutex> lock(mu_);
            cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty())
                return;   // stopping and drained
            job = std::move(queue_.front());
            queue_.pop_front();
        }

        TaskResult result = execute(job);
        if (!result.ok)
            logging::debug("worker " + std::to_string(index) + ": request " +
                           std::to_string(job.id) + " (" + task_type_str(job.type) +
                           ") failed: " + result.error.message);

        std::promise<TaskResult> promise;
        {
            std::lock_guard<std::mutex> lock(mu_);
            auto it = pending_.find(job.id);
            promise = std::move(it->second);
            pending_.erase(it);
        }
        promise.set_value(std::move(result));
    }
}
