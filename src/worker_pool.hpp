// worker_pool.hpp

#pragma once
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

// Linux limits thread names to 15 characters.
void name_current_thread(const char* name);

class PoolRejected : public std::runtime_error {
  public:
    explicit PoolRejected(const std::string& what) : std::runtime_error(what) {}
};

// Fixed set of detached worker threads draining a bounded FIFO backlog.
// Workers never keep the process alive: destroying the pool stops idle
// workers and abandons busy ones to finish on their own.
class WorkerPool {
  public:
    using Job = std::function<void()>;

    static constexpr const char* kThreadName = "collectors-th";

    WorkerPool(std::size_t workers, std::size_t backlog);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Throws PoolRejected when the backlog is full or the pool is stopping.
    void submit(Job job);

    std::size_t workers() const { return workers_; }
    std::size_t backlog_capacity() const;
    std::size_t pending() const;

  private:
    struct Shared {
      std::mutex mu;
      std::condition_variable cv;
      std::deque<Job> jobs;
      std::size_t capacity = 0;
      bool stopping = false;
    };

    static void worker_loop(std::shared_ptr<Shared> shared);

    std::shared_ptr<Shared> shared_;
    std::size_t workers_;
};
