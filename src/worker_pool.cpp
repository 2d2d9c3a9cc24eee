// worker_pool.cpp
#include "worker_pool.hpp"
#include <pthread.h>
#include <cstring>
#include <thread>
#include <utility>

#include <spdlog/spdlog.h>

void name_current_thread(const char* name) {
  int rc = pthread_setname_np(pthread_self(), name);
  if (rc != 0) spdlog::warn("Cannot name thread {}: {}", name, std::strerror(rc));
}

WorkerPool::WorkerPool(std::size_t workers, std::size_t backlog)
    : shared_(std::make_shared<Shared>()), workers_(workers) {
  if (workers == 0) throw std::invalid_argument("worker pool needs at least one thread");
  if (backlog == 0) throw std::invalid_argument("worker pool backlog must be positive");
  shared_->capacity = backlog;

  for (std::size_t i = 0; i < workers; ++i) {
    std::thread(worker_loop, shared_).detach();
  }
}

WorkerPool::~WorkerPool() {
  {
    std::lock_guard<std::mutex> lk(shared_->mu);
    shared_->stopping = true;
    shared_->jobs.clear();
  }
  shared_->cv.notify_all();
}

void WorkerPool::submit(Job job) {
  {
    std::lock_guard<std::mutex> lk(shared_->mu);
    if (shared_->stopping) throw PoolRejected("worker pool is shutting down");
    if (shared_->jobs.size() >= shared_->capacity)
      throw PoolRejected("worker pool backlog full (" + std::to_string(shared_->capacity) + ")");
    shared_->jobs.push_back(std::move(job));
  }
  shared_->cv.notify_one();
}

std::size_t WorkerPool::backlog_capacity() const {
  std::lock_guard<std::mutex> lk(shared_->mu);
  return shared_->capacity;
}

std::size_t WorkerPool::pending() const {
  std::lock_guard<std::mutex> lk(shared_->mu);
  return shared_->jobs.size();
}

void WorkerPool::worker_loop(std::shared_ptr<Shared> shared) {
  name_current_thread(kThreadName);
  for (;;) {
    Job job;
    {
      std::unique_lock<std::mutex> lk(shared->mu);
      shared->cv.wait(lk, [&] { return shared->stopping || !shared->jobs.empty(); });
      if (shared->stopping) return;
      job = std::move(shared->jobs.front());
      shared->jobs.pop_front();
    }
    job();
  }
}
