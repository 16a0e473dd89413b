/**
 * @file encode_queue.cpp
 * @brief Encoder worker pool implementation
 */

#include "img2reel/encode_queue.hpp"

#include <exception>
#include <utility>

#include "img2reel/logging.hpp"

namespace img2reel {

EncodeQueue::EncodeQueue(Encoder &encoder, int workers) : encoder_(encoder) {
  if (workers < 1)
    workers = 1;
  threads_.reserve(workers);
  for (int i = 0; i < workers; ++i) {
    threads_.emplace_back(&EncodeQueue::worker_loop, this);
  }
}

EncodeQueue::~EncodeQueue() { shutdown(); }

std::future<EncodeOutcome> EncodeQueue::submit(EncodeJob job) {
  Item item;
  item.job = std::move(job);
  std::future<EncodeOutcome> future = item.promise.get_future();

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!done_.load()) {
      items_.push(std::move(item));
      cv_.notify_one();
      return future;
    }
  }

  EncodeOutcome rejected;
  rejected.error = "encoder is shutting down";
  item.promise.set_value(rejected);
  return future;
}

bool EncodeQueue::pop(Item &item) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this] { return !items_.empty() || done_.load(); });

  if (items_.empty()) {
    return false;
  }

  item = std::move(items_.front());
  items_.pop();
  return true;
}

void EncodeQueue::worker_loop() {
  Item item;
  while (pop(item)) {
    try {
      item.promise.set_value(encoder_.run(item.job));
    } catch (const std::exception &e) {
      LOG_ERROR("{} Encoder threw: {}", item.job.tag, e.what());
      item.promise.set_exception(std::current_exception());
    }
  }
}

void EncodeQueue::shutdown() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    done_.store(true);
  }
  cv_.notify_all();

  for (auto &t : threads_) {
    if (t.joinable())
      t.join();
  }
}

size_t EncodeQueue::pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return items_.size();
}

} // namespace img2reel
