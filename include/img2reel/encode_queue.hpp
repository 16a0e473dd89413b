/**
 * @file encode_queue.hpp
 * @brief Bounded pool of encoder workers
 *
 * @details Request threads submit jobs and wait on a future; a fixed number
 *          of workers pop jobs and run them through the Encoder, so at most
 *          that many encoder processes exist at once regardless of how many
 *          requests are in flight.
 */

#ifndef IMG2REEL_ENCODE_QUEUE_HPP
#define IMG2REEL_ENCODE_QUEUE_HPP

#include <atomic>
#include <condition_variable>
#include <future>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

#include "encoder.hpp"

namespace img2reel {

/**
 * @class EncodeQueue
 * @brief Thread-safe job queue with its own worker threads.
 *
 * @attention USAGE:
 *
 *   - Construct with the encoder and worker count
 *
 *   - Request threads call submit() and wait on the future
 *
 *   - shutdown() (or the destructor) drains queued jobs and joins workers
 */
class EncodeQueue {
public:
  EncodeQueue(Encoder &encoder, int workers);
  ~EncodeQueue();

  EncodeQueue(const EncodeQueue &) = delete;
  EncodeQueue &operator=(const EncodeQueue &) = delete;

  /**
   * @brief Queue a job.
   * @return Future fulfilled when a worker has run the job. After shutdown
   *         the future is fulfilled immediately with a failed outcome.
   */
  std::future<EncodeOutcome> submit(EncodeJob job);

  /**
   * @brief Stop accepting jobs, finish queued ones and join the workers.
   */
  void shutdown();

  /// Jobs waiting for a worker
  size_t pending() const;

  int workers() const { return static_cast<int>(threads_.size()); }

private:
  struct Item {
    EncodeJob job;
    std::promise<EncodeOutcome> promise;
  };

  Encoder &encoder_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::queue<Item> items_;
  std::atomic<bool> done_{false};
  std::vector<std::thread> threads_;

  bool pop(Item &item);
  void worker_loop();
};

} // namespace img2reel

#endif // IMG2REEL_ENCODE_QUEUE_HPP
