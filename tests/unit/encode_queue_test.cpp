#include <cassert>
#include <future>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "img2reel/encode_queue.hpp"
#include "test_support.hpp"

namespace {

using img2reel::EncodeJob;
using img2reel::EncodeOutcome;
using img2reel::EncodeQueue;
using img2reel_test::FakeEncoder;
using img2reel_test::ScratchDir;

EncodeJob JobWritingTo(const std::string& path) {
  EncodeJob job;
  job.inputs      = {"unused.png"};
  job.output_path = path;
  job.tag         = "[Req test]";
  return job;
}

class ThrowingEncoder : public img2reel::Encoder {
 public:
  EncodeOutcome run(const EncodeJob&) override { throw std::runtime_error("boom"); }
};

void TestWorkerCountBoundsConcurrency() {
  ScratchDir  dir("queue-bound");
  FakeEncoder encoder;
  encoder.delay_ms = 50;

  EncodeQueue queue(encoder, 2);
  assert(queue.workers() == 2);

  std::vector<std::future<EncodeOutcome>> futures;
  for (int i = 0; i < 6; ++i) {
    futures.push_back(queue.submit(JobWritingTo((dir / ("clip" + std::to_string(i) + ".mp4")).string())));
  }
  for (auto& f : futures) {
    assert(f.get().ok);
  }

  assert(encoder.job_count() == 6);
  assert(encoder.max_active() <= 2);
}

void TestFailuresArePropagated() {
  ScratchDir  dir("queue-fail");
  FakeEncoder encoder;
  encoder.fail_message = "Invalid data found when processing input";

  EncodeQueue   queue(encoder, 1);
  EncodeOutcome outcome = queue.submit(JobWritingTo((dir / "x.mp4").string())).get();
  assert(!outcome.ok);
  assert(outcome.error == "Invalid data found when processing input");
}

void TestEncoderExceptionReachesFuture() {
  ThrowingEncoder encoder;
  EncodeQueue     queue(encoder, 1);
  auto            future = queue.submit(JobWritingTo("/nonexistent/x.mp4"));

  bool threw = false;
  try {
    future.get();
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()) == "boom";
  }
  assert(threw);
}

void TestSubmitAfterShutdownFailsFast() {
  FakeEncoder encoder;
  EncodeQueue queue(encoder, 1);
  queue.shutdown();

  EncodeOutcome outcome = queue.submit(JobWritingTo("/nonexistent/x.mp4")).get();
  assert(!outcome.ok);
  assert(outcome.error.find("shutting down") != std::string::npos);
  assert(encoder.job_count() == 0);

  queue.shutdown();
}

void TestShutdownDrainsQueuedJobs() {
  ScratchDir  dir("queue-drain");
  FakeEncoder encoder;
  encoder.delay_ms = 20;

  std::vector<std::future<EncodeOutcome>> futures;
  {
    EncodeQueue queue(encoder, 1);
    for (int i = 0; i < 3; ++i) {
      futures.push_back(queue.submit(JobWritingTo((dir / ("d" + std::to_string(i) + ".mp4")).string())));
    }
  }
  for (auto& f : futures) {
    assert(f.get().ok);
  }
  assert(encoder.job_count() == 3);
}

}  // namespace

int main() {
  TestWorkerCountBoundsConcurrency();
  TestFailuresArePropagated();
  TestEncoderExceptionReachesFuture();
  TestSubmitAfterShutdownFailsFast();
  TestShutdownDrainsQueuedJobs();

  std::cout << "img2reel_unit_encode_queue: pass\n";
  return 0;
}
