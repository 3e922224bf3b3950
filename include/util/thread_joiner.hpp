// Copyright (c) 2025 The Signage Node Developers
// Distributed under the MIT software license

#pragma once

#include <thread>
#include <vector>

namespace signage {
namespace util {

// Joins every joinable thread of a worker vector when it leaves scope.
// Declare it right after the vector, so that a throw while workers are
// still being started never destroys a joinable std::thread.
class ThreadJoiner {
public:
  explicit ThreadJoiner(std::vector<std::thread>& threads) : threads_(threads) {}
  ~ThreadJoiner() { JoinAll(); }

  ThreadJoiner(const ThreadJoiner&) = delete;
  ThreadJoiner& operator=(const ThreadJoiner&) = delete;

  void JoinAll() {
    for (auto& t : threads_) {
      if (t.joinable()) {
        t.join();
      }
    }
  }

private:
  std::vector<std::thread>& threads_;
};

}  // namespace util
}  // namespace signage
