#pragma once
#include <chrono>
#include <functional>
#include <string>

namespace sentinel::util {

// Fire-and-forget unit of work on its own detached thread.
//
// What a caller does NOT get:
//  - no join, no completion signal, no result;
//  - no cancellation: a task keeps running after its spawner moves on;
//  - no shutdown guarantee: tasks still in flight at process exit are cut off;
//  - no ordering between tasks spawned back to back.
// An exception escaping the work is reported on stderr and dropped.
class DetachedTask {
public:
  // Returns false if the thread could not be created (work is dropped).
  static bool spawn(std::string label, std::function<void()> work);

  // Tasks started and not yet returned.
  [[nodiscard]] static int in_flight();

  // Blocks until in_flight() is 0 or limit passes; true when idle. Lets
  // process teardown wait for tasks that use process-wide state.
  static bool wait_idle(std::chrono::milliseconds limit);
};

} // namespace sentinel::util
