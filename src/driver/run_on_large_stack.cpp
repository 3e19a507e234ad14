/***
 * Name: proofc::driver::RunOnLargeStack
 * Purpose: Run the driver body on a worker thread with an explicit stack size.
 * Inputs: stack_size (bytes), body
 * Outputs: body's return value; exceptions from body are rethrown on the caller
 * Theory of Operation: POSIX threads, since std::thread cannot set a stack size.
 *   The caller blocks in pthread_join for the whole run.
 */
#include "proofc/driver/app.h"

#include <cstddef>
#include <cstring>
#include <exception>
#include <functional>
#include <string>

#include <pthread.h>

#include "proofc/exceptions/backend_error.h"
#include "proofc/exceptions/config_error.h"

namespace proofc::driver {

namespace {

struct StackTask {
  const std::function<int()>* body{nullptr};
  int result{0};
  std::exception_ptr error;
};

auto ThreadEntry(void* arg) -> void* {
  auto* task = static_cast<StackTask*>(arg);
  try {
    task->result = (*task->body)();
  } catch (...) {
    task->error = std::current_exception();  // rethrown by the joining thread
  }
  return nullptr;
}

}  // namespace

auto RunOnLargeStack(std::size_t stack_size, const std::function<int()>& body) -> int {
  StackTask task;
  task.body = &body;

  pthread_attr_t attr;
  int rc = pthread_attr_init(&attr);
  if (rc != 0) {
    throw exceptions::BackendError(std::string("pthread_attr_init failed: ") + std::strerror(rc));
  }
  rc = pthread_attr_setstacksize(&attr, stack_size);
  if (rc != 0) {
    pthread_attr_destroy(&attr);
    throw exceptions::ConfigError("invalid worker stack size " + std::to_string(stack_size) + ": " +
                                  std::strerror(rc));
  }
  pthread_t thread;
  rc = pthread_create(&thread, &attr, &ThreadEntry, &task);
  pthread_attr_destroy(&attr);
  if (rc != 0) {
    throw exceptions::BackendError(std::string("failed to create worker thread: ") + std::strerror(rc));
  }
  rc = pthread_join(thread, nullptr);
  if (rc != 0) {
    throw exceptions::BackendError(std::string("failed to join worker thread: ") + std::strerror(rc));
  }
  if (task.error) {
    std::rethrow_exception(task.error);
  }
  return task.result;
}

}  // namespace proofc::driver
