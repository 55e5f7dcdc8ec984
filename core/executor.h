/**************************************************************************/
/*                                                                        */
/*                   zlink - terminal file transfer engine                */
/*             Copyright (C)2025-2026, zlink developers                   */
/*                                                                        */
/*    Licensed  under the  Apache License, Version  2.0 (the "License");  */
/*    you may not use this  file  except in compliance with the License.  */
/*    You may obtain a copy of the License at                             */
/*                                                                        */
/*                http://www.apache.org/licenses/LICENSE-2.0              */
/*                                                                        */
/*    Unless  required  by  applicable  law  or agreed to  in  writing,   */
/*    software  distributed  under  the  License  is  distributed on an   */
/*    "AS IS"  BASIS, WITHOUT  WARRANTIES  OR  CONDITIONS OF ANY  KIND,   */
/*    either  express  or implied.  See  the  License for  the specific   */
/*    language governing permissions and limitations under the License.   */
/**************************************************************************/
#ifndef INCLUDED_ZLINK_CORE_EXECUTOR_H
#define INCLUDED_ZLINK_CORE_EXECUTOR_H

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace zlink::core {

/**
 * Runs posted tasks in the order they were posted. Implementations decide
 * on which thread the tasks run.
 */
class Executor {
public:
  using task_t = std::function<void()>;

  Executor() = default;
  Executor(const Executor&) = delete;
  Executor& operator=(const Executor&) = delete;
  virtual ~Executor() = default;

  virtual void Post(task_t task) = 0;
  /** Blocks until every task posted before this call has run. */
  virtual void Flush() = 0;
};

/** Runs each task immediately on the posting thread. */
class InlineExecutor final : public Executor {
public:
  InlineExecutor() = default;
  ~InlineExecutor() override = default;
  void Post(task_t task) override;
  void Flush() override {}
};

/**
 * Runs tasks on one dedicated worker thread. The destructor runs any tasks
 * still queued and then joins the worker.
 */
class ThreadExecutor final : public Executor {
public:
  explicit ThreadExecutor(std::string name);
  ~ThreadExecutor() override;
  void Post(task_t task) override;
  void Flush() override;
  [[nodiscard]] bool on_worker_thread() const noexcept;

private:
  void WorkerProc();

  const std::string name_;
  std::mutex mu_;
  std::condition_variable cv_;
  std::condition_variable idle_cv_;
  std::deque<task_t> tasks_;
  bool running_task_{false};
  bool stop_{false};
  std::thread worker_;
};

} // namespace zlink::core

#endif // INCLUDED_ZLINK_CORE_EXECUTOR_H
