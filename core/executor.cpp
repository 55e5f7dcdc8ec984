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
#include "core/executor.h"

#include "core/log.h"
#include <exception>
#include <utility>

namespace zlink::core {

static void RunTask(const Executor::task_t& task, const std::string& name) {
  try {
    task();
  } catch (const std::exception& e) {
    LOG(ERROR) << "Executor '" << name << "': task threw: " << e.what();
  }
}

void InlineExecutor::Post(task_t task) { RunTask(task, "inline"); }

ThreadExecutor::ThreadExecutor(std::string name) : name_(std::move(name)) {
  worker_ = std::thread(&ThreadExecutor::WorkerProc, this);
}

ThreadExecutor::~ThreadExecutor() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    stop_ = true;
  }
  cv_.notify_all();
  if (worker_.joinable()) {
    worker_.join();
  }
}

void ThreadExecutor::Post(task_t task) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (stop_) {
      LOG(WARNING) << "Executor '" << name_ << "' is stopping; dropping task.";
      return;
    }
    tasks_.emplace_back(std::move(task));
  }
  cv_.notify_one();
}

void ThreadExecutor::Flush() {
  if (on_worker_thread()) {
    // A task waiting on its own queue would never return.
    return;
  }
  std::unique_lock<std::mutex> lock(mu_);
  idle_cv_.wait(lock, [this] { return tasks_.empty() && !running_task_; });
}

bool ThreadExecutor::on_worker_thread() const noexcept {
  return std::this_thread::get_id() == worker_.get_id();
}

void ThreadExecutor::WorkerProc() {
  VLOG(2) << "Executor '" << name_ << "' started.";
  for (;;) {
    task_t task;
    {
      std::unique_lock<std::mutex> lock(mu_);
      cv_.wait(lock, [this] { return stop_ || !tasks_.empty(); });
      if (tasks_.empty()) {
        // stop_ is set and nothing is left to run.
        break;
      }
      task = std::move(tasks_.front());
      tasks_.pop_front();
      running_task_ = true;
    }
    RunTask(task, name_);
    {
      std::lock_guard<std::mutex> lock(mu_);
      running_task_ = false;
    }
    idle_cv_.notify_all();
  }
  idle_cv_.notify_all();
  VLOG(2) << "Executor '" << name_ << "' stopped.";
}

} // namespace zlink::core
