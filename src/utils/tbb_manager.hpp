#ifndef HAUL_UTILS_TBB_MANAGER_HPP_
#define HAUL_UTILS_TBB_MANAGER_HPP_

#include <tbb/blocked_range.h>
#include <tbb/global_control.h>
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>

#include "utils/flags.hpp"
#include "utils/logger.hpp"

namespace haul {
namespace utils {

struct TBBState {
  bool initialized = false;
  int concurrency = 0;
  std::shared_ptr<tbb::task_arena> arena;
};

/**
 * @brief 按名称管理 TBB arena
 *
 * Each named arena gets its concurrency from --custom_tbb_parallel_control
 * ("name:N,..."), else from the caller's fallback, else from TBB's default.
 * Transfers block on sockets, so the download arena is sized to the
 * transfer limit rather than the core count.
 */
class TBBManager {
 public:
  static TBBManager& GetInstance();

  std::shared_ptr<tbb::task_arena> Init(const std::string& tbb_name,
                                        int fallback_concurrency = 0);

  // Runs task(i) for i in [start, end). Exceptions escaping a task are
  // logged; callers that need per-item outcomes must catch inside the task.
  template <typename IntType, typename Func>
  void ParallelFor(const std::string& tbb_name, IntType start, IntType end,
                   const Func& task, int fallback_concurrency = 0);

  int Concurrency(const std::string& tbb_name) const;

  void Release();
  ~TBBManager();

  static std::map<std::string, int> ParseParallelControl(
      const std::string& control);
  static std::map<std::string, int>& GetTBBParallelCountDefines();

 private:
  TBBManager() = default;
  TBBManager(const TBBManager&) = delete;
  TBBManager& operator=(const TBBManager&) = delete;

  uint64_t GenerateUniqueTaskId() const;

  std::unordered_map<std::string, TBBState> task_arenas_;
  // 阻塞型任务需要超过核数的 worker
  std::unique_ptr<tbb::global_control> parallelism_;
  mutable std::mutex arenas_mutex_;
};

// 模板实现
template <typename IntType, typename Func>
void TBBManager::ParallelFor(const std::string& tbb_name, IntType start,
                             IntType end, const Func& task,
                             int fallback_concurrency) {
  if (start >= end) return;
  uint64_t task_id = GenerateUniqueTaskId();
  std::string unique_task_name = tbb_name + "_" + std::to_string(task_id);

  auto arena = Init(tbb_name, fallback_concurrency);

  LOG(DEBUG) << "[TBBManager] ParallelFor start: " << unique_task_name << " ["
             << start << "," << end << ")";
  arena->execute([&task, &unique_task_name, start, end]() {
    // grainsize 1: every item is a whole transfer
    tbb::parallel_for(
        tbb::blocked_range<IntType>(start, end, 1),
        [&task, &unique_task_name](const tbb::blocked_range<IntType>& range) {
          for (IntType i = range.begin(); i < range.end(); ++i) {
            try {
              task(i);
            } catch (const std::exception& e) {
              LOG(ERROR) << "[TBBManager] Exception in " << unique_task_name
                         << " item " << i << ": " << e.what();
            }
          }
        });
  });
  LOG(DEBUG) << "[TBBManager] ParallelFor end: " << unique_task_name;
}

}  // namespace utils
}  // namespace haul

#endif  // HAUL_UTILS_TBB_MANAGER_HPP_
