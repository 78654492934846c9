/** @copyright Copyright The HearthKernel Contributors */

#ifndef HEARTHKERNEL_SRC_TASK_INCLUDE_TASK_FSM_HPP_
#define HEARTHKERNEL_SRC_TASK_INCLUDE_TASK_FSM_HPP_

#include <etl/fsm.h>

#include <cstdint>

#include "task_messages.hpp"

/// 任务状态 ID，用作 etl::fsm 的状态 ID
enum TaskStatusId : uint8_t {
  kReady = 0,
  kRunning = 1,
  kSuspended = 2,
  kCompleted = 3,
};

/// 获取状态名
constexpr auto GetTaskStatusName(etl::fsm_state_id_t id) -> const char* {
  switch (id) {
    case TaskStatusId::kReady:
      return "Ready";
    case TaskStatusId::kRunning:
      return "Running";
    case TaskStatusId::kSuspended:
      return "Suspended";
    case TaskStatusId::kCompleted:
      return "Completed";
    default:
      return "Unknown";
  }
}

/// 状态：Ready，等待执行器轮询
struct StateReady
    : public etl::fsm_state<etl::fsm, StateReady, TaskStatusId::kReady,
                            MsgPoll> {
  auto on_event(const MsgPoll&) -> etl::fsm_state_id_t;
  auto on_event_unknown(const etl::imessage& msg) -> etl::fsm_state_id_t;
};

/// 状态：Running，正在被轮询
struct StateRunning
    : public etl::fsm_state<etl::fsm, StateRunning, TaskStatusId::kRunning,
                            MsgPending, MsgComplete> {
  auto on_event(const MsgPending&) -> etl::fsm_state_id_t;
  auto on_event(const MsgComplete&) -> etl::fsm_state_id_t;
  auto on_event_unknown(const etl::imessage& msg) -> etl::fsm_state_id_t;
};

/// 状态：Suspended，等待 Waker
struct StateSuspended
    : public etl::fsm_state<etl::fsm, StateSuspended, TaskStatusId::kSuspended,
                            MsgWake> {
  auto on_event(const MsgWake&) -> etl::fsm_state_id_t;
  auto on_event_unknown(const etl::imessage& msg) -> etl::fsm_state_id_t;
};

/// 状态：Completed，终态
struct StateCompleted
    : public etl::fsm_state<etl::fsm, StateCompleted, TaskStatusId::kCompleted> {
  auto on_event_unknown(const etl::imessage& msg) -> etl::fsm_state_id_t;
};

class TaskFsm {
 public:
  /// @name 构造/析构函数
  /// @{
  TaskFsm();
  TaskFsm(const TaskFsm&) = delete;
  TaskFsm(TaskFsm&&) = delete;
  auto operator=(const TaskFsm&) -> TaskFsm& = delete;
  auto operator=(TaskFsm&&) -> TaskFsm& = delete;
  ~TaskFsm() = default;
  /// @}

  /// 启动 FSM，进入 Ready
  void Start();

  /// 向 FSM 发送消息
  void Receive(const etl::imessage& msg);

  /// 获取当前状态 ID
  [[nodiscard]] auto GetStateId() const -> etl::fsm_state_id_t;

 private:
  static constexpr size_t kStateCount = 4;

  StateReady state_ready_;
  StateRunning state_running_;
  StateSuspended state_suspended_;
  StateCompleted state_completed_;

  etl::ifsm_state* state_list_[kStateCount];

  etl::fsm fsm_;
};

#endif  // HEARTHKERNEL_SRC_TASK_INCLUDE_TASK_FSM_HPP_
