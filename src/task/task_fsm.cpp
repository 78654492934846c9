/**
 * @copyright Copyright The HearthKernel Contributors
 * @brief Task FSM implementation, etl::fsm state transition bodies
 */

#include "task_fsm.hpp"

#include "kernel_log.hpp"

// ─── StateReady ──────────────────────────────────────────────────────────────

auto StateReady::on_event(const MsgPoll& /*msg*/) -> etl::fsm_state_id_t {
  return TaskStatusId::kRunning;
}

auto StateReady::on_event_unknown(const etl::imessage& msg)
    -> etl::fsm_state_id_t {
  klog::Warn("TaskFsm: Ready received unexpected message id=%d\n",
             static_cast<int>(msg.get_message_id()));
  return STATE_ID;
}

// ─── StateRunning ────────────────────────────────────────────────────────────

auto StateRunning::on_event(const MsgPending& /*msg*/) -> etl::fsm_state_id_t {
  return TaskStatusId::kSuspended;
}

auto StateRunning::on_event(const MsgComplete& /*msg*/) -> etl::fsm_state_id_t {
  return TaskStatusId::kCompleted;
}

auto StateRunning::on_event_unknown(const etl::imessage& msg)
    -> etl::fsm_state_id_t {
  klog::Warn("TaskFsm: Running received unexpected message id=%d\n",
             static_cast<int>(msg.get_message_id()));
  return STATE_ID;
}

// ─── StateSuspended ──────────────────────────────────────────────────────────

auto StateSuspended::on_event(const MsgWake& /*msg*/) -> etl::fsm_state_id_t {
  return TaskStatusId::kReady;
}

auto StateSuspended::on_event_unknown(const etl::imessage& msg)
    -> etl::fsm_state_id_t {
  klog::Warn("TaskFsm: Suspended received unexpected message id=%d\n",
             static_cast<int>(msg.get_message_id()));
  return STATE_ID;
}

// ─── StateCompleted ──────────────────────────────────────────────────────────

auto StateCompleted::on_event_unknown(const etl::imessage& msg)
    -> etl::fsm_state_id_t {
  klog::Warn("TaskFsm: Completed received unexpected message id=%d\n",
             static_cast<int>(msg.get_message_id()));
  return STATE_ID;
}

// ─── TaskFsm ─────────────────────────────────────────────────────────────────

TaskFsm::TaskFsm() : fsm_(router_id::kTaskFsm) {
  state_list_[TaskStatusId::kReady] = &state_ready_;
  state_list_[TaskStatusId::kRunning] = &state_running_;
  state_list_[TaskStatusId::kSuspended] = &state_suspended_;
  state_list_[TaskStatusId::kCompleted] = &state_completed_;
  fsm_.set_states(state_list_, kStateCount);
}

void TaskFsm::Start() { fsm_.start(); }

void TaskFsm::Receive(const etl::imessage& msg) { fsm_.receive(msg); }

auto TaskFsm::GetStateId() const -> etl::fsm_state_id_t {
  return fsm_.get_state_id();
}
