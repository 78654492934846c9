/**
 * @copyright Copyright The HearthKernel Contributors
 */

#ifndef HEARTHKERNEL_SRC_TASK_INCLUDE_TASK_MESSAGES_HPP_
#define HEARTHKERNEL_SRC_TASK_INCLUDE_TASK_MESSAGES_HPP_

#include <etl/message.h>

/// Task FSM 消息 ID
namespace task_msg_id {
static constexpr etl::message_id_t kPoll = 1;
static constexpr etl::message_id_t kPending = 2;
static constexpr etl::message_id_t kComplete = 3;
static constexpr etl::message_id_t kWake = 4;
}  // namespace task_msg_id

/// 消息路由 ID
namespace router_id {
static constexpr etl::message_router_id_t kTaskFsm = 1;
}  // namespace router_id

/// Task FSM 消息结构体（无负载，用作事件）
struct MsgPoll : public etl::message<task_msg_id::kPoll> {};
struct MsgPending : public etl::message<task_msg_id::kPending> {};
struct MsgComplete : public etl::message<task_msg_id::kComplete> {};
struct MsgWake : public etl::message<task_msg_id::kWake> {};

#endif  // HEARTHKERNEL_SRC_TASK_INCLUDE_TASK_MESSAGES_HPP_
