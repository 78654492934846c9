/**
 * @copyright Copyright The HearthKernel Contributors
 * @brief 内核头文件
 */

#ifndef HEARTHKERNEL_SRC_INCLUDE_KERNEL_H_
#define HEARTHKERNEL_SRC_INCLUDE_KERNEL_H_

#include <cstdint>

#include "boot_info.hpp"
#include "expected.hpp"
#include "panic_observer.hpp"

/**
 * @brief 内核入口，由引导程序跳转
 * @param boot_info 引导信息，引导程序保证其在内核生命周期内有效
 */
extern "C" [[maybe_unused]] [[noreturn]] void _start(
    const BootInfo* boot_info);

/**
 * @brief 内存初始化：建立页表访问、映射堆与内核栈
 * @param boot_info 引导信息
 * @return Expected<void> 任一映射失败时返回错误
 * @post 堆可用，operator new 可用
 */
auto MemoryInit(const BootInfo& boot_info) -> Expected<void>;

/**
 * @brief 切换到带保护页的内核栈后调用 entry
 * @param entry 新栈上的入口
 * @param arg 参数
 * @pre MemoryInit 已完成
 */
[[noreturn]] void RunOnKernelStack(void (*entry)(void*), void* arg);

/**
 * @brief 报告致命错误并停机
 * @param event 错误信息
 * @note 依次输出报告、调用栈，通知 panic 观察者，最后关中断停机
 */
[[noreturn]] void Panic(const PanicEvent& event);

/**
 * @brief 以 kExplicit 类型报告致命错误
 * @param reason 原因
 */
[[noreturn]] void Panic(const char* reason);

#endif /* HEARTHKERNEL_SRC_INCLUDE_KERNEL_H_ */
