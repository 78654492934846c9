/**
 * @copyright Copyright The HearthKernel Contributors
 */

#ifndef HEARTHKERNEL_SRC_ARCH_ARCH_H_
#define HEARTHKERNEL_SRC_ARCH_ARCH_H_

#include <cpu_io.h>

#include <cstddef>
#include <cstdint>

struct BootInfo;

/**
 * @brief 体系结构相关初始化
 * @param boot_info 引导程序传入的信息
 * @pre 引导程序已建立物理内存偏移映射
 * @post 串口、GDT 与 TSS 已初始化
 */
void ArchInit(const BootInfo& boot_info);

/**
 * @brief 体系结构相关中断初始化
 * @pre ArchInit 已完成
 * @post 中断控制器已重映射，中断描述符表已加载，中断已开启
 */
void InterruptInit();

/// @name 中断开关
/// @{
void EnableInterrupt();
void DisableInterrupt();
[[nodiscard]] auto GetInterruptStatus() -> bool;
/// @}

/**
 * @brief 以 sti; hlt 原子地开中断并停机
 * @note sti 的生效延迟到下一条指令之后，两条指令之间不会响应中断
 */
void EnableInterruptAndHalt();

/**
 * @brief 关中断后循环 hlt，不再返回
 */
[[noreturn]] void HaltLoop();

/**
 * @brief 加载全局描述符表并重新加载段寄存器与 TR
 * @param gdtr 描述符表寄存器值
 * @param code_selector CS 使用的选择子
 * @param data_selector DS/ES/FS/GS/SS 使用的选择子
 * @param tss_selector TSS 选择子
 */
void LoadGlobalDescriptorTable(
    cpu_io::detail::register_info::GdtrInfo::Gdtr gdtr, uint16_t code_selector,
    uint16_t data_selector, uint16_t tss_selector);

/**
 * @brief 加载中断描述符表
 * @param idtr 描述符表寄存器值
 */
void LoadInterruptTable(cpu_io::detail::register_info::IdtrInfo::Idtr idtr);

/**
 * @brief 使虚拟页的 TLB 项失效
 * @param virtual_addr 页内任意虚拟地址
 * @note 内核镜像中由 cpu_io 整体刷新 TLB
 */
void FlushTlbPage(uint64_t virtual_addr);

/**
 * @brief 读取当前四级页表的物理地址 (CR3)
 */
[[nodiscard]] auto ReadPageTableRoot() -> uint64_t;

/**
 * @brief 读取最近一次缺页的线性地址 (CR2)
 */
[[nodiscard]] auto ReadFaultAddress() -> uint64_t;

/**
 * @brief 切换到新栈并调用 entry(arg)，entry 不得返回
 * @param stack_top 新栈顶，16 字节对齐
 * @param entry 入口函数
 * @param arg 参数
 */
[[noreturn]] void SwitchStack(uint64_t stack_top, void (*entry)(void*),
                              void* arg);

/// isa-debug-exit 退出状态，QEMU 进程退出码为 (status << 1) | 1
enum class QemuExitCode : uint32_t {
  kSuccess = 0x10,
  kFailed = 0x11,
};

/**
 * @brief 通过 0xf4 端口退出 QEMU，仅测试使用
 * @param exit_code 退出状态
 */
void ExitQemu(QemuExitCode exit_code);

/// 最多回溯 128 层调用栈
static constexpr size_t kMaxFrameCount = 128;

/**
 * @brief 打印调用栈
 * @note 沿 rbp 链回溯，并用内核 ELF 符号表解析函数名
 */
void DumpStack();

#endif /* HEARTHKERNEL_SRC_ARCH_ARCH_H_ */
