/**
 * @copyright Copyright The HearthKernel Contributors
 */

#ifndef HEARTHKERNEL_SRC_INCLUDE_EXPECTED_HPP_
#define HEARTHKERNEL_SRC_INCLUDE_EXPECTED_HPP_

#include <cstdint>
#include <expected>

/// 内核错误码
enum class ErrorCode : uint64_t {
  kSuccess = 0,
  // ELF 相关错误 (0x100 - 0x1FF)
  kElfInvalidAddress = 0x100,
  kElfInvalidMagic = 0x101,
  kElfUnsupported32Bit = 0x102,
  kElfInvalidClass = 0x103,
  kElfSymtabNotFound = 0x104,
  kElfStrtabNotFound = 0x105,
  kElfInvalidEndianness = 0x106,
  kElfInvalidType = 0x107,
  kElfInvalidMachine = 0x108,
  kElfInvalidVersion = 0x109,
  kElfInvalidEntrySize = 0x10A,
  kElfInvalidSegmentType = 0x10B,
  kElfInvalidSegmentFlags = 0x10C,
  kElfInvalidSegmentAlignment = 0x10D,
  kElfDuplicatePhdrSegment = 0x10E,
  kElfSegmentOutOfBounds = 0x10F,
  kElfInvalidSectionType = 0x110,
  kElfSectionOutOfBounds = 0x111,
  kElfInvalidSectionIndex = 0x112,
  kElfInvalidStringIndex = 0x113,
  // 页表相关错误 (0x400 - 0x4FF)
  kVmAlreadyMapped = 0x400,
  kVmFrameAllocationFailed = 0x401,
  kVmHugePage = 0x402,
  kVmPageNotMapped = 0x403,
  kVmInvalidAddress = 0x404,
  // 堆相关错误 (0x500 - 0x5FF)
  kHeapAlreadyInitialized = 0x500,
  kHeapInvalidRegion = 0x501,
  // 中断相关错误 (0x600 - 0x6FF)
  kIdtLocked = 0x600,
  kIdtMissingStack = 0x601,
  kIdtInvalidStackIndex = 0x602,
  kPicInvalidOffset = 0x603,
  // 任务相关错误 (0x700 - 0x7FF)
  kTaskTableFull = 0x700,
  kTaskInvalid = 0x701,
  // 通用错误 (0xF00 - 0xFFF)
  kInvalidArgument = 0xF00,
  kOutOfMemory = 0xF01,
  kAlreadyInitialized = 0xF02,
};

/// 获取错误码对应的错误信息
constexpr auto GetErrorMessage(ErrorCode code) -> const char* {
  switch (code) {
    case ErrorCode::kSuccess:
      return "Success";
    case ErrorCode::kElfInvalidAddress:
      return "Invalid ELF address";
    case ErrorCode::kElfInvalidMagic:
      return "Invalid ELF magic number";
    case ErrorCode::kElfUnsupported32Bit:
      return "32-bit ELF not supported";
    case ErrorCode::kElfInvalidClass:
      return "Invalid ELF class";
    case ErrorCode::kElfSymtabNotFound:
      return ".symtab section not found";
    case ErrorCode::kElfStrtabNotFound:
      return ".strtab section not found";
    case ErrorCode::kElfInvalidEndianness:
      return "ELF is not little-endian";
    case ErrorCode::kElfInvalidType:
      return "Invalid ELF file type";
    case ErrorCode::kElfInvalidMachine:
      return "ELF machine is not x86_64";
    case ErrorCode::kElfInvalidVersion:
      return "Invalid ELF version";
    case ErrorCode::kElfInvalidEntrySize:
      return "Invalid ELF table entry size";
    case ErrorCode::kElfInvalidSegmentType:
      return "Invalid program header type";
    case ErrorCode::kElfInvalidSegmentFlags:
      return "Invalid program header flags";
    case ErrorCode::kElfInvalidSegmentAlignment:
      return "Invalid program header alignment";
    case ErrorCode::kElfDuplicatePhdrSegment:
      return "Multiple PT_PHDR program headers";
    case ErrorCode::kElfSegmentOutOfBounds:
      return "Program header outside ELF image";
    case ErrorCode::kElfInvalidSectionType:
      return "Invalid section header type";
    case ErrorCode::kElfSectionOutOfBounds:
      return "Section outside ELF image";
    case ErrorCode::kElfInvalidSectionIndex:
      return "Invalid section name table index";
    case ErrorCode::kElfInvalidStringIndex:
      return "String offset outside string table";
    case ErrorCode::kVmAlreadyMapped:
      return "Page already mapped";
    case ErrorCode::kVmFrameAllocationFailed:
      return "Frame allocation failed";
    case ErrorCode::kVmHugePage:
      return "Parent entry maps a huge page";
    case ErrorCode::kVmPageNotMapped:
      return "Page not mapped";
    case ErrorCode::kVmInvalidAddress:
      return "Invalid virtual address";
    case ErrorCode::kHeapAlreadyInitialized:
      return "Heap already initialized";
    case ErrorCode::kHeapInvalidRegion:
      return "Invalid heap region";
    case ErrorCode::kIdtLocked:
      return "Interrupt table already loaded";
    case ErrorCode::kIdtMissingStack:
      return "Double fault gate requires an interrupt stack";
    case ErrorCode::kIdtInvalidStackIndex:
      return "Invalid interrupt stack index";
    case ErrorCode::kPicInvalidOffset:
      return "Invalid PIC vector offset";
    case ErrorCode::kTaskTableFull:
      return "Task table full";
    case ErrorCode::kTaskInvalid:
      return "Invalid task";
    case ErrorCode::kInvalidArgument:
      return "Invalid argument";
    case ErrorCode::kOutOfMemory:
      return "Out of memory";
    case ErrorCode::kAlreadyInitialized:
      return "Already initialized";
    default:
      return "Unknown error";
  }
}

/// 错误类型，用于 std::expected
struct Error {
  ErrorCode code;

  constexpr Error(ErrorCode c) : code(c) {}

  [[nodiscard]] constexpr auto message() const -> const char* {
    return GetErrorMessage(code);
  }
};

/// std::expected 别名模板
template <typename T>
using Expected = std::expected<T, Error>;

#endif /* HEARTHKERNEL_SRC_INCLUDE_EXPECTED_HPP_ */
