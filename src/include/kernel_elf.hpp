/**
 * @copyright Copyright The HearthKernel Contributors
 */

#ifndef HEARTHKERNEL_SRC_INCLUDE_KERNEL_ELF_HPP_
#define HEARTHKERNEL_SRC_INCLUDE_KERNEL_ELF_HPP_

#include <elf.h>

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <span>
#include <string_view>

#include "expected.hpp"
#include "kernel_log.hpp"
#include "once.hpp"

/// 符号查找结果
struct SymbolInfo {
  const char* name;
  /// 地址相对函数起始的偏移
  uint64_t offset;
};

/**
 * elf 文件相关
 * @details 校验 ELF 头、程序头表与节头表，之后只保留符号表与字符串表，
 * 用于回溯时给地址命名
 */
class KernelElf {
 public:
  /**
   * 解析内核 elf 镜像
   * @param image 引导程序交给内核的 elf 文件
   * @return Expected<KernelElf> 任一校验失败时返回对应的错误
   *  - kElfInvalidAddress 镜像为空或小于 ELF 头
   *  - kElfInvalidMagic / kElfInvalidClass / kElfUnsupported32Bit 标识错误
   *  - kElfInvalidEndianness / kElfInvalidVersion / kElfInvalidType /
   *    kElfInvalidMachine ELF 头字段错误
   *  - kElfInvalidEntrySize 程序头或节头表项大小不符
   *  - kElfInvalidSegmentType / kElfInvalidSegmentFlags /
   *    kElfInvalidSegmentAlignment / kElfDuplicatePhdrSegment /
   *    kElfSegmentOutOfBounds 程序头错误
   *  - kElfInvalidSectionType / kElfSectionOutOfBounds /
   *    kElfInvalidSectionIndex / kElfInvalidStringIndex 节头或字符串错误
   *  - kElfSymtabNotFound / kElfStrtabNotFound 缺少 .symtab/.strtab
   */
  [[nodiscard]] static auto Parse(std::span<const uint8_t> image)
      -> Expected<KernelElf> {
    KernelElf elf;
    elf.elf_ = image;
    return elf.CheckElfIdentity()
        .and_then([&elf]() { return elf.CheckElfHeader(); })
        .and_then([&elf]() { return elf.CheckProgramHeaders(); })
        .and_then([&elf]() { return elf.ParseSections(); })
        .and_then([&elf]() { return elf.CheckSymbolNames(); })
        .transform([&elf]() { return elf; });
  }

  /// @name 构造/析构函数
  /// @{
  KernelElf() = default;
  KernelElf(const KernelElf&) = default;
  KernelElf(KernelElf&&) = default;
  auto operator=(const KernelElf&) -> KernelElf& = default;
  auto operator=(KernelElf&&) -> KernelElf& = default;
  ~KernelElf() = default;
  /// @}

  /**
   * 查找包含 addr 的函数符号
   * @param addr 代码地址
   * @return std::optional<SymbolInfo> 不在任何函数内时返回空
   */
  [[nodiscard]] auto LookupSymbol(uint64_t addr) const
      -> std::optional<SymbolInfo> {
    for (const auto& sym : symtab_) {
      if (ELF64_ST_TYPE(sym.st_info) != STT_FUNC) {
        continue;
      }
      if (addr >= sym.st_value && addr < sym.st_value + sym.st_size) {
        // st_name 已在 Parse 中校验
        return SymbolInfo{strtab_.data() + sym.st_name, addr - sym.st_value};
      }
    }
    return std::nullopt;
  }

  /// 符号数
  [[nodiscard]] auto SymbolCount() const -> size_t { return symtab_.size(); }

  /**
   * 获取 elf 文件大小
   * @return elf 文件大小
   */
  [[nodiscard]] auto GetElfSize() const -> size_t { return elf_.size(); }

 private:
  /// @name elf 文件相关
  /// @{
  std::span<const uint8_t> elf_;
  std::span<const Elf64_Sym> symtab_;
  std::span<const char> strtab_;
  /// @}

  [[nodiscard]] auto Header() const -> const Elf64_Ehdr& {
    return *reinterpret_cast<const Elf64_Ehdr*>(elf_.data());
  }

  /// [offset, offset + length) 是否落在镜像内
  [[nodiscard]] auto InImage(uint64_t offset, uint64_t length) const -> bool {
    return offset <= elf_.size() && length <= elf_.size() - offset;
  }

  /**
   * 取字符串表中以 NUL 结尾的字符串
   * @return 越界或没有结尾 NUL 时为空
   */
  [[nodiscard]] static auto StringAt(std::span<const char> table,
                                     uint64_t index)
      -> std::optional<std::string_view> {
    if (index >= table.size()) {
      return std::nullopt;
    }
    auto rest = table.subspan(index);
    const auto* end =
        static_cast<const char*>(std::memchr(rest.data(), '\0', rest.size()));
    if (end == nullptr) {
      return std::nullopt;
    }
    return std::string_view(rest.data(), end - rest.data());
  }

  /**
   * 检查 elf 标识
   * @return 成功返回 Expected<void>，失败返回错误
   */
  [[nodiscard]] auto CheckElfIdentity() const -> Expected<void> {
    if (elf_.data() == nullptr || elf_.size() < sizeof(Elf64_Ehdr)) {
      return std::unexpected(Error(ErrorCode::kElfInvalidAddress));
    }
    return CheckElfMagic().and_then([this]() { return CheckElfClass(); });
  }

  /**
   * 检查 ELF magic number
   */
  [[nodiscard]] auto CheckElfMagic() const -> Expected<void> {
    if ((elf_[EI_MAG0] != ELFMAG0) || (elf_[EI_MAG1] != ELFMAG1) ||
        (elf_[EI_MAG2] != ELFMAG2) || (elf_[EI_MAG3] != ELFMAG3)) {
      return std::unexpected(Error(ErrorCode::kElfInvalidMagic));
    }
    return {};
  }

  /**
   * 检查 ELF class (32/64 bit)
   */
  [[nodiscard]] auto CheckElfClass() const -> Expected<void> {
    if (elf_[EI_CLASS] == ELFCLASS32) {
      return std::unexpected(Error(ErrorCode::kElfUnsupported32Bit));
    }
    if (elf_[EI_CLASS] != ELFCLASS64) {
      return std::unexpected(Error(ErrorCode::kElfInvalidClass));
    }
    return {};
  }

  /**
   * 检查字节序、版本、文件类型与机器类型
   * @note 内核只按小端读取，大端文件同样返回 kElfInvalidEndianness
   */
  [[nodiscard]] auto CheckElfHeader() const -> Expected<void> {
    const auto& ehdr = Header();
    if (ehdr.e_ident[EI_DATA] != ELFDATA2LSB) {
      return std::unexpected(Error(ErrorCode::kElfInvalidEndianness));
    }
    if (ehdr.e_ident[EI_VERSION] != EV_CURRENT ||
        ehdr.e_version != EV_CURRENT) {
      return std::unexpected(Error(ErrorCode::kElfInvalidVersion));
    }
    if (ehdr.e_type < ET_REL || ehdr.e_type > ET_CORE) {
      return std::unexpected(Error(ErrorCode::kElfInvalidType));
    }
    if (ehdr.e_machine != EM_X86_64) {
      return std::unexpected(Error(ErrorCode::kElfInvalidMachine));
    }
    return {};
  }

  static constexpr auto IsKnownSegmentType(uint32_t type) -> bool {
    return type <= PT_TLS || (type >= PT_LOOS && type <= PT_HIPROC);
  }

  /**
   * 校验程序头表
   * @note e_phoff 为 0 表示没有程序头表
   */
  [[nodiscard]] auto CheckProgramHeaders() const -> Expected<void> {
    const auto& ehdr = Header();
    if (ehdr.e_phoff == 0 || ehdr.e_phnum == 0) {
      return {};
    }
    if (ehdr.e_phentsize != sizeof(Elf64_Phdr)) {
      return std::unexpected(Error(ErrorCode::kElfInvalidEntrySize));
    }
    if (!InImage(ehdr.e_phoff,
                 static_cast<uint64_t>(ehdr.e_phnum) * sizeof(Elf64_Phdr))) {
      return std::unexpected(Error(ErrorCode::kElfSegmentOutOfBounds));
    }

    std::span<const Elf64_Phdr> phdrs(
        reinterpret_cast<const Elf64_Phdr*>(elf_.data() + ehdr.e_phoff),
        ehdr.e_phnum);
    constexpr uint32_t kKnownFlags = PF_X | PF_W | PF_R | PF_MASKOS |
                                     PF_MASKPROC;
    bool phdr_seen = false;
    for (const auto& phdr : phdrs) {
      if (!IsKnownSegmentType(phdr.p_type)) {
        return std::unexpected(Error(ErrorCode::kElfInvalidSegmentType));
      }
      if ((phdr.p_flags & ~kKnownFlags) != 0) {
        return std::unexpected(Error(ErrorCode::kElfInvalidSegmentFlags));
      }
      // 0 与 1 都表示不要求对齐
      auto align = phdr.p_align;
      if (align > 1) {
        if ((align & (align - 1)) != 0 ||
            (phdr.p_type == PT_LOAD &&
             phdr.p_offset % align != phdr.p_vaddr % align)) {
          return std::unexpected(
              Error(ErrorCode::kElfInvalidSegmentAlignment));
        }
      }
      if (phdr.p_type == PT_PHDR) {
        if (phdr_seen) {
          return std::unexpected(Error(ErrorCode::kElfDuplicatePhdrSegment));
        }
        phdr_seen = true;
      }
      if (phdr.p_filesz != 0 && !InImage(phdr.p_offset, phdr.p_filesz)) {
        return std::unexpected(Error(ErrorCode::kElfSegmentOutOfBounds));
      }
    }
    return {};
  }

  static constexpr auto IsKnownSectionType(uint32_t type) -> bool {
    return type <= SHT_DYNSYM ||
           (type >= SHT_INIT_ARRAY && type <= SHT_SYMTAB_SHNDX) ||
           type >= SHT_LOOS;
  }

  /**
   * 校验节头表并定位 .symtab 与 .strtab
   */
  [[nodiscard]] auto ParseSections() -> Expected<void> {
    const auto& ehdr = Header();
    if (ehdr.e_shoff == 0 || ehdr.e_shnum == 0) {
      return std::unexpected(Error(ErrorCode::kElfSymtabNotFound));
    }
    if (ehdr.e_shentsize != sizeof(Elf64_Shdr)) {
      return std::unexpected(Error(ErrorCode::kElfInvalidEntrySize));
    }
    if (!InImage(ehdr.e_shoff,
                 static_cast<uint64_t>(ehdr.e_shnum) * sizeof(Elf64_Shdr))) {
      return std::unexpected(Error(ErrorCode::kElfSectionOutOfBounds));
    }
    if (ehdr.e_shstrndx == SHN_UNDEF || ehdr.e_shstrndx >= ehdr.e_shnum) {
      return std::unexpected(Error(ErrorCode::kElfInvalidSectionIndex));
    }

    std::span<const Elf64_Shdr> shdrs(
        reinterpret_cast<const Elf64_Shdr*>(elf_.data() + ehdr.e_shoff),
        ehdr.e_shnum);
    for (const auto& shdr : shdrs) {
      if (!IsKnownSectionType(shdr.sh_type)) {
        return std::unexpected(Error(ErrorCode::kElfInvalidSectionType));
      }
      // SHT_NOBITS 不占文件空间
      if (shdr.sh_type != SHT_NOBITS && shdr.sh_type != SHT_NULL &&
          !InImage(shdr.sh_offset, shdr.sh_size)) {
        return std::unexpected(Error(ErrorCode::kElfSectionOutOfBounds));
      }
    }

    const auto& names_shdr = shdrs[ehdr.e_shstrndx];
    if (names_shdr.sh_type != SHT_STRTAB) {
      return std::unexpected(Error(ErrorCode::kElfInvalidSectionIndex));
    }
    std::span<const char> shstrtab(
        reinterpret_cast<const char*>(elf_.data() + names_shdr.sh_offset),
        names_shdr.sh_size);

    for (const auto& shdr : shdrs) {
      if (shdr.sh_type == SHT_NULL) {
        continue;
      }
      auto name = StringAt(shstrtab, shdr.sh_name);
      if (!name) {
        return std::unexpected(Error(ErrorCode::kElfInvalidStringIndex));
      }
      // StringAt 已确认以 NUL 结尾
      klog::Debug("sh_name: [%s]\n", name->data());
      if (*name == ".symtab") {
        if (shdr.sh_entsize != sizeof(Elf64_Sym)) {
          return std::unexpected(Error(ErrorCode::kElfInvalidEntrySize));
        }
        symtab_ = std::span<const Elf64_Sym>(
            reinterpret_cast<const Elf64_Sym*>(elf_.data() + shdr.sh_offset),
            shdr.sh_size / sizeof(Elf64_Sym));
      } else if (*name == ".strtab") {
        strtab_ = std::span<const char>(
            reinterpret_cast<const char*>(elf_.data() + shdr.sh_offset),
            shdr.sh_size);
      }
    }

    if (symtab_.empty()) {
      return std::unexpected(Error(ErrorCode::kElfSymtabNotFound));
    }
    if (strtab_.empty()) {
      return std::unexpected(Error(ErrorCode::kElfStrtabNotFound));
    }
    return {};
  }

  /// 每个符号名都须是 .strtab 内以 NUL 结尾的字符串
  [[nodiscard]] auto CheckSymbolNames() const -> Expected<void> {
    for (const auto& sym : symtab_) {
      if (!StringAt(strtab_, sym.st_name)) {
        return std::unexpected(Error(ErrorCode::kElfInvalidStringIndex));
      }
    }
    return {};
  }
};

using KernelElfSingleton = OnceSingleton<KernelElf>;

#endif /* HEARTHKERNEL_SRC_INCLUDE_KERNEL_ELF_HPP_ */
