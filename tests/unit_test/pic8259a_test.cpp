/**
 * @copyright Copyright The HearthKernel Contributors
 */

#include "pic8259a.h"

#include <gtest/gtest.h>

#include <vector>

#include "arch_mock.hpp"

namespace {

using arch_mock::PortWrite;

class Pic8259aTest : public ::testing::Test {
 protected:
  void SetUp() override { arch_mock::Reset(); }

  /// 初始化为 32/40 并清空端口记录
  void InitDefault() {
    ASSERT_TRUE(pic_.Initialize(32, 40).has_value());
    arch_mock::Get().port_writes.clear();
  }

  PIC8259A pic_;
};

}  // namespace

TEST_F(Pic8259aTest, InitializeSendsCommandWords) {
  // 初始化前的屏蔽字
  arch_mock::Get().port_reads[PIC8259A::kMasterData] = {0xB8};
  arch_mock::Get().port_reads[PIC8259A::kSlaveData] = {0x8E};

  ASSERT_TRUE(pic_.Initialize(32, 40).has_value());

  const std::vector<PortWrite> expected = {
      {0x20, 0x11, 1}, {0xA0, 0x11, 1},  // ICW1
      {0x21, 32, 1},   {0xA1, 40, 1},    // ICW2
      {0x21, 0x04, 1}, {0xA1, 0x02, 1},  // ICW3
      {0x21, 0x01, 1}, {0xA1, 0x01, 1},  // ICW4
      {0x21, 0xB8, 1}, {0xA1, 0x8E, 1},  // 恢复屏蔽字
  };
  EXPECT_EQ(arch_mock::Get().port_writes, expected);
  EXPECT_EQ(arch_mock::Get().wait_count, 8);
  EXPECT_EQ(pic_.offset_master(), 32);
  EXPECT_EQ(pic_.offset_slave(), 40);
}

TEST_F(Pic8259aTest, RejectsInvalidOffsets) {
  // 与 CPU 异常向量冲突
  auto ret = pic_.Initialize(8, 40);
  ASSERT_FALSE(ret.has_value());
  EXPECT_EQ(ret.error().code, ErrorCode::kPicInvalidOffset);
  // 未按 8 对齐
  EXPECT_FALSE(pic_.Initialize(33, 48).has_value());
  // 两片重叠
  EXPECT_FALSE(pic_.Initialize(32, 32).has_value());

  EXPECT_TRUE(arch_mock::Get().port_writes.empty());
  EXPECT_FALSE(pic_.HandlesInterrupt(33));
}

TEST_F(Pic8259aTest, HandlesOnlyItsVectors) {
  InitDefault();
  EXPECT_FALSE(pic_.HandlesInterrupt(31));
  EXPECT_TRUE(pic_.HandlesInterrupt(32));
  EXPECT_TRUE(pic_.HandlesInterrupt(47));
  EXPECT_FALSE(pic_.HandlesInterrupt(48));
  EXPECT_FALSE(pic_.HandlesInterrupt(14));
}

TEST_F(Pic8259aTest, MasterEndOfInterrupt) {
  InitDefault();
  pic_.NotifyEndOfInterrupt(33);
  EXPECT_EQ(arch_mock::Get().port_writes,
            (std::vector<PortWrite>{{0x20, 0x20, 1}}));
}

TEST_F(Pic8259aTest, SlaveEndOfInterruptNotifiesBothChips) {
  InitDefault();
  pic_.NotifyEndOfInterrupt(44);
  EXPECT_EQ(arch_mock::Get().port_writes,
            (std::vector<PortWrite>{{0xA0, 0x20, 1}, {0x20, 0x20, 1}}));
}

TEST_F(Pic8259aTest, ForeignVectorIsIgnored) {
  InitDefault();
  pic_.NotifyEndOfInterrupt(14);
  pic_.NotifyEndOfInterrupt(0x80);
  EXPECT_TRUE(arch_mock::Get().port_writes.empty());
}

TEST_F(Pic8259aTest, TracksInServiceVectors) {
  InitDefault();
  pic_.BeginInterrupt(33);
  EXPECT_TRUE(pic_.IsInService(33));
  EXPECT_FALSE(pic_.IsInService(32));

  pic_.NotifyEndOfInterrupt(33);
  EXPECT_FALSE(pic_.IsInService(33));
  EXPECT_FALSE(pic_.CheckEndOfInterrupt(33));
  EXPECT_EQ(pic_.missed_eoi_count(), 0);
}

TEST_F(Pic8259aTest, MissedEndOfInterruptIsResent) {
  InitDefault();
  pic_.BeginInterrupt(32);
  EXPECT_TRUE(pic_.CheckEndOfInterrupt(32));
  EXPECT_EQ(pic_.missed_eoi_count(), 1);
  EXPECT_FALSE(pic_.IsInService(32));
  EXPECT_EQ(arch_mock::WritesTo(PIC8259A::kMasterCommand),
            std::vector<uint32_t>{0x20});
}

TEST_F(Pic8259aTest, RedeliveryWhileInServiceIsCounted) {
  InitDefault();
  pic_.BeginInterrupt(40);
  pic_.BeginInterrupt(40);
  EXPECT_EQ(pic_.missed_eoi_count(), 1);
  EXPECT_TRUE(pic_.IsInService(40));
}

TEST_F(Pic8259aTest, MaskBits) {
  InitDefault();
  arch_mock::Get().port_reads[PIC8259A::kMasterData] = {0x00};
  arch_mock::Get().port_reads[PIC8259A::kSlaveData] = {0xFF};
  pic_.SetMask(1);
  pic_.ClearMask(12);
  EXPECT_EQ(arch_mock::Get().port_writes,
            (std::vector<PortWrite>{{0x21, 0x02, 1}, {0xA1, 0xEF, 1}}));

  arch_mock::Get().port_writes.clear();
  pic_.DisableAll();
  EXPECT_EQ(arch_mock::Get().port_writes,
            (std::vector<PortWrite>{{0x21, 0xFF, 1}, {0xA1, 0xFF, 1}}));
}
