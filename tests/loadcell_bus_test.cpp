#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <string>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include "loadcell_bus/frame_codec.h"
#include "loadcell_bus/loadcell_bus.h"

namespace loadcell_bus {
namespace {

using std::chrono::milliseconds;

/**
 * @brief 가상 RS-485 버스. pty master 쪽에서 장치 응답을 흉내낸다.
 * slave 경로를 SerialConfig.device 로 넘겨 LoadCellBus 가 실제 termios 경로로 연다.
 */
class PtyDeviceSide {
public:
  PtyDeviceSide() {
    master_fd_ = ::posix_openpt(O_RDWR | O_NOCTTY);
    if (master_fd_ < 0 || ::grantpt(master_fd_) != 0 || ::unlockpt(master_fd_) != 0)
      return;
    const char *name = ::ptsname(master_fd_);
    if (name != nullptr)
      slave_path_ = name;
  }

  ~PtyDeviceSide() {
    if (master_fd_ >= 0)
      ::close(master_fd_);
  }

  bool Ok() const { return master_fd_ >= 0 && !slave_path_.empty(); }
  const std::string &SlavePath() const { return slave_path_; }

  /** @brief size 바이트가 모일 때까지 읽는다. timeout 이면 지금까지 읽은 만큼 */
  Bytes ReadExactly(std::size_t size, milliseconds timeout) {
    Bytes out;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (out.size() < size && std::chrono::steady_clock::now() < deadline) {
      pollfd pfd{master_fd_, POLLIN, 0};
      if (::poll(&pfd, 1, 20) <= 0)
        continue;
      std::uint8_t buf[64];
      const ssize_t n = ::read(master_fd_, buf, std::min(sizeof(buf), size - out.size()));
      if (n > 0)
        out.insert(out.end(), buf, buf + n);
    }
    return out;
  }

  void Write(const Bytes &bytes) {
    ASSERT_EQ(::write(master_fd_, bytes.data(), bytes.size()), static_cast<ssize_t>(bytes.size()));
  }

private:
  int master_fd_ = -1;
  std::string slave_path_;
};

const Bytes kBcdFrame{0x01, 0x05, 0x02, 0x00, 0x09, 0x02, 0x91, 0xA4};
const Bytes kBinaryFrame{0x02, 0x05, 0x02, 0x00, 0x03, 0x00, 0xC5, 0x1A, 0xEB};
const Bytes kIdFrame{0x04, 0x05, 0x05, 0x00, 0x00, 0x00,
                     0x00, 0xDE, 0xAD, 0xBE, 0xEF, 0x46};

SerialConfig ConfigFor(const PtyDeviceSide &pty) {
  SerialConfig cfg;
  cfg.device = pty.SlavePath();
  cfg.baudrate = 115200;
  return cfg;
}

TEST(LoadCellBusTest, CommandsFailWhenNotOpen) {
  LoadCellBus bus;
  EXPECT_FALSE(bus.IsOpen());
  EXPECT_EQ(bus.SendCommand(FrameCodec::ReadWeight()), ResultCode::kNotOpen);
  EXPECT_EQ(bus.ReadWeights(milliseconds(10)), ResultCode::kNotOpen);
  EXPECT_EQ(bus.SetZero(), ResultCode::kNotOpen);
  EXPECT_FALSE(bus.LastError().empty());
}

TEST(LoadCellBusTest, OpenReportsMissingDevice) {
  LoadCellBus bus;
  SerialConfig cfg;
  cfg.device = "/dev/loadcell_bus_does_not_exist";
  EXPECT_FALSE(bus.Open(cfg));
  EXPECT_NE(bus.LastError().find("loadcell_bus_does_not_exist"), std::string::npos);
}

TEST(LoadCellBusTest, BroadcastReadCollectsEveryDevice) {
  PtyDeviceSide pty;
  ASSERT_TRUE(pty.Ok());

  LoadCellBus bus;
  ASSERT_TRUE(bus.Open(ConfigFor(pty))) << bus.LastError();

  std::thread device([&pty] {
    const Bytes request = pty.ReadExactly(5, milliseconds(2000));
    EXPECT_EQ(request, FrameCodec::ReadWeight());
    Bytes reply = kBcdFrame;
    reply.insert(reply.end(), kBinaryFrame.begin(), kBinaryFrame.end());
    pty.Write(reply);
  });

  std::vector<DecodedEvent> events;
  const ResultCode rc = bus.ReadWeights(milliseconds(500), 0, &events);
  device.join();

  ASSERT_EQ(rc, ResultCode::kOk) << bus.LastError();
  EXPECT_EQ(events.size(), 2U);

  const auto snapshot = bus.Registry().Snapshot();
  ASSERT_EQ(snapshot.size(), 2U);
  EXPECT_EQ(snapshot[0].address, 0x01);
  EXPECT_DOUBLE_EQ(snapshot[0].last_raw_weight, 29100.0);
  EXPECT_EQ(snapshot[1].address, 0x02);
  EXPECT_NEAR(snapshot[1].last_raw_weight, 50458.0 / 565.4, 1e-9);

  bus.Close();
  EXPECT_FALSE(bus.IsOpen());
}

TEST(LoadCellBusTest, ReadIdsStoresIdentity) {
  PtyDeviceSide pty;
  ASSERT_TRUE(pty.Ok());

  LoadCellBus bus;
  ASSERT_TRUE(bus.Open(ConfigFor(pty))) << bus.LastError();

  std::thread device([&pty] {
    const Bytes request = pty.ReadExactly(5, milliseconds(2000));
    EXPECT_EQ(request, FrameCodec::ReadId());
    pty.Write(kIdFrame);
  });

  const ResultCode rc = bus.ReadIds(milliseconds(1000), 0);
  device.join();

  ASSERT_EQ(rc, ResultCode::kOk) << bus.LastError();
  const auto ids = bus.Identities();
  ASSERT_EQ(ids.size(), 1U);
  EXPECT_EQ(ids[0].address, 0x04);
  EXPECT_EQ(ids[0].ToHexString(), "DEADBEEF");
}

TEST(LoadCellBusTest, SilentBusTimesOutAfterRetries) {
  PtyDeviceSide pty;
  ASSERT_TRUE(pty.Ok());

  LoadCellBus bus;
  ASSERT_TRUE(bus.Open(ConfigFor(pty))) << bus.LastError();

  EXPECT_EQ(bus.ReadWeights(milliseconds(30), 1), ResultCode::kTimeout);
  EXPECT_NE(bus.LastError().find("0x02"), std::string::npos);
  EXPECT_NE(bus.LastError().find("2 attempt"), std::string::npos);

  // 두 번의 송신이 모두 버스에 나갔는지 확인
  const Bytes sent = pty.ReadExactly(10, milliseconds(500));
  EXPECT_EQ(sent.size(), 10U);
}

TEST(LoadCellBusTest, WriteCommandsAreSentWithoutWaiting) {
  PtyDeviceSide pty;
  ASSERT_TRUE(pty.Ok());

  LoadCellBus bus;
  ASSERT_TRUE(bus.Open(ConfigFor(pty))) << bus.LastError();

  EXPECT_EQ(bus.ChangeAddress(5), ResultCode::kOk);
  EXPECT_EQ(pty.ReadExactly(5, milliseconds(1000)), (Bytes{0x00, 0x63, 0x10, 0x05, 0x78}));

  EXPECT_EQ(bus.SetZero(), ResultCode::kOk);
  EXPECT_EQ(pty.ReadExactly(5, milliseconds(1000)), (Bytes{0x00, 0x63, 0x06, 0x03, 0x6C}));
}

} // namespace
} // namespace loadcell_bus
