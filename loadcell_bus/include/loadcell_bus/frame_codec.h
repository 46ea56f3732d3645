#ifndef LOADCELL_BUS_FRAME_CODEC_H_
#define LOADCELL_BUS_FRAME_CODEC_H_

#include <cstddef>
#include <cstdint>
#include <vector>

namespace loadcell_bus {

using Bytes = std::vector<std::uint8_t>;

/** @brief 송신 명령 종류 */
enum class CommandKind : std::uint8_t {
  kReadWeight = 0,
  kReadId,
  kReadParams,
  kSetZero,
  kChangeAddress,
  kWriteParams
};

const char *CommandKindToString(CommandKind kind) noexcept;

/**
 * @brief 파라미터 쓰기 인자(모두 테이블 index).
 * max_weight 0..19, division 0..14, zero_range 0..9, settling_range 1..10,
 * scale_kind 0..3
 */
struct ParamWriteArgs {
  std::uint8_t max_weight_index = 0;
  std::uint8_t division_index = 0;
  std::uint8_t zero_range = 0;
  std::uint8_t settling_range = 1;
  std::uint8_t scale_kind = 0;
};

/** @brief EncodeCommand() 에 넘기는 명령별 인자 묶음 */
struct CommandArgs {
  std::uint8_t new_address = 0; // kChangeAddress
  ParamWriteArgs params{};      // kWriteParams
};

/**
 * @brief 송신 명령 한 건. 생성 이후 변경하지 않는다.
 */
struct Command {
  std::uint8_t address = 0;
  std::uint8_t function = 0;
  std::uint8_t reg = 0;
  Bytes payload;
  std::uint8_t checksum = 0;

  /** @brief [address, function, reg, payload..., checksum] */
  Bytes Serialize() const;
};

/**
 * @brief 명령 프레임 생성기. 상태를 갖지 않는다.
 *
 * 모든 명령은 브로드캐스트 주소(0x00)로 송신되며
 * checksum 은 앞선 모든 바이트 합의 하위 8bit 이다.
 * 범위를 벗어난 인자는 LoadCellException(kInvalidArgument) 로 거부한다.
 */
class FrameCodec final {
public:
  static std::uint8_t Checksum(const std::uint8_t *data,
                               std::size_t size) noexcept;
  static std::uint8_t Checksum(const Bytes &data) noexcept;

  /** @brief 마지막 바이트가 그 앞 바이트들의 checksum 인지 검사 */
  static bool VerifyChecksum(const std::uint8_t *frame,
                             std::size_t size) noexcept;

  static Command MakeReadWeight();
  static Command MakeReadId();
  static Command MakeReadParams();
  static Command MakeSetZero();
  static Command MakeChangeAddress(std::uint8_t new_address);
  static Command MakeWriteParams(const ParamWriteArgs &args);

  static Bytes ReadWeight() { return MakeReadWeight().Serialize(); }
  static Bytes ReadId() { return MakeReadId().Serialize(); }
  static Bytes ReadParams() { return MakeReadParams().Serialize(); }
  static Bytes SetZero() { return MakeSetZero().Serialize(); }
  static Bytes ChangeAddress(std::uint8_t new_address) {
    return MakeChangeAddress(new_address).Serialize();
  }
  static Bytes WriteParams(const ParamWriteArgs &args) {
    return MakeWriteParams(args).Serialize();
  }

  /** @brief kind 에 따라 위 builder 로 분기 */
  static Bytes EncodeCommand(CommandKind kind, const CommandArgs &args = {});

private:
  static Command Make_(std::uint8_t function, std::uint8_t reg, Bytes payload);
};

} // namespace loadcell_bus

#endif // LOADCELL_BUS_FRAME_CODEC_H_
