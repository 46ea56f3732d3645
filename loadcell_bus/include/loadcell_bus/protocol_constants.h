#ifndef LOADCELL_BUS_PROTOCOL_CONSTANTS_H_
#define LOADCELL_BUS_PROTOCOL_CONSTANTS_H_

#include <array>
#include <cstddef>
#include <cstdint>

namespace loadcell_bus {
namespace protocol {

/** @brief 브로드캐스트 주소. 명령 프레임은 항상 이 주소로 송신된다. */
inline constexpr std::uint8_t kBroadcastAddress = 0x00;

/** @brief 유효 디바이스 주소 범위 (주소 변경 명령 인자) */
inline constexpr std::uint8_t kMinDeviceAddress = 1;
inline constexpr std::uint8_t kMaxDeviceAddress = 10;

/** function code */
inline constexpr std::uint8_t kFuncRead = 0x05;
inline constexpr std::uint8_t kFuncWrite = 0x63;
inline constexpr std::uint8_t kFuncContinuous = 0x06; // 연속 송출 모드 응답

/** register */
inline constexpr std::uint8_t kRegWeight = 0x02;
inline constexpr std::uint8_t kRegId = 0x05;
inline constexpr std::uint8_t kRegZeroSet = 0x06;
inline constexpr std::uint8_t kRegAddress = 0x10;
inline constexpr std::uint8_t kRegParam = 0x23;

/** 명령 인자 */
inline constexpr std::uint8_t kReadArgument = 0x05;
inline constexpr std::uint8_t kZeroSetArgument = 0x03;

/** 응답 프레임 길이 */
inline constexpr std::size_t kBcdWeightFrameBytes = 8;
inline constexpr std::size_t kBinaryWeightFrameBytes = 9;
inline constexpr std::size_t kParamFrameBytes = 9;
inline constexpr std::size_t kIdFrameBytes = 12;
inline constexpr std::size_t kMinFrameBytes = 8;

/** @brief 9바이트(binary) 무게 프레임의 카운트 -> g 변환 계수 */
inline constexpr double kDefaultBinaryCountsPerGram = 565.4;

/**
 * @brief division index -> 분해능(g/count).
 * index 15 이상은 장비 매뉴얼에 정의되어 있지 않다.
 */
inline constexpr std::array<double, 15> kResolutionTable = {
    0.1,   0.2,   0.5,    1.0,    2.0,    5.0,   10.0, 20.0,
    50.0,  100.0, 200.0,  500.0,  1000.0, 2000.0, 5000.0};

/** @brief 테이블 범위를 벗어난 division 의 분해능 */
inline constexpr double kFallbackResolutionGrams = 1.0;

/** @brief 파라미터 쓰기 max_weight index -> 최대 하중(kg) */
inline constexpr std::array<std::uint16_t, 20> kMaxWeightTableKg = {
    5,  10, 15, 20, 25, 30, 35, 40, 45, 50,
    55, 60, 65, 70, 75, 80, 85, 90, 95, 100};

/** @brief scale kind index -> 측정 방식 이름 */
inline constexpr std::array<const char *, 4> kScaleKindNames = {
    "quick", "normal", "crane", "large_crane"};
inline constexpr const char *kUnknownScaleKindName = "Unknown";

/** 파라미터 쓰기 인자 범위(양 끝 포함) */
inline constexpr std::uint8_t kMaxZeroRangeIndex = 9;
inline constexpr std::uint8_t kMinSettlingRangeIndex = 1;
inline constexpr std::uint8_t kMaxSettlingRangeIndex = 10;

} // namespace protocol
} // namespace loadcell_bus

#endif // LOADCELL_BUS_PROTOCOL_CONSTANTS_H_
