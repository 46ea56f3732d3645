#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

#include <zmq.hpp>

#include "loadcell_bus_data_type.h"
#include "zmq_publisher_msgpack.hpp"

namespace {
constexpr const char* kDefaultEndpoint = "tcp://*:5559";
constexpr const char* kDefaultTopic = "loadcell_bus_cmd";

void PrintUsage(const char* prog) {
  std::cerr << "usage: " << prog << " <action> [options]\n"
            << "  zero <address>\n"
            << "  calibrate <address> <known_grams>\n"
            << "  tare_device\n"
            << "  change_address <new_address>\n"
            << "  write_params <max> <div> <zero> <settle> <kind>\n"
            << "  read_id | read_params\n"
            << "env: LOADCELL_BUS_CMD_ENDPOINT (default " << kDefaultEndpoint << "), "
            << "LOADCELL_BUS_CMD_TOPIC (default " << kDefaultTopic << ")\n";
}

std::uint8_t ParseByte(const std::string& text) {
  const unsigned long v = std::stoul(text, nullptr, 0);
  if (v > 0xFF)
    throw std::out_of_range("byte value out of range: " + text);
  return static_cast<std::uint8_t>(v);
}

/** @brief argv -> BusCommand. 인자 개수 오류는 invalid_argument */
LOADCELL_BUS::BusCommand MakeCommand(int argc, char* argv[]) {
  LOADCELL_BUS::BusCommand cmd{};
  cmd.action = argv[1];
  cmd.command_id = static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch())
          .count());

  const int nargs = argc - 2;
  if (cmd.action == "zero") {
    if (nargs != 1)
      throw std::invalid_argument("zero needs <address>");
    cmd.address = ParseByte(argv[2]);
  } else if (cmd.action == "calibrate") {
    if (nargs != 2)
      throw std::invalid_argument("calibrate needs <address> <known_grams>");
    cmd.address = ParseByte(argv[2]);
    cmd.value = std::stod(argv[3]);
  } else if (cmd.action == "change_address") {
    if (nargs != 1)
      throw std::invalid_argument("change_address needs <new_address>");
    cmd.args.push_back(ParseByte(argv[2]));
  } else if (cmd.action == "write_params") {
    if (nargs != 5)
      throw std::invalid_argument("write_params needs 5 values");
    for (int i = 2; i < argc; ++i)
      cmd.args.push_back(ParseByte(argv[i]));
  } else if (cmd.action == "tare_device" || cmd.action == "read_id" || cmd.action == "read_params") {
    if (nargs != 0)
      throw std::invalid_argument(cmd.action + " takes no arguments");
  } else {
    throw std::invalid_argument("unknown action: " + cmd.action);
  }
  return cmd;
}

std::string EnvOr(const char* name, const char* fallback) {
  const char* v = std::getenv(name);
  return (v != nullptr && *v != '\0') ? std::string(v) : std::string(fallback);
}
}  // namespace

/**
 * @brief 드라이버 명령 채널로 BusCommand 1건을 발행한다.
 * 드라이버(SUB)가 connect 를 마칠 시간을 주기 위해 발행 전 워밍업 딜레이를 둔다.
 * 처리 결과는 다음 BusSnapshot 의 command_outcomes 로 확인한다(loadcell_bus_monitor).
 * @return 정상 0, 인자 오류 2, 예외 1
 */
int main(int argc, char* argv[]) {
  if (argc < 2) {
    PrintUsage(argv[0]);
    return 2;
  }

  LOADCELL_BUS::BusCommand cmd;
  try {
    cmd = MakeCommand(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << "[CMD][ERR] " << e.what() << "\n";
    PrintUsage(argv[0]);
    return 2;
  }

  try {
    zmq::context_t context(1);

    zmq_pub::MsgPackPublisher<LOADCELL_BUS::BusCommand> publisher(
        context, EnvOr("LOADCELL_BUS_CMD_ENDPOINT", kDefaultEndpoint), EnvOr("LOADCELL_BUS_CMD_TOPIC", kDefaultTopic));

    std::cout << "[CMD] bind=" << publisher.Endpoint() << " topic=" << publisher.Topic() << "\n";

    // SUB 재연결 대기(첫 publish 유실 방지용 워밍업)
    std::this_thread::sleep_for(std::chrono::milliseconds(300));

    publisher.Publish(cmd);
    std::cout << "[CMD] sent id=" << cmd.command_id << " action=" << cmd.action
              << " address=" << static_cast<int>(cmd.address) << " value=" << cmd.value
              << " args=" << cmd.args.size() << "\n";

    // linger 0 이므로 전송 완료 전에 context 가 닫히지 않도록 잠시 대기
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "[CMD][ERR] " << e.what() << "\n";
    return 1;
  }
}
