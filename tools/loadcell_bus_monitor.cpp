#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <string>
#include <thread>

#include <zmq.hpp>

#include "loadcell_bus_data_type.h"
#include "zmq_subscriber_msgpack.hpp"

namespace {
constexpr const char* kDefaultEndpoint = "tcp://localhost:5558";
constexpr const char* kDefaultTopic = "loadcell_bus";

std::atomic<bool> g_running{true};

void OnSignal(int) { g_running.store(false); }

const char* StateName(std::uint8_t state) {
  switch (state) {
    case LOADCELL_BUS::OK:
      return "OK";
    case LOADCELL_BUS::EMPTY:
      return "EMPTY";
    default:
      return "ERROR";
  }
}
}  // namespace

/**
 * @brief 드라이버가 발행하는 BusSnapshot 을 구독해 장치별 무게와 변화 이벤트를 출력한다.
 *
 * 같은 cycle_no 의 스냅샷은 publish 주기마다 반복 발행되므로 한 번만 출력한다.
 * 사용법: loadcell_bus_monitor [endpoint] [topic]
 *
 * @return 정상 종료 시 0, 예외 발생 시 1
 */
int main(int argc, char* argv[]) {
  const std::string endpoint = argc > 1 ? argv[1] : kDefaultEndpoint;
  const std::string topic = argc > 2 ? argv[2] : kDefaultTopic;

  std::signal(SIGINT, OnSignal);
  std::signal(SIGTERM, OnSignal);

  try {
    zmq::context_t context(1);

    std::uint64_t last_cycle = 0;
    std::string last_instance;

    zmq_pub::MsgPackSubscriber<LOADCELL_BUS::BusSnapshot> subscriber(
        context, endpoint, topic,
        [&last_cycle, &last_instance](LOADCELL_BUS::BusSnapshot&& msg) {
          if (msg.driver_instance_id == last_instance && msg.cycle_no == last_cycle)
            return;
          last_instance = msg.driver_instance_id;
          last_cycle = msg.cycle_no;

          std::cout << "[MON] cycle=" << msg.cycle_no << " seq=" << msg.seq_no
                    << " state=" << StateName(msg.driver_state) << " ret_code=" << msg.ret_code;
          if (!msg.driver_err_msg.empty())
            std::cout << " err=\"" << msg.driver_err_msg << "\"";
          std::cout << "\n";

          for (const auto& d : msg.devices) {
            std::cout << "  addr=" << static_cast<int>(d.address) << std::fixed << std::setprecision(1)
                      << " weight=" << d.corrected_weight << "g"
                      << " smoothed=" << d.smoothed_weight << "g"
                      << " raw=" << d.raw_weight << "g"
                      << " zero=" << d.zero_offset_grams << std::setprecision(6)
                      << " scale=" << d.scale_factor << (d.is_stable ? " [stable]" : "") << "\n";
            std::cout.unsetf(std::ios::floatfield);
          }
          for (const auto& c : msg.weight_changes) {
            std::cout << "  change addr=" << static_cast<int>(c.address)
                      << (c.kind == LOADCELL_BUS::ADDED ? " added " : " removed ") << c.delta_grams
                      << "g -> " << c.stable_weight_grams << "g\n";
          }
          for (const auto& id : msg.identities)
            std::cout << "  id addr=" << static_cast<int>(id.address) << " " << id.id_hex << "\n";
          for (const auto& p : msg.params) {
            std::cout << "  params addr=" << static_cast<int>(p.address) << " resolution=" << p.resolution_grams
                      << "g kind=" << p.scale_kind_name << " zero_range=" << static_cast<int>(p.zero_range)
                      << " settling=" << static_cast<int>(p.settling_range) << " max=" << p.max_weight_grams
                      << "g\n";
          }
          for (const auto& o : msg.command_outcomes) {
            std::cout << "  command id=" << o.command_id << " " << o.action << " ret_code=" << o.ret_code << " "
                      << o.message << "\n";
          }
        },
        [](const std::string& error_message) {
          std::cerr << "[MON][ERR] " << error_message << "\n";
          return true;
        });

    std::cout << "[MON] connect=" << subscriber.Endpoint() << " topic=" << subscriber.Topic() << "\n";
    std::cout << "[MON] Press Ctrl+C to exit.\n";

    while (g_running.load()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    subscriber.Stop();
    std::cout << "[MON] done\n";
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "[MON][ERR][EXCEPTION] " << e.what() << "\n";
    return 1;
  }
}
