#pragma once
#include <cstdint>
#include <string>

namespace loadcell_bus {

struct SerialConfig {
    std::string device = "/dev/ttyUSB0";
    int baudrate = 115200;     // 9600/19200/38400/57600/115200/230400
    uint8_t data_bits = 8;     // 5..8
    char parity = 'N';         // 'N','E','O'
    uint8_t stop_bits = 1;     // 1 or 2
    bool rtscts = false;       // HW flow control
    bool xonxoff = false;      // SW flow control

    // read behavior
    // VMIN/VTIME: reader 스레드가 stop 요청을 주기적으로 확인할 수 있도록
    // 기본값은 "최대 0.1s 대기 후 반환"
    uint8_t vmin = 0;
    uint8_t vtime_ds = 1;      // deciseconds (0.1s 단위) 0..255
};

} // namespace loadcell_bus
