#include <exception>
#include <iostream>
#include <memory>

#include "loadcell_bus_driver_node.h"
#include "rclcpp/rclcpp.hpp"

/**
 * @brief ROS2 런타임 초기화 후 LoadCellBusDriverNode 를 생성해 스핀한다.
 * @return 정상 종료 시 0, 초기화 실패(포트/endpoint 중복 등) 시 1
 */
int main(int argc, char* argv[]) {
  try {
    rclcpp::init(argc, argv);

    rclcpp::executors::MultiThreadedExecutor executor;

    auto node = std::make_shared<loadcell_bus_driver::LoadCellBusDriverNode>();
    node->Initialize();

    executor.add_node(node);
    executor.spin();

    rclcpp::shutdown();
    return 0;
  }
  catch (const std::exception& e) {
    std::cerr << "(main-print) exception: " << e.what() << std::endl;
    rclcpp::shutdown();
    return 1;
  }
}
