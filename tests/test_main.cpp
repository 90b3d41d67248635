#include "logger.hpp"
#include <cstdlib>
#include <gtest/gtest.h>

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    // Keep test output readable; set ROUTE_COMPOSE_TEST_LOG=debug to see engine logs
    const char* level = std::getenv("ROUTE_COMPOSE_TEST_LOG");
    routecompose::Logger::setLevel(level ? routecompose::Logger::parseLevel(level)
                                         : routecompose::LogLevel::None);
    return RUN_ALL_TESTS();
}
