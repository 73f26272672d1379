#include "tempo/app/DemoApp.hpp"
#include <spdlog/spdlog.h>

int main() {
    spdlog::set_level(spdlog::level::trace);
    tempo::app::DemoApp demo;
    demo.run();
    return 0;
}
