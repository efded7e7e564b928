// Test child: grows its resident set in steps, then holds it and exits.
// usage: tasksup-test-grow <steps> <chunk_kb> <step_ms> [hold_ms]
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

int main(int argc, char** argv) {
    if (argc < 4) {
        std::cerr << "usage: tasksup-test-grow <steps> <chunk_kb> <step_ms> [hold_ms]" << std::endl;
        return 1;
    }
    int steps = std::atoi(argv[1]);
    size_t chunk = static_cast<size_t>(std::atol(argv[2])) * 1024;
    int step_ms = std::atoi(argv[3]);
    int hold_ms = argc > 4 ? std::atoi(argv[4]) : 0;

    std::vector<std::unique_ptr<char[]>> blocks;
    for (int i = 0; i < steps; ++i) {
        blocks.emplace_back(new char[chunk]);
        std::memset(blocks.back().get(), i + 1, chunk); // touch every page so it counts as resident
        std::this_thread::sleep_for(std::chrono::milliseconds(step_ms));
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(hold_ms));
    return 0;
}
