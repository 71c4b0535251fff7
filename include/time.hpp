#pragma once

#include <chrono>
#include <iostream>

// runs the statements and prints their wall time after the label
#define TIME_BLOCK(label, ...) do {                                               \
    const auto __start = std::chrono::steady_clock::now();                        \
    __VA_ARGS__                                                                    \
    const std::chrono::duration<double, std::milli> __elapsed =                   \
        std::chrono::steady_clock::now() - __start;                               \
    std::cout << "[elasticsurf] " << label << " took: " << __elapsed.count() << "ms" << std::endl; \
} while(0)
