#pragma once
#include <cmath>
#include <exception>
#include <iomanip>
#include <iostream>
#include <string>

// Shared checks for the standalone test programs. Each check prints a line
// and bumps a failure counter; finish() turns the counter into an exit code.
namespace test {

inline int& failures() {
    static int count = 0;
    return count;
}

inline bool expect_true(bool condition, const std::string& what) {
    if (condition) {
        std::cout << "  ✓ " << what << std::endl;
    } else {
        std::cout << "  ✗ " << what << " FAILED" << std::endl;
        failures()++;
    }
    return condition;
}

inline bool expect_near(float actual, float expected, float tolerance, const std::string& what) {
    bool passed = std::abs(actual - expected) <= tolerance;
    if (!passed) {
        std::cout << std::fixed << std::setprecision(6)
                  << "    expected " << expected << ", got " << actual << std::endl;
    }
    return expect_true(passed, what);
}

template <typename Error, typename Fn>
bool expect_throws(Fn fn, const std::string& what) {
    try {
        fn();
    } catch (const Error&) {
        return expect_true(true, what);
    } catch (const std::exception& e) {
        std::cout << "    unexpected exception: " << e.what() << std::endl;
        return expect_true(false, what);
    }
    std::cout << "    nothing was thrown" << std::endl;
    return expect_true(false, what);
}

inline void section(const std::string& title) {
    std::cout << "\n=== " << title << " ===" << std::endl;
}

inline int finish(const std::string& suite) {
    if (failures() == 0) {
        std::cout << "\n=== " << suite << ": ALL PASSED ===" << std::endl;
        return 0;
    }
    std::cout << "\n=== " << suite << ": " << failures() << " FAILED ===" << std::endl;
    return 1;
}

} // namespace test
