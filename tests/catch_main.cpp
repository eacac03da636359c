#include <catch2/catch_session.hpp>
#include <catch2/catch_test_macros.hpp>
#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <sstream>

inline std::string bench_environment() {
    std::ostringstream ss;

#if defined(_MSC_VER)
    ss << "Compiler: MSVC " << _MSC_VER << "\n";
#elif defined(__clang__)
    ss << "Compiler: Clang " << __clang_major__ << "." << __clang_minor__ << "\n";
#elif defined(__GNUC__)
    ss << "Compiler: GCC " << __GNUC__ << "." << __GNUC_MINOR__ << "\n";
#endif

#ifdef _WIN32
    ss << "OS: Windows\n";
#elif defined(__linux__)
    ss << "OS: Linux\n";
#endif

    ss << "spdlog: " << SPDLOG_VER_MAJOR << "." << SPDLOG_VER_MINOR << "." << SPDLOG_VER_PATCH << "\n";

    return ss.str();
}

int main(int argc, char* argv[]) {
    // SPDLOG_LEVEL=uplist=trace
    spdlog::cfg::load_env_levels();

    std::cout << bench_environment() << "\n";
    return Catch::Session().run(argc, argv);
}
