// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Test runner: Catch2 session with logging set up around it

#include <catch2/catch_session.hpp>
#include <cstdlib>
#include <string>

void InitializeTestLogging(const std::string& level);
void ShutdownTestLogging();

int main(int argc, char* argv[]) {
    // PARLEY_TEST_LOGLEVEL=trace for verbose failing runs
    const char* env = std::getenv("PARLEY_TEST_LOGLEVEL");
    InitializeTestLogging(env ? env : "off");

    int result = Catch::Session().run(argc, argv);

    ShutdownTestLogging();
    return result;
}
