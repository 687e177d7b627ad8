// Standalone driver for running fuzz targets without libFuzzer
// Replays each file named on the command line through the target once

#ifdef STANDALONE_FUZZ_TARGET_DRIVER

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <vector>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size);

int main(int argc, char** argv) {
    if (argc < 2) {
        fprintf(stderr, "Usage: %s <input_file>...\n", argv[0]);
        fprintf(stderr, "Build with clang to get a real libFuzzer binary.\n");
        return 1;
    }

    int failures = 0;
    for (int i = 1; i < argc; ++i) {
        std::ifstream file(argv[i], std::ios::binary);
        if (!file) {
            fprintf(stderr, "Error: Cannot open file '%s'\n", argv[i]);
            failures++;
            continue;
        }
        std::vector<uint8_t> buffer((std::istreambuf_iterator<char>(file)),
                                    std::istreambuf_iterator<char>());

        LLVMFuzzerTestOneInput(buffer.data(), buffer.size());
        printf("%s: %zu bytes ok\n", argv[i], buffer.size());
    }

    return failures == 0 ? 0 : 1;
}

#endif // STANDALONE_FUZZ_TARGET_DRIVER
