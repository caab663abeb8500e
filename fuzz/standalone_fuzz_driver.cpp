// Standalone driver for the decoder fuzz targets when libFuzzer is not available
// Replays every file given on the command line (directories are walked), so a
// saved corpus can be run as a regression check with any compiler

#ifdef STANDALONE_FUZZ_TARGET_DRIVER

#include <cstdint>
#include <cstddef>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>
#include <vector>

// Forward declare the fuzzer entry point
extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size);

namespace {

bool RunFile(const std::filesystem::path &path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        fprintf(stderr, "Error: Cannot open file '%s'\n", path.c_str());
        return false;
    }
    std::vector<uint8_t> buffer((std::istreambuf_iterator<char>(file)),
                                std::istreambuf_iterator<char>());
    LLVMFuzzerTestOneInput(buffer.data(), buffer.size());
    return true;
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        fprintf(stderr, "Usage: %s <input_file|corpus_dir>...\n", argv[0]);
        fprintf(stderr, "\nReplays inputs without mutation. For actual fuzzing,\n");
        fprintf(stderr, "configure with -DTOPOWATCH_BUILD_FUZZERS=ON using clang.\n");
        return 1;
    }

    size_t inputs = 0;
    size_t failures = 0;
    for (int i = 1; i < argc; ++i) {
        std::filesystem::path arg(argv[i]);
        std::error_code ec;
        if (std::filesystem::is_directory(arg, ec)) {
            for (const auto &entry : std::filesystem::recursive_directory_iterator(arg, ec)) {
                if (entry.is_regular_file(ec)) {
                    ++inputs;
                    failures += RunFile(entry.path()) ? 0 : 1;
                }
            }
        } else {
            ++inputs;
            failures += RunFile(arg) ? 0 : 1;
        }
    }

    printf("Replayed %zu input(s), %zu unreadable\n", inputs, failures);
    return failures == 0 ? 0 : 1;
}

#endif // STANDALONE_FUZZ_TARGET_DRIVER
