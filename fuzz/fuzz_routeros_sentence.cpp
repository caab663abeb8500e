// Fuzz target for RouterOS API sentence decoding
// Tests the variable-length word prefix and reply parsing

#include "discovery/routeros_api.hpp"
#include <cstdint>
#include <cstddef>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    using namespace topowatch::discovery::routeros;

    std::string_view buffer(reinterpret_cast<const char *>(data), size);

    // Decode sentences back to back, the way the client drains its buffer
    while (!buffer.empty()) {
        std::vector<std::string> words;
        size_t consumed = 0;
        DecodeStatus status = DecodeSentence(buffer, words, consumed);
        if (status != DecodeStatus::COMPLETE) {
            break;
        }

        // A complete sentence consumes at least its terminator
        if (consumed == 0 || consumed > buffer.size()) {
            __builtin_trap();
        }

        Reply reply = ParseReply(words);
        (void)reply;

        // Re-encoding a decoded sentence must decode to the same words
        std::string encoded = EncodeSentence(words);
        std::vector<std::string> again;
        size_t consumed_again = 0;
        if (DecodeSentence(encoded, again, consumed_again) != DecodeStatus::COMPLETE ||
            again != words || consumed_again != encoded.size()) {
            __builtin_trap();
        }

        buffer.remove_prefix(consumed);
    }

    return 0;
}
