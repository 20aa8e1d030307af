#include "mqttd/core/obfuscation.h"
#include "mqttd/core/errors.h"
#include "mqttd/core/utils.h"

#include <cstdint>

namespace mqttd {
namespace core {

namespace {

const std::string kObfuscationKey = "mqttd/ledger/obfuscation";

std::string applyKeyStream(const std::string& input) {
    std::string output = input;
    for (size_t i = 0; i < output.size(); ++i) {
        auto mask = static_cast<uint8_t>(kObfuscationKey[i % kObfuscationKey.size()]) ^
                    static_cast<uint8_t>(i * 31 + 7);
        output[i] = static_cast<char>(static_cast<uint8_t>(output[i]) ^ mask);
    }
    return output;
}

} // namespace

std::string encodeObfuscated(const std::string& plain) {
    return base64Encode(applyKeyStream(plain));
}

std::string decodeObfuscated(const std::string& encoded) {
    std::string raw;
    if (encoded.empty() || !base64Decode(encoded, raw)) {
        throw ConfigError("value is not an obfuscated password");
    }
    return applyKeyStream(raw);
}

std::string tryDecodeObfuscated(const std::string& value) {
    std::string raw;
    if (value.empty() || !base64Decode(value, raw)) {
        return value;
    }
    return applyKeyStream(raw);
}

} // namespace core
} // namespace mqttd
