#include "ironq/envelope.hpp"
#include "ironq/errors.hpp"

namespace ironq {

// Base64 encoding/decoding
static const std::string base64_chars =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
    "abcdefghijklmnopqrstuvwxyz"
    "0123456789+/";

std::string encode_to_string(const std::vector<uint8_t>& data) {
    std::string ret;
    ret.reserve(((data.size() + 2) / 3) * 4);

    int i = 0;
    uint8_t char_array_3[3];
    uint8_t char_array_4[4];

    for (uint8_t byte : data) {
        char_array_3[i++] = byte;
        if (i == 3) {
            char_array_4[0] = (char_array_3[0] & 0xfc) >> 2;
            char_array_4[1] = ((char_array_3[0] & 0x03) << 4) + ((char_array_3[1] & 0xf0) >> 4);
            char_array_4[2] = ((char_array_3[1] & 0x0f) << 2) + ((char_array_3[2] & 0xc0) >> 6);
            char_array_4[3] = char_array_3[2] & 0x3f;

            for (i = 0; i < 4; i++)
                ret += base64_chars[char_array_4[i]];
            i = 0;
        }
    }

    if (i) {
        for (int j = i; j < 3; j++)
            char_array_3[j] = '\0';

        char_array_4[0] = (char_array_3[0] & 0xfc) >> 2;
        char_array_4[1] = ((char_array_3[0] & 0x03) << 4) + ((char_array_3[1] & 0xf0) >> 4);
        char_array_4[2] = ((char_array_3[1] & 0x0f) << 2) + ((char_array_3[2] & 0xc0) >> 6);

        for (int j = 0; j < i + 1; j++)
            ret += base64_chars[char_array_4[j]];

        while (i++ < 3)
            ret += '=';
    }

    return ret;
}

std::vector<uint8_t> decode_string(const std::string& encoded) {
    // Padding may only appear at the end
    size_t data_len = encoded.size();
    while (data_len > 0 && encoded[data_len - 1] == '=') {
        data_len--;
    }
    if (encoded.size() - data_len > 2 || encoded.size() % 4 == 1) {
        throw CodecError("ironq: invalid base64 length");
    }

    std::vector<uint8_t> ret;
    ret.reserve((data_len * 3) / 4);

    int i = 0;
    uint8_t char_array_4[4], char_array_3[3];

    for (size_t in_ = 0; in_ < data_len; in_++) {
        size_t pos = base64_chars.find(encoded[in_]);
        if (pos == std::string::npos) {
            throw CodecError("ironq: invalid base64 character at offset " + std::to_string(in_));
        }
        char_array_4[i++] = static_cast<uint8_t>(pos);
        if (i == 4) {
            char_array_3[0] = (char_array_4[0] << 2) + ((char_array_4[1] & 0x30) >> 4);
            char_array_3[1] = ((char_array_4[1] & 0xf) << 4) + ((char_array_4[2] & 0x3c) >> 2);
            char_array_3[2] = ((char_array_4[2] & 0x3) << 6) + char_array_4[3];

            for (i = 0; i < 3; i++)
                ret.push_back(char_array_3[i]);
            i = 0;
        }
    }

    if (i == 1) {
        throw CodecError("ironq: truncated base64 input");
    }

    if (i) {
        char_array_3[0] = (char_array_4[0] << 2) + ((char_array_4[1] & 0x30) >> 4);
        char_array_3[1] = ((char_array_4[1] & 0xf) << 4) + ((char_array_4[2] & 0x3c) >> 2);

        for (int j = 0; j < i - 1; j++)
            ret.push_back(char_array_3[j]);
    }

    return ret;
}

} // namespace ironq
