#include "tus/upload/metadata.hpp"

#include <openssl/evp.h>

#include <cstdint>

namespace tus::upload {
namespace {

bool is_base64_char(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '+' || c == '/';
}

std::string_view trim(std::string_view text) {
    const auto is_space = [](char c) { return c == ' ' || c == '\t'; };
    while (!text.empty() && is_space(text.front())) {
        text.remove_prefix(1);
    }
    while (!text.empty() && is_space(text.back())) {
        text.remove_suffix(1);
    }
    return text;
}

bool valid_key(std::string_view key) {
    if (key.empty()) {
        return false;
    }
    for (char c : key) {
        const auto uc = static_cast<unsigned char>(c);
        if (uc <= 0x20 || uc >= 0x7f || c == ',') {
            return false;
        }
    }
    return true;
}

} // namespace

std::string encode_base64(std::string_view bytes) {
    if (bytes.empty()) {
        return {};
    }

    // EVP_EncodeBlock appends a NUL after the 4*ceil(n/3) output characters
    std::string output(((bytes.size() + 2) / 3) * 4 + 1, '\0');
    const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(output.data()),
                                        reinterpret_cast<const unsigned char*>(bytes.data()),
                                        static_cast<int>(bytes.size()));
    output.resize(written < 0 ? 0 : static_cast<std::size_t>(written));
    return output;
}

Result<std::string> decode_base64(std::string_view text) {
    if (text.size() % 4 != 0) {
        return Err<std::string, std::string>("base64 length is not a multiple of 4");
    }
    if (text.empty()) {
        return Ok(std::string());
    }

    std::size_t padding = 0;
    if (text.back() == '=') {
        padding = text[text.size() - 2] == '=' ? 2 : 1;
    }

    // EVP_DecodeBlock accepts surrounding whitespace and '=' anywhere
    for (std::size_t i = 0; i < text.size() - padding; ++i) {
        if (!is_base64_char(text[i])) {
            return Err<std::string, std::string>("invalid base64 character at position " + std::to_string(i));
        }
    }

    std::string output((text.size() / 4) * 3, '\0');
    const int decoded = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(output.data()),
                                        reinterpret_cast<const unsigned char*>(text.data()),
                                        static_cast<int>(text.size()));
    if (decoded < 0 || static_cast<std::size_t>(decoded) < padding) {
        return Err<std::string, std::string>("malformed base64 input");
    }

    // Decoded length counts the padding as zero bytes
    output.resize(static_cast<std::size_t>(decoded) - padding);
    return Ok(std::move(output));
}

UploadResult<Metadata> parse_metadata(std::string_view header) {
    Metadata metadata;
    if (trim(header).empty()) {
        return Ok<Metadata, Error>(std::move(metadata));
    }

    std::size_t start = 0;
    while (start <= header.size()) {
        const auto comma = header.find(',', start);
        const auto end = comma == std::string_view::npos ? header.size() : comma;
        const auto pair = trim(header.substr(start, end - start));

        if (pair.empty()) {
            return fail<Metadata>(ErrorCode::ProtocolViolation, "Upload-Metadata contains an empty pair");
        }

        const auto space = pair.find(' ');
        const auto key = pair.substr(0, space);
        if (!valid_key(key)) {
            return fail<Metadata>(ErrorCode::ProtocolViolation,
                                  "Upload-Metadata has an invalid key in '" + std::string(pair) + "'");
        }

        std::string value;
        if (space != std::string_view::npos) {
            const auto encoded = pair.substr(space + 1);
            if (encoded.find_first_of(" \t") != std::string_view::npos) {
                return fail<Metadata>(ErrorCode::ProtocolViolation,
                                      "Upload-Metadata value for '" + std::string(key) + "' contains whitespace");
            }
            auto decoded = decode_base64(encoded);
            if (decoded.is_error()) {
                return fail<Metadata>(ErrorCode::ProtocolViolation,
                                      "Upload-Metadata value for '" + std::string(key) + "': " + decoded.error());
            }
            value = std::move(decoded.value());
        }

        if (!metadata.emplace(std::string(key), std::move(value)).second) {
            return fail<Metadata>(ErrorCode::ProtocolViolation,
                                  "Upload-Metadata repeats key '" + std::string(key) + "'");
        }

        if (comma == std::string_view::npos) {
            break;
        }
        start = comma + 1;
    }

    return Ok<Metadata, Error>(std::move(metadata));
}

std::string format_metadata(const Metadata& metadata) {
    std::string header;
    for (const auto& [key, value] : metadata) {
        if (!header.empty()) {
            header += ',';
        }
        header += key;
        if (!value.empty()) {
            header += ' ';
            header += encode_base64(value);
        }
    }
    return header;
}

} // namespace tus::upload
