/*
 * certrun - Certification Session Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "certrun/envelope.hpp"
#include "certrun/logger.hpp"
#include <zlib.h>
#include <array>
#include <cstring>

namespace certrun {

namespace {
constexpr int kGzipWindowBits = 16 + MAX_WBITS;
constexpr std::size_t kChunkSize = 16384;

constexpr char kBase64Alphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

int base64Value(char c) noexcept {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}
}

std::optional<std::string> gzipCompress(const std::string& data) noexcept {
    try {
        z_stream stream;
        std::memset(&stream, 0, sizeof(stream));
        if (deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED, kGzipWindowBits, 8,
                         Z_DEFAULT_STRATEGY) != Z_OK) {
            LOG_ERROR("deflateInit2 failed");
            return std::nullopt;
        }

        stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
        stream.avail_in = static_cast<uInt>(data.size());

        std::string out;
        std::array<char, kChunkSize> buffer;
        int rc = Z_OK;
        do {
            stream.next_out = reinterpret_cast<Bytef*>(buffer.data());
            stream.avail_out = static_cast<uInt>(buffer.size());
            rc = deflate(&stream, Z_FINISH);
            if (rc == Z_STREAM_ERROR) {
                deflateEnd(&stream);
                LOG_ERROR("deflate failed");
                return std::nullopt;
            }
            out.append(buffer.data(), buffer.size() - stream.avail_out);
        } while (rc != Z_STREAM_END);

        deflateEnd(&stream);
        return out;
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("gzip compression failed: ") + e.what());
        return std::nullopt;
    }
}

std::optional<std::string> gzipDecompress(const std::string& data) noexcept {
    try {
        z_stream stream;
        std::memset(&stream, 0, sizeof(stream));
        if (inflateInit2(&stream, kGzipWindowBits) != Z_OK) {
            LOG_ERROR("inflateInit2 failed");
            return std::nullopt;
        }

        stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
        stream.avail_in = static_cast<uInt>(data.size());

        std::string out;
        std::array<char, kChunkSize> buffer;
        int rc = Z_OK;
        while (rc != Z_STREAM_END) {
            stream.next_out = reinterpret_cast<Bytef*>(buffer.data());
            stream.avail_out = static_cast<uInt>(buffer.size());
            rc = inflate(&stream, Z_NO_FLUSH);
            if (rc != Z_OK && rc != Z_STREAM_END) {
                inflateEnd(&stream);
                LOG_DEBUG("inflate failed with code " + std::to_string(rc));
                return std::nullopt;
            }
            out.append(buffer.data(), buffer.size() - stream.avail_out);
            if (rc == Z_OK && stream.avail_in == 0 && stream.avail_out != 0) {
                // Truncated input.
                inflateEnd(&stream);
                LOG_DEBUG("gzip stream is truncated");
                return std::nullopt;
            }
        }

        inflateEnd(&stream);
        return out;
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("gzip decompression failed: ") + e.what());
        return std::nullopt;
    }
}

std::string base64Encode(const std::string& data) {
    std::string out;
    out.reserve((data.size() + 2) / 3 * 4);
    std::size_t i = 0;
    for (; i + 2 < data.size(); i += 3) {
        unsigned v = (static_cast<unsigned char>(data[i]) << 16) |
                     (static_cast<unsigned char>(data[i + 1]) << 8) |
                     static_cast<unsigned char>(data[i + 2]);
        out += kBase64Alphabet[(v >> 18) & 0x3F];
        out += kBase64Alphabet[(v >> 12) & 0x3F];
        out += kBase64Alphabet[(v >> 6) & 0x3F];
        out += kBase64Alphabet[v & 0x3F];
    }
    std::size_t rest = data.size() - i;
    if (rest == 1) {
        unsigned v = static_cast<unsigned char>(data[i]) << 16;
        out += kBase64Alphabet[(v >> 18) & 0x3F];
        out += kBase64Alphabet[(v >> 12) & 0x3F];
        out += "==";
    } else if (rest == 2) {
        unsigned v = (static_cast<unsigned char>(data[i]) << 16) |
                     (static_cast<unsigned char>(data[i + 1]) << 8);
        out += kBase64Alphabet[(v >> 18) & 0x3F];
        out += kBase64Alphabet[(v >> 12) & 0x3F];
        out += kBase64Alphabet[(v >> 6) & 0x3F];
        out += '=';
    }
    return out;
}

std::optional<std::string> base64Decode(const std::string& text) {
    if (text.size() % 4 != 0) {
        return std::nullopt;
    }
    std::string out;
    out.reserve(text.size() / 4 * 3);
    for (std::size_t i = 0; i < text.size(); i += 4) {
        int values[4];
        int padding = 0;
        for (int k = 0; k < 4; ++k) {
            char c = text[i + k];
            if (c == '=') {
                // Padding only in the last two positions of the last quad.
                if (i + 4 != text.size() || k < 2) {
                    return std::nullopt;
                }
                values[k] = 0;
                ++padding;
            } else {
                if (padding > 0) {
                    return std::nullopt;
                }
                values[k] = base64Value(c);
                if (values[k] < 0) {
                    return std::nullopt;
                }
            }
        }
        unsigned v = (values[0] << 18) | (values[1] << 12) | (values[2] << 6) | values[3];
        out += static_cast<char>((v >> 16) & 0xFF);
        if (padding < 2) {
            out += static_cast<char>((v >> 8) & 0xFF);
        }
        if (padding < 1) {
            out += static_cast<char>(v & 0xFF);
        }
    }
    return out;
}

}
