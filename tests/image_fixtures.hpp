#pragma once

#include <cstdint>
#include <vector>

namespace clipstash::testing {

// Minimal headers; enough bytes for dimension parsing, not decodable images

inline std::vector<uint8_t> make_png(uint32_t width, uint32_t height) {
    std::vector<uint8_t> png = {
        0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n',
        0x00, 0x00, 0x00, 0x0D, 'I', 'H', 'D', 'R'
    };
    for (const uint32_t v : {width, height}) {
        png.push_back(static_cast<uint8_t>(v >> 24));
        png.push_back(static_cast<uint8_t>(v >> 16));
        png.push_back(static_cast<uint8_t>(v >> 8));
        png.push_back(static_cast<uint8_t>(v));
    }
    // bit depth, colour type, compression, filter, interlace, CRC
    png.insert(png.end(), {8, 6, 0, 0, 0, 0xDE, 0xAD, 0xBE, 0xEF});
    return png;
}

inline std::vector<uint8_t> make_gif(uint16_t width, uint16_t height) {
    return {
        'G', 'I', 'F', '8', '9', 'a',
        static_cast<uint8_t>(width & 0xFF), static_cast<uint8_t>(width >> 8),
        static_cast<uint8_t>(height & 0xFF), static_cast<uint8_t>(height >> 8),
        0x00, 0x00, 0x00
    };
}

inline std::vector<uint8_t> make_jpeg(uint16_t width, uint16_t height) {
    return {
        0xFF, 0xD8,                                     // SOI
        0xFF, 0xE0, 0x00, 0x04, 'J', 'F',               // APP0, truncated payload
        0xFF, 0xC4, 0x00, 0x03, 0x00,                   // DHT (not a frame header)
        0xFF, 0xC0, 0x00, 0x11, 0x08,                   // SOF0, precision 8
        static_cast<uint8_t>(height >> 8), static_cast<uint8_t>(height & 0xFF),
        static_cast<uint8_t>(width >> 8), static_cast<uint8_t>(width & 0xFF),
        0x03
    };
}

inline std::vector<uint8_t> make_bmp(int32_t width, int32_t height) {
    std::vector<uint8_t> bmp(26, 0);
    bmp[0] = 'B';
    bmp[1] = 'M';
    bmp[14] = 40;   // BITMAPINFOHEADER
    const auto w = static_cast<uint32_t>(width);
    const auto h = static_cast<uint32_t>(height);
    for (int i = 0; i < 4; ++i) {
        bmp[18 + i] = static_cast<uint8_t>(w >> (8 * i));
        bmp[22 + i] = static_cast<uint8_t>(h >> (8 * i));
    }
    return bmp;
}

} // namespace clipstash::testing
