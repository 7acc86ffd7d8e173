#include "classifier/image_header.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstdlib>

namespace clipstash {

namespace {

constexpr std::array<uint8_t, 8> kPngMagic = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'};

inline uint16_t be16(std::span<const uint8_t> d, size_t off) {
    return static_cast<uint16_t>((d[off] << 8) | d[off + 1]);
}

inline uint32_t be32(std::span<const uint8_t> d, size_t off) {
    return (static_cast<uint32_t>(d[off]) << 24) | (static_cast<uint32_t>(d[off + 1]) << 16) |
           (static_cast<uint32_t>(d[off + 2]) << 8) | static_cast<uint32_t>(d[off + 3]);
}

inline uint16_t le16(std::span<const uint8_t> d, size_t off) {
    return static_cast<uint16_t>(d[off] | (d[off + 1] << 8));
}

inline uint32_t le32(std::span<const uint8_t> d, size_t off) {
    return static_cast<uint32_t>(d[off]) | (static_cast<uint32_t>(d[off + 1]) << 8) |
           (static_cast<uint32_t>(d[off + 2]) << 16) | (static_cast<uint32_t>(d[off + 3]) << 24);
}

std::optional<ImageDimensions> make_dims(ImageFormat format, uint32_t w, uint32_t h) {
    if (w == 0 || h == 0) return std::nullopt;
    return ImageDimensions{format, w, h};
}

// SOF0-SOF15 carry frame dimensions; C4 (DHT), C8 (JPG ext), CC (DAC) do not
inline bool is_sof_marker(uint8_t m) {
    return m >= 0xC0 && m <= 0xCF && m != 0xC4 && m != 0xC8 && m != 0xCC;
}

// Markers with no length field
inline bool is_standalone_marker(uint8_t m) {
    return m == 0x01 || m == 0xD8 || (m >= 0xD0 && m <= 0xD7);
}

} // anonymous namespace

ImageFormat ImageHeaderParser::detect_format(std::span<const uint8_t> data) {
    if (data.size() >= kPngMagic.size() &&
        std::equal(kPngMagic.begin(), kPngMagic.end(), data.begin())) {
        return ImageFormat::PNG;
    }
    if (data.size() >= 3 && data[0] == 0xFF && data[1] == 0xD8 && data[2] == 0xFF) {
        return ImageFormat::JPEG;
    }
    if (data.size() >= 6 && data[0] == 'G' && data[1] == 'I' && data[2] == 'F' &&
        data[3] == '8' && (data[4] == '7' || data[4] == '9') && data[5] == 'a') {
        return ImageFormat::GIF;
    }
    if (data.size() >= 2 && data[0] == 'B' && data[1] == 'M') {
        return ImageFormat::BMP;
    }
    if (data.size() >= 4 &&
        ((data[0] == 'I' && data[1] == 'I' && data[2] == 42 && data[3] == 0) ||
         (data[0] == 'M' && data[1] == 'M' && data[2] == 0 && data[3] == 42))) {
        return ImageFormat::TIFF;
    }
    return ImageFormat::UNKNOWN;
}

std::optional<ImageDimensions> ImageHeaderParser::parse(std::span<const uint8_t> data) {
    switch (detect_format(data)) {
        case ImageFormat::PNG:  return parse_png(data);
        case ImageFormat::JPEG: return parse_jpeg(data);
        case ImageFormat::GIF:  return parse_gif(data);
        case ImageFormat::BMP:  return parse_bmp(data);
        case ImageFormat::TIFF: return parse_tiff(data);
        case ImageFormat::UNKNOWN: break;
    }
    return std::nullopt;
}

std::optional<ImageDimensions> ImageHeaderParser::parse_png(std::span<const uint8_t> data) {
    // magic(8) + length(4) + "IHDR"(4) + width(4) + height(4)
    if (data.size() < 24) return std::nullopt;
    if (data[12] != 'I' || data[13] != 'H' || data[14] != 'D' || data[15] != 'R') {
        return std::nullopt;
    }
    return make_dims(ImageFormat::PNG, be32(data, 16), be32(data, 20));
}

std::optional<ImageDimensions> ImageHeaderParser::parse_gif(std::span<const uint8_t> data) {
    if (data.size() < 10) return std::nullopt;
    return make_dims(ImageFormat::GIF, le16(data, 6), le16(data, 8));
}

std::optional<ImageDimensions> ImageHeaderParser::parse_bmp(std::span<const uint8_t> data) {
    if (data.size() < 18) return std::nullopt;
    const uint32_t dib_size = le32(data, 14);

    if (dib_size == 12) {
        // BITMAPCOREHEADER: 16-bit unsigned dimensions
        if (data.size() < 22) return std::nullopt;
        return make_dims(ImageFormat::BMP, le16(data, 18), le16(data, 20));
    }
    if (dib_size >= 40) {
        if (data.size() < 26) return std::nullopt;
        // Signed; negative height means a top-down bitmap
        const auto w = static_cast<int32_t>(le32(data, 18));
        const auto h = static_cast<int32_t>(le32(data, 22));
        if (w <= 0 || h == 0 || h == INT32_MIN) return std::nullopt;
        return make_dims(ImageFormat::BMP, static_cast<uint32_t>(w),
                         static_cast<uint32_t>(std::abs(h)));
    }
    return std::nullopt;
}

std::optional<ImageDimensions> ImageHeaderParser::parse_jpeg(std::span<const uint8_t> data) {
    size_t pos = 2;  // past SOI
    while (pos + 1 < data.size()) {
        if (data[pos] != 0xFF) return std::nullopt;

        // Fill bytes: any number of 0xFF before the marker code
        while (pos < data.size() && data[pos] == 0xFF) ++pos;
        if (pos >= data.size()) return std::nullopt;
        const uint8_t marker = data[pos++];

        if (is_standalone_marker(marker)) continue;
        if (marker == 0xD9 || marker == 0xDA) return std::nullopt;  // EOI / SOS before any SOF

        if (pos + 2 > data.size()) return std::nullopt;
        const uint16_t seg_len = be16(data, pos);
        if (seg_len < 2) return std::nullopt;

        if (is_sof_marker(marker)) {
            // length(2) precision(1) height(2) width(2)
            if (pos + 7 > data.size()) return std::nullopt;
            return make_dims(ImageFormat::JPEG, be16(data, pos + 5), be16(data, pos + 3));
        }
        pos += seg_len;
    }
    return std::nullopt;
}

std::optional<ImageDimensions> ImageHeaderParser::parse_tiff(std::span<const uint8_t> data) {
    if (data.size() < 8) return std::nullopt;
    const bool little = data[0] == 'I';

    auto rd16 = [&](size_t off) { return little ? le16(data, off) : be16(data, off); };
    auto rd32 = [&](size_t off) { return little ? le32(data, off) : be32(data, off); };

    const uint32_t ifd = rd32(4);
    if (static_cast<size_t>(ifd) + 2 > data.size()) return std::nullopt;
    const uint16_t count = rd16(ifd);

    constexpr uint16_t kTagWidth = 256;
    constexpr uint16_t kTagLength = 257;
    constexpr uint16_t kTypeShort = 3;
    constexpr uint16_t kTypeLong = 4;

    uint32_t width = 0;
    uint32_t height = 0;
    for (uint16_t i = 0; i < count; ++i) {
        const size_t entry = static_cast<size_t>(ifd) + 2 + static_cast<size_t>(i) * 12;
        if (entry + 12 > data.size()) return std::nullopt;

        const uint16_t tag = rd16(entry);
        if (tag != kTagWidth && tag != kTagLength) continue;

        const uint16_t type = rd16(entry + 2);
        uint32_t value = 0;
        if (type == kTypeShort) {
            value = rd16(entry + 8);
        } else if (type == kTypeLong) {
            value = rd32(entry + 8);
        } else {
            return std::nullopt;
        }
        (tag == kTagWidth ? width : height) = value;
        if (width != 0 && height != 0) break;
    }
    return make_dims(ImageFormat::TIFF, width, height);
}

} // namespace clipstash
