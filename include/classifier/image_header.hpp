#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

namespace clipstash {

enum class ImageFormat {
    UNKNOWN,
    PNG,
    JPEG,
    GIF,
    BMP,
    TIFF
};

[[nodiscard]] inline constexpr std::string_view image_format_name(ImageFormat format) noexcept {
    switch (format) {
        case ImageFormat::PNG:  return "png";
        case ImageFormat::JPEG: return "jpeg";
        case ImageFormat::GIF:  return "gif";
        case ImageFormat::BMP:  return "bmp";
        case ImageFormat::TIFF: return "tiff";
        case ImageFormat::UNKNOWN: break;
    }
    return "unknown";
}

struct ImageDimensions {
    ImageFormat format = ImageFormat::UNKNOWN;
    uint32_t width = 0;
    uint32_t height = 0;
};

/**
 * @brief Header-only image dimension reader
 *
 * Reads just the fields that carry width/height, never decodes pixels:
 * - PNG:  IHDR chunk (bytes 16-23, big-endian)
 * - GIF:  logical screen descriptor (bytes 6-9, little-endian)
 * - BMP:  BITMAPINFOHEADER / BITMAPCOREHEADER after the 14-byte file header
 * - JPEG: first SOFn segment, walking the marker chain
 * - TIFF: ImageWidth (256) / ImageLength (257) tags of the first IFD
 */
class ImageHeaderParser {
public:
    /// Identify the container from its magic bytes
    [[nodiscard]] static ImageFormat detect_format(std::span<const uint8_t> data);

    /**
     * @brief Parse dimensions from the header
     * @return nullopt if the format is unknown, the header is truncated, or a
     *         dimension is zero
     */
    [[nodiscard]] static std::optional<ImageDimensions> parse(std::span<const uint8_t> data);

private:
    static std::optional<ImageDimensions> parse_png(std::span<const uint8_t> data);
    static std::optional<ImageDimensions> parse_gif(std::span<const uint8_t> data);
    static std::optional<ImageDimensions> parse_bmp(std::span<const uint8_t> data);
    static std::optional<ImageDimensions> parse_jpeg(std::span<const uint8_t> data);
    static std::optional<ImageDimensions> parse_tiff(std::span<const uint8_t> data);
};

} // namespace clipstash
