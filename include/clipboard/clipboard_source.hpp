#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <cstdint>

namespace clipstash {

/**
 * @brief Read side of the system clipboard
 *
 * The change counter increments whenever the clipboard owner changes its
 * content. Failures are transient; the monitor retries on the next tick.
 */
class IClipboardSource {
public:
    virtual ~IClipboardSource() = default;

    [[nodiscard]] virtual Result<int64_t> current_change_count() = 0;

    /// Current clipboard content as one of text, image bytes or file paths
    [[nodiscard]] virtual Result<RawCapture> read_payload() = 0;
};

/**
 * @brief Write side of the system clipboard (restore)
 */
class IClipboardSink {
public:
    virtual ~IClipboardSink() = default;

    [[nodiscard]] virtual Status write_payload(const RawCapture& payload) = 0;
};

} // namespace clipstash
