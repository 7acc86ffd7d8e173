#pragma once

#include "clipboard/clipboard_source.hpp"

#include <mutex>
#include <vector>

namespace clipstash::testing {

/**
 * @brief In-memory clipboard: the test sets content, the counter follows
 *
 * write_payload() behaves like the real clipboard: the written content
 * becomes current and the counter increments.
 */
class MockClipboard : public IClipboardSource, public IClipboardSink {
public:
    void set(RawCapture payload) {
        std::lock_guard<std::mutex> lock(mutex_);
        current_ = std::move(payload);
        ++counter_;
    }

    void set_text(std::string text) { set(TextPayload{std::move(text)}); }

    void set_image(std::vector<uint8_t> bytes, std::string mime = "image/png") {
        set(ImagePayload{std::move(bytes), std::move(mime)});
    }

    void set_files(std::vector<std::string> paths) { set(FilePayload{std::move(paths)}); }

    void set_counter_fails(bool fails) { counter_fails_ = fails; }
    void set_read_fails(bool fails) { read_fails_ = fails; }
    void set_write_fails(bool fails) { write_fails_ = fails; }

    [[nodiscard]] Result<int64_t> current_change_count() override {
        if (counter_fails_) {
            return Result<int64_t>::error(ErrorCategory::CAPTURE_ERROR, "Mock counter failure");
        }
        std::lock_guard<std::mutex> lock(mutex_);
        return Result<int64_t>::ok(counter_);
    }

    [[nodiscard]] Result<RawCapture> read_payload() override {
        ++read_count_;
        if (read_fails_) {
            return Result<RawCapture>::error(ErrorCategory::CAPTURE_ERROR, "Mock read failure");
        }
        std::lock_guard<std::mutex> lock(mutex_);
        return Result<RawCapture>::ok(current_);
    }

    [[nodiscard]] Status write_payload(const RawCapture& payload) override {
        if (write_fails_) {
            return Status::error(ErrorCategory::CAPTURE_ERROR, "Mock write failure");
        }
        written_.push_back(payload);
        set(payload);
        return ok_status();
    }

    [[nodiscard]] const std::vector<RawCapture>& written() const { return written_; }
    [[nodiscard]] int read_count() const { return read_count_; }

private:
    std::mutex mutex_;
    RawCapture current_ = TextPayload{};
    int64_t counter_ = 0;
    bool counter_fails_ = false;
    bool read_fails_ = false;
    bool write_fails_ = false;
    int read_count_ = 0;
    std::vector<RawCapture> written_;
};

} // namespace clipstash::testing
