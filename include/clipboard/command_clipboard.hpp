#pragma once

#include "clipboard/clipboard_source.hpp"

#include <sys/types.h>

#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace clipstash {

/**
 * @brief Wayland clipboard through wl-paste / wl-copy
 *
 * wl-paste has no change counter, so one is derived. A `wl-paste --watch`
 * child prints a line each time the selection changes; a poll with no new
 * line costs nothing. After a line the preferred representation is read and
 * digested, and the counter increments when the digest differs from the last
 * one. Those bytes are kept so read_payload() right after does not run
 * wl-paste again.
 *
 * Without a watcher (disabled, or the child exited) each poll digests the
 * offered type list plus the first signature_bytes of the preferred
 * representation, and read_payload() reads the full content.
 *
 * Preferred representation: text/uri-list (files), then image/*, then text.
 */
class CommandClipboard : public IClipboardSource, public IClipboardSink {
public:
    struct Config {
        std::string paste_command = "wl-paste";
        std::string copy_command = "wl-copy";
        bool watch = true;                   // follow changes with `paste_command --watch`
        size_t signature_bytes = 64 * 1024;  // content prefix compared when not watching
    };

    CommandClipboard();
    explicit CommandClipboard(Config config);
    ~CommandClipboard() override;

    CommandClipboard(const CommandClipboard&) = delete;
    CommandClipboard& operator=(const CommandClipboard&) = delete;

    [[nodiscard]] Result<int64_t> current_change_count() override;
    [[nodiscard]] Result<RawCapture> read_payload() override;
    [[nodiscard]] Status write_payload(const RawCapture& payload) override;

    /// Pick the representation to capture from an offered type list
    [[nodiscard]] static std::optional<std::string> preferred_type(const std::vector<std::string>& types);

    /// Parse a text/uri-list body into local paths (file:// only, percent-decoded)
    [[nodiscard]] static std::vector<std::string> parse_uri_list(const std::string& body);

    /// Encode a local path as a file:// URI
    [[nodiscard]] static std::string to_file_uri(const std::string& path);

    /// True while the watch child is running and reporting changes
    [[nodiscard]] bool watching() const { return watch_alive_.load(); }

private:
    struct Snapshot {
        std::string mime_type;
        std::string content;
    };

    Result<std::string> select_type() const;
    Result<Snapshot> take_snapshot() const;
    Result<std::string> content_signature() const;
    static RawCapture to_capture(const Snapshot& snapshot);

    bool watcher_running();
    void start_watcher();
    void watch_loop(int fd);
    void record_digest(const std::string& digest);  // caller holds mutex_

    Config config_;
    std::mutex mutex_;
    int64_t counter_ = 0;
    std::string last_digest_;
    std::optional<Snapshot> last_snapshot_;

    bool watch_started_ = false;
    pid_t watch_pid_ = -1;
    std::atomic<bool> watch_alive_{false};
    std::atomic<bool> watch_stopping_{false};
    std::atomic<uint64_t> watch_events_{0};
    std::optional<uint64_t> seen_events_;
    std::thread watch_thread_;
};

} // namespace clipstash
