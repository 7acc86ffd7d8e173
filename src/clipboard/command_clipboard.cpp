#include "clipboard/command_clipboard.hpp"
#include "classifier/image_header.hpp"
#include "fingerprint/fingerprinter.hpp"
#include "core/utils.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <format>
#include <span>

namespace clipstash {

namespace {

constexpr std::string_view kUriListType = "text/uri-list";

constexpr std::array<std::string_view, 5> kTextTypes = {
    "text/plain;charset=utf-8", "text/plain", "UTF8_STRING", "STRING", "TEXT"
};

std::string shell_quote(const std::string& arg) {
    std::string out = "'";
    for (const char c : arg) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}

// Run a command and collect stdout; non-zero exit is an error
Result<std::string> run_capture(const std::string& cmd) {
    FILE* pipe = ::popen((cmd + " 2>/dev/null").c_str(), "r");
    if (!pipe) {
        return Result<std::string>::error(ErrorCategory::CAPTURE_ERROR,
            std::format("Cannot run '{}'", cmd));
    }

    std::string output;
    std::array<char, 65536> buf;
    size_t n;
    while ((n = std::fread(buf.data(), 1, buf.size(), pipe)) > 0) {
        output.append(buf.data(), n);
    }

    const int status = ::pclose(pipe);
    if (status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        return Result<std::string>::error(ErrorCategory::CAPTURE_ERROR,
            std::format("'{}' failed (status {})", cmd, status));
    }
    return Result<std::string>::ok(std::move(output));
}

// Run a command feeding data on stdin
Status run_feed(const std::string& cmd, std::string_view data) {
    FILE* pipe = ::popen(cmd.c_str(), "w");
    if (!pipe) {
        return Status::error(ErrorCategory::CAPTURE_ERROR, std::format("Cannot run '{}'", cmd));
    }

    const size_t written = std::fwrite(data.data(), 1, data.size(), pipe);
    const int status = ::pclose(pipe);
    if (written != data.size() || status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        return Status::error(ErrorCategory::CAPTURE_ERROR,
            std::format("'{}' failed (status {}, wrote {} of {} bytes)",
                        cmd, status, written, data.size()));
    }
    return ok_status();
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string percent_decode(std::string_view in) {
    std::string out;
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        if (in[i] == '%' && i + 2 < in.size()) {
            const int hi = hex_value(in[i + 1]);
            const int lo = hex_value(in[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>((hi << 4) | lo);
                i += 2;
                continue;
            }
        }
        out += in[i];
    }
    return out;
}

std::string_view mime_for(ImageFormat format) {
    switch (format) {
        case ImageFormat::PNG:     return "image/png";
        case ImageFormat::JPEG:    return "image/jpeg";
        case ImageFormat::GIF:     return "image/gif";
        case ImageFormat::BMP:     return "image/bmp";
        case ImageFormat::TIFF:    return "image/tiff";
        case ImageFormat::UNKNOWN: break;
    }
    return "image/png";
}

} // anonymous namespace

CommandClipboard::CommandClipboard() : CommandClipboard(Config{}) {}

CommandClipboard::CommandClipboard(Config config) : config_(std::move(config)) {}

CommandClipboard::~CommandClipboard() {
    if (watch_pid_ > 0) {
        watch_stopping_.store(true);
        ::kill(watch_pid_, SIGTERM);
        ::waitpid(watch_pid_, nullptr, 0);
    }
    // The reader sees EOF once the child is gone
    if (watch_thread_.joinable()) {
        watch_thread_.join();
    }
}

std::optional<std::string> CommandClipboard::preferred_type(const std::vector<std::string>& types) {
    for (const auto& t : types) {
        if (t == kUriListType) return t;
    }
    for (const auto& t : types) {
        if (t.starts_with("image/")) return t;
    }
    for (const auto want : kTextTypes) {
        for (const auto& t : types) {
            if (t == want) return t;
        }
    }
    for (const auto& t : types) {
        if (t.starts_with("text/")) return t;
    }
    return std::nullopt;
}

std::vector<std::string> CommandClipboard::parse_uri_list(const std::string& body) {
    std::vector<std::string> paths;
    for (auto line : utils::split(body, '\n')) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        line = utils::trim(line);
        if (line.empty() || line.front() == '#') continue;

        std::string_view uri(line);
        if (!uri.starts_with("file://")) continue;
        uri.remove_prefix(7);
        // file://host/path: drop an optional host part
        if (!uri.empty() && uri.front() != '/') {
            const auto slash = uri.find('/');
            if (slash == std::string_view::npos) continue;
            uri.remove_prefix(slash);
        }
        paths.push_back(percent_decode(uri));
    }
    return paths;
}

std::string CommandClipboard::to_file_uri(const std::string& path) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out = "file://";
    for (const char c : path) {
        const auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '/' || c == '-' || c == '_' || c == '.' || c == '~') {
            out += c;
        } else {
            out += '%';
            out += kHex[uc >> 4];
            out += kHex[uc & 0x0F];
        }
    }
    return out;
}

Result<std::string> CommandClipboard::select_type() const {
    using R = Result<std::string>;

    auto listed = run_capture(config_.paste_command + " --list-types");
    if (listed.is_error()) {
        return R::error_from(listed);
    }

    std::vector<std::string> types;
    for (auto& t : utils::split(listed.value(), '\n')) {
        t = utils::trim(t);
        if (!t.empty()) types.push_back(std::move(t));
    }

    auto mime = preferred_type(types);
    if (!mime) {
        return R::error(ErrorCategory::CAPTURE_ERROR, "Clipboard offers no supported type");
    }
    return R::ok(std::move(*mime));
}

Result<CommandClipboard::Snapshot> CommandClipboard::take_snapshot() const {
    using R = Result<Snapshot>;

    auto mime = select_type();
    if (mime.is_error()) {
        return R::error_from(mime);
    }

    auto content = run_capture(std::format("{} --no-newline --type {}",
                                           config_.paste_command, shell_quote(mime.value())));
    if (content.is_error()) {
        return R::error_from(content);
    }
    return R::ok(Snapshot{std::move(mime.value()), std::move(content.value())});
}

Result<std::string> CommandClipboard::content_signature() const {
    using R = Result<std::string>;

    auto mime = select_type();
    if (mime.is_error()) {
        return R::error_from(mime);
    }

    auto prefix = run_capture(std::format("{} --no-newline --type {} 2>/dev/null | head -c {}",
                                          config_.paste_command, shell_quote(mime.value()),
                                          config_.signature_bytes));
    if (prefix.is_error()) {
        return R::error_from(prefix);
    }
    return R::ok(mime.value() + '\0' + prefix.value());
}

RawCapture CommandClipboard::to_capture(const Snapshot& snapshot) {
    if (snapshot.mime_type == kUriListType) {
        return FilePayload{parse_uri_list(snapshot.content)};
    }
    if (snapshot.mime_type.starts_with("image/")) {
        ImagePayload image;
        image.bytes.assign(snapshot.content.begin(), snapshot.content.end());
        image.mime_type = snapshot.mime_type;
        return image;
    }
    return TextPayload{snapshot.content};
}

void CommandClipboard::start_watcher() {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        utils::log::warn(std::format("Clipboard watcher: pipe failed (errno {})", errno));
        return;
    }

    const std::string cmd = std::format("exec {} --watch echo", config_.paste_command);
    const pid_t pid = ::fork();
    if (pid < 0) {
        utils::log::warn(std::format("Clipboard watcher: fork failed (errno {})", errno));
        ::close(fds[0]);
        ::close(fds[1]);
        return;
    }

    if (pid == 0) {
        ::dup2(fds[1], STDOUT_FILENO);
        const int devnull = ::open("/dev/null", O_WRONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDERR_FILENO);
            ::close(devnull);
        }
        ::execl("/bin/sh", "sh", "-c", cmd.c_str(), static_cast<char*>(nullptr));
        ::_exit(127);
    }

    ::close(fds[1]);
    watch_pid_ = pid;
    watch_alive_.store(true);
    watch_thread_ = std::thread([this, fd = fds[0]] { watch_loop(fd); });
    utils::log::debug(std::format("Clipboard watcher started (pid {})", pid));
}

void CommandClipboard::watch_loop(int fd) {
    std::array<char, 256> buf;
    while (true) {
        const ssize_t n = ::read(fd, buf.data(), buf.size());
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;
        watch_events_.fetch_add(static_cast<uint64_t>(
            std::count(buf.begin(), buf.begin() + n, '\n')));
    }
    ::close(fd);
    watch_alive_.store(false);
    if (!watch_stopping_.load()) {
        utils::log::warn("Clipboard watcher exited; comparing content signatures each poll");
    }
}

bool CommandClipboard::watcher_running() {
    if (!config_.watch) return false;
    if (!watch_started_) {
        watch_started_ = true;
        start_watcher();
    }
    return watch_alive_.load();
}

void CommandClipboard::record_digest(const std::string& digest) {
    if (digest != last_digest_) {
        last_digest_ = digest;
        ++counter_;
    }
}

Result<int64_t> CommandClipboard::current_change_count() {
    std::unique_lock<std::mutex> lock(mutex_);

    if (watcher_running()) {
        const uint64_t events = watch_events_.load();
        if (seen_events_ && *seen_events_ == events) {
            return Result<int64_t>::ok(counter_);
        }
        lock.unlock();

        auto snapshot = take_snapshot();
        if (snapshot.is_error()) {
            return Result<int64_t>::error_from(snapshot);
        }
        const std::string digest = Fingerprinter::fingerprint(ContentType::TEXT,
            snapshot.value().mime_type + '\0' + snapshot.value().content).hex;

        lock.lock();
        seen_events_ = events;
        record_digest(digest);
        last_snapshot_ = std::move(snapshot.value());
        return Result<int64_t>::ok(counter_);
    }
    lock.unlock();

    auto signature = content_signature();
    if (signature.is_error()) {
        return Result<int64_t>::error_from(signature);
    }
    const std::string digest = Fingerprinter::fingerprint(ContentType::TEXT, signature.value()).hex;

    lock.lock();
    record_digest(digest);
    last_snapshot_.reset();
    return Result<int64_t>::ok(counter_);
}

Result<RawCapture> CommandClipboard::read_payload() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (last_snapshot_) {
            auto capture = to_capture(*last_snapshot_);
            last_snapshot_.reset();
            return Result<RawCapture>::ok(std::move(capture));
        }
    }

    auto snapshot = take_snapshot();
    if (snapshot.is_error()) {
        return Result<RawCapture>::error_from(snapshot);
    }
    return Result<RawCapture>::ok(to_capture(snapshot.value()));
}

Status CommandClipboard::write_payload(const RawCapture& payload) {
    if (const auto* text = std::get_if<TextPayload>(&payload)) {
        return run_feed(config_.copy_command + " --type text/plain", text->text);
    }

    if (const auto* image = std::get_if<ImagePayload>(&payload)) {
        std::string mime = image->mime_type;
        if (mime.empty()) {
            mime = std::string(mime_for(ImageHeaderParser::detect_format(std::span(image->bytes))));
        }
        const std::string_view bytes(reinterpret_cast<const char*>(image->bytes.data()),
                                     image->bytes.size());
        return run_feed(std::format("{} --type {}", config_.copy_command, shell_quote(mime)), bytes);
    }

    const auto& files = std::get<FilePayload>(payload);
    std::string body;
    for (const auto& path : files.paths) {
        body += to_file_uri(path);
        body += "\r\n";
    }
    return run_feed(config_.copy_command + " --type text/uri-list", body);
}

} // namespace clipstash
