#include "classifier/content_classifier.hpp"
#include "classifier/image_header.hpp"
#include "fingerprint/fingerprinter.hpp"
#include "core/utils.hpp"

#include <filesystem>
#include <format>
#include <span>
#include <stdexcept>
#include <type_traits>

namespace clipstash {

namespace {

using ClassifyResult = Result<std::optional<ClassifiedPayload>>;

ClassifyResult skip() {
    return ClassifyResult::ok(std::nullopt);
}

std::string display_name(const std::string& path) {
    const std::filesystem::path p(path);
    const std::string name = p.filename().string();
    if (!name.empty()) return name;
    // Trailing separator: fall back to the last directory component
    const std::string parent = p.parent_path().filename().string();
    return parent.empty() ? path : parent;
}

} // anonymous namespace

ContentClassifier::ContentClassifier(const Config& config,
                                     std::shared_ptr<const ArtifactStore> artifacts)
    : config_(config),
      artifacts_(std::move(artifacts)) {}

ClassifyResult ContentClassifier::classify(const RawCapture& capture) const {
    try {
        return std::visit([this](const auto& payload) -> ClassifyResult {
            using T = std::decay_t<decltype(payload)>;
            if constexpr (std::is_same_v<T, TextPayload>) {
                return classify_text(payload);
            } else if constexpr (std::is_same_v<T, ImagePayload>) {
                return classify_image(payload);
            } else {
                static_assert(std::is_same_v<T, FilePayload>);
                return classify_files(payload);
            }
        }, capture);
    } catch (const std::exception& e) {
        return ClassifyResult::error(ErrorCategory::INTERNAL_ERROR,
            std::format("Classification failed: {}", e.what()));
    }
}

ClassifyResult ContentClassifier::classify_text(const TextPayload& payload) const {
    if (payload.text.empty()) return skip();
    if (payload.text.size() > config_.max_text_bytes) {
        utils::log::warn(std::format("Text too large ({} bytes > {}), skipping",
                                     payload.text.size(), config_.max_text_bytes));
        return skip();
    }

    ClassifiedPayload out;
    out.content_type = ContentType::TEXT;
    out.normalized = payload.text;
    out.raw_payload = payload.text;
    out.display_text = utils::make_preview(payload.text, config_.preview_length);
    out.fingerprint = Fingerprinter::fingerprint(ContentType::TEXT, out.normalized);
    return ClassifyResult::ok(std::move(out));
}

ClassifyResult ContentClassifier::classify_image(const ImagePayload& payload) const {
    if (payload.bytes.empty()) return skip();
    if (payload.bytes.size() > config_.max_image_bytes) {
        utils::log::warn(std::format("Image too large ({} bytes > {}), skipping",
                                     payload.bytes.size(), config_.max_image_bytes));
        return skip();
    }
    if (!artifacts_) {
        return ClassifyResult::error(ErrorCategory::INTERNAL_ERROR,
            "No artifact directory configured for image capture");
    }

    const std::span<const uint8_t> bytes(payload.bytes);

    ClassifiedPayload out;
    out.content_type = ContentType::IMAGE;
    out.normalized.assign(reinterpret_cast<const char*>(bytes.data()), bytes.size());
    out.fingerprint = Fingerprinter::fingerprint(ContentType::IMAGE, out.normalized);

    // Artifact must be on disk before the row can exist
    const auto written = artifacts_->write(out.fingerprint.hex, bytes);
    if (written.is_error()) {
        return ClassifyResult::error_from(written);
    }
    out.artifact_path = artifacts_->path_for(out.fingerprint.hex).string();
    out.artifact_created = written.value();
    out.raw_payload = out.artifact_path;

    if (const auto dims = ImageHeaderParser::parse(bytes)) {
        out.display_text = std::format("[Image: {}x{}]", dims->width, dims->height);
    } else {
        out.display_text = "[Image]";
        out.degradation = std::format("Unreadable image header ({} bytes, mime '{}')",
                                      bytes.size(), payload.mime_type);
    }
    return ClassifyResult::ok(std::move(out));
}

ClassifyResult ContentClassifier::classify_files(const FilePayload& payload) const {
    std::vector<std::string> paths;
    paths.reserve(payload.paths.size());
    for (const auto& p : payload.paths) {
        if (!p.empty()) paths.push_back(p);
    }
    if (paths.empty()) return skip();

    std::string joined;
    for (size_t i = 0; i < paths.size(); ++i) {
        if (i > 0) joined += kPathSeparator;
        joined += paths[i];
    }

    std::string label;
    if (paths.size() == 1) {
        label = display_name(paths.front());
    } else {
        label = std::format("{} files: {}, ...", paths.size(), display_name(paths.front()));
    }

    ClassifiedPayload out;
    out.content_type = ContentType::FILE_REFERENCE;
    out.normalized = joined;
    out.raw_payload = std::move(joined);
    out.display_text = utils::make_preview(label, config_.preview_length);
    out.fingerprint = Fingerprinter::fingerprint(ContentType::FILE_REFERENCE, out.normalized);
    return ClassifyResult::ok(std::move(out));
}

} // namespace clipstash
