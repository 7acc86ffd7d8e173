#include <catch2/catch_test_macros.hpp>
#include "classifier/content_classifier.hpp"
#include "fingerprint/fingerprinter.hpp"
#include "image_fixtures.hpp"
#include "temp_dir.hpp"

using namespace clipstash;
using namespace clipstash::testing;

namespace {

struct ClassifierFixture {
    TempDir dir;
    std::shared_ptr<ArtifactStore> artifacts;
    ContentClassifier::Config cfg;

    ClassifierFixture() : artifacts(std::make_shared<ArtifactStore>(dir / "images", "img")) {
        REQUIRE(artifacts->ensure_directory().is_ok());
        cfg.preview_length = 20;
        cfg.max_text_bytes = 1000;
        cfg.max_image_bytes = 100'000;
    }

    ContentClassifier make() const { return ContentClassifier(cfg, artifacts); }
};

} // anonymous namespace

// ============================================================================
// Text
// ============================================================================

TEST_CASE("Classifier handles text", "[classifier]") {
    ClassifierFixture fx;
    const auto classifier = fx.make();

    SECTION("Short text keeps its bytes and gets a collapsed preview") {
        auto result = classifier.classify(TextPayload{"hello\n\n  world"});
        REQUIRE(result.is_ok());
        REQUIRE(result.value().has_value());
        const auto& item = *result.value();
        CHECK(item.content_type == ContentType::TEXT);
        CHECK(item.raw_payload == "hello\n\n  world");
        CHECK(item.display_text == "hello world");
        CHECK(item.fingerprint == Fingerprinter::fingerprint(ContentType::TEXT, "hello\n\n  world"));
        CHECK_FALSE(item.degradation.has_value());
    }

    SECTION("Long text preview is truncated") {
        auto result = classifier.classify(TextPayload{std::string(200, 'a')});
        REQUIRE(result.is_ok());
        REQUIRE(result.value().has_value());
        CHECK(result.value()->display_text == std::string(17, 'a') + "...");
        CHECK(result.value()->raw_payload.size() == 200);
    }

    SECTION("Empty text is skipped") {
        auto result = classifier.classify(TextPayload{""});
        REQUIRE(result.is_ok());
        CHECK_FALSE(result.value().has_value());
    }

    SECTION("Oversized text is skipped") {
        auto result = classifier.classify(TextPayload{std::string(1001, 'x')});
        REQUIRE(result.is_ok());
        CHECK_FALSE(result.value().has_value());
    }
}

// ============================================================================
// Images
// ============================================================================

TEST_CASE("Classifier handles images", "[classifier]") {
    ClassifierFixture fx;
    const auto classifier = fx.make();

    SECTION("PNG gets dimensions and an artifact") {
        const auto png = make_png(1920, 1080);
        auto result = classifier.classify(ImagePayload{png, "image/png"});
        REQUIRE(result.is_ok());
        REQUIRE(result.value().has_value());
        const auto& item = *result.value();
        CHECK(item.content_type == ContentType::IMAGE);
        CHECK(item.display_text == "[Image: 1920x1080]");
        CHECK(item.artifact_created);
        CHECK(item.raw_payload == item.artifact_path);
        CHECK(fx.artifacts->exists(item.artifact_path));
        CHECK(item.artifact_path == fx.artifacts->path_for(item.fingerprint.hex).string());
        CHECK(item.normalized.size() == png.size());
    }

    SECTION("Same image twice does not recreate the artifact") {
        const auto gif = make_gif(10, 20);
        auto first = classifier.classify(ImagePayload{gif, "image/gif"});
        auto second = classifier.classify(ImagePayload{gif, "image/gif"});
        REQUIRE(first.is_ok());
        REQUIRE(second.is_ok());
        CHECK(first.value()->artifact_created);
        CHECK_FALSE(second.value()->artifact_created);
        CHECK(first.value()->fingerprint == second.value()->fingerprint);
    }

    SECTION("Unreadable header degrades to a generic label") {
        auto result = classifier.classify(ImagePayload{{0x00, 0x01, 0x02, 0x03, 0x04}, "image/png"});
        REQUIRE(result.is_ok());
        REQUIRE(result.value().has_value());
        CHECK(result.value()->display_text == "[Image]");
        CHECK(result.value()->degradation.has_value());
        CHECK(fx.artifacts->exists(result.value()->artifact_path));
    }

    SECTION("Empty image is skipped") {
        auto result = classifier.classify(ImagePayload{{}, "image/png"});
        REQUIRE(result.is_ok());
        CHECK_FALSE(result.value().has_value());
    }

    SECTION("Oversized image is skipped without an artifact") {
        std::vector<uint8_t> big(100'001, 0xAB);
        auto result = classifier.classify(ImagePayload{big, "image/png"});
        REQUIRE(result.is_ok());
        CHECK_FALSE(result.value().has_value());
        CHECK(fx.artifacts->total_bytes() == 0);
    }

    SECTION("Same bytes as text and image fingerprint differently") {
        const std::string bytes = "GIF89a-not-really";
        auto as_text = classifier.classify(TextPayload{bytes});
        auto as_image = classifier.classify(
            ImagePayload{std::vector<uint8_t>(bytes.begin(), bytes.end()), "image/gif"});
        REQUIRE(as_text.is_ok());
        REQUIRE(as_image.is_ok());
        CHECK_FALSE(as_text.value()->fingerprint == as_image.value()->fingerprint);
    }
}

TEST_CASE("Classifier without an artifact store cannot capture images", "[classifier]") {
    ContentClassifier classifier(ContentClassifier::Config{}, nullptr);
    auto result = classifier.classify(ImagePayload{make_png(1, 1), "image/png"});
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::INTERNAL_ERROR);
}

// ============================================================================
// File references
// ============================================================================

TEST_CASE("Classifier handles file references", "[classifier]") {
    ClassifierFixture fx;
    fx.cfg.preview_length = 60;
    const auto classifier = fx.make();

    SECTION("Single file shows its name") {
        auto result = classifier.classify(FilePayload{{"/home/user/docs/report.pdf"}});
        REQUIRE(result.is_ok());
        REQUIRE(result.value().has_value());
        CHECK(result.value()->content_type == ContentType::FILE_REFERENCE);
        CHECK(result.value()->display_text == "report.pdf");
        CHECK(result.value()->raw_payload == "/home/user/docs/report.pdf");
    }

    SECTION("Directory with a trailing separator shows the directory name") {
        auto result = classifier.classify(FilePayload{{"/home/user/photos/"}});
        REQUIRE(result.is_ok());
        CHECK(result.value()->display_text == "photos");
    }

    SECTION("Several files show a count") {
        auto result = classifier.classify(FilePayload{{"/tmp/a.txt", "/tmp/b.txt", "/tmp/c.txt"}});
        REQUIRE(result.is_ok());
        REQUIRE(result.value().has_value());
        CHECK(result.value()->display_text == "3 files: a.txt, ...");
        CHECK(result.value()->raw_payload ==
              std::string("/tmp/a.txt") + kPathSeparator + "/tmp/b.txt" + kPathSeparator + "/tmp/c.txt");
    }

    SECTION("Empty paths are dropped and an empty list is skipped") {
        auto result = classifier.classify(FilePayload{{"", ""}});
        REQUIRE(result.is_ok());
        CHECK_FALSE(result.value().has_value());
    }
}
