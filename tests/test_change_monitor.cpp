#include <catch2/catch_test_macros.hpp>
#include "pipeline_fixture.hpp"
#include "image_fixtures.hpp"

#include <stdexcept>

using namespace clipstash;
using namespace clipstash::testing;

using Outcome = ChangeMonitor::TickOutcome;

TEST_CASE("ChangeMonitor treats startup content as the baseline", "[monitor]") {
    PipelineFixture fx;
    fx.clipboard->set_text("already there");
    auto monitor = fx.make_monitor();

    CHECK(monitor->tick() == Outcome::UNCHANGED);
    CHECK(fx.clipboard->read_count() == 0);
    CHECK(fx.store->count().value() == 0);
    CHECK(monitor->state() == ChangeMonitor::State::IDLE);
}

TEST_CASE("ChangeMonitor captures new content", "[monitor]") {
    PipelineFixture fx;
    auto monitor = fx.make_monitor();

    SECTION("Text is inserted once") {
        fx.clipboard->set_text("hello");
        CHECK(monitor->tick() == Outcome::INSERTED);
        CHECK(monitor->tick() == Outcome::UNCHANGED);
        CHECK(fx.clipboard->read_count() == 1);

        auto recent = fx.store->recent(10);
        REQUIRE(recent.is_ok());
        REQUIRE(recent.value().size() == 1);
        CHECK(recent.value()[0].raw_payload == "hello");
        CHECK(recent.value()[0].display_text == "hello");
        CHECK(monitor->stats().captures == 1);
    }

    SECTION("Copying the same content again bumps") {
        fx.clipboard->set_text("hello");
        REQUIRE(monitor->tick() == Outcome::INSERTED);
        fx.clipboard->set_text("other");
        REQUIRE(monitor->tick() == Outcome::INSERTED);
        fx.clipboard->set_text("hello");
        CHECK(monitor->tick() == Outcome::BUMPED);

        CHECK(fx.store->count().value() == 2);
        auto recent = fx.store->recent(1);
        REQUIRE(recent.value().size() == 1);
        CHECK(recent.value()[0].raw_payload == "hello");
        CHECK(monitor->stats().bumps == 1);
    }

    SECTION("Images land on disk and in history") {
        fx.clipboard->set_image(make_png(640, 480));
        REQUIRE(monitor->tick() == Outcome::INSERTED);
        auto recent = fx.store->recent(1);
        REQUIRE(recent.value().size() == 1);
        const auto& e = recent.value()[0];
        CHECK(e.content_type == ContentType::IMAGE);
        CHECK(e.display_text == "[Image: 640x480]");
        CHECK(fx.artifacts->exists(e.raw_payload));
    }

    SECTION("File lists are captured") {
        fx.clipboard->set_files({"/tmp/a.txt", "/tmp/b.txt"});
        REQUIRE(monitor->tick() == Outcome::INSERTED);
        auto recent = fx.store->recent(1);
        CHECK(recent.value()[0].content_type == ContentType::FILE_REFERENCE);
        CHECK(recent.value()[0].display_text == "2 files: a.txt, ...");
    }

    SECTION("Several changes between ticks keep only the latest") {
        fx.clipboard->set_text("first");
        fx.clipboard->set_text("second");
        REQUIRE(monitor->tick() == Outcome::INSERTED);
        auto recent = fx.store->recent(10);
        REQUIRE(recent.value().size() == 1);
        CHECK(recent.value()[0].raw_payload == "second");
    }
}

TEST_CASE("ChangeMonitor redacts sensitive text", "[monitor][privacy]") {
    PipelineFixture fx;
    auto monitor = fx.make_monitor();

    fx.clipboard->set_text("password=abc123");
    REQUIRE(monitor->tick() == Outcome::INSERTED);

    auto recent = fx.store->recent(1);
    REQUIRE(recent.is_ok());
    REQUIRE(recent.value().size() == 1);
    const auto& listed = recent.value()[0];
    CHECK(listed.is_sensitive);
    CHECK(listed.sensitive_kinds == "password");
    CHECK(listed.preview().find("abc123") == std::string::npos);

    auto full = fx.store->get(listed.id);
    REQUIRE(full.value().has_value());
    CHECK(full.value()->raw_payload == "password=abc123");
}

TEST_CASE("ChangeMonitor skips unusable payloads", "[monitor]") {
    PipelineFixture fx;
    auto monitor = fx.make_monitor();

    fx.clipboard->set_text("");
    CHECK(monitor->tick() == Outcome::SKIPPED);
    // Skipped change is consumed, not retried
    CHECK(monitor->tick() == Outcome::UNCHANGED);
    CHECK(fx.store->count().value() == 0);
    CHECK(monitor->stats().skips == 1);
}

TEST_CASE("ChangeMonitor failure handling", "[monitor]") {
    PipelineFixture fx;
    auto monitor = fx.make_monitor();

    SECTION("Read failure is retried on the next tick") {
        fx.clipboard->set_text("flaky");
        fx.clipboard->set_read_fails(true);
        CHECK(monitor->tick() == Outcome::FAILED);
        CHECK(monitor->tick() == Outcome::FAILED);
        CHECK(fx.store->count().value() == 0);

        fx.clipboard->set_read_fails(false);
        CHECK(monitor->tick() == Outcome::INSERTED);
        CHECK(fx.store->count().value() == 1);
        CHECK(monitor->stats().failures == 2);
    }

    SECTION("Counter failure does not consume the change") {
        fx.clipboard->set_text("later");
        fx.clipboard->set_counter_fails(true);
        CHECK(monitor->tick() == Outcome::FAILED);
        CHECK(fx.clipboard->read_count() == 0);

        fx.clipboard->set_counter_fails(false);
        CHECK(monitor->tick() == Outcome::INSERTED);
    }

    SECTION("Unreadable counter at startup takes the first readable state as baseline") {
        PipelineFixture fx2;
        fx2.clipboard->set_text("pre-existing");
        fx2.clipboard->set_counter_fails(true);
        auto late = fx2.make_monitor();
        CHECK_FALSE(late->last_change_count().has_value());

        fx2.clipboard->set_counter_fails(false);
        CHECK(late->tick() == Outcome::UNCHANGED);
        CHECK(late->last_change_count().has_value());
        CHECK(fx2.store->count().value() == 0);
    }
}

TEST_CASE("ChangeMonitor change callback", "[monitor]") {
    PipelineFixture fx;
    auto monitor = fx.make_monitor();

    std::vector<UpsertOutcome> seen;
    monitor->set_on_change([&seen](const UpsertOutcome& outcome) { seen.push_back(outcome); });

    fx.clipboard->set_text("a");
    REQUIRE(monitor->tick() == Outcome::INSERTED);
    fx.clipboard->set_text("b");
    REQUIRE(monitor->tick() == Outcome::INSERTED);
    fx.clipboard->set_text("a");
    REQUIRE(monitor->tick() == Outcome::BUMPED);

    REQUIRE(seen.size() == 3);
    CHECK_FALSE(seen[0].bumped);
    CHECK(seen[2].bumped);
    CHECK(seen[2].id == seen[0].id);

    SECTION("A throwing callback does not fail the capture") {
        monitor->set_on_change([](const UpsertOutcome&) { throw std::runtime_error("listener broke"); });
        fx.clipboard->set_text("c");
        CHECK(monitor->tick() == Outcome::INSERTED);
        CHECK(fx.store->count().value() == 3);
    }
}

TEST_CASE("ChangeMonitor retention through the pipeline", "[monitor]") {
    PipelineFixture fx(2);
    auto monitor = fx.make_monitor();

    std::vector<int64_t> evicted;
    monitor->set_on_change([&evicted](const UpsertOutcome& outcome) {
        evicted.insert(evicted.end(), outcome.evicted_ids.begin(), outcome.evicted_ids.end());
    });

    fx.clipboard->set_image(make_gif(4, 4), "image/gif");
    REQUIRE(monitor->tick() == Outcome::INSERTED);
    const auto image_path = fx.store->recent(1).value()[0].raw_payload;
    REQUIRE(fx.artifacts->exists(image_path));

    fx.clipboard->set_text("one");
    REQUIRE(monitor->tick() == Outcome::INSERTED);
    fx.clipboard->set_text("two");
    REQUIRE(monitor->tick() == Outcome::INSERTED);

    CHECK(fx.store->count().value() == 2);
    CHECK(evicted.size() == 1);
    CHECK_FALSE(fx.artifacts->exists(image_path));
}

TEST_CASE("tick_outcome_name", "[monitor]") {
    CHECK(std::string(tick_outcome_name(Outcome::INSERTED)) == "inserted");
    CHECK(std::string(tick_outcome_name(Outcome::BUMPED)) == "bumped");
    CHECK(std::string(tick_outcome_name(Outcome::FAILED)) == "failed");
}
