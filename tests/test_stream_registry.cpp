#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include "stream/stream_registry.hpp"
#include "mocks/mock_stream_provider.hpp"

#include <chrono>
#include <latch>
#include <memory>
#include <set>
#include <thread>
#include <vector>

using namespace ingestgate;
using namespace ingestgate::test;

namespace {

struct RegistryFixture {
    std::shared_ptr<MockStreamProvider> provider = std::make_shared<MockStreamProvider>();
    std::shared_ptr<AckDispatcher> dispatcher = std::make_shared<AckDispatcher>();
    std::shared_ptr<StreamRegistry> registry = std::make_shared<StreamRegistry>(
        provider, Credentials{"client-id", "client-secret"}, dispatcher);
};

} // anonymous namespace

// ============================================================================
// Get-or-create
// ============================================================================

TEST_CASE("StreamRegistry creates a stream on first request", "[registry]") {
    RegistryFixture f;

    auto handle = f.registry->get_or_create_stream("station_one", make_descriptor("station_one"));
    REQUIRE(handle.is_ok());
    REQUIRE(handle.value()->key() == "station_one");
    REQUIRE(handle.value()->stream_id() == "station_one-1");
    REQUIRE(f.provider->create_calls == 1);
    REQUIRE(f.registry->active_tables() == std::set<std::string>{"station_one"});
}

TEST_CASE("StreamRegistry passes credentials and options to the provider", "[registry]") {
    auto provider = std::make_shared<MockStreamProvider>();
    StreamRegistry::Config config;
    config.max_inflight_records = 1234;
    config.recovery = false;
    config.backpressure = BackpressureMode::REJECT;
    StreamRegistry registry(provider, Credentials{"id", "secret"}, nullptr, config);

    REQUIRE(registry.get_or_create_stream("t", make_descriptor("t")).is_ok());
    REQUIRE(provider->last_credentials.client_id == "id");
    REQUIRE(provider->last_credentials.client_secret == "secret");
    REQUIRE(provider->last_options.max_inflight_records == 1234);
    REQUIRE_FALSE(provider->last_options.recovery);
    REQUIRE(provider->last_options.backpressure == BackpressureMode::REJECT);
    REQUIRE_FALSE(provider->last_options.ack_callback);
}

TEST_CASE("StreamRegistry returns the cached handle while it is open", "[registry]") {
    RegistryFixture f;
    const auto descriptor = make_descriptor("t");

    auto first = f.registry->get_or_create_stream("t", descriptor);
    auto second = f.registry->get_or_create_stream("t", descriptor);
    REQUIRE(first.is_ok());
    REQUIRE(second.is_ok());
    REQUIRE(first.value() == second.value());
    REQUIRE(f.provider->create_calls == 1);
}

TEST_CASE("Concurrent first requests for one key collapse into one creation", "[registry][concurrency]") {
    RegistryFixture f;
    f.provider->creation_delay = std::chrono::milliseconds(100);
    const auto descriptor = make_descriptor("station_one");

    constexpr int kCallers = 16;
    std::vector<std::shared_ptr<StreamHandle>> handles(kCallers);
    std::latch start(kCallers);
    std::vector<std::thread> threads;
    for (int i = 0; i < kCallers; ++i) {
        threads.emplace_back([&, i] {
            start.arrive_and_wait();
            auto result = f.registry->get_or_create_stream("station_one", descriptor);
            if (result.is_ok()) handles[i] = result.value();
        });
    }
    for (auto& t : threads) t.join();

    REQUIRE(f.provider->create_calls == 1);
    for (const auto& handle : handles) {
        REQUIRE(handle != nullptr);
        REQUIRE(handle == handles.front());
    }
}

TEST_CASE("Different keys are created in parallel", "[registry][concurrency]") {
    RegistryFixture f;
    f.provider->creation_delay = std::chrono::milliseconds(300);

    std::latch start(4);
    std::vector<std::thread> threads;
    for (const char* key : {"A", "B", "A", "A"}) {
        threads.emplace_back([&, key] {
            start.arrive_and_wait();
            (void)f.registry->get_or_create_stream(key, make_descriptor(key));
        });
    }
    for (auto& t : threads) t.join();

    // One creation per key, and A never waited on B
    REQUIRE(f.provider->create_calls == 2);
    REQUIRE(f.provider->max_in_progress == 2);
    REQUIRE(f.registry->active_tables() == std::set<std::string>{"A", "B"});
}

// ============================================================================
// Recreation
// ============================================================================

TEST_CASE("A non-open handle is closed and recreated exactly once", "[registry]") {
    const auto state = GENERATE(ProviderStreamState::FAILED,
                                ProviderStreamState::RECOVERING,
                                ProviderStreamState::FLUSHING,
                                ProviderStreamState::CLOSED,
                                ProviderStreamState::UNINITIALIZED);
    RegistryFixture f;
    const auto descriptor = make_descriptor("t");

    auto original = f.registry->get_or_create_stream("t", descriptor);
    REQUIRE(original.is_ok());
    auto original_control = f.provider->control(0);
    original_control->state = state;

    auto replacement = f.registry->get_or_create_stream("t", descriptor);
    REQUIRE(replacement.is_ok());
    REQUIRE(replacement.value() != original.value());
    REQUIRE(replacement.value()->stream_id() != original.value()->stream_id());
    REQUIRE(original_control->close_calls == 1);
    REQUIRE(original.value()->is_closed());
    REQUIRE(f.provider->create_calls == 2);
    REQUIRE(f.registry->get_stats().recreations == 1);

    // The replacement is healthy, so no further recreation
    auto again = f.registry->get_or_create_stream("t", descriptor);
    REQUIRE(again.value() == replacement.value());
    REQUIRE(f.provider->create_calls == 2);
}

TEST_CASE("A failing close does not prevent recreation", "[registry]") {
    RegistryFixture f;
    const auto descriptor = make_descriptor("t");

    REQUIRE(f.registry->get_or_create_stream("t", descriptor).is_ok());
    auto control = f.provider->control(0);
    control->state = ProviderStreamState::FAILED;
    control->fail_close = true;

    auto replacement = f.registry->get_or_create_stream("t", descriptor);
    REQUIRE(replacement.is_ok());
    REQUIRE(control->close_calls == 1);
    REQUIRE(f.registry->get_stats().close_failures == 1);
}

TEST_CASE("A liveness query that throws counts as degraded", "[registry]") {
    RegistryFixture f;
    const auto descriptor = make_descriptor("t");

    REQUIRE(f.registry->get_or_create_stream("t", descriptor).is_ok());
    f.provider->control(0)->throw_on_state = true;

    auto replacement = f.registry->get_or_create_stream("t", descriptor);
    REQUIRE(replacement.is_ok());
    REQUIRE(f.provider->create_calls == 2);
}

// ============================================================================
// Creation failures
// ============================================================================

TEST_CASE("A failed creation caches nothing and is retried from scratch", "[registry]") {
    RegistryFixture f;
    f.provider->fail_remaining = 1;
    const auto descriptor = make_descriptor("t");

    auto failed = f.registry->get_or_create_stream("t", descriptor);
    REQUIRE(failed.is_error());
    REQUIRE(failed.error_category() == ErrorCategory::CREATION_ERROR);
    REQUIRE(f.registry->active_tables().empty());
    REQUIRE_FALSE(f.registry->stream_state("t").has_value());

    auto retried = f.registry->get_or_create_stream("t", descriptor);
    REQUIRE(retried.is_ok());
    REQUIRE(f.provider->create_calls == 2);
    REQUIRE(f.registry->get_stats().creation_failures == 1);
}

TEST_CASE("Provider exceptions become creation errors", "[registry]") {
    RegistryFixture f;
    f.provider->throw_on_create = true;

    auto result = f.registry->get_or_create_stream("t", make_descriptor("t"));
    REQUIRE(result.is_error());
    REQUIRE(result.error_category() == ErrorCategory::CREATION_ERROR);
    REQUIRE(result.error_message().find("provider exploded") != std::string::npos);
    REQUIRE(f.registry->active_tables().empty());
}

TEST_CASE("Schema resolution failures keep their category", "[registry]") {
    RegistryFixture f;

    SECTION("provider reports schema resolution error") {
        f.provider->fail_remaining = 1;
        f.provider->fail_category = ErrorCategory::SCHEMA_RESOLUTION_ERROR;
        auto result = f.registry->get_or_create_stream("t", make_descriptor("t"));
        REQUIRE(result.error_category() == ErrorCategory::SCHEMA_RESOLUTION_ERROR);
    }

    SECTION("descriptor without a schema never reaches the provider") {
        StreamDescriptor descriptor{"t", nullptr, "Message"};
        auto result = f.registry->get_or_create_stream("t", descriptor);
        REQUIRE(result.error_category() == ErrorCategory::SCHEMA_RESOLUTION_ERROR);
        REQUIRE(f.provider->create_calls == 0);
    }

    SECTION("non-creation categories from the provider are normalized") {
        f.provider->fail_remaining = 1;
        f.provider->fail_category = ErrorCategory::INTERNAL_ERROR;
        auto result = f.registry->get_or_create_stream("t", make_descriptor("t"));
        REQUIRE(result.error_category() == ErrorCategory::CREATION_ERROR);
    }

    REQUIRE(f.registry->active_tables().empty());
}

TEST_CASE("A failure on one key does not affect another", "[registry]") {
    RegistryFixture f;
    REQUIRE(f.registry->get_or_create_stream("good", make_descriptor("good")).is_ok());

    f.provider->fail_remaining = 1;
    REQUIRE(f.registry->get_or_create_stream("bad", make_descriptor("bad")).is_error());

    REQUIRE(f.registry->active_tables() == std::set<std::string>{"good"});
    REQUIRE(f.registry->ingest_record("good", make_record(1)).is_ok());
}

// ============================================================================
// Ingest / flush
// ============================================================================

TEST_CASE("ingest_record without a cached handle is NOT_FOUND with no side effects", "[registry]") {
    RegistryFixture f;

    auto result = f.registry->ingest_record("missing", make_record(1));
    REQUIRE(result.is_error());
    REQUIRE(result.error_category() == ErrorCategory::NOT_FOUND);
    REQUIRE(f.provider->create_calls == 0);
    REQUIRE(f.registry->active_tables().empty());
    REQUIRE(f.registry->get_stats().records_submitted == 0);
}

TEST_CASE("ingest_record resolves with the provider offset", "[registry]") {
    RegistryFixture f;
    REQUIRE(f.registry->get_or_create_stream("t", make_descriptor("t")).is_ok());

    for (int64_t i = 0; i < 5; ++i) {
        auto pending = f.registry->ingest_record("t", make_record(i));
        REQUIRE(pending.is_ok());
        auto offset = pending.value().wait();
        REQUIRE(offset.is_ok());
        REQUIRE(offset.value() == i);
    }
    REQUIRE(f.provider->control(0)->record_count() == 5);
    REQUIRE(f.registry->get_stats().records_submitted == 5);
}

TEST_CASE("Submission failures are reported, not thrown", "[registry]") {
    RegistryFixture f;
    REQUIRE(f.registry->get_or_create_stream("t", make_descriptor("t")).is_ok());
    f.provider->control(0)->state = ProviderStreamState::FAILED;

    auto result = f.registry->ingest_record("t", make_record(1));
    REQUIRE(result.is_error());
    REQUIRE(result.error_category() == ErrorCategory::SUBMIT_ERROR);
    REQUIRE(f.registry->get_stats().submit_failures == 1);
}

TEST_CASE("flush_stream drains the cached handle", "[registry]") {
    RegistryFixture f;

    REQUIRE(f.registry->flush_stream("t").error_category() == ErrorCategory::NOT_FOUND);

    REQUIRE(f.registry->get_or_create_stream("t", make_descriptor("t")).is_ok());
    auto control = f.provider->control(0);
    control->auto_ack = false;

    auto pending = f.registry->ingest_record("t", make_record(7));
    REQUIRE(pending.is_ok());
    REQUIRE_FALSE(pending.value().is_ready());

    REQUIRE(f.registry->flush_stream("t").is_ok());
    REQUIRE(control->flush_calls == 1);
    REQUIRE(pending.value().is_ready());
}

// ============================================================================
// Teardown
// ============================================================================

TEST_CASE("close_all empties the registry even when closes fail", "[registry]") {
    RegistryFixture f;
    for (const char* key : {"a", "b", "c", "d"}) {
        REQUIRE(f.registry->get_or_create_stream(key, make_descriptor(key)).is_ok());
    }
    f.provider->control(1)->fail_close = true;
    f.provider->control(3)->fail_close = true;

    REQUIRE_NOTHROW(f.registry->close_all());

    REQUIRE(f.registry->active_tables().empty());
    for (const auto& control : f.provider->all_controls()) {
        REQUIRE(control->close_calls == 1);
    }
    REQUIRE(f.registry->get_stats().close_failures == 2);

    // Destruction must not close a second time
    f.registry.reset();
    for (const auto& control : f.provider->all_controls()) {
        REQUIRE(control->close_calls == 1);
    }
}

TEST_CASE("Shutdown after a submission leaves pending ingestions to the caller", "[registry]") {
    RegistryFixture f;
    REQUIRE(f.registry->get_or_create_stream("A", make_descriptor("A")).is_ok());
    f.provider->control(0)->auto_ack = false;

    auto pending = f.registry->ingest_record("A", make_record(1));
    REQUIRE(pending.is_ok());

    REQUIRE_NOTHROW(f.registry->close_all());
    REQUIRE(f.registry->active_tables().empty());

    // The mock leaves unacked records unresolved on close
    REQUIRE_FALSE(pending.value().wait_for(std::chrono::milliseconds(10)));

    // Resolution after close is still delivered
    f.provider->control(0)->ack_all();
    REQUIRE(pending.value().is_ready());
}

TEST_CASE("close_stream and remove_table drop one key", "[registry]") {
    RegistryFixture f;
    REQUIRE(f.registry->get_or_create_stream("a", make_descriptor("a")).is_ok());
    REQUIRE(f.registry->get_or_create_stream("b", make_descriptor("b")).is_ok());

    f.registry->close_stream("a");
    REQUIRE(f.registry->active_tables() == std::set<std::string>{"b"});

    f.registry->remove_table("b");
    REQUIRE(f.registry->active_tables().empty());

    // Closing an unknown key is a no-op
    REQUIRE_NOTHROW(f.registry->close_stream("nope"));

    // A removed key can be created again
    REQUIRE(f.registry->get_or_create_stream("a", make_descriptor("a")).is_ok());
    REQUIRE(f.provider->create_calls == 3);
}

TEST_CASE("close_all waits for an in-flight creation", "[registry][concurrency]") {
    RegistryFixture f;
    f.provider->creation_delay = std::chrono::milliseconds(200);

    std::thread creator([&] {
        (void)f.registry->get_or_create_stream("slow", make_descriptor("slow"));
    });

    // Let the creator take the key lock first
    while (f.provider->in_progress == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    REQUIRE(f.registry->stream_state("slow") == StreamState::CONNECTING);

    creator.join();
    f.registry->close_all();
    REQUIRE(f.registry->active_tables().empty());
    REQUIRE(f.provider->control(0)->close_calls == 1);
}

// ============================================================================
// Observation
// ============================================================================

TEST_CASE("stream_state reflects the last observed handle state", "[registry]") {
    RegistryFixture f;
    REQUIRE_FALSE(f.registry->stream_state("t").has_value());

    REQUIRE(f.registry->get_or_create_stream("t", make_descriptor("t")).is_ok());
    REQUIRE(f.registry->stream_state("t") == StreamState::OPEN);

    f.registry->close_stream("t");
    REQUIRE_FALSE(f.registry->stream_state("t").has_value());
}

// ============================================================================
// Acknowledgments
// ============================================================================

TEST_CASE("Ack offsets for one handle are non-decreasing", "[registry][ack]") {
    RegistryFixture f;
    REQUIRE(f.registry->get_or_create_stream("t", make_descriptor("t")).is_ok());

    constexpr int kThreads = 4;
    constexpr int kPerThread = 250;
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < kPerThread; ++i) {
                (void)f.registry->ingest_record("t", make_record(t * kPerThread + i));
            }
        });
    }
    for (auto& t : threads) t.join();

    f.dispatcher->flush();
    const auto stats = f.dispatcher->get_stats();
    REQUIRE(stats.regressions == 0);
    REQUIRE(stats.dropped == 0);
    REQUIRE(f.dispatcher->last_offset("t") == kThreads * kPerThread - 1);
}

TEST_CASE("Offsets restarting after recreation are not regressions", "[registry][ack]") {
    RegistryFixture f;
    const auto descriptor = make_descriptor("t");

    REQUIRE(f.registry->get_or_create_stream("t", descriptor).is_ok());
    for (int i = 0; i < 10; ++i) {
        (void)f.registry->ingest_record("t", make_record(i));
    }
    f.provider->control(0)->state = ProviderStreamState::FAILED;

    REQUIRE(f.registry->get_or_create_stream("t", descriptor).is_ok());
    (void)f.registry->ingest_record("t", make_record(100));

    f.dispatcher->flush();
    REQUIRE(f.dispatcher->get_stats().regressions == 0);
    REQUIRE(f.dispatcher->last_offset("t") == 0);
}
