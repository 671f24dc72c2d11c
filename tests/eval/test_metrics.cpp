#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "mcpevals/eval/metrics.hpp"

using namespace mcpevals;
using namespace mcpevals::eval;
using namespace std::chrono_literals;
using Catch::Matchers::WithinAbs;

TEST_CASE("LoggingMetricsCollector counts events", "[eval][metrics]") {
    LoggingMetricsCollector metrics;

    SECTION("starts empty") {
        auto snapshot = metrics.snapshot();
        CHECK(snapshot.evaluations_started == 0);
        CHECK(snapshot.average_score() == 0.0);
    }

    SECTION("evaluations") {
        auto high = EvaluationScore::create(5, 5, 5, 5, 4, "good");
        auto low = EvaluationScore::create(2, 2, 2, 2, 2, "weak");
        REQUIRE(high.has_value());
        REQUIRE(low.has_value());

        metrics.evaluation_started("first");
        metrics.evaluation_started("second");
        metrics.evaluation_started("third");
        metrics.evaluation_completed("first", 1200ms, *high);
        metrics.evaluation_completed("second", 300ms, *low);
        metrics.evaluation_failed("third", make_error(ErrorCode::Timeout, "server hung"));

        auto snapshot = metrics.snapshot();
        CHECK(snapshot.evaluations_started == 3);
        CHECK(snapshot.evaluations_completed == 2);
        CHECK(snapshot.evaluations_failed == 1);
        CHECK(snapshot.total_evaluation_time == 1500ms);
        CHECK_THAT(snapshot.average_score(), WithinAbs(3.4, 1e-9));
        metrics.log_summary();
    }

    SECTION("connections") {
        metrics.connection_attempt("/srv/servers/calculator.js");
        metrics.connection_succeeded("/srv/servers/calculator.js", 40ms);
        metrics.connection_attempt("http://localhost:3000/mcp");
        metrics.connection_failed("http://localhost:3000/mcp",
                                  make_error(ErrorCode::ConnectionFailed, "refused"));

        auto snapshot = metrics.snapshot();
        CHECK(snapshot.connection_attempts == 2);
        CHECK(snapshot.connection_successes == 1);
        CHECK(snapshot.connection_failures == 1);
    }
}
