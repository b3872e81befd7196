#include "runner_shared.hpp"

#include <string>

#include <catch2/catch_test_macros.hpp>

using namespace swath_sampler;

TEST_CASE("run_tally_succeeds_when_every_swath_is_ok_or_skipped") {
    runner::RunTally tally;
    tally.ok = 3;
    tally.skipped = 2;
    REQUIRE(tally.succeeded());
    REQUIRE(tally.status() == "ok");
    REQUIRE(tally.exit_code() == 0);
}

TEST_CASE("run_tally_counts_quarantined_swaths_as_unsuccessful") {
    runner::RunTally tally;
    tally.ok = 4;
    tally.quarantined = 1;
    REQUIRE_FALSE(tally.succeeded());
    REQUIRE(tally.status() == "partial");
    REQUIRE(tally.exit_code() == 1);
}

TEST_CASE("run_tally_counts_failed_swaths_as_unsuccessful") {
    runner::RunTally tally;
    tally.ok = 1;
    tally.failed = 2;
    REQUIRE_FALSE(tally.succeeded());
    REQUIRE(tally.status() == "partial");
    REQUIRE(tally.exit_code() == 1);
}

TEST_CASE("run_tally_reports_aborted_run") {
    runner::RunTally tally;
    tally.quarantined = 1;
    tally.aborted = true;
    REQUIRE(tally.status() == "aborted");
    REQUIRE(tally.exit_code() == 1);
}

TEST_CASE("swath_rng_is_reproducible_per_seed_and_index") {
    auto a = runner::make_swath_rng(7, 2);
    auto b = runner::make_swath_rng(7, 2);
    auto c = runner::make_swath_rng(7, 3);
    const auto first = a();
    REQUIRE(first == b());
    REQUIRE(first != c());
}

TEST_CASE("format_bytes_picks_binary_unit") {
    REQUIRE(runner::format_bytes(512) == "512 B");
    REQUIRE(runner::format_bytes(1536) == "1.50 KiB");
    REQUIRE(runner::format_bytes(3ULL * 1024 * 1024) == "3.00 MiB");
}
