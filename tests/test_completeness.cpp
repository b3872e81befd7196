#include "swath_sampler/sampling/completeness.hpp"

#include <limits>
#include <sstream>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace swath_sampler;
using namespace swath_sampler::sampling;

TEST_CASE("complete_swath_reports_no_missing_values_and_stays_silent") {
    Swath swath(3, 4, 5);
    const auto report = check_completeness(swath);
    REQUIRE(report.total_elements == 60);
    REQUIRE(report.valid_elements == 60);
    REQUIRE_FALSE(report.has_missing());
    REQUIRE(report.ratio() == Catch::Approx(1.0));

    std::ostringstream diag;
    report_completeness(report, "granule.fits", diag);
    REQUIRE(diag.str().empty());
}

TEST_CASE("nan_values_count_as_missing") {
    Swath swath(2, 5, 5);
    swath(0, 1, 1) = std::numeric_limits<float>::quiet_NaN();
    swath(1, 4, 0) = std::numeric_limits<float>::quiet_NaN();

    const auto report = check_completeness(swath);
    REQUIRE(report.has_missing());
    REQUIRE(report.valid_elements == 48);
    REQUIRE(report.ratio() == Catch::Approx(0.96));

    std::ostringstream diag;
    report_completeness(report, "granule.fits", diag);
    REQUIRE(diag.str().find("[COMPLETENESS] WARNING: granule.fits") != std::string::npos);
    REQUIRE(diag.str().find("96.000% complete") != std::string::npos);
}

TEST_CASE("fill_value_counts_as_missing_only_when_given") {
    Swath swath(1, 2, 2);
    swath(0, 0, 0) = -999.0f;

    REQUIRE_FALSE(check_completeness(swath).has_missing());
    const auto report = check_completeness(swath, -999.0f);
    REQUIRE(report.valid_elements == 3);
}

TEST_CASE("completeness_check_does_not_modify_swath") {
    Swath swath(1, 2, 2);
    swath(0, 1, 1) = std::numeric_limits<float>::quiet_NaN();
    swath(0, 0, 1) = 7.0f;
    (void)check_completeness(swath, 7.0f);
    REQUIRE(swath(0, 0, 1) == 7.0f);
}

TEST_CASE("empty_swath_is_complete") {
    Swath swath;
    const auto report = check_completeness(swath);
    REQUIRE(report.total_elements == 0);
    REQUIRE(report.ratio() == Catch::Approx(1.0));
}
