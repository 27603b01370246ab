#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "analytics/benchmark_analysis.hpp"

#include <cmath>
#include <numeric>

using namespace equity::analytics;
using equity::data::ReturnSeries;
using Catch::Matchers::WithinAbs;

namespace
{
    ReturnSeries make_returns(const std::vector<std::string> &dates, const std::vector<double> &values)
    {
        ReturnSeries rs;
        for (size_t i = 0; i < dates.size(); ++i)
        {
            rs.append(dates[i], values[i]);
        }
        return rs;
    }

    const std::vector<std::string> kDates = {"2024-01-02", "2024-01-03", "2024-01-04",
                                             "2024-01-05", "2024-01-08", "2024-01-09"};
}

TEST_CASE("Benchmark: leveraged portfolio has beta 2", "[Benchmark][Regression]")
{
    std::vector<double> b = {0.01, -0.005, 0.02, -0.01, 0.003, 0.007};
    std::vector<double> p(b.size());
    for (size_t i = 0; i < b.size(); ++i)
    {
        p[i] = 2.0 * b[i];
    }

    BenchmarkAnalysis bench(make_returns(kDates, p), make_returns(kDates, b), 0.02, 0.10);

    REQUIRE(bench.sufficient());
    REQUIRE(bench.num_observations() == 6);
    REQUIRE(bench.benchmark_has_variance());
    REQUIRE_THAT(bench.beta(), WithinAbs(2.0, 1e-10));
    REQUIRE_THAT(bench.r_squared(), WithinAbs(1.0, 1e-10));

    double mean_p = std::accumulate(p.begin(), p.end(), 0.0) / 6.0;
    double expected_alpha = mean_p * 252.0 - (0.02 + 2.0 * (0.10 - 0.02));
    REQUIRE_THAT(bench.alpha(), WithinAbs(expected_alpha, 1e-10));
}

TEST_CASE("Benchmark: tracking error and information ratio", "[Benchmark][TrackingError]")
{
    std::vector<double> b = {0.01, -0.005, 0.02, -0.01, 0.003, 0.007};
    std::vector<double> p = {0.012, -0.004, 0.018, -0.007, 0.006, 0.006};

    BenchmarkAnalysis bench(make_returns(kDates, p), make_returns(kDates, b));

    std::vector<double> d(6);
    for (size_t i = 0; i < 6; ++i)
    {
        d[i] = p[i] - b[i];
    }
    double mean_d = std::accumulate(d.begin(), d.end(), 0.0) / 6.0;
    double ss = 0.0;
    for (double x : d)
    {
        ss += (x - mean_d) * (x - mean_d);
    }
    double te = std::sqrt(ss / 5.0) * std::sqrt(252.0);

    REQUIRE_THAT(bench.tracking_error(), WithinAbs(te, 1e-12));
    REQUIRE_THAT(bench.active_return(), WithinAbs(mean_d * 252.0, 1e-12));
    REQUIRE_THAT(bench.information_ratio(), WithinAbs(mean_d * 252.0 / te, 1e-9));
    REQUIRE(bench.excess_returns().size() == 6);
}

TEST_CASE("Benchmark: only shared dates are used", "[Benchmark][Alignment]")
{
    ReturnSeries p = make_returns({"2024-01-02", "2024-01-03", "2024-01-04"}, {0.01, 0.02, 0.03});
    ReturnSeries b = make_returns({"2024-01-03", "2024-01-04", "2024-01-05"}, {0.01, -0.01, 0.02});

    BenchmarkAnalysis bench(p, b);
    REQUIRE(bench.num_observations() == 2);
    REQUIRE(bench.dates() == std::vector<std::string>{"2024-01-03", "2024-01-04"});
}

TEST_CASE("Benchmark: degenerate inputs", "[Benchmark][Validation]")
{
    SECTION("Fewer than 2 shared dates")
    {
        ReturnSeries p = make_returns({"2024-01-02", "2024-01-03"}, {0.01, 0.02});
        ReturnSeries b = make_returns({"2024-01-03", "2024-01-04"}, {0.01, 0.02});
        BenchmarkAnalysis bench(p, b);
        REQUIRE_FALSE(bench.sufficient());
        REQUIRE(bench.beta() == 0.0);
        REQUIRE(bench.alpha() == 0.0);
        REQUIRE(bench.tracking_error() == 0.0);
    }

    SECTION("Flat benchmark forces beta to 0")
    {
        std::vector<double> p = {0.01, -0.005, 0.02, -0.01, 0.003, 0.007};
        std::vector<double> b(6, 0.0);
        BenchmarkAnalysis bench(make_returns(kDates, p), make_returns(kDates, b));
        REQUIRE(bench.sufficient());
        REQUIRE_FALSE(bench.benchmark_has_variance());
        REQUIRE(bench.beta() == 0.0);
        REQUIRE(bench.tracking_error() > 0.0);
    }

    SECTION("Identical series have zero tracking error")
    {
        std::vector<double> b = {0.01, -0.005, 0.02, -0.01, 0.003, 0.007};
        BenchmarkAnalysis bench(make_returns(kDates, b), make_returns(kDates, b));
        REQUIRE_THAT(bench.tracking_error(), WithinAbs(0.0, 1e-15));
        REQUIRE(bench.information_ratio() == 0.0);
        REQUIRE_THAT(bench.beta(), WithinAbs(1.0, 1e-12));
    }

    SECTION("Non-positive trading days")
    {
        ReturnSeries p = make_returns(kDates, std::vector<double>(6, 0.01));
        REQUIRE_THROWS_AS(BenchmarkAnalysis(p, p, 0.02, 0.10, 0), std::invalid_argument);
    }
}
