//
// Unit tests for storage locations
//

#include <catch2/catch_test_macros.hpp>
#include <topline/data/storage.h>

using namespace topline::data;
using epoch_core::ReportMode;

TEST_CASE("FormatStorageUri", "[storage]") {
    SECTION("Plain bucket names are S3 buckets") {
        REQUIRE(FormatStorageUri("telemetry-parquet", "topline_summary/v1") ==
                "s3://telemetry-parquet/topline_summary/v1");
    }

    SECTION("Buckets carrying a scheme are used as the base") {
        REQUIRE(FormatStorageUri("file:///tmp/dash", "v4/topline-weekly.csv") ==
                "file:///tmp/dash/v4/topline-weekly.csv");
        REQUIRE(FormatStorageUri("s3://bucket/", "key") == "s3://bucket/key");
    }
}

TEST_CASE("Dataset locations by report mode", "[storage]") {
    REQUIRE(SummaryLocation("telemetry-parquet", "topline_summary/v1", ReportMode::weekly) ==
            "s3://telemetry-parquet/topline_summary/v1/mode=weekly");
    REQUIRE(SummaryLocation("file:///data", "summary", ReportMode::monthly) ==
            "file:///data/summary/mode=monthly");

    REQUIRE(DashboardKey("v4", ReportMode::weekly) == "v4/topline-weekly.csv");
    REQUIRE(DashboardKey("dashboards/v4", ReportMode::monthly) ==
            "dashboards/v4/topline-monthly.csv");
}

TEST_CASE("ResolveLocation", "[storage]") {
    auto location = ResolveLocation("file:///tmp/topline");
    REQUIRE(location.filesystem != nullptr);
    REQUIRE(location.filesystem->type_name() == "local");
    REQUIRE(location.path == "/tmp/topline");

    REQUIRE_THROWS_AS(ResolveLocation("unknown-scheme://bucket/key"), std::runtime_error);
}
