//
// End-to-end tests of the summary -> dashboard reformatting
//

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "common/summary_frame.h"
#include "transforms/components/normalize/dimension_normalizer.h"
#include <topline/core/errors.h>
#include <topline/transforms/runtime/reformat_pipeline.h>
#include <algorithm>
#include <set>

using namespace topline;
using namespace topline::transform;
using namespace topline::test;
using Catch::Matchers::WithinAbs;

namespace {

double RowTotal(epoch_frame::DataFrame const &df, size_t row) {
    double total{0};
    for (auto const &column : DefaultReportConfig().historical_schema) {
        if (IsDimensionColumn(column.name)) {
            continue;
        }
        if (column.type == epoch_core::ColumnType::Decimal) {
            total += ReadDouble(df, column.name).at(row).value_or(0.0);
        } else {
            total += static_cast<double>(ReadInt64(df, column.name).at(row).value_or(0));
        }
    }
    return total;
}

// Output rows as an ordered multiset of their printed cells
std::multiset<std::vector<std::string>> AsMultiset(epoch_frame::DataFrame const &df) {
    std::multiset<std::vector<std::string>> rows;
    auto table = df.table();
    for (int64_t row = 0; row < table->num_rows(); ++row) {
        std::vector<std::string> cells;
        for (auto const &column : table->columns()) {
            cells.push_back(column->GetScalar(row).ValueOrDie()->ToString());
        }
        rows.insert(std::move(cells));
    }
    return rows;
}

std::vector<SummaryRow> MixedSummary() {
    return {
        {.geo = "FR", .channel = "release", .os = "Windows", .hours = 10.0,
         .actives = 5, .report_start = "20190101"},
        {.geo = "FR", .channel = "beta", .os = "Windows", .hours = 4.0,
         .actives = 3, .report_start = "20190101"},
        {.geo = "KR", .channel = "release", .os = "Linux", .hours = 1.5,
         .crashes = 2, .google = 7, .actives = 1, .report_start = "20190108"},
        {.geo = std::nullopt, .channel = std::nullopt, .os = "Darwin",
         .actives = 4, .report_start = "20190108"},
        {.geo = "US", .channel = "nightly", .os = "Linux", .actives = 9,
         .report_start = "not-a-date"},
        {.geo = "DE", .channel = "aurora", .os = "Linux", .hours = 0.0,
         .actives = 0, .report_start = "20190101"},
    };
}

} // namespace

TEST_CASE("ReformatData: two FR channels on one day", "[reformat]") {
    auto output = ReformatData(MakeSummaryFrame({
        {.geo = "FR", .channel = "release", .os = "Windows", .hours = 10.0,
         .actives = 5, .report_start = "20190101"},
        {.geo = "FR", .channel = "beta", .os = "Windows", .hours = 4.0,
         .actives = 3, .report_start = "20190101"},
    }), DefaultReportConfig());

    auto actives = ReadInt64(output, "actives");
    auto hours = ReadDouble(output, "hours");

    SECTION("Wildcard over channel") {
        auto row = FindRow(output, "2019-01-01", "FR", "all", "Windows");
        REQUIRE(row >= 0);
        REQUIRE(actives[row] == 8);
        REQUIRE_THAT(*hours[row], WithinAbs(14.0, 1e-9));
    }

    SECTION("Wildcard over everything but the date") {
        auto row = FindRow(output, "2019-01-01", "all", "all", "all");
        REQUIRE(row >= 0);
        REQUIRE(actives[row] == 8);
        REQUIRE_THAT(*hours[row], WithinAbs(14.0, 1e-9));
    }

    SECTION("Concrete combinations survive") {
        auto row = FindRow(output, "2019-01-01", "FR", "beta", "Windows");
        REQUIRE(row >= 0);
        REQUIRE(actives[row] == 3);
    }

    SECTION("Every combination is reported for the single date") {
        // 8 subsets of {geo, channel, os}; channel splits in two when present
        REQUIRE(output.num_rows() == 12);
    }
}

TEST_CASE("ReformatData: regions outside the allow-list", "[reformat]") {
    auto output = ReformatData(MakeSummaryFrame({
        {.geo = "KR", .actives = 4, .report_start = "20190101"},
    }), DefaultReportConfig());

    for (auto const &geo : ReadStrings(output, GEO)) {
        REQUIRE(geo.has_value());
        REQUIRE((*geo == "Other" || *geo == "all"));
    }
    REQUIRE(FindRow(output, "2019-01-01", "Other", "release", "Windows_NT") >= 0);
    REQUIRE(FindRow(output, "2019-01-01", "KR", "release", "Windows_NT") == -1);
}

TEST_CASE("ReformatData: all-zero combinations are pruned", "[reformat]") {
    auto output = ReformatData(MakeSummaryFrame({
        {.geo = "US", .channel = "release", .actives = 2, .report_start = "20190101"},
        {.geo = "CA", .channel = "beta", .hours = 0.0, .actives = 0, .report_start = "20190101"},
    }), DefaultReportConfig());

    REQUIRE(FindRow(output, "2019-01-01", "CA", "beta", "Windows_NT") == -1);
    REQUIRE(FindRow(output, "2019-01-01", "CA", "all", "all") == -1);
    REQUIRE(FindRow(output, "2019-01-01", "all", "beta", "all") == -1);
    // the zero row still belongs to the wildcard total
    REQUIRE(FindRow(output, "2019-01-01", "all", "all", "all") >= 0);
}

TEST_CASE("ReformatData output invariants", "[reformat]") {
    auto output = ReformatData(MakeSummaryFrame(MixedSummary()), DefaultReportConfig());
    REQUIRE(output.num_rows() > 0);

    SECTION("Historical column order") {
        std::vector<std::string> expected;
        for (auto const &column : DefaultReportConfig().historical_schema) {
            expected.push_back(column.name);
        }
        REQUIRE(output.column_names() == expected);
    }

    SECTION("Every date is concrete") {
        for (auto const &date : ReadStrings(output, DATE)) {
            REQUIRE(date.has_value());
            REQUIRE(*date != "all");
            REQUIRE(date->size() == 10);
            REQUIRE(ParseReportDate(date->substr(0, 4) + date->substr(5, 2) + date->substr(8, 2)) == *date);
        }
    }

    SECTION("Every total is strictly positive") {
        for (size_t row = 0; row < static_cast<size_t>(output.num_rows()); ++row) {
            REQUIRE(RowTotal(output, row) > 0);
        }
    }

    SECTION("Columns without a summary source are zero") {
        for (auto name : {"inactives", "five_of_seven", "total_records"}) {
            for (auto const &value : ReadInt64(output, name)) {
                REQUIRE(value == 0);
            }
        }
    }

    SECTION("Rows with an unparseable date are dropped") {
        for (auto const &channel : ReadStrings(output, CHANNEL)) {
            REQUIRE(channel != "nightly");
        }
    }

    SECTION("Null categorical values are filled with all") {
        for (auto name : {GEO, CHANNEL, OS}) {
            for (auto const &value : ReadStrings(output, name)) {
                REQUIRE(value.has_value());
            }
        }

        // the null-channel group and the channel wildcard print the same key
        auto dates = ReadStrings(output, DATE);
        auto geos = ReadStrings(output, GEO);
        auto channels = ReadStrings(output, CHANNEL);
        auto oses = ReadStrings(output, OS);
        auto actives = ReadInt64(output, "actives");
        int matches = 0;
        for (size_t i = 0; i < dates.size(); ++i) {
            if (dates[i] == "2019-01-08" && geos[i] == "Other" && channels[i] == "all" &&
                oses[i] == "Darwin") {
                ++matches;
                REQUIRE(actives[i] == 4);
            }
        }
        REQUIRE(matches == 2);
    }

    SECTION("Summed aggregates") {
        auto row = FindRow(output, "2019-01-08", "all", "all", "all");
        REQUIRE(row >= 0);
        REQUIRE(ReadInt64(output, "actives")[row] == 5);
        REQUIRE(ReadInt64(output, "google")[row] == 7);
        REQUIRE(ReadInt64(output, "crashes")[row] == 2);
    }
}

TEST_CASE("ReformatData is idempotent and deterministic", "[reformat]") {
    auto summary = MakeSummaryFrame(MixedSummary());
    auto first = ReformatData(summary, DefaultReportConfig());
    auto second = ReformatData(summary, DefaultReportConfig());
    REQUIRE(first.equals(second));

    SECTION("Input row order does not change the output multiset") {
        auto rows = MixedSummary();
        std::ranges::reverse(rows);
        auto reversed = ReformatData(MakeSummaryFrame(rows), DefaultReportConfig());
        REQUIRE(AsMultiset(reversed) == AsMultiset(first));
    }
}

TEST_CASE("ReformatTransform exposes the pipeline as a transform", "[reformat]") {
    ReformatTransform transform{
        TransformConfiguration{"topline_weekly", "reformat", DefaultReportConfig()}};
    REQUIRE(transform.GetId() == "topline_weekly");
    REQUIRE(transform.GetName() == "reformat");

    auto summary = MakeSummaryFrame(MixedSummary());
    REQUIRE(transform.TransformData(summary).equals(ReformatData(summary, DefaultReportConfig())));
}

TEST_CASE("ReformatData rejects summaries without the input schema", "[reformat]") {
    auto table = MakeSummaryFrame(MixedSummary()).table();
    auto trimmed = table->RemoveColumn(table->schema()->GetFieldIndex(REPORT_START)).ValueOrDie();
    REQUIRE_THROWS_AS(ReformatData(epoch_frame::DataFrame(trimmed), DefaultReportConfig()),
                      SchemaMismatchError);
}

TEST_CASE("ReformatData serialises the configured wildcard token", "[reformat]") {
    auto config = DefaultReportConfig();
    config.wildcard_token = "*";
    auto output = ReformatData(MakeSummaryFrame({
        {.geo = "FR", .actives = 1, .report_start = "20190101"},
    }), config);
    REQUIRE(FindRow(output, "2019-01-01", "*", "*", "*") >= 0);
    REQUIRE(FindRow(output, "2019-01-01", "all", "all", "all") == -1);
}

TEST_CASE("ReformatData ignores undeclared summary columns", "[reformat]") {
    auto table = MakeSummaryFrame({
        {.geo = "FR", .actives = 2, .report_start = "20190101"},
    }).table();
    table = table->AddColumn(table->num_columns(), arrow::field(DATE, arrow::utf8()),
                             StringColumn({"2000-01-01"})).ValueOrDie();

    auto output = ReformatData(epoch_frame::DataFrame(table), DefaultReportConfig());
    REQUIRE(FindRow(output, "2019-01-01", "FR", "release", "Windows_NT") >= 0);
    for (auto const &date : ReadStrings(output, DATE)) {
        REQUIRE(date == "2019-01-01");
    }
}
