#include <gtest/gtest.h>
#include "../../fmsave/geo.hpp"
#include "../../fmsave/validator.hpp"
#include "flights.hpp"

#include <tuple>

using namespace std::chrono_literals;

namespace {

/// LHR to JFK leaving 20:30 London time, arriving 23:10 New York time: 7:40 in the air.
fmsave_core::row consistent_flight(const fmsave_core::schema_ptr &schema, const std::string &flightnum) {
    auto r = flights::lhr_jfk(schema, "2023-01-09");
    r.set("flightnum", fmsave_core::value(flightnum));
    r.set("time_dep", fmsave_core::value(flights::datetime("2023-01-09 20:30")));
    r.set("gmtoffset_dep", fmsave_core::value(0.0));
    r.set("time_arr", fmsave_core::value(flights::datetime("2023-01-09 23:10")));
    r.set("gmtoffset_arr", fmsave_core::value(-5.0));
    r.set("duration", fmsave_core::value(fmsave_core::timedelta_t(7h + 40min)));
    r.set("dist", fmsave_core::value(5550));
    return r;
}

std::vector<fmsave::finding> of_field(const std::vector<fmsave::finding> &findings, const std::string &field) {
    std::vector<fmsave::finding> result;
    for (const auto &f : findings) {
        if (f.field == field) {
            result.push_back(f);
        }
    }
    return result;
}

} // namespace

TEST(GeoTest, great_circle_distance) {
    EXPECT_NEAR(5550.0, fmsave::great_circle_km(51.47, -0.45, 40.64, -73.78), 25.0);
    EXPECT_DOUBLE_EQ(0.0, fmsave::great_circle_km(10.0, 20.0, 10.0, 20.0));
    EXPECT_NEAR(1.609344, fmsave::miles_to_km(1.0), 1e-5);
}

TEST(ValidatorTest, consistent_row_has_no_findings) {
    auto schema = flights::canonical();
    auto data = flights::make_dataset({consistent_flight(schema, "BA117")});

    auto findings = fmsave::validator().validate(data);

    EXPECT_TRUE(findings.empty());
    auto summary = fmsave::validator::summarize(findings, data.size());
    EXPECT_EQ(1, summary.checked);
    EXPECT_EQ(1, summary.consistent);
    EXPECT_EQ(0, summary.flagged);
}

TEST(ValidatorTest, flags_distance_deviation) {
    auto schema = flights::canonical();
    auto flight = consistent_flight(schema, "BA117");
    flight.set("dist", fmsave_core::value(1000));

    auto findings = of_field(fmsave::validator().validate(flights::make_dataset({flight})), "dist");

    ASSERT_EQ(1, findings.size());
    EXPECT_EQ(fmsave::severity::error, findings[0].severity);
    EXPECT_EQ(0, findings[0].row_index);
    EXPECT_EQ("1000 km", findings[0].actual);
    EXPECT_NE(std::string::npos, findings[0].to_string().find("dist"));
}

TEST(ValidatorTest, distance_deviation_is_relative_to_stored_distance) {
    auto schema = flights::canonical();
    // Great-circle distance is about 5541 km: 9.5% of 6122 km but 10.6% of 6200 km.
    auto within = consistent_flight(schema, "BA117");
    within.set("dist", fmsave_core::value(6122));
    auto beyond = consistent_flight(schema, "BA119");
    beyond.set("dist", fmsave_core::value(6200));
    auto zero = consistent_flight(schema, "BA121");
    zero.set("dist", fmsave_core::value(0));

    auto findings = of_field(fmsave::validator().validate(flights::make_dataset({within, beyond, zero})), "dist");

    ASSERT_EQ(2, findings.size());
    EXPECT_EQ(1, findings[0].row_index);
    EXPECT_EQ("6200 km", findings[0].actual);
    EXPECT_EQ(2, findings[1].row_index);
    EXPECT_EQ(fmsave::severity::error, findings[1].severity);
}

TEST(ValidatorTest, tolerance_is_configurable) {
    auto schema = flights::canonical();
    auto flight = consistent_flight(schema, "BA117");
    flight.set("dist", fmsave_core::value(4800));
    auto data = flights::make_dataset({flight});

    EXPECT_EQ(1, of_field(fmsave::validator().validate(data), "dist").size());

    fmsave::validator_options loose;
    loose.distance_tolerance = 0.25;
    EXPECT_TRUE(of_field(fmsave::validator(loose).validate(data), "dist").empty());
}

TEST(ValidatorTest, missing_coordinates_are_unvalidated) {
    auto schema = flights::canonical();
    auto flight = consistent_flight(schema, "BA117");
    flight.set("lat_arr", fmsave_core::value());

    auto findings = of_field(fmsave::validator().validate(flights::make_dataset({flight})), "dist");

    ASSERT_EQ(1, findings.size());
    EXPECT_EQ(fmsave::severity::unvalidated, findings[0].severity);
}

TEST(ValidatorTest, absent_distance_is_a_warning) {
    auto schema = flights::canonical();
    auto flight = consistent_flight(schema, "BA117");
    flight.set("dist", fmsave_core::value());

    auto findings = of_field(fmsave::validator().validate(flights::make_dataset({flight})), "dist");

    ASSERT_EQ(1, findings.size());
    EXPECT_EQ(fmsave::severity::warning, findings[0].severity);
    EXPECT_EQ("absent", findings[0].actual);
}

TEST(ValidatorTest, flags_duration_mismatch) {
    auto schema = flights::canonical();
    auto flight = consistent_flight(schema, "BA117");
    flight.set("duration", fmsave_core::value(fmsave_core::timedelta_t(2h + 40min)));

    auto findings = of_field(fmsave::validator().validate(flights::make_dataset({flight})), "duration");

    ASSERT_EQ(1, findings.size());
    EXPECT_EQ(fmsave::severity::error, findings[0].severity);
    EXPECT_EQ("7:40", findings[0].expected);
    EXPECT_EQ("2:40", findings[0].actual);
}

TEST(ValidatorTest, duration_within_tolerance_passes) {
    auto schema = flights::canonical();
    auto flight = consistent_flight(schema, "BA117");
    flight.set("duration", fmsave_core::value(fmsave_core::timedelta_t(7h + 50min)));

    EXPECT_TRUE(of_field(fmsave::validator().validate(flights::make_dataset({flight})), "duration").empty());
}

TEST(ValidatorTest, arrival_before_departure_is_an_error) {
    auto schema = flights::canonical();
    auto flight = flights::make(schema, "2023-01-09", "XX1");
    flight.set("time_dep", fmsave_core::value(flights::datetime("2023-01-09 23:00")));
    flight.set("gmtoffset_dep", fmsave_core::value(0.0));
    flight.set("time_arr", fmsave_core::value(flights::datetime("2023-01-09 01:00")));
    flight.set("gmtoffset_arr", fmsave_core::value(0.0));
    flight.set("duration", fmsave_core::value(fmsave_core::timedelta_t(2h)));

    auto findings = of_field(fmsave::validator().validate(flights::make_dataset({flight})), "duration");

    ASSERT_EQ(1, findings.size());
    EXPECT_EQ(fmsave::severity::error, findings[0].severity);
    EXPECT_EQ("-22:00", findings[0].expected);
}

TEST(ValidatorTest, missing_offsets_are_unvalidated) {
    auto schema = flights::canonical();
    auto flight = consistent_flight(schema, "BA117");
    flight.set("gmtoffset_arr", fmsave_core::value());

    auto findings = of_field(fmsave::validator().validate(flights::make_dataset({flight})), "duration");

    ASSERT_EQ(1, findings.size());
    EXPECT_EQ(fmsave::severity::unvalidated, findings[0].severity);
    EXPECT_EQ("7:40", findings[0].actual);
}

TEST(ValidatorTest, summary_counts_rows_once) {
    std::vector<fmsave::finding> findings = {
        {0, "dist", "5550 km", "1000 km", fmsave::severity::error},
        {0, "duration", "7:40", "absent", fmsave::severity::unvalidated},
        {1, "duration", "7:40", "absent", fmsave::severity::unvalidated},
        {2, "dist", "5550 km", "absent", fmsave::severity::warning},
        {2, "duration", "7:40", "2:40", fmsave::severity::error},
    };

    auto summary = fmsave::validator::summarize(findings, 5);

    EXPECT_EQ(5, summary.checked);
    EXPECT_EQ(2, summary.flagged);
    EXPECT_EQ(1, summary.unvalidated);
    EXPECT_EQ(2, summary.consistent);
    EXPECT_EQ("5 rows checked: 2 consistent, 2 flagged, 1 unvalidated", summary.to_string());
}

TEST(ValidatorTest, does_not_modify_dataset) {
    auto schema = flights::canonical();
    auto flight = consistent_flight(schema, "BA117");
    flight.set("dist", fmsave_core::value(1000));
    auto data = flights::make_dataset({flight});
    auto copy = data;

    std::ignore = fmsave::validator().validate(data);

    EXPECT_EQ(copy, data);
}
