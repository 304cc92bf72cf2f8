#include <gtest/gtest.h>
#include "../../fmsave/exceptions.hpp"
#include "../../fmsave/timezone_resolver.hpp"
#include "flights.hpp"

#include <deque>
#include <functional>

namespace {

/// Answers by longitude sign; scripted failures are raised first, one per call.
class fake_lookup : public fmsave::timezone_lookup {
public:
    fmsave::timezone_info lookup(double lat, double lon, fmsave_core::date_t date) override {
        calls.push_back(fmsave::timezone_query::make(lat, lon, date));
        if (!failures.empty()) {
            auto fail = std::move(failures.front());
            failures.pop_front();
            fail();
        }
        if (lon < -30) {
            return {"America/New_York", -5.0};
        }
        return {"Europe/London", 0.0};
    }

    std::string name() const override {
        return "fake";
    }

    std::vector<fmsave::timezone_query> calls;
    std::deque<std::function<void()>> failures;
};

fmsave_core::row dated_flight(const fmsave_core::schema_ptr &schema, const std::string &day,
                              const std::string &flightnum) {
    auto r = flights::lhr_jfk(schema, day);
    r.set("flightnum", fmsave_core::value(flightnum));
    r.set("date_str_dep", fmsave_core::value(flights::date(day)));
    r.set("date_str_arr", fmsave_core::value(flights::date(day)));
    return r;
}

} // namespace

TEST(TimezoneResolverTest, fills_missing_timezones) {
    auto schema = flights::canonical();
    auto data = flights::make_dataset({dated_flight(schema, "2023-03-09", "BA117")});
    fake_lookup lookup;
    fmsave::timezone_cache cache;

    auto result = fmsave::timezone_resolver(lookup, {}, cache).resolve(data);

    const auto &r = result.data[0];
    EXPECT_EQ(fmsave_core::value("Europe/London"), r.get("tzid_dep"));
    EXPECT_EQ(fmsave_core::value(0.0), r.get("gmtoffset_dep"));
    EXPECT_EQ(fmsave_core::value("America/New_York"), r.get("tzid_arr"));
    EXPECT_EQ(fmsave_core::value(-5.0), r.get("gmtoffset_arr"));
    EXPECT_EQ(1, result.resolved);
    EXPECT_EQ(0, result.unresolved);
    EXPECT_EQ(2, result.lookups);
    EXPECT_EQ(2, cache.size());
    EXPECT_TRUE(data[0].get("tzid_dep").is_absent());
}

TEST(TimezoneResolverTest, same_airport_and_date_is_queried_once) {
    auto schema = flights::canonical();
    auto data = flights::make_dataset({dated_flight(schema, "2023-03-09", "BA117"),
                                       dated_flight(schema, "2023-03-09", "BA175")});
    fake_lookup lookup;
    fmsave::timezone_cache cache;

    auto result = fmsave::timezone_resolver(lookup, {}, cache).resolve(data);

    EXPECT_EQ(2, lookup.calls.size());
    EXPECT_EQ(2, result.resolved);
}

TEST(TimezoneResolverTest, cached_answers_are_reused) {
    auto schema = flights::canonical();
    fake_lookup lookup;
    fmsave::timezone_cache cache;
    cache.put(fmsave::timezone_query::make(51.47, -0.45, flights::date("2023-03-09")), {"Europe/London", 0.0});

    auto result = fmsave::timezone_resolver(lookup, {}, cache)
                      .resolve(flights::make_dataset({dated_flight(schema, "2023-03-09", "BA117")}));

    ASSERT_EQ(1, lookup.calls.size());
    EXPECT_DOUBLE_EQ(-73.78, lookup.calls[0].lon());
    EXPECT_EQ(1, result.cache_hits);
    EXPECT_EQ(1, result.resolved);
}

TEST(TimezoneResolverTest, rows_with_timezones_are_left_alone) {
    auto schema = flights::canonical();
    auto flight = dated_flight(schema, "2023-03-09", "BA117");
    flight.set("tzid_dep", fmsave_core::value("Europe/London"));
    flight.set("gmtoffset_dep", fmsave_core::value(0.0));
    flight.set("tzid_arr", fmsave_core::value("America/New_York"));
    flight.set("gmtoffset_arr", fmsave_core::value(-5.0));
    fake_lookup lookup;
    fmsave::timezone_cache cache;

    auto result = fmsave::timezone_resolver(lookup, {}, cache).resolve(flights::make_dataset({flight}));

    EXPECT_TRUE(lookup.calls.empty());
    EXPECT_EQ(0, result.resolved);
    EXPECT_EQ(flight, result.data[0]);
}

TEST(TimezoneResolverTest, missing_date_falls_back_to_local_time) {
    auto schema = flights::canonical();
    auto flight = flights::lhr_jfk(schema, "2023-03-09");
    flight.set("time_dep", fmsave_core::value(flights::datetime("2023-03-09 20:30")));
    flight.set("time_arr", fmsave_core::value(flights::datetime("2023-03-10 00:10")));
    fake_lookup lookup;
    fmsave::timezone_cache cache;

    auto result = fmsave::timezone_resolver(lookup, {}, cache).resolve(flights::make_dataset({flight}));

    ASSERT_EQ(2, lookup.calls.size());
    EXPECT_EQ(flights::date("2023-03-09"), lookup.calls[0].date);
    EXPECT_EQ(flights::date("2023-03-10"), lookup.calls[1].date);
    EXPECT_EQ(fmsave_core::value(flights::date("2023-03-10")), result.data[0].get("date_str_arr"));
}

TEST(TimezoneResolverTest, rows_without_coordinates_are_skipped) {
    auto schema = flights::canonical();
    auto flight = flights::make(schema, "2023-03-09", "XX1");
    flight.set("date_str_dep", fmsave_core::value(flights::date("2023-03-09")));
    fake_lookup lookup;
    fmsave::timezone_cache cache;

    auto result = fmsave::timezone_resolver(lookup, {}, cache).resolve(flights::make_dataset({flight}));

    EXPECT_TRUE(lookup.calls.empty());
    EXPECT_EQ(1, result.skipped);
    EXPECT_EQ(0, result.resolved);
    EXPECT_EQ(0, result.unresolved);
}

TEST(TimezoneResolverTest, row_with_one_side_lacking_coordinates_is_skipped) {
    auto schema = flights::canonical();
    auto flight = dated_flight(schema, "2023-03-09", "BA117");
    flight.set("lat_dep", fmsave_core::value());
    fake_lookup lookup;
    fmsave::timezone_cache cache;

    auto result = fmsave::timezone_resolver(lookup, {}, cache).resolve(flights::make_dataset({flight}));

    ASSERT_EQ(1, lookup.calls.size());
    EXPECT_EQ(fmsave_core::value("America/New_York"), result.data[0].get("tzid_arr"));
    EXPECT_TRUE(result.data[0].get("tzid_dep").is_absent());
    EXPECT_EQ(1, result.skipped);
    EXPECT_EQ(0, result.resolved);
    EXPECT_EQ(0, result.unresolved);
}

TEST(TimezoneResolverTest, transient_failures_are_retried) {
    auto schema = flights::canonical();
    fake_lookup lookup;
    lookup.failures.push_back([] { throw fmsave::transient_lookup_error("timeout"); });
    lookup.failures.push_back([] { throw fmsave::transient_lookup_error("HTTP 503"); });
    fmsave::timezone_cache cache;

    auto result = fmsave::timezone_resolver(lookup, {}, cache)
                      .resolve(flights::make_dataset({dated_flight(schema, "2023-03-09", "BA117")}));

    EXPECT_EQ(4, lookup.calls.size());
    EXPECT_EQ(1, result.resolved);
    EXPECT_TRUE(result.errors.empty());
}

TEST(TimezoneResolverTest, retries_are_bounded) {
    auto schema = flights::canonical();
    fake_lookup lookup;
    for (int i = 0; i < 2; ++i) {
        lookup.failures.push_back([] { throw fmsave::transient_lookup_error("timeout"); });
    }
    fmsave::resolver_options options;
    options.max_retries = 1;
    fmsave::timezone_cache cache;

    auto result = fmsave::timezone_resolver(lookup, options, cache)
                      .resolve(flights::make_dataset({dated_flight(schema, "2023-03-09", "BA117")}));

    EXPECT_EQ(3, lookup.calls.size());
    EXPECT_EQ(1, result.unresolved);
    ASSERT_EQ(1, result.errors.size());
    EXPECT_TRUE(result.data[0].get("tzid_dep").is_absent());
    EXPECT_EQ(fmsave_core::value("America/New_York"), result.data[0].get("tzid_arr"));
}

TEST(TimezoneResolverTest, not_found_affects_only_its_query) {
    auto schema = flights::canonical();
    fake_lookup lookup;
    lookup.failures.push_back([] { throw fmsave::lookup_not_found(51.47, -0.45, "no timezone"); });
    fmsave::timezone_cache cache;

    auto result = fmsave::timezone_resolver(lookup, {}, cache)
                      .resolve(flights::make_dataset({dated_flight(schema, "2023-03-09", "BA117"),
                                                      dated_flight(schema, "2023-03-10", "BA118")}));

    EXPECT_EQ(4, lookup.calls.size());
    EXPECT_EQ(1, result.errors.size());
    EXPECT_EQ(1, result.unresolved);
    EXPECT_EQ(1, result.resolved);
    EXPECT_FALSE(result.quota_exhausted);
}

TEST(TimezoneResolverTest, quota_stops_further_lookups) {
    auto schema = flights::canonical();
    fake_lookup lookup;
    lookup.failures.push_back([] {});
    lookup.failures.push_back([] { throw fmsave::quota_exceeded("the hourly limit of 1000 credits has been exceeded"); });
    fmsave::timezone_cache cache;

    auto result = fmsave::timezone_resolver(lookup, {}, cache)
                      .resolve(flights::make_dataset({dated_flight(schema, "2023-03-09", "BA117"),
                                                      dated_flight(schema, "2023-03-10", "BA118")}));

    EXPECT_EQ(2, lookup.calls.size());
    EXPECT_TRUE(result.quota_exhausted);
    EXPECT_EQ(2, result.unresolved);
    EXPECT_EQ(0, result.resolved);
    EXPECT_EQ(fmsave_core::value("Europe/London"), result.data[0].get("tzid_dep"));
    EXPECT_TRUE(result.data[0].get("tzid_arr").is_absent());
    EXPECT_NE(std::string::npos, result.summary().find("rerun later"));
}

TEST(TimezoneResolverTest, authorization_failure_stops_lookups) {
    auto schema = flights::canonical();
    fake_lookup lookup;
    lookup.failures.push_back([] { throw fmsave::lookup_authorization_error("user account not enabled"); });
    fmsave::timezone_cache cache;

    auto result = fmsave::timezone_resolver(lookup, {}, cache)
                      .resolve(flights::make_dataset({dated_flight(schema, "2023-03-09", "BA117")}));

    EXPECT_EQ(1, lookup.calls.size());
    EXPECT_TRUE(result.authorization_failed);
    EXPECT_EQ(1, result.unresolved);
    EXPECT_EQ(1, result.errors.size());
}

TEST(TimezoneResolverTest, lookup_limit) {
    auto schema = flights::canonical();
    fake_lookup lookup;
    fmsave::resolver_options options;
    options.max_lookups = 3;
    fmsave::timezone_cache cache;

    auto result = fmsave::timezone_resolver(lookup, options, cache)
                      .resolve(flights::make_dataset({dated_flight(schema, "2023-03-09", "BA117"),
                                                      dated_flight(schema, "2023-03-10", "BA118")}));

    EXPECT_EQ(3, lookup.calls.size());
    EXPECT_TRUE(result.lookup_limit_reached);
    EXPECT_EQ(1, result.resolved);
    EXPECT_EQ(1, result.unresolved);
}
