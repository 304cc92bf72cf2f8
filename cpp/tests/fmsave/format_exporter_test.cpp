#include <gtest/gtest.h>
#include "../../fmsave/dataset_io.hpp"
#include "../../fmsave/format_exporter.hpp"
#include "../../fmsave/merge_engine.hpp"
#include "../../fmsave_core/exceptions.hpp"
#include "flights.hpp"

#include <tuple>

using namespace std::chrono_literals;

namespace {

fmsave_core::row full_flight(const fmsave_core::schema_ptr &schema, const std::string &day,
                             const std::string &flightnum) {
    auto r = flights::lhr_jfk(schema, day);
    r.set("flightnum", fmsave_core::value(flightnum));
    r.set("time_dep", fmsave_core::value(flights::datetime(day + " 20:30")));
    r.set("time_arr", fmsave_core::value(flights::datetime(day + " 23:10")));
    r.set("duration", fmsave_core::value(fmsave_core::timedelta_t(7h + 40min)));
    r.set("dist", fmsave_core::value(5550));
    r.set("airline", fmsave_core::value("British Airways"));
    r.set("iata_airline", fmsave_core::value("BA"));
    r.set("seat", fmsave_core::value("23A"));
    r.set("position", fmsave_core::value("Window"));
    r.set("class", fmsave_core::value("Economy"));
    r.set("reason", fmsave_core::value("Personal"));
    return r;
}

const std::string british_airways = "1355,\"British Airways\",,BA,BAW,SPEEDBIRD,\"United Kingdom\",Y\n";

fmsave::reference_tables openflights_tables(const std::string &airlines = british_airways) {
    auto &registry = flights::registry();
    fmsave::reference_tables tables;
    tables.add(fmsave::reference_table(
        registry.load("openflights_airports"),
        fmsave::decode_rows("507,\"London Heathrow Airport\",London,\"United Kingdom\",LHR,EGLL,51.4706,-0.461941,83,0,E,"
                            "Europe/London,airport,OurAirports\n"
                            "3797,\"John F Kennedy International Airport\",\"New York\",\"United States\",JFK,KJFK,"
                            "40.63980103,-73.77890015,13,-5,A,America/New_York,airport,OurAirports\n",
                            registry.load("openflights_airports"))));
    tables.add(fmsave::reference_table(
        registry.load("openflights_airlines"),
        fmsave::decode_rows(airlines, registry.load("openflights_airlines"))));
    return tables;
}

} // namespace

TEST(FormatExporterTest, exports_openflights_columns) {
    auto schema = flights::canonical();
    auto data = flights::make_dataset({full_flight(schema, "2023-03-09", "BA117")});
    auto tables = openflights_tables();
    auto target = flights::registry().load("openflights");

    auto result = fmsave::format_exporter(target, &tables).export_dataset(data);

    ASSERT_EQ(1, result.records.size());
    EXPECT_TRUE(result.errors.empty());
    const auto &record = result.records[0];
    ASSERT_EQ(target->size(), record.size());
    EXPECT_EQ("2023-03-09", record[target->index_of("Date")]);
    EXPECT_EQ("EGLL", record[target->index_of("From")]);
    EXPECT_EQ("KJFK", record[target->index_of("To")]);
    EXPECT_EQ("BA117", record[target->index_of("Flight_Number")]);
    EXPECT_EQ("3448", record[target->index_of("Distance")]);
    EXPECT_EQ("07:40", record[target->index_of("Duration")]);
    EXPECT_EQ("W", record[target->index_of("Seat_Type")]);
    EXPECT_EQ("Y", record[target->index_of("Class")]);
    EXPECT_EQ("L", record[target->index_of("Reason")]);
    EXPECT_EQ("", record[target->index_of("Trip")]);
    EXPECT_EQ("507", record[target->index_of("From_OID")]);
    EXPECT_EQ("3797", record[target->index_of("To_OID")]);
    EXPECT_EQ("1355", record[target->index_of("Airline_OID")]);
}

TEST(FormatExporterTest, date_precision_selects_format) {
    auto schema = flights::canonical();
    auto with_time = full_flight(schema, "2023-03-09", "BA117");
    with_time.set("dt_info", fmsave_core::value("YMDT"));
    auto month_only = full_flight(schema, "2023-04-01", "BA118");
    month_only.set("dt_info", fmsave_core::value("YM"));
    auto data = flights::make_dataset({with_time, month_only});
    auto tables = openflights_tables();
    auto target = flights::registry().load("openflights");

    auto result = fmsave::format_exporter(target, &tables).export_dataset(data);

    ASSERT_EQ(2, result.records.size());
    EXPECT_EQ("2023-03-09 20:30", result.records[0][target->index_of("Date")]);
    EXPECT_EQ("2023-04", result.records[1][target->index_of("Date")]);
}

TEST(FormatExporterTest, rows_missing_required_values_are_excluded) {
    auto schema = flights::canonical();
    auto missing = full_flight(schema, "2023-03-10", "BA118");
    missing.set("icao_dep", fmsave_core::value(""));
    auto data = flights::make_dataset({full_flight(schema, "2023-03-09", "BA117"), missing,
                                       full_flight(schema, "2023-03-11", "BA119")});
    auto tables = openflights_tables();
    auto target = flights::registry().load("openflights");

    auto result = fmsave::format_exporter(target, &tables).export_dataset(data);

    ASSERT_EQ(2, result.records.size());
    EXPECT_EQ("BA117", result.records[0][target->index_of("Flight_Number")]);
    EXPECT_EQ("BA119", result.records[1][target->index_of("Flight_Number")]);
    ASSERT_EQ(1, result.errors.size());
    EXPECT_EQ(1, result.errors[0].row());
    EXPECT_EQ("From", result.errors[0].column());
}

TEST(FormatExporterTest, exports_myflightpath_columns) {
    auto schema = flights::canonical();
    auto data = flights::make_dataset({full_flight(schema, "2023-03-09", "BA117")});
    auto target = flights::registry().load("myflightpath");

    auto result = fmsave::format_exporter(target).export_dataset(data);

    ASSERT_EQ(1, result.records.size());
    const auto &record = result.records[0];
    EXPECT_EQ("2023-03-09", record[target->index_of("flight_date")]);
    EXPECT_EQ("20:30", record[target->index_of("departure_time")]);
    EXPECT_EQ("23:10", record[target->index_of("arrival_time")]);
    EXPECT_EQ("window", record[target->index_of("seat_type")]);
    EXPECT_EQ("leisure", record[target->index_of("reason")]);
    EXPECT_EQ("Y", record[target->index_of("is_public")]);
    EXPECT_EQ("", record[target->index_of("airline_icao")]);

    const auto csv = result.to_csv();
    EXPECT_EQ(0, csv.find("flight_date,flight_number,airline_icao,airline_iata,"));
    EXPECT_NE(std::string::npos, csv.find("\r\n2023-03-09,BA117,,BA,EGLL,LHR,20:30,"));
}

TEST(FormatExporterTest, lookup_without_tables_fails_before_export) {
    auto schema = flights::canonical();
    auto data = flights::make_dataset({full_flight(schema, "2023-03-09", "BA117")});

    EXPECT_THROW(std::ignore = fmsave::format_exporter(flights::registry().load("openflights")).export_dataset(data),
                 fmsave::unknown_reference_table);
}

TEST(FormatExporterTest, unknown_source_column_fails_before_export) {
    auto schema = flights::canonical();
    auto target = fmsave_core::schema::parse("broken", R"({"columns": [
        {"name": "Where", "type": "str", "provenance": "no_such_column"}]})");

    EXPECT_THROW(std::ignore = fmsave::format_exporter(target).export_dataset(flights::make_dataset({})),
                 fmsave_core::unknown_column);
}

TEST(FormatExporterTest, reference_table_lookup) {
    auto tables = openflights_tables();
    const auto &airports = tables.get("openflights_airports");

    EXPECT_EQ(2, airports.size());
    EXPECT_EQ(fmsave_core::value(3797), airports.lookup("IATA", "JFK", "ID").value());
    EXPECT_EQ(fmsave_core::value("Europe/London"), airports.lookup("ICAO", "EGLL", "Tz").value());
    EXPECT_FALSE(airports.lookup("ICAO", "ZZZZ", "ID").has_value());
    EXPECT_THROW(std::ignore = tables.get("ourairports"), fmsave::unknown_reference_table);
}

TEST(FormatExporterTest, airline_lookup_matches_code_and_name) {
    auto schema = flights::canonical();
    auto data = flights::make_dataset({full_flight(schema, "2023-03-09", "BA117")});
    auto tables = openflights_tables("100,\"Bahamas Air\",,BA,BHS,BAHAMAS,Bahamas,N\n" + british_airways);
    auto target = flights::registry().load("openflights");

    auto result = fmsave::format_exporter(target, &tables).export_dataset(data);

    ASSERT_EQ(1, result.records.size());
    EXPECT_EQ("1355", result.records[0][target->index_of("Airline_OID")]);
}

TEST(FormatExporterTest, airline_lookup_falls_back_to_name) {
    auto schema = flights::canonical();
    auto renamed = full_flight(schema, "2023-03-09", "BA117");
    renamed.set("iata_airline", fmsave_core::value("ZZ"));
    auto unknown = full_flight(schema, "2023-03-10", "XX1");
    unknown.set("airline", fmsave_core::value("Nowhere Air"));
    unknown.set("iata_airline", fmsave_core::value("BA"));
    auto data = flights::make_dataset({renamed, unknown});
    auto tables = openflights_tables();
    auto target = flights::registry().load("openflights");

    auto result = fmsave::format_exporter(target, &tables).export_dataset(data);

    ASSERT_EQ(2, result.records.size());
    EXPECT_EQ("1355", result.records[0][target->index_of("Airline_OID")]);
    EXPECT_EQ("", result.records[1][target->index_of("Airline_OID")]);
}

TEST(FormatExporterTest, reference_table_lookup_by_several_columns) {
    auto &registry = flights::registry();
    fmsave::reference_table airlines(
        registry.load("openflights_airlines"),
        fmsave::decode_rows("100,\"Bahamas Air\",,BA,BHS,BAHAMAS,Bahamas,N\n" + british_airways,
                            registry.load("openflights_airlines")));

    EXPECT_EQ(fmsave_core::value(100), airlines.lookup("IATA", "BA", "ID").value());
    EXPECT_EQ(fmsave_core::value(1355), airlines.lookup({{"IATA", "BA"}, {"Name", "British Airways"}}, "ID").value());
    EXPECT_FALSE(airlines.lookup({{"IATA", "ZZ"}, {"Name", "British Airways"}}, "ID").has_value());
    EXPECT_THROW(std::ignore = airlines.lookup({{"IATA", "BA"}, {"Nickname", "x"}}, "ID"), fmsave_core::unknown_column);
}

TEST(FormatExporterTest, out_of_range_integer_excludes_row) {
    auto schema = flights::canonical();
    auto huge = full_flight(schema, "2023-03-10", "BA118");
    huge.set("lat_dep", fmsave_core::value(1e300));
    auto data = flights::make_dataset({full_flight(schema, "2023-03-09", "BA117"), huge});
    auto target = fmsave_core::schema::parse("rounded", R"({"columns": [
        {"name": "Latitude", "type": "int", "provenance": "lat_dep"}]})");

    auto result = fmsave::format_exporter(target).export_dataset(data);

    ASSERT_EQ(1, result.records.size());
    EXPECT_EQ("51", result.records[0][0]);
    ASSERT_EQ(1, result.errors.size());
    EXPECT_EQ(1, result.errors[0].row());
    EXPECT_EQ("Latitude", result.errors[0].column());
}
