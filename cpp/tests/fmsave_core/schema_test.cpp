#include <gtest/gtest.h>
#include "../../fmsave_core/exceptions.hpp"
#include "../../fmsave_core/schema.hpp"
#include "../../fmsave_core/schema_registry.hpp"
#include "../fmsave/flights.hpp"

#include <tuple>

TEST(SchemaTest, canonical_schema) {
    auto schema = flights::canonical();

    EXPECT_EQ("fmsave", schema->name());
    EXPECT_EQ(0, schema->index_of("flight_index"));
    EXPECT_EQ(fmsave_core::column_type::datetime, schema->column("time_dep").type());
    EXPECT_EQ(fmsave_core::side::arrival, schema->column("lat_arr").column_side());
    EXPECT_TRUE(schema->column("flightnum").is_merge_key());
    EXPECT_FALSE(schema->column("tzid_dep").is_merge_key());
    EXPECT_FALSE(schema->column("flight_index").is_merge_key());

    EXPECT_EQ(schema->index_of("lat_dep"), schema->find_by_provenance(fmsave_core::side::departure, "lat"));
    EXPECT_EQ(schema->index_of("tzid_arr"), schema->find_by_provenance(fmsave_core::side::arrival, "tzid"));
    EXPECT_EQ(schema->index_of("dist"), schema->find_by_provenance(fmsave_core::side::none, "distance"));
    EXPECT_FALSE(schema->find_by_provenance(fmsave_core::side::departure, "distance").has_value());
    EXPECT_EQ(schema->index_of("date_str_dep"), schema->timezone_lookup_date(fmsave_core::side::departure));

    EXPECT_EQ("date_as_dt", schema->merge().window_column.value());
    EXPECT_EQ("flight_index", schema->merge().index_column.value());
    EXPECT_THROW(std::ignore = schema->index_of("no_such_column"), fmsave_core::unknown_column);
}

TEST(SchemaTest, export_dialects_load) {
    auto openflights = flights::registry().load("openflights");
    const auto& date = openflights->column("Date");
    ASSERT_TRUE(date.column_provenance().has_value());
    const auto& selection = std::get<fmsave_core::switch_provenance>(*date.column_provenance());
    EXPECT_EQ("dt_info", selection.discriminator);
    EXPECT_EQ("%Y-%m", selection.cases.at("YM").format.value());
    EXPECT_TRUE(date.required());

    const auto& lookup = std::get<fmsave_core::lookup_provenance>(*openflights->column("From_OID").column_provenance());
    EXPECT_EQ("openflights_airports", lookup.table);
    ASSERT_EQ(1, lookup.attempts.size());
    ASSERT_EQ(1, lookup.attempts[0].size());
    EXPECT_EQ("icao_dep", lookup.attempts[0][0].key_column);
    EXPECT_EQ("ICAO", lookup.attempts[0][0].match);
    EXPECT_EQ("ID", lookup.field);

    const auto& airline = std::get<fmsave_core::lookup_provenance>(
        *openflights->column("Airline_OID").column_provenance());
    ASSERT_EQ(2, airline.attempts.size());
    EXPECT_EQ(2, airline.attempts[0].size());
    ASSERT_EQ(1, airline.attempts[1].size());
    EXPECT_EQ("airline", airline.attempts[1][0].key_column);
    EXPECT_EQ("Name", airline.attempts[1][0].match);

    EXPECT_EQ(fmsave_core::distance_unit::miles, openflights->column("Distance").unit().value());
    EXPECT_EQ("W", openflights->column("Seat_Type").value_map().at("Window"));

    auto airports = flights::registry().load("openflights_airports");
    EXPECT_FALSE(airports->document().header_row);
    EXPECT_EQ("\n", airports->document().newline);
}

TEST(SchemaTest, registry_caches_and_reports_unknown_dialects) {
    fmsave_core::schema_registry registry(FMSAVE_SCHEMA_DIR);
    EXPECT_FALSE(registry.is_loaded("fmsave"));
    auto first = registry.load("fmsave");
    EXPECT_TRUE(registry.is_loaded("fmsave"));
    EXPECT_EQ(first, registry.load("fmsave"));

    EXPECT_THROW(std::ignore = registry.load("no_such_dialect"), fmsave_core::unknown_dialect);
}

TEST(SchemaTest, accepts_type_aliases) {
    auto schema = fmsave_core::schema::parse("aliases", R"({
        "columns": [
            {"name": "a", "type": "str"},
            {"name": "b", "type": "dt"},
            {"name": "c", "type": "td"},
            {"name": "d", "type": "int"},
            {"name": "e", "type": "float"},
            {"name": "f", "type": "bool"}
        ]
    })");

    EXPECT_EQ(fmsave_core::column_type::string, schema->column("a").type());
    EXPECT_EQ(fmsave_core::column_type::datetime, schema->column("b").type());
    EXPECT_EQ(fmsave_core::column_type::timedelta, schema->column("c").type());
    EXPECT_EQ(fmsave_core::column_type::integer, schema->column("d").type());
    EXPECT_EQ(fmsave_core::column_type::floating, schema->column("e").type());
    EXPECT_EQ(fmsave_core::column_type::boolean, schema->column("f").type());
    EXPECT_EQ(',', schema->document().separator);
    EXPECT_TRUE(schema->document().header_row);
}

TEST(SchemaTest, rejects_unknown_type) {
    EXPECT_THROW(fmsave_core::schema::parse("bad", R"({"columns": [{"name": "a", "type": "decimal"}]})"),
                 fmsave_core::unknown_column_type);
}

TEST(SchemaTest, rejects_duplicate_column) {
    EXPECT_THROW(fmsave_core::schema::parse("bad", R"({"columns": [{"name": "a", "type": "str"},
                                                                    {"name": "a", "type": "int"}]})"),
                 fmsave_core::duplicate_column);
}

TEST(SchemaTest, rejects_unpaired_side_column) {
    EXPECT_THROW(fmsave_core::schema::parse("bad", R"({"columns": [
                     {"name": "lat_dep", "type": "float", "side": "dep", "provenance": "lat"}]})"),
                 fmsave_core::unpaired_side_column);

    EXPECT_NO_THROW(fmsave_core::schema::parse("good", R"({"columns": [
                        {"name": "lat_dep", "type": "float", "side": "dep", "provenance": "lat"},
                        {"name": "lat_arr", "type": "float", "side": "arr", "provenance": "lat"}]})"));
}

TEST(SchemaTest, rejects_malformed_documents) {
    EXPECT_THROW(fmsave_core::schema::parse("bad", "not json"), fmsave_core::invalid_schema_document);
    EXPECT_THROW(fmsave_core::schema::parse("bad", "[]"), fmsave_core::invalid_schema_document);
    EXPECT_THROW(fmsave_core::schema::parse("bad", R"({"columns": [{"type": "str"}]})"),
                 fmsave_core::invalid_schema_document);
    EXPECT_THROW(fmsave_core::schema::parse("bad", R"({"columns": [{"name": "a", "type": "int", "unit": "km",
                                                                    "transform": "upper"}]})"),
                 fmsave_core::invalid_schema_document);
    EXPECT_THROW(fmsave_core::schema::parse("bad", R"({"merge": {"window_column": "d"},
                                                       "columns": [{"name": "d", "type": "str"}]})"),
                 fmsave_core::invalid_schema_document);
    EXPECT_THROW(fmsave_core::schema::parse("bad", R"({"merge": {"order_columns": ["missing"]},
                                                       "columns": [{"name": "d", "type": "str"}]})"),
                 fmsave_core::unknown_column);
}
