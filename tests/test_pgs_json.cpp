#include <catch2/catch_all.hpp>
#include "../api/json/pgs_json.h"

SCENARIO("JSON to variant map conversion") {
    GIVEN("A manifest-like JSON document") {
        pgsv_map data;
        pgs_json json(&data);

        WHEN("Parsing it") {
            bool ok = json.parse(R"({"sections": [{"title": "A", "start_page": 1, "ratio": 0.5, "draft": false}],
                                     "metadata": {"file_name": null}})");

            THEN("Values keep their JSON types") {
                REQUIRE(ok);
                const pgsv_map& section = data["sections"].vector_value()[0].map_value();
                REQUIRE(section.at("title").is_string());
                REQUIRE(section.at("start_page").is_int());
                REQUIRE(section.at("ratio").is_double());
                REQUIRE(section.at("draft").is_bool());
                REQUIRE(data["metadata"].map_value().at("file_name").is_null());
            }
        }

        WHEN("Parsing broken JSON") {
            bool ok = json.parse("{\"sections\": [");

            THEN("Parsing fails with a message and an empty map") {
                REQUIRE_FALSE(ok);
                REQUIRE(data.empty());
                REQUIRE(json.last_error().contains("JSON parse error"));
            }
        }

        WHEN("Parsing a top-level array") {
            THEN("It is rejected") {
                REQUIRE_FALSE(json.parse("[]"));
                REQUIRE_FALSE(json.last_error().empty());
            }
        }
    }

    GIVEN("A filled map") {
        pgsv_map data;
        data["name"] = "Book_Chapter 1_ Odile";
        data["count"] = 18LL;
        data["ok"] = true;
        pgs_json json(&data);

        WHEN("Creating JSON and parsing it back") {
            pgs_string text = json.create();
            pgsv_map back;
            pgs_json reader(&back);

            THEN("The same values come out") {
                REQUIRE(reader.parse(text));
                REQUIRE(back == data);
            }
        }
    }

    GIVEN("No map") {
        THEN("Construction is refused") {
            REQUIRE_THROWS_AS(pgs_json(nullptr), std::invalid_argument);
        }
    }
}
