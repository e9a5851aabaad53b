#include <catch2/catch_all.hpp>
#include "../splitting/manifest/pgs_manifest_loader.h"
#include "shared/split_test_fixtures.h"

static pgsv_map section_map(const pgs_string& title, pgs_variant start, pgs_variant end, const pgs_string& kind) {
    pgsv_map section;
    section["title"] = title;
    section["start_page"] = start;
    section["end_page"] = end;
    section["kind"] = kind;
    return section;
}

static pgsv_map raw_manifest(const pgsv_vector& sections) {
    pgsv_map metadata;
    metadata["declared_total_pages"] = 400LL;
    metadata["source_file_name"] = "Book.pdf";

    pgsv_map raw;
    raw["sections"] = sections;
    raw["metadata"] = metadata;
    return raw;
}

SCENARIO("Loading a well-formed manifest") {
    GIVEN("The JSON emitted by the analysis service") {
        WHEN("Loading it") {
            pgs_manifest manifest = pgs_manifest_loader::load_json(sample_manifest_json());

            THEN("Sections keep their order and values") {
                REQUIRE(manifest.section_count() == 3);
                const auto& sections = manifest.get_sections();
                REQUIRE(sections[0].get_title() == "Front Cover");
                REQUIRE(sections[0].get_kind() == pgs_section_kind::front_matter);
                REQUIRE(sections[1].get_title() == "Chapter 1: The Beginning/End");
                REQUIRE(sections[1].get_start_page() == 2);
                REQUIRE(sections[1].get_end_page() == 4);
                REQUIRE(sections[1].get_kind() == pgs_section_kind::chapter);
                REQUIRE(sections[2].get_kind() == pgs_section_kind::back_matter);
            }

            THEN("Legacy metadata keys are accepted") {
                REQUIRE(manifest.get_metadata().get_declared_total_pages() == 6);
                REQUIRE(manifest.get_metadata().get_source_file_name() == "Sample Book.pdf");
                REQUIRE(manifest.get_metadata().get_declared_total_sections() == 3);
            }

            THEN("A missing page_range is derived from the page numbers") {
                REQUIRE(manifest.get_sections()[1].get_page_range() == "2-4");
                REQUIRE(manifest.get_sections()[2].get_page_range() == "5-6");
                REQUIRE(manifest.get_sections()[0].get_page_range() == "1");
            }

            THEN("The declared section pages are summed") {
                REQUIRE(manifest.declared_section_pages() == 6);
            }
        }
    }

    GIVEN("Page numbers given as numeric strings and whole doubles") {
        pgsv_vector sections;
        sections.push_back(section_map("Prologue", "3", 4.0, "Front-Matter"));

        WHEN("Loading it") {
            pgs_manifest manifest = pgs_manifest_loader::load(raw_manifest(sections));

            THEN("They are read as integers and the kind is normalized") {
                REQUIRE(manifest.get_sections()[0].get_start_page() == 3);
                REQUIRE(manifest.get_sections()[0].get_end_page() == 4);
                REQUIRE(manifest.get_sections()[0].get_kind() == pgs_section_kind::front_matter);
            }
        }
    }

    GIVEN("Metadata without page count or file name") {
        pgsv_map raw;
        raw["sections"] = pgsv_vector();
        raw["metadata"] = pgsv_map();

        THEN("Defaults are used") {
            pgs_manifest manifest = pgs_manifest_loader::load(raw);
            REQUIRE(manifest.section_count() == 0);
            REQUIRE(manifest.get_metadata().get_declared_total_pages() == 0);
            REQUIRE(manifest.get_metadata().get_source_file_name().empty());
            REQUIRE_FALSE(manifest.get_metadata().has_declared_total_sections());
        }
    }
}

SCENARIO("Rejecting malformed manifests") {
    GIVEN("A manifest without metadata") {
        pgsv_map raw;
        raw["sections"] = pgsv_vector();

        THEN("Loading fails with a validation error") {
            REQUIRE_THROWS_AS(pgs_manifest_loader::load(raw), pgs_validation_error);
            REQUIRE_THROWS_WITH(pgs_manifest_loader::load(raw), Catch::Matchers::ContainsSubstring("metadata"));
        }
    }

    GIVEN("A manifest without sections") {
        pgsv_map raw;
        raw["metadata"] = pgsv_map();

        THEN("Loading fails naming the missing key") {
            REQUIRE_THROWS_AS(pgs_manifest_loader::load(raw), pgs_validation_error);
            REQUIRE_THROWS_WITH(pgs_manifest_loader::load(raw), Catch::Matchers::ContainsSubstring("sections"));
        }
    }

    GIVEN("A section missing one of its required fields") {
        auto field = GENERATE(as<std::string>{}, "title", "start_page", "end_page", "kind");
        pgsv_map broken = section_map("Chapter 1", 1LL, 9LL, "chapter");
        broken.erase(field);
        pgsv_vector sections;
        sections.push_back(broken);

        THEN("The error names that field") {
            try {
                pgs_manifest_loader::load(raw_manifest(sections));
                FAIL("expected pgs_validation_error");
            } catch (const pgs_validation_error& e) {
                REQUIRE(e.get_field_path() == pgs_string("sections[0].") + pgs_string(field));
            }
        }
    }

    GIVEN("A section using the legacy type key") {
        pgsv_map section = section_map("Index", 1LL, 2LL, "chapter");
        section.erase("kind");
        section["type"] = "back_matter";
        pgsv_vector sections;
        sections.push_back(section);

        THEN("The alias is read as the kind") {
            pgs_manifest manifest = pgs_manifest_loader::load(raw_manifest(sections));
            REQUIRE(manifest.get_sections()[0].get_kind() == pgs_section_kind::back_matter);
        }

        WHEN("The alias holds an unknown kind") {
            section["type"] = "appendix";
            pgsv_vector bad;
            bad.push_back(section);

            THEN("Loading fails on the kind field") {
                REQUIRE_THROWS_WITH(pgs_manifest_loader::load(raw_manifest(bad)),
                                    Catch::Matchers::ContainsSubstring("sections[0].kind"));
            }
        }
    }

    GIVEN("A manifest whose sections are not an array") {
        pgsv_map raw;
        raw["sections"] = "chapter one";
        raw["metadata"] = pgsv_map();

        THEN("Loading fails naming the field") {
            try {
                pgs_manifest_loader::load(raw);
                FAIL("expected pgs_validation_error");
            } catch (const pgs_validation_error& e) {
                REQUIRE(e.get_field_path() == "sections");
            }
        }
    }

    GIVEN("Metadata that is not an object") {
        pgsv_map raw;
        raw["sections"] = pgsv_vector();
        raw["metadata"] = 12LL;

        THEN("Loading fails") {
            REQUIRE_THROWS_AS(pgs_manifest_loader::load(raw), pgs_validation_error);
        }
    }

    GIVEN("A section without end_page") {
        pgsv_map broken = section_map("Chapter 2", 10LL, 12LL, "chapter");
        broken.erase("end_page");
        pgsv_vector sections;
        sections.push_back(section_map("Chapter 1", 1LL, 9LL, "chapter"));
        sections.push_back(broken);

        THEN("The error names the section index and field") {
            try {
                pgs_manifest_loader::load(raw_manifest(sections));
                FAIL("expected pgs_validation_error");
            } catch (const pgs_validation_error& e) {
                REQUIRE(e.get_field_path() == "sections[1].end_page");
            }
        }
    }

    GIVEN("A section whose start lies after its end") {
        pgsv_vector sections;
        sections.push_back(section_map("Backwards", 9LL, 3LL, "chapter"));

        THEN("Loading fails instead of swapping the pages") {
            REQUIRE_THROWS_AS(pgs_manifest_loader::load(raw_manifest(sections)), pgs_validation_error);
        }
    }

    GIVEN("A section with an unknown kind") {
        pgsv_vector sections;
        sections.push_back(section_map("Map", 1LL, 1LL, "appendix"));

        THEN("Loading fails naming the kind field") {
            REQUIRE_THROWS_WITH(pgs_manifest_loader::load(raw_manifest(sections)),
                                Catch::Matchers::ContainsSubstring("sections[0].kind"));
        }
    }

    GIVEN("A fractional page number") {
        pgsv_vector sections;
        sections.push_back(section_map("Half", 1.5, 3LL, "chapter"));

        THEN("Loading fails") {
            REQUIRE_THROWS_AS(pgs_manifest_loader::load(raw_manifest(sections)), pgs_validation_error);
        }
    }

    GIVEN("Page numbers too large for any document") {
        auto bad_value = GENERATE(pgs_variant(4000000000000LL), pgs_variant(1e300), pgs_variant(-1e300),
                                  pgs_variant("99999999999"), pgs_variant(-3000000000LL));
        pgsv_vector sections;
        sections.push_back(section_map("Huge", 1LL, bad_value, "chapter"));

        THEN("Loading rejects them as out of range") {
            REQUIRE_THROWS_AS(pgs_manifest_loader::load(raw_manifest(sections)), pgs_validation_error);
        }
    }

    GIVEN("A page number at the accepted limit") {
        pgsv_vector sections;
        sections.push_back(section_map("Last", 1LL, pgs_manifest_loader::max_page_number, "chapter"));

        THEN("It is accepted") {
            pgs_manifest manifest = pgs_manifest_loader::load(raw_manifest(sections));
            REQUIRE(manifest.get_sections()[0].get_end_page() == pgs_manifest_loader::max_page_number);
        }
    }

    GIVEN("A declared page count out of range") {
        pgsv_map metadata;
        metadata["total_pages"] = 1e18;
        pgsv_map raw;
        raw["sections"] = pgsv_vector();
        raw["metadata"] = metadata;

        THEN("Loading fails on the metadata field") {
            REQUIRE_THROWS_WITH(pgs_manifest_loader::load(raw),
                                Catch::Matchers::ContainsSubstring("metadata.declared_total_pages"));
        }
    }

    GIVEN("Text that is not JSON") {
        THEN("Loading fails with a validation error") {
            REQUIRE_THROWS_AS(pgs_manifest_loader::load_json("{ sections: "), pgs_validation_error);
            REQUIRE_THROWS_AS(pgs_manifest_loader::load_json("[1, 2, 3]"), pgs_validation_error);
        }
    }
}

SCENARIO("Loading a manifest from disk") {
    GIVEN("A manifest file") {
        temp_dir dir;
        pgs_string path = dir.child("sections.json");
        write_file(path, sample_manifest_json());

        THEN("It loads like the JSON text") {
            REQUIRE(pgs_manifest_loader::load_file(path).section_count() == 3);
        }
    }

    GIVEN("A path that does not exist") {
        temp_dir dir;

        THEN("Loading fails with a not-found error") {
            REQUIRE_THROWS_AS(pgs_manifest_loader::load_file(dir.child("missing.json")), pgs_not_found_error);
        }
    }
}
