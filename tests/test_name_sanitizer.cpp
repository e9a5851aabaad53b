#include <catch2/catch_all.hpp>
#include "../splitting/pgs_name_sanitizer.h"

SCENARIO("Section titles become safe path components") {
    GIVEN("A title containing a colon and a slash") {
        pgs_string title = "Chapter 1: The Beginning/End";

        WHEN("Sanitizing it") {
            pgs_string safe = pgs_name_sanitizer::sanitize(title);

            THEN("Both characters are replaced by underscores") {
                REQUIRE(safe == "Chapter 1_ The Beginning_End");
            }
        }
    }

    GIVEN("A title with every forbidden character and line breaks") {
        pgs_string title = "a/b\\c:d*e?f\"g<h>i|j\nk\r\nl";

        WHEN("Sanitizing it") {
            pgs_string safe = pgs_name_sanitizer::sanitize(title);

            THEN("No forbidden character or newline survives") {
                for (const char* c = pgs_name_sanitizer::forbidden_characters; *c != '\0'; c++) {
                    REQUIRE_FALSE(safe.contains(pgs_string(*c)));
                }
                REQUIRE_FALSE(safe.contains("\n"));
                REQUIRE_FALSE(safe.contains("\r"));
                REQUIRE(safe == "a_b_c_d_e_f_g_h_i_j k l");
            }
        }
    }

    GIVEN("A title with irregular whitespace") {
        WHEN("Sanitizing it") {
            pgs_string safe = pgs_name_sanitizer::sanitize("   Part \t Two    Epilogue  ");

            THEN("Whitespace runs collapse and both ends are trimmed") {
                REQUIRE(safe == "Part Two Epilogue");
            }
        }
    }

    GIVEN("An empty or blank title") {
        THEN("It sanitizes to the placeholder component") {
            REQUIRE(pgs_name_sanitizer::sanitize("") == "Untitled");
            REQUIRE(pgs_name_sanitizer::sanitize(" \n\t ") == "Untitled");
        }
    }

    GIVEN("Already sanitized text") {
        pgs_string once = pgs_name_sanitizer::sanitize("Notes: <draft> | final?");

        THEN("Sanitizing again changes nothing") {
            REQUIRE(pgs_name_sanitizer::sanitize(once) == once);
        }
    }
}

SCENARIO("Book base names are derived from the document file name") {
    GIVEN("A plain file name") {
        THEN("The extension is dropped") {
            REQUIRE(pgs_name_sanitizer::book_base_name("The Paris Library.pdf") == "The Paris Library");
        }
    }

    GIVEN("A path with directories and a compression marker") {
        THEN("Directory, extension and marker are dropped") {
            REQUIRE(pgs_name_sanitizer::book_base_name("/tmp/in/WF_4262_Book_compressed.pdf") == "WF_4262_Book");
            REQUIRE(pgs_name_sanitizer::book_base_name("C:\\scans\\Book_compressed_compressed.pdf") == "Book");
        }
    }

    GIVEN("A name that only consists of the marker") {
        THEN("The marker is kept rather than producing an empty name") {
            REQUIRE(pgs_name_sanitizer::book_base_name("_compressed.pdf") == "_compressed");
        }
    }

    GIVEN("A file name without extension") {
        THEN("The name is used as is") {
            REQUIRE(pgs_name_sanitizer::book_base_name("Manuscript") == "Manuscript");
        }
    }
}

SCENARIO("Folder and file names combine book and section title") {
    GIVEN("A book name and a section title") {
        pgs_string book = "WF_4262_The Paris Library";
        pgs_string title = "Chapter 1: Odile";

        THEN("The folder name joins both with an underscore") {
            REQUIRE(pgs_name_sanitizer::folder_name(book, title) == "WF_4262_The Paris Library_Chapter 1_ Odile");
        }

        THEN("The page file name appends the section-relative page") {
            REQUIRE(pgs_name_sanitizer::page_file_name(book, title, 2) ==
                    "WF_4262_The Paris Library_Chapter 1_ Odile_Page_2.pdf");
            REQUIRE(pgs_name_sanitizer::page_file_name(book, title, 10, "txt") ==
                    "WF_4262_The Paris Library_Chapter 1_ Odile_Page_10.txt");
        }
    }

    GIVEN("An empty title") {
        THEN("The folder does not end with a dangling underscore") {
            REQUIRE(pgs_name_sanitizer::folder_name("Book", "") == "Book_Untitled");
        }
    }
}
