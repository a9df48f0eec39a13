#include <doctest/doctest.h>
#include <pngchunk/chunk_type.hh>

#include <sstream>
#include <unordered_set>
#include <set>

using namespace pngchunk;

static_assert(known_types::IHDR.is_critical());
static_assert(known_types::IHDR.is_public());
static_assert(!known_types::IHDR.is_safe_to_copy());
static_assert(known_types::tEXt.is_ancillary());
static_assert(known_types::tEXt.is_safe_to_copy());
static_assert("IEND"_ct.is_valid());

TEST_SUITE("CHUNK TYPE") {
    TEST_CASE("construction") {
        SUBCASE("from bytes") {
            chunk_type::bytes_type expected{82, 117, 83, 116};
            chunk_type actual(expected);
            CHECK(actual.bytes() == expected);
        }

        SUBCASE("from string") {
            chunk_type expected(chunk_type::bytes_type{82, 117, 83, 116});
            CHECK(chunk_type::from_string("RuSt") == expected);
        }

        SUBCASE("from raw memory") {
            const char raw[] = "tEXtpayload";
            CHECK(chunk_type::from_bytes(raw) == known_types::tEXt);
        }

        SUBCASE("from chars and literal") {
            CHECK(chunk_type('I', 'E', 'N', 'D') == known_types::IEND);
            CHECK("RuSt"_ct == chunk_type::from_string("RuSt"));
        }

        SUBCASE("copies compare equal") {
            chunk_type a = chunk_type::from_string("RuSt");
            chunk_type b = a;
            CHECK(a == b);
            CHECK_FALSE(a != b);
        }
    }

    TEST_CASE("validation") {
        SUBCASE("non-letter byte is rejected") {
            CHECK_THROWS_AS(chunk_type::from_string("Ru1t"), invalid_chunk_type);
            CHECK_THROWS_AS(chunk_type::from_string("Ru t"), invalid_chunk_type);
            CHECK_THROWS_AS(chunk_type(chunk_type::bytes_type{'R', 'u', 0, 't'}), invalid_chunk_type);
            CHECK_THROWS_AS(chunk_type(chunk_type::bytes_type{'R', 'u', '[', 't'}), invalid_chunk_type);
            CHECK_THROWS_AS(chunk_type(chunk_type::bytes_type{'R', 'u', '@', 't'}), invalid_chunk_type);
        }

        SUBCASE("offending bytes are reported") {
            try {
                (void)chunk_type::from_string("Ru1t");
                FAIL("Should have thrown exception");
            } catch (const invalid_chunk_type& e) {
                CHECK(e.bytes()[0] == 'R');
                CHECK(e.bytes()[2] == '1');
                std::string msg = e.what();
                CHECK(msg.find("49") != std::string::npos);
            }
        }

        SUBCASE("wrong length is rejected") {
            try {
                (void)chunk_type::from_string("Ru");
                FAIL("Should have thrown exception");
            } catch (const wrong_length& e) {
                CHECK(e.expected() == 4);
                CHECK(e.actual() == 2);
            }
            CHECK_THROWS_AS(chunk_type::from_string(""), wrong_length);
            CHECK_THROWS_AS(chunk_type::from_string("RuStRuSt"), wrong_length);
        }

        SUBCASE("length counts bytes, not characters") {
            // "Ru" + U+00E9 is 4 bytes, but not all letters
            CHECK_THROWS_AS(chunk_type::from_string("Ru\xC3\xA9"), invalid_chunk_type);
            // Three characters, five bytes
            CHECK_THROWS_AS(chunk_type::from_string("R\xC3\xA9\xC3\xA9"), wrong_length);
        }

        SUBCASE("errors share the library base class") {
            CHECK_THROWS_AS(chunk_type::from_string("Ru1t"), pngchunk_error);
            CHECK_THROWS_AS(chunk_type::from_string("Ru"), pngchunk_error);
        }
    }

    TEST_CASE("property bits") {
        SUBCASE("critical") {
            CHECK(chunk_type::from_string("RuSt").is_critical());
            CHECK_FALSE(chunk_type::from_string("ruSt").is_critical());
            CHECK(chunk_type::from_string("ruSt").is_ancillary());
        }

        SUBCASE("public") {
            CHECK(chunk_type::from_string("RUSt").is_public());
            CHECK_FALSE(chunk_type::from_string("RuSt").is_public());
            CHECK(chunk_type::from_string("RuSt").is_private());
        }

        SUBCASE("reserved bit") {
            CHECK(chunk_type::from_string("RuSt").is_reserved_bit_valid());
            CHECK_FALSE(chunk_type::from_string("Rust").is_reserved_bit_valid());
        }

        SUBCASE("safe to copy") {
            CHECK(chunk_type::from_string("RuSt").is_safe_to_copy());
            CHECK_FALSE(chunk_type::from_string("RuST").is_safe_to_copy());
        }

        SUBCASE("raw bytes can be inspected before validation") {
            type_bits::bytes_type raw{'R', 'u', '1', 't'};
            CHECK_FALSE(chunk_type::is_valid_bytes(raw));
            CHECK(type_bits::is_critical(raw));
            CHECK_FALSE(type_bits::is_public(raw));
            CHECK(type_bits::is_safe_to_copy(raw));
        }
    }

    TEST_CASE("conformance") {
        CHECK(chunk_type::from_string("RuSt").is_valid());
        CHECK_FALSE(chunk_type::from_string("Rust").is_valid());
        CHECK(known_types::IHDR.is_valid());
        CHECK(known_types::iTXt.is_valid());
    }

    TEST_CASE("display") {
        chunk_type t = chunk_type::from_string("RuSt");
        CHECK(t.to_string() == "RuSt");

        std::ostringstream oss;
        oss << t;
        CHECK(oss.str() == "'RuSt'");
    }

    TEST_CASE("matching known types") {
        chunk_type t = chunk_type::from_string("IEND");
        CHECK(t == known_types::IEND);
        CHECK(t != known_types::IHDR);
        CHECK(t.to_string() == "IEND");
    }

    TEST_CASE("use in containers") {
        std::unordered_set<chunk_type> seen;
        seen.insert(known_types::IHDR);
        seen.insert(known_types::IDAT);
        seen.insert(chunk_type::from_string("IDAT"));
        CHECK(seen.size() == 2);
        CHECK(seen.count(known_types::IHDR) == 1);

        std::set<chunk_type> ordered{known_types::IHDR, known_types::IDAT, known_types::IEND};
        CHECK(ordered.begin()->to_string() == "IDAT");
    }
}
