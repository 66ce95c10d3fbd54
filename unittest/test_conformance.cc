//
// Test property summary and warning callbacks of check()
//

#include <doctest/doctest.h>
#include <pngchunk/conformance.hh>
#include <pngchunk/chunk_ids.hh>

#include <algorithm>
#include <functional>
#include <sstream>
#include <string>
#include <vector>

using namespace pngchunk;

// Helper to track warnings
struct warning_tracker {
    struct warning_info {
        std::uint64_t offset;
        std::string category;
        std::string message;
    };

    std::vector<warning_info> warnings;

    void operator()(std::uint64_t offset, std::string_view category, std::string_view message) {
        warnings.push_back({offset, std::string(category), std::string(message)});
    }

    bool has_warning(std::string_view category) const {
        return std::any_of(warnings.begin(), warnings.end(),
            [category](const warning_info& w) { return w.category == category; });
    }
};

TEST_CASE("describe") {
    SUBCASE("RuSt") {
        auto p = describe(chunk_type::from_ascii_str("RuSt"));
        CHECK(p.critical);
        CHECK_FALSE(p.public_type);
        CHECK(p.reserved_bit_valid);
        CHECK(p.safe_to_copy);
        CHECK(p.valid);
    }

    SUBCASE("Rust") {
        auto p = describe(chunk_type::from_ascii_str("Rust"));
        CHECK_FALSE(p.reserved_bit_valid);
        CHECK_FALSE(p.valid);
    }

    SUBCASE("stream output") {
        std::stringstream ss;
        ss << describe(chunk_id::tEXt);
        CHECK(ss.str() == "ancillary, public, reserved bit clear, safe to copy");

        ss.str("");
        ss << describe(chunk_type::from_ascii_str("RuST"));
        CHECK(ss.str() == "critical, private, reserved bit clear, unsafe to copy");
    }
}

TEST_CASE("check - warning callbacks") {
    warning_tracker tracker;
    check_options opts;
    opts.on_warning = std::ref(tracker);
    opts.offset = 33;

    SUBCASE("registered chunks produce no warnings") {
        CHECK(check(chunk_id::IHDR, opts));
        CHECK(check(chunk_id::tEXt, opts));
        CHECK(check(chunk_id::gAMA, opts));
        CHECK(tracker.warnings.empty());
    }

    SUBCASE("reserved_bit") {
        CHECK_FALSE(check(chunk_type::from_ascii_str("tEst"), opts));
        REQUIRE(tracker.warnings.size() == 1);
        CHECK(tracker.warnings[0].category == "reserved_bit");
        CHECK(tracker.warnings[0].offset == 33);
        CHECK(tracker.warnings[0].message.find("tEst") != std::string::npos);
    }

    SUBCASE("unknown_critical") {
        CHECK(check(chunk_type::from_ascii_str("RuSt"), opts));
        REQUIRE(tracker.warnings.size() == 1);
        CHECK(tracker.warnings[0].category == "unknown_critical");
    }

    SUBCASE("unsafe_to_copy") {
        CHECK(check(chunk_type::from_ascii_str("ruST"), opts));
        REQUIRE(tracker.warnings.size() == 1);
        CHECK(tracker.warnings[0].category == "unsafe_to_copy");
    }

    SUBCASE("unknown ancillary safe-to-copy chunk is fine") {
        CHECK(check(chunk_type::from_ascii_str("prVt"), opts));
        CHECK(tracker.warnings.empty());
    }

    SUBCASE("several findings for one chunk") {
        CHECK_FALSE(check(chunk_type::from_ascii_str("Rust"), opts));
        CHECK(tracker.has_warning("reserved_bit"));
        CHECK(tracker.has_warning("unknown_critical"));
        CHECK(tracker.warnings.size() == 2);
    }
}

TEST_CASE("check - no handler installed") {
    CHECK(check(chunk_type::from_ascii_str("RuSt")));
    CHECK_FALSE(check(chunk_type::from_ascii_str("Rust")));

    check_options opts;
    CHECK_FALSE(check(chunk_type::from_ascii_str("Rust"), opts));
}
