//
// Chunk type diagnostics
//

#include <pngchunk/conformance.hh>
#include <pngchunk/chunk_ids.hh>

#include <ostream>

namespace pngchunk {

    chunk_properties describe(const chunk_type& t) {
        return {
            .critical = t.is_critical(),
            .public_type = t.is_public(),
            .reserved_bit_valid = t.is_reserved_bit_valid(),
            .safe_to_copy = t.is_safe_to_copy(),
            .valid = t.is_valid()
        };
    }

    std::ostream& operator<<(std::ostream& os, const chunk_properties& p) {
        os << (p.critical ? "critical" : "ancillary") << ", "
           << (p.public_type ? "public" : "private") << ", "
           << (p.reserved_bit_valid ? "reserved bit clear" : "reserved bit set") << ", "
           << (p.safe_to_copy ? "safe to copy" : "unsafe to copy");
        return os;
    }

    bool check(const chunk_type& t, const check_options& options) {
        if (!options.on_warning) {
            return t.is_valid();
        }

        if (!t.is_reserved_bit_valid()) {
            options.on_warning(options.offset, "reserved_bit",
                "Chunk type '" + t.to_string() + "' has the reserved bit set (third letter is lowercase)");
        }

        if (!is_known(t)) {
            if (t.is_critical()) {
                options.on_warning(options.offset, "unknown_critical",
                    "Chunk type '" + t.to_string() + "' is critical but not a registered type");
            } else if (!t.is_safe_to_copy()) {
                options.on_warning(options.offset, "unsafe_to_copy",
                    "Chunk type '" + t.to_string() + "' is an unknown ancillary chunk that is not safe to copy");
            }
        }

        return t.is_valid();
    }

    bool check(const chunk_type& t) {
        return check(t, check_options{});
    }

} // namespace pngchunk
