/**
 * @file conformance.hh
 * @brief Property summary and diagnostics for chunk types
 */

#pragma once

#include <functional>
#include <string_view>
#include <cstdint>
#include <iosfwd>

#include <pngchunk/chunk_type.hh>
#include <pngchunk/export_pngchunk.h>

namespace pngchunk {

    /**
     * @struct chunk_properties
     * @brief The four property bits of a chunk type, decoded
     */
    struct chunk_properties {
        bool critical = false;          ///< Decoders must understand it
        bool public_type = false;       ///< Defined by the PNG specification
        bool reserved_bit_valid = false;///< Reserved bit is clear
        bool safe_to_copy = false;      ///< Editors may copy it unmodified
        bool valid = false;             ///< Same as reserved_bit_valid
    };

    /**
     * @brief Decode the property bits of a chunk type
     */
    PNGCHUNK_EXPORT chunk_properties describe(const chunk_type& t);

    PNGCHUNK_EXPORT std::ostream& operator<<(std::ostream& os, const chunk_properties& p);

    /**
     * @struct check_options
     * @brief Configuration for check()
     */
    struct check_options {
        /**
         * @typedef warning_handler
         * @brief Callback function type for handling warnings
         * @param offset File offset given in check_options::offset
         * @param category Warning category (e.g., "reserved_bit", "unknown_critical")
         * @param message Human-readable warning message
         */
        using warning_handler = std::function<void(
            std::uint64_t offset,
            std::string_view category,
            std::string_view message
        )>;

        /**
         * @brief Optional warning handler callback
         *
         * If not set, warnings are silently ignored.
         */
        warning_handler on_warning;

        /**
         * @brief Offset of the chunk header in the file
         *
         * Not interpreted; passed through to on_warning so the caller can
         * locate the chunk.
         */
        std::uint64_t offset = 0;
    };

    /**
     * @brief Report how a chunk type deviates from what a decoder expects
     *
     * Emits one warning per finding:
     * - "reserved_bit": bit 5 of the third byte is set
     * - "unknown_critical": critical and not a registered type; a decoder
     *   cannot skip it
     * - "unsafe_to_copy": ancillary, not registered and not safe to copy;
     *   an editor that modified critical data must drop it
     *
     * Never throws on its own; what to do with a finding is the caller's
     * decision.
     *
     * @return t.is_valid()
     */
    PNGCHUNK_EXPORT bool check(const chunk_type& t, const check_options& options);

    /**
     * @brief check() with default options (no warnings reported)
     */
    PNGCHUNK_EXPORT bool check(const chunk_type& t);

} // namespace pngchunk
