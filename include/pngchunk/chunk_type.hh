/**
 * @file chunk_type.hh
 * @brief PNG chunk type code (the 4-letter tag in front of every chunk)
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <pngchunk/export_pngchunk.h>

namespace pngchunk {

    namespace detail {
        [[noreturn]] PNGCHUNK_EXPORT void throw_not_ascii_letter(std::size_t position, std::uint8_t value);
        [[noreturn]] PNGCHUNK_EXPORT void throw_length_mismatch(std::size_t length);
    }

    /**
     * @class chunk_type
     * @brief Validated 4-byte chunk type tag
     *
     * Every byte is an ASCII letter ('A'-'Z' or 'a'-'z'). The check runs at
     * construction, so an instance holding any other byte cannot exist.
     * Bit 5 (0x20, the case bit) of each byte carries one property:
     *
     * | byte | predicate             | bit clear | bit set   |
     * |------|-----------------------|-----------|-----------|
     * | 0    | is_critical           | critical  | ancillary |
     * | 1    | is_public             | public    | private   |
     * | 2    | is_reserved_bit_valid | conformant| reserved  |
     * | 3    | is_safe_to_copy       | unsafe    | safe      |
     *
     * is_safe_to_copy is true when its bit is SET; the other three are
     * true when their bit is clear.
     */
    class PNGCHUNK_EXPORT chunk_type {
    public:
        using bytes_type = std::array<std::uint8_t, 4>;

        static constexpr std::size_t size = 4;
        static constexpr std::uint8_t property_bit = 0x20;

        /**
         * @brief Build from four raw bytes
         * @throws encoding_error if a byte is not an ASCII letter
         */
        static constexpr chunk_type from_bytes(const bytes_type& b) {
            for (std::size_t i = 0; i < b.size(); i++) {
                if (!is_ascii_letter(b[i])) {
                    detail::throw_not_ascii_letter(i, b[i]);
                }
            }
            return chunk_type(b);
        }

        /**
         * @brief Build from four bytes read out of a buffer
         * @param data Pointer to at least 4 readable bytes
         * @throws encoding_error if a byte is not an ASCII letter
         */
        static chunk_type from_bytes(const void* data);

        /**
         * @brief Build from text
         *
         * The length is counted in bytes, not code points: a string holding
         * a multi-byte UTF-8 character is rejected as a length mismatch.
         *
         * @throws length_error if @p s is not exactly 4 bytes
         * @throws encoding_error if a byte is not an ASCII letter
         */
        static constexpr chunk_type from_ascii_str(std::string_view s) {
            if (s.size() != size) {
                detail::throw_length_mismatch(s.size());
            }
            return from_bytes({
                static_cast<std::uint8_t>(s[0]),
                static_cast<std::uint8_t>(s[1]),
                static_cast<std::uint8_t>(s[2]),
                static_cast<std::uint8_t>(s[3])
            });
        }

        /**
         * @brief Build from the 32-bit value as stored in a PNG stream
         *
         * PNG is big-endian, so the first letter is the most significant
         * byte: "IHDR" is 0x49484452.
         *
         * @throws encoding_error if a byte is not an ASCII letter
         */
        static constexpr chunk_type from_uint32(std::uint32_t value) {
            return from_bytes({
                static_cast<std::uint8_t>(value >> 24),
                static_cast<std::uint8_t>(value >> 16),
                static_cast<std::uint8_t>(value >> 8),
                static_cast<std::uint8_t>(value)
            });
        }

        /**
         * @brief Non-throwing variant of from_ascii_str
         * @return The chunk type, or nullopt if @p s is not 4 ASCII letters
         */
        static std::optional<chunk_type> try_parse(std::string_view s) noexcept;

        static constexpr bool is_ascii_letter(std::uint8_t c) {
            return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
        }

        [[nodiscard]] constexpr bytes_type bytes() const { return m_bytes; }

        [[nodiscard]] constexpr bool is_critical() const {
            return (m_bytes[0] & property_bit) == 0;
        }

        [[nodiscard]] constexpr bool is_public() const {
            return (m_bytes[1] & property_bit) == 0;
        }

        [[nodiscard]] constexpr bool is_reserved_bit_valid() const {
            return (m_bytes[2] & property_bit) == 0;
        }

        [[nodiscard]] constexpr bool is_safe_to_copy() const {
            return (m_bytes[3] & property_bit) != 0;
        }

        // Only the reserved bit is checked. Case-consistency rules across the
        // four letters are not part of this test.
        [[nodiscard]] constexpr bool is_valid() const {
            return is_reserved_bit_valid();
        }

        // Convert to string
        [[nodiscard]] std::string to_string() const;

        // Big-endian, the inverse of from_uint32
        [[nodiscard]] constexpr std::uint32_t to_uint32() const {
            return (std::uint32_t(m_bytes[0]) << 24) |
                   (std::uint32_t(m_bytes[1]) << 16) |
                   (std::uint32_t(m_bytes[2]) << 8) |
                   std::uint32_t(m_bytes[3]);
        }

        // Write to bytes
        void to_bytes(void* dest) const;

        constexpr std::uint8_t operator[](std::size_t i) const { return m_bytes[i]; }

        [[nodiscard]] constexpr auto begin() const { return m_bytes.begin(); }
        [[nodiscard]] constexpr auto end() const { return m_bytes.end(); }

        // Comparison operators
        constexpr bool operator==(const chunk_type& o) const { return m_bytes == o.m_bytes; }
        constexpr bool operator!=(const chunk_type& o) const { return !(*this == o); }
        constexpr bool operator<(const chunk_type& o) const { return m_bytes < o.m_bytes; }
        constexpr bool operator<=(const chunk_type& o) const { return m_bytes <= o.m_bytes; }
        constexpr bool operator>(const chunk_type& o) const { return m_bytes > o.m_bytes; }
        constexpr bool operator>=(const chunk_type& o) const { return m_bytes >= o.m_bytes; }

    private:
        constexpr explicit chunk_type(const bytes_type& b) : m_bytes(b) {}

        bytes_type m_bytes;
    };

    /**
     * @brief Stream output
     *
     * Writes the quoted tag ('IHDR'). With std::hex set on the stream,
     * writes to_uint32() as 0x49484452 instead.
     */
    PNGCHUNK_EXPORT std::ostream& operator<<(std::ostream& os, const chunk_type& t);

    // Hash function
    struct PNGCHUNK_EXPORT chunk_type_hash {
        std::size_t operator()(const chunk_type& t) const noexcept;
    };

    /**
     * @brief User-defined literal for compile-time chunk types
     *
     * "IHDR"_ct in a constant expression is checked by the compiler; a
     * literal that is not four ASCII letters does not compile.
     */
    constexpr chunk_type operator""_ct(const char* str, std::size_t len) {
        return chunk_type::from_ascii_str(std::string_view(str, len));
    }

} // namespace pngchunk

// Specialization for std::hash
namespace std {
    template<>
    struct hash<pngchunk::chunk_type> {
        std::size_t operator()(const pngchunk::chunk_type& t) const noexcept {
            return pngchunk::chunk_type_hash{}(t);
        }
    };
}
