//
// Out-of-line parts of chunk_type: error reporting, text and stream output
//

#include <pngchunk/chunk_type.hh>
#include <pngchunk/exceptions.hh>

#include <cstring>
#include <iomanip>

namespace pngchunk {

    namespace detail {
        void throw_not_ascii_letter(std::size_t position, std::uint8_t value) {
            THROW_ENCODING("Chunk type byte ", position, " has value ", static_cast<unsigned>(value),
                           ", chunk type encoding must be ASCII letters (65-90 or 97-122)");
        }

        void throw_length_mismatch(std::size_t length) {
            THROW_LENGTH("Chunk type must be exactly ", chunk_type::size, " bytes, got ", length);
        }
    }

    chunk_type chunk_type::from_bytes(const void* data) {
        bytes_type b;
        std::memcpy(b.data(), data, b.size());
        return from_bytes(b);
    }

    std::optional<chunk_type> chunk_type::try_parse(std::string_view s) noexcept {
        if (s.size() != size) {
            return std::nullopt;
        }

        bytes_type b;
        for (std::size_t i = 0; i < size; i++) {
            b[i] = static_cast<std::uint8_t>(s[i]);
            if (!is_ascii_letter(b[i])) {
                return std::nullopt;
            }
        }
        return chunk_type(b);
    }

    // Cannot fail: construction guarantees ASCII letters
    std::string chunk_type::to_string() const {
        return std::string(m_bytes.begin(), m_bytes.end());
    }

    void chunk_type::to_bytes(void* dest) const {
        std::memcpy(dest, m_bytes.data(), m_bytes.size());
    }

    std::ostream& operator<<(std::ostream& os, const chunk_type& t) {
        if (os.flags() & std::ios::hex) {
            // Save and restore format flags
            auto flags = os.flags();
            auto fill = os.fill();
            os << "0x" << std::hex << std::setfill('0') << std::setw(8) << t.to_uint32();
            os.flags(flags);
            os.fill(fill);
        } else {
            os << '\'' << t.to_string() << '\'';
        }
        return os;
    }

    std::size_t chunk_type_hash::operator()(const chunk_type& t) const noexcept {
        return (static_cast<std::size_t>(t.to_uint32()) * 0x9E3779B1u) ^ 0x85EBCA6Bu;
    }

} // namespace pngchunk
