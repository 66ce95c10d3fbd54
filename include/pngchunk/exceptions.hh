/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for the chunk type library
 *
 * Construction of a chunk type is the only operation that can fail, and
 * it fails in one of two ways: a byte that is not an ASCII letter, or
 * textual input that is not exactly four bytes long.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <sstream>

namespace pngchunk {

    /**
     * @class chunk_error
     * @brief Base exception class for all chunk type errors
     *
     * Catch this to handle every error raised by the library with a
     * single catch block.
     */
    class chunk_error : public std::runtime_error {
    public:
        explicit chunk_error(const std::string& msg)
            : std::runtime_error(msg) {}
    };

    /**
     * @class encoding_error
     * @brief A byte of the tag is outside 'A'-'Z' / 'a'-'z'
     */
    class encoding_error : public chunk_error {
    public:
        explicit encoding_error(const std::string& msg)
            : chunk_error(msg) {}
    };

    /**
     * @class length_error
     * @brief Textual input is not exactly four bytes long
     */
    class length_error : public chunk_error {
    public:
        explicit length_error(const std::string& msg)
            : chunk_error(msg) {}
    };

    /**
     * @brief Build error message from variadic arguments
     * @tparam Args Variadic template arguments
     * @param args Arguments to concatenate into error message
     * @return Concatenated error message string
     */
    template<typename... Args>
    std::string build_error_msg(Args&&... args) {
        std::ostringstream oss;
        ((oss << args), ...);
        return oss.str();
    }

    /**
     * @defgroup ExceptionMacros Exception Throwing Macros
     * @{
     */

    /**
     * @def THROW_ENCODING
     * @brief Throw an encoding_error with formatted message
     */
    #define THROW_ENCODING(...) \
        throw ::pngchunk::encoding_error(::pngchunk::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_LENGTH
     * @brief Throw a length_error with formatted message
     */
    #define THROW_LENGTH(...) \
        throw ::pngchunk::length_error(::pngchunk::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_ENCODING_IF
     * @brief Conditionally throw an encoding_error
     */
    #define THROW_ENCODING_IF(condition, ...) \
        do { if (condition) THROW_ENCODING(__VA_ARGS__); } while(0)

    /**
     * @def THROW_LENGTH_IF
     * @brief Conditionally throw a length_error
     */
    #define THROW_LENGTH_IF(condition, ...) \
        do { if (condition) THROW_LENGTH(__VA_ARGS__); } while(0)

    /** @} */ // end of ExceptionMacros group

} // namespace pngchunk
