/**
 * @file chunk_ids.hh
 * @brief Chunk types registered for PNG and its extensions
 */

#pragma once

#include <pngchunk/chunk_type.hh>
#include <pngchunk/export_pngchunk.h>

namespace pngchunk {
    namespace chunk_id {
        // Critical
        inline constexpr chunk_type IHDR = "IHDR"_ct;
        inline constexpr chunk_type PLTE = "PLTE"_ct;
        inline constexpr chunk_type IDAT = "IDAT"_ct;
        inline constexpr chunk_type IEND = "IEND"_ct;

        // Ancillary
        inline constexpr chunk_type bKGD = "bKGD"_ct;
        inline constexpr chunk_type cHRM = "cHRM"_ct;
        inline constexpr chunk_type gAMA = "gAMA"_ct;
        inline constexpr chunk_type hIST = "hIST"_ct;
        inline constexpr chunk_type pHYs = "pHYs"_ct;
        inline constexpr chunk_type sBIT = "sBIT"_ct;
        inline constexpr chunk_type tEXt = "tEXt"_ct;
        inline constexpr chunk_type tIME = "tIME"_ct;
        inline constexpr chunk_type tRNS = "tRNS"_ct;
        inline constexpr chunk_type zTXt = "zTXt"_ct;
        inline constexpr chunk_type iCCP = "iCCP"_ct;
        inline constexpr chunk_type sPLT = "sPLT"_ct;
        inline constexpr chunk_type sRGB = "sRGB"_ct;
        inline constexpr chunk_type iTXt = "iTXt"_ct;
        inline constexpr chunk_type eXIf = "eXIf"_ct;

        // Registered extensions
        inline constexpr chunk_type oFFs = "oFFs"_ct;
        inline constexpr chunk_type pCAL = "pCAL"_ct;
        inline constexpr chunk_type sCAL = "sCAL"_ct;
        inline constexpr chunk_type sTER = "sTER"_ct;
        inline constexpr chunk_type gIFg = "gIFg"_ct;
        inline constexpr chunk_type gIFx = "gIFx"_ct;
        inline constexpr chunk_type fRAc = "fRAc"_ct;

        // APNG
        inline constexpr chunk_type acTL = "acTL"_ct;
        inline constexpr chunk_type fcTL = "fcTL"_ct;
        inline constexpr chunk_type fdAT = "fdAT"_ct;
    }

    /**
     * @brief Check whether a chunk type is one of the registered types above
     */
    PNGCHUNK_EXPORT bool is_known(const chunk_type& t);

} // namespace pngchunk
