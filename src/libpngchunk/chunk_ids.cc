//
// Registered chunk type lookup
//

#include <pngchunk/chunk_ids.hh>

#include <algorithm>
#include <array>

namespace pngchunk {

    namespace {
        using namespace chunk_id;

        // Sorted, for binary search
        constexpr std::array known_types = {
            IDAT, IEND, IHDR, PLTE,
            acTL, bKGD, cHRM, eXIf, fRAc, fcTL, fdAT, gAMA, gIFg, gIFx,
            hIST, iCCP, iTXt, oFFs, pCAL, pHYs, sBIT, sCAL, sPLT, sRGB,
            sTER, tEXt, tIME, tRNS, zTXt
        };

        static_assert(std::is_sorted(known_types.begin(), known_types.end()),
                      "known_types must stay sorted");
    }

    bool is_known(const chunk_type& t) {
        return std::binary_search(known_types.begin(), known_types.end(), t);
    }

} // namespace pngchunk
