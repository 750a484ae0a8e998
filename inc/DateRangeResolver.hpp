#pragma once
#include <vector>

#include "Common.hpp"
#include "Errors.hpp"

namespace NReservation {

    // One date per night: check-in inclusive, check-out exclusive.
    inline std::vector<TDate> ResolveDateRange(TDate start, TDate end) {
        if (!(start < end)) {
            throw TReservationError(EErrorCode::InvalidDateRange,
                                    "Start date " + start.ToString() + " must be before end date " + end.ToString());
        }
        std::vector<TDate> out;
        out.reserve(static_cast<size_t>(end.Days - start.Days));
        for (TDate d = start; d < end; d = d.Next()) {
            out.push_back(d);
        }
        return out;
    }

} // namespace NReservation
