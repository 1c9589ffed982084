#pragma once

#include "cutgraph/CutTypes.h"

namespace cutgraph {

// True when the two half-open intervals share any time; touching ends do not count.
bool overlaps(const TimeSpan& lhs, const TimeSpan& rhs);

// True when `spanned` lies entirely inside `spanning` (boundaries inclusive).
bool overspans(const TimeSpan& spanning, const TimeSpan& spanned);

TimeSpan make_span(Seconds start, Seconds duration);

}  // namespace cutgraph
