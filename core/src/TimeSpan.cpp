#include "cutgraph/TimeSpan.h"

namespace cutgraph {

bool overlaps(const TimeSpan& lhs, const TimeSpan& rhs) {
    return lhs.start < rhs.end && rhs.start < lhs.end;
}

bool overspans(const TimeSpan& spanning, const TimeSpan& spanned) {
    return spanning.start <= spanned.start && spanned.end <= spanning.end;
}

TimeSpan make_span(Seconds start, Seconds duration) {
    return TimeSpan{start, start + duration};
}

}  // namespace cutgraph
