#include "memo/cache/cache-settings.hh"
#include "memo/util/error.hh"

namespace memo {

void CacheSettings::validate() const
{
    if (numSegments.get() == 0)
        throw UsageError("setting '%s' must be at least 1", numSegments.name);
}

} // namespace memo
