#include "response.h"

UsageEntry TargetResponseUnit::tokenCounts() const
{
    if (usage.has_value())
        return *usage;

    UsageEntry counts;
    if (timings.has_value()) {
        counts.promptTokens = timings->cacheN.value_or(0);
        counts.completionTokens = timings->predictedN.value_or(0);
        counts.totalTokens = counts.promptTokens + counts.completionTokens;
    }
    return counts;
}
