#include "estuary/evaluation/evaluator.h"

namespace est
{
    std::int64_t ProjectedScoreEvaluator::evaluate(const Graph& graph, const Punter punter) const
    {
        return score_of(graph, full_, punter);
    }
} // namespace est
