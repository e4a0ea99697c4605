#pragma once

/// Convenience umbrella header for the Strata library.

#include <strata/core/codec.hpp>
#include <strata/core/column.hpp>
#include <strata/engine/aggregation.hpp>
#include <strata/engine/filter.hpp>
#include <strata/engine/query.hpp>
#include <strata/engine/query_plan.hpp>
#include <strata/engine/query_stats.hpp>
#include <strata/ir/expr.hpp>
