#pragma once

// Core types and structures
#include "core/types.hpp"
#include "core/errors.hpp"
#include "core/tree_graph.hpp"
#include "core/allocation.hpp"
#include "core/individual.hpp"
#include "core/problem.hpp"
#include "core/global_state.hpp"

// Constraints
#include "constraints/constraint_set.hpp"

// Evaluation
#include "eval/metrics.hpp"
#include "eval/evaluator.hpp"
#include "eval/worker.hpp"
#include "eval/worker_pool.hpp"

// Optimizers
#include "optimizers/optimizer.hpp"
#include "optimizers/operators.hpp"
#include "optimizers/greedy.hpp"
#include "optimizers/genetic.hpp"
#include "optimizers/multi_objective.hpp"

// Random number generation
#include "random/rng.hpp"
