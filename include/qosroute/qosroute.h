// qosroute.h - Umbrella header for the QoS route search library
// Part of the QoS route search library (C++20)
//
// Pulls in the network model, cost model, every solver, the dispatcher
// and the comparison helpers.

#ifndef QOSROUTE_QOSROUTE_H
#define QOSROUTE_QOSROUTE_H

#include "core/cancel_token.h"
#include "core/log.h"
#include "core/random.h"
#include "core/search_stats.h"

#include "graph/bandwidth_filter.h"
#include "graph/edge_property_map.h"
#include "graph/graph_concepts.h"
#include "graph/network.h"
#include "graph/path.h"
#include "graph/shortest_path.h"
#include "graph/weighted_view.h"

#include "cost/cost_model.h"
#include "cost/edge_cost.h"
#include "cost/qos_weights.h"

#include "solver/algorithms/annealing.h"
#include "solver/algorithms/baseline.h"
#include "solver/algorithms/genetic.h"
#include "solver/algorithms/particle_swarm.h"
#include "solver/algorithms/qlearning.h"
#include "solver/compare.h"
#include "solver/dispatcher.h"
#include "solver/search_result.h"
#include "solver/search_setup.h"

#endif // QOSROUTE_QOSROUTE_H
