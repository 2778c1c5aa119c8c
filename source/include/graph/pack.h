// pack.h
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <vector>

#include <zst/zst.h>

#include "graph/graph.h"
#include "graph/layout.h"
#include "graph/adapters.h"
#include "graph/pack_error.h"

namespace otpack::graph
{
	enum class Strategy
	{
		Promote,
		Duplicate,
		Split,
		Respace,
		Reprioritise,
	};

	const char* strategyName(Strategy strategy);

	struct PackOptions
	{
		// how many times we re-sort after changing the graph before giving up
		size_t max_rounds = 32;

		// tried in this order for each overflow; the first one that changes the graph wins
		std::vector<Strategy> strategies = {
			Strategy::Promote,
			Strategy::Duplicate,
			Strategy::Split,
			Strategy::Respace,
			Strategy::Reprioritise,
		};

		// promote anything whose subgraph can't possibly fit in 16 bits before the first round
		bool promote_eagerly = true;

		bool verbose = false;

		bool allows(Strategy strategy) const;
	};

	/*
	    Orders the graph so that every offset fits, and writes it out. If the plain topological
	    order already works, that's what you get; otherwise the graph is reshaped until it fits
	    or we run out of ideas (or rounds).

	    The graph is consumed; on failure, the error carries a snapshot of where we ended up.
	*/
	PackResult<zst::byte_buffer> pack(Graph graph, const PackOptions& options = {});
	PackResult<zst::byte_buffer> pack(Graph graph, const PackOptions& options, const Adapters& adapters);

	/*
	    Writes the objects out in layout order and patches every offset. The layout must not
	    have any overflows.
	*/
	zst::byte_buffer serialise(const Graph& graph, const Layout& layout);
}
