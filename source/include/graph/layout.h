// layout.h
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <vector>

#include "graph/object.h"
#include "graph/pack_error.h"

namespace otpack::graph
{
	struct Graph;

	/*
	    An emission order plus the absolute position of every object in it. Objects that are not
	    reachable from the root are never placed.
	*/
	struct Layout
	{
		static constexpr size_t UNPLACED = static_cast<size_t>(-1);

		static Layout place(const Graph& graph, std::vector<ObjectId> order);

		const std::vector<ObjectId>& order() const { return m_order; }

		bool isPlaced(ObjectId id) const;
		size_t start(ObjectId id) const;
		size_t end(ObjectId id) const;

		size_t totalSize() const { return m_total_size; }

	private:
		std::vector<ObjectId> m_order;
		std::vector<size_t> m_starts;
		std::vector<size_t> m_ends;
		size_t m_total_size = 0;
	};

	/*
	    Plain topological order (Kahn's algorithm, FIFO). Every object comes after all of the
	    objects that link to it. Fails with StructuralCycle if some reachable objects can never
	    be placed.
	*/
	PackResult<Layout> sortKahn(Graph& graph);

	/*
	    Same discipline, but among the objects that are ready, the one that is closest to the root
	    (by accumulated size) goes first. Objects in higher spaces always go after objects in lower
	    spaces, and raised priorities pull objects forward.
	*/
	PackResult<Layout> sortShortestDistance(Graph& graph);
}
