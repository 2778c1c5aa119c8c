// layout.cpp
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#include "util.h"
#include "error.h"

#include "graph/graph.h"
#include "graph/layout.h"
#include "misc/priority_queue.h"

namespace otpack::graph
{
	Layout Layout::place(const Graph& graph, std::vector<ObjectId> order)
	{
		Layout ret {};
		ret.m_starts.resize(graph.objectCount(), UNPLACED);
		ret.m_ends.resize(graph.objectCount(), UNPLACED);

		size_t pos = 0;
		for(auto id : order)
		{
			auto idx = static_cast<size_t>(id);
			if(ret.m_starts[idx] != UNPLACED)
				otpack::internal_error("{} appears twice in the emission order", id);

			ret.m_starts[idx] = pos;
			pos += graph.sizeOf(id);
			ret.m_ends[idx] = pos;
		}

		ret.m_order = std::move(order);
		ret.m_total_size = pos;
		return ret;
	}

	bool Layout::isPlaced(ObjectId id) const
	{
		auto idx = static_cast<size_t>(id);
		return idx < m_starts.size() && m_starts[idx] != UNPLACED;
	}

	size_t Layout::start(ObjectId id) const
	{
		if(not this->isPlaced(id))
			otpack::internal_error("{} was not placed", id);

		return m_starts[static_cast<size_t>(id)];
	}

	size_t Layout::end(ObjectId id) const
	{
		if(not this->isPlaced(id))
			otpack::internal_error("{} was not placed", id);

		return m_ends[static_cast<size_t>(id)];
	}




	static PackResult<void> check_everything_placed(Graph& graph, const std::vector<bool>& placed, size_t num_placed)
	{
		auto& root = graph.vertex(graph.root());
		if(num_placed == graph.reachableCount() && root.incoming_edges == 0)
			return Ok();

		std::vector<ObjectId> stuck {};
		for(auto id : graph.reachableObjects())
		{
			if(not placed[static_cast<size_t>(id)])
				stuck.push_back(id);
		}

		// something links back up to the root; it went first anyway, but that's a cycle.
		if(stuck.empty())
		{
			for(auto& [parent, _] : root.parents)
				stuck.push_back(parent);

			stuck.push_back(graph.root());
		}

		return Err(PackError::cycle(std::move(stuck),
		    zpr::sprint("{} of {} reachable objects could not be ordered", graph.reachableCount() - num_placed,
		        graph.reachableCount())));
	}

	PackResult<Layout> sortKahn(Graph& graph)
	{
		graph.updateParents();

		auto n = graph.objectCount();
		std::vector<size_t> removed_edges(n, 0);
		std::vector<bool> placed(n, false);

		std::vector<ObjectId> order {};
		std::deque<ObjectId> queue { graph.root() };

		while(not queue.empty())
		{
			auto id = queue.front();
			queue.pop_front();

			order.push_back(id);
			placed[static_cast<size_t>(id)] = true;

			for(auto& link : graph.object(id).links)
			{
				auto child = static_cast<size_t>(link.target);

				// only once every parent has gone can the child go.
				removed_edges[child] += 1;
				if(removed_edges[child] == graph.vertex(link.target).incoming_edges && not placed[child])
					queue.push_back(link.target);
			}
		}

		TRY(check_everything_placed(graph, placed, order.size()));
		return Ok(Layout::place(graph, std::move(order)));
	}




	namespace
	{
		struct DistanceKey
		{
			uint32_t space;
			uint64_t distance;

			// tie-breaker: the order in which things became ready
			uint32_t order;

			auto operator<=>(const DistanceKey&) const = default;
		};
	}

	static std::vector<uint64_t> compute_distances(const Graph& graph)
	{
		constexpr auto INFINITE = std::numeric_limits<uint64_t>::max();

		std::vector<uint64_t> distances(graph.objectCount(), INFINITE);
		std::vector<bool> done(graph.objectCount(), false);

		util::PriorityQueue<uint64_t> queue {};
		distances[static_cast<size_t>(graph.root())] = 0;
		queue.push(0, static_cast<size_t>(graph.root()));

		while(auto next = queue.pop())
		{
			auto [dist, idx] = *next;
			if(done[idx])
				continue;

			done[idx] = true;
			for(auto& link : graph.object(ObjectId(static_cast<uint32_t>(idx))).links)
			{
				auto child = static_cast<size_t>(link.target);
				if(done[child])
					continue;

				auto child_dist = dist + graph.sizeOf(link.target);
				if(child_dist < distances[child])
				{
					distances[child] = child_dist;
					queue.push(child_dist, child);
				}
			}
		}

		return distances;
	}

	// anything we can get to from the root without crossing a 32-bit link goes in the lowest space.
	static void assign_short_reachable_space(Graph& graph)
	{
		std::vector<bool> seen(graph.objectCount(), false);
		std::deque<ObjectId> queue { graph.root() };

		while(not queue.empty())
		{
			auto id = queue.front();
			queue.pop_front();

			if(seen[static_cast<size_t>(id)])
				continue;

			seen[static_cast<size_t>(id)] = true;
			graph.setSpace(id, space::SHORT_REACHABLE);

			for(auto& link : graph.object(id).links)
			{
				if(link.width != OffsetWidth::Offset32)
					queue.push_back(link.target);
			}
		}
	}

	static uint64_t modified_distance(const Vertex& vertex, uint64_t distance, size_t size)
	{
		auto dist = static_cast<int64_t>(distance);
		switch(vertex.priority)
		{
			case 0: break;
			case 1: dist -= static_cast<int64_t>(size / 2); break;
			case 2: dist -= static_cast<int64_t>(size); break;
			default: dist = 0; break;
		}

		return static_cast<uint64_t>(std::max(dist, int64_t(0)));
	}

	PackResult<Layout> sortShortestDistance(Graph& graph)
	{
		graph.updateParents();
		assign_short_reachable_space(graph);

		auto distances = compute_distances(graph);

		auto n = graph.objectCount();
		std::vector<size_t> removed_edges(n, 0);
		std::vector<bool> placed(n, false);

		std::vector<ObjectId> order {};
		util::PriorityQueue<DistanceKey> queue {};
		queue.push(DistanceKey { .space = graph.vertex(graph.root()).space, .distance = 0, .order = 0 },
		    static_cast<size_t>(graph.root()));

		uint32_t ready_order = 1;
		while(auto next = queue.pop())
		{
			auto id = ObjectId(static_cast<uint32_t>(next->second));

			order.push_back(id);
			placed[static_cast<size_t>(id)] = true;

			for(auto& link : graph.object(id).links)
			{
				auto child = static_cast<size_t>(link.target);

				removed_edges[child] += 1;
				if(removed_edges[child] != graph.vertex(link.target).incoming_edges || placed[child])
					continue;

				auto& v = graph.vertex(link.target);
				auto key = DistanceKey {
					.space = v.space,
					.distance = modified_distance(v, distances[child], graph.sizeOf(link.target)),
					.order = ready_order++,
				};

				queue.push(key, child);
			}
		}

		TRY(check_everything_placed(graph, placed, order.size()));
		return Ok(Layout::place(graph, std::move(order)));
	}
}
