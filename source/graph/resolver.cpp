// resolver.cpp
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#include "util.h"
#include "error.h"

#include "misc/priority_queue.h"

#include "graph/pack.h"
#include "graph/graph.h"
#include "graph/layout.h"
#include "graph/overflow.h"

/*
    The overall approach:

    1. try a plain topological sort. if nothing overflows, we're done; this is also what makes
       packing an already-packed table give back the same bytes.
    2. promote anything whose subtree can't possibly fit behind a 16-bit offset, give every
       subgraph under a 32-bit link its own space, and re-sort by distance from the root.
    3. while there are overflows, reshape the graph around the worst ones and re-sort.

    Reshaping is either something local (duplicating a shared child, pulling a child closer),
    after which we keep going with the next overflow, or something structural (promotion,
    splitting, moving subgraphs between spaces), after which the rest of the overflow list is
    stale and we re-sort straight away.
*/

namespace otpack::graph
{
	const char* strategyName(Strategy strategy)
	{
		switch(strategy)
		{
			case Strategy::Promote: return "promote";
			case Strategy::Duplicate: return "duplicate";
			case Strategy::Split: return "split";
			case Strategy::Respace: return "respace";
			case Strategy::Reprioritise: return "reprioritise";
		}
		return "?";
	}

	bool PackOptions::allows(Strategy strategy) const
	{
		return std::find(this->strategies.begin(), this->strategies.end(), strategy) != this->strategies.end();
	}

	namespace
	{
		enum class Outcome
		{
			Unchanged,
			Changed,      // the next overflow in this round is still worth looking at
			Restructured, // re-sort now
		};

		struct RoundState
		{
			// objects modified this round; overflows involving them wait for the next one.
			util::hashset<ObjectId> touched;
			bool respaced = false;
		};

		struct Resolver
		{
			Graph& graph;
			const PackOptions& options;
			const Adapters& adapters;

			PackResult<Outcome> apply(Strategy strategy, const Overflow& overflow, const std::vector<Overflow>& all,
			    RoundState& state);

			PackResult<bool> promote(const Overflow& overflow);
			bool duplicate(const Overflow& overflow, const std::vector<Overflow>& all, RoundState& state);
			PackResult<bool> split(const Overflow& overflow, const std::vector<Overflow>& all);
			bool respace(const std::vector<Overflow>& all, RoundState& state);
			bool reprioritise(const Overflow& overflow, RoundState& state);

			PackResult<size_t> promoteOversized();
		};
	}

	static PackError with_snapshot(PackError err, const Graph& graph, const Layout* layout)
	{
		err.graph = std::make_shared<const Graph>(graph);
		if(layout != nullptr)
			err.layout = std::make_shared<const Layout>(*layout);

		return err;
	}

	static bool has_promotable_links(const Object& obj)
	{
		return std::any_of(obj.links.begin(), obj.links.end(), [](const Link& link) { return link.promotable; });
	}

	using SortFn = PackResult<Layout> (*)(Graph&);

	// cycles made only of virtual links are broken by dropping those links; real cycles are fatal.
	static PackResult<Layout> sort_breaking_cycles(Graph& graph, SortFn sort)
	{
		while(true)
		{
			auto result = sort(graph);
			if(result.ok())
				return Ok(std::move(result.unwrap()));

			auto& err = result.error();
			if(err.kind != PackError::Kind::StructuralCycle)
				return Err(std::move(err));

			auto dropped = graph.dropVirtualLinksAmong(err.stuck);
			if(dropped == 0)
				return Err(std::move(err));

			otpack::warn("pack", "dropped {} ordering-only link(s) to break a cycle between {} object(s)", dropped,
			    err.stuck.size());
		}
	}

	// worst first: children with the most overflowing parents, then the ones that are furthest out.
	static std::vector<Overflow> rank_overflows(const std::vector<Overflow>& overflows)
	{
		util::hashmap<ObjectId, int64_t> parents_per_child {};
		for(auto& o : overflows)
			parents_per_child[o.child] += 1;

		util::PriorityQueue<std::tuple<int64_t, int64_t, size_t>> queue {};
		queue.reserve(overflows.size());

		for(size_t i = 0; i < overflows.size(); i++)
		{
			auto& o = overflows[i];
			queue.push({ -parents_per_child[o.child], -static_cast<int64_t>(o.excess()), i }, i);
		}

		std::vector<Overflow> ret {};
		ret.reserve(overflows.size());

		while(auto next = queue.pop())
			ret.push_back(overflows[next->second]);

		return ret;
	}




	PackResult<Outcome> Resolver::apply(Strategy strategy, const Overflow& overflow, const std::vector<Overflow>& all,
	    RoundState& state)
	{
		bool changed = false;
		switch(strategy)
		{
			case Strategy::Promote:
				if(TRY(this->promote(overflow)))
					return Ok(Outcome::Restructured);
				break;

			case Strategy::Split:
				if(TRY(this->split(overflow, all)))
					return Ok(Outcome::Restructured);
				break;

			case Strategy::Respace:
				if(this->respace(all, state))
					return Ok(Outcome::Restructured);
				break;

			case Strategy::Duplicate: changed = this->duplicate(overflow, all, state); break;
			case Strategy::Reprioritise: changed = this->reprioritise(overflow, state); break;
		}

		return Ok(changed ? Outcome::Changed : Outcome::Unchanged);
	}

	PackResult<bool> Resolver::promote(const Overflow& overflow)
	{
		// the child, the parent, and then upwards for as long as there's only one way up.
		graph.updateParents();

		std::vector<ObjectId> candidates { overflow.child, overflow.parent };
		for(auto cur = overflow.parent; graph.vertex(cur).parents.size() == 1;)
		{
			cur = graph.vertex(cur).parents.begin()->first;
			if(std::find(candidates.begin(), candidates.end(), cur) != candidates.end())
				break;

			candidates.push_back(cur);
		}

		for(auto id : candidates)
		{
			auto promoter = adapters.promoter(graph.object(id).kind);
			if(promoter == nullptr || not has_promotable_links(graph.object(id)))
				continue;

			if(not TRY(promoter->promote(graph, id)))
				continue;

			if(options.verbose)
				otpack::log("pack", "promoted the links of {} to fix {}", id, overflow);

			graph.assignSpaces();
			return Ok(true);
		}

		return Ok(false);
	}

	bool Resolver::duplicate(const Overflow& overflow, const std::vector<Overflow>& all, RoundState& state)
	{
		graph.updateParents();
		if(not graph.vertex(overflow.child).isShared())
			return false;

		std::vector<ObjectId> parents {};
		for(auto& o : all)
		{
			if(o.child == overflow.child && not state.touched.contains(o.parent))
				parents.push_back(o.parent);
		}

		auto clone = graph.duplicateAndReassignParents(parents, overflow.child);
		if(not clone.has_value())
			return false;

		if(options.verbose)
			otpack::log("pack", "duplicated {} as {} for {} parent(s)", overflow.child, *clone, parents.size());

		state.touched.insert(*clone);
		for(auto p : parents)
			state.touched.insert(p);

		return true;
	}

	PackResult<bool> Resolver::split(const Overflow& overflow, const std::vector<Overflow>& all)
	{
		graph.updateParents();

		auto parent = overflow.parent;
		auto splitter = adapters.splitter(graph.object(parent).kind);
		if(splitter == nullptr)
			return Ok(false);

		auto& pv = graph.vertex(parent);
		if(pv.parents.size() != 1)
			return Ok(false);

		auto container_id = pv.parents.begin()->first;
		auto container = adapters.container(graph.object(container_id).kind);
		if(container == nullptr)
			return Ok(false);

		auto n = splitter->entryCount(graph, parent);
		if(n < 2)
			return Ok(false);

		// cut before the first entry that can't be reached, but never make the first half the bigger one.
		std::optional<size_t> first_bad {};
		for(auto& o : all)
		{
			if(o.parent != parent)
				continue;

			if(auto entry = splitter->entryForLink(graph, parent, o.position); entry.has_value())
				first_bad = std::min(first_bad.value_or(*entry), *entry);
		}

		auto at = std::clamp(std::min(first_bad.value_or(n / 2), n / 2), size_t(1), n - 1);

		std::vector<EntryRange> ranges {};
		ranges.push_back(EntryRange { .begin = 0, .end = at });
		ranges.push_back(EntryRange { .begin = at, .end = n });

		auto shards = TRY(splitter->split(graph, parent, ranges));
		TRY(container->insertShards(graph, container_id, parent, shards));

		if(options.verbose)
			otpack::log("pack", "split {} ({} entries) at {} into {} shard(s)", parent, n, at, shards.size());

		graph.assignSpaces();
		return Ok(true);
	}

	bool Resolver::respace(const std::vector<Overflow>& all, RoundState& state)
	{
		if(state.respaced)
			return false;

		state.respaced = true;
		return graph.tryIsolatingSubgraphs(all);
	}

	bool Resolver::reprioritise(const Overflow& overflow, RoundState& state)
	{
		if(not graph.object(overflow.child).isLeaf() || state.touched.contains(overflow.parent))
			return false;

		if(not graph.raiseChildrensPriority(overflow.parent))
			return false;

		if(options.verbose)
			otpack::log("pack", "raised the priority of the children of {}", overflow.parent);

		state.touched.insert(overflow.parent);
		return true;
	}

	PackResult<size_t> Resolver::promoteOversized()
	{
		size_t count = 0;
		for(auto id : graph.reachableObjects())
		{
			auto promoter = adapters.promoter(graph.object(id).kind);
			if(promoter == nullptr || not has_promotable_links(graph.object(id)))
				continue;

			if(graph.subgraphSize(id) <= maxValue(OffsetWidth::Offset16))
				continue;

			if(TRY(promoter->promote(graph, id)))
				count += 1;
		}

		if(count > 0 && options.verbose)
			otpack::log("pack", "promoted {} object(s) up front", count);

		return Ok(count);
	}




	PackResult<zst::byte_buffer> pack(Graph graph, const PackOptions& options)
	{
		Adapters none {};
		return pack(std::move(graph), options, none);
	}

	PackResult<zst::byte_buffer> pack(Graph graph, const PackOptions& options, const Adapters& adapters)
	{
		graph.setVerbose(options.verbose);

		if(auto r = graph.validate(); r.is_err())
			return Err(with_snapshot(std::move(r.error()), graph, nullptr));

		if(auto reachable = graph.reachableCount(); reachable < graph.objectCount())
		{
			otpack::warn("pack", "{} of {} object(s) are not reachable from the root and will be left out",
			    graph.objectCount() - reachable, graph.objectCount());
		}

		auto sorted = sort_breaking_cycles(graph, &sortKahn);
		if(sorted.is_err())
			return Err(with_snapshot(std::move(sorted.error()), graph, nullptr));

		auto layout = std::move(sorted.unwrap());
		if(not willOverflow(graph, layout))
		{
			if(options.verbose)
				otpack::log("pack", "topological order fits ({} bytes)", layout.totalSize());

			return Ok(serialise(graph, layout));
		}

		auto resolver = Resolver { .graph = graph, .options = options, .adapters = adapters };
		if(options.promote_eagerly && options.allows(Strategy::Promote))
		{
			if(auto r = resolver.promoteOversized(); r.is_err())
				return Err(with_snapshot(std::move(r.error()), graph, &layout));
		}

		graph.assignSpaces();

		auto resort = [&]() -> PackResult<void> {
			auto r = sort_breaking_cycles(graph, &sortShortestDistance);
			if(r.is_err())
				return Err(with_snapshot(std::move(r.error()), graph, &layout));

			layout = std::move(r.unwrap());
			return Ok();
		};

		TRY(resort());

		for(size_t round = 0;; round++)
		{
			auto overflows = findOverflows(graph, layout);
			if(overflows.empty())
				break;

			if(round >= options.max_rounds)
			{
				auto err = PackError::unresolved(PackError::Cause::BudgetExhausted, overflows,
				    zpr::sprint("{} offset(s) still overflow after {} round(s)", overflows.size(), round));
				return Err(with_snapshot(std::move(err), graph, &layout));
			}

			if(options.verbose)
				otpack::log("pack", "round {}: {} overflow(s)", round + 1, overflows.size());

			RoundState state {};
			bool changed = false;
			bool restructured = false;

			for(auto& overflow : rank_overflows(overflows))
			{
				if(state.touched.contains(overflow.parent) || state.touched.contains(overflow.child))
					continue;

				for(auto strategy : options.strategies)
				{
					auto r = resolver.apply(strategy, overflow, overflows, state);
					if(r.is_err())
						return Err(with_snapshot(std::move(r.error()), graph, &layout));

					if(r.unwrap() == Outcome::Unchanged)
						continue;

					changed = true;
					restructured = (r.unwrap() == Outcome::Restructured);
					break;
				}

				if(restructured)
					break;
			}

			if(not changed)
			{
				auto err = PackError::unresolved(PackError::Cause::NoApplicableStrategy, overflows,
				    zpr::sprint("nothing more can be done about {} overflowing offset(s)", overflows.size()));
				return Err(with_snapshot(std::move(err), graph, &layout));
			}

			TRY(resort());
		}

		if(options.verbose)
			otpack::log("pack", "packed {} object(s) into {} bytes", layout.order().size(), layout.totalSize());

		return Ok(serialise(graph, layout));
	}
}
