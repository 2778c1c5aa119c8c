// spaces.cpp
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#include "util.h"
#include "error.h"

#include "graph/graph.h"

/*
    Subgraphs that hang off 32-bit links (extension subtables and friends) get their own
    "space". Everything in a lower space is packed before everything in a higher one, so the
    16-bit region near the root stays small, and each wide subgraph sits in one contiguous
    block where its own 16-bit offsets can reach each other.

    For this to work, an object in a space must not also be reachable from outside it; any such
    object is duplicated (along with everything below it) when the space is isolated.
*/

namespace otpack::graph
{
	uint32_t Graph::next_space()
	{
		return m_next_space++;
	}

	void Graph::find_subgraph_map(ObjectId id, std::map<ObjectId, size_t>& subgraph) const
	{
		for(auto& link : this->object(id).links)
		{
			// only recurse the first time we see something, so edges are counted exactly once
			if(auto it = subgraph.find(link.target); it != subgraph.end())
			{
				it->second += 1;
			}
			else
			{
				subgraph.emplace(link.target, 1);
				this->find_subgraph_map(link.target, subgraph);
			}
		}
	}

	void Graph::find_connected_nodes(ObjectId start, std::set<ObjectId>& targets, util::hashset<ObjectId>& visited,
	    std::set<ObjectId>& connected) const
	{
		std::vector<ObjectId> stack { start };
		while(not stack.empty())
		{
			auto id = stack.back();
			stack.pop_back();

			if(not visited.insert(id).second)
				continue;

			if(targets.erase(id) > 0)
				connected.insert(id);

			// walk both up and down; two roots that share anything at all end up in the same space.
			for(auto& [parent, _] : this->vertex(id).parents)
				stack.push_back(parent);

			for(auto& link : this->object(id).links)
				stack.push_back(link.target);
		}
	}

	ObjectId Graph::duplicate_subgraph(ObjectId root, util::hashmap<ObjectId, ObjectId>& dupes, uint32_t space)
	{
		if(auto it = dupes.find(root); it != dupes.end())
			return it->second;

		auto copy = this->object(root);
		for(auto& link : copy.links)
			link.target = this->duplicate_subgraph(link.target, dupes, space);

		auto id = this->addObject(std::move(copy));
		this->vertex_mut(id).space = space;

		dupes[root] = id;
		return id;
	}

	ObjectId Graph::find_root_of_space(ObjectId id) const
	{
		// bounded, in case something upstream is in the same space through a cycle
		for(size_t i = 0; i < m_vertices.size(); i++)
		{
			auto& v = this->vertex(id);
			if(v.parents.empty())
				return id;

			auto parent = v.parents.begin()->first;
			if(this->vertex(parent).space != v.space)
				return id;

			id = parent;
		}

		return id;
	}

	bool Graph::isolateSubgraph(std::set<ObjectId>& roots)
	{
		this->updateParents();

		// object -> number of incoming edges that come from inside the subgraph. a root can be
		// inside another root's subgraph already, in which case it (and everything under it) has
		// been walked, and the edges from there are already counted.
		std::map<ObjectId, size_t> subgraph {};
		for(auto root : roots)
		{
			if(subgraph.try_emplace(root, 0).second)
				this->find_subgraph_map(root, subgraph);
		}

		// from outside, only the 32-bit links into the roots count as "inside"; if there are other
		// (narrower) links, the root itself needs to be duplicated.
		for(auto root : roots)
		{
			for(auto& [parent, _] : this->vertex(root).parents)
			{
				if(subgraph.contains(parent))
					continue;

				for(auto& link : this->object(parent).links)
					subgraph[root] += (link.target == root && startsSpace(link.width)) ? 1 : 0;
			}
		}

		if(subgraph.empty())
			return false;

		auto space = this->next_space();
		m_roots_per_space[space] = roots.size();

		util::hashmap<ObjectId, ObjectId> dupes {};
		for(auto& [id, edges_inside] : subgraph)
		{
			if(edges_inside < this->vertex(id).incoming_edges)
				this->duplicate_subgraph(id, dupes, space);
		}

		// objects that weren't shared stay put and join the space; point them at the duplicates.
		for(auto& [id, _] : subgraph)
		{
			if(dupes.contains(id))
				continue;

			this->vertex_mut(id).space = space;
			for(auto& link : m_store.getMutable(id).links)
			{
				if(auto it = dupes.find(link.target); it != dupes.end())
					link.target = it->second;
			}
		}

		// finally, the wide links into any root that had to be duplicated go to the duplicate.
		for(auto root : roots)
		{
			auto it = dupes.find(root);
			if(it == dupes.end())
				continue;

			for(auto& [parent, _] : this->vertex(root).parents)
			{
				for(auto& link : m_store.getMutable(parent).links)
				{
					if(link.target == root && startsSpace(link.width))
						link.target = it->second;
				}
			}
		}

		for(auto& [old_id, new_id] : dupes)
		{
			if(roots.erase(old_id) > 0)
				roots.insert(new_id);
		}

		if(m_verbose)
		{
			otpack::log("graph", "moved {} root(s) into space {} ({} object(s) duplicated)", roots.size(), space,
			    dupes.size());
		}

		m_parents_invalid = true;
		return true;
	}

	bool Graph::assignSpaces()
	{
		this->updateParents();

		std::set<ObjectId> roots {};
		std::map<SpaceId, std::set<ObjectId>> hinted_roots {};

		// everything underneath a 32-bit link
		util::hashset<ObjectId> wide {};

		util::hashset<ObjectId> seen {};
		std::deque<ObjectId> queue { m_root };
		while(not queue.empty())
		{
			auto id = queue.front();
			queue.pop_front();

			if(wide.contains(id) || not seen.insert(id).second)
				continue;

			for(auto& link : this->object(id).links)
			{
				if(not startsSpace(link.width))
				{
					queue.push_back(link.target);
					continue;
				}

				if(link.space != SpaceId::Auto)
					hinted_roots[link.space].insert(link.target);
				else
					roots.insert(link.target);

				for(auto x : this->findSubgraph(link.target))
					wide.insert(x);
			}
		}

		if(roots.empty() && hinted_roots.empty())
			return false;

		// a root that was asked for by name goes where it was asked to go.
		for(auto& [_, group] : hinted_roots)
		{
			for(auto r : group)
				roots.erase(r);
		}

		// the traversal for connected roots must not wander out into the 16-bit world.
		util::hashset<ObjectId> visited {};
		for(auto id : this->reachableObjects())
		{
			if(not wide.contains(id))
				visited.insert(id);
		}

		for(auto& [hint, group] : hinted_roots)
		{
			if(m_verbose)
				otpack::log("graph", "isolating {} root(s) with space hint {}", group.size(), static_cast<uint32_t>(hint));

			this->isolateSubgraph(group);
			this->updateParents();

			for(auto r : group)
			{
				for(auto x : this->findSubgraph(r))
					visited.insert(x);
			}
		}

		while(not roots.empty())
		{
			auto next = *roots.begin();

			std::set<ObjectId> connected {};
			this->find_connected_nodes(next, roots, visited, connected);

			// `next` was already swallowed by something else; it still needs a space of its own.
			if(connected.empty())
			{
				roots.erase(next);
				connected.insert(next);
			}

			this->isolateSubgraph(connected);
			this->updateParents();
		}

		return true;
	}

	bool Graph::tryIsolatingSubgraphs(const std::vector<Overflow>& overflows)
	{
		this->updateParents();

		std::map<uint32_t, std::set<ObjectId>> to_isolate {};
		for(auto& overflow : overflows)
		{
			auto parent_space = this->vertex(overflow.parent).space;

			// only isolated spaces can be split up further
			if(parent_space < space::INITIAL || this->rootsInSpace(parent_space) < 2)
				continue;

			if(this->vertex(overflow.child).space != parent_space)
				continue;

			to_isolate[parent_space].insert(this->find_root_of_space(overflow.parent));
		}

		bool changed = false;
		for(auto& [space, roots] : to_isolate)
		{
			auto max_to_move = this->rootsInSpace(space) / 2;
			while(roots.size() > max_to_move)
				roots.erase(std::prev(roots.end()));

			if(roots.empty())
				continue;

			if(m_verbose)
			{
				otpack::log("graph", "moving {} of {} root(s) out of space {}", roots.size(),
				    this->rootsInSpace(space), space);
			}

			auto moved = roots.size();
			if(this->isolateSubgraph(roots))
			{
				m_roots_per_space[space] -= moved;
				changed = true;
			}

			this->updateParents();
		}

		return changed;
	}
}
