// graph.cpp
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#include "util.h"
#include "error.h"

#include "graph/graph.h"

namespace otpack::graph
{
	Graph::Graph(ObjectStore store, ObjectId root) : m_store(std::move(store)), m_root(root)
	{
		this->check_id(root);
		m_vertices.resize(m_store.size());
	}

	void Graph::check_id(ObjectId id) const
	{
		if(not m_store.contains(id))
			otpack::internal_error("{} does not exist in the graph ({} objects)", id, m_store.size());
	}

	const Object& Graph::object(ObjectId id) const
	{
		return m_store.get(id);
	}

	const Vertex& Graph::vertex(ObjectId id) const
	{
		this->check_id(id);
		return m_vertices[static_cast<size_t>(id)];
	}

	Vertex& Graph::vertex_mut(ObjectId id)
	{
		this->check_id(id);
		return m_vertices[static_cast<size_t>(id)];
	}

	PackResult<void> Graph::validate() const
	{
		for(auto id : this->reachableObjects())
		{
			auto& obj = this->object(id);

			std::vector<std::pair<size_t, size_t>> fields {};
			for(auto& link : obj.links)
			{
				if(not m_store.contains(link.target))
					return Err(PackError::invalid(zpr::sprint("{} links to nonexistent {}", id, link.target)));

				// the root is emitted first, so nothing may point back at it.
				if(link.target == m_root)
					return Err(PackError::invalid(zpr::sprint("{} links back to the root {}", id, m_root)));

				if(link.isVirtual())
					continue;

				auto len = byteLength(link.width);
				if(link.position + len > obj.size())
				{
					return Err(PackError::invalid(zpr::sprint("{}: {} at +{} runs past the end of the object ({} bytes)",
					    id, link.width, link.position, obj.size())));
				}

				fields.emplace_back(link.position, link.position + len);
			}

			std::sort(fields.begin(), fields.end());
			for(size_t i = 1; i < fields.size(); i++)
			{
				if(fields[i].first < fields[i - 1].second)
					return Err(PackError::invalid(zpr::sprint("{}: offset fields at +{} and +{} overlap", id,
					    fields[i - 1].first, fields[i].first)));
			}
		}

		return Ok();
	}

	std::vector<ObjectId> Graph::reachableObjects() const
	{
		std::vector<ObjectId> ret {};
		std::vector<bool> seen(m_store.size(), false);

		std::vector<ObjectId> stack { m_root };
		while(not stack.empty())
		{
			auto id = stack.back();
			stack.pop_back();

			if(seen[static_cast<size_t>(id)])
				continue;

			seen[static_cast<size_t>(id)] = true;
			ret.push_back(id);

			auto& links = this->object(id).links;
			for(auto it = links.rbegin(); it != links.rend(); ++it)
			{
				if(m_store.contains(it->target) && not seen[static_cast<size_t>(it->target)])
					stack.push_back(it->target);
			}
		}

		return ret;
	}

	void Graph::updateParents()
	{
		if(not m_parents_invalid)
			return;

		m_vertices.resize(m_store.size());
		for(auto& v : m_vertices)
		{
			v.parents.clear();
			v.incoming_edges = 0;
			v.reachable = false;
		}

		// only links from objects we can actually get to count; orphans don't hold anything back.
		auto reachable = this->reachableObjects();
		for(auto id : reachable)
			m_vertices[static_cast<size_t>(id)].reachable = true;

		for(auto id : reachable)
		{
			for(auto& link : this->object(id).links)
			{
				// dangling links are reported by validate()
				if(not m_store.contains(link.target))
					continue;

				auto& child = m_vertices[static_cast<size_t>(link.target)];
				child.parents[id] += 1;
				child.incoming_edges += 1;
			}
		}

		m_parents_invalid = false;
	}

	size_t Graph::reachableCount()
	{
		this->updateParents();
		return static_cast<size_t>(std::count_if(m_vertices.begin(), m_vertices.end(), //
		    [](const Vertex& v) { return v.reachable; }));
	}

	std::set<ObjectId> Graph::findSubgraph(ObjectId id) const
	{
		std::set<ObjectId> ret {};
		std::vector<ObjectId> stack { id };
		while(not stack.empty())
		{
			auto next = stack.back();
			stack.pop_back();

			if(not ret.insert(next).second)
				continue;

			for(auto& link : this->object(next).links)
				stack.push_back(link.target);
		}

		return ret;
	}

	size_t Graph::subgraphSize(ObjectId id) const
	{
		size_t total = 0;
		for(auto x : this->findSubgraph(id))
			total += this->sizeOf(x);

		return total;
	}




	ObjectId Graph::addObject(Object obj)
	{
		auto id = m_store.append(std::move(obj));
		m_vertices.resize(m_store.size());

		m_parents_invalid = true;
		return id;
	}

	ObjectId Graph::internObject(Object obj)
	{
		auto id = m_store.intern(std::move(obj));
		m_vertices.resize(m_store.size());

		m_parents_invalid = true;
		return id;
	}

	void Graph::replaceObject(ObjectId id, Object obj)
	{
		m_store.getMutable(id) = std::move(obj);
		m_parents_invalid = true;
	}

	void Graph::remapChild(ObjectId parent, uint32_t position, ObjectId new_child)
	{
		this->check_id(new_child);
		for(auto& link : m_store.getMutable(parent).links)
		{
			if(not link.isVirtual() && link.position == position)
			{
				link.target = new_child;
				m_parents_invalid = true;
				return;
			}
		}

		otpack::internal_error("{} has no offset at +{}", parent, position);
	}

	size_t Graph::remapChildren(ObjectId parent, ObjectId from, ObjectId to)
	{
		this->check_id(to);

		size_t count = 0;
		for(auto& link : m_store.getMutable(parent).links)
		{
			if(link.target == from)
				link.target = to, count++;
		}

		if(count > 0)
			m_parents_invalid = true;

		return count;
	}

	ObjectId Graph::duplicateVertex(ObjectId id)
	{
		auto copy = this->object(id);
		auto space = this->vertex(id).space;

		auto clone = this->addObject(std::move(copy));
		this->vertex_mut(clone).space = space;

		return clone;
	}

	std::optional<ObjectId> Graph::duplicateAndReassignParents(const std::vector<ObjectId>& parents, ObjectId child)
	{
		this->updateParents();

		auto total_parents = this->vertex(child).parents.size();

		std::vector<ObjectId> moving {};
		for(auto p : parents)
		{
			if(this->vertex(child).parents.contains(p) && std::find(moving.begin(), moving.end(), p) == moving.end())
				moving.push_back(p);
		}

		// someone has to keep the original.
		if(moving.size() == total_parents && not moving.empty())
			moving.pop_back();

		if(moving.empty())
			return std::nullopt;

		auto clone = this->duplicateVertex(child);
		for(auto p : moving)
			this->remapChildren(p, child, clone);

		// a clone that is still shared will likely need to sit close to several parents.
		if(moving.size() > 1)
			this->vertex_mut(clone).priority = MAX_PRIORITY;

		return clone;
	}

	bool Graph::raisePriority(ObjectId id)
	{
		auto& v = this->vertex_mut(id);
		if(v.priority >= MAX_PRIORITY)
			return false;

		v.priority += 1;
		return true;
	}

	bool Graph::raiseChildrensPriority(ObjectId parent)
	{
		bool changed = false;
		for(auto& link : this->object(parent).links)
			changed |= this->raisePriority(link.target);

		return changed;
	}

	size_t Graph::dropVirtualLinksAmong(const std::vector<ObjectId>& objects)
	{
		util::hashset<ObjectId> among(objects.begin(), objects.end());

		size_t dropped = 0;
		for(auto id : objects)
		{
			auto& links = m_store.getMutable(id).links;
			auto it = std::remove_if(links.begin(), links.end(), [&among](const Link& link) {
				return link.isVirtual() && among.contains(link.target);
			});

			dropped += static_cast<size_t>(std::distance(it, links.end()));
			links.erase(it, links.end());
		}

		if(dropped > 0)
			m_parents_invalid = true;

		return dropped;
	}

	void Graph::setSpace(ObjectId id, uint32_t space)
	{
		this->vertex_mut(id).space = space;
	}

	size_t Graph::rootsInSpace(uint32_t space) const
	{
		if(auto it = m_roots_per_space.find(space); it != m_roots_per_space.end())
			return it->second;
		return 0;
	}
}
