// graph.h
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <map>
#include <set>
#include <vector>
#include <optional>

#include "util.h"
#include "graph/object.h"
#include "graph/overflow.h"
#include "graph/pack_error.h"
#include "graph/object_store.h"

namespace otpack::graph
{
	namespace space
	{
		// reachable from the root using only 16- and 24-bit links
		constexpr uint32_t SHORT_REACHABLE = 0;

		// reachable, but only through a 32-bit link somewhere
		constexpr uint32_t REACHABLE = 1;

		// the first space handed out to an isolated subgraph
		constexpr uint32_t INITIAL = 2;
	}

	constexpr uint8_t MAX_PRIORITY = 3;

	struct Vertex
	{
		uint32_t space = space::REACHABLE;
		uint8_t priority = 0;

		bool reachable = false;

		// number of incoming links from reachable objects, counting each link separately
		size_t incoming_edges = 0;

		// parent -> how many of its links point here
		util::hashmap<ObjectId, size_t> parents;

		bool isShared() const { return parents.size() > 1; }
	};

	/*
	    The object store plus all the bookkeeping the packer needs on top of it. The graph is
	    rooted at one object; anything the collaborator interned but never linked from the root
	    is simply ignored (never sorted, never emitted).

	    Handing in an id that the graph doesn't know about is a bug in the caller, and aborts.
	*/
	struct Graph
	{
		Graph(ObjectStore store, ObjectId root);

		ObjectId root() const { return m_root; }
		size_t objectCount() const { return m_store.size(); }
		bool contains(ObjectId id) const { return m_store.contains(id); }

		const Object& object(ObjectId id) const;
		const Vertex& vertex(ObjectId id) const;
		size_t sizeOf(ObjectId id) const { return this->object(id).size(); }

		// checks link bounds and targets; run once before packing.
		PackResult<void> validate() const;

		void updateParents();

		// reachable objects, root first, in depth-first discovery order
		std::vector<ObjectId> reachableObjects() const;
		size_t reachableCount();

		std::set<ObjectId> findSubgraph(ObjectId id) const;
		size_t subgraphSize(ObjectId id) const;


		// adds a fresh object, no deduplication
		ObjectId addObject(Object obj);

		// adds an object, reusing an existing id with the same content
		ObjectId internObject(Object obj);

		// swaps the content of `id` wholesale; links into `id` are unaffected.
		void replaceObject(ObjectId id, Object obj);

		// retargets the (non-virtual) link at `position` in `parent`
		void remapChild(ObjectId parent, uint32_t position, ObjectId new_child);

		// retargets every link in `parent` that points at `from`
		size_t remapChildren(ObjectId parent, ObjectId from, ObjectId to);

		// a copy of `id` with the same links; nothing points at it yet.
		ObjectId duplicateVertex(ObjectId id);

		/*
		    Clones `child` and moves every link from `parents` over to the clone. If that would
		    leave the original with no parents at all, one parent is left pointing at the original.
		    Returns nothing if there was nothing to do.
		*/
		std::optional<ObjectId> duplicateAndReassignParents(const std::vector<ObjectId>& parents, ObjectId child);

		bool raisePriority(ObjectId id);
		bool raiseChildrensPriority(ObjectId parent);

		// drops virtual links between the given objects; returns how many were removed.
		size_t dropVirtualLinksAmong(const std::vector<ObjectId>& objects);


		/*
		    Finds every subgraph that hangs off a 32-bit link, makes sure each is only reachable
		    through such links (duplicating shared objects as needed), and gives each group of
		    connected roots its own space. Returns false if there were no such subgraphs.
		*/
		bool assignSpaces();

		// moves the subgraph under `roots` into a new space, duplicating anything shared with the outside.
		bool isolateSubgraph(std::set<ObjectId>& roots);

		// for spaces that have overflows and more than one root, move half of the roots elsewhere.
		bool tryIsolatingSubgraphs(const std::vector<Overflow>& overflows);

		size_t rootsInSpace(uint32_t space) const;
		void setSpace(ObjectId id, uint32_t space);

		bool verbose() const { return m_verbose; }
		void setVerbose(bool verbose) { m_verbose = verbose; }

	private:
		Vertex& vertex_mut(ObjectId id);
		void check_id(ObjectId id) const;

		ObjectId duplicate_subgraph(ObjectId root, util::hashmap<ObjectId, ObjectId>& dupes, uint32_t space);
		void find_subgraph_map(ObjectId id, std::map<ObjectId, size_t>& subgraph) const;
		void find_connected_nodes(ObjectId id, std::set<ObjectId>& targets, util::hashset<ObjectId>& visited,
		    std::set<ObjectId>& connected) const;
		ObjectId find_root_of_space(ObjectId id) const;
		uint32_t next_space();

		ObjectStore m_store;
		std::vector<Vertex> m_vertices;
		ObjectId m_root;

		bool m_parents_invalid = true;
		bool m_verbose = false;

		uint32_t m_next_space = space::INITIAL;
		util::hashmap<uint32_t, size_t> m_roots_per_space;
	};
}
