// object_store.h
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <vector>

#include "util.h"
#include "graph/object.h"

namespace otpack::graph
{
	/*
	    Content-addressed storage for objects. Interning the same bytes, links and kind twice
	    gives back the same id; ids are handed out densely starting from 0, and are only
	    meaningful to the store (and graph) that produced them.
	*/
	struct ObjectStore
	{
		ObjectId intern(Object obj);
		ObjectId intern(std::vector<uint8_t> bytes, std::vector<Link> links, ObjectKind kind = ObjectKind::Opaque);

		// adds a new object even if an identical one already exists.
		ObjectId append(Object obj);

		const Object& get(ObjectId id) const;
		Object& getMutable(ObjectId id);

		bool contains(ObjectId id) const { return static_cast<size_t>(id) < m_objects.size(); }
		size_t size() const { return m_objects.size(); }

	private:
		std::vector<Object> m_objects;

		// content hash -> every id that had this hash when it was added
		util::hashmap<size_t, std::vector<ObjectId>> m_buckets;
	};
}
