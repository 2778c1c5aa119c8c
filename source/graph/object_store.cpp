// object_store.cpp
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#include "util.h"
#include "error.h"

#include "graph/object_store.h"

namespace otpack::graph
{
	ObjectId ObjectStore::intern(Object obj)
	{
		auto hash = obj.hash();
		if(auto it = m_buckets.find(hash); it != m_buckets.end())
		{
			for(auto id : it->second)
			{
				if(m_objects[static_cast<size_t>(id)] == obj)
					return id;
			}
		}

		auto id = ObjectId(static_cast<uint32_t>(m_objects.size()));
		m_objects.push_back(std::move(obj));
		m_buckets[hash].push_back(id);

		return id;
	}

	ObjectId ObjectStore::intern(std::vector<uint8_t> bytes, std::vector<Link> links, ObjectKind kind)
	{
		return this->intern(Object {
		    .bytes = std::move(bytes),
		    .links = std::move(links),
		    .kind = kind,
		});
	}

	ObjectId ObjectStore::append(Object obj)
	{
		auto hash = obj.hash();
		auto id = ObjectId(static_cast<uint32_t>(m_objects.size()));
		m_objects.push_back(std::move(obj));
		m_buckets[hash].push_back(id);

		return id;
	}

	const Object& ObjectStore::get(ObjectId id) const
	{
		if(not this->contains(id))
			otpack::internal_error("{} is not in this store (size {})", id, m_objects.size());

		return m_objects[static_cast<size_t>(id)];
	}

	Object& ObjectStore::getMutable(ObjectId id)
	{
		if(not this->contains(id))
			otpack::internal_error("{} is not in this store (size {})", id, m_objects.size());

		return m_objects[static_cast<size_t>(id)];
	}
}
