// adapters.cpp
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#include "error.h"

#include "graph/adapters.h"

namespace otpack::graph
{
	Splitter::~Splitter()
	{
	}

	ShardContainer::~ShardContainer()
	{
	}

	Promoter::~Promoter()
	{
	}

	Adapters& Adapters::addSplitter(ObjectKind kind, std::unique_ptr<Splitter> splitter)
	{
		if(m_splitters.contains(kind))
			otpack::internal_error("splitter for kind {} registered twice", static_cast<uint16_t>(kind));

		m_splitters.emplace(kind, std::move(splitter));
		return *this;
	}

	Adapters& Adapters::addContainer(ObjectKind kind, std::unique_ptr<ShardContainer> container)
	{
		if(m_containers.contains(kind))
			otpack::internal_error("shard container for kind {} registered twice", static_cast<uint16_t>(kind));

		m_containers.emplace(kind, std::move(container));
		return *this;
	}

	Adapters& Adapters::addPromoter(ObjectKind kind, std::unique_ptr<Promoter> promoter)
	{
		if(m_promoters.contains(kind))
			otpack::internal_error("promoter for kind {} registered twice", static_cast<uint16_t>(kind));

		m_promoters.emplace(kind, std::move(promoter));
		return *this;
	}

	template <typename T>
	static const T* lookup(const util::hashmap<ObjectKind, std::unique_ptr<T>>& map, ObjectKind kind)
	{
		if(auto it = map.find(kind); it != map.end())
			return it->second.get();
		return nullptr;
	}

	const Splitter* Adapters::splitter(ObjectKind kind) const
	{
		return lookup(m_splitters, kind);
	}

	const ShardContainer* Adapters::container(ObjectKind kind) const
	{
		return lookup(m_containers, kind);
	}

	const Promoter* Adapters::promoter(ObjectKind kind) const
	{
		return lookup(m_promoters, kind);
	}
}
