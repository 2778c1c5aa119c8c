// overflow.cpp
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#include "util.h"
#include "error.h"

#include "graph/graph.h"
#include "graph/layout.h"
#include "graph/overflow.h"

namespace otpack::graph
{
	uint64_t Overflow::excess() const
	{
		if(this->distance < 0)
			return static_cast<uint64_t>(-this->distance);

		auto max = maxValue(this->width);
		auto dist = static_cast<uint64_t>(this->distance);
		return dist > max ? dist - max : 0;
	}

	bool fitsInWidth(int64_t value, OffsetWidth width)
	{
		return value >= 0 && static_cast<uint64_t>(value) <= maxValue(width);
	}

	int64_t offsetValue(const Graph& graph, const Layout& layout, ObjectId parent, const Link& link)
	{
		if(link.nullable && graph.object(link.target).empty())
			return 0;

		auto child_start = static_cast<int64_t>(layout.start(link.target));
		switch(link.whence)
		{
			case OffsetWhence::Head: return child_start - static_cast<int64_t>(layout.start(parent));
			case OffsetWhence::Tail: return child_start - static_cast<int64_t>(layout.end(parent));
			case OffsetWhence::Absolute: return child_start;
		}

		return child_start;
	}

	std::vector<Overflow> findOverflows(const Graph& graph, const Layout& layout)
	{
		std::vector<Overflow> overflows {};
		util::hashset<uint64_t> seen {};

		for(auto parent : layout.order())
		{
			for(auto& link : graph.object(parent).links)
			{
				if(link.isVirtual() || not layout.isPlaced(link.target))
					continue;

				auto value = offsetValue(graph, layout, parent, link);
				if(fitsInWidth(value, link.width))
					continue;

				auto pair = (static_cast<uint64_t>(parent) << 32) | static_cast<uint64_t>(link.target);
				if(not seen.insert(pair).second)
					continue;

				overflows.push_back(Overflow {
				    .parent = parent,
				    .child = link.target,
				    .position = link.position,
				    .width = link.width,
				    .whence = link.whence,
				    .distance = value,
				});
			}
		}

		return overflows;
	}

	bool willOverflow(const Graph& graph, const Layout& layout)
	{
		for(auto parent : layout.order())
		{
			for(auto& link : graph.object(parent).links)
			{
				if(link.isVirtual() || not layout.isPlaced(link.target))
					continue;

				if(not fitsInWidth(offsetValue(graph, layout, parent, link), link.width))
					return true;
			}
		}

		return false;
	}
}
