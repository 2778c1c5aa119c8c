// serialise.cpp
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#include "util.h"
#include "error.h"

#include "graph/pack.h"
#include "graph/graph.h"
#include "graph/layout.h"
#include "graph/overflow.h"

namespace otpack::graph
{
	static void write_offset(uint8_t* out, OffsetWidth width, uint64_t value)
	{
		switch(width)
		{
			case OffsetWidth::Offset16: util::writeBEU16(out, static_cast<uint16_t>(value)); break;
			case OffsetWidth::Offset24: util::writeBEU24(out, static_cast<uint32_t>(value)); break;
			case OffsetWidth::Offset32: util::writeBEU32(out, static_cast<uint32_t>(value)); break;
			case OffsetWidth::Zero: break;
		}
	}

	zst::byte_buffer serialise(const Graph& graph, const Layout& layout)
	{
		std::vector<uint8_t> bytes(layout.totalSize(), 0);

		for(auto id : layout.order())
		{
			auto& obj = graph.object(id);
			auto base = layout.start(id);

			std::copy(obj.bytes.begin(), obj.bytes.end(), bytes.begin() + static_cast<ptrdiff_t>(base));

			for(auto& link : obj.links)
			{
				if(link.isVirtual())
					continue;

				if(not layout.isPlaced(link.target))
					otpack::internal_error("{} links to {}, which was never placed", id, link.target);

				auto value = offsetValue(graph, layout, id, link);
				if(not fitsInWidth(value, link.width))
				{
					otpack::internal_error("offset {} -> {} (+{}) does not fit in {}: {}", id, link.target,
					    link.position, link.width, value);
				}

				write_offset(&bytes[base + link.position], link.width, static_cast<uint64_t>(value));
			}
		}

		zst::byte_buffer ret {};
		ret.append(bytes.data(), bytes.size());
		return ret;
	}
}
