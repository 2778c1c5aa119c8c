// dump.cpp
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#include "util.h"
#include "error.h"

#include "misc/inc_bimap.h"

#include "graph/dump.h"
#include "graph/graph.h"
#include "graph/layout.h"
#include "graph/overflow.h"

namespace otpack::graph
{
	std::string dumpGraphviz(const Graph& graph, const Layout* layout, DumpOptions options)
	{
		auto objects = graph.reachableObjects();

		util::hashset<uint32_t> keep_spaces {};
		bool pruning = false;
		if(options.prune_to_overflows && layout != nullptr)
		{
			for(auto& o : findOverflows(graph, *layout))
				keep_spaces.insert(graph.vertex(o.child).space);

			pruning = not keep_spaces.empty();
		}

		auto keep = [&](ObjectId id) { return not pruning || keep_spaces.contains(graph.vertex(id).space); };

		// dot doesn't care what the node names are, but small dense ones are easier to read
		util::IncBiMap names {};

		std::string ret = "digraph TablePacking {\n";
		ret += "  node [shape=box];\n";

		for(auto id : objects)
		{
			if(not keep(id))
				continue;

			auto& v = graph.vertex(id);
			auto name = names.add(static_cast<uint32_t>(id));
			ret += zpr::sprint("  N{} [label=\"{} ({}B, S{})\"", name, id, graph.sizeOf(id), v.space);
			if(id == graph.root())
				ret += ", peripheries=2";
			if(v.priority > 0)
				ret += zpr::sprint(", xlabel=\"p{}\"", v.priority);
			ret += "];\n";
		}

		for(auto id : objects)
		{
			if(not keep(id))
				continue;

			for(auto& link : graph.object(id).links)
			{
				if(not keep(link.target))
					continue;

				auto from = *names.get(static_cast<uint32_t>(id));
				auto to = *names.get(static_cast<uint32_t>(link.target));

				if(link.isVirtual())
				{
					ret += zpr::sprint("  N{} -> N{} [style=dotted];\n", from, to);
					continue;
				}

				if(layout == nullptr || not layout->isPlaced(id) || not layout->isPlaced(link.target))
				{
					ret += zpr::sprint("  N{} -> N{} [label=\"{}\"];\n", from, to, link.width);
					continue;
				}

				auto value = offsetValue(graph, *layout, id, link);
				if(fitsInWidth(value, link.width))
				{
					ret += zpr::sprint("  N{} -> N{} [label=\"{} ({})\"];\n", from, to, value, link.width);
				}
				else
				{
					ret += zpr::sprint("  N{} -> N{} [label=\"{} ({})\", color=\"firebrick\", style=bold];\n", from,
					    to, value, link.width);
				}
			}
		}

		ret += "}\n";
		return ret;
	}
}
