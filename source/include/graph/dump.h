// dump.h
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>

namespace otpack::graph
{
	struct Graph;
	struct Layout;

	struct DumpOptions
	{
		// only keep objects in spaces that contain an overflowing child
		bool prune_to_overflows = false;
	};

	/*
	    Renders the graph in graphviz dot syntax. Nodes are labelled with their id, size and
	    space; edges with the offset value they would get under `layout`, coloured red (and bold)
	    when it doesn't fit. If `layout` is null, edges are labelled with the offset width only.
	*/
	std::string dumpGraphviz(const Graph& graph, const Layout* layout, DumpOptions options = {});
}
