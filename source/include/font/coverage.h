// coverage.h
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <vector>

#include "defs.h"
#include "types.h"

#include "graph/object.h"
#include "graph/adapters.h"

namespace otpack::font::off
{
	/*
	    Reads a coverage table (format 1 or 2). The result is indexed by coverage index, so
	    `ret[i]` is the glyph with coverage index `i`.
	*/
	StrErrorOr<std::vector<GlyphId>> parseCoverageTable(zst::byte_span cov_table);

	/*
	    Writes a coverage table for the given glyphs (sorted and deduplicated first), in whichever
	    format comes out smaller. If both are the same size, format 1 is used.
	*/
	graph::Object buildCoverageTable(std::vector<GlyphId> glyphs);

	// splits a coverage table into shards by coverage index.
	struct CoverageSplitter : graph::Splitter
	{
		virtual size_t entryCount(const graph::Graph& graph, graph::ObjectId id) const override;
		virtual std::optional<size_t> entryForLink(const graph::Graph& graph, graph::ObjectId id,
		    uint32_t position) const override;

		virtual graph::PackResult<std::vector<graph::ObjectId>> split(graph::Graph& graph, graph::ObjectId id,
		    const std::vector<graph::EntryRange>& ranges) const override;
	};
}
