// coverage.cpp
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#include "util.h"
#include "error.h"

#include "font/misc.h"
#include "font/coverage.h"
#include "font/layout_tables.h"

#include "graph/graph.h"
#include "graph/builder.h"

namespace otpack::font::off
{
	StrErrorOr<std::vector<GlyphId>> parseCoverageTable(zst::byte_span cov_table)
	{
		if(cov_table.size() < 4)
			return ErrFmt("coverage table too short ({} bytes)", cov_table.size());

		auto format = consume_u16(cov_table);
		std::map<size_t, GlyphId> coverage_map {};

		if(format == 1)
		{
			auto count = consume_u16(cov_table);
			if(cov_table.size() < count * sizeof(uint16_t))
				return ErrFmt("coverage table truncated (expected {} glyphs)", count);

			// the first glyphid in the array has index 0, then 1, and so on.
			for(size_t i = 0; i < count; i++)
				coverage_map[i] = GlyphId { consume_u16(cov_table) };
		}
		else if(format == 2)
		{
			auto num_ranges = consume_u16(cov_table);
			if(cov_table.size() < num_ranges * 3 * sizeof(uint16_t))
				return ErrFmt("coverage table truncated (expected {} ranges)", num_ranges);

			for(size_t i = 0; i < num_ranges; i++)
			{
				auto first = consume_u16(cov_table);
				auto last = consume_u16(cov_table);
				auto start_cov = consume_u16(cov_table);

				if(last < first)
					return ErrFmt("coverage range {} is backwards ({} > {})", i, first, last);

				for(uint32_t g = first; g < last + 1u; g++)
					coverage_map[start_cov + (g - first)] = GlyphId { g };
			}
		}
		else
		{
			return ErrFmt("invalid OTF coverage table format ({})", format);
		}

		std::vector<GlyphId> glyphs {};
		glyphs.reserve(coverage_map.size());

		for(auto& [idx, gid] : coverage_map)
		{
			if(idx != glyphs.size())
				return ErrFmt("coverage indices are not contiguous (missing {})", glyphs.size());

			glyphs.push_back(gid);
		}

		return Ok(std::move(glyphs));
	}

	graph::Object buildCoverageTable(std::vector<GlyphId> glyphs)
	{
		std::sort(glyphs.begin(), glyphs.end());
		glyphs.erase(std::unique(glyphs.begin(), glyphs.end()), glyphs.end());

		struct Range
		{
			uint16_t first;
			uint16_t last;
			uint16_t start_cov;
		};

		std::vector<Range> ranges {};
		for(size_t i = 0; i < glyphs.size(); i++)
		{
			auto gid = static_cast<uint16_t>(glyphs[i]);
			if(not ranges.empty() && ranges.back().last + 1u == gid)
				ranges.back().last = gid;
			else
				ranges.push_back(Range { .first = gid, .last = gid, .start_cov = static_cast<uint16_t>(i) });
		}

		graph::ObjectBuilder builder { kind::COVERAGE };
		if(ranges.size() * 3 < glyphs.size())
		{
			builder.u16(2).u16(static_cast<uint16_t>(ranges.size()));
			for(auto& r : ranges)
				builder.u16(r.first).u16(r.last).u16(r.start_cov);
		}
		else
		{
			builder.u16(1).u16(static_cast<uint16_t>(glyphs.size()));
			for(auto g : glyphs)
				builder.u16(static_cast<uint16_t>(g));
		}

		return builder.finish();
	}




	size_t CoverageSplitter::entryCount(const graph::Graph& graph, graph::ObjectId id) const
	{
		if(auto glyphs = parseCoverageTable(graph.object(id).span()); glyphs.ok())
			return glyphs->size();

		return 0;
	}

	std::optional<size_t> CoverageSplitter::entryForLink(const graph::Graph& graph, graph::ObjectId id,
	    uint32_t position) const
	{
		// coverage tables don't point at anything
		return std::nullopt;
	}

	graph::PackResult<std::vector<graph::ObjectId>> CoverageSplitter::split(graph::Graph& graph, graph::ObjectId id,
	    const std::vector<graph::EntryRange>& ranges) const
	{
		auto glyphs = parseCoverageTable(graph.object(id).span());
		if(glyphs.is_err())
			return Err(graph::PackError::invalid(zpr::sprint("{}: {}", id, glyphs.error())));

		std::vector<graph::ObjectId> shards {};
		size_t prev_end = 0;
		for(auto& range : ranges)
		{
			if(range.begin < prev_end || range.begin >= range.end || range.end > glyphs->size())
			{
				return Err(graph::PackError::invalid(zpr::sprint("{}: bad coverage shard [{}, {}) of {} glyphs", id,
				    range.begin, range.end, glyphs->size())));
			}

			prev_end = range.end;

			std::vector<GlyphId> part(glyphs->begin() + static_cast<ptrdiff_t>(range.begin),
			    glyphs->begin() + static_cast<ptrdiff_t>(range.end));

			shards.push_back(graph.internObject(buildCoverageTable(std::move(part))));
		}

		return Ok(std::move(shards));
	}
}
