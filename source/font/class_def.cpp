// class_def.cpp
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#include "util.h"
#include "error.h"

#include "font/misc.h"
#include "font/class_def.h"
#include "font/layout_tables.h"

#include "graph/builder.h"

namespace otpack::font::off
{
	template <typename Callback>
	static StrErrorOr<void> parse_classdef_table(zst::byte_span table, Callback&& callback)
	{
		if(table.size() < 4)
			return ErrFmt("ClassDef table too short ({} bytes)", table.size());

		auto format = consume_u16(table);
		if(format == 1)
		{
			if(table.size() < 4)
				return ErrFmt("ClassDef table too short");

			auto start_gid = consume_u16(table);
			auto num_glyphs = consume_u16(table);
			if(table.size() < num_glyphs * sizeof(uint16_t))
				return ErrFmt("ClassDef table truncated (expected {} glyphs)", num_glyphs);

			for(uint32_t i = 0; i < num_glyphs; i++)
				callback(consume_u16(table), GlyphId { start_gid + i });
		}
		else if(format == 2)
		{
			auto num_ranges = consume_u16(table);
			if(table.size() < num_ranges * 3 * sizeof(uint16_t))
				return ErrFmt("ClassDef table truncated (expected {} ranges)", num_ranges);

			for(size_t i = 0; i < num_ranges; i++)
			{
				auto first_gid = consume_u16(table);
				auto last_gid = consume_u16(table);
				auto class_id = consume_u16(table);

				if(last_gid < first_gid)
					return ErrFmt("ClassDef range {} is backwards ({} > {})", i, first_gid, last_gid);

				for(uint32_t g = first_gid; g < last_gid + 1u; g++)
					callback(class_id, GlyphId { g });
			}
		}
		else
		{
			return ErrFmt("invalid ClassDef format {}", format);
		}

		return Ok();
	}

	StrErrorOr<std::map<GlyphId, uint16_t>> parseClassDef(zst::byte_span table)
	{
		std::map<GlyphId, uint16_t> classes {};
		TRY(parse_classdef_table(table, [&](uint16_t cls, GlyphId gid) {
			if(cls != 0)
				classes[gid] = cls;
		}));

		return Ok(std::move(classes));
	}

	uint16_t classOf(const std::map<GlyphId, uint16_t>& classes, GlyphId glyph)
	{
		if(auto it = classes.find(glyph); it != classes.end())
			return it->second;

		return 0;
	}

	graph::Object buildClassDef(const std::map<GlyphId, uint16_t>& classes)
	{
		struct Range
		{
			uint16_t first;
			uint16_t last;
			uint16_t cls;
		};

		std::vector<Range> ranges {};
		for(auto& [gid, cls] : classes)
		{
			if(cls == 0)
				continue;

			auto g = static_cast<uint16_t>(gid);
			if(not ranges.empty() && ranges.back().last + 1u == g && ranges.back().cls == cls)
				ranges.back().last = g;
			else
				ranges.push_back(Range { .first = g, .last = g, .cls = cls });
		}

		graph::ObjectBuilder builder { kind::CLASS_DEF };
		if(ranges.empty())
			return builder.u16(1).u16(0).u16(0).finish();

		// format 1 has to spell out every glyph between the first and the last, classed or not.
		size_t span = ranges.back().last - ranges.front().first + 1u;
		if(4 + 6 * ranges.size() < 6 + 2 * span)
		{
			builder.u16(2).u16(static_cast<uint16_t>(ranges.size()));
			for(auto& r : ranges)
				builder.u16(r.first).u16(r.last).u16(r.cls);
		}
		else
		{
			auto first = ranges.front().first;
			builder.u16(1).u16(first).u16(static_cast<uint16_t>(span));

			std::vector<uint16_t> values(span, 0);
			for(auto& r : ranges)
			{
				for(uint32_t g = r.first; g < r.last + 1u; g++)
					values[g - first] = r.cls;
			}

			for(auto v : values)
				builder.u16(v);
		}

		return builder.finish();
	}
}
