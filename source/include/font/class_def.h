// class_def.h
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <map>

#include "defs.h"
#include "types.h"

#include "graph/object.h"

namespace otpack::font::off
{
	/*
	    Reads a ClassDef table (format 1 or 2) into a glyph -> class mapping. Glyphs that the
	    table doesn't mention are in class 0, and are not in the map.
	*/
	StrErrorOr<std::map<GlyphId, uint16_t>> parseClassDef(zst::byte_span table);

	// the class of `glyph` in the mapping, 0 if it has none.
	uint16_t classOf(const std::map<GlyphId, uint16_t>& classes, GlyphId glyph);

	/*
	    Writes a ClassDef table, leaving out class 0 entries, in whichever format comes out
	    smaller. If both are the same size, format 1 is used.
	*/
	graph::Object buildClassDef(const std::map<GlyphId, uint16_t>& classes);
}
