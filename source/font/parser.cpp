// parser.cpp
// Copyright (c) 2021, zhiayang
// SPDX-License-Identifier: Apache-2.0

#include "util.h"
#include "error.h"

#include "font/misc.h"

namespace otpack::font
{
	// these are all BIG ENDIAN
	uint16_t peek_u16(const zst::byte_span& s)
	{
		if(s.size() < 2)
			otpack::internal_error("read of 2 bytes past the end of a {}-byte span", s.size());

		return static_cast<uint16_t>(((uint16_t) s[0] << 8) | ((uint16_t) s[1] << 0));
	}

	uint16_t consume_u16(zst::byte_span& s)
	{
		auto ret = peek_u16(s);
		s.remove_prefix(2);
		return ret;
	}
}
