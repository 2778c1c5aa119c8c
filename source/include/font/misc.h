// misc.h
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>

#include <zst/zst.h>

namespace otpack::font
{
	// big-endian readers. the span must have enough bytes; callers check before reading.
	uint16_t peek_u16(const zst::byte_span& s);
	uint16_t consume_u16(zst::byte_span& s);
}
