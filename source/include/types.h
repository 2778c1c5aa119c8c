// types.h
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <type_traits>

#include <zpr.h>
#include <zst/zst.h>

enum class GlyphId : uint32_t
{
	notdef = 0
};

template <>
struct std::hash<GlyphId>
{
	size_t operator()(const GlyphId& gid) const { return std::hash<size_t>()(static_cast<size_t>(gid)); }
};

namespace zpr
{
	template <>
	struct print_formatter<GlyphId>
	{
		template <typename Cb>
		void print(GlyphId x, Cb&& cb, format_args args)
		{
			detail::print(static_cast<Cb&&>(cb), "glyph({})", static_cast<uint32_t>(x));
		}
	};

	// lvalues are looked up by reference type, which the generic enum formatter would otherwise take.
	template <> struct print_formatter<GlyphId&> : print_formatter<GlyphId> { };
	template <> struct print_formatter<const GlyphId&> : print_formatter<GlyphId> { };
	template <> struct print_formatter<const GlyphId> : print_formatter<GlyphId> { };
}
