// overflow.h
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <vector>

#include "graph/object.h"

namespace otpack::graph
{
	struct Graph;
	struct Layout;

	struct Overflow
	{
		ObjectId parent;
		ObjectId child;
		uint32_t position;
		OffsetWidth width;
		OffsetWhence whence;

		// the value the offset would need to hold; negative if the child was placed before the base.
		int64_t distance;

		// how far past the width's maximum the distance is (or how far behind the base, if negative)
		uint64_t excess() const;
	};

	/*
	    The value an offset field would be written with, given where the layout put both ends.
	    Nullable links to empty objects are always 0.
	*/
	int64_t offsetValue(const Graph& graph, const Layout& layout, ObjectId parent, const Link& link);

	bool fitsInWidth(int64_t value, OffsetWidth width);

	// every overflowing (parent, child) pair, in emission order of the parent. only placed objects are checked.
	std::vector<Overflow> findOverflows(const Graph& graph, const Layout& layout);
	bool willOverflow(const Graph& graph, const Layout& layout);
}

namespace zpr
{
	template <>
	struct print_formatter<otpack::graph::Overflow>
	{
		template <typename Cb>
		void print(const otpack::graph::Overflow& x, Cb&& cb, format_args args)
		{
			detail::print(static_cast<Cb&&>(cb), "{} -> {} (+{}, {}): {}", x.parent, x.child, x.position, x.width,
			    x.distance);
		}
	};
}
