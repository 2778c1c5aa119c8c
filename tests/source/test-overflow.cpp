// test-overflow.cpp
// Copyright (c) 2024, yuki
// SPDX-License-Identifier: Apache-2.0

#include "tester.h"

#include "graph/graph.h"
#include "graph/pack.h"
#include "graph/layout.h"
#include "graph/overflow.h"

namespace test
{
	using namespace otpack::graph;

	static void overflow_basic(Context& ctx)
	{
		ObjectStore store {};
		auto big = leaf(store, 65530, 0x01);
		auto small = leaf(store, 100, 0x02);
		auto root = store.intern(ObjectBuilder().offset16(big).offset16(small).zeros(6).finish());

		auto graph = Graph(std::move(store), root);
		auto layout = sortKahn(graph);

		auto overflows = findOverflows(graph, *layout);
		CHECK(ctx, willOverflow(graph, *layout));
		if(CHECK_EQ(ctx, overflows.size(), size_t(1)))
		{
			auto& o = overflows[0];
			CHECK_EQ(ctx, o.parent, root);
			CHECK_EQ(ctx, o.child, small);
			CHECK_EQ(ctx, o.position, uint32_t(2));
			CHECK_EQ(ctx, o.distance, int64_t(65540));
			CHECK_EQ(ctx, o.excess(), uint64_t(5));
		}
	}

	static void shared_child_reports_each_parent(Context& ctx)
	{
		ObjectStore store {};
		auto child = leaf(store, 10, 0x01);
		auto p1 = store.intern(ObjectBuilder().offset16(child).fill(0x11, 40000).finish());
		auto p2 = store.intern(ObjectBuilder().offset16(child).offset16(child).fill(0x22, 30000).finish());
		auto root = store.intern(ObjectBuilder().offset16(p1).offset16(p2).finish());

		auto graph = Graph(std::move(store), root);
		auto layout = sortKahn(graph);

		// p2 points at the child twice, but that's one (parent, child) pair.
		auto overflows = findOverflows(graph, *layout);
		CHECK_EQ(ctx, overflows.size(), size_t(1));
		CHECK_EQ(ctx, overflows[0].parent, p1);
	}

	static void offset_bases(Context& ctx)
	{
		ObjectStore store {};
		auto child = leaf(store, 4, 0x01);
		auto empty = store.intern(ObjectBuilder().finish());

		auto root = store.intern(ObjectBuilder()
		                             .u32(0)
		                             .offset16(child, { .whence = OffsetWhence::Head })
		                             .offset16(child, { .whence = OffsetWhence::Tail })
		                             .offset32(child, { .whence = OffsetWhence::Absolute })
		                             .offset16(empty, { .nullable = true })
		                             .finish());

		auto graph = Graph(std::move(store), root);
		auto layout = sortKahn(graph);

		auto& links = graph.object(root).links;
		CHECK_EQ(ctx, graph.sizeOf(root), size_t(14));
		CHECK_EQ(ctx, offsetValue(graph, *layout, root, links[0]), int64_t(14));
		CHECK_EQ(ctx, offsetValue(graph, *layout, root, links[1]), int64_t(0));
		CHECK_EQ(ctx, offsetValue(graph, *layout, root, links[2]), int64_t(14));
		CHECK_EQ(ctx, offsetValue(graph, *layout, root, links[3]), int64_t(0));

		CHECK(ctx, not willOverflow(graph, *layout));

		auto bytes = serialise(graph, *layout);
		CHECK_EQ(ctx, bytes.size(), size_t(18));
		CHECK_EQ(ctx, read_u16(bytes, 4), uint16_t(14));
		CHECK_EQ(ctx, read_u16(bytes, 6), uint16_t(0));
		CHECK_EQ(ctx, read_u32(bytes, 8), uint32_t(14));
		CHECK_EQ(ctx, read_u16(bytes, 12), uint16_t(0));
	}

	static void width_limits(Context& ctx)
	{
		CHECK(ctx, fitsInWidth(65535, OffsetWidth::Offset16));
		CHECK(ctx, not fitsInWidth(65536, OffsetWidth::Offset16));
		CHECK(ctx, fitsInWidth(0xFF'FFFF, OffsetWidth::Offset24));
		CHECK(ctx, not fitsInWidth(0x100'0000, OffsetWidth::Offset24));
		CHECK(ctx, fitsInWidth(0xFFFF'FFFF, OffsetWidth::Offset32));
		CHECK(ctx, not fitsInWidth(-1, OffsetWidth::Offset32));
	}

	void test_overflow(Context& ctx)
	{
		overflow_basic(ctx);
		shared_child_reports_each_parent(ctx);
		offset_bases(ctx);
		width_limits(ctx);
	}
}
