// test-coverage.cpp
// Copyright (c) 2024, yuki
// SPDX-License-Identifier: Apache-2.0

#include "tester.h"

#include "font/coverage.h"
#include "font/layout_tables.h"

#include "graph/graph.h"

namespace test
{
	using namespace otpack::graph;
	using namespace otpack::font::off;

	static std::vector<GlyphId> glyphs(std::initializer_list<uint32_t> ids)
	{
		std::vector<GlyphId> ret {};
		for(auto id : ids)
			ret.push_back(GlyphId(id));
		return ret;
	}

	static std::vector<GlyphId> glyph_range(uint32_t first, uint32_t last)
	{
		std::vector<GlyphId> ret {};
		for(auto id = first; id <= last; id++)
			ret.push_back(GlyphId(id));
		return ret;
	}

	static void formats(Context& ctx)
	{
		// scattered glyphs: format 1
		auto f1 = buildCoverageTable(glyphs({ 12, 5, 9, 5 }));
		CHECK_EQ(ctx, f1.kind, kind::COVERAGE);
		CHECK_EQ(ctx, f1.bytes, (std::vector<uint8_t> { 0, 1, 0, 3, 0, 5, 0, 9, 0, 12 }));

		// one long run: format 2
		auto f2 = buildCoverageTable(glyph_range(10, 19));
		CHECK_EQ(ctx, f2.bytes, (std::vector<uint8_t> { 0, 2, 0, 1, 0, 10, 0, 19, 0, 0 }));

		// both would be 10 bytes
		auto tie = buildCoverageTable(glyph_range(1, 3));
		CHECK_EQ(ctx, tie.bytes[1], uint8_t(1));

		auto parsed1 = parseCoverageTable(f1.span());
		CHECK(ctx, parsed1.ok() && *parsed1 == glyphs({ 5, 9, 12 }));

		auto parsed2 = parseCoverageTable(f2.span());
		CHECK(ctx, parsed2.ok() && *parsed2 == glyph_range(10, 19));

		// two ranges, with coverage indices carried across
		auto multi = glyph_range(3, 9);
		auto more = glyph_range(100, 120);
		multi.insert(multi.end(), more.begin(), more.end());

		auto f3 = buildCoverageTable(multi);
		CHECK_EQ(ctx, f3.bytes[1], uint8_t(2));
		auto parsed3 = parseCoverageTable(f3.span());
		CHECK(ctx, parsed3.ok() && *parsed3 == multi);
	}

	static void malformed(Context& ctx)
	{
		auto bad_format = std::vector<uint8_t> { 0, 3, 0, 0 };
		CHECK(ctx, parseCoverageTable(zst::byte_span(bad_format.data(), bad_format.size())).is_err());

		auto truncated = std::vector<uint8_t> { 0, 1, 0, 4, 0, 1 };
		CHECK(ctx, parseCoverageTable(zst::byte_span(truncated.data(), truncated.size())).is_err());

		auto backwards = std::vector<uint8_t> { 0, 2, 0, 1, 0, 9, 0, 3, 0, 0 };
		CHECK(ctx, parseCoverageTable(zst::byte_span(backwards.data(), backwards.size())).is_err());

		auto empty = std::vector<uint8_t> {};
		CHECK(ctx, parseCoverageTable(zst::byte_span(empty.data(), empty.size())).is_err());
	}

	static void splitting(Context& ctx)
	{
		auto original = glyphs({ 1, 2, 3, 4, 5, 20, 22, 30, 31, 32, 33, 34, 35, 36, 37, 38, 39, 40 });

		ObjectStore store {};
		auto cov = store.intern(buildCoverageTable(original));
		auto graph = Graph(std::move(store), cov);

		auto splitter = CoverageSplitter();
		CHECK_EQ(ctx, splitter.entryCount(graph, cov), original.size());
		CHECK(ctx, not splitter.entryForLink(graph, cov, 0).has_value());

		auto ranges = std::vector<EntryRange> {
			{ .begin = 0, .end = 4 },
			{ .begin = 4, .end = 10 },
			{ .begin = 10, .end = original.size() },
		};

		auto shards = splitter.split(graph, cov, ranges);
		if(not CHECK(ctx, shards.ok()) || not CHECK_EQ(ctx, shards->size(), size_t(3)))
			return;

		std::vector<GlyphId> all {};
		for(size_t i = 0; i < shards->size(); i++)
		{
			auto part = parseCoverageTable(graph.object((*shards)[i]).span());
			if(not CHECK(ctx, part.ok()))
				continue;

			CHECK_EQ(ctx, part->size(), ranges[i].size());

			// each shard's glyphs come strictly after the previous shard's
			if(not all.empty() && not part->empty())
				CHECK(ctx, all.back() < part->front());

			all.insert(all.end(), part->begin(), part->end());
		}

		CHECK(ctx, all == original);

		// the original is left alone
		CHECK(ctx, *parseCoverageTable(graph.object(cov).span()) == original);

		auto overlapping = std::vector<EntryRange> { { .begin = 0, .end = 5 }, { .begin = 4, .end = 8 } };
		CHECK(ctx, splitter.split(graph, cov, overlapping).is_err());

		auto too_far = std::vector<EntryRange> { { .begin = 0, .end = original.size() + 1 } };
		CHECK(ctx, splitter.split(graph, cov, too_far).is_err());
	}

	void test_coverage(Context& ctx)
	{
		formats(ctx);
		malformed(ctx);
		splitting(ctx);
	}
}
