// test-layout-tables.cpp
// Copyright (c) 2024, yuki
// SPDX-License-Identifier: Apache-2.0

#include "tester.h"

#include "font/coverage.h"
#include "font/class_def.h"
#include "font/layout_tables.h"

#include "graph/graph.h"
#include "graph/pack.h"

namespace test
{
	using namespace otpack::graph;
	using namespace otpack::font::off;

	static Adapters layout_adapters()
	{
		Adapters adapters {};
		registerLayoutAdapters(adapters);
		return adapters;
	}

	static void lookup_fields(Context& ctx)
	{
		ObjectStore store {};
		auto a = leaf(store, 4, 0x01);
		auto b = leaf(store, 4, 0x02);

		auto obj = buildLookup(LookupTable {
		    .kind = kind::GPOS_LOOKUP,
		    .type = 4,
		    .flags = 0x0008,
		    .subtables = { a, b },
		    .mark_filtering_set = 3,
		});

		CHECK_EQ(ctx, obj.bytes, (std::vector<uint8_t> { 0, 4, 0, 0x18, 0, 2, 0, 0, 0, 0, 0, 3 }));
		CHECK(ctx, obj.linkAt(6) != nullptr && obj.linkAt(6)->promotable);

		auto parsed = parseLookup(obj);
		if(CHECK(ctx, parsed.ok()))
		{
			CHECK_EQ(ctx, parsed->type, uint16_t(4));
			CHECK_EQ(ctx, parsed->flags, uint16_t(0x0008));
			CHECK_EQ(ctx, parsed->subtables, (std::vector<ObjectId> { a, b }));
			CHECK(ctx, parsed->mark_filtering_set == std::optional<uint16_t>(3));
		}

		CHECK(ctx, parseLookup(ObjectBuilder(kind::EXTENSION).zeros(8).finish()).is_err());
	}

	/*
	    root -> lookup -> 3 subtables of 40k each. The last subtable is out of reach, and the
	    lookup as a whole is too big to ever fit, so it gets turned into an extension lookup.
	*/
	static Graph big_gsub_lookup()
	{
		ObjectStore store {};

		std::vector<ObjectId> subtables {};
		for(uint8_t i = 1; i <= 3; i++)
			subtables.push_back(leaf(store, 40000, i));

		auto lookup = store.intern(buildLookup(LookupTable {
		    .kind = kind::GSUB_LOOKUP,
		    .type = 1,
		    .flags = 0,
		    .subtables = subtables,
		}));

		auto root = store.intern(ObjectBuilder().offset16(lookup).finish());
		return Graph(std::move(store), root);
	}

	static void lookups_are_promoted(Context& ctx)
	{
		auto adapters = layout_adapters();

		auto eager = pack(big_gsub_lookup(), PackOptions {}, adapters);
		if(not CHECK(ctx, eager.ok()))
		{
			zpr::fprintln(stderr, "{}", eager.error());
			return;
		}

		auto& out = *eager;
		CHECK_EQ(ctx, out.size(), size_t(2 + 12 + 3 * 8 + 3 * 40000));

		// the lookup: extension type, 3 subtables, first extension right after it
		CHECK_EQ(ctx, read_u16(out, 2), GSUB_EXTENSION_LOOKUP);
		CHECK_EQ(ctx, read_u16(out, 6), uint16_t(3));
		CHECK_EQ(ctx, read_u16(out, 8), uint16_t(12));

		// the first extension: format 1, wrapping a type 1 subtable that sits right after the extensions
		CHECK_EQ(ctx, read_u16(out, 14), uint16_t(1));
		CHECK_EQ(ctx, read_u16(out, 16), uint16_t(1));
		CHECK_EQ(ctx, read_u32(out, 18), uint32_t(24));
		CHECK_EQ(ctx, out.data()[38], uint8_t(1));

		// promoting only once an overflow shows up ends up in the same place
		auto lazy = pack(big_gsub_lookup(), PackOptions { .promote_eagerly = false }, adapters);
		CHECK(ctx, lazy.ok() && *lazy == out);

		// but without the adapters, nothing can be done
		auto without = pack(big_gsub_lookup());
		CHECK(ctx, without.is_err() && without.error().kind == PackError::Kind::OverflowUnresolved);
	}

	/*
	    A GPOS pair adjustment subtable with 100 pair sets of 1000 bytes each. Even behind an
	    extension, the later pair sets are too far away, so the subtable is split in half (with
	    its coverage), and the second half gets an extension of its own.
	*/
	static Graph big_pair_pos(ObjectId* pair_pos)
	{
		ObjectStore store {};

		std::vector<GlyphId> covered {};
		std::vector<ObjectId> pair_sets {};
		for(uint16_t i = 0; i < 100; i++)
		{
			covered.push_back(GlyphId(10u + i));
			pair_sets.push_back(store.intern(ObjectBuilder().u16(i).fill(static_cast<uint8_t>(i), 998).finish()));
		}

		auto coverage = store.intern(buildCoverageTable(covered));
		auto subtable = store.intern(buildPairPosFormat1(PairPosFormat1 {
		    .coverage = coverage,
		    .value_format1 = 4,
		    .value_format2 = 0,
		    .pair_sets = pair_sets,
		}));

		auto lookup = store.intern(buildLookup(LookupTable {
		    .kind = kind::GPOS_LOOKUP,
		    .type = 2,
		    .flags = 0,
		    .subtables = { subtable },
		}));

		*pair_pos = subtable;

		auto root = store.intern(ObjectBuilder().offset16(lookup).finish());
		return Graph(std::move(store), root);
	}

	static void pair_pos_is_split(Context& ctx)
	{
		auto adapters = layout_adapters();

		ObjectId pair_pos {};
		auto graph = big_pair_pos(&pair_pos);

		auto splitter = adapters.splitter(kind::PAIR_POS_1);
		if(not CHECK(ctx, splitter != nullptr))
			return;

		CHECK_EQ(ctx, splitter->entryCount(graph, pair_pos), size_t(100));
		CHECK_EQ(ctx, splitter->entryForLink(graph, pair_pos, 10 + 2 * 70).value_or(0), size_t(70));
		CHECK(ctx, not splitter->entryForLink(graph, pair_pos, 2).has_value());

		auto result = pack(std::move(graph), PackOptions {}, adapters);
		if(not CHECK(ctx, result.ok()))
		{
			zpr::fprintln(stderr, "{}", result.error());
			return;
		}

		auto& out = *result;

		// root, lookup (2 subtables), 2 extensions, then per half: subtable, coverage, 50 pair sets
		CHECK_EQ(ctx, out.size(), size_t(2 + 10 + 2 * 8 + 2 * (110 + 10) + 100 * 1000));
		CHECK_EQ(ctx, read_u16(out, 2), GPOS_EXTENSION_LOOKUP);
		CHECK_EQ(ctx, read_u16(out, 6), uint16_t(2));

		// both extensions wrap pair adjustment (type 2)
		CHECK_EQ(ctx, read_u16(out, 12 + 2), uint16_t(2));
		CHECK_EQ(ctx, read_u16(out, 20 + 2), uint16_t(2));

		// first half: starts right after the extensions, with 50 pair sets, starting at glyph 10
		auto first = size_t(12 + 16);
		CHECK_EQ(ctx, read_u32(out, 12 + 4), uint32_t(first - 12));
		CHECK_EQ(ctx, read_u16(out, first), uint16_t(1));
		CHECK_EQ(ctx, read_u16(out, first + 8), uint16_t(50));

		auto coverage = first + read_u16(out, first + 2);
		CHECK_EQ(ctx, read_u16(out, coverage + 4), uint16_t(10));
		CHECK_EQ(ctx, read_u16(out, coverage + 6), uint16_t(59));

		// the second half follows the first, and covers glyphs 60 to 109
		auto second = 20 + read_u32(out, 20 + 4);
		CHECK_EQ(ctx, second, first + 110 + 10 + 50 * 1000);
		CHECK_EQ(ctx, read_u16(out, second + 8), uint16_t(50));

		auto coverage2 = second + read_u16(out, second + 2);
		CHECK_EQ(ctx, read_u16(out, coverage2 + 4), uint16_t(60));
		CHECK_EQ(ctx, read_u16(out, coverage2 + 6), uint16_t(109));

		// and its first pair set is number 50
		CHECK_EQ(ctx, read_u16(out, second + read_u16(out, second + 10)), uint16_t(50));
	}

	static void class_defs(Context& ctx)
	{
		// one long run of the same class is shorter as a range
		std::map<GlyphId, uint16_t> run {};
		for(uint32_t g = 20; g < 30; g++)
			run[GlyphId(g)] = 1;

		auto f2 = buildClassDef(run);
		CHECK_EQ(ctx, f2.kind, kind::CLASS_DEF);
		CHECK_EQ(ctx, f2.bytes, (std::vector<uint8_t> { 0, 2, 0, 1, 0, 20, 0, 29, 0, 1 }));

		// different classes next to each other are shorter as an array
		auto f1 = buildClassDef({ { GlyphId(5), 1 }, { GlyphId(6), 2 }, { GlyphId(7), 3 } });
		CHECK_EQ(ctx, f1.bytes, (std::vector<uint8_t> { 0, 1, 0, 5, 0, 3, 0, 1, 0, 2, 0, 3 }));

		// class 0 is what you get for being left out, so it isn't written
		auto zero = buildClassDef({ { GlyphId(5), 0 }, { GlyphId(6), 2 } });
		CHECK_EQ(ctx, zero.bytes, (std::vector<uint8_t> { 0, 1, 0, 6, 0, 1, 0, 2 }));

		auto empty = buildClassDef({});
		CHECK_EQ(ctx, empty.bytes, (std::vector<uint8_t> { 0, 1, 0, 0, 0, 0 }));

		auto parsed = parseClassDef(f2.span());
		if(CHECK(ctx, parsed.ok()))
		{
			CHECK(ctx, *parsed == run);
			CHECK_EQ(ctx, classOf(*parsed, GlyphId(25)), uint16_t(1));
			CHECK_EQ(ctx, classOf(*parsed, GlyphId(30)), uint16_t(0));
		}

		auto parsed1 = parseClassDef(f1.span());
		CHECK(ctx, parsed1.ok() && parsed1->size() == 3 && classOf(*parsed1, GlyphId(7)) == 3);

		auto bad_format = std::vector<uint8_t> { 0, 3, 0, 0 };
		auto truncated = std::vector<uint8_t> { 0, 1, 0, 5, 0, 3, 0, 1 };
		auto backwards = std::vector<uint8_t> { 0, 2, 0, 1, 0, 9, 0, 8, 0, 1 };
		CHECK(ctx, parseClassDef(zst::byte_span(bad_format.data(), bad_format.size())).is_err());
		CHECK(ctx, parseClassDef(zst::byte_span(truncated.data(), truncated.size())).is_err());
		CHECK(ctx, parseClassDef(zst::byte_span(backwards.data(), backwards.size())).is_err());
	}

	/*
	    A PairPos format 2 subtable with 4 first classes and 2 second classes. Each pair has an
	    xAdvance with a device table (only set for the first second class), and an xPlacement for
	    the second glyph. Glyph 10 is in no first class, which means class 0.
	*/
	static void pair_pos_2_shards(Context& ctx)
	{
		ObjectStore store {};

		std::vector<ObjectId> devices {};
		for(uint8_t i = 0; i < 4; i++)
			devices.push_back(leaf(store, 6, static_cast<uint8_t>(0x10 + i)));

		auto coverage = store.intern(buildCoverageTable({ GlyphId(10), GlyphId(11), GlyphId(12), GlyphId(13), GlyphId(14) }));
		auto class_def1 = store.intern(buildClassDef({
		    { GlyphId(11), 1 },
		    { GlyphId(12), 2 },
		    { GlyphId(13), 3 },
		    { GlyphId(14), 1 },
		}));
		auto class_def2 = store.intern(buildClassDef({ { GlyphId(20), 1 } }));

		ObjectBuilder builder { kind::PAIR_POS_2 };
		builder.u16(2).offset16(coverage).u16(0x0044).u16(0x0001).offset16(class_def1).offset16(class_def2).u16(4).u16(2);

		for(uint16_t c1 = 0; c1 < 4; c1++)
		{
			for(uint16_t c2 = 0; c2 < 2; c2++)
			{
				builder.u16(static_cast<uint16_t>(10 * c1 + c2));
				builder.offset16(c2 == 0 ? std::optional<ObjectId>(devices[c1]) : std::nullopt);
				builder.u16(static_cast<uint16_t>(100 + c1));
			}
		}

		auto subtable = store.intern(builder.finish());
		auto lookup = store.intern(buildLookup(LookupTable {
		    .kind = kind::GPOS_LOOKUP,
		    .type = 2,
		    .flags = 0,
		    .subtables = { subtable },
		}));

		auto graph = Graph(std::move(store), lookup);

		auto parsed = parsePairPosFormat2(graph.object(subtable));
		if(not CHECK(ctx, parsed.ok()))
			return;

		CHECK_EQ(ctx, parsed->class1RecordSize(), size_t(12));
		CHECK_EQ(ctx, valueRecordSize(0x00F0), size_t(8));

		auto adapters = layout_adapters();
		auto splitter = adapters.splitter(kind::PAIR_POS_2);
		if(not CHECK(ctx, splitter != nullptr))
			return;

		CHECK_EQ(ctx, splitter->entryCount(graph, subtable), size_t(4));
		CHECK_EQ(ctx, splitter->entryForLink(graph, subtable, 16 + 12 * 3 + 2).value_or(0), size_t(3));
		CHECK(ctx, not splitter->entryForLink(graph, subtable, 8).has_value());

		CHECK(ctx, splitter->split(graph, subtable, { EntryRange { .begin = 0, .end = 5 } }).is_err());

		auto shards = splitter->split(graph, subtable,
		    { EntryRange { .begin = 0, .end = 2 }, EntryRange { .begin = 2, .end = 4 } });
		if(not CHECK(ctx, shards.ok() && shards->size() == 2))
			return;

		auto first = parsePairPosFormat2(graph.object((*shards)[0]));
		auto second = parsePairPosFormat2(graph.object((*shards)[1]));
		if(not CHECK(ctx, first.ok() && second.ok()))
			return;

		CHECK_EQ(ctx, first->class1_count, uint16_t(2));
		CHECK_EQ(ctx, first->class2_count, uint16_t(2));
		CHECK_EQ(ctx, first->value_format1, uint16_t(0x0044));
		CHECK_EQ(ctx, first->value_format2, uint16_t(0x0001));
		CHECK_EQ(ctx, second->class1_count, uint16_t(2));

		// the second shard has a copy of the second ClassDef, not the same one
		CHECK_EQ(ctx, first->class_def2, class_def2);
		CHECK(ctx, second->class_def2 != class_def2);
		CHECK(ctx, graph.object(second->class_def2) == graph.object(class_def2));

		// class 0 goes with the first shard
		auto cov1 = parseCoverageTable(graph.object(first->coverage).span());
		CHECK(ctx, cov1.ok() && *cov1 == (std::vector<GlyphId> { GlyphId(10), GlyphId(11), GlyphId(14) }));

		auto classes1 = parseClassDef(graph.object(first->class_def1).span());
		CHECK(ctx, classes1.ok() && *classes1 == (std::map<GlyphId, uint16_t> { { GlyphId(11), 1 }, { GlyphId(14), 1 } }));

		// and the second shard's classes start again from 0
		auto cov2 = parseCoverageTable(graph.object(second->coverage).span());
		CHECK(ctx, cov2.ok() && *cov2 == (std::vector<GlyphId> { GlyphId(12), GlyphId(13) }));

		auto classes2 = parseClassDef(graph.object(second->class_def1).span());
		CHECK(ctx, classes2.ok() && *classes2 == (std::map<GlyphId, uint16_t> { { GlyphId(13), 1 } }));

		// the records come along with their device offsets; null ones stay null
		auto& obj1 = graph.object((*shards)[0]);
		CHECK_EQ(ctx, obj1.size(), size_t(16 + 2 * 12));
		CHECK(ctx, obj1.linkAt(18) != nullptr && obj1.linkAt(18)->target == devices[0]);
		CHECK(ctx, obj1.linkAt(24) == nullptr);
		CHECK(ctx, obj1.linkAt(30) != nullptr && obj1.linkAt(30)->target == devices[1]);
		CHECK_EQ(ctx, obj1.bytes[16 + 12 + 1], uint8_t(10));

		auto& obj2 = graph.object((*shards)[1]);
		CHECK(ctx, obj2.linkAt(18) != nullptr && obj2.linkAt(18)->target == devices[2]);
		CHECK(ctx, obj2.linkAt(30) != nullptr && obj2.linkAt(30)->target == devices[3]);
		CHECK_EQ(ctx, obj2.bytes[16 + 1], uint8_t(20));
		CHECK_EQ(ctx, obj2.bytes[16 + 6 + 1], uint8_t(21));
		CHECK_EQ(ctx, obj2.bytes[16 + 4 + 1], uint8_t(102));
	}

	/*
	    The class-based version of `big_pair_pos`: 100 glyphs, each in its own first class, and
	    a pair value with a 1000-byte device table for each class.
	*/
	static Graph big_pair_pos_2()
	{
		ObjectStore store {};

		std::vector<GlyphId> covered {};
		std::map<GlyphId, uint16_t> classes {};
		std::vector<ObjectId> devices {};
		for(uint16_t i = 0; i < 100; i++)
		{
			covered.push_back(GlyphId(10u + i));
			classes[GlyphId(10u + i)] = i;
			devices.push_back(store.intern(ObjectBuilder().u16(i).fill(static_cast<uint8_t>(i), 998).finish()));
		}

		auto coverage = store.intern(buildCoverageTable(covered));
		auto class_def1 = store.intern(buildClassDef(classes));
		auto class_def2 = store.intern(buildClassDef({}));

		ObjectBuilder builder { kind::PAIR_POS_2 };
		builder.u16(2).offset16(coverage).u16(0x0044).u16(0).offset16(class_def1).offset16(class_def2).u16(100).u16(1);
		for(uint16_t i = 0; i < 100; i++)
			builder.u16(i).offset16(devices[i]);

		auto subtable = store.intern(builder.finish());
		auto lookup = store.intern(buildLookup(LookupTable {
		    .kind = kind::GPOS_LOOKUP,
		    .type = 2,
		    .flags = 0,
		    .subtables = { subtable },
		}));

		auto root = store.intern(ObjectBuilder().offset16(lookup).finish());
		return Graph(std::move(store), root);
	}

	static void pair_pos_2_is_split(Context& ctx)
	{
		auto result = pack(big_pair_pos_2(), PackOptions {}, layout_adapters());
		if(not CHECK(ctx, result.ok()))
		{
			zpr::fprintln(stderr, "{}", result.error());
			return;
		}

		auto& out = *result;
		auto lookup = size_t(read_u16(out, 0));
		CHECK_EQ(ctx, read_u16(out, lookup), GPOS_EXTENSION_LOOKUP);

		auto count = read_u16(out, lookup + 4);
		CHECK(ctx, count >= 2);

		// between them, the shards have every class in order, and each record still reaches its
		// own device table (which starts with the class number, like the xAdvance does).
		size_t next_class = 0;
		size_t bad_records = 0;
		for(size_t i = 0; i < count; i++)
		{
			auto ext = lookup + read_u16(out, lookup + 6 + 2 * i);
			CHECK_EQ(ctx, read_u16(out, ext + 2), uint16_t(2));

			auto sub = ext + read_u32(out, ext + 4);
			CHECK_EQ(ctx, read_u16(out, sub), uint16_t(2));

			auto coverage = sub + read_u16(out, sub + 2);
			CHECK_EQ(ctx, read_u16(out, coverage + 4), static_cast<uint16_t>(10 + next_class));

			auto class1_count = read_u16(out, sub + 12);
			for(size_t k = 0; k < class1_count; k++, next_class++)
			{
				auto rec = sub + 16 + 4 * k;
				auto device = sub + read_u16(out, rec + 2);
				if(read_u16(out, rec) != next_class || read_u16(out, device) != next_class)
					bad_records++;
			}
		}

		CHECK_EQ(ctx, next_class, size_t(100));
		CHECK_EQ(ctx, bad_records, size_t(0));
	}

	/*
	    MarkBasePos with 4 marks in 3 classes (glyphs 30-33, classes 0, 1, 2, 1) and 2 bases,
	    each with a row of 3 anchors (some null).
	*/
	static void mark_base_shards(Context& ctx)
	{
		ObjectStore store {};

		std::vector<ObjectId> mark_anchors {};
		for(uint8_t i = 0; i < 4; i++)
			mark_anchors.push_back(leaf(store, 6, static_cast<uint8_t>(0x20 + i)));

		auto b00 = leaf(store, 6, 0x30);
		auto b01 = leaf(store, 6, 0x31);
		auto b10 = leaf(store, 6, 0x32);
		auto b12 = leaf(store, 6, 0x33);

		auto mark_coverage = store.intern(buildCoverageTable({ GlyphId(30), GlyphId(31), GlyphId(32), GlyphId(33) }));
		auto base_coverage = store.intern(buildCoverageTable({ GlyphId(40), GlyphId(41) }));

		auto mark_array = store.intern(buildMarkArray(MarkArray {
		    .records = {
		        { .mark_class = 0, .anchor = mark_anchors[0] },
		        { .mark_class = 1, .anchor = mark_anchors[1] },
		        { .mark_class = 2, .anchor = mark_anchors[2] },
		        { .mark_class = 1, .anchor = mark_anchors[3] },
		    },
		}));

		auto base_array = store.intern(buildBaseArray(BaseArray {
		    .mark_class_count = 3,
		    .anchors = { b00, b01, std::nullopt, b10, std::nullopt, b12 },
		}));

		auto subtable = store.intern(buildMarkBasePos(MarkBasePosFormat1 {
		    .mark_coverage = mark_coverage,
		    .base_coverage = base_coverage,
		    .mark_class_count = 3,
		    .mark_array = mark_array,
		    .base_array = base_array,
		}));

		auto lookup = store.intern(buildLookup(LookupTable {
		    .kind = kind::GPOS_LOOKUP,
		    .type = 4,
		    .flags = 0,
		    .subtables = { subtable },
		}));

		auto graph = Graph(std::move(store), lookup);

		auto parsed_bases = parseBaseArray(graph.object(base_array), 3);
		if(CHECK(ctx, parsed_bases.ok()))
		{
			CHECK_EQ(ctx, parsed_bases->baseCount(), size_t(2));
			CHECK(ctx, not parsed_bases->anchors[2].has_value());
			CHECK(ctx, parsed_bases->anchors[5] == std::optional<ObjectId>(b12));
		}

		auto adapters = layout_adapters();
		auto splitter = adapters.splitter(kind::MARK_BASE_POS);
		if(not CHECK(ctx, splitter != nullptr))
			return;

		CHECK_EQ(ctx, splitter->entryCount(graph, subtable), size_t(3));
		CHECK(ctx, not splitter->entryForLink(graph, subtable, 8).has_value());

		auto shards = splitter->split(graph, subtable,
		    { EntryRange { .begin = 0, .end = 1 }, EntryRange { .begin = 1, .end = 3 } });
		if(not CHECK(ctx, shards.ok() && shards->size() == 2))
			return;

		auto first = parseMarkBasePos(graph.object((*shards)[0]));
		auto second = parseMarkBasePos(graph.object((*shards)[1]));
		if(not CHECK(ctx, first.ok() && second.ok()))
			return;

		CHECK_EQ(ctx, first->mark_class_count, uint16_t(1));
		CHECK_EQ(ctx, second->mark_class_count, uint16_t(2));
		CHECK_EQ(ctx, first->base_coverage, base_coverage);
		CHECK(ctx, second->base_coverage != base_coverage);
		CHECK(ctx, graph.object(second->base_coverage) == graph.object(base_coverage));

		// the first shard: just mark 30, and the first column of each base
		auto marks1 = parseCoverageTable(graph.object(first->mark_coverage).span());
		CHECK(ctx, marks1.ok() && *marks1 == (std::vector<GlyphId> { GlyphId(30) }));

		auto records1 = parseMarkArray(graph.object(first->mark_array));
		if(CHECK(ctx, records1.ok() && records1->records.size() == 1))
		{
			CHECK_EQ(ctx, records1->records[0].mark_class, uint16_t(0));
			CHECK_EQ(ctx, records1->records[0].anchor, mark_anchors[0]);
		}

		auto bases1 = parseBaseArray(graph.object(first->base_array), 1);
		CHECK(ctx, bases1.ok() && bases1->anchors == (std::vector<std::optional<ObjectId>> { b00, b10 }));

		// the second shard: the other three marks, renumbered, and the other two columns
		auto marks2 = parseCoverageTable(graph.object(second->mark_coverage).span());
		CHECK(ctx, marks2.ok() && *marks2 == (std::vector<GlyphId> { GlyphId(31), GlyphId(32), GlyphId(33) }));

		auto records2 = parseMarkArray(graph.object(second->mark_array));
		if(CHECK(ctx, records2.ok() && records2->records.size() == 3))
		{
			CHECK_EQ(ctx, records2->records[0].mark_class, uint16_t(0));
			CHECK_EQ(ctx, records2->records[1].mark_class, uint16_t(1));
			CHECK_EQ(ctx, records2->records[2].mark_class, uint16_t(0));
			CHECK_EQ(ctx, records2->records[2].anchor, mark_anchors[3]);
		}

		auto bases2 = parseBaseArray(graph.object(second->base_array), 2);
		CHECK(ctx, bases2.ok()
		               && bases2->anchors == (std::vector<std::optional<ObjectId>> { b01, std::nullopt, std::nullopt, b12 }));

		// a mark array that doesn't match its coverage can't be split
		auto bad = graph.addObject(buildMarkBasePos(MarkBasePosFormat1 {
		    .mark_coverage = base_coverage,
		    .base_coverage = base_coverage,
		    .mark_class_count = 3,
		    .mark_array = mark_array,
		    .base_array = base_array,
		}));

		auto failed = splitter->split(graph, bad, { EntryRange { .begin = 0, .end = 1 }, EntryRange { .begin = 1, .end = 3 } });
		CHECK(ctx, failed.is_err() && failed.error().kind == PackError::Kind::InvalidGraph);
	}

	void test_layout_tables(Context& ctx)
	{
		lookup_fields(ctx);
		lookups_are_promoted(ctx);
		pair_pos_is_split(ctx);
		class_defs(ctx);
		pair_pos_2_shards(ctx);
		pair_pos_2_is_split(ctx);
		mark_base_shards(ctx);
	}
}
