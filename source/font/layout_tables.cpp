// layout_tables.cpp
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#include "util.h"
#include "error.h"

#include "font/misc.h"
#include "font/coverage.h"
#include "font/class_def.h"
#include "font/layout_tables.h"

#include "graph/graph.h"
#include "graph/builder.h"

namespace otpack::font::off
{
	using graph::Graph;
	using graph::Object;
	using graph::ObjectId;
	using graph::PackError;
	using graph::PackResult;

	uint16_t extensionLookupType(graph::ObjectKind lookup_kind)
	{
		return lookup_kind == kind::GPOS_LOOKUP ? GPOS_EXTENSION_LOOKUP : GSUB_EXTENSION_LOOKUP;
	}

	static bool is_lookup(graph::ObjectKind k)
	{
		return util::is_one_of(k, kind::GSUB_LOOKUP, kind::GPOS_LOOKUP);
	}

	Object buildLookup(const LookupTable& lookup)
	{
		graph::ObjectBuilder builder { lookup.kind };

		auto flags = lookup.flags;
		if(lookup.mark_filtering_set.has_value())
			flags |= LOOKUP_FLAG_USE_MARK_FILTERING_SET;

		builder.u16(lookup.type).u16(flags).u16(static_cast<uint16_t>(lookup.subtables.size()));
		for(auto sub : lookup.subtables)
			builder.offset16(sub, { .promotable = lookup.promotable });

		if(lookup.mark_filtering_set.has_value())
			builder.u16(*lookup.mark_filtering_set);

		return builder.finish();
	}

	Object buildExtension(const ExtensionSubtable& ext)
	{
		return graph::ObjectBuilder(kind::EXTENSION) //
		    .u16(1)
		    .u16(ext.lookup_type)
		    .offset32(ext.subtable)
		    .finish();
	}

	Object buildPairPosFormat1(const PairPosFormat1& subtable)
	{
		graph::ObjectBuilder builder { kind::PAIR_POS_1 };
		builder.u16(1)
		    .offset16(subtable.coverage)
		    .u16(subtable.value_format1)
		    .u16(subtable.value_format2)
		    .u16(static_cast<uint16_t>(subtable.pair_sets.size()));

		for(auto ps : subtable.pair_sets)
			builder.offset16(ps);

		return builder.finish();
	}

	// the target of the offset field at `position`, which must be there.
	static PackResult<ObjectId> link_target(const Object& obj, uint32_t position, const char* what)
	{
		auto link = obj.linkAt(position);
		if(link == nullptr)
			return Err(PackError::invalid(zpr::sprint("missing {} offset at +{}", what, position)));

		return Ok(link->target);
	}

	PackResult<LookupTable> parseLookup(const Object& obj)
	{
		if(not is_lookup(obj.kind))
			return Err(PackError::invalid(zpr::sprint("object of kind {} is not a lookup", static_cast<uint16_t>(obj.kind))));

		auto buf = obj.span();
		if(buf.size() < 6)
			return Err(PackError::invalid(zpr::sprint("lookup too short ({} bytes)", buf.size())));

		LookupTable lookup {};
		lookup.kind = obj.kind;
		lookup.type = consume_u16(buf);
		lookup.flags = consume_u16(buf);

		auto count = consume_u16(buf);
		bool has_mfs = (lookup.flags & LOOKUP_FLAG_USE_MARK_FILTERING_SET);

		if(buf.size() < count * 2u + (has_mfs ? 2 : 0))
			return Err(PackError::invalid(zpr::sprint("lookup with {} subtables is truncated", count)));

		lookup.promotable = false;
		for(uint32_t i = 0; i < count; i++)
		{
			auto pos = 6 + 2 * i;
			lookup.subtables.push_back(TRY(link_target(obj, pos, "subtable")));
			lookup.promotable |= obj.linkAt(pos)->promotable;
		}

		buf.remove_prefix(count * 2u);
		if(has_mfs)
		{
			lookup.mark_filtering_set = consume_u16(buf);
			lookup.flags &= static_cast<uint16_t>(~LOOKUP_FLAG_USE_MARK_FILTERING_SET);
		}

		return Ok(std::move(lookup));
	}

	PackResult<ExtensionSubtable> parseExtension(const Object& obj)
	{
		auto buf = obj.span();
		if(obj.kind != kind::EXTENSION || buf.size() < 8 || peek_u16(buf) != 1)
			return Err(PackError::invalid("malformed extension subtable"));

		buf.remove_prefix(2);
		auto type = consume_u16(buf);
		auto target = TRY(link_target(obj, 4, "extension"));

		return Ok(ExtensionSubtable { .lookup_type = type, .subtable = target });
	}

	PackResult<PairPosFormat1> parsePairPosFormat1(const Object& obj)
	{
		auto buf = obj.span();
		if(obj.kind != kind::PAIR_POS_1 || buf.size() < 10 || peek_u16(buf) != 1)
			return Err(PackError::invalid("malformed PairPos format 1 subtable"));

		PairPosFormat1 ret {};
		ret.coverage = TRY(link_target(obj, 2, "coverage"));

		buf.remove_prefix(4);
		ret.value_format1 = consume_u16(buf);
		ret.value_format2 = consume_u16(buf);

		auto count = consume_u16(buf);
		if(buf.size() < count * 2u)
			return Err(PackError::invalid(zpr::sprint("PairPos with {} pair sets is truncated", count)));

		for(uint32_t i = 0; i < count; i++)
			ret.pair_sets.push_back(TRY(link_target(obj, 10 + 2 * i, "pair set")));

		return Ok(std::move(ret));
	}

	size_t valueRecordSize(uint16_t value_format)
	{
		// the low 8 bits each stand for one 16-bit field (4 values, then 4 device offsets)
		return 2 * static_cast<size_t>(std::popcount(static_cast<uint16_t>(value_format & 0xFF)));
	}

	size_t PairPosFormat2::class1RecordSize() const
	{
		return this->class2_count * (valueRecordSize(this->value_format1) + valueRecordSize(this->value_format2));
	}

	PackResult<PairPosFormat2> parsePairPosFormat2(const Object& obj)
	{
		auto buf = obj.span();
		if(obj.kind != kind::PAIR_POS_2 || buf.size() < 16 || peek_u16(buf) != 2)
			return Err(PackError::invalid("malformed PairPos format 2 subtable"));

		PairPosFormat2 ret {};
		ret.coverage = TRY(link_target(obj, 2, "coverage"));
		ret.class_def1 = TRY(link_target(obj, 8, "class def 1"));
		ret.class_def2 = TRY(link_target(obj, 10, "class def 2"));

		buf.remove_prefix(4);
		ret.value_format1 = consume_u16(buf);
		ret.value_format2 = consume_u16(buf);

		buf.remove_prefix(4);
		ret.class1_count = consume_u16(buf);
		ret.class2_count = consume_u16(buf);

		if(buf.size() < ret.class1_count * ret.class1RecordSize())
		{
			return Err(PackError::invalid(zpr::sprint("PairPos with {}x{} class records is truncated",
			    ret.class1_count, ret.class2_count)));
		}

		return Ok(std::move(ret));
	}

	Object buildMarkBasePos(const MarkBasePosFormat1& subtable)
	{
		return graph::ObjectBuilder(kind::MARK_BASE_POS)
		    .u16(1)
		    .offset16(subtable.mark_coverage)
		    .offset16(subtable.base_coverage)
		    .u16(subtable.mark_class_count)
		    .offset16(subtable.mark_array)
		    .offset16(subtable.base_array)
		    .finish();
	}

	Object buildMarkArray(const MarkArray& array)
	{
		graph::ObjectBuilder builder { kind::MARK_ARRAY };
		builder.u16(static_cast<uint16_t>(array.records.size()));

		for(auto& rec : array.records)
			builder.u16(rec.mark_class).offset16(rec.anchor);

		return builder.finish();
	}

	Object buildBaseArray(const BaseArray& array)
	{
		graph::ObjectBuilder builder { kind::BASE_ARRAY };
		builder.u16(static_cast<uint16_t>(array.baseCount()));

		for(auto& anchor : array.anchors)
			builder.offset16(anchor);

		return builder.finish();
	}

	PackResult<MarkBasePosFormat1> parseMarkBasePos(const Object& obj)
	{
		auto buf = obj.span();
		if(obj.kind != kind::MARK_BASE_POS || buf.size() < 12 || peek_u16(buf) != 1)
			return Err(PackError::invalid("malformed MarkBasePos format 1 subtable"));

		MarkBasePosFormat1 ret {};
		ret.mark_coverage = TRY(link_target(obj, 2, "mark coverage"));
		ret.base_coverage = TRY(link_target(obj, 4, "base coverage"));
		ret.mark_class_count = peek_u16(buf.drop(6));
		ret.mark_array = TRY(link_target(obj, 8, "mark array"));
		ret.base_array = TRY(link_target(obj, 10, "base array"));

		return Ok(std::move(ret));
	}

	PackResult<MarkArray> parseMarkArray(const Object& obj)
	{
		auto buf = obj.span();
		if(buf.size() < 2)
			return Err(PackError::invalid("mark array too short"));

		auto count = consume_u16(buf);
		if(buf.size() < count * 4u)
			return Err(PackError::invalid(zpr::sprint("mark array with {} records is truncated", count)));

		MarkArray ret {};
		for(uint32_t i = 0; i < count; i++)
		{
			auto cls = consume_u16(buf);
			buf.remove_prefix(2);

			auto anchor = TRY(link_target(obj, 4 + 4 * i, "mark anchor"));
			ret.records.push_back(MarkRecord { .mark_class = cls, .anchor = anchor });
		}

		return Ok(std::move(ret));
	}

	PackResult<BaseArray> parseBaseArray(const Object& obj, uint16_t mark_class_count)
	{
		auto buf = obj.span();
		if(buf.size() < 2)
			return Err(PackError::invalid("base array too short"));

		auto count = consume_u16(buf);
		if(buf.size() < count * mark_class_count * 2u)
			return Err(PackError::invalid(zpr::sprint("base array with {} records is truncated", count)));

		BaseArray ret {};
		ret.mark_class_count = mark_class_count;

		for(uint32_t i = 0; i < count * uint32_t(mark_class_count); i++)
		{
			if(auto link = obj.linkAt(2 + 2 * i); link != nullptr)
				ret.anchors.push_back(link->target);
			else
				ret.anchors.push_back(std::nullopt);
		}

		return Ok(std::move(ret));
	}




	namespace
	{
		// ranges have to be in order, non-empty, non-overlapping, and within the entry count.
		static PackResult<void> check_ranges(ObjectId id, const std::vector<graph::EntryRange>& ranges, size_t count)
		{
			size_t prev_end = 0;
			for(auto& r : ranges)
			{
				if(r.begin < prev_end || r.begin >= r.end || r.end > count)
				{
					return Err(PackError::invalid(zpr::sprint("{}: bad shard [{}, {}) of {} entries", id, r.begin,
					    r.end, count)));
				}

				prev_end = r.end;
			}

			return Ok();
		}

		// copies the 16-bit fields in [start, start + length) of `obj`, keeping the offsets among them.
		static void copy_fields(graph::ObjectBuilder& builder, const Object& obj, size_t start, size_t length)
		{
			auto bytes = obj.span().drop(start).take(length);
			for(size_t i = 0; i + 1 < length; i += 2)
			{
				auto link = obj.linkAt(static_cast<uint32_t>(start + i));
				if(link == nullptr)
				{
					builder.u16(peek_u16(bytes.drop(i)));
					continue;
				}

				builder.offset16(link->target, {
				    .nullable = link->nullable,
				    .promotable = link->promotable,
				    .whence = link->whence,
				    .space = link->space,
				});
			}
		}

		struct LookupPromoter : graph::Promoter
		{
			virtual PackResult<bool> promote(Graph& graph, ObjectId id) const override
			{
				auto lookup = TRY(parseLookup(graph.object(id)));

				auto ext_type = extensionLookupType(lookup.kind);
				if(not lookup.promotable || lookup.type == ext_type)
					return Ok(false);

				std::vector<ObjectId> extensions {};
				for(auto sub : lookup.subtables)
				{
					auto ext = buildExtension({ .lookup_type = lookup.type, .subtable = sub });
					extensions.push_back(graph.addObject(std::move(ext)));
				}

				lookup.type = ext_type;
				lookup.subtables = std::move(extensions);
				lookup.promotable = false;

				graph.replaceObject(id, buildLookup(lookup));
				return Ok(true);
			}
		};

		struct LookupSubtableContainer : graph::ShardContainer
		{
			virtual PackResult<void> insertShards(Graph& graph, ObjectId parent, ObjectId original,
			    const std::vector<ObjectId>& shards) const override
			{
				if(shards.empty())
					return Err(PackError::invalid(zpr::sprint("no shards for {}", original)));

				if(graph.object(parent).kind == kind::EXTENSION)
					return this->insert_behind_extension(graph, parent, original, shards);

				auto lookup = TRY(parseLookup(graph.object(parent)));
				TRY(replace_in_lookup(lookup, original, shards));

				graph.replaceObject(parent, buildLookup(lookup));
				return Ok();
			}

		private:
			static PackResult<void> replace_in_lookup(LookupTable& lookup, ObjectId original,
			    const std::vector<ObjectId>& replacements)
			{
				std::vector<ObjectId> subtables {};
				for(auto sub : lookup.subtables)
				{
					if(sub == original)
						subtables.insert(subtables.end(), replacements.begin(), replacements.end());
					else
						subtables.push_back(sub);
				}

				if(subtables.size() > 0xFFFF)
					return Err(PackError::invalid(zpr::sprint("lookup would have {} subtables", subtables.size())));

				lookup.subtables = std::move(subtables);
				return Ok();
			}

			/*
			    The first shard takes the place of the original under the existing extension; the
			    rest get extensions of their own, which go into every lookup that uses the existing
			    one, right after it.
			*/
			PackResult<void> insert_behind_extension(Graph& graph, ObjectId ext_id, ObjectId original,
			    const std::vector<ObjectId>& shards) const
			{
				auto ext = TRY(parseExtension(graph.object(ext_id)));
				if(ext.subtable != original)
					return Err(PackError::invalid(zpr::sprint("{} does not point at {}", ext_id, original)));

				graph.updateParents();

				std::vector<ObjectId> lookups {};
				for(auto& [p, _] : graph.vertex(ext_id).parents)
					lookups.push_back(p);

				if(lookups.empty())
					return Err(PackError::invalid(zpr::sprint("{} is not used by any lookup", ext_id)));

				graph.remapChild(ext_id, 4, shards[0]);

				std::vector<ObjectId> new_exts { ext_id };
				for(size_t i = 1; i < shards.size(); i++)
				{
					auto obj = buildExtension({ .lookup_type = ext.lookup_type, .subtable = shards[i] });
					new_exts.push_back(graph.addObject(std::move(obj)));
				}

				for(auto lookup_id : lookups)
				{
					auto lookup = TRY(parseLookup(graph.object(lookup_id)));
					TRY(replace_in_lookup(lookup, ext_id, new_exts));

					graph.replaceObject(lookup_id, buildLookup(lookup));
				}

				return Ok();
			}
		};

		struct PairPosSplitter : graph::Splitter
		{
			virtual size_t entryCount(const Graph& graph, ObjectId id) const override
			{
				if(auto pp = parsePairPosFormat1(graph.object(id)); pp.ok())
					return pp->pair_sets.size();

				return 0;
			}

			virtual std::optional<size_t> entryForLink(const Graph& graph, ObjectId id, uint32_t position) const override
			{
				if(position < 10 || (position - 10) % 2 != 0)
					return std::nullopt;

				auto idx = (position - 10) / 2;
				if(idx >= this->entryCount(graph, id))
					return std::nullopt;

				return idx;
			}

			// each shard gets the pair sets in its range, and a coverage for just those glyphs.
			virtual PackResult<std::vector<ObjectId>> split(Graph& graph, ObjectId id,
			    const std::vector<graph::EntryRange>& ranges) const override
			{
				auto pp = TRY(parsePairPosFormat1(graph.object(id)));

				auto num_glyphs = m_coverage.entryCount(graph, pp.coverage);
				if(num_glyphs != pp.pair_sets.size())
				{
					return Err(PackError::invalid(zpr::sprint("{}: {} pair sets but {} covered glyphs", id,
					    pp.pair_sets.size(), num_glyphs)));
				}

				auto coverages = TRY(m_coverage.split(graph, pp.coverage, ranges));

				std::vector<ObjectId> shards {};
				for(size_t i = 0; i < ranges.size(); i++)
				{
					auto& r = ranges[i];
					auto shard = PairPosFormat1 {
						.coverage = coverages[i],
						.value_format1 = pp.value_format1,
						.value_format2 = pp.value_format2,
						.pair_sets = std::vector<ObjectId>(pp.pair_sets.begin() + static_cast<ptrdiff_t>(r.begin),
						    pp.pair_sets.begin() + static_cast<ptrdiff_t>(r.end)),
					};

					shards.push_back(graph.addObject(buildPairPosFormat1(shard)));
				}

				return Ok(std::move(shards));
			}

		private:
			CoverageSplitter m_coverage {};
		};

		/*
		    PairPos format 2 is split by first class. Each shard keeps the class1 records in its
		    range (renumbered from 0), and covers only the glyphs whose first class is in the range.
		    The second ClassDef is the same for all of them; every shard after the first gets its
		    own copy, so that nothing ties the shards to one space.
		*/
		struct PairPos2Splitter : graph::Splitter
		{
			virtual size_t entryCount(const Graph& graph, ObjectId id) const override
			{
				if(auto pp = parsePairPosFormat2(graph.object(id)); pp.ok())
					return pp->class1_count;

				return 0;
			}

			virtual std::optional<size_t> entryForLink(const Graph& graph, ObjectId id, uint32_t position) const override
			{
				auto pp = parsePairPosFormat2(graph.object(id));
				if(pp.is_err() || position < 16)
					return std::nullopt;

				auto record_size = pp->class1RecordSize();
				if(record_size == 0)
					return std::nullopt;

				auto idx = (position - 16) / record_size;
				if(idx >= pp->class1_count)
					return std::nullopt;

				return idx;
			}

			virtual PackResult<std::vector<ObjectId>> split(Graph& graph, ObjectId id,
			    const std::vector<graph::EntryRange>& ranges) const override
			{
				// copied, since adding the shards can move the original around
				auto original = graph.object(id);
				auto pp = TRY(parsePairPosFormat2(original));
				TRY(check_ranges(id, ranges, pp.class1_count));

				auto glyphs = parseCoverageTable(graph.object(pp.coverage).span());
				if(glyphs.is_err())
					return Err(PackError::invalid(zpr::sprint("{}: {}", pp.coverage, glyphs.error())));

				auto classes = parseClassDef(graph.object(pp.class_def1).span());
				if(classes.is_err())
					return Err(PackError::invalid(zpr::sprint("{}: {}", pp.class_def1, classes.error())));

				auto record_size = pp.class1RecordSize();

				std::vector<ObjectId> shards {};
				for(size_t i = 0; i < ranges.size(); i++)
				{
					auto& r = ranges[i];

					std::vector<GlyphId> covered {};
					std::map<GlyphId, uint16_t> new_classes {};

					for(auto gid : *glyphs)
					{
						auto cls = classOf(*classes, gid);
						if(cls < r.begin || cls >= r.end)
							continue;

						covered.push_back(gid);
						new_classes[gid] = static_cast<uint16_t>(cls - r.begin);
					}

					auto coverage = graph.addObject(buildCoverageTable(std::move(covered)));
					auto class_def1 = graph.addObject(buildClassDef(new_classes));
					auto class_def2 = (i == 0) ? pp.class_def2 : graph.addObject(graph.object(pp.class_def2));

					graph::ObjectBuilder builder { kind::PAIR_POS_2 };
					builder.u16(2)
					    .offset16(coverage)
					    .u16(pp.value_format1)
					    .u16(pp.value_format2)
					    .offset16(class_def1)
					    .offset16(class_def2)
					    .u16(static_cast<uint16_t>(r.size()))
					    .u16(pp.class2_count);

					copy_fields(builder, original, 16 + r.begin * record_size, r.size() * record_size);
					shards.push_back(graph.addObject(builder.finish()));
				}

				return Ok(std::move(shards));
			}
		};

		/*
		    MarkBasePos format 1 is split by mark class. Each shard gets the marks of the classes
		    in its range (with a mark coverage and mark array of its own), and a base array that
		    keeps only those classes' columns. Like the second ClassDef above, the base coverage is
		    copied for every shard after the first.
		*/
		struct MarkBaseSplitter : graph::Splitter
		{
			virtual size_t entryCount(const Graph& graph, ObjectId id) const override
			{
				if(auto mb = parseMarkBasePos(graph.object(id)); mb.ok())
					return mb->mark_class_count;

				return 0;
			}

			// the subtable only points at whole tables, none of which belong to one class.
			virtual std::optional<size_t> entryForLink(const Graph& graph, ObjectId id, uint32_t position) const override
			{
				return std::nullopt;
			}

			virtual PackResult<std::vector<ObjectId>> split(Graph& graph, ObjectId id,
			    const std::vector<graph::EntryRange>& ranges) const override
			{
				auto mb = TRY(parseMarkBasePos(graph.object(id)));
				TRY(check_ranges(id, ranges, mb.mark_class_count));

				auto marks = parseCoverageTable(graph.object(mb.mark_coverage).span());
				if(marks.is_err())
					return Err(PackError::invalid(zpr::sprint("{}: {}", mb.mark_coverage, marks.error())));

				auto mark_array = TRY(parseMarkArray(graph.object(mb.mark_array)));
				auto base_array = TRY(parseBaseArray(graph.object(mb.base_array), mb.mark_class_count));

				if(marks->size() != mark_array.records.size())
				{
					return Err(PackError::invalid(zpr::sprint("{}: {} mark records but {} covered marks", id,
					    mark_array.records.size(), marks->size())));
				}

				// the new coverages are written sorted, so the mark records only line up if the old one was.
				if(not std::is_sorted(marks->begin(), marks->end()))
					return Err(PackError::invalid(zpr::sprint("{}: mark coverage is not sorted", mb.mark_coverage)));

				std::vector<ObjectId> shards {};
				for(size_t i = 0; i < ranges.size(); i++)
				{
					auto& r = ranges[i];

					std::vector<GlyphId> covered {};
					MarkArray new_marks {};

					for(size_t m = 0; m < mark_array.records.size(); m++)
					{
						auto& rec = mark_array.records[m];
						if(rec.mark_class < r.begin || rec.mark_class >= r.end)
							continue;

						covered.push_back((*marks)[m]);
						new_marks.records.push_back(MarkRecord {
						    .mark_class = static_cast<uint16_t>(rec.mark_class - r.begin),
						    .anchor = rec.anchor,
						});
					}

					BaseArray new_bases { .mark_class_count = static_cast<uint16_t>(r.size()) };
					for(size_t base = 0; base < base_array.baseCount(); base++)
					{
						auto row = base_array.anchors.begin() + static_cast<ptrdiff_t>(base * mb.mark_class_count);
						new_bases.anchors.insert(new_bases.anchors.end(), row + static_cast<ptrdiff_t>(r.begin),
						    row + static_cast<ptrdiff_t>(r.end));
					}

					auto coverage = graph.addObject(buildCoverageTable(std::move(covered)));
					auto base_coverage = (i == 0) ? mb.base_coverage : graph.addObject(graph.object(mb.base_coverage));
					auto mark_array_id = graph.addObject(buildMarkArray(new_marks));
					auto base_array_id = graph.addObject(buildBaseArray(new_bases));

					shards.push_back(graph.addObject(buildMarkBasePos(MarkBasePosFormat1 {
					    .mark_coverage = coverage,
					    .base_coverage = base_coverage,
					    .mark_class_count = static_cast<uint16_t>(r.size()),
					    .mark_array = mark_array_id,
					    .base_array = base_array_id,
					})));
				}

				return Ok(std::move(shards));
			}
		};
	}

	void registerLayoutAdapters(graph::Adapters& adapters)
	{
		adapters.addPromoter(kind::GSUB_LOOKUP, std::make_unique<LookupPromoter>())
		    .addPromoter(kind::GPOS_LOOKUP, std::make_unique<LookupPromoter>())
		    .addContainer(kind::GSUB_LOOKUP, std::make_unique<LookupSubtableContainer>())
		    .addContainer(kind::GPOS_LOOKUP, std::make_unique<LookupSubtableContainer>())
		    .addContainer(kind::EXTENSION, std::make_unique<LookupSubtableContainer>())
		    .addSplitter(kind::PAIR_POS_1, std::make_unique<PairPosSplitter>())
		    .addSplitter(kind::PAIR_POS_2, std::make_unique<PairPos2Splitter>())
		    .addSplitter(kind::MARK_BASE_POS, std::make_unique<MarkBaseSplitter>())
		    .addSplitter(kind::COVERAGE, std::make_unique<CoverageSplitter>());
	}
}
