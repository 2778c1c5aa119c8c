// layout_tables.h
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <vector>
#include <optional>

#include "graph/object.h"
#include "graph/adapters.h"
#include "graph/pack_error.h"

/*
    The parts of GSUB and GPOS that the packer knows how to reshape:

    - lookups can be promoted, moving each subtable behind an Extension subtable (with a 32-bit
      offset), which puts the subtable in its own space.
    - PairPos format 1 subtables can be split by pair set, along with their coverage.
    - PairPos format 2 subtables can be split by first class, along with their coverage and
      first ClassDef.
    - MarkBasePos format 1 subtables can be split by mark class, along with their mark coverage,
      mark array and base array.
    - lookups and extension subtables can take the shards of a split subtable.

    Everything else is opaque bytes as far as the packer is concerned.
*/
namespace otpack::font::off
{
	namespace kind
	{
		constexpr auto COVERAGE = graph::ObjectKind(0x101);
		constexpr auto GSUB_LOOKUP = graph::ObjectKind(0x102);
		constexpr auto GPOS_LOOKUP = graph::ObjectKind(0x103);
		constexpr auto EXTENSION = graph::ObjectKind(0x104);
		constexpr auto PAIR_POS_1 = graph::ObjectKind(0x105);
		constexpr auto PAIR_POS_2 = graph::ObjectKind(0x106);
		constexpr auto CLASS_DEF = graph::ObjectKind(0x107);
		constexpr auto MARK_BASE_POS = graph::ObjectKind(0x108);
		constexpr auto MARK_ARRAY = graph::ObjectKind(0x109);
		constexpr auto BASE_ARRAY = graph::ObjectKind(0x10A);
	}

	constexpr uint16_t GSUB_EXTENSION_LOOKUP = 7;
	constexpr uint16_t GPOS_EXTENSION_LOOKUP = 9;

	constexpr uint16_t LOOKUP_FLAG_USE_MARK_FILTERING_SET = 0x0010;

	struct LookupTable
	{
		// GSUB_LOOKUP or GPOS_LOOKUP
		graph::ObjectKind kind;

		uint16_t type;
		uint16_t flags;
		std::vector<graph::ObjectId> subtables;
		std::optional<uint16_t> mark_filtering_set;

		// whether the subtable offsets may be moved behind extensions
		bool promotable = true;
	};

	struct ExtensionSubtable
	{
		uint16_t lookup_type;
		graph::ObjectId subtable;
	};

	struct PairPosFormat1
	{
		graph::ObjectId coverage;
		uint16_t value_format1;
		uint16_t value_format2;

		// one per glyph in the coverage, in coverage order
		std::vector<graph::ObjectId> pair_sets;
	};

	/*
	    Only the header of the subtable; the class1 records (class1_count of them, each holding
	    class2_count pairs of value records) stay in the object's bytes, since their device
	    offsets are links of the object.
	*/
	struct PairPosFormat2
	{
		graph::ObjectId coverage;
		uint16_t value_format1;
		uint16_t value_format2;
		graph::ObjectId class_def1;
		graph::ObjectId class_def2;
		uint16_t class1_count;
		uint16_t class2_count;

		size_t class1RecordSize() const;
	};

	// the number of bytes in a value record with the given format
	size_t valueRecordSize(uint16_t value_format);

	struct MarkBasePosFormat1
	{
		graph::ObjectId mark_coverage;
		graph::ObjectId base_coverage;
		uint16_t mark_class_count;
		graph::ObjectId mark_array;
		graph::ObjectId base_array;
	};

	struct MarkRecord
	{
		uint16_t mark_class;
		graph::ObjectId anchor;
	};

	// one record per glyph in the mark coverage, in coverage order
	struct MarkArray
	{
		std::vector<MarkRecord> records;
	};

	// a row of `mark_class_count` anchors per glyph in the base coverage; anchors can be null.
	struct BaseArray
	{
		uint16_t mark_class_count;
		std::vector<std::optional<graph::ObjectId>> anchors;

		size_t baseCount() const { return mark_class_count == 0 ? 0 : anchors.size() / mark_class_count; }
	};

	graph::Object buildLookup(const LookupTable& lookup);
	graph::Object buildExtension(const ExtensionSubtable& ext);
	graph::Object buildPairPosFormat1(const PairPosFormat1& subtable);
	graph::Object buildMarkBasePos(const MarkBasePosFormat1& subtable);
	graph::Object buildMarkArray(const MarkArray& array);
	graph::Object buildBaseArray(const BaseArray& array);

	graph::PackResult<LookupTable> parseLookup(const graph::Object& obj);
	graph::PackResult<ExtensionSubtable> parseExtension(const graph::Object& obj);
	graph::PackResult<PairPosFormat1> parsePairPosFormat1(const graph::Object& obj);
	graph::PackResult<PairPosFormat2> parsePairPosFormat2(const graph::Object& obj);
	graph::PackResult<MarkBasePosFormat1> parseMarkBasePos(const graph::Object& obj);
	graph::PackResult<MarkArray> parseMarkArray(const graph::Object& obj);
	graph::PackResult<BaseArray> parseBaseArray(const graph::Object& obj, uint16_t mark_class_count);

	// the extension lookup type for the table that `lookup_kind` belongs to
	uint16_t extensionLookupType(graph::ObjectKind lookup_kind);

	void registerLayoutAdapters(graph::Adapters& adapters);
}
