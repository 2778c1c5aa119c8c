// adapters.h
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <vector>
#include <optional>

#include "util.h"
#include "graph/object.h"
#include "graph/pack_error.h"

namespace otpack::graph
{
	struct Graph;

	// a half-open range of logical entries (glyphs, pair sets, ...) in an object
	struct EntryRange
	{
		size_t begin;
		size_t end;

		size_t size() const { return end - begin; }
	};

	/*
	    Knows how to cut one kind of object into several smaller ones, each carrying a contiguous
	    range of its logical entries. The shards are new objects; the original is left alone.
	*/
	struct Splitter
	{
		virtual ~Splitter();

		virtual size_t entryCount(const Graph& graph, ObjectId id) const = 0;

		// which entry the link at `position` belongs to, if it belongs to any in particular
		virtual std::optional<size_t> entryForLink(const Graph& graph, ObjectId id, uint32_t position) const = 0;

		virtual PackResult<std::vector<ObjectId>> split(Graph& graph, ObjectId id,
		    const std::vector<EntryRange>& ranges) const = 0;
	};

	/*
	    Knows how to make one kind of object point at a list of shards in place of a single
	    child that was split.
	*/
	struct ShardContainer
	{
		virtual ~ShardContainer();

		virtual PackResult<void> insertShards(Graph& graph, ObjectId parent, ObjectId original,
		    const std::vector<ObjectId>& shards) const = 0;
	};

	/*
	    Knows how to move the promotable links of one kind of object behind wider offsets.
	    Returns false if there was nothing left to promote.
	*/
	struct Promoter
	{
		virtual ~Promoter();

		virtual PackResult<bool> promote(Graph& graph, ObjectId parent) const = 0;
	};

	struct Adapters
	{
		Adapters& addSplitter(ObjectKind kind, std::unique_ptr<Splitter> splitter);
		Adapters& addContainer(ObjectKind kind, std::unique_ptr<ShardContainer> container);
		Adapters& addPromoter(ObjectKind kind, std::unique_ptr<Promoter> promoter);

		const Splitter* splitter(ObjectKind kind) const;
		const ShardContainer* container(ObjectKind kind) const;
		const Promoter* promoter(ObjectKind kind) const;

	private:
		util::hashmap<ObjectKind, std::unique_ptr<Splitter>> m_splitters;
		util::hashmap<ObjectKind, std::unique_ptr<ShardContainer>> m_containers;
		util::hashmap<ObjectKind, std::unique_ptr<Promoter>> m_promoters;
	};
}
