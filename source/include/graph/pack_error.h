// pack_error.h
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <string>
#include <vector>

#include <zpr.h>
#include <zst/zst.h>

#include "graph/object.h"
#include "graph/overflow.h"

namespace otpack::graph
{
	struct Graph;
	struct Layout;

	struct PackError
	{
		enum class Kind
		{
			StructuralCycle,
			OverflowUnresolved,
			InvalidGraph,
		};

		enum class Cause
		{
			None,
			NoApplicableStrategy,
			BudgetExhausted,
		};

		Kind kind;
		Cause cause = Cause::None;
		std::string message;

		// what was still overflowing when we gave up
		std::vector<Overflow> overflows;

		// objects that could not be sequenced
		std::vector<ObjectId> stuck;

		// the graph (and, where there was one, the layout) as they were at the point of failure
		std::shared_ptr<const Graph> graph;
		std::shared_ptr<const Layout> layout;

		std::string display() const;

		// graphviz rendering of the snapshot; empty if there isn't one.
		std::string dumpGraph() const;

		static PackError cycle(std::vector<ObjectId> stuck, std::string message);
		static PackError invalid(std::string message);
		static PackError unresolved(Cause cause, std::vector<Overflow> overflows, std::string message);
	};

	template <typename T>
	using PackResult = zst::Result<T, PackError>;

	const char* kindName(PackError::Kind kind);
	const char* causeName(PackError::Cause cause);
}

namespace zpr
{
	template <>
	struct print_formatter<otpack::graph::PackError>
	{
		template <typename Cb>
		void print(const otpack::graph::PackError& err, Cb&& cb, format_args args)
		{
			detail::print_one(static_cast<Cb&&>(cb), static_cast<format_args&&>(args), err.display());
		}
	};
}
