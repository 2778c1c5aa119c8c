// pack_error.cpp
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#include "util.h"
#include "error.h"

#include "graph/dump.h"
#include "graph/graph.h"
#include "graph/layout.h"
#include "graph/pack_error.h"

namespace otpack::graph
{
	const char* kindName(PackError::Kind kind)
	{
		switch(kind)
		{
			using enum PackError::Kind;
			case StructuralCycle: return "structural cycle";
			case OverflowUnresolved: return "unresolved overflow";
			case InvalidGraph: return "invalid graph";
		}
		return "?";
	}

	const char* causeName(PackError::Cause cause)
	{
		switch(cause)
		{
			using enum PackError::Cause;
			case None: return "none";
			case NoApplicableStrategy: return "no applicable strategy";
			case BudgetExhausted: return "round budget exhausted";
		}
		return "?";
	}

	PackError PackError::cycle(std::vector<ObjectId> stuck, std::string message)
	{
		return PackError {
			.kind = Kind::StructuralCycle,
			.message = std::move(message),
			.stuck = std::move(stuck),
		};
	}

	PackError PackError::invalid(std::string message)
	{
		return PackError {
			.kind = Kind::InvalidGraph,
			.message = std::move(message),
		};
	}

	PackError PackError::unresolved(Cause cause, std::vector<Overflow> overflows, std::string message)
	{
		return PackError {
			.kind = Kind::OverflowUnresolved,
			.cause = cause,
			.message = std::move(message),
			.overflows = std::move(overflows),
		};
	}

	std::string PackError::display() const
	{
		auto ret = zpr::sprint("{}: {}", kindName(this->kind), this->message);
		if(this->cause != Cause::None)
			ret += zpr::sprint(" ({})", causeName(this->cause));

		if(not this->overflows.empty())
		{
			ret += zpr::sprint("\n{} overflowing offset(s):", this->overflows.size());
			for(auto& o : this->overflows)
				ret += zpr::sprint("\n  {}", o);
		}

		if(not this->stuck.empty())
		{
			ret += "\nstuck:";
			for(auto id : this->stuck)
				ret += zpr::sprint(" {}", id);
		}

		return ret;
	}

	std::string PackError::dumpGraph() const
	{
		if(this->graph == nullptr)
			return "";

		return dumpGraphviz(*this->graph, this->layout.get());
	}
}
