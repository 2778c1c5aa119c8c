// object.h
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <limits>
#include <vector>
#include <cstdint>

#include <zpr.h>
#include <zst/zst.h>

namespace otpack::graph
{
	// a dense index into the store that created it; meaningless across stores.
	enum class ObjectId : uint32_t
	{
	};

	// opaque to the packer; collaborators pick values and register adapters against them.
	enum class ObjectKind : uint16_t
	{
		Opaque = 0,
	};

	// grouping hint carried by wide links; see Graph::assignSpaces.
	enum class SpaceId : uint32_t
	{
		Auto = 0,
	};

	enum class OffsetWidth : uint8_t
	{
		Zero = 0, // a virtual link; constrains ordering, never written
		Offset16 = 2,
		Offset24 = 3,
		Offset32 = 4,
	};

	enum class OffsetWhence : uint8_t
	{
		Head,     // from the start of the parent (the usual OpenType convention)
		Tail,     // from the end of the parent
		Absolute, // from the start of the output
	};

	constexpr inline size_t byteLength(OffsetWidth width)
	{
		return static_cast<size_t>(width);
	}

	constexpr inline uint64_t maxValue(OffsetWidth width)
	{
		switch(width)
		{
			case OffsetWidth::Zero: return 0;
			case OffsetWidth::Offset16: return std::numeric_limits<uint16_t>::max();
			case OffsetWidth::Offset24: return (1u << 24) - 1;
			case OffsetWidth::Offset32: return std::numeric_limits<uint32_t>::max();
		}
		return 0;
	}

	// only 32-bit links lead into a separate space; 24-bit ones are ordinary links.
	constexpr inline bool startsSpace(OffsetWidth width)
	{
		return width == OffsetWidth::Offset32;
	}

	const char* widthName(OffsetWidth width);

	struct Link
	{
		uint32_t position = 0;
		OffsetWidth width = OffsetWidth::Offset16;
		OffsetWhence whence = OffsetWhence::Head;

		// a nullable link whose target is empty gets written as 0
		bool nullable = false;

		// the parent knows how to move this link behind a wider offset (eg. extension subtables)
		bool promotable = false;

		SpaceId space = SpaceId::Auto;
		ObjectId target {};

		bool isVirtual() const { return width == OffsetWidth::Zero; }

		bool operator==(const Link&) const = default;
		size_t hash() const;
	};

	struct Object
	{
		std::vector<uint8_t> bytes;
		std::vector<Link> links;
		ObjectKind kind = ObjectKind::Opaque;

		size_t size() const { return bytes.size(); }
		bool empty() const { return bytes.empty(); }
		zst::byte_span span() const { return zst::byte_span(bytes.data(), bytes.size()); }

		bool isLeaf() const;
		const Link* linkAt(uint32_t position) const;

		bool operator==(const Object&) const = default;
		size_t hash() const;
	};
}

template <>
struct std::hash<otpack::graph::ObjectId>
{
	size_t operator()(otpack::graph::ObjectId id) const { return std::hash<uint32_t>()(static_cast<uint32_t>(id)); }
};

namespace zpr
{
	template <>
	struct print_formatter<otpack::graph::ObjectId>
	{
		template <typename Cb>
		void print(otpack::graph::ObjectId x, Cb&& cb, format_args args)
		{
			detail::print(static_cast<Cb&&>(cb), "obj({})", static_cast<uint32_t>(x));
		}
	};

	template <>
	struct print_formatter<otpack::graph::OffsetWidth>
	{
		template <typename Cb>
		void print(otpack::graph::OffsetWidth x, Cb&& cb, format_args args)
		{
			detail::print(static_cast<Cb&&>(cb), "{}", otpack::graph::widthName(x));
		}
	};

	// zpr asks for the formatter of the argument type as passed, which for lvalues is a reference;
	// the generic enum formatter matches those, so they need their own specialisations.
	template <> struct print_formatter<otpack::graph::ObjectId&> : print_formatter<otpack::graph::ObjectId> { };
	template <> struct print_formatter<const otpack::graph::ObjectId&> : print_formatter<otpack::graph::ObjectId> { };
	template <> struct print_formatter<const otpack::graph::ObjectId> : print_formatter<otpack::graph::ObjectId> { };

	template <> struct print_formatter<otpack::graph::OffsetWidth&> : print_formatter<otpack::graph::OffsetWidth> { };
	template <> struct print_formatter<const otpack::graph::OffsetWidth&> : print_formatter<otpack::graph::OffsetWidth> { };
	template <> struct print_formatter<const otpack::graph::OffsetWidth> : print_formatter<otpack::graph::OffsetWidth> { };
}
