// object.cpp
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#include "util.h"
#include "error.h"

#include "graph/object.h"
#include "graph/builder.h"

namespace otpack::graph
{
	const char* widthName(OffsetWidth width)
	{
		switch(width)
		{
			case OffsetWidth::Zero: return "virtual";
			case OffsetWidth::Offset16: return "Offset16";
			case OffsetWidth::Offset24: return "Offset24";
			case OffsetWidth::Offset32: return "Offset32";
		}
		return "?";
	}

	size_t Link::hash() const
	{
		return util::hasher::combine(static_cast<size_t>(this->position), //
		    static_cast<uint32_t>(this->width), static_cast<uint32_t>(this->whence), this->nullable,
		    this->promotable, static_cast<uint32_t>(this->space), static_cast<uint32_t>(this->target));
	}

	size_t Object::hash() const
	{
		auto h = util::hasher::combine(util::hasher()(this->span()), static_cast<uint32_t>(this->kind));
		for(auto& link : this->links)
			h = util::hasher::combine(h, link.hash());

		return h;
	}

	bool Object::isLeaf() const
	{
		return this->links.empty();
	}

	const Link* Object::linkAt(uint32_t position) const
	{
		for(auto& link : this->links)
		{
			if(not link.isVirtual() && link.position == position)
				return &link;
		}

		return nullptr;
	}




	ObjectBuilder& ObjectBuilder::u8(uint8_t x)
	{
		m_bytes.push_back(x);
		return *this;
	}

	ObjectBuilder& ObjectBuilder::u16(uint16_t x)
	{
		m_bytes.push_back(static_cast<uint8_t>((x >> 8) & 0xff));
		m_bytes.push_back(static_cast<uint8_t>((x >> 0) & 0xff));
		return *this;
	}

	ObjectBuilder& ObjectBuilder::u24(uint32_t x)
	{
		if(x > 0xff'ffff)
			otpack::internal_error("value {} does not fit in 24 bits", x);

		m_bytes.push_back(static_cast<uint8_t>((x >> 16) & 0xff));
		m_bytes.push_back(static_cast<uint8_t>((x >> 8) & 0xff));
		m_bytes.push_back(static_cast<uint8_t>((x >> 0) & 0xff));
		return *this;
	}

	ObjectBuilder& ObjectBuilder::u32(uint32_t x)
	{
		m_bytes.push_back(static_cast<uint8_t>((x >> 24) & 0xff));
		m_bytes.push_back(static_cast<uint8_t>((x >> 16) & 0xff));
		m_bytes.push_back(static_cast<uint8_t>((x >> 8) & 0xff));
		m_bytes.push_back(static_cast<uint8_t>((x >> 0) & 0xff));
		return *this;
	}

	ObjectBuilder& ObjectBuilder::bytes(zst::byte_span span)
	{
		m_bytes.insert(m_bytes.end(), span.begin(), span.end());
		return *this;
	}

	ObjectBuilder& ObjectBuilder::zeros(size_t count)
	{
		return this->fill(0, count);
	}

	ObjectBuilder& ObjectBuilder::fill(uint8_t value, size_t count)
	{
		m_bytes.insert(m_bytes.end(), count, value);
		return *this;
	}

	ObjectBuilder& ObjectBuilder::offset(OffsetWidth width, std::optional<ObjectId> target, LinkFlags flags)
	{
		if(width == OffsetWidth::Zero)
			otpack::internal_error("offset fields need a non-zero width");

		auto pos = static_cast<uint32_t>(m_bytes.size());
		this->zeros(byteLength(width));

		// a missing target is a null offset: the zeros we just wrote are the final value.
		if(not target.has_value())
			return *this;

		m_links.push_back(Link {
		    .position = pos,
		    .width = width,
		    .whence = flags.whence,
		    .nullable = flags.nullable,
		    .promotable = flags.promotable,
		    .space = flags.space,
		    .target = *target,
		});

		return *this;
	}

	ObjectBuilder& ObjectBuilder::offset16(std::optional<ObjectId> target, LinkFlags flags)
	{
		return this->offset(OffsetWidth::Offset16, target, flags);
	}

	ObjectBuilder& ObjectBuilder::offset24(std::optional<ObjectId> target, LinkFlags flags)
	{
		return this->offset(OffsetWidth::Offset24, target, flags);
	}

	ObjectBuilder& ObjectBuilder::offset32(std::optional<ObjectId> target, LinkFlags flags)
	{
		return this->offset(OffsetWidth::Offset32, target, flags);
	}

	ObjectBuilder& ObjectBuilder::virtualLink(ObjectId target)
	{
		m_links.push_back(Link {
		    .position = 0,
		    .width = OffsetWidth::Zero,
		    .target = target,
		});
		return *this;
	}

	ObjectBuilder& ObjectBuilder::setU16At(size_t pos, uint16_t x)
	{
		if(pos + 2 > m_bytes.size())
			otpack::internal_error("setU16At({}) out of bounds (size {})", pos, m_bytes.size());

		util::writeBEU16(&m_bytes[pos], x);
		return *this;
	}

	ObjectBuilder& ObjectBuilder::kind(ObjectKind kind)
	{
		m_kind = kind;
		return *this;
	}

	Object ObjectBuilder::finish()
	{
		return Object {
			.bytes = std::move(m_bytes),
			.links = std::move(m_links),
			.kind = m_kind,
		};
	}
}
