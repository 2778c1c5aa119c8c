// builder.h
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>

#include "graph/object.h"

namespace otpack::graph
{
	struct LinkFlags
	{
		bool nullable = false;
		bool promotable = false;
		OffsetWhence whence = OffsetWhence::Head;
		SpaceId space = SpaceId::Auto;
	};

	/*
	    Serialises one object field by field (big-endian, the way OpenType wants it), recording
	    a Link for every offset field it reserves. The offset bytes are left as zero; the packer
	    patches them once the layout is known.
	*/
	struct ObjectBuilder
	{
		explicit ObjectBuilder(ObjectKind kind = ObjectKind::Opaque) : m_kind(kind) { }

		ObjectBuilder& u8(uint8_t x);
		ObjectBuilder& u16(uint16_t x);
		ObjectBuilder& u24(uint32_t x);
		ObjectBuilder& u32(uint32_t x);
		ObjectBuilder& bytes(zst::byte_span span);
		ObjectBuilder& zeros(size_t count);
		ObjectBuilder& fill(uint8_t value, size_t count);

		ObjectBuilder& offset16(std::optional<ObjectId> target, LinkFlags flags = {});
		ObjectBuilder& offset24(std::optional<ObjectId> target, LinkFlags flags = {});
		ObjectBuilder& offset32(std::optional<ObjectId> target, LinkFlags flags = {});
		ObjectBuilder& offset(OffsetWidth width, std::optional<ObjectId> target, LinkFlags flags = {});

		// forces `target` to be placed after this object, without writing anything.
		ObjectBuilder& virtualLink(ObjectId target);

		// overwrite a field that was written earlier (counts, lengths, ...)
		ObjectBuilder& setU16At(size_t pos, uint16_t x);

		ObjectBuilder& kind(ObjectKind kind);

		size_t size() const { return m_bytes.size(); }

		Object finish();

	private:
		std::vector<uint8_t> m_bytes;
		std::vector<Link> m_links;
		ObjectKind m_kind;
	};
}
