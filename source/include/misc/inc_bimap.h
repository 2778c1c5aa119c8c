// inc_bimap.h
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <vector>
#include <optional>

#include "util.h" // for hashmap

namespace util
{
	/*
	    Maps a sparse set of u32 keys (glyph ids, object ids, class values) onto 0..n in the
	    order they were first seen. There's no removal; indices are stable once handed out.
	*/
	struct IncBiMap
	{
		uint32_t add(uint32_t key)
		{
			if(auto it = m_forward.find(key); it != m_forward.end())
				return it->second;

			auto idx = static_cast<uint32_t>(m_backward.size());
			m_forward.emplace(key, idx);
			m_backward.push_back(key);
			return idx;
		}

		std::optional<uint32_t> get(uint32_t key) const
		{
			if(auto it = m_forward.find(key); it != m_forward.end())
				return it->second;
			return std::nullopt;
		}

		std::optional<uint32_t> getBackward(uint32_t index) const
		{
			if(index < m_backward.size())
				return m_backward[index];
			return std::nullopt;
		}

		bool has(uint32_t key) const { return m_forward.contains(key); }

		size_t size() const { return m_backward.size(); }
		bool empty() const { return m_backward.empty(); }

		// in index order
		const std::vector<uint32_t>& keys() const { return m_backward; }

	private:
		util::hashmap<uint32_t, uint32_t> m_forward;
		std::vector<uint32_t> m_backward;
	};
}
