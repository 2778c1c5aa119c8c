// priority_queue.h
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <vector>
#include <utility>
#include <optional>
#include <concepts>

namespace util
{
	/*
	    A binary min-heap of (priority, payload) pairs. Unlike std::priority_queue this one pops
	    the *smallest* priority first, lets you look at the minimum without copying it out, and
	    hands back an empty optional instead of exploding when you pop an empty queue.

	    Entries with equal priority come out in no particular order; callers that care about
	    stability should fold a tie-breaker into `P`.
	*/
	template <std::totally_ordered P>
	struct PriorityQueue
	{
		using value_type = std::pair<P, size_t>;

		void push(P priority, size_t payload)
		{
			m_heap.emplace_back(std::move(priority), payload);
			this->sift_up(m_heap.size() - 1);
		}

		std::optional<value_type> pop()
		{
			if(m_heap.empty())
				return std::nullopt;

			auto ret = std::move(m_heap.front());
			if(m_heap.size() > 1)
			{
				m_heap.front() = std::move(m_heap.back());
				m_heap.pop_back();
				this->sift_down(0);
			}
			else
			{
				m_heap.pop_back();
			}

			return ret;
		}

		const value_type* minimum() const
		{
			if(m_heap.empty())
				return nullptr;
			return &m_heap.front();
		}

		bool empty() const { return m_heap.empty(); }
		size_t size() const { return m_heap.size(); }

		void clear() { m_heap.clear(); }
		void reserve(size_t n) { m_heap.reserve(n); }

	private:
		static size_t parent(size_t i) { return (i - 1) / 2; }
		static size_t left(size_t i) { return 2 * i + 1; }
		static size_t right(size_t i) { return 2 * i + 2; }

		bool less(size_t a, size_t b) const { return m_heap[a].first < m_heap[b].first; }

		void sift_up(size_t i)
		{
			while(i > 0 && this->less(i, parent(i)))
			{
				std::swap(m_heap[i], m_heap[parent(i)]);
				i = parent(i);
			}
		}

		void sift_down(size_t i)
		{
			while(true)
			{
				auto smallest = i;
				if(left(i) < m_heap.size() && this->less(left(i), smallest))
					smallest = left(i);

				if(right(i) < m_heap.size() && this->less(right(i), smallest))
					smallest = right(i);

				if(smallest == i)
					break;

				std::swap(m_heap[i], m_heap[smallest]);
				i = smallest;
			}
		}

		std::vector<value_type> m_heap;
	};
}
