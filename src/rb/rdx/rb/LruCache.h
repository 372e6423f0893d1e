//
// Copyright (C) 2024 Pablo Delgado Krämer
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program. If not, see <https://www.gnu.org/licenses/>.
//

#pragma once

#include <stdint.h>
#include <assert.h>
#include <functional>
#include <list>
#include <optional>
#include <unordered_map>
#include <utility>

namespace rdx
{
  // Capacity-bounded map that evicts the least recently used entry. Evicted
  // entries are handed back to the caller, which owns their destruction.
  template<typename K, typename V, typename H = std::hash<K>>
  class RbLruCache
  {
  public:
    using Entry = std::pair<K, V>;

    explicit RbLruCache(uint32_t capacity)
      : m_capacity(capacity)
    {
      assert(capacity > 0);
    }

    V* get(const K& key)
    {
      auto it = m_map.find(key);
      if (it == m_map.end())
      {
        return nullptr;
      }

      m_entries.splice(m_entries.begin(), m_entries, it->second);
      return &it->second->second;
    }

    std::optional<Entry> put(K key, V value)
    {
      if (auto it = m_map.find(key); it != m_map.end())
      {
        Entry old = std::move(*it->second);
        it->second->second = std::move(value);
        m_entries.splice(m_entries.begin(), m_entries, it->second);
        return old;
      }

      m_entries.emplace_front(key, std::move(value));
      m_map[key] = m_entries.begin();

      if (m_entries.size() <= m_capacity)
      {
        return std::nullopt;
      }

      Entry evicted = std::move(m_entries.back());
      m_map.erase(evicted.first);
      m_entries.pop_back();
      return evicted;
    }

    template<typename F>
    void drain(F&& fun)
    {
      for (Entry& entry : m_entries)
      {
        fun(entry.first, entry.second);
      }

      m_entries.clear();
      m_map.clear();
    }

    size_t size() const
    {
      return m_entries.size();
    }

    uint32_t capacity() const
    {
      return m_capacity;
    }

  private:
    uint32_t m_capacity;
    std::list<Entry> m_entries;
    std::unordered_map<K, typename std::list<Entry>::iterator, H> m_map;
  };
}
