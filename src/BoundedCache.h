
/************************************************************************\

    Glance - Prefetching image viewer
    Copyright (C) 2026 Jango73

    This program is free software: you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program.  If not, see <https://www.gnu.org/licenses/>.

\************************************************************************/

#pragma once

#include <QHash>
#include <QList>
#include <QtGlobal>

#include "FileIdentity.h"

/**
 * @brief Size-accounted cache with first-in first-out eviction.
 *
 * T must provide `qsizetype byteSize() const`. The total of all held entries
 * stays within the capacity, except for a single entry that is larger than the
 * capacity on its own: it is inserted into an otherwise empty cache.
 *
 * Not synchronized. The owner guards every call.
 */
template <typename T>
class BoundedCache
{
public:
    explicit BoundedCache(qsizetype capacity)
        : m_capacity(capacity)
    {
    }

    const T *find(const FileIdentity &id) const
    {
        const auto it = m_entries.constFind(id);
        if (it == m_entries.constEnd()) {
            return nullptr;
        }
        return &it->value;
    }

    bool contains(const FileIdentity &id) const
    {
        return m_entries.contains(id);
    }

    // First writer wins: pushing a held identity changes nothing.
    bool push(const FileIdentity &id, const T &value)
    {
        if (m_entries.contains(id)) {
            return false;
        }
        const qsizetype pushSize = value.byteSize();
        while (m_size + pushSize > m_capacity && !m_order.isEmpty()) {
            evictOldest();
        }
        m_entries.insert(id, Entry{value, pushSize});
        m_order.append(id);
        m_size += pushSize;
        return true;
    }

    void clear()
    {
        m_entries.clear();
        m_order.clear();
        m_size = 0;
    }

    qsizetype size() const { return m_size; }
    qsizetype capacity() const { return m_capacity; }
    qsizetype count() const { return m_order.size(); }
    bool isEmpty() const { return m_order.isEmpty(); }

    // Oldest first.
    QList<FileIdentity> keys() const { return m_order; }

private:
    struct Entry {
        T value;
        qsizetype size = 0;
    };

    void evictOldest()
    {
        const FileIdentity oldest = m_order.takeFirst();
        const auto it = m_entries.find(oldest);
        if (it == m_entries.end()) {
            return;
        }
        m_size -= it->size;
        m_entries.erase(it);
    }

    QHash<FileIdentity, Entry> m_entries;
    QList<FileIdentity> m_order;
    qsizetype m_size = 0;
    qsizetype m_capacity;
};
