
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

#include "ErrorLedger.h"

void ErrorLedger::record(const FileIdentity &id, const LoadError &error)
{
    m_errors.insert(id, error);
}

bool ErrorLedger::remove(const FileIdentity &id)
{
    return m_errors.remove(id) > 0;
}

const LoadError *ErrorLedger::find(const FileIdentity &id) const
{
    const auto it = m_errors.constFind(id);
    if (it == m_errors.constEnd()) {
        return nullptr;
    }
    return &it.value();
}

bool ErrorLedger::contains(const FileIdentity &id) const
{
    return m_errors.contains(id);
}

void ErrorLedger::clear()
{
    m_errors.clear();
}

qsizetype ErrorLedger::count() const
{
    return m_errors.size();
}
