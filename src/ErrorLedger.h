#pragma once

#include <QHash>

#include "FileIdentity.h"
#include "LoadError.h"

// Last load failure per file. Entries stay until replaced, removed or cleared.
class ErrorLedger
{
public:
    void record(const FileIdentity &id, const LoadError &error);
    bool remove(const FileIdentity &id);
    const LoadError *find(const FileIdentity &id) const;
    bool contains(const FileIdentity &id) const;
    void clear();
    qsizetype count() const;

private:
    QHash<FileIdentity, LoadError> m_errors;
};
