#pragma once

#include <QHashFunctions>
#include <QString>

class FileIdentity
{
public:
    FileIdentity() = default;

    static FileIdentity fromPath(const QString &path);
    static QString normalizePath(const QString &path);

    bool isValid() const { return !m_path.isEmpty(); }
    const QString &path() const { return m_path; }

    bool operator==(const FileIdentity &other) const { return m_path == other.m_path; }
    bool operator!=(const FileIdentity &other) const { return m_path != other.m_path; }

private:
    explicit FileIdentity(const QString &normalizedPath);

    QString m_path;
};

inline size_t qHash(const FileIdentity &identity, size_t seed = 0) noexcept
{
    return qHash(identity.path(), seed);
}
