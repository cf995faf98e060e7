#pragma once

#include <QString>
#include <QStringList>
#include <Qt>

class PathCollection
{
public:
    enum class SortKey {
        Name = 0,
        Modified,
        Size
    };

    PathCollection() = default;

    static PathCollection build(const QString &directory,
                                const QStringList &extensions,
                                SortKey sortKey,
                                Qt::SortOrder sortOrder,
                                const QString &initialFile = QString(),
                                Qt::CaseSensitivity extensionCase = Qt::CaseInsensitive);

    bool isEmpty() const { return m_paths.isEmpty(); }
    int size() const { return static_cast<int>(m_paths.size()); }
    int index() const { return m_index; }
    QString current() const;
    const QStringList &paths() const { return m_paths; }
    QString directory() const { return m_directory; }
    SortKey sortKey() const { return m_sortKey; }
    Qt::SortOrder sortOrder() const { return m_sortOrder; }
    int indexOf(const QString &path) const;

    QStringList next(int lookahead);
    QStringList prev(int lookahead);
    void reorder(SortKey sortKey, Qt::SortOrder sortOrder);

private:
    void sortPaths();

    QString m_directory;
    QStringList m_paths;
    int m_index = 0;
    SortKey m_sortKey = SortKey::Name;
    Qt::SortOrder m_sortOrder = Qt::AscendingOrder;
};
