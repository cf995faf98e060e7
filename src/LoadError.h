#pragma once

#include <QString>

struct LoadError {
    enum class Kind {
        NotFound,
        Unsupported,
        UploadFailed,
        Other
    };

    Kind kind = Kind::Other;
    QString message;

    static LoadError notFound(const QString &message = QString());
    static LoadError unsupported(const QString &message = QString());
    static LoadError uploadFailed(const QString &message = QString());
    static LoadError other(const QString &message);

    static QString kindName(Kind kind);
    QString toString() const;

    bool operator==(const LoadError &other) const
    {
        return kind == other.kind && message == other.message;
    }
};
