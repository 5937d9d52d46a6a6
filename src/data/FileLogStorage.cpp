#include "mdlog/data/FileLogStorage.hpp"

#include "mdlog/core/Logging.hpp"

#include <QFile>
#include <QTextStream>

namespace mdlog {
namespace data {

FileLogStorage::FileLogStorage(QString filePath, std::optional<core::LineEnding> lineEnding)
    : m_filePath(std::move(filePath))
    , m_forcedLineEnding(lineEnding)
{
    reload();
}

bool FileLogStorage::reload()
{
    m_text.clear();
    m_errorString.clear();
    m_loaded = false;

    // No QIODevice::Text: CRLF must survive for the parser.
    QFile file(m_filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        m_errorString = QStringLiteral("cannot open %1: %2").arg(m_filePath, file.errorString());
        qCWarning(lcStorage).noquote() << m_errorString;
        return false;
    }

    QTextStream stream(&file);
    stream.setCodec("UTF-8");
    m_text = stream.readAll();
    m_lineEnding = m_forcedLineEnding.value_or(core::detectLineEnding(m_text));
    m_loaded = true;
    qCDebug(lcStorage).noquote() << "Loaded" << m_filePath << "with" << core::lineEndingName(m_lineEnding)
                                 << "line endings";
    return true;
}

bool FileLogStorage::isLoaded() const
{
    return m_loaded;
}

QString FileLogStorage::errorString() const
{
    return m_errorString;
}

const QString &FileLogStorage::filePath() const
{
    return m_filePath;
}

const QString &FileLogStorage::text() const
{
    return m_text;
}

core::LineEnding FileLogStorage::lineEnding() const
{
    return m_lineEnding;
}

} // namespace data
} // namespace mdlog
