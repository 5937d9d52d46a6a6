#pragma once

#include <QString>
#include <optional>

#include "mdlog/core/LineEnding.hpp"

namespace mdlog {
namespace data {

class FileLogStorage
{
public:
    // Without a line ending the convention is detected from the file content.
    explicit FileLogStorage(QString filePath, std::optional<core::LineEnding> lineEnding = std::nullopt);
    ~FileLogStorage() = default;

    bool reload();
    bool isLoaded() const;
    QString errorString() const;

    const QString &filePath() const;
    const QString &text() const;
    core::LineEnding lineEnding() const;

private:
    QString m_filePath;
    std::optional<core::LineEnding> m_forcedLineEnding;
    core::LineEnding m_lineEnding = core::LineEnding::Unix;
    QString m_text;
    QString m_errorString;
    bool m_loaded = false;
};

} // namespace data
} // namespace mdlog
