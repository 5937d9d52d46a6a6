#pragma once

#include <QString>

namespace mdlog {
namespace core {

struct ParseError
{
    enum Kind
    {
        NoError,
        StructuralError,
        DateResolutionError,
    };

    Kind kind = NoError;
    int offset = -1; // offset of the offending marker in the parsed text
    QString message;

    QString errorString() const;
};

} // namespace core
} // namespace mdlog
