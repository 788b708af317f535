#ifndef SLICEERRORS_H
#define SLICEERRORS_H

#include <stdexcept>
#include <string>
#include <QString>

/**
 * Error taxonomy of the slicing session engine
 *
 * ValidationError is raised synchronously before any work starts and is never retried.
 * DecodeError and EncodeError are raised inside the slicing task and turned into a
 * terminal error message. ExportError is raised only when an export produced nothing.
 */
class SliceError : public std::runtime_error
{
public:
    explicit SliceError(const QString& message)
        : std::runtime_error(message.toStdString())
    {}

    QString message() const { return QString::fromStdString(what()); }
};

class ValidationError : public SliceError
{
public:
    using SliceError::SliceError;
};

class DecodeError : public SliceError
{
public:
    using SliceError::SliceError;
};

class EncodeError : public SliceError
{
public:
    using SliceError::SliceError;
};

class ExportError : public SliceError
{
public:
    using SliceError::SliceError;
};

#endif // SLICEERRORS_H
