#pragma once

#include <stdexcept>
#include <string>

namespace azupload
{

    // Local failures that end a run. Store-side transfer, commit and
    // verification failures are returned as an UploadResult instead.
    enum class ErrorKind
    {
        Configuration,
        RestartRecord,
        LocalRead
    };

    inline const char *errorKindName(ErrorKind kind)
    {
        switch (kind)
        {
        case ErrorKind::Configuration:
            return "configuration error";
        case ErrorKind::RestartRecord:
            return "restart record error";
        case ErrorKind::LocalRead:
            return "local read error";
        }
        return "unknown error";
    }

    class UploadError : public std::runtime_error
    {
    public:
        UploadError(ErrorKind kind, const std::string &message)
            : std::runtime_error(message), kind_(kind)
        {
        }

        ErrorKind kind() const { return kind_; }

    private:
        ErrorKind kind_;
    };

} // namespace azupload
