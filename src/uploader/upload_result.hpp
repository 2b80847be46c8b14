#pragma once

#include <string>

#include "../restart/restart_store.hpp"

namespace azupload
{
    enum class UploadStatus
    {
        Completed,
        TransferFailed,
        CommitFailed,
        VerificationFailed,
        Cancelled
    };

    inline const char *uploadStatusName(UploadStatus status)
    {
        switch (status)
        {
        case UploadStatus::Completed:
            return "completed";
        case UploadStatus::TransferFailed:
            return "transfer failed";
        case UploadStatus::CommitFailed:
            return "commit failed";
        case UploadStatus::VerificationFailed:
            return "verification failed";
        case UploadStatus::Cancelled:
            return "cancelled";
        }
        return "unknown";
    }

    struct UploadResult
    {
        UploadStatus status = UploadStatus::Completed;
        std::string message;
        RestartState state; // last state written to the restart record

        bool completed() const { return status == UploadStatus::Completed; }

        // A later run can pick up from the restart record without operator action.
        bool resumable() const
        {
            return status == UploadStatus::TransferFailed || status == UploadStatus::CommitFailed ||
                   status == UploadStatus::Cancelled;
        }
    };
}
