#pragma once
#include <string>

namespace chunk
{

enum class ErrorKind
{
    None,
    Plan,          // bad configuration, run never starts
    Scan,          // listing the sidecar area failed
    Split,         // reading the source or writing a chunk failed
    Archive,       // producing the temporary archive failed
    Space,         // local scratch space pre-flight failed
    RemoteDelete,  // best-effort remote invalidation failed
    Transfer,      // the remote mover rejected a copy
    Vanished       // source disappeared between discovery and processing
};

struct Error
{
    ErrorKind   kind{ErrorKind::None};
    std::string detail;
};

inline const char *kind_name(ErrorKind k)
{
    switch (k)
    {
        case ErrorKind::None:
            return "none";
        case ErrorKind::Plan:
            return "PlanError";
        case ErrorKind::Scan:
            return "ScanError";
        case ErrorKind::Split:
            return "SplitError";
        case ErrorKind::Archive:
            return "ArchiveError";
        case ErrorKind::Space:
            return "SpaceError";
        case ErrorKind::RemoteDelete:
            return "RemoteDeleteError";
        case ErrorKind::Transfer:
            return "TransferError";
        case ErrorKind::Vanished:
            return "Vanished";
    }
    return "?";
}

// Fatal kinds stop the whole run; the rest are logged and processing goes on.
inline bool is_fatal(ErrorKind k)
{
    return k == ErrorKind::Plan || k == ErrorKind::Scan || k == ErrorKind::Split ||
           k == ErrorKind::Archive || k == ErrorKind::Space;
}

}  // namespace chunk
