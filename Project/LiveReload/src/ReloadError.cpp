// ReloadError.cpp
#include "LiveReload/ReloadError.h"

namespace LiveReload {

    const char* ToString(LoadErrorKind kind) {
        switch (kind) {
            case LoadErrorKind::NotFound:     return "NotFound";
            case LoadErrorKind::BadModule:    return "BadModule";
            case LoadErrorKind::HostMismatch: return "HostMismatch";
        }
        return "Unknown";
    }

    LoadError::LoadError(LoadErrorKind kind, const std::string& path, const std::string& detail)
        : ReloadError(std::string("LoadError(") + ToString(kind) + ") '" + path + "': " + detail),
          m_kind(kind),
          m_path(path) {
    }

    WatchError::WatchError(const std::string& directory, const std::string& detail)
        : ReloadError("WatchError '" + directory + "': " + detail),
          m_directory(directory) {
    }

} // namespace LiveReload
