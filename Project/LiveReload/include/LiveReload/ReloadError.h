#pragma once
// ReloadError.h
//
// Error taxonomy for the reload engine.
//
//  - LoadError : the module file is missing/unreadable, is not a loadable library,
//                does not export the lifecycle table, or was built against a different
//                Host layout.
//  - WatchError: the filesystem subscription on the module's directory could not be set up.
//
// Both are thrown synchronously from Reloadable construction and ReloadNow()/Reload().
// Update() and the watcher's Poll() never throw.

#include <stdexcept>
#include <string>

namespace LiveReload {

    class ReloadError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    enum class LoadErrorKind {
        NotFound,       // missing or unreadable file
        BadModule,      // not a library, missing/invalid lifecycle table
        HostMismatch    // Host layout fingerprint differs from the host's
    };

    const char* ToString(LoadErrorKind kind);

    class LoadError : public ReloadError {
    public:
        LoadError(LoadErrorKind kind, const std::string& path, const std::string& detail);

        LoadErrorKind Kind() const { return m_kind; }
        const std::string& Path() const { return m_path; }

    private:
        LoadErrorKind m_kind;
        std::string m_path;
    };

    class WatchError : public ReloadError {
    public:
        WatchError(const std::string& directory, const std::string& detail);

        const std::string& Directory() const { return m_directory; }

    private:
        std::string m_directory;
    };

} // namespace LiveReload
