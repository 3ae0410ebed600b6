#pragma once
// ReloadModule.h
//
// Dynamic module loading.
//
// Responsibilities:
//  - IReloadModule: one loaded module and its resolved lifecycle table. Destroying it closes the
//    OS library handle; nothing the module exported may be used afterwards.
//  - IModuleLoader: opens a module file and produces an IReloadModule, or throws LoadError.
//  - CreateNativeModuleLoader(): the dlopen / LoadLibrary implementation.
//
// The orchestrator only talks to these interfaces, so tests can substitute an in-process loader.

#include "LiveReload/ReloadApi.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace LiveReload {

    struct LoaderSettings {
        // Open a private copy of the file instead of the file itself. The build step may then
        // overwrite the file while it is loaded, and the OS loader never sees the same path twice.
        bool shadowCopy = true;
        // Where shadow copies go. Empty = <system temp>/livereload.
        std::string shadowDirectory;
    };

    class IReloadModule {
    public:
        virtual ~IReloadModule() = default;

        virtual size_t StateSize() const = 0;

        virtual void Init(void* host, void* state) = 0;
        virtual void Reload(void* host, void* state) = 0;
        virtual ShouldQuit Update(void* host, void* state) = 0;
        virtual void Unload(void* host, void* state) = 0;
        virtual void Deinit(void* host, void* state) = 0;

        // The path the module was requested from (not the shadow copy).
        virtual const std::string& Path() const = 0;
    };

    class IModuleLoader {
    public:
        virtual ~IModuleLoader() = default;

        // Throws LoadError. hostFingerprint == 0 skips the host layout check.
        virtual std::unique_ptr<IReloadModule> Load(const std::string& path, uint64_t hostFingerprint) = 0;
    };

    std::shared_ptr<IModuleLoader> CreateNativeModuleLoader(const LoaderSettings& settings = LoaderSettings{});

} // namespace LiveReload
