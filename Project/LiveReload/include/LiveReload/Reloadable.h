#pragma once
// Reloadable.h
//
// Owns one reloadable module and drives its lifecycle.
//
// Typical frame loop:
//
//   LiveReload::Reloadable<GameHost> game("build/libgame.so", GameHost{ ... });
//   while (running) {
//       game.Reload();                                   // reloads if the file changed
//       if (game.Update() == LiveReload::ShouldQuit::Yes) break;
//   }
//
// State machine:
//  - Construction loads the module, sizes the state buffer and calls init. Any failure throws and
//    no object exists.
//  - ReloadNow(): unload on the outgoing module, release it, load the file again, resize the state
//    buffer (prefix kept), reload on the incoming module. If the load throws the object stays
//    Unloaded with the state buffer untouched, and the next Reload() tries again without
//    waiting for a file event.
//  - Update() on an Unloaded object does nothing and returns ShouldQuit::No.
//  - Shutdown() (or destruction) calls deinit if a module is loaded, then releases everything.
//
// Everything runs on the calling thread. Only the watcher has a thread of its own.

#include "LiveReload/ChangeWatcher.h"
#include "LiveReload/ReloadApi.h"
#include "LiveReload/ReloadModule.h"
#include "LiveReload/ReloadSettings.h"
#include "LiveReload/StateBuffer.h"

#include <cstdint>
#include <memory>
#include <string>
#include <utility>

namespace LiveReload {

    // The untyped engine behind Reloadable<Host>. The host object is borrowed and must outlive it.
    class ReloadableCore {
    public:
        // Throws LoadError or WatchError. A null loader means the native loader built from
        // settings.loader.
        ReloadableCore(const std::string& path, void* host, uint64_t hostFingerprint,
                       const ReloadSettings& settings = ReloadSettings{},
                       std::shared_ptr<IModuleLoader> loader = nullptr);
        ~ReloadableCore();

        ReloadableCore(const ReloadableCore&) = delete;
        ReloadableCore& operator=(const ReloadableCore&) = delete;

        // Reload if the watcher saw a change or no module is loaded.
        void Reload();

        // Unconditional reload. Throws LoadError.
        void ReloadNow();

        ShouldQuit Update();

        SaveState SaveSnapshot() const;
        void LoadSnapshot(const SaveState& state);

        void Shutdown();

        bool IsLoaded() const { return m_module != nullptr; }
        bool IsShutDown() const { return m_shutDown; }
        size_t StateSize() const { return m_state.Size(); }
        const std::string& Path() const { return m_path; }

        UnsafeStateView StateView() { return m_state.View(); }

        void RequestReload(const std::string& reason = std::string());

    private:
        std::unique_ptr<IReloadModule> LoadModule();

        std::string m_path;
        void* m_host;
        uint64_t m_hostFingerprint;
        std::shared_ptr<IModuleLoader> m_loader;

        ChangeWatcher m_watcher;
        StateBuffer m_state;
        std::unique_ptr<IReloadModule> m_module;
        bool m_shutDown = false;
    };

    template <typename Host>
    class Reloadable {
    public:
        Reloadable(const std::string& path, Host host,
                   const ReloadSettings& settings = ReloadSettings{},
                   std::shared_ptr<IModuleLoader> loader = nullptr)
            : m_host(std::make_unique<Host>(std::move(host))),
              m_core(std::make_unique<ReloadableCore>(path, m_host.get(), HostFingerprint<Host>(),
                                                      settings, std::move(loader))) {
        }

        void Reload() { m_core->Reload(); }
        void ReloadNow() { m_core->ReloadNow(); }
        ShouldQuit Update() { return m_core->Update(); }

        SaveState SaveSnapshot() const { return m_core->SaveSnapshot(); }
        void LoadSnapshot(const SaveState& state) { m_core->LoadSnapshot(state); }

        void Shutdown() { m_core->Shutdown(); }

        bool IsLoaded() const { return m_core->IsLoaded(); }
        size_t StateSize() const { return m_core->StateSize(); }
        const std::string& Path() const { return m_core->Path(); }
        UnsafeStateView StateView() { return m_core->StateView(); }
        void RequestReload(const std::string& reason = std::string()) { m_core->RequestReload(reason); }

        Host& GetHost() { return *m_host; }
        const Host& GetHost() const { return *m_host; }

    private:
        // Declared first so the host outlives the core's deinit call.
        std::unique_ptr<Host> m_host;
        std::unique_ptr<ReloadableCore> m_core;
    };

} // namespace LiveReload
