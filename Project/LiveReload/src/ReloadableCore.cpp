// ReloadableCore.cpp
#include "LiveReload/Reloadable.h"
#include "LiveReload/ReloadError.h"
#include "LiveReload/Logging.hpp"

#include <filesystem>
#include <system_error>

namespace LiveReload {

    namespace {

        std::string CanonicalPath(const std::string& path) {
            std::error_code ec;
            const std::filesystem::path canonical = std::filesystem::canonical(path, ec);
            if (ec) {
                LIVERELOAD_PRINT(ReloadLogging::LogLevel::Error, "[Reloadable] Cannot resolve '", path, "': ", ec.message());
                throw LoadError(LoadErrorKind::NotFound, path, ec.message());
            }
            return canonical.string();
        }

    } // namespace

    ReloadableCore::ReloadableCore(const std::string& path, void* host, uint64_t hostFingerprint,
                                   const ReloadSettings& settings, std::shared_ptr<IModuleLoader> loader)
        : m_path(CanonicalPath(path)),
          m_host(host),
          m_hostFingerprint(hostFingerprint),
          m_loader(loader ? std::move(loader) : CreateNativeModuleLoader(settings.loader)) {
        WatchConfig watchCfg;
        watchCfg.targetPath = m_path;
        watchCfg.debounceMs = settings.watch.debounceMs;
        watchCfg.pollIntervalMs = settings.watch.pollIntervalMs;
        m_watcher.Start(watchCfg);

        m_module = LoadModule();
        m_state.EnsureCapacity(m_module->StateSize());
        m_module->Init(m_host, m_state.Pointer());

        LIVERELOAD_PRINT(ReloadLogging::LogLevel::Info, "[Reloadable] Initialized '", m_path, "' (state ",
            m_state.Size(), " bytes)");
    }

    ReloadableCore::~ReloadableCore() {
        Shutdown();
    }

    std::unique_ptr<IReloadModule> ReloadableCore::LoadModule() {
        std::unique_ptr<IReloadModule> module = m_loader->Load(m_path, m_hostFingerprint);
        if (!module) {
            throw LoadError(LoadErrorKind::BadModule, m_path, "loader returned no module");
        }
        return module;
    }

    void ReloadableCore::Reload() {
        if (m_shutDown) {
            return;
        }
        const bool changed = m_watcher.Poll();
        if (changed || !m_module) {
            ReloadNow();
        }
    }

    void ReloadableCore::ReloadNow() {
        if (m_shutDown) {
            return;
        }

        if (m_module) {
            m_module->Unload(m_host, m_state.Pointer());
            m_module.reset();
            LIVERELOAD_PRINT(ReloadLogging::LogLevel::Debug, "[Reloadable] Unloaded '", m_path, "'");
        }

        std::unique_ptr<IReloadModule> incoming;
        try {
            incoming = LoadModule();
        }
        catch (const LoadError& e) {
            LIVERELOAD_PRINT(ReloadLogging::LogLevel::Error, "[Reloadable] Reload failed, module stays unloaded: ", e.what());
            throw;
        }

        const size_t previous = m_state.Size();
        m_state.EnsureCapacity(incoming->StateSize());
        m_module = std::move(incoming);
        m_module->Reload(m_host, m_state.Pointer());

        LIVERELOAD_PRINT(ReloadLogging::LogLevel::Info, "[Reloadable] Reloaded '", m_path, "' (state ",
            previous, " -> ", m_state.Size(), " bytes)");
    }

    ShouldQuit ReloadableCore::Update() {
        if (!m_module) {
            return ShouldQuit::No;
        }
        return m_module->Update(m_host, m_state.Pointer());
    }

    SaveState ReloadableCore::SaveSnapshot() const {
        return m_state.Snapshot();
    }

    void ReloadableCore::LoadSnapshot(const SaveState& state) {
        m_state.Restore(state);
    }

    void ReloadableCore::Shutdown() {
        if (m_shutDown) {
            return;
        }
        m_shutDown = true;

        if (m_module) {
            m_module->Deinit(m_host, m_state.Pointer());
            m_module.reset();
        }
        m_watcher.Stop();
        m_state.Release();

        LIVERELOAD_PRINT(ReloadLogging::LogLevel::Info, "[Reloadable] Shut down '", m_path, "'");
    }

    void ReloadableCore::RequestReload(const std::string& reason) {
        m_watcher.RequestReload(reason);
    }

} // namespace LiveReload
