// NativeModuleLoader.cpp
//
// IModuleLoader backed by the OS dynamic loader (dlopen on POSIX, LoadLibrary on Windows).
//
// Load sequence: existence check, optional shadow copy, open, resolve LiveReloadDescribe_v1,
// describe into a zeroed table, validate header and entry points, compare host fingerprints.
// On any failure the library is closed and the shadow copy deleted before LoadError leaves.

#include "LiveReload/ReloadModule.h"
#include "LiveReload/ReloadError.h"
#include "LiveReload/Logging.hpp"

#include <atomic>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <utility>

#if defined(_WIN32) || defined(_WIN64)
#define WIN32_LEAN_AND_MEAN
#include <windows.h>
#else
#include <dlfcn.h>
#endif

namespace fs = std::filesystem;

namespace LiveReload {

    namespace {

        using LibraryHandle = void*;

#if defined(_WIN32) || defined(_WIN64)
        std::string LastOsError() {
            const DWORD err = ::GetLastError();
            char buf[256] = {};
            const DWORD n = ::FormatMessageA(FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS,
                nullptr, err, 0, buf, static_cast<DWORD>(sizeof(buf)), nullptr);
            std::string text = n ? std::string(buf, n) : std::string("unknown error");
            while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) text.pop_back();
            return text + " (err=" + std::to_string(static_cast<unsigned long>(err)) + ")";
        }

        LibraryHandle OpenLibrary(const std::string& path, std::string& error) {
            HMODULE h = ::LoadLibraryA(path.c_str());
            if (!h) {
                error = LastOsError();
                return nullptr;
            }
            return reinterpret_cast<LibraryHandle>(h);
        }

        void CloseLibrary(LibraryHandle handle) {
            if (handle) {
                ::FreeLibrary(reinterpret_cast<HMODULE>(handle));
            }
        }

        void* FindSymbol(LibraryHandle handle, const char* name, std::string& error) {
            FARPROC proc = ::GetProcAddress(reinterpret_cast<HMODULE>(handle), name);
            if (!proc) {
                error = LastOsError();
                return nullptr;
            }
            return reinterpret_cast<void*>(proc);
        }
#else
        LibraryHandle OpenLibrary(const std::string& path, std::string& error) {
            ::dlerror();
            void* h = ::dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
            if (!h) {
                const char* err = ::dlerror();
                error = err ? err : "dlopen failed";
                return nullptr;
            }
            return h;
        }

        void CloseLibrary(LibraryHandle handle) {
            if (handle) {
                ::dlclose(handle);
            }
        }

        void* FindSymbol(LibraryHandle handle, const char* name, std::string& error) {
            ::dlerror();
            void* sym = ::dlsym(handle, name);
            const char* err = ::dlerror();
            if (err || !sym) {
                error = err ? err : "symbol resolved to null";
                return nullptr;
            }
            return sym;
        }
#endif

        void RemoveQuietly(const fs::path& path) {
            std::error_code ec;
            fs::remove(path, ec);
            if (ec) {
                LIVERELOAD_PRINT(ReloadLogging::LogLevel::Warn, "[Loader] Could not remove shadow copy '",
                    path.string(), "': ", ec.message());
            }
        }

        // Closes the library unless ownership was taken.
        struct LibraryGuard {
            LibraryHandle handle = nullptr;
            ~LibraryGuard() { CloseLibrary(handle); }
            LibraryHandle Release() { return std::exchange(handle, nullptr); }
        };

        // Deletes the shadow copy unless ownership was taken.
        struct ShadowFileGuard {
            fs::path path;
            ~ShadowFileGuard() { if (!path.empty()) RemoveQuietly(path); }
            fs::path Release() { return std::exchange(path, fs::path()); }
        };

        LoadError Fail(LoadErrorKind kind, const std::string& path, const std::string& detail) {
            LIVERELOAD_PRINT(ReloadLogging::LogLevel::Warn, "[Loader] ", ToString(kind), " '", path, "': ", detail);
            return LoadError(kind, path, detail);
        }

        bool IsReadable(const fs::path& path) {
            std::ifstream probe(path, std::ios::binary);
            return probe.good();
        }

        class NativeModule final : public IReloadModule {
        public:
            NativeModule(std::string path, LibraryHandle handle, const LiveReloadApi_v1& api, fs::path shadowCopy)
                : m_path(std::move(path)),
                  m_handle(handle),
                  m_api(api),
                  m_shadowCopy(std::move(shadowCopy)),
                  m_stateSize(api.size()) {
            }

            ~NativeModule() override {
                CloseLibrary(m_handle);
                m_handle = nullptr;
                if (!m_shadowCopy.empty()) {
                    RemoveQuietly(m_shadowCopy);
                }
                LIVERELOAD_PRINT(ReloadLogging::LogLevel::Debug, "[Loader] Released '", m_path, "'");
            }

            NativeModule(const NativeModule&) = delete;
            NativeModule& operator=(const NativeModule&) = delete;

            size_t StateSize() const override { return m_stateSize; }

            void Init(void* host, void* state) override { m_api.init(host, state); }
            void Reload(void* host, void* state) override { m_api.reload(host, state); }
            ShouldQuit Update(void* host, void* state) override {
                return m_api.update(host, state) != 0 ? ShouldQuit::Yes : ShouldQuit::No;
            }
            void Unload(void* host, void* state) override { m_api.unload(host, state); }
            void Deinit(void* host, void* state) override { m_api.deinit(host, state); }

            const std::string& Path() const override { return m_path; }

        private:
            std::string m_path;
            LibraryHandle m_handle;
            LiveReloadApi_v1 m_api;
            fs::path m_shadowCopy;
            size_t m_stateSize;
        };

        class NativeModuleLoader final : public IModuleLoader {
        public:
            explicit NativeModuleLoader(const LoaderSettings& settings)
                : m_settings(settings) {
                if (m_settings.shadowDirectory.empty()) {
                    std::error_code ec;
                    fs::path tmp = fs::temp_directory_path(ec);
                    if (ec) {
                        tmp = fs::current_path(ec);
                    }
                    m_settings.shadowDirectory = (tmp / "livereload").string();
                }
            }

            std::unique_ptr<IReloadModule> Load(const std::string& path, uint64_t hostFingerprint) override {
                std::error_code ec;
                const fs::path source(path);
                if (!fs::is_regular_file(source, ec)) {
                    throw Fail(LoadErrorKind::NotFound, path, "file does not exist");
                }

                ShadowFileGuard shadow;
                std::string openPath = path;
                if (m_settings.shadowCopy) {
                    shadow.path = MakeShadowCopy(source, path);
                    openPath = shadow.path.string();
                }
                else if (!IsReadable(source)) {
                    throw Fail(LoadErrorKind::NotFound, path, "file is not readable");
                }

                std::string osError;
                LibraryGuard library;
                library.handle = OpenLibrary(openPath, osError);
                if (!library.handle) {
                    throw Fail(LoadErrorKind::BadModule, path, "cannot open library: " + osError);
                }

                void* sym = FindSymbol(library.handle, LIVERELOAD_DESCRIBE_SYMBOL, osError);
                if (!sym) {
                    throw Fail(LoadErrorKind::BadModule, path,
                        std::string("missing entry point ") + LIVERELOAD_DESCRIBE_SYMBOL + ": " + osError);
                }

                LiveReloadDescribeFn_v1 describe = nullptr;
                static_assert(sizeof(describe) == sizeof(sym), "function and data pointers differ in size");
                std::memcpy(&describe, &sym, sizeof(describe));

                LiveReloadApi_v1 api;
                std::memset(&api, 0, sizeof(api));
                api.structSize = static_cast<uint32_t>(sizeof(LiveReloadApi_v1));
                api.abiVersion = LIVERELOAD_ABI_VERSION_V1;

                const int32_t status = describe(&api);
                if (status != LIVERELOAD_STATUS_OK) {
                    throw Fail(LoadErrorKind::BadModule, path,
                        std::string(LIVERELOAD_DESCRIBE_SYMBOL) + " returned status " + std::to_string(status));
                }

                Validate(api, path);

                if (hostFingerprint != 0 && api.hostFingerprint != 0 && api.hostFingerprint != hostFingerprint) {
                    throw Fail(LoadErrorKind::HostMismatch, path,
                        "module host fingerprint " + std::to_string(api.hostFingerprint)
                        + " differs from host " + std::to_string(hostFingerprint));
                }

                auto module = std::make_unique<NativeModule>(path, library.Release(), api, shadow.Release());
                LIVERELOAD_PRINT(ReloadLogging::LogLevel::Info, "[Loader] Opened '", path, "' (state ",
                    module->StateSize(), " bytes)");
                return module;
            }

        private:
            static void Validate(const LiveReloadApi_v1& api, const std::string& path) {
                if (api.structSize != sizeof(LiveReloadApi_v1)) {
                    throw Fail(LoadErrorKind::BadModule, path, "lifecycle table struct_size mismatch");
                }
                if (api.abiVersion != LIVERELOAD_ABI_VERSION_V1) {
                    throw Fail(LoadErrorKind::BadModule, path,
                        "unsupported abi_version " + std::to_string(api.abiVersion));
                }
                if (!api.size || !api.init || !api.reload || !api.update || !api.unload || !api.deinit) {
                    throw Fail(LoadErrorKind::BadModule, path, "lifecycle table missing function pointer");
                }
            }

            fs::path MakeShadowCopy(const fs::path& source, const std::string& path) {
                static std::atomic<uint64_t> counter{ 0 };

                std::error_code ec;
                const fs::path dir(m_settings.shadowDirectory);
                fs::create_directories(dir, ec);
                if (ec) {
                    throw Fail(LoadErrorKind::NotFound, path,
                        "cannot create shadow directory '" + dir.string() + "': " + ec.message());
                }

                const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
                fs::path target = dir / (source.stem().string() + "-" + std::to_string(stamp) + "-"
                    + std::to_string(counter.fetch_add(1)) + source.extension().string());

                fs::copy_file(source, target, fs::copy_options::overwrite_existing, ec);
                if (ec) {
                    const std::string reason = ec.message();
                    fs::remove(target, ec);
                    throw Fail(LoadErrorKind::NotFound, path,
                        "cannot copy to '" + target.string() + "': " + reason);
                }
                return target;
            }

            LoaderSettings m_settings;
        };

    } // namespace

    std::shared_ptr<IModuleLoader> CreateNativeModuleLoader(const LoaderSettings& settings) {
        return std::make_shared<NativeModuleLoader>(settings);
    }

} // namespace LiveReload
