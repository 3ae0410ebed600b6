#pragma once
// ReloadApi.h
//
// The lifecycle contract between a host program and a reloadable module.
//
// A module is a shared library that exports one C function, LiveReloadDescribe_v1, which
// fills a LiveReloadApi_v1 table with six entry points:
//
//   size    - bytes of state the module needs; the host keeps a buffer at least this large.
//   init    - called once, the very first time a module is loaded by a Reloadable.
//   reload  - called on every load after the first. The state buffer holds whatever the
//             previous module left there; it may not match the new State layout.
//   update  - called at the host's discretion (usually once per frame); returns whether
//             the host should quit.
//   unload  - called right before the module is released for a reload.
//   deinit  - called once when the host shuts the Reloadable down.
//
// Every entry receives the host's capability object and the state buffer as untyped
// pointers. The Host type must have the same layout in the host and the module for the
// whole run. The State record is private to the module; keep it standard-layout and only
// append members so old bytes stay meaningful after a reload.
//
// Module side, no macros and no global table:
//
//   extern "C" LIVERELOAD_MODULE_EXPORT int32_t LIVERELOAD_CALL
//   LiveReloadDescribe_v1(LiveReloadApi_v1* outApi) {
//       return LiveReload::Describe(outApi, LiveReload::ReloadApiBuilder<Host, State>()
//           .OnInit<&MyInit>()
//           .OnUpdate<&MyUpdate>()
//           .Build());
//   }

#include <cstddef>
#include <cstdint>
#include <type_traits>

#if defined(_WIN32) || defined(_WIN64)
    #define LIVERELOAD_CALL __cdecl
    #define LIVERELOAD_MODULE_EXPORT __declspec(dllexport)
#else
    #define LIVERELOAD_CALL
    #if defined(__GNUC__) || defined(__clang__)
        #define LIVERELOAD_MODULE_EXPORT __attribute__((visibility("default")))
    #else
        #define LIVERELOAD_MODULE_EXPORT
    #endif
#endif

#define LIVERELOAD_DESCRIBE_SYMBOL "LiveReloadDescribe_v1"

#define LIVERELOAD_STATUS_OK   0
#define LIVERELOAD_STATUS_FAIL 1

extern "C" {

    enum { LIVERELOAD_ABI_VERSION_V1 = 1u };

    typedef struct LiveReloadApi_v1 {
        uint32_t structSize;        // sizeof(LiveReloadApi_v1) as seen by the module
        uint32_t abiVersion;        // LIVERELOAD_ABI_VERSION_V1
        uint64_t hostFingerprint;   // 0 = unchecked

        size_t  (LIVERELOAD_CALL *size)(void);
        void    (LIVERELOAD_CALL *init)(void* host, void* state);
        void    (LIVERELOAD_CALL *reload)(void* host, void* state);
        int32_t (LIVERELOAD_CALL *update)(void* host, void* state);   // 0 = continue, 1 = quit
        void    (LIVERELOAD_CALL *unload)(void* host, void* state);
        void    (LIVERELOAD_CALL *deinit)(void* host, void* state);
    } LiveReloadApi_v1;

    typedef int32_t (LIVERELOAD_CALL *LiveReloadDescribeFn_v1)(LiveReloadApi_v1* outApi);

} // extern "C"

namespace LiveReload {

    // More self-documenting than a bool returned from update.
    enum class ShouldQuit : int32_t {
        No = 0,
        Yes = 1
    };

    // Detect Host::kLayoutVersion
    template <typename, typename = void> struct HasLayoutVersion : std::false_type {};
    template <typename T>
    struct HasLayoutVersion<T, std::void_t<decltype(T::kLayoutVersion)>> : std::true_type {};
    template <typename T> constexpr bool HasLayoutVersion_v = HasLayoutVersion<T>::value;

    // Identifies the Host layout on both sides of the module boundary. A Host may declare
    // `static constexpr uint32_t kLayoutVersion` and bump it whenever its fields change.
    template <typename Host>
    constexpr uint64_t HostFingerprint() {
        uint64_t version = 0;
        if constexpr (HasLayoutVersion_v<Host>) {
            version = static_cast<uint64_t>(Host::kLayoutVersion);
        }
        return (static_cast<uint64_t>(sizeof(Host)) << 32)
            | ((static_cast<uint64_t>(alignof(Host)) & 0xFFu) << 24)
            | (version & 0xFFFFFFu);
    }

    template <typename Host, typename State>
    class ReloadApiBuilder {
    public:
        using Hook = void (*)(Host&, State&);
        using UpdateHook = ShouldQuit (*)(Host&, State&);

        constexpr ReloadApiBuilder() : m_api{} {
            m_api.structSize = static_cast<uint32_t>(sizeof(LiveReloadApi_v1));
            m_api.abiVersion = LIVERELOAD_ABI_VERSION_V1;
            m_api.hostFingerprint = HostFingerprint<Host>();
            m_api.size = &SizeThunk;
            m_api.init = &NoopThunk;
            m_api.reload = &NoopThunk;
            m_api.update = &ContinueThunk;
            m_api.unload = &NoopThunk;
            m_api.deinit = &NoopThunk;
        }

        template <Hook Fn>
        constexpr ReloadApiBuilder& OnInit() { m_api.init = &HookThunk<Fn>; return *this; }

        template <Hook Fn>
        constexpr ReloadApiBuilder& OnReload() { m_api.reload = &HookThunk<Fn>; return *this; }

        template <UpdateHook Fn>
        constexpr ReloadApiBuilder& OnUpdate() { m_api.update = &UpdateThunk<Fn>; return *this; }

        template <Hook Fn>
        constexpr ReloadApiBuilder& OnUnload() { m_api.unload = &HookThunk<Fn>; return *this; }

        template <Hook Fn>
        constexpr ReloadApiBuilder& OnDeinit() { m_api.deinit = &HookThunk<Fn>; return *this; }

        constexpr LiveReloadApi_v1 Build() const { return m_api; }

    private:
        static size_t LIVERELOAD_CALL SizeThunk() {
            return sizeof(State);
        }

        static void LIVERELOAD_CALL NoopThunk(void*, void*) {}

        static int32_t LIVERELOAD_CALL ContinueThunk(void*, void*) {
            return static_cast<int32_t>(ShouldQuit::No);
        }

        template <Hook Fn>
        static void LIVERELOAD_CALL HookThunk(void* host, void* state) {
            Fn(*static_cast<Host*>(host), *static_cast<State*>(state));
        }

        template <UpdateHook Fn>
        static int32_t LIVERELOAD_CALL UpdateThunk(void* host, void* state) {
            return static_cast<int32_t>(Fn(*static_cast<Host*>(host), *static_cast<State*>(state)));
        }

        LiveReloadApi_v1 m_api;
    };

    // Copies a built table into the host-provided output. The host pre-fills structSize; a
    // different value means host and module disagree on the table layout.
    inline int32_t Describe(LiveReloadApi_v1* outApi, const LiveReloadApi_v1& api) {
        if (!outApi) {
            return LIVERELOAD_STATUS_FAIL;
        }
        if (outApi->structSize != 0 && outApi->structSize != api.structSize) {
            return LIVERELOAD_STATUS_FAIL;
        }
        *outApi = api;
        return LIVERELOAD_STATUS_OK;
    }

} // namespace LiveReload
