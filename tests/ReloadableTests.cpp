// ReloadableTests.cpp
// Orchestrator state machine against the in-process stub loader.

#include <catch2/catch.hpp>

#include "LiveReload/Reloadable.h"
#include "LiveReload/ReloadError.h"
#include "StubModules.h"
#include "TestUtils.h"

#include <cstring>
#include <vector>

using namespace LiveReload;
using Stubs::CallLog;
using Stubs::StubLoader;

namespace {

    struct Fixture {
        Fixture() : log(std::make_shared<CallLog>()), loader(std::make_shared<StubLoader>(log)) {
            modulePath = dir.File("stub_module.bin");
            TestUtils::WriteTextFile(modulePath, "stub");
            settings.watch.debounceMs = 50;
            settings.watch.pollIntervalMs = 20;
            // Fill the state with 1, 2, 3, ... so prefix checks have something to compare.
            loader->onInit = [](void*, void* state, size_t size) {
                auto* bytes = static_cast<uint8_t*>(state);
                for (size_t i = 0; i < size; ++i) bytes[i] = static_cast<uint8_t>(i + 1);
            };
        }

        std::unique_ptr<ReloadableCore> Make() {
            return std::make_unique<ReloadableCore>(modulePath, &hostValue, 0, settings, loader);
        }

        TestUtils::TempDir dir;
        std::string modulePath;
        ReloadSettings settings;
        std::shared_ptr<CallLog> log;
        std::shared_ptr<StubLoader> loader;
        int hostValue = 0;
    };

    std::vector<uint8_t> Bytes(std::initializer_list<int> values) {
        std::vector<uint8_t> out;
        for (int v : values) out.push_back(static_cast<uint8_t>(v));
        return out;
    }

    struct CounterHost {
        int ticks = 0;
    };

} // namespace

TEST_CASE("Construction loads the module and calls init once", "[reloadable]") {
    Fixture f;
    auto core = f.Make();

    REQUIRE(core->IsLoaded());
    REQUIRE(core->StateSize() == 8);
    REQUIRE(f.log->calls == std::vector<std::string>{ "load#1", "init#1" });
    REQUIRE(core->Path() == std::filesystem::canonical(f.modulePath).string());
}

TEST_CASE("Reload without a change does nothing", "[reloadable]") {
    Fixture f;
    auto core = f.Make();

    core->Reload();
    core->Reload();
    core->Reload();

    REQUIRE(f.log->calls == std::vector<std::string>{ "load#1", "init#1" });
}

TEST_CASE("ReloadNow unloads, releases, then reloads the new module", "[reloadable]") {
    Fixture f;
    auto core = f.Make();

    core->ReloadNow();

    REQUIRE(f.log->calls == std::vector<std::string>{
        "load#1", "init#1", "unload#1", "release#1", "load#2", "reload#2" });
    REQUIRE(f.log->Count("init#2") == 0);
    REQUIRE(core->IsLoaded());
}

TEST_CASE("A manual request is picked up by the next Reload", "[reloadable]") {
    Fixture f;
    auto core = f.Make();

    core->RequestReload("test");
    core->Reload();

    REQUIRE(f.loader->loads == 2);
    REQUIRE(f.log->Count("reload#2") == 1);

    core->Reload();
    REQUIRE(f.loader->loads == 2);
}

TEST_CASE("Update forwards to the loaded module", "[reloadable]") {
    Fixture f;
    f.loader->onUpdate = [](void*, void* state, size_t) { static_cast<uint8_t*>(state)[0] += 10; };
    auto core = f.Make();

    REQUIRE(core->Update() == ShouldQuit::No);
    REQUIRE(core->StateView().As<uint8_t>()[0] == 11);

    f.loader->updateResult = ShouldQuit::Yes;
    core->ReloadNow();
    REQUIRE(core->Update() == ShouldQuit::Yes);
}

TEST_CASE("A failed reload leaves the module unloaded and is retried", "[reloadable]") {
    Fixture f;
    auto core = f.Make();
    const SaveState before = core->SaveSnapshot();

    f.loader->fail = true;
    REQUIRE_THROWS_AS(core->ReloadNow(), LoadError);

    REQUIRE_FALSE(core->IsLoaded());
    REQUIRE(core->SaveSnapshot() == before);
    REQUIRE(f.log->Count("unload#1") == 1);
    REQUIRE(f.log->Count("release#1") == 1);

    SECTION("Update while unloaded makes no call") {
        const size_t callsBefore = f.log->calls.size();
        REQUIRE(core->Update() == ShouldQuit::No);
        REQUIRE(f.log->calls.size() == callsBefore);
    }

    SECTION("Reload retries without a file event") {
        REQUIRE_THROWS_AS(core->Reload(), LoadError);
        REQUIRE(f.log->Count("load-failed") == 2);

        f.loader->fail = false;
        core->Reload();
        REQUIRE(core->IsLoaded());
        REQUIRE(f.log->calls.back() == "reload#2");
        REQUIRE(f.log->Count("init#2") == 0);
        REQUIRE(core->SaveSnapshot() == before);
    }

    SECTION("Shutdown does not call deinit") {
        core->Shutdown();
        REQUIRE(f.log->Count("deinit#1") == 0);
    }
}

TEST_CASE("Reload keeps the state prefix when the state grows or shrinks", "[reloadable]") {
    Fixture f;
    auto core = f.Make();
    REQUIRE(core->SaveSnapshot().Bytes() == Bytes({ 1, 2, 3, 4, 5, 6, 7, 8 }));

    SECTION("growth zero-fills the tail") {
        f.loader->nextStateSize = 12;
        core->ReloadNow();
        REQUIRE(core->StateSize() == 12);
        REQUIRE(core->SaveSnapshot().Bytes() == Bytes({ 1, 2, 3, 4, 5, 6, 7, 8, 0, 0, 0, 0 }));
    }

    SECTION("shrink drops the tail") {
        f.loader->nextStateSize = 4;
        core->ReloadNow();
        REQUIRE(core->StateSize() == 4);
        REQUIRE(core->SaveSnapshot().Bytes() == Bytes({ 1, 2, 3, 4 }));
    }
}

TEST_CASE("Snapshots round-trip through the orchestrator", "[reloadable]") {
    Fixture f;
    auto core = f.Make();

    const SaveState snapshot(Bytes({ 9, 8, 7, 6, 5, 4, 3, 2 }));
    core->LoadSnapshot(snapshot);
    REQUIRE(core->SaveSnapshot() == snapshot);
    REQUIRE(*core->StateView().As<uint8_t>() == 9);
}

TEST_CASE("Shutdown calls deinit once and is idempotent", "[reloadable]") {
    Fixture f;
    auto core = f.Make();

    core->Shutdown();
    core->Shutdown();

    REQUIRE(f.log->Count("deinit#1") == 1);
    REQUIRE(f.log->Count("release#1") == 1);
    REQUIRE(core->IsShutDown());
    REQUIRE_FALSE(core->IsLoaded());
    REQUIRE(core->StateSize() == 0);

    const size_t callsBefore = f.log->calls.size();
    core->RequestReload();
    core->Reload();
    core->ReloadNow();
    REQUIRE(core->Update() == ShouldQuit::No);
    REQUIRE(f.log->calls.size() == callsBefore);

    core.reset();
    REQUIRE(f.log->Count("deinit#1") == 1);
}

TEST_CASE("Destruction calls deinit once", "[reloadable]") {
    Fixture f;
    {
        auto core = f.Make();
        core->Update();
    }
    REQUIRE(f.log->calls == std::vector<std::string>{ "load#1", "init#1", "update#1", "deinit#1", "release#1" });
}

TEST_CASE("Construction failures throw", "[reloadable]") {
    Fixture f;

    SECTION("missing file") {
        try {
            ReloadableCore core(f.dir.File("missing.bin"), &f.hostValue, 0, f.settings, f.loader);
            FAIL("expected LoadError");
        }
        catch (const LoadError& e) {
            REQUIRE(e.Kind() == LoadErrorKind::NotFound);
        }
        REQUIRE(f.loader->loads == 0);
    }

    SECTION("loader failure") {
        f.loader->fail = true;
        REQUIRE_THROWS_AS(ReloadableCore(f.modulePath, &f.hostValue, 0, f.settings, f.loader), LoadError);
        REQUIRE(f.log->Count("init#1") == 0);
    }
}

TEST_CASE("Reloadable owns the host and passes it to the module", "[reloadable]") {
    Fixture f;
    f.loader->onUpdate = [](void* host, void*, size_t) { static_cast<CounterHost*>(host)->ticks++; };

    Reloadable<CounterHost> reloadable(f.modulePath, CounterHost{}, f.settings, f.loader);
    reloadable.Update();
    reloadable.Update();

    REQUIRE(reloadable.GetHost().ticks == 2);

    const Reloadable<CounterHost>& constRef = reloadable;
    REQUIRE(constRef.GetHost().ticks == 2);

    reloadable.ReloadNow();
    reloadable.Update();
    REQUIRE(reloadable.GetHost().ticks == 3);
}

TEST_CASE("A failed reload leaves the host untouched", "[reloadable]") {
    Fixture f;
    f.loader->onUpdate = [](void* host, void*, size_t) { static_cast<CounterHost*>(host)->ticks++; };

    Reloadable<CounterHost> reloadable(f.modulePath, CounterHost{}, f.settings, f.loader);
    reloadable.Update();
    reloadable.Update();
    const int ticksBefore = reloadable.GetHost().ticks;
    REQUIRE(ticksBefore == 2);

    f.loader->fail = true;
    REQUIRE_THROWS_AS(reloadable.ReloadNow(), LoadError);
    REQUIRE_FALSE(reloadable.IsLoaded());
    REQUIRE(reloadable.GetHost().ticks == ticksBefore);

    REQUIRE(reloadable.Update() == ShouldQuit::No);
    REQUIRE(reloadable.GetHost().ticks == ticksBefore);

    f.loader->fail = false;
    reloadable.Reload();
    REQUIRE(reloadable.IsLoaded());
    REQUIRE(reloadable.GetHost().ticks == ticksBefore);

    reloadable.Update();
    REQUIRE(reloadable.GetHost().ticks == ticksBefore + 1);
}
