// StateBufferTests.cpp
#include <catch2/catch.hpp>

#include "LiveReload/StateBuffer.h"

#include <cstdint>
#include <cstring>
#include <vector>

using namespace LiveReload;

namespace {

    std::vector<uint8_t> ReadBytes(StateBuffer& buffer, size_t count) {
        std::vector<uint8_t> out(count);
        std::memcpy(out.data(), buffer.Pointer(), count);
        return out;
    }

} // namespace

TEST_CASE("StateBuffer starts empty", "[state]") {
    StateBuffer buffer;
    REQUIRE(buffer.Size() == 0);
    REQUIRE(buffer.Capacity() == 0);
}

TEST_CASE("StateBuffer allocates whole words and reports the exact size", "[state]") {
    StateBuffer buffer;

    SECTION("non-multiple of eight") {
        buffer.EnsureCapacity(12);
        REQUIRE(buffer.Size() == 12);
        REQUIRE(buffer.Capacity() == 16);
        REQUIRE(ReadBytes(buffer, 12) == std::vector<uint8_t>(12, 0));
    }

    SECTION("zero bytes still gets one word") {
        buffer.EnsureCapacity(0);
        REQUIRE(buffer.Size() == 0);
        REQUIRE(buffer.Capacity() == 8);
        REQUIRE(buffer.Pointer() != nullptr);
    }

    SECTION("storage is word aligned") {
        buffer.EnsureCapacity(3);
        REQUIRE(reinterpret_cast<uintptr_t>(buffer.Pointer()) % alignof(uint64_t) == 0);
    }
}

TEST_CASE("StateBuffer growth keeps the prefix and zero-fills", "[state]") {
    StateBuffer buffer;
    buffer.EnsureCapacity(8);
    std::memset(buffer.Pointer(), 0x5A, 8);

    buffer.EnsureCapacity(20);

    const std::vector<uint8_t> bytes = ReadBytes(buffer, 20);
    REQUIRE(std::vector<uint8_t>(bytes.begin(), bytes.begin() + 8) == std::vector<uint8_t>(8, 0x5A));
    REQUIRE(std::vector<uint8_t>(bytes.begin() + 8, bytes.end()) == std::vector<uint8_t>(12, 0));
}

TEST_CASE("StateBuffer shrink clears the discarded bytes", "[state]") {
    StateBuffer buffer;
    buffer.EnsureCapacity(16);
    std::memset(buffer.Pointer(), 0xFF, 16);

    buffer.EnsureCapacity(12);
    REQUIRE(buffer.Size() == 12);
    REQUIRE(ReadBytes(buffer, 12) == std::vector<uint8_t>(12, 0xFF));

    buffer.EnsureCapacity(16);
    const std::vector<uint8_t> bytes = ReadBytes(buffer, 16);
    REQUIRE(std::vector<uint8_t>(bytes.begin() + 12, bytes.end()) == std::vector<uint8_t>(4, 0));
}

TEST_CASE("UnsafeStateView refuses types larger than the view", "[state]") {
    struct Wide {
        uint64_t a;
        uint64_t b;
    };

    StateBuffer buffer;
    buffer.EnsureCapacity(8);
    UnsafeStateView view = buffer.View();

    REQUIRE(view.Size() == 8);
    REQUIRE(view.As<uint64_t>() != nullptr);
    REQUIRE(view.As<Wide>() == nullptr);

    *view.As<uint64_t>() = 42;
    REQUIRE(*buffer.View().As<uint64_t>() == 42);

    REQUIRE(UnsafeStateView().As<uint8_t>() == nullptr);
}

TEST_CASE("StateBuffer snapshot and restore", "[state]") {
    StateBuffer buffer;
    buffer.EnsureCapacity(16);
    for (size_t i = 0; i < 16; ++i) {
        static_cast<uint8_t*>(buffer.Pointer())[i] = static_cast<uint8_t>(i * 3);
    }

    const SaveState snapshot = buffer.Snapshot();
    REQUIRE(snapshot.Size() == 16);
    REQUIRE(snapshot.Bytes()[5] == 15);

    SECTION("restore replaces size and contents exactly") {
        const SaveState small(std::vector<uint8_t>{ 1, 2, 3, 4, 5 });
        buffer.Restore(small);
        REQUIRE(buffer.Size() == 5);
        REQUIRE(buffer.Snapshot() == small);

        buffer.Restore(snapshot);
        REQUIRE(buffer.Size() == 16);
        REQUIRE(buffer.Snapshot() == snapshot);
    }

    SECTION("snapshots are independent copies") {
        std::memset(buffer.Pointer(), 0, 16);
        REQUIRE(buffer.Snapshot() != snapshot);
        REQUIRE(snapshot.Bytes()[5] == 15);
    }
}

TEST_CASE("SaveState compares by bytes", "[state]") {
    REQUIRE(SaveState(std::vector<uint8_t>{ 1, 2 }) == SaveState(std::vector<uint8_t>{ 1, 2 }));
    REQUIRE(SaveState(std::vector<uint8_t>{ 1, 2 }) != SaveState(std::vector<uint8_t>{ 1, 2, 0 }));
    REQUIRE(SaveState() == SaveState(std::vector<uint8_t>{}));
}

TEST_CASE("StateBuffer release frees the storage", "[state]") {
    StateBuffer buffer;
    buffer.EnsureCapacity(32);
    buffer.Release();
    REQUIRE(buffer.Size() == 0);
    REQUIRE(buffer.Capacity() == 0);
}
