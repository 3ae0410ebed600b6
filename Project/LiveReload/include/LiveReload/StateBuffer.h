#pragma once
// StateBuffer.h
//
// The opaque byte region handed to every lifecycle call, and the only thing that survives a
// reload.
//
//  - Storage is allocated in 64-bit words so any State record the module declares is suitably
//    aligned; Size() reports exactly the bytes the module asked for.
//  - Resizing keeps the overlapping prefix. Newly added bytes read as zero, including bytes that
//    were discarded by an earlier shrink.
//  - Pointer() and View() are invalidated by EnsureCapacity(), Restore() and Release().

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace LiveReload {

    // Immutable copy of a state buffer's bytes. Carries no layout information.
    class SaveState {
    public:
        SaveState() = default;
        explicit SaveState(std::vector<uint8_t> bytes) : m_bytes(std::move(bytes)) {}

        const std::vector<uint8_t>& Bytes() const { return m_bytes; }
        size_t Size() const { return m_bytes.size(); }

        bool operator==(const SaveState& other) const { return m_bytes == other.m_bytes; }
        bool operator!=(const SaveState& other) const { return !(*this == other); }

    private:
        std::vector<uint8_t> m_bytes;
    };

    // Pointer + size over the state buffer. Nothing checks that the bytes actually hold a T;
    // after a reload they hold whatever the previous module wrote.
    class UnsafeStateView {
    public:
        UnsafeStateView() = default;
        UnsafeStateView(void* data, size_t size) : m_data(data), m_size(size) {}

        void* Data() const { return m_data; }
        size_t Size() const { return m_size; }

        // Null when the view is smaller than T.
        template <typename T>
        T* As() const {
            if (!m_data || m_size < sizeof(T)) {
                return nullptr;
            }
            return static_cast<T*>(m_data);
        }

    private:
        void* m_data = nullptr;
        size_t m_size = 0;
    };

    class StateBuffer {
    public:
        StateBuffer() = default;

        StateBuffer(const StateBuffer&) = delete;
        StateBuffer& operator=(const StateBuffer&) = delete;

        // Resize to exactly 'bytes', preserving the common prefix.
        void EnsureCapacity(size_t bytes);

        void* Pointer();
        UnsafeStateView View();

        size_t Size() const { return m_size; }
        // Bytes actually allocated (a whole number of words, at least one once sized).
        size_t Capacity() const { return m_words.size() * sizeof(uint64_t); }

        SaveState Snapshot() const;

        // Replaces contents and size with the snapshot's bytes. No compatibility check.
        void Restore(const SaveState& state);

        void Release();

    private:
        static size_t WordsFor(size_t bytes);
        void ResizeStorage(size_t bytes);

        std::vector<uint64_t> m_words;
        size_t m_size = 0;
    };

} // namespace LiveReload
