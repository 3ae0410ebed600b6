// StateBuffer.cpp
#include "LiveReload/StateBuffer.h"
#include "LiveReload/Logging.hpp"

#include <algorithm>
#include <cstring>

namespace LiveReload {

    size_t StateBuffer::WordsFor(size_t bytes) {
        const size_t words = (bytes + sizeof(uint64_t) - 1) / sizeof(uint64_t);
        return std::max<size_t>(words, 1);
    }

    void StateBuffer::ResizeStorage(size_t bytes) {
        // Discarded bytes must read as zero after a later growth.
        if (bytes < m_size && !m_words.empty()) {
            auto* raw = reinterpret_cast<uint8_t*>(m_words.data());
            std::memset(raw + bytes, 0, m_size - bytes);
        }
        m_words.resize(WordsFor(bytes), 0);
        m_size = bytes;
    }

    void StateBuffer::EnsureCapacity(size_t bytes) {
        if (bytes == m_size && !m_words.empty()) {
            return;
        }
        const size_t previous = m_size;
        ResizeStorage(bytes);
        LIVERELOAD_PRINT(ReloadLogging::LogLevel::Debug, "[StateBuffer] Resized ", previous, " -> ", bytes, " bytes");
    }

    void* StateBuffer::Pointer() {
        if (m_words.empty()) {
            ResizeStorage(0);
        }
        return m_words.data();
    }

    UnsafeStateView StateBuffer::View() {
        return UnsafeStateView(Pointer(), m_size);
    }

    SaveState StateBuffer::Snapshot() const {
        std::vector<uint8_t> bytes(m_size);
        if (m_size > 0) {
            std::memcpy(bytes.data(), m_words.data(), m_size);
        }
        return SaveState(std::move(bytes));
    }

    void StateBuffer::Restore(const SaveState& state) {
        const std::vector<uint8_t>& bytes = state.Bytes();
        m_words.assign(WordsFor(bytes.size()), 0);
        if (!bytes.empty()) {
            std::memcpy(m_words.data(), bytes.data(), bytes.size());
        }
        m_size = bytes.size();
    }

    void StateBuffer::Release() {
        m_words.clear();
        m_words.shrink_to_fit();
        m_size = 0;
    }

} // namespace LiveReload
