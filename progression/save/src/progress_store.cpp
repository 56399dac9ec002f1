#include <progression/save/progress_store.hpp>
#include <progression/core/log.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace progression::save {

namespace fs = std::filesystem;

// ============================================================================
// FileProgressStore
// ============================================================================

FileProgressStore::FileProgressStore(std::string path)
    : m_path(std::move(path)) {
}

std::optional<std::string> FileProgressStore::read() {
    std::error_code ec;
    if (!fs::exists(m_path, ec)) {
        return std::nullopt;
    }

    std::ifstream file(m_path, std::ios::binary);
    if (!file.is_open()) {
        core::log_error("save", "Failed to open save file: {}", m_path);
        return std::nullopt;
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    return contents.str();
}

bool FileProgressStore::write(const std::string& blob) {
    std::error_code ec;

    fs::path parent = fs::path(m_path).parent_path();
    if (!parent.empty() && !fs::exists(parent, ec)) {
        fs::create_directories(parent, ec);
        if (ec) {
            core::log_error("save", "Failed to create save directory {}: {}", parent.string(), ec.message());
            return false;
        }
    }

    // Write to temp file first for atomic operation
    std::string temp_path = m_path + ".tmp";

    std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        core::log_error("save", "Failed to open temp save file: {}", temp_path);
        return false;
    }

    file.write(blob.data(), static_cast<std::streamsize>(blob.size()));
    file.flush();
    if (!file.good()) {
        file.close();
        fs::remove(temp_path, ec);
        core::log_error("save", "Failed to write temp save file: {}", temp_path);
        return false;
    }
    file.close();

    // Atomic rename: replace target file with temp file
    fs::rename(temp_path, m_path, ec);
    if (ec) {
        core::log_error("save", "Failed to rename temp save file: {}", ec.message());
        std::error_code ignored;
        fs::remove(temp_path, ignored);
        return false;
    }

    return true;
}

bool FileProgressStore::exists() const {
    std::error_code ec;
    return fs::exists(m_path, ec);
}

bool FileProgressStore::remove() {
    std::error_code ec;
    return fs::remove(m_path, ec);
}

// ============================================================================
// MemoryProgressStore
// ============================================================================

bool MemoryProgressStore::write(const std::string& blob) {
    if (m_fail_writes) {
        return false;
    }
    m_blob = blob;
    ++m_write_count;
    return true;
}

} // namespace progression::save
