#pragma once

#include <string>
#include <optional>

namespace progression::save {

// ============================================================================
// IProgressStore - Durable slot holding the serialized progress document
// ============================================================================

class IProgressStore {
public:
    virtual ~IProgressStore() = default;

    // nullopt when nothing has been stored yet or the slot cannot be read
    virtual std::optional<std::string> read() = 0;

    // Replaces the stored document. Returns false on failure, leaving the
    // previous document intact.
    virtual bool write(const std::string& blob) = 0;
};

// Writes to "<path>.tmp" and renames it over the target so a crash mid-write
// never leaves a truncated save behind
class FileProgressStore : public IProgressStore {
public:
    explicit FileProgressStore(std::string path);

    std::optional<std::string> read() override;
    bool write(const std::string& blob) override;

    bool exists() const;
    bool remove();

    const std::string& path() const { return m_path; }

private:
    std::string m_path;
};

// Keeps the document in memory. For tests and hosts with their own storage.
class MemoryProgressStore : public IProgressStore {
public:
    std::optional<std::string> read() override { return m_blob; }
    bool write(const std::string& blob) override;

    // Makes subsequent writes fail
    void set_fail_writes(bool fail) { m_fail_writes = fail; }

    const std::optional<std::string>& blob() const { return m_blob; }
    void set_blob(std::string blob) { m_blob = std::move(blob); }
    int write_count() const { return m_write_count; }
    void clear() { m_blob.reset(); }

private:
    std::optional<std::string> m_blob;
    bool m_fail_writes = false;
    int m_write_count = 0;
};

} // namespace progression::save
