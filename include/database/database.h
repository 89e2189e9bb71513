#pragma once

#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <cstdint>

namespace zackathon {
namespace database {

// Puts collected for one atomic Database::write.
class WriteBatch {
public:
    WriteBatch();
    ~WriteBatch();
    void put(const std::string& key, const std::vector<uint8_t>& value);
private:
    friend class Database;
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// SQLite-backed key/value store: one table kv(key TEXT PRIMARY KEY, value BLOB).
// Several connections may share a file; writers wait up to one second for
// the lock before failing.
class Database {
public:
    using Visitor = std::function<bool(const std::string&, const std::vector<uint8_t>&)>;

    Database();
    ~Database();

    bool open(const std::string& path);
    void close();
    bool isOpen() const;

    bool put(const std::string& key, const std::vector<uint8_t>& value);
    // Empty when the key is absent.
    std::vector<uint8_t> get(const std::string& key) const;

    // Applies every put in one transaction, or none of them.
    bool write(const WriteBatch& batch);

    // Visits keys with the prefix in key order until fn returns false.
    void forEach(const std::string& prefix, Visitor fn) const;

    std::string lastError() const;

    // Explicit transaction on this connection; holds the file's write lock
    // from the first write until rollback.
    bool beginTransaction();
    bool rollbackTransaction();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
