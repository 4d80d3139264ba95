#pragma once

#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <cstdint>

namespace curator {
namespace database {

class WriteBatch {
public:
    WriteBatch();
    ~WriteBatch();
    void put(const std::string& key, const std::vector<uint8_t>& value);
    void clear();
private:
    friend class Database;
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

class Database {
public:
    Database();
    ~Database();

    bool open(const std::string& path);
    void close();
    bool isOpen() const;

    std::vector<uint8_t> get(const std::string& key) const;

    // All-or-nothing; the batch is left untouched on failure.
    bool write(WriteBatch& batch);

    void forEach(const std::string& prefix, std::function<bool(const std::string&, const std::vector<uint8_t>&)> fn) const;

    std::string lastError() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
