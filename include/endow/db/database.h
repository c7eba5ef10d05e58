// ENDOW - Database Abstraction Layer
// Copyright (c) 2026 ENDOW Developers
// MIT License
//
// Abstract key-value store used to persist vault state between keeper runs.
// LevelDB backs it on disk; MemoryDatabase serves tests and dry runs.

#ifndef ENDOW_DB_DATABASE_H
#define ENDOW_DB_DATABASE_H

#include "endow/core/types.h"
#include "endow/core/serialize.h"

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <ios>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace endow {
namespace db {

// ============================================================================
// Database Status - Result of database operations
// ============================================================================

class Status {
public:
    enum Code {
        OK = 0,
        NOT_FOUND = 1,
        CORRUPTION = 2,
        NOT_SUPPORTED = 3,
        INVALID_ARGUMENT = 4,
        IO_ERROR = 5,
    };
    
private:
    Code code_;
    std::string message_;
    
public:
    Status() : code_(OK) {}
    Status(Code code, const std::string& msg = "") : code_(code), message_(msg) {}
    
    static Status Ok() { return Status(); }
    static Status NotFound(const std::string& msg = "") { return Status(NOT_FOUND, msg); }
    static Status Corruption(const std::string& msg = "") { return Status(CORRUPTION, msg); }
    static Status NotSupported(const std::string& msg = "") { return Status(NOT_SUPPORTED, msg); }
    static Status InvalidArgument(const std::string& msg = "") { return Status(INVALID_ARGUMENT, msg); }
    static Status IOError(const std::string& msg = "") { return Status(IO_ERROR, msg); }
    
    bool ok() const { return code_ == OK; }
    bool IsNotFound() const { return code_ == NOT_FOUND; }
    bool IsCorruption() const { return code_ == CORRUPTION; }
    bool IsIOError() const { return code_ == IO_ERROR; }
    
    Code code() const { return code_; }
    const std::string& message() const { return message_; }
    
    std::string ToString() const;
};

// ============================================================================
// Slice - A non-owning reference to a byte range
// ============================================================================

class Slice {
private:
    const char* data_;
    size_t size_;
    
public:
    Slice() : data_(""), size_(0) {}
    Slice(const char* d, size_t n) : data_(d), size_(n) {}
    Slice(const std::string& s) : data_(s.data()), size_(s.size()) {}
    Slice(const char* s) : data_(s), size_(std::strlen(s)) {}
    
    const char* data() const { return data_; }
    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }
    
    char operator[](size_t n) const { return data_[n]; }
    
    std::string ToString() const { return std::string(data_, size_); }
    
    bool starts_with(const Slice& prefix) const {
        return size_ >= prefix.size_ && std::memcmp(data_, prefix.data_, prefix.size_) == 0;
    }
    
    int compare(const Slice& b) const {
        size_t min_len = std::min(size_, b.size_);
        int r = min_len == 0 ? 0 : std::memcmp(data_, b.data_, min_len);
        if (r == 0) {
            if (size_ < b.size_) r = -1;
            else if (size_ > b.size_) r = +1;
        }
        return r;
    }
    
    bool operator==(const Slice& b) const { return compare(b) == 0; }
    bool operator!=(const Slice& b) const { return !(*this == b); }
};

// ============================================================================
// Database Options
// ============================================================================

struct Options {
    bool create_if_missing = true;
    bool error_if_exists = false;
    bool paranoid_checks = false;
    
    /// Write buffer size (default 4MB)
    size_t write_buffer_size = 4 * 1024 * 1024;
    
    int max_open_files = 64;
    
    /// LRU cache size for blocks (default 8MB, 0 disables)
    size_t block_cache_size = 8 * 1024 * 1024;
    
    bool compression = true;
};

struct WriteOptions {
    /// Sync write to disk before returning
    bool sync = false;
};

// ============================================================================
// WriteBatch - Atomic batch of write operations
// ============================================================================

class WriteBatch {
private:
    std::vector<std::pair<std::string, std::optional<std::string>>> operations_;
    
public:
    void Put(const Slice& key, const Slice& value) {
        operations_.emplace_back(key.ToString(), value.ToString());
    }
    
    void Delete(const Slice& key) {
        operations_.emplace_back(key.ToString(), std::nullopt);
    }
    
    void Clear() { operations_.clear(); }
    size_t Count() const { return operations_.size(); }
    bool Empty() const { return operations_.empty(); }
    
    template<typename Func>
    void Iterate(Func&& func) const {
        for (const auto& [key, value] : operations_) {
            func(key, value);
        }
    }
};

// ============================================================================
// Iterator - Forward iterator over keys in order
// ============================================================================

class Iterator {
public:
    virtual ~Iterator() = default;
    
    virtual bool Valid() const = 0;
    virtual void SeekToFirst() = 0;
    
    /// Position at the first key >= target
    virtual void Seek(const Slice& target) = 0;
    
    virtual void Next() = 0;
    virtual Slice key() const = 0;
    virtual Slice value() const = 0;
    virtual Status status() const = 0;
};

// ============================================================================
// Database - Abstract database interface
// ============================================================================

class Database {
public:
    virtual ~Database() = default;
    
    virtual Status Get(const Slice& key, std::string* value) = 0;
    
    virtual Status Put(const WriteOptions& options, const Slice& key, const Slice& value) = 0;
    Status Put(const Slice& key, const Slice& value) {
        return Put(WriteOptions(), key, value);
    }
    
    virtual Status Delete(const WriteOptions& options, const Slice& key) = 0;
    Status Delete(const Slice& key) {
        return Delete(WriteOptions(), key);
    }
    
    /// Apply a batch of writes atomically
    virtual Status Write(const WriteOptions& options, WriteBatch* batch) = 0;
    Status Write(WriteBatch* batch) {
        return Write(WriteOptions(), batch);
    }
    
    virtual std::unique_ptr<Iterator> NewIterator() = 0;
    
    virtual bool Exists(const Slice& key) {
        std::string value;
        return Get(key, &value).ok();
    }
    
    /// Backend statistics for diagnostics
    virtual std::string GetStats() const { return ""; }
};

// ============================================================================
// Database Factory Functions
// ============================================================================

/**
 * Open (or create) a LevelDB database at the specified path.
 * @return Pair of (status, database pointer); pointer is null on failure
 */
std::pair<Status, std::unique_ptr<Database>> OpenDatabase(
    const std::filesystem::path& path,
    const Options& options = Options());

/// Delete all data of the database at path
Status DestroyDatabase(const std::filesystem::path& path);

// ============================================================================
// Serialization Helpers
// ============================================================================

template<typename T>
std::string SerializeToString(const T& obj) {
    DataStream ss;
    Serialize(ss, obj);
    return std::string(reinterpret_cast<const char*>(ss.data()), ss.size());
}

/// Decode obj from data. Fails on short input or trailing bytes.
template<typename T>
bool DeserializeFromString(const std::string& data, T& obj) {
    DataStream ss(reinterpret_cast<const uint8_t*>(data.data()), data.size());
    try {
        Unserialize(ss, obj);
    } catch (const std::ios_base::failure&) {
        return false;
    }
    return ss.empty();
}

// ============================================================================
// Key Prefixes for Database Namespacing
// ============================================================================

namespace prefix {
    constexpr char VAULT = 'v';           // owner -> vault record
    constexpr char TOKEN = 't';           // owner -> token ledger state
    constexpr char TREASURY = 'r';        // owner -> treasury state
    constexpr char DONATION = 'd';        // owner -> donation forwarder state
    constexpr char GUARD = 'g';           // owner -> launch guard state
    constexpr char ASSETS = 'a';          // -> asset ledger state
    constexpr char FLAG = 'F';            // name -> flag value
    constexpr char VERSION = 'V';         // -> schema version
}

/// Create a prefixed database key
inline std::string MakeKey(char prefix) {
    return std::string(1, prefix);
}

template<typename T>
std::string MakeKey(char prefix, const T& obj) {
    std::string result(1, prefix);
    result += SerializeToString(obj);
    return result;
}

} // namespace db
} // namespace endow

#endif // ENDOW_DB_DATABASE_H
