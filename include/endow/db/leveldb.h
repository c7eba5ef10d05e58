// ENDOW - LevelDB Wrapper
// Copyright (c) 2026 ENDOW Developers
// MIT License
//
// LevelDB and in-memory implementations of the database interface.

#ifndef ENDOW_DB_LEVELDB_H
#define ENDOW_DB_LEVELDB_H

#include "endow/db/database.h"

#include <leveldb/cache.h>
#include <leveldb/db.h>
#include <leveldb/write_batch.h>

#include <map>
#include <mutex>

namespace endow {
namespace db {

/// Map a LevelDB status onto ours
Status FromLevelDBStatus(const leveldb::Status& s);

// ============================================================================
// LevelDB Database Implementation
// ============================================================================

class LevelDBIterator : public Iterator {
private:
    std::unique_ptr<leveldb::Iterator> iter_;
    
public:
    explicit LevelDBIterator(leveldb::Iterator* iter) : iter_(iter) {}
    
    bool Valid() const override { return iter_->Valid(); }
    void SeekToFirst() override { iter_->SeekToFirst(); }
    void Seek(const Slice& target) override {
        iter_->Seek(leveldb::Slice(target.data(), target.size()));
    }
    void Next() override { iter_->Next(); }
    
    Slice key() const override {
        leveldb::Slice k = iter_->key();
        return Slice(k.data(), k.size());
    }
    
    Slice value() const override {
        leveldb::Slice v = iter_->value();
        return Slice(v.data(), v.size());
    }
    
    Status status() const override { return FromLevelDBStatus(iter_->status()); }
};

class LevelDBDatabase : public Database {
private:
    // Declaration order matters: db_ must be destroyed before cache_
    std::unique_ptr<leveldb::Cache> cache_;
    std::unique_ptr<leveldb::DB> db_;
    
public:
    LevelDBDatabase(leveldb::DB* db, leveldb::Cache* cache)
        : cache_(cache), db_(db) {}
    
    Status Get(const Slice& key, std::string* value) override;
    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override;
    Status Delete(const WriteOptions& options, const Slice& key) override;
    Status Write(const WriteOptions& options, WriteBatch* batch) override;
    std::unique_ptr<Iterator> NewIterator() override;
    std::string GetStats() const override;
};

// ============================================================================
// In-Memory Database
// ============================================================================

class MemoryDatabase : public Database {
private:
    std::map<std::string, std::string> data_;
    mutable std::mutex mutex_;
    
public:
    MemoryDatabase() = default;
    
    Status Get(const Slice& key, std::string* value) override;
    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override;
    Status Delete(const WriteOptions& options, const Slice& key) override;
    Status Write(const WriteOptions& options, WriteBatch* batch) override;
    
    /// Iterates over a copy taken at creation time
    std::unique_ptr<Iterator> NewIterator() override;
    
    size_t Size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return data_.size();
    }
};

class MemoryIterator : public Iterator {
private:
    std::map<std::string, std::string> data_;
    std::map<std::string, std::string>::const_iterator iter_;
    
public:
    explicit MemoryIterator(std::map<std::string, std::string> data)
        : data_(std::move(data)), iter_(data_.end()) {}
    
    bool Valid() const override { return iter_ != data_.end(); }
    void SeekToFirst() override { iter_ = data_.begin(); }
    void Seek(const Slice& target) override { iter_ = data_.lower_bound(target.ToString()); }
    void Next() override {
        if (iter_ != data_.end()) ++iter_;
    }
    Slice key() const override { return Slice(iter_->first); }
    Slice value() const override { return Slice(iter_->second); }
    Status status() const override { return Status::Ok(); }
};

} // namespace db
} // namespace endow

#endif // ENDOW_DB_LEVELDB_H
