// ENDOW - Vault Database
// Copyright (c) 2026 ENDOW Developers
// MIT License

#include "endow/db/vaultdb.h"
#include "endow/vault/journal.h"
#include "endow/util/logging.h"

#include <ios>
#include <stdexcept>
#include <vector>

namespace endow {
namespace db {

namespace {

const char* const REGISTRY_FLAG = "registry";

std::string BytesToString(const std::vector<uint8_t>& bytes) {
    return std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

std::vector<uint8_t> StringToBytes(const std::string& str) {
    return std::vector<uint8_t>(str.begin(), str.end());
}

bool SameIdentity(const vault::Vault& a, const vault::Vault& b) {
    return a.owner == b.owner && a.token == b.token && a.asset == b.asset &&
           a.treasury == b.treasury && a.donation == b.donation && a.guard == b.guard &&
           a.poolKey == b.poolKey;
}

} // namespace

VaultDB::VaultDB(const std::filesystem::path& dbPath, const Options& options, bool wipe)
    : dbPath_(dbPath) {
    if (wipe) {
        Status status = DestroyDatabase(dbPath);
        if (!status.ok() && !status.IsNotFound()) {
            LOG_WARN(util::LogCategory::DB) << "Failed to wipe " << dbPath.string()
                                            << ": " << status.ToString();
        }
    }
    
    auto [status, db] = OpenDatabase(dbPath, options);
    if (!status.ok()) {
        throw std::runtime_error("Failed to open vault database: " + status.ToString());
    }
    db_ = std::move(db);
    LOG_INFO(util::LogCategory::DB) << "Opened vault database at " << dbPath.string();
}

VaultDB::VaultDB(std::unique_ptr<Database> db) : db_(std::move(db)) {
    if (!db_) {
        throw std::invalid_argument("VaultDB requires a database");
    }
}

Status VaultDB::WriteState(const vault::VaultRegistry& registry, const vault::Journaled& assets) {
    WriteBatch batch;
    
    DataStream version;
    version << VAULTDB_VERSION;
    batch.Put(MakeKey(prefix::VERSION), BytesToString(version.ToBytes()));
    batch.Put(MakeKey(prefix::FLAG, std::string(REGISTRY_FLAG)),
              BytesToString(vault::SaveToBytes(registry)));
    batch.Put(MakeKey(prefix::ASSETS), BytesToString(vault::SaveToBytes(assets)));
    
    registry.ForEachVault([&](const vault::VaultHandle& handle) {
        const Address& owner = handle.Owner();
        batch.Put(MakeKey(prefix::VAULT, owner), SerializeToString(handle.Record()));
        batch.Put(MakeKey(prefix::TOKEN, owner), BytesToString(vault::SaveToBytes(handle.Token())));
        batch.Put(MakeKey(prefix::TREASURY, owner),
                  BytesToString(vault::SaveToBytes(handle.Treasury())));
        batch.Put(MakeKey(prefix::DONATION, owner),
                  BytesToString(vault::SaveToBytes(handle.Donation())));
        batch.Put(MakeKey(prefix::GUARD, owner), BytesToString(vault::SaveToBytes(handle.Guard())));
    });
    
    WriteOptions options;
    options.sync = true;
    Status status = db_->Write(options, &batch);
    if (status.ok()) {
        nWrites_ += batch.Count();
        LOG_DEBUG(util::LogCategory::DB) << "Wrote state of " << registry.Size() << " vault(s)";
    }
    return status;
}

Status VaultDB::ReadBlob(const std::string& key, vault::Journaled& obj, bool required) {
    std::string value;
    Status status = db_->Get(key, &value);
    ++nReads_;
    if (status.IsNotFound() && !required) {
        return Status::Ok();
    }
    if (!status.ok()) {
        return status;
    }
    try {
        vault::LoadFromBytes(obj, StringToBytes(value));
    } catch (const std::ios_base::failure& e) {
        return Status::Corruption(e.what());
    }
    return Status::Ok();
}

Status VaultDB::ReadState(vault::VaultRegistry& registry, vault::Journaled& assets) {
    std::optional<uint32_t> version = ReadVersion();
    if (!version) {
        return Status::NotFound("no stored vault state");
    }
    if (*version != VAULTDB_VERSION) {
        return Status::NotSupported("vault database version " + std::to_string(*version));
    }
    
    std::vector<vault::Journaled*> participants{&registry, &assets};
    std::vector<vault::VaultHandle*> handles;
    registry.ForEachVault([&](vault::VaultHandle& handle) {
        handles.push_back(&handle);
        participants.push_back(&handle.Token());
        participants.push_back(&handle.Treasury());
        participants.push_back(&handle.Donation());
        participants.push_back(&handle.Guard());
    });
    vault::ScopedTransaction tx(participants);
    
    Status status = ReadBlob(MakeKey(prefix::FLAG, std::string(REGISTRY_FLAG)), registry, true);
    if (!status.ok()) return status;
    status = ReadBlob(MakeKey(prefix::ASSETS), assets, true);
    if (!status.ok()) return status;
    
    size_t restored = 0;
    for (vault::VaultHandle* handle : handles) {
        const Address& owner = handle->Owner();
        vault::Vault stored;
        status = ReadVaultRecord(owner, stored);
        if (status.IsNotFound()) {
            // Added to the configuration since the last run
            LOG_INFO(util::LogCategory::DB) << "No stored state for vault " << owner.ToShortString();
            continue;
        }
        if (!status.ok()) return status;
        if (!SameIdentity(stored, handle->Record())) {
            return Status::Corruption("stored vault " + owner.ToString() +
                                      " does not match configuration");
        }
        
        status = ReadBlob(MakeKey(prefix::TOKEN, owner), handle->Token(), true);
        if (!status.ok()) return status;
        status = ReadBlob(MakeKey(prefix::TREASURY, owner), handle->Treasury(), true);
        if (!status.ok()) return status;
        status = ReadBlob(MakeKey(prefix::DONATION, owner), handle->Donation(), true);
        if (!status.ok()) return status;
        status = ReadBlob(MakeKey(prefix::GUARD, owner), handle->Guard(), true);
        if (!status.ok()) return status;
        ++restored;
    }
    
    tx.Commit();
    LOG_INFO(util::LogCategory::DB) << "Restored state of " << restored << " vault(s)";
    return Status::Ok();
}

Status VaultDB::ReadVaultRecord(const Address& owner, vault::Vault& record) const {
    std::string value;
    Status status = db_->Get(MakeKey(prefix::VAULT, owner), &value);
    ++nReads_;
    if (!status.ok()) {
        return status;
    }
    if (!DeserializeFromString(value, record)) {
        LOG_ERROR(util::LogCategory::DB) << "Undecodable vault record for " << owner.ToString();
        return Status::Corruption("undecodable vault record for " + owner.ToString());
    }
    return Status::Ok();
}

std::optional<vault::Vault> VaultDB::ReadVault(const Address& owner) const {
    vault::Vault record;
    if (!ReadVaultRecord(owner, record).ok()) {
        return std::nullopt;
    }
    return record;
}

size_t VaultDB::ForEachVault(const std::function<bool(const vault::Vault&)>& func) const {
    size_t count = 0;
    auto iter = db_->NewIterator();
    std::string vaultPrefix = MakeKey(prefix::VAULT);
    iter->Seek(Slice(vaultPrefix));
    
    while (iter->Valid()) {
        Slice key = iter->key();
        if (key.size() < 1 || key[0] != prefix::VAULT) {
            break;
        }
        vault::Vault record;
        if (DeserializeFromString(iter->value().ToString(), record)) {
            ++count;
            if (!func(record)) {
                break;
            }
        }
        iter->Next();
    }
    return count;
}

std::optional<uint32_t> VaultDB::ReadVersion() const {
    std::string value;
    ++nReads_;
    if (!db_->Get(MakeKey(prefix::VERSION), &value).ok()) {
        return std::nullopt;
    }
    uint32_t version = 0;
    if (!DeserializeFromString(value, version)) {
        return std::nullopt;
    }
    return version;
}

} // namespace db
} // namespace endow
