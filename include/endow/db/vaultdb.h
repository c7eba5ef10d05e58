// ENDOW - Vault Database
// Copyright (c) 2026 ENDOW Developers
// MIT License
//
// Persists registry, ledgers and per-vault component state between keeper
// runs. Vaults themselves are rebuilt from configuration on start; the
// database restores what happened to them since.

#ifndef ENDOW_DB_VAULTDB_H
#define ENDOW_DB_VAULTDB_H

#include "endow/db/database.h"
#include "endow/vault/registry.h"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>

namespace endow {
namespace db {

/// Layout version written with every state snapshot
constexpr uint32_t VAULTDB_VERSION = 1;

class VaultDB {
public:
    /**
     * Open or create the vault database on disk.
     * @throws std::runtime_error if the database cannot be opened
     */
    explicit VaultDB(const std::filesystem::path& dbPath,
                     const Options& options = Options(),
                     bool wipe = false);
    
    /// Use an already opened database (MemoryDatabase in tests and dry runs)
    explicit VaultDB(std::unique_ptr<Database> db);
    
    VaultDB(const VaultDB&) = delete;
    VaultDB& operator=(const VaultDB&) = delete;
    
    // ========================================================================
    // Snapshots
    // ========================================================================
    
    /**
     * Write registry flags, the asset ledger and every vault's component
     * state in a single atomic batch.
     */
    Status WriteState(const vault::VaultRegistry& registry, const vault::Journaled& assets);
    
    /**
     * Restore state written by WriteState onto a registry rebuilt from
     * configuration. All or nothing: on any error the registry and ledger
     * are left as they were.
     *
     * @return NotFound for an empty database, Corruption if a stored vault
     *         does not match the configured one or a blob fails to decode
     */
    Status ReadState(vault::VaultRegistry& registry, vault::Journaled& assets);
    
    // ========================================================================
    // Records
    // ========================================================================
    
    std::optional<vault::Vault> ReadVault(const Address& owner) const;
    
    /**
     * Visit stored vault records in key order.
     * @return number of records visited
     */
    size_t ForEachVault(const std::function<bool(const vault::Vault&)>& func) const;
    
    std::optional<uint32_t> ReadVersion() const;
    
    uint64_t GetReadCount() const { return nReads_.load(); }
    uint64_t GetWriteCount() const { return nWrites_.load(); }
    
    const std::filesystem::path& GetPath() const { return dbPath_; }

private:
    /// Read and decode one component blob
    Status ReadBlob(const std::string& key, vault::Journaled& obj, bool required);
    
    /// NotFound if no record is stored, Corruption if it fails to decode
    Status ReadVaultRecord(const Address& owner, vault::Vault& record) const;
    
    std::unique_ptr<Database> db_;
    std::filesystem::path dbPath_;
    
    mutable std::atomic<uint64_t> nReads_{0};
    mutable std::atomic<uint64_t> nWrites_{0};
};

} // namespace db
} // namespace endow

#endif // ENDOW_DB_VAULTDB_H
