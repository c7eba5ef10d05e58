// ENDOW - State Journal
// Copyright (c) 2026 ENDOW Developers
// MIT License
//
// All-or-nothing execution for vault entry points. Participants snapshot
// their state into a DataStream before the call; if the call leaves by
// exception every participant is restored from its snapshot.

#ifndef ENDOW_VAULT_JOURNAL_H
#define ENDOW_VAULT_JOURNAL_H

#include "endow/core/serialize.h"

#include <initializer_list>
#include <utility>
#include <vector>

namespace endow {
namespace vault {

/// State that can be captured and restored. The same encoding is used for
/// rollback snapshots and for the vault database.
class Journaled {
public:
    virtual ~Journaled() = default;
    
    virtual void SaveState(DataStream& s) const = 0;
    virtual void LoadState(DataStream& s) = 0;
};

/**
 * RAII transaction over a set of journaled participants.
 *
 * Usage:
 *   ScopedTransaction tx({&token, &assets, this, &events});
 *   ... mutate, possibly throw ...
 *   tx.Commit();
 *
 * Null participants are skipped, and a participant listed twice is only
 * captured once. Nested transactions are allowed: an inner rollback
 * restores the state seen when the inner transaction began.
 */
class ScopedTransaction {
public:
    explicit ScopedTransaction(std::initializer_list<Journaled*> participants);
    
    /// Participant set known only at run time
    explicit ScopedTransaction(const std::vector<Journaled*>& participants);
    ~ScopedTransaction();
    
    ScopedTransaction(const ScopedTransaction&) = delete;
    ScopedTransaction& operator=(const ScopedTransaction&) = delete;
    
    /// Keep all changes made since construction
    void Commit() noexcept { committed_ = true; }
    
    bool IsCommitted() const noexcept { return committed_; }

private:
    void Capture(Journaled* participant);
    
    std::vector<std::pair<Journaled*, DataStream>> snapshots_;
    bool committed_{false};
};

/// Snapshot helpers used by the database layer
std::vector<uint8_t> SaveToBytes(const Journaled& obj);
void LoadFromBytes(Journaled& obj, const std::vector<uint8_t>& bytes);

} // namespace vault
} // namespace endow

#endif // ENDOW_VAULT_JOURNAL_H
