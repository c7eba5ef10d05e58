// ENDOW - State Journal
// Copyright (c) 2026 ENDOW Developers
// MIT License

#include "endow/vault/journal.h"
#include "endow/util/logging.h"

#include <algorithm>
#include <ios>

namespace endow {
namespace vault {

ScopedTransaction::ScopedTransaction(std::initializer_list<Journaled*> participants) {
    snapshots_.reserve(participants.size());
    for (Journaled* participant : participants) {
        Capture(participant);
    }
}

ScopedTransaction::ScopedTransaction(const std::vector<Journaled*>& participants) {
    snapshots_.reserve(participants.size());
    for (Journaled* participant : participants) {
        Capture(participant);
    }
}

void ScopedTransaction::Capture(Journaled* participant) {
    if (participant == nullptr) {
        return;
    }
    bool seen = std::any_of(snapshots_.begin(), snapshots_.end(),
                            [participant](const auto& entry) { return entry.first == participant; });
    if (seen) {
        return;
    }
    DataStream snapshot;
    participant->SaveState(snapshot);
    snapshots_.emplace_back(participant, std::move(snapshot));
}

ScopedTransaction::~ScopedTransaction() {
    if (committed_) {
        return;
    }
    LOG_DEBUG(util::LogCategory::DEFAULT) << "Rolling back " << snapshots_.size()
                                          << " participant(s)";
    // Restore in reverse order of capture
    for (auto it = snapshots_.rbegin(); it != snapshots_.rend(); ++it) {
        it->first->LoadState(it->second);
    }
}

std::vector<uint8_t> SaveToBytes(const Journaled& obj) {
    DataStream s;
    obj.SaveState(s);
    return s.ToBytes();
}

void LoadFromBytes(Journaled& obj, const std::vector<uint8_t>& bytes) {
    DataStream s(bytes);
    obj.LoadState(s);
    if (!s.empty()) {
        throw std::ios_base::failure("LoadFromBytes(): trailing data");
    }
}

} // namespace vault
} // namespace endow
