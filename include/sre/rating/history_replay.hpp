#pragma once

/// @file history_replay.hpp
/// @brief Rebuild a store's live state from its ledger.
///
/// Both rating stores restore through replayHistory(): a single pass over
/// the ledger that condenses each entity's records into a ReplayedEntity
/// and hands it to a store-specific visitor. RatingLedger::latestPerEntity()
/// is built on the same pass, so the latest-record rule lives only here.

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <utility>

#include "sre/foundation/types.hpp"
#include "sre/rating/rating_ledger.hpp"

namespace sre::rating {

/// Condensed history of one entity.
///
/// Pointers refer into the replayed ledger and are valid for the duration
/// of the visitor call.
struct ReplayedEntity {
    /// Record with the greatest (season, week); later insertion on ties.
    /// Its rating is the entity's live rating.
    const RatingRecord* latest = nullptr;

    /// Same rule restricted to Game records, nullptr if the entity was only
    /// ever touched by reversion.
    const RatingRecord* latestGame = nullptr;

    /// Number of Game records.
    uint32_t games = 0;
};

/// Replay @p ledger for entities of type @p Kind.
///
/// Calls visit(const std::string& entityId, const ReplayedEntity&) once per
/// entity, in ascending id order. Records of the other entity type are
/// ignored.
///
/// @return Number of entities visited.
template <foundation::EntityType Kind, typename Visitor>
std::size_t replayHistory(const RatingLedger& ledger, Visitor&& visit) {
    std::map<std::string, ReplayedEntity> entities;

    for (const auto& record : ledger.records()) {
        if (record.entityType != Kind) {
            continue;
        }
        auto& entity = entities[record.entityId];
        if (entity.latest == nullptr || record.when >= entity.latest->when) {
            entity.latest = &record;
        }
        if (record.source == foundation::RatingSource::Game) {
            ++entity.games;
            if (entity.latestGame == nullptr || record.when >= entity.latestGame->when) {
                entity.latestGame = &record;
            }
        }
    }

    for (const auto& [id, entity] : entities) {
        visit(id, entity);
    }
    return entities.size();
}

} // namespace sre::rating
