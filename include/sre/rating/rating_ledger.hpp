#pragma once

/// @file rating_ledger.hpp
/// @brief Append-only, time-indexed record of every rating change.
///
/// Each rating store owns one ledger and appends to it under its writer
/// lock after every update. The ledger is the source of truth for the
/// store's live map: RatingLedger::load() followed by replayHistory()
/// reproduces the ratings of a process that never restarted.
///
/// On-disk layout (CSV, one file per store, header row first):
///   team:   season,week,entity_id,rating,source
///   player: season,week,entity_id,position,rating,source
///
/// Ratings are written in shortest round-trip form so a reload is
/// bit-identical.

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "sre/foundation/rating_result.hpp"
#include "sre/foundation/types.hpp"

namespace sre::rating {

/// One immutable ledger entry.
struct RatingRecord {
    foundation::SeasonWeek when;
    std::string entityId;
    foundation::EntityType entityType = foundation::EntityType::Team;
    foundation::Position position = foundation::Position::Unknown;  ///< Players only.
    double rating = 0.0;
    foundation::RatingSource source = foundation::RatingSource::Game;

    bool operator==(const RatingRecord&) const = default;
};

/// Append-only list of RatingRecords in insertion order.
///
/// Not internally synchronized; the owning store's lock guards it.
///
/// Precondition for append(): per entity, records arrive in non-decreasing
/// (season, week) order. Violations are not detected.
class RatingLedger {
public:
    RatingLedger() = default;

    /// Append a record. Existing records are never modified.
    void append(RatingRecord record);

    /// All records in insertion order.
    [[nodiscard]] const std::vector<RatingRecord>& records() const noexcept { return records_; }

    /// Per entity, the record with the greatest (season, week).
    /// Ties go to the record inserted last. Built on replayHistory(), the
    /// same pass the stores restore through.
    [[nodiscard]] std::unordered_map<std::string, RatingRecord> latestPerEntity() const;

    /// Every record of one entity, in insertion order.
    [[nodiscard]] std::vector<RatingRecord> historyOf(std::string_view entityId) const;

    [[nodiscard]] std::size_t size() const noexcept { return records_.size(); }
    [[nodiscard]] bool empty() const noexcept { return records_.empty(); }

    /// Write the ledger as CSV in the layout of @p type.
    ///
    /// The file is written beside @p path and renamed over it, so a failed
    /// save leaves any previous file intact.
    [[nodiscard]] foundation::RatingResult<void> save(
        const std::filesystem::path& path, foundation::EntityType type) const;

    /// Read a CSV ledger written by save().
    ///
    /// @return HistoryFileNotFound if @p path does not exist,
    ///         HistoryReadFailed if it cannot be read,
    ///         HistoryCorrupted on a bad header or any malformed row.
    [[nodiscard]] static foundation::RatingResult<RatingLedger> load(
        const std::filesystem::path& path, foundation::EntityType type);

private:
    std::vector<RatingRecord> records_;
};

} // namespace sre::rating
