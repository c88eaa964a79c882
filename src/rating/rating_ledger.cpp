/// @file rating_ledger.cpp
/// @brief RatingLedger implementation with CSV persistence.

#include "sre/rating/rating_ledger.hpp"

#include <array>
#include <charconv>
#include <cmath>
#include <fstream>
#include <system_error>

#include "sre/foundation/error_code.hpp"
#include "sre/foundation/rating_error.hpp"
#include "sre/rating/history_replay.hpp"

namespace sre::rating {

using foundation::EntityType;
using foundation::ErrorCode;
using foundation::Position;
using foundation::RatingError;
using foundation::RatingResult;
using foundation::RatingSource;

// -- CSV helpers -------------------------------------------------------------

namespace {

constexpr std::string_view kTeamHeader = "season,week,entity_id,rating,source";
constexpr std::string_view kPlayerHeader = "season,week,entity_id,position,rating,source";

std::string_view headerFor(EntityType type) {
    return type == EntityType::Team ? kTeamHeader : kPlayerHeader;
}

/// The current header, or the older one without the source column.
bool isKnownHeader(std::string_view line, EntityType type) {
    auto header = headerFor(type);
    auto legacy = header.substr(0, header.rfind(','));
    return line == header || line == legacy;
}

std::vector<std::string_view> splitFields(std::string_view line) {
    std::vector<std::string_view> fields;
    std::size_t start = 0;
    while (true) {
        auto comma = line.find(',', start);
        if (comma == std::string_view::npos) {
            fields.push_back(line.substr(start));
            return fields;
        }
        fields.push_back(line.substr(start, comma - start));
        start = comma + 1;
    }
}

template <typename T>
bool parseNumber(std::string_view text, T& out) {
    if (text.empty()) {
        return false;
    }
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc{} && ptr == text.data() + text.size();
}

/// Shortest decimal form that parses back to the same double.
std::string formatRating(double value) {
    std::array<char, 32> buf{};
    auto [ptr, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), value);
    return std::string(buf.data(), ec == std::errc{} ? ptr : buf.data());
}

bool parseSource(std::string_view text, RatingSource& out) {
    if (text.empty() || text == "game") {
        out = RatingSource::Game;
        return true;
    }
    if (text == "reversion") {
        out = RatingSource::Reversion;
        return true;
    }
    return false;
}

/// Parse one data row. Returns false on any malformed field.
bool parseRow(std::string_view line, EntityType type, RatingRecord& out) {
    auto fields = splitFields(line);
    const std::size_t required = type == EntityType::Team ? 4 : 5;
    if (fields.size() != required && fields.size() != required + 1) {
        return false;
    }

    std::size_t i = 0;
    if (!parseNumber(fields[i++], out.when.season) ||
        !parseNumber(fields[i++], out.when.week)) {
        return false;
    }
    out.entityId = std::string(fields[i++]);
    if (out.entityId.empty()) {
        return false;
    }
    out.entityType = type;
    out.position = Position::Unknown;
    if (type == EntityType::Player) {
        auto name = fields[i++];
        out.position = foundation::parsePosition(name);
        if (out.position == Position::Unknown &&
            name != foundation::positionName(Position::Unknown)) {
            return false;
        }
    }
    if (!parseNumber(fields[i++], out.rating) || !std::isfinite(out.rating)) {
        return false;
    }
    return parseSource(i < fields.size() ? fields[i] : std::string_view{}, out.source);
}

} // namespace

// -- In-memory ---------------------------------------------------------------

void RatingLedger::append(RatingRecord record) {
    records_.push_back(std::move(record));
}

std::unordered_map<std::string, RatingRecord> RatingLedger::latestPerEntity() const {
    std::unordered_map<std::string, RatingRecord> latest;
    auto collect = [&latest](const std::string& id, const ReplayedEntity& entity) {
        latest.insert_or_assign(id, *entity.latest);
    };
    replayHistory<EntityType::Team>(*this, collect);
    replayHistory<EntityType::Player>(*this, collect);
    return latest;
}

std::vector<RatingRecord> RatingLedger::historyOf(std::string_view entityId) const {
    std::vector<RatingRecord> history;
    for (const auto& record : records_) {
        if (record.entityId == entityId) {
            history.push_back(record);
        }
    }
    return history;
}

// -- Persistence -------------------------------------------------------------

RatingResult<void> RatingLedger::save(const std::filesystem::path& path,
                                      EntityType type) const {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return RatingResult<void>::err(RatingError(
                ErrorCode::HistoryWriteFailed,
                "failed to create history directory: " + ec.message(), path.string()));
        }
    }

    auto tmpPath = path;
    tmpPath += ".tmp";

    {
        std::ofstream out(tmpPath, std::ios::trunc);
        if (!out) {
            return RatingResult<void>::err(RatingError(
                ErrorCode::HistoryWriteFailed, "cannot open history file for writing",
                tmpPath.string()));
        }

        out << headerFor(type) << '\n';
        for (const auto& record : records_) {
            if (record.entityId.find_first_of(",\r\n") != std::string::npos) {
                out.close();
                std::filesystem::remove(tmpPath, ec);
                return RatingResult<void>::err(RatingError(
                    ErrorCode::HistoryWriteFailed,
                    "entity id cannot be stored in CSV: " + record.entityId, path.string()));
            }
            out << record.when.season << ',' << record.when.week << ','
                << record.entityId << ',';
            if (type == EntityType::Player) {
                out << foundation::positionName(record.position) << ',';
            }
            out << formatRating(record.rating) << ','
                << foundation::ratingSourceName(record.source) << '\n';
        }

        out.flush();
        if (!out) {
            out.close();
            std::filesystem::remove(tmpPath, ec);
            return RatingResult<void>::err(RatingError(
                ErrorCode::HistoryWriteFailed, "failed to write history file",
                tmpPath.string()));
        }
    }

    std::filesystem::rename(tmpPath, path, ec);
    if (ec) {
        return RatingResult<void>::err(RatingError(
            ErrorCode::HistoryWriteFailed, "failed to replace history file: " + ec.message(),
            path.string()));
    }
    return RatingResult<void>::ok();
}

RatingResult<RatingLedger> RatingLedger::load(const std::filesystem::path& path,
                                              EntityType type) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return RatingResult<RatingLedger>::err(RatingError(
            ErrorCode::HistoryFileNotFound, "no history file", path.string()));
    }

    std::ifstream in(path);
    if (!in) {
        return RatingResult<RatingLedger>::err(RatingError(
            ErrorCode::HistoryReadFailed, "cannot open history file", path.string()));
    }

    auto stripCr = [](std::string& line) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
    };

    std::string line;
    if (!std::getline(in, line)) {
        return RatingResult<RatingLedger>::err(RatingError(
            ErrorCode::HistoryCorrupted, "history file is empty", path.string()));
    }
    stripCr(line);
    if (!isKnownHeader(line, type)) {
        return RatingResult<RatingLedger>::err(RatingError(
            ErrorCode::HistoryCorrupted, "unexpected header: " + line, path.string()));
    }

    RatingLedger ledger;
    std::size_t lineNo = 1;
    while (std::getline(in, line)) {
        ++lineNo;
        stripCr(line);
        if (line.empty()) {
            continue;
        }
        RatingRecord record;
        if (!parseRow(line, type, record)) {
            return RatingResult<RatingLedger>::err(RatingError(
                ErrorCode::HistoryCorrupted,
                "malformed row at line " + std::to_string(lineNo), path.string()));
        }
        ledger.append(std::move(record));
    }

    if (in.bad()) {
        return RatingResult<RatingLedger>::err(RatingError(
            ErrorCode::HistoryReadFailed, "read error", path.string()));
    }
    return RatingResult<RatingLedger>::ok(std::move(ledger));
}

} // namespace sre::rating
