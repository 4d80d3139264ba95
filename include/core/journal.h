#pragma once

#include "core/engine_state.h"
#include "database/database.h"
#include <functional>
#include <string>
#include <vector>

namespace curator {
namespace core {

enum class CommandType : uint8_t {
    SUBMIT = 1,
    RETRACT = 2,
    BLESS = 3,
    COMMANDMENT = 4,
    ADVANCE = 5,
    UPDATE_ROOT = 6,
    SCHEDULE_PARAMS = 7,
    SET_TREASURY = 8,
    GRANT_ROLE = 9,
    REVOKE_ROLE = 10,
    APPROVE_DELEGATE = 11,
    PAUSE = 12,
    UNPAUSE = 13
};

std::string commandTypeToString(CommandType type);

struct JournalEntry {
    uint64_t sequence = 0;
    CommandType type = CommandType::SUBMIT;
    Timestamp timestamp = 0;
    std::vector<uint8_t> payload;
};

// Append-only command log. Entries are written before the command is
// applied in memory; replaying them in order rebuilds the engine state.
class Journal {
public:
    static constexpr const char* GENESIS_KEY = "meta:genesis";
    static constexpr const char* VERSION_KEY = "meta:version";
    static constexpr const char* ENTRY_PREFIX = "journal:";
    static constexpr const char* ROUND_PREFIX = "round:";
    static constexpr const char* WINNER_PREFIX = "winner:";

    explicit Journal(database::Database& db);

    bool load();
    uint64_t nextSequence() const { return nextSequence_; }

    // Writes the entry together with `extra` in one transaction.
    bool append(JournalEntry entry, database::WriteBatch& extra);

    // Stops at the first entry that fails to decode or that `fn` rejects.
    bool replay(const std::function<bool(const JournalEntry&)>& fn) const;

    static std::string entryKey(uint64_t sequence);
    static std::string roundKey(RoundId round);
    static std::string winnerKey(RoundId round);

    static std::vector<uint8_t> encodeEntry(const JournalEntry& entry);
    static bool decodeEntry(const std::vector<uint8_t>& data, JournalEntry& out);

private:
    database::Database& db_;
    uint64_t nextSequence_ = 1;
};

std::vector<uint8_t> encodeOptions(const EngineOptions& options);
bool decodeOptions(const std::vector<uint8_t>& data, EngineOptions& out);

std::vector<uint8_t> encodeBlessing(const BlessingRequest& request);
bool decodeBlessing(const std::vector<uint8_t>& data, BlessingRequest& out);

std::vector<uint8_t> encodeCommandment(const CommandmentRequest& request);
bool decodeCommandment(const std::vector<uint8_t>& data, CommandmentRequest& out);

std::vector<uint8_t> encodePendingParams(const PendingParams& params);
bool decodePendingParams(const std::vector<uint8_t>& data, PendingParams& out);

std::vector<uint8_t> encodeRoundRecord(const RoundRecord& record);
bool decodeRoundRecord(const std::vector<uint8_t>& data, RoundRecord& out);

std::vector<uint8_t> encodeWinner(const WinnerNotification& winner);
bool decodeWinner(const std::vector<uint8_t>& data, WinnerNotification& out);

}
}
