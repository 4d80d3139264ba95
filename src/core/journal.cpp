#include "core/journal.h"
#include "utils/serialize.h"
#include "utils/logger.h"
#include <algorithm>
#include <cstdio>
#include <stdexcept>

namespace curator {
namespace core {

using utils::ByteBuffer;

static constexpr uint8_t ENTRY_FORMAT = 1;

std::string commandTypeToString(CommandType type) {
    switch (type) {
        case CommandType::SUBMIT: return "submit";
        case CommandType::RETRACT: return "retract";
        case CommandType::BLESS: return "bless";
        case CommandType::COMMANDMENT: return "commandment";
        case CommandType::ADVANCE: return "advance";
        case CommandType::UPDATE_ROOT: return "update_root";
        case CommandType::SCHEDULE_PARAMS: return "schedule_params";
        case CommandType::SET_TREASURY: return "set_treasury";
        case CommandType::GRANT_ROLE: return "grant_role";
        case CommandType::REVOKE_ROLE: return "revoke_role";
        case CommandType::APPROVE_DELEGATE: return "approve_delegate";
        case CommandType::PAUSE: return "pause";
        case CommandType::UNPAUSE: return "unpause";
    }
    return "unknown";
}

static std::string sequenceKey(const char* prefix, uint64_t n) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%020llu", static_cast<unsigned long long>(n));
    return std::string(prefix) + buf;
}

std::string Journal::entryKey(uint64_t sequence) {
    return sequenceKey(ENTRY_PREFIX, sequence);
}

std::string Journal::roundKey(RoundId round) {
    return sequenceKey(ROUND_PREFIX, round);
}

std::string Journal::winnerKey(RoundId round) {
    return sequenceKey(WINNER_PREFIX, round);
}

Journal::Journal(database::Database& db) : db_(db) {}

bool Journal::load() {
    if (!db_.isOpen()) return false;
    uint64_t last = 0;
    db_.forEach(ENTRY_PREFIX, [&last](const std::string& key, const std::vector<uint8_t>&) {
        try {
            last = std::max<uint64_t>(last, std::stoull(key.substr(std::char_traits<char>::length(ENTRY_PREFIX))));
        } catch (const std::exception&) {
            utils::Logger::warn("Ignoring malformed journal key " + key);
        }
        return true;
    });
    nextSequence_ = last + 1;
    return true;
}

bool Journal::append(JournalEntry entry, database::WriteBatch& extra) {
    entry.sequence = nextSequence_;
    extra.put(entryKey(entry.sequence), encodeEntry(entry));
    if (!db_.write(extra)) {
        utils::Logger::error("Journal append failed at " + std::to_string(entry.sequence) + ": " + db_.lastError());
        return false;
    }
    nextSequence_++;
    return true;
}

bool Journal::replay(const std::function<bool(const JournalEntry&)>& fn) const {
    bool ok = true;
    uint64_t expected = 1;
    db_.forEach(ENTRY_PREFIX, [&](const std::string& key, const std::vector<uint8_t>& value) {
        JournalEntry entry;
        if (!decodeEntry(value, entry)) {
            utils::Logger::error("Corrupt journal entry " + key);
            ok = false;
            return false;
        }
        if (entry.sequence != expected) {
            utils::Logger::error("Journal gap: expected " + std::to_string(expected) +
                                 " got " + std::to_string(entry.sequence));
            ok = false;
            return false;
        }
        if (!fn(entry)) {
            ok = false;
            return false;
        }
        expected++;
        return true;
    });
    return ok;
}

std::vector<uint8_t> Journal::encodeEntry(const JournalEntry& entry) {
    ByteBuffer buf;
    buf.writeUint8(ENTRY_FORMAT);
    buf.writeUint64(entry.sequence);
    buf.writeUint8(static_cast<uint8_t>(entry.type));
    buf.writeUint64(entry.timestamp);
    buf.writeBytes(entry.payload);
    return buf.data();
}

bool Journal::decodeEntry(const std::vector<uint8_t>& data, JournalEntry& out) {
    try {
        ByteBuffer buf(data);
        if (buf.readUint8() != ENTRY_FORMAT) return false;
        out.sequence = buf.readUint64();
        uint8_t type = buf.readUint8();
        if (type < static_cast<uint8_t>(CommandType::SUBMIT) || type > static_cast<uint8_t>(CommandType::UNPAUSE)) {
            return false;
        }
        out.type = static_cast<CommandType>(type);
        out.timestamp = buf.readUint64();
        out.payload = buf.readBytes();
        return buf.atEnd();
    } catch (const std::runtime_error&) {
        return false;
    }
}

template<typename E>
static E readEnum(ByteBuffer& buf, E maxValue) {
    uint8_t v = buf.readUint8();
    if (v > static_cast<uint8_t>(maxValue)) throw std::runtime_error("Enum out of range");
    return static_cast<E>(v);
}

static void writeParams(ByteBuffer& buf, const EngineParams& p) {
    buf.writeUint64(p.votingPeriod);
    buf.writeUint32(p.blessingsPerUnit);
    buf.writeUint32(p.commandmentsPerUnit);
    buf.writeUint64(p.blessingWeight);
    buf.writeUint64(p.commandmentWeight);
    buf.writeUint64(p.timeDecayBase);
    buf.writeUint64(p.timeDecayMin);
    buf.writeUint64(p.blessingCost);
    buf.writeUint64(p.commandmentCost);
    buf.writeUint8(static_cast<uint8_t>(p.roundMode));
    buf.writeUint8(static_cast<uint8_t>(p.tieBreak));
    buf.writeUint8(static_cast<uint8_t>(p.deadlock));
    buf.writeBool(p.scoreResetOnRoundEnd);
}

static EngineParams readParams(ByteBuffer& buf) {
    EngineParams p;
    p.votingPeriod = buf.readUint64();
    p.blessingsPerUnit = buf.readUint32();
    p.commandmentsPerUnit = buf.readUint32();
    p.blessingWeight = buf.readUint64();
    p.commandmentWeight = buf.readUint64();
    p.timeDecayBase = buf.readUint64();
    p.timeDecayMin = buf.readUint64();
    p.blessingCost = buf.readUint64();
    p.commandmentCost = buf.readUint64();
    p.roundMode = readEnum(buf, RoundMode::ROUND_BASED);
    p.tieBreak = readEnum(buf, TieBreakStrategy::PSEUDO_RANDOM);
    p.deadlock = readEnum(buf, DeadlockStrategy::ALLOW_REWINS);
    p.scoreResetOnRoundEnd = buf.readBool();
    return p;
}

static void writeStringList(ByteBuffer& buf, const std::vector<std::string>& items) {
    buf.writeVarInt(items.size());
    for (const auto& s : items) buf.writeString(s);
}

static std::vector<std::string> readStringList(ByteBuffer& buf) {
    uint64_t n = buf.readVarInt();
    if (n > buf.remaining()) throw std::runtime_error("List too large");
    std::vector<std::string> out;
    for (uint64_t i = 0; i < n; i++) out.push_back(buf.readString());
    return out;
}

static void writeEligibility(ByteBuffer& buf, const std::vector<uint64_t>& units,
                             const std::vector<crypto::Hash256>& proof) {
    buf.writeVarInt(units.size());
    for (uint64_t u : units) buf.writeUint64(u);
    buf.writeVarInt(proof.size());
    for (const auto& h : proof) buf.writeArray(h);
}

static void readEligibility(ByteBuffer& buf, std::vector<uint64_t>& units,
                            std::vector<crypto::Hash256>& proof) {
    uint64_t n = buf.readVarInt();
    if (n > buf.remaining() / 8) throw std::runtime_error("Unit list too large");
    units.clear();
    for (uint64_t i = 0; i < n; i++) units.push_back(buf.readUint64());
    uint64_t m = buf.readVarInt();
    if (m > buf.remaining() / crypto::SHA256_SIZE) throw std::runtime_error("Proof too large");
    proof.clear();
    for (uint64_t i = 0; i < m; i++) proof.push_back(buf.readArray<crypto::SHA256_SIZE>());
}

std::vector<uint8_t> encodeOptions(const EngineOptions& o) {
    ByteBuffer buf;
    buf.writeString(o.admin);
    buf.writeString(o.treasury);
    buf.writeUint64(o.genesisTime);
    writeParams(buf, o.params);
    writeStringList(buf, o.creators);
    writeStringList(buf, o.relayers);
    return buf.data();
}

bool decodeOptions(const std::vector<uint8_t>& data, EngineOptions& out) {
    try {
        ByteBuffer buf(data);
        out.admin = buf.readString();
        out.treasury = buf.readString();
        out.genesisTime = buf.readUint64();
        out.params = readParams(buf);
        out.creators = readStringList(buf);
        out.relayers = readStringList(buf);
        return buf.atEnd();
    } catch (const std::runtime_error&) {
        return false;
    }
}

std::vector<uint8_t> encodeBlessing(const BlessingRequest& r) {
    ByteBuffer buf;
    buf.writeUint64(r.seedId);
    buf.writeString(r.elector);
    buf.writeString(r.actor);
    writeEligibility(buf, r.unitIds, r.proof);
    buf.writeUint64(r.payment);
    return buf.data();
}

bool decodeBlessing(const std::vector<uint8_t>& data, BlessingRequest& out) {
    try {
        ByteBuffer buf(data);
        out.seedId = buf.readUint64();
        out.elector = buf.readString();
        out.actor = buf.readString();
        readEligibility(buf, out.unitIds, out.proof);
        out.payment = buf.readUint64();
        return buf.atEnd();
    } catch (const std::runtime_error&) {
        return false;
    }
}

std::vector<uint8_t> encodeCommandment(const CommandmentRequest& r) {
    ByteBuffer buf;
    buf.writeUint64(r.seedId);
    buf.writeString(r.elector);
    buf.writeString(r.actor);
    buf.writeString(r.contentHandle);
    writeEligibility(buf, r.unitIds, r.proof);
    buf.writeUint64(r.payment);
    return buf.data();
}

bool decodeCommandment(const std::vector<uint8_t>& data, CommandmentRequest& out) {
    try {
        ByteBuffer buf(data);
        out.seedId = buf.readUint64();
        out.elector = buf.readString();
        out.actor = buf.readString();
        out.contentHandle = buf.readString();
        readEligibility(buf, out.unitIds, out.proof);
        out.payment = buf.readUint64();
        return buf.atEnd();
    } catch (const std::runtime_error&) {
        return false;
    }
}

// One presence byte per field, in declaration order.
std::vector<uint8_t> encodePendingParams(const PendingParams& p) {
    ByteBuffer buf;
    auto u64 = [&buf](const std::optional<uint64_t>& v) {
        buf.writeBool(v.has_value());
        if (v) buf.writeUint64(*v);
    };
    auto u32 = [&buf](const std::optional<uint32_t>& v) {
        buf.writeBool(v.has_value());
        if (v) buf.writeUint32(*v);
    };
    u64(p.votingPeriod);
    u32(p.blessingsPerUnit);
    u32(p.commandmentsPerUnit);
    u64(p.blessingWeight);
    u64(p.commandmentWeight);
    u64(p.timeDecayBase);
    u64(p.timeDecayMin);
    u64(p.blessingCost);
    u64(p.commandmentCost);
    buf.writeBool(p.roundMode.has_value());
    if (p.roundMode) buf.writeUint8(static_cast<uint8_t>(*p.roundMode));
    buf.writeBool(p.tieBreak.has_value());
    if (p.tieBreak) buf.writeUint8(static_cast<uint8_t>(*p.tieBreak));
    buf.writeBool(p.deadlock.has_value());
    if (p.deadlock) buf.writeUint8(static_cast<uint8_t>(*p.deadlock));
    buf.writeBool(p.scoreResetOnRoundEnd.has_value());
    if (p.scoreResetOnRoundEnd) buf.writeBool(*p.scoreResetOnRoundEnd);
    return buf.data();
}

bool decodePendingParams(const std::vector<uint8_t>& data, PendingParams& out) {
    try {
        ByteBuffer buf(data);
        PendingParams p;
        if (buf.readBool()) p.votingPeriod = buf.readUint64();
        if (buf.readBool()) p.blessingsPerUnit = buf.readUint32();
        if (buf.readBool()) p.commandmentsPerUnit = buf.readUint32();
        if (buf.readBool()) p.blessingWeight = buf.readUint64();
        if (buf.readBool()) p.commandmentWeight = buf.readUint64();
        if (buf.readBool()) p.timeDecayBase = buf.readUint64();
        if (buf.readBool()) p.timeDecayMin = buf.readUint64();
        if (buf.readBool()) p.blessingCost = buf.readUint64();
        if (buf.readBool()) p.commandmentCost = buf.readUint64();
        if (buf.readBool()) p.roundMode = readEnum(buf, RoundMode::ROUND_BASED);
        if (buf.readBool()) p.tieBreak = readEnum(buf, TieBreakStrategy::PSEUDO_RANDOM);
        if (buf.readBool()) p.deadlock = readEnum(buf, DeadlockStrategy::ALLOW_REWINS);
        if (buf.readBool()) p.scoreResetOnRoundEnd = buf.readBool();
        if (!buf.atEnd()) return false;
        out = p;
        return true;
    } catch (const std::runtime_error&) {
        return false;
    }
}

std::vector<uint8_t> encodeRoundRecord(const RoundRecord& r) {
    ByteBuffer buf;
    buf.writeUint64(r.number);
    buf.writeUint64(r.periodStart);
    buf.writeUint64(r.periodDuration);
    buf.writeUint64(r.resolvedAt);
    buf.writeUint64(r.winnerSeedId);
    buf.writeUint64(r.winningScore);
    buf.writeBool(r.skipped);
    buf.writeBool(r.viaDeadlock);
    buf.writeUint8(static_cast<uint8_t>(r.deadlockStrategy));
    buf.writeVarInt(r.candidateCount);
    return buf.data();
}

bool decodeRoundRecord(const std::vector<uint8_t>& data, RoundRecord& out) {
    try {
        ByteBuffer buf(data);
        out.number = buf.readUint64();
        out.periodStart = buf.readUint64();
        out.periodDuration = buf.readUint64();
        out.resolvedAt = buf.readUint64();
        out.winnerSeedId = buf.readUint64();
        out.winningScore = buf.readUint64();
        out.skipped = buf.readBool();
        out.viaDeadlock = buf.readBool();
        out.deadlockStrategy = readEnum(buf, DeadlockStrategy::ALLOW_REWINS);
        out.candidateCount = static_cast<size_t>(buf.readVarInt());
        return buf.atEnd();
    } catch (const std::runtime_error&) {
        return false;
    }
}

std::vector<uint8_t> encodeWinner(const WinnerNotification& w) {
    ByteBuffer buf;
    buf.writeUint64(w.round);
    buf.writeUint64(w.seedId);
    buf.writeString(w.contentHandle);
    buf.writeUint64(w.finalScore);
    buf.writeString(w.creator);
    buf.writeUint64(w.resolvedAt);
    return buf.data();
}

bool decodeWinner(const std::vector<uint8_t>& data, WinnerNotification& out) {
    try {
        ByteBuffer buf(data);
        out.round = buf.readUint64();
        out.seedId = buf.readUint64();
        out.contentHandle = buf.readString();
        out.finalScore = buf.readUint64();
        out.creator = buf.readString();
        out.resolvedAt = buf.readUint64();
        return buf.atEnd();
    } catch (const std::runtime_error&) {
        return false;
    }
}

}
}
