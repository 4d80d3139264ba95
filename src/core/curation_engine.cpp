#include "core/curation_engine.h"
#include "core/resolution.h"
#include "utils/logger.h"
#include "utils/serialize.h"
#include <algorithm>
#include <mutex>
#include <shared_mutex>

namespace curator {
namespace core {

static const char* LOG_CATEGORY = "curation";

static void logInfo(const std::string& msg) {
    CURATOR_LOG(utils::LogLevel::INFO, LOG_CATEGORY, msg);
}

static void logDebug(const std::string& msg) {
    CURATOR_LOG(utils::LogLevel::DEBUG, LOG_CATEGORY, msg);
}

static std::string redact(const Address& a) {
    return utils::Logger::redactAddress(a);
}

struct CurationEngine::Impl {
    EngineOptions options;
    std::unique_ptr<EngineState> state;
    std::shared_ptr<crypto::EligibilityOracle> oracle;

    database::Database db;
    std::unique_ptr<Journal> journal;
    bool persistent = false;
    bool replaying = false;
    bool journalFailed = false;
    uint64_t appliedCommands = 0;

    mutable std::shared_mutex mtx;
    EngineEventHandler eventHandler;
    WinnerHandler winnerHandler;
    std::vector<EngineEvent> outbox;
    std::vector<WinnerNotification> winnerOutbox;

    void reset(const EngineOptions& opts) {
        options = opts;
        state = std::make_unique<EngineState>(opts);
        appliedCommands = 0;
    }

    void emit(EngineEventType type, SeedId seedId, const Address& actor, Timestamp now,
              std::map<std::string, std::string> data = {}) {
        if (replaying) return;
        EngineEvent ev;
        ev.type = type;
        ev.round = state->rounds.currentRound();
        ev.seedId = seedId;
        ev.actor = actor;
        ev.timestamp = now;
        ev.data = std::move(data);
        outbox.push_back(std::move(ev));
    }

    void flush() {
        std::vector<EngineEvent> events;
        std::vector<WinnerNotification> wins;
        EngineEventHandler eh;
        WinnerHandler wh;
        {
            std::unique_lock<std::shared_mutex> lock(mtx);
            events.swap(outbox);
            wins.swap(winnerOutbox);
            eh = eventHandler;
            wh = winnerHandler;
        }
        if (eh) {
            for (const auto& ev : events) eh(ev);
        }
        if (wh) {
            for (const auto& w : wins) wh(w);
        }
    }

    // Write-ahead: the entry is durable before the caller mutates state.
    bool persist(CommandType type, Timestamp now, std::vector<uint8_t> payload,
                 database::WriteBatch* extra = nullptr) {
        if (persistent && !replaying) {
            JournalEntry entry;
            entry.type = type;
            entry.timestamp = now;
            entry.payload = std::move(payload);
            database::WriteBatch local;
            if (!journal->append(std::move(entry), extra ? *extra : local)) {
                journalFailed = true;
                return false;
            }
        }
        appliedCommands++;
        return true;
    }

    template<typename R>
    bool gate(R& out) {
        if (journalFailed) {
            out = failure<R>(ErrorKind::LIFECYCLE, "journal_unavailable");
            return false;
        }
        if (state->access.isPaused()) {
            out = failure<R>(ErrorKind::LIFECYCLE, "paused");
            return false;
        }
        return true;
    }

    OpResult requireAdmin(const Address& caller) const {
        if (journalFailed) return failure<OpResult>(ErrorKind::LIFECYCLE, "journal_unavailable");
        if (caller.empty()) return failure<OpResult>(ErrorKind::VALIDATION, "invalid_address");
        if (!state->access.hasRole(Role::ADMIN, caller)) {
            return failure<OpResult>(ErrorKind::AUTHORIZATION, "missing_role");
        }
        return success();
    }

    OpResult checkEligibility(const Address& elector, const std::vector<uint64_t>& units,
                              const std::vector<crypto::Hash256>& proof) const {
        if (units.empty()) return failure<OpResult>(ErrorKind::VALIDATION, "empty_unit_ids");
        if (units.size() > MAX_UNITS_PER_PROOF) return failure<OpResult>(ErrorKind::VALIDATION, "too_many_units");
        if (proof.size() > MAX_PROOF_DEPTH) return failure<OpResult>(ErrorKind::VALIDATION, "proof_too_long");
        if (!state->roots.hasCurrent()) return failure<OpResult>(ErrorKind::ELIGIBILITY, "no_ownership_root");
        if (crypto::MerkleEligibilityOracle::hasDuplicateUnits(units)) {
            return failure<OpResult>(ErrorKind::ELIGIBILITY, "invalid_membership_proof");
        }
        if (oracle->verify(state->roots.current, elector, units, proof)) return success();
        if (!crypto::isZero(state->roots.previous) &&
            oracle->verify(state->roots.previous, elector, units, proof)) {
            return success();
        }
        return failure<OpResult>(ErrorKind::ELIGIBILITY, "invalid_membership_proof");
    }

    PeriodClock clock() const {
        PeriodClock c;
        c.periodStart = state->rounds.periodStart();
        c.periodDuration = state->rounds.periodDuration();
        c.round = state->rounds.currentRound();
        return c;
    }

    std::vector<Candidate> candidatesFor(const std::vector<SeedId>& ids) const {
        std::vector<Candidate> out;
        out.reserve(ids.size());
        for (SeedId id : ids) {
            const Seed* s = state->registry.find(id);
            if (!s) continue;
            Candidate c;
            c.id = s->id;
            c.score = s->blessingScore;
            c.createdAt = s->createdAt;
            out.push_back(c);
        }
        return out;
    }

    SubmitResult submit(const Address& rawCreator, const std::string& rawHandle, Timestamp now);
    OpResult retract(SeedId seedId, const Address& rawCaller, Timestamp now);
    BlessResult bless(BlessingRequest req, Timestamp now);
    std::vector<BlessResult> batch(const Address& rawRelayer, const std::vector<BlessingRequest>& requests, Timestamp now);
    CommandmentResult commandment(CommandmentRequest req, Timestamp now);
    AdvanceResult advance(Timestamp now, const crypto::Hash256& entropy);
    OpResult updateRoot(const Address& rawCaller, const crypto::Hash256& root, Timestamp now);
    OpResult schedule(const Address& rawCaller, const PendingParams& update, Timestamp now);
    OpResult setTreasury(const Address& rawCaller, const Address& rawTreasury, Timestamp now);
    OpResult grant(const Address& rawCaller, Role role, const Address& rawAccount, Timestamp now);
    OpResult revoke(const Address& rawCaller, Role role, const Address& rawAccount, Timestamp now);
    OpResult delegate(const Address& rawElector, const Address& rawDelegate, bool approved, Timestamp now);
    OpResult pause(const Address& rawCaller, const std::string& reason, Timestamp now);
    OpResult unpause(const Address& rawCaller, Timestamp now);

    bool applyEntry(const JournalEntry& entry);
};

SubmitResult CurationEngine::Impl::submit(const Address& rawCreator, const std::string& rawHandle, Timestamp now) {
    SubmitResult out;
    if (!gate(out)) return out;

    Address creator = normalizeAddress(rawCreator);
    if (creator.empty()) return failure<SubmitResult>(ErrorKind::VALIDATION, "invalid_address");
    std::string handle = SeedRegistry::normalizeContentHandle(rawHandle);
    if (handle.empty()) return failure<SubmitResult>(ErrorKind::VALIDATION, "invalid_content_handle");
    if (!state->access.hasRole(Role::CREATOR, creator)) {
        return failure<SubmitResult>(ErrorKind::AUTHORIZATION, "missing_role");
    }

    RoundId round = state->rounds.currentRound();
    OpResult chk = state->registry.checkSubmit(handle, round);
    if (!chk.ok) return failure<SubmitResult>(chk.kind, chk.error);

    utils::ByteBuffer payload;
    payload.writeString(creator);
    payload.writeString(handle);
    if (!persist(CommandType::SUBMIT, now, payload.data())) {
        return failure<SubmitResult>(ErrorKind::LIFECYCLE, "journal_unavailable");
    }

    out.ok = true;
    out.seedId = state->registry.submit(creator, handle, now, round);
    emit(EngineEventType::SeedSubmitted, out.seedId, creator, now,
         {{"creator", creator}, {"contentHandle", handle}});
    if (!replaying) {
        logInfo("Seed " + std::to_string(out.seedId) + " submitted by " + redact(creator) +
                " in round " + std::to_string(round));
    }
    return out;
}

OpResult CurationEngine::Impl::retract(SeedId seedId, const Address& rawCaller, Timestamp now) {
    OpResult out;
    if (!gate(out)) return out;

    Address caller = normalizeAddress(rawCaller);
    if (caller.empty()) return failure<OpResult>(ErrorKind::VALIDATION, "invalid_address");
    OpResult chk = state->registry.checkRetract(seedId, caller);
    if (!chk.ok) return chk;

    utils::ByteBuffer payload;
    payload.writeUint64(seedId);
    payload.writeString(caller);
    if (!persist(CommandType::RETRACT, now, payload.data())) {
        return failure<OpResult>(ErrorKind::LIFECYCLE, "journal_unavailable");
    }

    state->registry.retract(seedId);
    emit(EngineEventType::SeedRetracted, seedId, caller, now);
    if (!replaying) logInfo("Seed " + std::to_string(seedId) + " retracted");
    return success();
}

BlessResult CurationEngine::Impl::bless(BlessingRequest req, Timestamp now) {
    BlessResult out;
    if (!gate(out)) return out;

    req.elector = normalizeAddress(req.elector);
    req.actor = req.actor.empty() ? req.elector : normalizeAddress(req.actor);
    if (req.elector.empty() || req.actor.empty()) {
        return failure<BlessResult>(ErrorKind::VALIDATION, "invalid_address");
    }
    if (req.unitIds.empty()) return failure<BlessResult>(ErrorKind::VALIDATION, "empty_unit_ids");
    const Seed* seed = state->registry.find(req.seedId);
    if (!seed) return failure<BlessResult>(ErrorKind::VALIDATION, "seed_not_found");

    if (!state->access.canActFor(req.actor, req.elector)) {
        return failure<BlessResult>(ErrorKind::AUTHORIZATION, "not_authorized");
    }

    OpResult elig = checkEligibility(req.elector, req.unitIds, req.proof);
    if (!elig.ok) return failure<BlessResult>(elig.kind, elig.error);

    const EngineParams& params = state->config.current();
    uint64_t remaining = state->scoring.remainingBlessings(req.elector, req.unitIds.size(), params, now);
    if (remaining == 0) return failure<BlessResult>(ErrorKind::ELIGIBILITY, "daily_blessing_limit_reached");

    if (seed->isRetracted) return failure<BlessResult>(ErrorKind::LIFECYCLE, "seed_retracted");
    bool rewinOpen = seed->isDecided() && params.deadlock == DeadlockStrategy::ALLOW_REWINS;
    if (seed->isDecided() && !rewinOpen) return failure<BlessResult>(ErrorKind::LIFECYCLE, "seed_already_winner");
    if (!seed->isDecided() && !state->registry.isEligible(seed->id)) {
        return failure<BlessResult>(ErrorKind::LIFECYCLE, "seed_not_eligible");
    }
    if (!state->rounds.isBlessingOpen(now)) return failure<BlessResult>(ErrorKind::LIFECYCLE, "blessing_period_ended");

    auto receipt = Treasury::quote(req.payment, params.blessingCost);
    if (!receipt) return failure<BlessResult>(ErrorKind::PAYMENT, "insufficient_payment");

    if (!persist(CommandType::BLESS, now, encodeBlessing(req))) {
        return failure<BlessResult>(ErrorKind::LIFECYCLE, "journal_unavailable");
    }

    Seed* target = state->registry.findMutable(req.seedId);
    uint64_t delta = state->scoring.applyBlessing(*target, req.elector, req.actor, params, clock(), now);
    state->treasury.credit(state->config.treasury(), receipt->charged);
    state->treasury.recordRefund(receipt->refunded);

    out.ok = true;
    out.seedId = target->id;
    out.scoreDelta = delta;
    out.newScore = target->blessingScore;
    out.remainingToday = remaining - 1;
    out.charged = receipt->charged;
    out.refunded = receipt->refunded;

    emit(EngineEventType::BlessingSubmitted, target->id, req.actor, now,
         {{"elector", req.elector}, {"delegated", req.actor != req.elector ? "true" : "false"},
          {"scoreDelta", std::to_string(delta)}});
    emit(EngineEventType::SeedScoreUpdated, target->id, req.actor, now,
         {{"score", std::to_string(target->blessingScore)}});
    if (!replaying) {
        logDebug("Blessing on seed " + std::to_string(target->id) + " by " + redact(req.elector) +
                 " delta=" + std::to_string(delta) + " score=" + std::to_string(target->blessingScore));
    }
    return out;
}

std::vector<BlessResult> CurationEngine::Impl::batch(const Address& rawRelayer,
                                                     const std::vector<BlessingRequest>& requests,
                                                     Timestamp now) {
    auto failAll = [&requests](ErrorKind kind, const std::string& code) {
        return std::vector<BlessResult>(std::max<size_t>(requests.size(), 1), failure<BlessResult>(kind, code));
    };

    Address relayer = normalizeAddress(rawRelayer);
    if (relayer.empty()) return failAll(ErrorKind::VALIDATION, "invalid_address");
    if (requests.empty()) return failAll(ErrorKind::VALIDATION, "empty_batch");
    if (requests.size() > MAX_BATCH_SIZE) return failAll(ErrorKind::VALIDATION, "batch_too_large");
    if (!state->access.hasRole(Role::RELAYER, relayer)) return failAll(ErrorKind::AUTHORIZATION, "missing_role");

    std::vector<BlessResult> results;
    results.reserve(requests.size());
    size_t accepted = 0;
    for (const auto& r : requests) {
        BlessingRequest req = r;
        req.actor = relayer;
        BlessResult res = bless(req, now);
        if (res.ok) {
            accepted++;
        } else {
            emit(EngineEventType::BlessingFailed, req.seedId, relayer, now,
                 {{"elector", req.elector}, {"error", res.error}});
        }
        results.push_back(res);
    }
    logInfo("Batch blessing: " + std::to_string(accepted) + "/" + std::to_string(requests.size()) + " accepted");
    return results;
}

CommandmentResult CurationEngine::Impl::commandment(CommandmentRequest req, Timestamp now) {
    CommandmentResult out;
    if (!gate(out)) return out;

    req.elector = normalizeAddress(req.elector);
    req.actor = req.actor.empty() ? req.elector : normalizeAddress(req.actor);
    if (req.elector.empty() || req.actor.empty()) {
        return failure<CommandmentResult>(ErrorKind::VALIDATION, "invalid_address");
    }
    req.contentHandle = SeedRegistry::normalizeContentHandle(req.contentHandle);
    if (req.contentHandle.empty()) return failure<CommandmentResult>(ErrorKind::VALIDATION, "invalid_content_handle");
    if (req.unitIds.empty()) return failure<CommandmentResult>(ErrorKind::VALIDATION, "empty_unit_ids");
    const Seed* seed = state->registry.find(req.seedId);
    if (!seed) return failure<CommandmentResult>(ErrorKind::VALIDATION, "seed_not_found");

    if (!state->access.canActFor(req.actor, req.elector)) {
        return failure<CommandmentResult>(ErrorKind::AUTHORIZATION, "not_authorized");
    }

    OpResult elig = checkEligibility(req.elector, req.unitIds, req.proof);
    if (!elig.ok) return failure<CommandmentResult>(elig.kind, elig.error);

    const EngineParams& params = state->config.current();
    uint64_t remaining = state->scoring.remainingCommandments(req.elector, req.unitIds.size(), params, now);
    if (remaining == 0) return failure<CommandmentResult>(ErrorKind::ELIGIBILITY, "daily_commandment_limit_reached");

    if (seed->isRetracted) return failure<CommandmentResult>(ErrorKind::LIFECYCLE, "seed_retracted");

    auto receipt = Treasury::quote(req.payment, params.commandmentCost);
    if (!receipt) return failure<CommandmentResult>(ErrorKind::PAYMENT, "insufficient_payment");

    if (!persist(CommandType::COMMANDMENT, now, encodeCommandment(req))) {
        return failure<CommandmentResult>(ErrorKind::LIFECYCLE, "journal_unavailable");
    }

    bool scoring = params.commandmentWeight > 0 &&
                   state->registry.isEligible(seed->id) &&
                   state->rounds.isBlessingOpen(now);
    Seed* target = state->registry.findMutable(req.seedId);
    Commandment c = state->scoring.applyCommandment(*target, req.elector, req.actor, req.contentHandle,
                                                    scoring, params, clock(), now);
    state->treasury.credit(state->config.treasury(), receipt->charged);
    state->treasury.recordRefund(receipt->refunded);

    out.ok = true;
    out.commandmentId = c.id;
    out.scoreDelta = c.scoreDelta;
    out.remainingToday = remaining - 1;
    out.charged = receipt->charged;
    out.refunded = receipt->refunded;

    emit(EngineEventType::CommandmentSubmitted, target->id, req.actor, now,
         {{"commandmentId", std::to_string(c.id)}, {"author", req.elector}, {"contentHandle", c.contentHandle}});
    if (c.scoreDelta > 0) {
        emit(EngineEventType::SeedScoreUpdated, target->id, req.actor, now,
             {{"score", std::to_string(target->blessingScore)}});
    }
    if (!replaying) logDebug("Commandment " + std::to_string(c.id) + " on seed " + std::to_string(target->id));
    return out;
}

AdvanceResult CurationEngine::Impl::advance(Timestamp now, const crypto::Hash256& entropy) {
    AdvanceResult out;
    if (!gate(out)) return out;

    RoundStateMachine& rounds = state->rounds;
    if (!rounds.isResolvable(now)) return failure<AdvanceResult>(ErrorKind::LIFECYCLE, "period_not_ended");

    const EngineParams& params = state->config.current();
    DeadlockStrategy deadlock = state->config.effectiveDeadlock();
    std::vector<Candidate> candidates = candidatesFor(state->registry.eligible().sorted());
    RoundId round = rounds.currentRound();
    std::vector<Candidate> previous;
    if (deadlock == DeadlockStrategy::ALLOW_REWINS) {
        // Past winners compete only on score earned in this round.
        previous = candidatesFor(state->registry.previousWinners());
        for (auto& c : previous) c.score = state->scoring.seedScoreByRound(round, c.id);
    }

    ResolutionPolicy policy(params.tieBreak, deadlock);
    Resolution res = policy.resolve(candidates, previous, round, entropy);
    if (res.outcome == ResolutionOutcome::NO_VALID_WINNER) {
        utils::Logger::warn("Round " + std::to_string(round) + " deadlocked under " + deadlockToString(deadlock));
        return failure<AdvanceResult>(ErrorKind::LIFECYCLE, "no_valid_winner");
    }

    RoundRecord record;
    record.number = round;
    record.periodStart = rounds.periodStart();
    record.periodDuration = rounds.periodDuration();
    record.resolvedAt = now;
    record.winnerSeedId = res.outcome == ResolutionOutcome::WINNER ? res.winner : NO_SEED;
    record.winningScore = res.score;
    record.skipped = res.outcome == ResolutionOutcome::SKIPPED;
    record.viaDeadlock = res.viaDeadlock;
    record.deadlockStrategy = deadlock;
    record.candidateCount = candidates.size();

    WinnerNotification note;
    if (!record.skipped) {
        const Seed* w = state->registry.find(record.winnerSeedId);
        note.round = round;
        note.seedId = w->id;
        note.contentHandle = w->contentHandle;
        note.finalScore = w->blessingScore;
        note.creator = w->creator;
        note.resolvedAt = now;
    }

    utils::ByteBuffer payload;
    payload.writeArray(entropy);
    database::WriteBatch extra;
    extra.put(Journal::roundKey(round), encodeRoundRecord(record));
    if (!record.skipped) extra.put(Journal::winnerKey(round), encodeWinner(note));
    if (!persist(CommandType::ADVANCE, now, payload.data(), &extra)) {
        return failure<AdvanceResult>(ErrorKind::LIFECYCLE, "journal_unavailable");
    }

    size_t resetCount = 0;
    if (!record.skipped) {
        state->registry.markWinner(record.winnerSeedId, round);
        if (params.scoreResetOnRoundEnd) {
            for (const auto& c : candidates) {
                if (c.id == record.winnerSeedId) continue;
                Seed* s = state->registry.findMutable(c.id);
                if (s && s->blessingScore > 0) {
                    s->blessingScore = 0;
                    resetCount++;
                }
            }
        }
        state->winners.push_back(note);
    }

    RoundMode previousMode = params.roundMode;
    std::vector<std::string> applied = state->config.applyPending();
    const EngineParams& next = state->config.current();
    rounds.close(record, now, next.votingPeriod);
    if (next.roundMode == RoundMode::ROUND_BASED || next.roundMode != previousMode) {
        state->registry.rebuildEligible(next.roundMode, rounds.currentRound());
    }

    if (record.skipped) {
        emit(EngineEventType::RoundSkipped, NO_SEED, "", now,
             {{"round", std::to_string(round)}, {"strategy", deadlockToString(deadlock)}});
    } else {
        emit(EngineEventType::WinnerSelected, record.winnerSeedId, "", now,
             {{"round", std::to_string(round)}, {"score", std::to_string(record.winningScore)},
              {"viaDeadlock", record.viaDeadlock ? "true" : "false"}, {"rewin", res.rewin ? "true" : "false"}});
        if (!replaying) winnerOutbox.push_back(note);
    }
    if (params.scoreResetOnRoundEnd && !record.skipped) {
        emit(EngineEventType::ScoresReset, NO_SEED, "", now,
             {{"round", std::to_string(round)}, {"seedsReset", std::to_string(resetCount)}});
    }
    if (!applied.empty()) {
        std::string names;
        for (const auto& n : applied) names += (names.empty() ? "" : ",") + n;
        emit(EngineEventType::ConfigApplied, NO_SEED, "", now, {{"params", names}});
    }
    emit(EngineEventType::BlessingPeriodStarted, NO_SEED, "", now,
         {{"periodStart", std::to_string(now)}, {"periodDuration", std::to_string(next.votingPeriod)}});

    out.ok = true;
    out.resolvedRound = round;
    out.newRound = rounds.currentRound();
    out.winnerSeedId = record.winnerSeedId;
    out.winningScore = record.winningScore;
    out.skipped = record.skipped;
    out.viaDeadlock = record.viaDeadlock;
    out.appliedConfig = applied;

    if (!replaying) {
        if (record.skipped) {
            logInfo("Round " + std::to_string(round) + " skipped");
        } else {
            logInfo("Round " + std::to_string(round) + " winner: seed " + std::to_string(record.winnerSeedId) +
                    " score=" + std::to_string(record.winningScore) + (record.viaDeadlock ? " (deadlock)" : ""));
        }
    }
    return out;
}

OpResult CurationEngine::Impl::updateRoot(const Address& rawCaller, const crypto::Hash256& root, Timestamp now) {
    Address caller = normalizeAddress(rawCaller);
    OpResult chk = requireAdmin(caller);
    if (!chk.ok) return chk;
    if (crypto::isZero(root)) return failure<OpResult>(ErrorKind::VALIDATION, "invalid_ownership_root");

    utils::ByteBuffer payload;
    payload.writeString(caller);
    payload.writeArray(root);
    if (!persist(CommandType::UPDATE_ROOT, now, payload.data())) {
        return failure<OpResult>(ErrorKind::LIFECYCLE, "journal_unavailable");
    }

    state->roots.rotate(root, now);
    emit(EngineEventType::OwnershipRootUpdated, NO_SEED, caller, now, {{"root", "0x" + crypto::toHex(root)}});
    if (!replaying) logInfo("Ownership root updated to 0x" + crypto::toHex(root));
    return success();
}

OpResult CurationEngine::Impl::schedule(const Address& rawCaller, const PendingParams& update, Timestamp now) {
    Address caller = normalizeAddress(rawCaller);
    OpResult chk = requireAdmin(caller);
    if (!chk.ok) return chk;
    chk = state->config.validateUpdate(update);
    if (!chk.ok) return chk;

    utils::ByteBuffer payload;
    payload.writeString(caller);
    payload.writeBytes(encodePendingParams(update));
    if (!persist(CommandType::SCHEDULE_PARAMS, now, payload.data())) {
        return failure<OpResult>(ErrorKind::LIFECYCLE, "journal_unavailable");
    }

    state->config.schedule(update);
    std::string names;
    for (const auto& n : update.names()) names += (names.empty() ? "" : ",") + n;
    emit(EngineEventType::ConfigScheduled, NO_SEED, caller, now, {{"params", names}});
    if (!replaying) logInfo("Configuration staged for next round: " + names);
    return success();
}

OpResult CurationEngine::Impl::setTreasury(const Address& rawCaller, const Address& rawTreasury, Timestamp now) {
    Address caller = normalizeAddress(rawCaller);
    OpResult chk = requireAdmin(caller);
    if (!chk.ok) return chk;
    Address treasury = normalizeAddress(rawTreasury);
    if (treasury.empty()) return failure<OpResult>(ErrorKind::VALIDATION, "invalid_address");

    utils::ByteBuffer payload;
    payload.writeString(caller);
    payload.writeString(treasury);
    if (!persist(CommandType::SET_TREASURY, now, payload.data())) {
        return failure<OpResult>(ErrorKind::LIFECYCLE, "journal_unavailable");
    }

    state->config.setTreasury(treasury);
    emit(EngineEventType::TreasuryUpdated, NO_SEED, caller, now, {{"treasury", treasury}});
    return success();
}

OpResult CurationEngine::Impl::grant(const Address& rawCaller, Role role, const Address& rawAccount, Timestamp now) {
    Address caller = normalizeAddress(rawCaller);
    OpResult chk = requireAdmin(caller);
    if (!chk.ok) return chk;
    Address account = normalizeAddress(rawAccount);
    if (account.empty()) return failure<OpResult>(ErrorKind::VALIDATION, "invalid_address");
    if (state->access.hasRole(role, account)) return failure<OpResult>(ErrorKind::LIFECYCLE, "role_already_granted");

    utils::ByteBuffer payload;
    payload.writeString(caller);
    payload.writeUint8(static_cast<uint8_t>(role));
    payload.writeString(account);
    if (!persist(CommandType::GRANT_ROLE, now, payload.data())) {
        return failure<OpResult>(ErrorKind::LIFECYCLE, "journal_unavailable");
    }

    state->access.grant(role, account);
    emit(EngineEventType::RoleGranted, NO_SEED, caller, now, {{"role", roleToString(role)}, {"account", account}});
    if (!replaying) logInfo("Granted " + roleToString(role) + " to " + redact(account));
    return success();
}

OpResult CurationEngine::Impl::revoke(const Address& rawCaller, Role role, const Address& rawAccount, Timestamp now) {
    Address caller = normalizeAddress(rawCaller);
    OpResult chk = requireAdmin(caller);
    if (!chk.ok) return chk;
    Address account = normalizeAddress(rawAccount);
    if (account.empty()) return failure<OpResult>(ErrorKind::VALIDATION, "invalid_address");
    if (!state->access.hasRole(role, account)) return failure<OpResult>(ErrorKind::LIFECYCLE, "role_not_granted");
    if (role == Role::ADMIN && state->access.memberCount(Role::ADMIN) == 1) {
        return failure<OpResult>(ErrorKind::LIFECYCLE, "last_admin");
    }

    utils::ByteBuffer payload;
    payload.writeString(caller);
    payload.writeUint8(static_cast<uint8_t>(role));
    payload.writeString(account);
    if (!persist(CommandType::REVOKE_ROLE, now, payload.data())) {
        return failure<OpResult>(ErrorKind::LIFECYCLE, "journal_unavailable");
    }

    state->access.revoke(role, account);
    emit(EngineEventType::RoleRevoked, NO_SEED, caller, now, {{"role", roleToString(role)}, {"account", account}});
    if (!replaying) logInfo("Revoked " + roleToString(role) + " from " + redact(account));
    return success();
}

OpResult CurationEngine::Impl::delegate(const Address& rawElector, const Address& rawDelegate, bool approved, Timestamp now) {
    if (journalFailed) return failure<OpResult>(ErrorKind::LIFECYCLE, "journal_unavailable");
    Address elector = normalizeAddress(rawElector);
    Address delegate = normalizeAddress(rawDelegate);
    if (elector.empty() || delegate.empty()) return failure<OpResult>(ErrorKind::VALIDATION, "invalid_address");
    if (elector == delegate) return failure<OpResult>(ErrorKind::VALIDATION, "invalid_delegate");
    if (state->access.isDelegate(elector, delegate) == approved) return success();

    utils::ByteBuffer payload;
    payload.writeString(elector);
    payload.writeString(delegate);
    payload.writeBool(approved);
    if (!persist(CommandType::APPROVE_DELEGATE, now, payload.data())) {
        return failure<OpResult>(ErrorKind::LIFECYCLE, "journal_unavailable");
    }

    state->access.setDelegate(elector, delegate, approved);
    emit(EngineEventType::DelegateApproval, NO_SEED, elector, now,
         {{"delegate", delegate}, {"approved", approved ? "true" : "false"}});
    return success();
}

OpResult CurationEngine::Impl::pause(const Address& rawCaller, const std::string& reason, Timestamp now) {
    Address caller = normalizeAddress(rawCaller);
    OpResult chk = requireAdmin(caller);
    if (!chk.ok) return chk;
    if (reason.size() > MAX_PAUSE_REASON) return failure<OpResult>(ErrorKind::VALIDATION, "reason_too_long");
    if (state->access.isPaused()) return failure<OpResult>(ErrorKind::LIFECYCLE, "already_paused");

    utils::ByteBuffer payload;
    payload.writeString(caller);
    payload.writeString(reason);
    if (!persist(CommandType::PAUSE, now, payload.data())) {
        return failure<OpResult>(ErrorKind::LIFECYCLE, "journal_unavailable");
    }

    state->access.pause(reason);
    emit(EngineEventType::Paused, NO_SEED, caller, now, {{"reason", reason}});
    if (!replaying) utils::Logger::warn("Engine paused: " + reason);
    return success();
}

OpResult CurationEngine::Impl::unpause(const Address& rawCaller, Timestamp now) {
    Address caller = normalizeAddress(rawCaller);
    OpResult chk = requireAdmin(caller);
    if (!chk.ok) return chk;
    if (!state->access.isPaused()) return failure<OpResult>(ErrorKind::LIFECYCLE, "not_paused");

    utils::ByteBuffer payload;
    payload.writeString(caller);
    if (!persist(CommandType::UNPAUSE, now, payload.data())) {
        return failure<OpResult>(ErrorKind::LIFECYCLE, "journal_unavailable");
    }

    state->access.unpause();
    emit(EngineEventType::Unpaused, NO_SEED, caller, now);
    if (!replaying) logInfo("Engine unpaused");
    return success();
}

bool CurationEngine::Impl::applyEntry(const JournalEntry& entry) {
    bool ok = false;
    std::string error;
    try {
        utils::ByteBuffer buf(entry.payload);
        switch (entry.type) {
            case CommandType::SUBMIT: {
                std::string creator = buf.readString();
                std::string handle = buf.readString();
                auto r = submit(creator, handle, entry.timestamp);
                ok = r.ok; error = r.error;
                break;
            }
            case CommandType::RETRACT: {
                SeedId id = buf.readUint64();
                std::string caller = buf.readString();
                auto r = retract(id, caller, entry.timestamp);
                ok = r.ok; error = r.error;
                break;
            }
            case CommandType::BLESS: {
                BlessingRequest req;
                if (!decodeBlessing(entry.payload, req)) { error = "decode"; break; }
                auto r = bless(req, entry.timestamp);
                ok = r.ok; error = r.error;
                break;
            }
            case CommandType::COMMANDMENT: {
                CommandmentRequest req;
                if (!decodeCommandment(entry.payload, req)) { error = "decode"; break; }
                auto r = commandment(req, entry.timestamp);
                ok = r.ok; error = r.error;
                break;
            }
            case CommandType::ADVANCE: {
                crypto::Hash256 entropy = buf.readArray<crypto::SHA256_SIZE>();
                auto r = advance(entry.timestamp, entropy);
                ok = r.ok; error = r.error;
                break;
            }
            case CommandType::UPDATE_ROOT: {
                std::string caller = buf.readString();
                crypto::Hash256 root = buf.readArray<crypto::SHA256_SIZE>();
                auto r = updateRoot(caller, root, entry.timestamp);
                ok = r.ok; error = r.error;
                break;
            }
            case CommandType::SCHEDULE_PARAMS: {
                std::string caller = buf.readString();
                PendingParams update;
                if (!decodePendingParams(buf.readBytes(), update)) { error = "decode"; break; }
                auto r = schedule(caller, update, entry.timestamp);
                ok = r.ok; error = r.error;
                break;
            }
            case CommandType::SET_TREASURY: {
                std::string caller = buf.readString();
                std::string treasury = buf.readString();
                auto r = setTreasury(caller, treasury, entry.timestamp);
                ok = r.ok; error = r.error;
                break;
            }
            case CommandType::GRANT_ROLE:
            case CommandType::REVOKE_ROLE: {
                std::string caller = buf.readString();
                uint8_t roleByte = buf.readUint8();
                if (roleByte > static_cast<uint8_t>(Role::RELAYER)) { error = "decode"; break; }
                std::string account = buf.readString();
                Role role = static_cast<Role>(roleByte);
                auto r = entry.type == CommandType::GRANT_ROLE
                    ? grant(caller, role, account, entry.timestamp)
                    : revoke(caller, role, account, entry.timestamp);
                ok = r.ok; error = r.error;
                break;
            }
            case CommandType::APPROVE_DELEGATE: {
                std::string elector = buf.readString();
                std::string delegateAddr = buf.readString();
                bool approved = buf.readBool();
                auto r = delegate(elector, delegateAddr, approved, entry.timestamp);
                ok = r.ok; error = r.error;
                break;
            }
            case CommandType::PAUSE: {
                std::string caller = buf.readString();
                std::string reason = buf.readString();
                auto r = pause(caller, reason, entry.timestamp);
                ok = r.ok; error = r.error;
                break;
            }
            case CommandType::UNPAUSE: {
                std::string caller = buf.readString();
                auto r = unpause(caller, entry.timestamp);
                ok = r.ok; error = r.error;
                break;
            }
        }
    } catch (const std::runtime_error& e) {
        ok = false;
        error = e.what();
    }
    if (!ok) {
        utils::Logger::error("Journal replay failed at entry " + std::to_string(entry.sequence) +
                             " (" + commandTypeToString(entry.type) + "): " + error);
    }
    return ok;
}

CurationEngine::CurationEngine(const EngineOptions& options, std::shared_ptr<crypto::EligibilityOracle> oracle)
    : impl_(std::make_unique<Impl>()) {
    EngineOptions opts = options;
    opts.admin = normalizeAddress(options.admin);
    opts.treasury = normalizeAddress(options.treasury);
    std::vector<Address> creators;
    for (const auto& c : options.creators) {
        Address a = normalizeAddress(c);
        if (!a.empty()) creators.push_back(a);
    }
    std::vector<Address> relayers;
    for (const auto& r : options.relayers) {
        Address a = normalizeAddress(r);
        if (!a.empty()) relayers.push_back(a);
    }
    opts.creators = creators;
    opts.relayers = relayers;
    if (opts.admin.empty()) {
        utils::Logger::warn("Engine created without a valid admin address; admin operations are disabled");
    }
    OpResult valid = ConfigLedger::validate(opts.params);
    if (!valid.ok) {
        utils::Logger::warn("Initial parameters rejected (" + valid.error + "), using defaults");
        opts.params = EngineParams();
    }
    impl_->reset(opts);
    impl_->oracle = oracle ? oracle : std::make_shared<crypto::MerkleEligibilityOracle>();
}

CurationEngine::~CurationEngine() {
    close();
}

bool CurationEngine::open(const std::string& dbPath) {
    std::unique_lock<std::shared_mutex> lock(impl_->mtx);
    if (impl_->persistent) return false;

    if (!impl_->db.open(dbPath)) {
        utils::Logger::error("Cannot open database " + dbPath + ": " + impl_->db.lastError());
        return false;
    }
    impl_->journal = std::make_unique<Journal>(impl_->db);
    if (!impl_->journal->load() || impl_->appliedCommands != 0) {
        utils::Logger::error("Database " + dbPath + " cannot be attached to an engine that already has state");
        impl_->journal.reset();
        impl_->db.close();
        return false;
    }

    std::vector<uint8_t> genesis = impl_->db.get(Journal::GENESIS_KEY);
    if (genesis.empty()) {
        if (impl_->journal->nextSequence() != 1) {
            utils::Logger::error("Database " + dbPath + " has journal entries but no genesis record");
            impl_->journal.reset();
            impl_->db.close();
            return false;
        }
        database::WriteBatch batch;
        batch.put(Journal::GENESIS_KEY, encodeOptions(impl_->options));
        std::string version = ENGINE_VERSION;
        batch.put(Journal::VERSION_KEY, std::vector<uint8_t>(version.begin(), version.end()));
        if (!impl_->db.write(batch)) {
            utils::Logger::error("Cannot write genesis to " + dbPath + ": " + impl_->db.lastError());
            impl_->journal.reset();
            impl_->db.close();
            return false;
        }
        logInfo("Initialized new curation database at " + dbPath);
    } else {
        EngineOptions stored;
        if (!decodeOptions(genesis, stored)) {
            utils::Logger::error("Corrupt genesis record in " + dbPath);
            impl_->journal.reset();
            impl_->db.close();
            return false;
        }
        EngineOptions previous = impl_->options;
        impl_->reset(stored);
        impl_->replaying = true;
        bool ok = impl_->journal->replay([this](const JournalEntry& e) { return impl_->applyEntry(e); });
        impl_->replaying = false;
        if (!ok) {
            impl_->reset(previous);
            impl_->journal.reset();
            impl_->db.close();
            return false;
        }
        logInfo("Replayed " + std::to_string(impl_->journal->nextSequence() - 1) + " journal entries from " + dbPath +
                ", round " + std::to_string(impl_->state->rounds.currentRound()));
    }

    impl_->persistent = true;
    impl_->journalFailed = false;
    return true;
}

void CurationEngine::close() {
    std::unique_lock<std::shared_mutex> lock(impl_->mtx);
    if (!impl_->persistent) return;
    impl_->journal.reset();
    impl_->db.close();
    impl_->persistent = false;
}

bool CurationEngine::isPersistent() const {
    std::shared_lock<std::shared_mutex> lock(impl_->mtx);
    return impl_->persistent;
}

SubmitResult CurationEngine::submitSeed(const Address& creator, const std::string& contentHandle, Timestamp now) {
    SubmitResult r;
    {
        std::unique_lock<std::shared_mutex> lock(impl_->mtx);
        r = impl_->submit(creator, contentHandle, now);
    }
    if (!r.ok) logDebug("submit rejected: " + r.error);
    impl_->flush();
    return r;
}

OpResult CurationEngine::retractSeed(SeedId seedId, const Address& caller, Timestamp now) {
    OpResult r;
    {
        std::unique_lock<std::shared_mutex> lock(impl_->mtx);
        r = impl_->retract(seedId, caller, now);
    }
    if (!r.ok) logDebug("retract rejected: " + r.error);
    impl_->flush();
    return r;
}

BlessResult CurationEngine::blessSeed(const BlessingRequest& request, Timestamp now) {
    BlessResult r;
    {
        std::unique_lock<std::shared_mutex> lock(impl_->mtx);
        r = impl_->bless(request, now);
    }
    if (!r.ok) logDebug("blessing rejected: " + r.error);
    impl_->flush();
    return r;
}

std::vector<BlessResult> CurationEngine::batchBless(const Address& relayer, const std::vector<BlessingRequest>& requests,
                                                    Timestamp now) {
    std::vector<BlessResult> r;
    {
        std::unique_lock<std::shared_mutex> lock(impl_->mtx);
        r = impl_->batch(relayer, requests, now);
    }
    impl_->flush();
    return r;
}

CommandmentResult CurationEngine::addCommandment(const CommandmentRequest& request, Timestamp now) {
    CommandmentResult r;
    {
        std::unique_lock<std::shared_mutex> lock(impl_->mtx);
        r = impl_->commandment(request, now);
    }
    if (!r.ok) logDebug("commandment rejected: " + r.error);
    impl_->flush();
    return r;
}

AdvanceResult CurationEngine::advance(Timestamp now, const crypto::Hash256& entropy) {
    AdvanceResult r;
    {
        std::unique_lock<std::shared_mutex> lock(impl_->mtx);
        r = impl_->advance(now, entropy);
    }
    if (!r.ok) logDebug("advance rejected: " + r.error);
    impl_->flush();
    return r;
}

OpResult CurationEngine::updateOwnershipRoot(const Address& caller, const crypto::Hash256& root, Timestamp now) {
    OpResult r;
    {
        std::unique_lock<std::shared_mutex> lock(impl_->mtx);
        r = impl_->updateRoot(caller, root, now);
    }
    impl_->flush();
    return r;
}

OpResult CurationEngine::scheduleParams(const Address& caller, const PendingParams& update, Timestamp now) {
    OpResult r;
    {
        std::unique_lock<std::shared_mutex> lock(impl_->mtx);
        r = impl_->schedule(caller, update, now);
    }
    if (!r.ok) logDebug("schedule rejected: " + r.error);
    impl_->flush();
    return r;
}

OpResult CurationEngine::setTreasury(const Address& caller, const Address& treasury, Timestamp now) {
    OpResult r;
    {
        std::unique_lock<std::shared_mutex> lock(impl_->mtx);
        r = impl_->setTreasury(caller, treasury, now);
    }
    impl_->flush();
    return r;
}

OpResult CurationEngine::grantRole(const Address& caller, Role role, const Address& account, Timestamp now) {
    OpResult r;
    {
        std::unique_lock<std::shared_mutex> lock(impl_->mtx);
        r = impl_->grant(caller, role, account, now);
    }
    impl_->flush();
    return r;
}

OpResult CurationEngine::revokeRole(const Address& caller, Role role, const Address& account, Timestamp now) {
    OpResult r;
    {
        std::unique_lock<std::shared_mutex> lock(impl_->mtx);
        r = impl_->revoke(caller, role, account, now);
    }
    impl_->flush();
    return r;
}

OpResult CurationEngine::approveDelegate(const Address& elector, const Address& delegate, bool approved, Timestamp now) {
    OpResult r;
    {
        std::unique_lock<std::shared_mutex> lock(impl_->mtx);
        r = impl_->delegate(elector, delegate, approved, now);
    }
    impl_->flush();
    return r;
}

OpResult CurationEngine::pause(const Address& caller, const std::string& reason, Timestamp now) {
    OpResult r;
    {
        std::unique_lock<std::shared_mutex> lock(impl_->mtx);
        r = impl_->pause(caller, reason, now);
    }
    impl_->flush();
    return r;
}

OpResult CurationEngine::unpause(const Address& caller, Timestamp now) {
    OpResult r;
    {
        std::unique_lock<std::shared_mutex> lock(impl_->mtx);
        r = impl_->unpause(caller, now);
    }
    impl_->flush();
    return r;
}

std::optional<Seed> CurationEngine::getSeed(SeedId seedId) const {
    std::shared_lock<std::shared_mutex> lock(impl_->mtx);
    const Seed* s = impl_->state->registry.find(seedId);
    if (!s) return std::nullopt;
    return *s;
}

size_t CurationEngine::seedCount() const {
    std::shared_lock<std::shared_mutex> lock(impl_->mtx);
    return impl_->state->registry.count();
}

std::vector<Seed> CurationEngine::getSeeds(size_t offset, size_t limit) const {
    std::shared_lock<std::shared_mutex> lock(impl_->mtx);
    return impl_->state->registry.page(offset, limit);
}

std::vector<SeedId> CurationEngine::seedsByRound(RoundId round) const {
    std::shared_lock<std::shared_mutex> lock(impl_->mtx);
    return impl_->state->registry.seedsByRound(round);
}

std::vector<SeedId> CurationEngine::currentRoundSeeds() const {
    std::shared_lock<std::shared_mutex> lock(impl_->mtx);
    return impl_->state->registry.seedsByRound(impl_->state->rounds.currentRound());
}

std::vector<SeedId> CurationEngine::eligibleSeeds() const {
    std::shared_lock<std::shared_mutex> lock(impl_->mtx);
    return impl_->state->registry.eligible().ids();
}

std::vector<SeedId> CurationEngine::eligibleSeedsPage(size_t offset, size_t limit) const {
    std::shared_lock<std::shared_mutex> lock(impl_->mtx);
    return impl_->state->registry.eligible().page(offset, limit);
}

size_t CurationEngine::eligibleCount() const {
    std::shared_lock<std::shared_mutex> lock(impl_->mtx);
    return impl_->state->registry.eligible().size();
}

std::pair<SeedId, uint64_t> CurationEngine::currentLeader() const {
    std::shared_lock<std::shared_mutex> lock(impl_->mtx);
    const EngineParams& params = impl_->state->config.current();
    ResolutionPolicy policy(params.tieBreak, params.deadlock);
    Candidate c = policy.leader(impl_->candidatesFor(impl_->state->registry.eligible().ids()));
    return {c.id, c.score};
}

RoundId CurationEngine::currentRound() const {
    std::shared_lock<std::shared_mutex> lock(impl_->mtx);
    return impl_->state->rounds.currentRound();
}

Timestamp CurationEngine::periodStart() const {
    std::shared_lock<std::shared_mutex> lock(impl_->mtx);
    return impl_->state->rounds.periodStart();
}

RoundPhase CurationEngine::phase(Timestamp now) const {
    std::shared_lock<std::shared_mutex> lock(impl_->mtx);
    return impl_->state->rounds.phase(now);
}

bool CurationEngine::isResolvable(Timestamp now) const {
    std::shared_lock<std::shared_mutex> lock(impl_->mtx);
    return impl_->state->rounds.isResolvable(now);
}

uint64_t CurationEngine::timeUntilPeriodEnd(Timestamp now) const {
    std::shared_lock<std::shared_mutex> lock(impl_->mtx);
    return impl_->state->rounds.timeUntilPeriodEnd(now);
}

uint64_t CurationEngine::secondsUntilDailyReset(Timestamp now) {
    return SECONDS_PER_DAY - (now % SECONDS_PER_DAY);
}

std::optional<RoundRecord> CurationEngine::roundRecord(RoundId round) const {
    std::shared_lock<std::shared_mutex> lock(impl_->mtx);
    return impl_->state->rounds.record(round);
}

SeedId CurationEngine::roundWinner(RoundId round) const {
    std::shared_lock<std::shared_mutex> lock(impl_->mtx);
    return impl_->state->rounds.winnerOf(round);
}

std::vector<RoundRecord> CurationEngine::roundHistory() const {
    std::shared_lock<std::shared_mutex> lock(impl_->mtx);
    return impl_->state->rounds.history();
}

std::vector<WinnerNotification> CurationEngine::winners() const {
    std::shared_lock<std::shared_mutex> lock(impl_->mtx);
    return impl_->state->winners;
}

uint64_t CurationEngine::blessingCount(const Address& elector, SeedId seedId) const {
    std::shared_lock<std::shared_mutex> lock(impl_->mtx);
    return impl_->state->scoring.blessingCount(normalizeAddress(elector), seedId);
}

bool CurationEngine::hasBlessed(const Address& elector, SeedId seedId) const {
    std::shared_lock<std::shared_mutex> lock(impl_->mtx);
    return impl_->state->scoring.hasBlessed(normalizeAddress(elector), seedId);
}

uint64_t CurationEngine::blessingsUsedToday(const Address& elector, Timestamp now) const {
    std::shared_lock<std::shared_mutex> lock(impl_->mtx);
    return impl_->state->scoring.blessingsUsedToday(normalizeAddress(elector), now);
}

uint64_t CurationEngine::commandmentsUsedToday(const Address& elector, Timestamp now) const {
    std::shared_lock<std::shared_mutex> lock(impl_->mtx);
    return impl_->state->scoring.commandmentsUsedToday(normalizeAddress(elector), now);
}

uint64_t CurationEngine::remainingBlessings(const Address& elector, uint64_t ownedUnits, Timestamp now) const {
    std::shared_lock<std::shared_mutex> lock(impl_->mtx);
    return impl_->state->scoring.remainingBlessings(normalizeAddress(elector), ownedUnits,
                                                    impl_->state->config.current(), now);
}

std::vector<BlessingRecord> CurationEngine::seedBlessings(SeedId seedId) const {
    std::shared_lock<std::shared_mutex> lock(impl_->mtx);
    return impl_->state->scoring.seedBlessings(seedId);
}

std::vector<BlessingRecord> CurationEngine::electorBlessings(const Address& elector) const {
    std::shared_lock<std::shared_mutex> lock(impl_->mtx);
    return impl_->state->scoring.electorBlessings(normalizeAddress(elector));
}

size_t CurationEngine::totalBlessings() const {
    std::shared_lock<std::shared_mutex> lock(impl_->mtx);
    return impl_->state->scoring.totalBlessings();
}

std::vector<Commandment> CurationEngine::commandmentsBySeed(SeedId seedId) const {
    std::shared_lock<std::shared_mutex> lock(impl_->mtx);
    return impl_->state->scoring.commandmentsBySeed(seedId);
}

std::vector<Commandment> CurationEngine::commandmentsByAuthor(const Address& author) const {
    std::shared_lock<std::shared_mutex> lock(impl_->mtx);
    return impl_->state->scoring.commandmentsByAuthor(normalizeAddress(author));
}

uint64_t CurationEngine::seedScoreByRound(RoundId round, SeedId seedId) const {
    std::shared_lock<std::shared_mutex> lock(impl_->mtx);
    return impl_->state->scoring.seedScoreByRound(round, seedId);
}

uint64_t CurationEngine::electorSeedBlessingsByRound(RoundId round, const Address& elector, SeedId seedId) const {
    std::shared_lock<std::shared_mutex> lock(impl_->mtx);
    return impl_->state->scoring.electorSeedBlessingsByRound(round, normalizeAddress(elector), seedId);
}

EngineParams CurationEngine::currentParams() const {
    std::shared_lock<std::shared_mutex> lock(impl_->mtx);
    return impl_->state->config.current();
}

PendingParams CurationEngine::pendingParams() const {
    std::shared_lock<std::shared_mutex> lock(impl_->mtx);
    return impl_->state->config.pending();
}

Address CurationEngine::treasury() const {
    std::shared_lock<std::shared_mutex> lock(impl_->mtx);
    return impl_->state->config.treasury();
}

uint64_t CurationEngine::treasuryBalance(const Address& treasury) const {
    std::shared_lock<std::shared_mutex> lock(impl_->mtx);
    return impl_->state->treasury.balance(normalizeAddress(treasury));
}

OwnershipRoots CurationEngine::ownershipRoots() const {
    std::shared_lock<std::shared_mutex> lock(impl_->mtx);
    return impl_->state->roots;
}

bool CurationEngine::isPaused() const {
    std::shared_lock<std::shared_mutex> lock(impl_->mtx);
    return impl_->state->access.isPaused();
}

std::string CurationEngine::pauseReason() const {
    std::shared_lock<std::shared_mutex> lock(impl_->mtx);
    return impl_->state->access.pauseReason();
}

bool CurationEngine::hasRole(Role role, const Address& account) const {
    std::shared_lock<std::shared_mutex> lock(impl_->mtx);
    return impl_->state->access.hasRole(role, normalizeAddress(account));
}

bool CurationEngine::isDelegate(const Address& elector, const Address& delegate) const {
    std::shared_lock<std::shared_mutex> lock(impl_->mtx);
    return impl_->state->access.isDelegate(normalizeAddress(elector), normalizeAddress(delegate));
}

EngineStatus CurationEngine::status(Timestamp now) const {
    std::shared_lock<std::shared_mutex> lock(impl_->mtx);
    const EngineState& st = *impl_->state;
    EngineStatus s;
    s.round = st.rounds.currentRound();
    s.phase = st.rounds.phase(now);
    s.periodStart = st.rounds.periodStart();
    s.periodDuration = st.rounds.periodDuration();
    s.timeUntilPeriodEnd = st.rounds.timeUntilPeriodEnd(now);
    s.secondsUntilDailyReset = secondsUntilDailyReset(now);
    s.paused = st.access.isPaused();
    s.pauseReason = st.access.pauseReason();
    s.totalSeeds = st.registry.count();
    s.eligibleSeeds = st.registry.eligible().size();
    ResolutionPolicy policy(st.config.current().tieBreak, st.config.current().deadlock);
    Candidate leader = policy.leader(impl_->candidatesFor(st.registry.eligible().ids()));
    s.leader = leader.id;
    s.leaderScore = leader.score;
    s.hasPendingConfig = st.config.hasPending();
    s.persistent = impl_->persistent;
    return s;
}

std::string CurationEngine::version() {
    return ENGINE_VERSION;
}

void CurationEngine::onEvent(EngineEventHandler handler) {
    std::unique_lock<std::shared_mutex> lock(impl_->mtx);
    impl_->eventHandler = handler;
}

void CurationEngine::onWinnerSelected(WinnerHandler handler) {
    std::unique_lock<std::shared_mutex> lock(impl_->mtx);
    impl_->winnerHandler = handler;
}

}
}
