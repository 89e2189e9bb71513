#include "core/hackathon.h"
#include "utils/serialize.h"
#include <stdexcept>

namespace zackathon {
namespace core {

static constexpr uint8_t RECORD_FORMAT = 1;

const char* phaseToString(Phase phase) {
    switch (phase) {
        case Phase::REGISTRATION_OPEN: return "RegistrationOpen";
        case Phase::SUBMISSIONS_OPEN: return "SubmissionsOpen";
        case Phase::JUDGING: return "Judging";
        case Phase::COMPLETED: return "Completed";
    }
    return "Unknown";
}

bool canAdvance(Phase from, Phase to) {
    return static_cast<uint8_t>(to) > static_cast<uint8_t>(from);
}

Result<void> advancePhase(Phase& phase, Phase to) {
    if (!canAdvance(phase, to)) {
        return makeError(ErrorCode::INVALID_PHASE,
                         std::string("Cannot move from ") + phaseToString(phase) + " to " + phaseToString(to));
    }
    phase = to;
    return {};
}

const char* statusToString(SubmissionStatus status) {
    switch (status) {
        case SubmissionStatus::PENDING: return "Pending";
        case SubmissionStatus::JUDGED: return "Judged";
    }
    return "Unknown";
}

bool HackathonRecord::isJudge(const Address& account) const {
    for (const auto& j : config.judges) {
        if (j == account) return true;
    }
    return false;
}

const Participant* HackathonRecord::findParticipant(const Address& account) const {
    auto it = participants.find(account);
    return it != participants.end() ? &it->second : nullptr;
}

bool HackathonRecord::hasScore(uint64_t submissionId, const Address& judge) const {
    return scores.find(ScoreKey(submissionId, judge)) != scores.end();
}

HackathonDetails HackathonRecord::details() const {
    HackathonDetails d;
    d.id = id;
    d.name = config.name;
    d.description = config.description;
    d.prizeDetails = config.prizeDetails;
    d.submissionDeadline = config.submissionDeadline;
    d.judgingDeadline = config.judgingDeadline;
    d.maxParticipants = config.maxParticipants;
    d.organizer = organizer;
    d.judges = config.judges;
    d.phase = phase;
    d.participantCount = participantCount;
    d.submissionCount = submissionCount;
    d.judgeAccessGranted = judgeAccessGranted;
    d.winnersFinalized = winnersFinalized;
    d.createdAt = createdAt;
    return d;
}

SubmissionInfo HackathonRecord::submissionInfo(uint64_t submissionId) const {
    const Submission& s = submissions.at(submissionId);
    SubmissionInfo info;
    info.id = s.id;
    info.participant = s.participant;
    info.submissionTime = s.submissionTime;
    info.status = s.status;
    info.judgeCount = s.judgeCount;
    return info;
}

static void writeAddress(utils::ByteBuffer& buf, const Address& a) {
    buf.writeArray(a.bytes());
}

static Address readAddress(utils::ByteBuffer& buf) {
    return Address(buf.readArray<crypto::ADDRESS_SIZE>());
}

static void writeHandle(utils::ByteBuffer& buf, const CiphertextHandle& h) {
    buf.writeArray(h.bytes());
}

static CiphertextHandle readHandle(utils::ByteBuffer& buf) {
    return CiphertextHandle(buf.readArray<fhe::HANDLE_SIZE>());
}

static void writeAddresses(utils::ByteBuffer& buf, const std::vector<Address>& list) {
    buf.writeVarInt(list.size());
    for (const auto& a : list) writeAddress(buf, a);
}

static std::vector<Address> readAddresses(utils::ByteBuffer& buf) {
    uint64_t n = buf.readVarInt();
    if (n > buf.remaining() / crypto::ADDRESS_SIZE) throw std::runtime_error("Address list too long");
    std::vector<Address> out;
    out.reserve(static_cast<size_t>(n));
    for (uint64_t i = 0; i < n; i++) out.push_back(readAddress(buf));
    return out;
}

std::vector<uint8_t> HackathonRecord::serialize() const {
    utils::ByteBuffer buf;
    buf.writeUint8(RECORD_FORMAT);
    buf.writeUint64(id);
    writeAddress(buf, organizer);

    buf.writeString(config.name);
    buf.writeString(config.description);
    buf.writeString(config.prizeDetails);
    buf.writeUint64(config.submissionDeadline);
    buf.writeUint64(config.judgingDeadline);
    buf.writeUint32(config.maxParticipants);
    writeAddresses(buf, config.judges);

    buf.writeUint8(static_cast<uint8_t>(phase));
    buf.writeUint32(participantCount);
    buf.writeUint32(submissionCount);
    buf.writeBool(judgeAccessGranted);
    buf.writeBool(winnersFinalized);
    buf.writeUint64(createdAt);

    buf.writeVarInt(participantList.size());
    for (const auto& addr : participantList) {
        const Participant& p = participants.at(addr);
        writeAddress(buf, p.wallet);
        buf.writeString(p.info.email);
        buf.writeString(p.info.discordHandle);
        buf.writeString(p.info.twitterHandle);
        buf.writeString(p.info.teamName);
        writeAddresses(buf, p.info.teamMembers);
        buf.writeUint64(p.registrationTime);
        buf.writeBool(p.hasSubmitted);
    }

    buf.writeVarInt(submissions.size());
    for (const auto& s : submissions) {
        buf.writeUint64(s.id);
        writeAddress(buf, s.participant);
        writeHandle(buf, s.encryptedReference);
        buf.writeUint64(s.submissionTime);
        buf.writeUint8(static_cast<uint8_t>(s.status));
        buf.writeUint32(s.judgeCount);
    }

    buf.writeVarInt(scores.size());
    for (const auto& [key, handle] : scores) {
        buf.writeUint64(key.first);
        writeAddress(buf, key.second);
        writeHandle(buf, handle);
    }

    buf.writeVarInt(aggregateScores.size());
    for (const auto& h : aggregateScores) writeHandle(buf, h);

    buf.writeVarInt(decryptedScores.size());
    for (const auto& d : decryptedScores) {
        buf.writeUint64(d.score);
        buf.writeBool(d.isDecrypted);
    }

    buf.writeVarInt(winners.size());
    for (const auto& w : winners) {
        writeAddress(buf, w.participant);
        buf.writeUint8(w.ranking);
        buf.writeUint64(w.finalScore);
        buf.writeUint64(w.submissionId);
    }
    return buf.data();
}

HackathonRecord HackathonRecord::deserialize(const std::vector<uint8_t>& data) {
    utils::ByteBuffer buf(data);
    HackathonRecord r;

    uint8_t format = buf.readUint8();
    if (format != RECORD_FORMAT) throw std::runtime_error("Unsupported record format");
    r.id = buf.readUint64();
    r.organizer = readAddress(buf);

    r.config.name = buf.readString();
    r.config.description = buf.readString();
    r.config.prizeDetails = buf.readString();
    r.config.submissionDeadline = buf.readUint64();
    r.config.judgingDeadline = buf.readUint64();
    r.config.maxParticipants = buf.readUint32();
    r.config.judges = readAddresses(buf);

    uint8_t phase = buf.readUint8();
    if (phase > static_cast<uint8_t>(Phase::COMPLETED)) throw std::runtime_error("Invalid phase");
    r.phase = static_cast<Phase>(phase);
    r.participantCount = buf.readUint32();
    r.submissionCount = buf.readUint32();
    r.judgeAccessGranted = buf.readBool();
    r.winnersFinalized = buf.readBool();
    r.createdAt = buf.readUint64();

    uint64_t participantCount = buf.readVarInt();
    for (uint64_t i = 0; i < participantCount; i++) {
        Participant p;
        p.wallet = readAddress(buf);
        p.info.email = buf.readString();
        p.info.discordHandle = buf.readString();
        p.info.twitterHandle = buf.readString();
        p.info.teamName = buf.readString();
        p.info.teamMembers = readAddresses(buf);
        p.registrationTime = buf.readUint64();
        p.hasSubmitted = buf.readBool();
        r.participantList.push_back(p.wallet);
        r.participants[p.wallet] = std::move(p);
    }

    uint64_t submissionCount = buf.readVarInt();
    for (uint64_t i = 0; i < submissionCount; i++) {
        Submission s;
        s.id = buf.readUint64();
        s.participant = readAddress(buf);
        s.encryptedReference = readHandle(buf);
        s.submissionTime = buf.readUint64();
        uint8_t status = buf.readUint8();
        if (status > static_cast<uint8_t>(SubmissionStatus::JUDGED)) throw std::runtime_error("Invalid status");
        s.status = static_cast<SubmissionStatus>(status);
        s.judgeCount = buf.readUint32();
        r.submissions.push_back(s);
    }

    uint64_t scoreCount = buf.readVarInt();
    for (uint64_t i = 0; i < scoreCount; i++) {
        uint64_t submissionId = buf.readUint64();
        Address judge = readAddress(buf);
        r.scores[ScoreKey(submissionId, judge)] = readHandle(buf);
    }

    uint64_t aggregateCount = buf.readVarInt();
    for (uint64_t i = 0; i < aggregateCount; i++) r.aggregateScores.push_back(readHandle(buf));

    uint64_t decryptedCount = buf.readVarInt();
    for (uint64_t i = 0; i < decryptedCount; i++) {
        DecryptedScore d;
        d.score = buf.readUint64();
        d.isDecrypted = buf.readBool();
        r.decryptedScores.push_back(d);
    }

    uint64_t winnerCount = buf.readVarInt();
    for (uint64_t i = 0; i < winnerCount; i++) {
        Winner w;
        w.participant = readAddress(buf);
        w.ranking = buf.readUint8();
        w.finalScore = buf.readUint64();
        w.submissionId = buf.readUint64();
        r.winners.push_back(w);
    }

    if (r.participantList.size() != r.participantCount ||
        r.submissions.size() != r.submissionCount) {
        throw std::runtime_error("Record counters disagree with contents");
    }
    return r;
}

}
}
