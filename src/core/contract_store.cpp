#include "core/contract_store.h"
#include "database/database.h"
#include "utils/logger.h"
#include "utils/serialize.h"
#include <cstdio>

namespace zackathon {
namespace core {

static const std::string KEY_COUNT = "meta:hackathon_count";
static const std::string KEY_VERSION = "meta:version";
static const std::string RECORD_PREFIX = "hackathon:";
static const std::string EVENT_PREFIX = "event:";

struct ContractStore::Impl {
    database::Database db;
};

ContractStore::ContractStore() : impl_(std::make_unique<Impl>()) {}
ContractStore::~ContractStore() { close(); }

// Zero-padded so lexical key order matches numeric order.
std::string ContractStore::recordKey(uint64_t id) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%020llu", static_cast<unsigned long long>(id));
    return RECORD_PREFIX + buf;
}

std::string ContractStore::eventKey(uint64_t sequence) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%020llu", static_cast<unsigned long long>(sequence));
    return EVENT_PREFIX + buf;
}

bool ContractStore::open(const std::string& path) {
    if (!impl_->db.open(path)) {
        LOG_ERROR("Failed to open contract store: " + path);
        return false;
    }

    auto version = impl_->db.get(KEY_VERSION);
    if (version.empty()) {
        utils::ByteBuffer buf;
        buf.writeUint32(STORE_FORMAT_VERSION);
        if (!impl_->db.put(KEY_VERSION, buf.data())) {
            LOG_ERROR("Failed to initialize contract store: " + impl_->db.lastError());
            impl_->db.close();
            return false;
        }
        return true;
    }

    try {
        utils::ByteBuffer buf(version);
        uint32_t v = buf.readUint32();
        if (v != STORE_FORMAT_VERSION) {
            LOG_ERROR("Unsupported contract store version " + std::to_string(v));
            impl_->db.close();
            return false;
        }
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Corrupt contract store version: ") + e.what());
        impl_->db.close();
        return false;
    }
    return true;
}

void ContractStore::close() {
    impl_->db.close();
}

bool ContractStore::isOpen() const {
    return impl_->db.isOpen();
}

Result<StoredState> ContractStore::load() const {
    if (!impl_->db.isOpen()) return makeError(ErrorCode::PERSISTENCE_ERROR, "Store not open");

    StoredState state;
    try {
        auto count = impl_->db.get(KEY_COUNT);
        if (!count.empty()) {
            utils::ByteBuffer buf(count);
            state.hackathonCount = buf.readUint64();
        }

        impl_->db.forEach(RECORD_PREFIX, [&state](const std::string&, const std::vector<uint8_t>& value) {
            HackathonRecord record = HackathonRecord::deserialize(value);
            state.records[record.id] = std::move(record);
            return true;
        });

        impl_->db.forEach(EVENT_PREFIX, [&state](const std::string&, const std::vector<uint8_t>& value) {
            state.events.push_back(ContractEvent::deserialize(value));
            return true;
        });
    } catch (const std::exception& e) {
        return makeError(ErrorCode::PERSISTENCE_ERROR, std::string("Corrupt contract store: ") + e.what());
    }

    for (const auto& [id, record] : state.records) {
        if (id == 0 || id > state.hackathonCount) {
            return makeError(ErrorCode::PERSISTENCE_ERROR,
                             "Record " + std::to_string(id) + " beyond hackathon count");
        }
    }
    return state;
}

Result<void> ContractStore::commit(const HackathonRecord& record, uint64_t hackathonCount,
                                   const std::vector<ContractEvent>& events) {
    if (!impl_->db.isOpen()) return makeError(ErrorCode::PERSISTENCE_ERROR, "Store not open");

    database::WriteBatch batch;
    batch.put(recordKey(record.id), record.serialize());

    utils::ByteBuffer count;
    count.writeUint64(hackathonCount);
    batch.put(KEY_COUNT, count.data());

    for (const auto& event : events) {
        batch.put(eventKey(event.sequence), event.serialize());
    }

    if (!impl_->db.write(batch)) {
        return makeError(ErrorCode::PERSISTENCE_ERROR, "Write failed: " + impl_->db.lastError());
    }
    return {};
}

}
}
