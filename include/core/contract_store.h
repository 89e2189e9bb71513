#pragma once

#include "core/events.h"
#include "core/hackathon.h"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace zackathon {
namespace core {

constexpr uint32_t STORE_FORMAT_VERSION = 1;

struct StoredState {
    std::map<uint64_t, HackathonRecord> records;
    uint64_t hackathonCount = 0;
    std::vector<ContractEvent> events;
};

// Durable contract state on the SQLite key/value store:
//   hackathon:<id>        serialized HackathonRecord
//   meta:hackathon_count  highest assigned id
//   meta:version          store format
//   event:<sequence>      serialized ContractEvent
class ContractStore {
public:
    ContractStore();
    ~ContractStore();

    bool open(const std::string& path);
    void close();
    bool isOpen() const;

    Result<StoredState> load() const;

    // Writes the record, the id counter and the new events in one transaction.
    Result<void> commit(const HackathonRecord& record, uint64_t hackathonCount,
                        const std::vector<ContractEvent>& events);

    static std::string recordKey(uint64_t id);
    static std::string eventKey(uint64_t sequence);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
