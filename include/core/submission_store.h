#pragma once

#include "core/context.h"
#include "core/hackathon.h"

namespace zackathon {
namespace core {

class SubmissionStore {
public:
    // Imports the caller's encrypted content reference and returns the new
    // submission id (arrival order, from 0).
    static Result<uint64_t> submit(HackathonRecord& record, const OperationContext& ctx,
                                   const fhe::ExternalInput& encryptedReference);

    // Judges only, once access has been granted.
    static Result<CiphertextHandle> encryptedReference(const HackathonRecord& record, const Address& caller,
                                                       uint64_t submissionId);
};

}
}
