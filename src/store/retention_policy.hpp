#pragma once

#include <cstddef>
#include <vector>

#include "utils/time.hpp"

namespace mailkeep::store {

struct RetentionOutcome {
    std::size_t removed = 0;
    std::size_t archived = 0;

    bool Changed() const { return removed > 0 || archived > 0; }

    RetentionOutcome& operator+=(const RetentionOutcome& other) {
        removed += other.removed;
        archived += other.archived;
        return *this;
    }
};

// Applied by RecordStore inside every mutation, on the working copy of the
// collection. BeforeWrite runs ahead of the caller's change, AfterWrite after it.
template <typename RecordT>
class RetentionPolicy {
public:
    virtual ~RetentionPolicy() = default;

    virtual RetentionOutcome BeforeWrite(std::vector<RecordT>& records, utils::TimePoint now) const {
        (void)records;
        (void)now;
        return {};
    }

    virtual RetentionOutcome AfterWrite(std::vector<RecordT>& records, utils::TimePoint now) const = 0;
};

}  // namespace mailkeep::store
