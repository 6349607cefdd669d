#pragma once

#include "scan_data.hpp"

#include <optional>

// Producer of scan batches, polled from the processing thread.
class IngestionSource {
public:
    virtual ~IngestionSource() = default;
    // Non-blocking; empty when nothing is pending.
    virtual std::optional<ScanBatch> poll_batch() = 0;
    virtual bool is_healthy() const = 0;
    virtual void shutdown() = 0;
};
