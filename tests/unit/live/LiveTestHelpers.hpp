#pragma once

#include <liveview/live/ComponentRegistry.hpp>
#include <liveview/live/Patch.hpp>
#include <liveview/live/Transport.hpp>

#include <atomic>
#include <memory>
#include <mutex>
#include <vector>

namespace LV::Live::Testing {

// Collects every batch the registry delivers.
struct RecordingDelivery {
    auto sink() -> PatchDelivery {
        return [this](PatchBatch batch) {
            std::lock_guard const lock{mutex};
            batches.push_back(std::move(batch));
        };
    }

    auto count() -> std::size_t {
        std::lock_guard const lock{mutex};
        return batches.size();
    }

    auto last() -> PatchBatch {
        std::lock_guard const lock{mutex};
        return batches.empty() ? PatchBatch{} : batches.back();
    }

    std::mutex              mutex;
    std::vector<PatchBatch> batches;
};

class FakeTransport final : public Transport {
public:
    explicit FakeTransport(TransportKind kind = TransportKind::EventStream)
        : kind_(kind) {}

    auto kind() const -> TransportKind override { return kind_; }
    void wake() override { wakes.fetch_add(1); }
    void close() override { closes.fetch_add(1); }

    std::atomic<int> wakes{0};
    std::atomic<int> closes{0};

private:
    TransportKind kind_;
};

} // namespace LV::Live::Testing
