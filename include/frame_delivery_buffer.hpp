#pragma once

#include <atomic>
#include <cstdint>
#include <memory>

#include "types.hpp"

// Single-slot, most-recent-wins store for the latest annotated frame.
//
// The slot is a shared_ptr swapped with the atomic shared_ptr free functions,
// so a reader either sees a complete frame or nothing. No caller-visible lock
// is taken; libstdc++ backs these functions with a small internal spinlock
// pool, so a reader can briefly spin behind a concurrent swap but never waits
// on inference or encoding. Publishing a sequence number lower than or equal
// to the one in the slot is rejected, which keeps what readers observe
// monotonic even if two writers race.
class FrameDeliveryBuffer {
public:
  using FramePtr = std::shared_ptr<const AnnotatedFrame>;

  // Returns false if a frame with an equal or newer sequence is already stored.
  bool publish(FramePtr frame) {
    if (!frame) return false;
    FramePtr current = std::atomic_load_explicit(&slot_, std::memory_order_acquire);
    do {
      if (current && current->sequence >= frame->sequence) {
        rejected_.fetch_add(1, std::memory_order_relaxed);
        return false;
      }
    } while (!std::atomic_compare_exchange_weak_explicit(
        &slot_, &current, frame, std::memory_order_acq_rel, std::memory_order_acquire));
    published_.fetch_add(1, std::memory_order_relaxed);
    uint64_t seen = latest_sequence_.load(std::memory_order_relaxed);
    while (seen < frame->sequence &&
           !latest_sequence_.compare_exchange_weak(seen, frame->sequence, std::memory_order_release,
                                                   std::memory_order_relaxed)) {
    }
    return true;
  }

  bool publish(AnnotatedFrame frame) {
    return publish(std::make_shared<const AnnotatedFrame>(std::move(frame)));
  }

  // nullptr means no frame has been published yet.
  FramePtr latest() const { return std::atomic_load_explicit(&slot_, std::memory_order_acquire); }

  bool empty() const { return latest() == nullptr; }

  // Drops the stored frame so readers see "no frame yet" until the next
  // publish. latest_sequence() is kept; sequences only grow across sessions.
  void reset() {
    std::atomic_store_explicit(&slot_, FramePtr{}, std::memory_order_release);
  }

  uint64_t latest_sequence() const { return latest_sequence_.load(std::memory_order_acquire); }
  uint64_t published() const { return published_.load(std::memory_order_relaxed); }
  uint64_t rejected() const { return rejected_.load(std::memory_order_relaxed); }

private:
  FramePtr slot_;
  std::atomic<uint64_t> latest_sequence_{0};
  std::atomic<uint64_t> published_{0};
  std::atomic<uint64_t> rejected_{0};
};
