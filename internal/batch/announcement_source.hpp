#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <utility>
#include <vector>

#include "internal/announcement/announcement.hpp"

namespace dsnp::batch {

/*
  Lazily pulled sequence of signed announcements.

  Next() returns std::nullopt once the sequence is exhausted. A source is
  consumed exactly once, front to back; the batch writer never asks for an
  element twice and never needs the whole sequence in memory.
*/
class AnnouncementSource {
 public:
  virtual ~AnnouncementSource() = default;

  virtual std::optional<announcement::SignedAnnouncement> Next() = 0;
};

// Source over an in-memory list; the list must outlive the source.
class VectorSource final : public AnnouncementSource {
 public:
  explicit VectorSource(const std::vector<announcement::SignedAnnouncement>& items) : items_(items) {}

  std::optional<announcement::SignedAnnouncement> Next() override {
    if (next_ == items_.size()) return std::nullopt;
    return items_[next_++];
  }

 private:
  const std::vector<announcement::SignedAnnouncement>& items_;
  std::size_t                                          next_{0};
};

// Source backed by a generator callback (database cursor, network feed ...).
class CallbackSource final : public AnnouncementSource {
 public:
  using Generator = std::function<std::optional<announcement::SignedAnnouncement>()>;

  explicit CallbackSource(Generator generator) : generator_(std::move(generator)) {}

  std::optional<announcement::SignedAnnouncement> Next() override {
    return generator_();
  }

 private:
  Generator generator_;
};

/*
  Wraps a source so its first element can be inspected before writing
  starts. The peeked element is replayed by the first Next().
*/
class PeekingSource final : public AnnouncementSource {
 public:
  explicit PeekingSource(AnnouncementSource& inner) : inner_(inner) {}

  const announcement::SignedAnnouncement* Peek() {
    if (!peeked_) {
      head_   = inner_.Next();
      peeked_ = true;
    }
    return head_ ? &*head_ : nullptr;
  }

  std::optional<announcement::SignedAnnouncement> Next() override {
    if (peeked_) {
      peeked_ = false;
      return std::exchange(head_, std::nullopt);
    }
    return inner_.Next();
  }

 private:
  AnnouncementSource&                             inner_;
  std::optional<announcement::SignedAnnouncement> head_;
  bool                                            peeked_{false};
};

} // namespace dsnp::batch
