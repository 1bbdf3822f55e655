#include "core/storage/message_store.hpp"

#include <algorithm>
#include <mutex>
#include <optional>
#include <sstream>

#include "core/model/message_codec.hpp"
#include "core/util/canonical.hpp"
#include "core/util/hash.hpp"

namespace mural {
namespace {

std::optional<std::uint64_t> sequence_of(const Message& message) {
  const std::string prefix = message.origin_node + "-";
  if (!message.id.starts_with(prefix)) {
    return std::nullopt;
  }
  return util::parse_uint64(std::string_view{message.id}.substr(prefix.size()));
}

}  // namespace

bool display_before(const Message& lhs, const Message& rhs) {
  if (lhs.logical_ts != rhs.logical_ts) {
    return lhs.logical_ts < rhs.logical_ts;
  }
  return lhs.id < rhs.id;
}

MessageStore::MessageStore(std::unique_ptr<IMessageLog> log) : log_(std::move(log)) {}

Result MessageStore::open() {
  if (log_ == nullptr) {
    return Result::failure(ErrorKind::Persistence, "Message store has no log attached.");
  }

  std::vector<Message> loaded;
  const Result load_result = log_->load(loaded);
  if (!load_result.ok) {
    return load_result;
  }

  std::unique_lock lock(mutex_);
  messages_.clear();
  max_counter_ = 0;
  rejected_on_load_ = 0;
  for (const auto& message : loaded) {
    if (!is_well_formed(message)) {
      ++rejected_on_load_;
      continue;
    }
    index_locked(message);
  }
  opened_ = true;

  return Result::success("Message store opened with " + std::to_string(messages_.size()) +
                         " messages.");
}

Result MessageStore::insert(const Message& message) {
  if (!is_well_formed(message)) {
    return Result::failure(ErrorKind::InvalidInput, "insert failed: malformed message.");
  }

  std::unique_lock lock(mutex_);
  if (messages_.contains(message.id)) {
    return Result::failure(ErrorKind::DuplicateId, "insert failed: duplicate id " + message.id);
  }

  const Result persisted = log_->append(message);
  if (!persisted.ok) {
    return persisted;
  }

  index_locked(message);
  return Result::success("Message stored.", message.id);
}

Result MessageStore::merge(const std::vector<Message>& incoming, std::size_t& out_added) {
  out_added = 0;
  std::size_t malformed = 0;

  std::unique_lock lock(mutex_);
  for (const auto& message : incoming) {
    if (!is_well_formed(message)) {
      ++malformed;
      continue;
    }
    if (messages_.contains(message.id)) {
      continue;
    }

    const Result persisted = log_->append(message);
    if (!persisted.ok) {
      return persisted;
    }
    index_locked(message);
    ++out_added;
  }

  if (malformed > 0) {
    return Result::success("Merged with " + std::to_string(malformed) + " malformed messages skipped.");
  }
  return Result::success("Merged.");
}

std::vector<Message> MessageStore::snapshot() const {
  std::shared_lock lock(mutex_);
  std::vector<Message> out;
  out.reserve(messages_.size());
  for (const auto& [id, message] : messages_) {
    (void)id;
    out.push_back(message);
  }
  return out;
}

std::vector<Message> MessageStore::ordered_view() const {
  std::vector<Message> out = snapshot();
  std::ranges::sort(out, display_before);
  return out;
}

SnapshotPage MessageStore::page_after(std::string_view after_id, std::size_t limit) const {
  SnapshotPage page;
  std::shared_lock lock(mutex_);
  auto it = after_id.empty() ? messages_.begin() : messages_.upper_bound(after_id);
  for (; it != messages_.end() && page.messages.size() < limit; ++it) {
    page.messages.push_back(it->second);
  }
  page.more = it != messages_.end();
  return page;
}

bool MessageStore::contains(std::string_view id) const {
  std::shared_lock lock(mutex_);
  return messages_.contains(id);
}

std::size_t MessageStore::size() const {
  std::shared_lock lock(mutex_);
  return messages_.size();
}

std::uint64_t MessageStore::max_counter() const {
  std::shared_lock lock(mutex_);
  return max_counter_;
}

std::uint64_t MessageStore::max_sequence_for(std::string_view origin_node) const {
  std::shared_lock lock(mutex_);
  std::uint64_t highest = 0;
  for (const auto& [id, message] : messages_) {
    (void)id;
    if (message.origin_node != origin_node) {
      continue;
    }
    if (const auto sequence = sequence_of(message)) {
      highest = std::max(highest, *sequence);
    }
  }
  return highest;
}

std::string MessageStore::digest() const {
  std::shared_lock lock(mutex_);
  return digest_locked();
}

StoreHealthReport MessageStore::health_report() const {
  std::shared_lock lock(mutex_);
  StoreHealthReport report;
  report.healthy = opened_;
  report.details = opened_ ? "Message store open." : "Message store not opened.";
  report.log_path = log_ != nullptr ? log_->location() : std::string{};
  report.message_count = messages_.size();
  report.invalid_record_count =
      rejected_on_load_ + (log_ != nullptr ? log_->invalid_record_count() : 0U);
  report.max_counter = max_counter_;
  report.digest = digest_locked();
  return report;
}

void MessageStore::index_locked(const Message& message) {
  const auto [it, inserted] = messages_.emplace(message.id, message);
  (void)it;
  if (inserted) {
    max_counter_ = std::max(max_counter_, message.logical_ts.counter);
  }
}

std::string MessageStore::digest_locked() const {
  // messages_ is ordered by id, so the digest is independent of arrival order.
  std::ostringstream out;
  for (const auto& [id, message] : messages_) {
    out << id << ':' << util::blake2b_hex(encode_message_line(message)) << '\n';
  }
  return util::blake2b_hex(out.str());
}

}  // namespace mural
