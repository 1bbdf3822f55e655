#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "core/model/types.hpp"

namespace mural {

// Durable append-only record of one node's message set.
class IMessageLog {
public:
  virtual ~IMessageLog() = default;

  virtual Result load(std::vector<Message>& out) = 0;
  virtual Result append(const Message& message) = 0;

  [[nodiscard]] virtual std::string location() const = 0;
  [[nodiscard]] virtual std::size_t invalid_record_count() const = 0;
};

class FileMessageLog final : public IMessageLog {
public:
  explicit FileMessageLog(std::string path);

  Result load(std::vector<Message>& out) override;
  Result append(const Message& message) override;

  [[nodiscard]] std::string location() const override { return path_; }
  [[nodiscard]] std::size_t invalid_record_count() const override { return invalid_records_; }

private:
  std::string path_;
  std::size_t invalid_records_ = 0;
};

class MemoryMessageLog final : public IMessageLog {
public:
  Result load(std::vector<Message>& out) override;
  Result append(const Message& message) override;

  [[nodiscard]] std::string location() const override { return "memory"; }
  [[nodiscard]] std::size_t invalid_record_count() const override { return 0; }

  void set_fail_appends(bool fail);
  [[nodiscard]] std::vector<Message> records() const;

private:
  mutable std::mutex mutex_;
  std::vector<Message> records_;
  bool fail_appends_ = false;
};

std::string message_log_path(std::string_view data_dir, std::string_view node_id);

}  // namespace mural
