#include "core/storage/message_log.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

#include "core/model/message_codec.hpp"

namespace mural {
namespace {

constexpr std::string_view kLogHeader = "# muralnet message log v1";

}  // namespace

FileMessageLog::FileMessageLog(std::string path) : path_(std::move(path)) {}

Result FileMessageLog::load(std::vector<Message>& out) {
  out.clear();
  invalid_records_ = 0;

  const std::filesystem::path file_path{path_};
  std::error_code ec;
  if (file_path.has_parent_path()) {
    std::filesystem::create_directories(file_path.parent_path(), ec);
    if (ec) {
      return Result::failure(ErrorKind::Persistence,
                             "Unable to create message log directory: " + ec.message());
    }
  }

  std::ifstream in(file_path);
  if (!in) {
    std::ofstream create(file_path, std::ios::out | std::ios::trunc);
    if (!create) {
      return Result::failure(ErrorKind::Persistence, "Unable to create message log: " + path_);
    }
    create << kLogHeader << '\n';
    if (!create.good()) {
      return Result::failure(ErrorKind::Persistence, "Failed writing message log header: " + path_);
    }
    return Result::success("Message log created.");
  }

  std::ostringstream contents;
  contents << in.rdbuf();
  decode_message_block(contents.str(), out, invalid_records_);
  return Result::success("Message log loaded.");
}

Result FileMessageLog::append(const Message& message) {
  std::ofstream out(path_, std::ios::out | std::ios::app);
  if (!out) {
    return Result::failure(ErrorKind::Persistence, "Failed to open message log: " + path_);
  }

  out << encode_message_line(message) << '\n';
  out.flush();
  if (!out.good()) {
    return Result::failure(ErrorKind::Persistence, "Failed to flush message log: " + path_);
  }

  return Result::success();
}

Result MemoryMessageLog::load(std::vector<Message>& out) {
  std::lock_guard lock(mutex_);
  out = records_;
  return Result::success("Memory log loaded.");
}

Result MemoryMessageLog::append(const Message& message) {
  std::lock_guard lock(mutex_);
  if (fail_appends_) {
    return Result::failure(ErrorKind::Persistence, "Memory log rejected append.");
  }
  records_.push_back(message);
  return Result::success();
}

void MemoryMessageLog::set_fail_appends(bool fail) {
  std::lock_guard lock(mutex_);
  fail_appends_ = fail;
}

std::vector<Message> MemoryMessageLog::records() const {
  std::lock_guard lock(mutex_);
  return records_;
}

std::string message_log_path(std::string_view data_dir, std::string_view node_id) {
  return (std::filesystem::path{std::string{data_dir}} /
          ("messages-" + std::string{node_id} + ".log"))
      .string();
}

}  // namespace mural
