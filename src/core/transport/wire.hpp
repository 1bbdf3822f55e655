#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "core/model/types.hpp"

namespace mural::wire {

using Fields = std::unordered_map<std::string, std::string>;

inline constexpr std::size_t kHeaderBytes = 4;
inline constexpr std::uint32_t kMaxFrameBytes = 8U << 20U;  // 8 MiB

std::array<unsigned char, kHeaderBytes> encode_header(std::uint32_t length);
std::uint32_t decode_header(const std::array<unsigned char, kHeaderBytes>& header);

// Header followed by payload. Returns nullopt when the payload is too large.
std::optional<std::string> encode_frame(std::string_view payload);

std::string make_request(std::string_view op,
                         std::vector<std::pair<std::string, std::string>> fields = {});
std::string make_response(const Result& result,
                          std::vector<std::pair<std::string, std::string>> fields = {});

// Splits a response payload into its Result and the remaining fields.
Result parse_response(std::string_view payload, Fields& out_fields);

// Encoded page lines stop at this budget so a page response fits one frame.
inline constexpr std::size_t kPageBudgetBytes = kMaxFrameBytes / 2U;

// `messages`, `more` and `next` fields for a page. Lines past the byte budget
// are left for the next page; the first line is always sent.
std::vector<std::pair<std::string, std::string>> page_fields(const SnapshotPage& page);
Result read_page(const Fields& fields, SnapshotPage& out);

// `after` and `limit` of a paged request. A missing limit means the default
// page size; larger limits are capped.
Result read_page_request(const Fields& fields, std::string& out_after, std::size_t& out_limit);

// `host:port`, with the port range checked.
bool split_host_port(std::string_view address, std::string& out_host, std::uint16_t& out_port);

}  // namespace mural::wire
