#pragma once

#include <cstdint>
#include <string_view>

#ifndef MURAL_APP_VERSION
#define MURAL_APP_VERSION "0.3.0"
#endif

#ifndef MURAL_BUILD_RELEASE
#define MURAL_BUILD_RELEASE "Eventual Board"
#endif

namespace mural {

inline constexpr std::string_view kAppDisplayName = "muralnet::replicated message board";
inline constexpr std::string_view kAppVersion = MURAL_APP_VERSION;
inline constexpr std::string_view kBuildRelease = MURAL_BUILD_RELEASE;
inline constexpr std::string_view kWireProtocol = "mural-wire-1";
inline constexpr std::uint16_t kDefaultListenPort = 5001;

}  // namespace mural
