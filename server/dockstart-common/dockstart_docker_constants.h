#pragma once

#include <chrono>

namespace dockstart
{
inline constexpr char kUnixSocketBaseUrl[] = "http://d";
inline constexpr char kTlsCaFile[] = "ca.pem";
inline constexpr char kTlsCertFile[] = "cert.pem";
inline constexpr char kTlsKeyFile[] = "key.pem";
inline constexpr std::chrono::seconds kConnectTimeout{10};
inline constexpr int kStopGraceSeconds = 10;
inline constexpr long kHttpNotModified = 304;
inline constexpr long kHttpNotFound = 404;
inline constexpr long kHttpConflict = 409;
} // namespace dockstart
