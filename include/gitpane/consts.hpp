#pragma once
#include <cstddef>
#include <string_view>

namespace gitpane::consts {

// Directory and file names
inline constexpr std::string_view kStateDir     = ".gitpane";
inline constexpr std::string_view kObjectsDir   = "objects";
inline constexpr std::string_view kBaselineFile = "baseline";
inline constexpr std::string_view kConfigFile   = "config";

// Stored object type strings
inline constexpr std::string_view kTypeBlob = "blob";

// ——— Object ID sizes ———
inline constexpr std::size_t kOidRawLen = 20;  // 20 bytes (SHA-1)
inline constexpr std::size_t kOidHexLen = 40;  // 40 hex chars (SHA-1)

// ——— Object store fanout ———
inline constexpr std::size_t kFanoutDirHexLen = 2; // "aa/" + "bbbb..." in .gitpane/objects

// ——— Unified diff markers ———
inline constexpr std::string_view kOldFilePrefix  = "---";
inline constexpr std::string_view kNewFilePrefix  = "+++";
inline constexpr std::string_view kHunkPrefix     = "@@";
inline constexpr std::string_view kGitDiffPrefix  = "diff ";
inline constexpr char kAddMarker      = '+';
inline constexpr char kRemoveMarker   = '-';
inline constexpr char kContextMarker  = ' ';
inline constexpr char kNoNewlineMarker = '\\';

// ——— Defaults (overridable through .gitpane/config) ———
inline constexpr int kDefaultMaxVisibleRows     = 30;
inline constexpr int kDefaultContextLines       = 3;
inline constexpr std::size_t kDefaultTokenCacheCapacity = 1000;

// ——— Common characters ———
inline constexpr char kSpace = ' ';
inline constexpr char kNul   = '\0';
inline constexpr char kLF    = '\n';

} // namespace gitpane::consts
