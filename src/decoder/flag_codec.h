#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "absl/container/flat_hash_map.h"
#include "absl/synchronization/mutex.h"

namespace FseDump {

// Separator placed between flag names in a rendered bitmask
inline constexpr std::string_view kFlagSeparator = " | ";

using FlagEntry = std::pair<std::string_view, uint32_t>;

// fseventsd flag table, in rendering order
inline constexpr std::array<FlagEntry, 21> kFlags = {{
	{"FolderEvent", 0x00000001},
	{"Mount", 0x00000002},
	{"Unmount", 0x00000004},
	{"EndOfTransaction", 0x00000020},
	{"LastHardLinkRemoved", 0x00000800},
	{"HardLink", 0x00001000},
	{"SymbolicLink", 0x00004000},
	{"FileEvent", 0x00008000},
	{"PermissionChange", 0x00010000},
	{"ExtendedAttrModified", 0x00020000},
	{"ExtendedAttrRemoved", 0x00040000},
	{"DocumentRevisioning", 0x00100000},
	{"ItemCloned", 0x00400000},
	{"Created", 0x01000000},
	{"Removed", 0x02000000},
	{"InodeMetaMod", 0x04000000},
	{"Renamed", 0x08000000},
	{"Modified", 0x10000000},
	{"Exchange", 0x20000000},
	{"FinderInfoMod", 0x40000000},
	{"FolderCreated", 0x80000000},
}};

// Alternate vocabulary (the FSEventStreamEventFlags naming used by other tools)
inline constexpr std::array<FlagEntry, 22> kAltFlags = {{
	{"Created", 0x00000001},
	{"Removed", 0x00000002},
	{"InodeMetaMod", 0x00000004},
	{"RenamedOrMoved", 0x00000008},
	{"Modified", 0x00000010},
	{"Exchange", 0x00000020},
	{"FinderInfoMod", 0x00000040},
	{"FolderCreated", 0x00000080},
	{"PermissionChange", 0x00000100},
	{"XAttrModified", 0x00000200},
	{"XAttrRemoved", 0x00000400},
	{"0x00000800", 0x00000800},
	{"DocumentRevision", 0x00001000},
	{"ItemCloned", 0x00004000},
	{"LastHardLinkRemoved", 0x00080000},
	{"HardLink", 0x00100000},
	{"SymbolicLink", 0x00400000},
	{"FileEvent", 0x00800000},
	{"FolderEvent", 0x01000000},
	{"Mount", 0x02000000},
	{"Unmount", 0x04000000},
	{"EndOfTransaction", 0x20000000},
}};

enum class FlagVocabulary {
	kPrimary,
	kAlternate,
};

/**
 * Canonical renderings of one bitmask. Owned by the FlagCodec that produced
 * them; addresses stay valid for the codec's lifetime.
 */
struct FlagTexts {
	std::string text;
	std::string alt_text;
};

/**
 * FlagCodec maps 32-bit fsevents flag masks to their names.
 *
 * Render() memoizes each distinct mask the first time it is seen. Lookups of
 * known masks take the shared side of the lock; only the first sight of a
 * mask takes it exclusively. The returned reference is stable, so callers may
 * compare renderings by address.
 *
 * @threading Safe for concurrent use by any number of decoder threads.
 */
class FlagCodec {
public:
	FlagCodec();
	~FlagCodec() = default;

	FlagCodec(const FlagCodec&) = delete;
	FlagCodec& operator=(const FlagCodec&) = delete;

	// Process-wide codec, created on first use and kept until exit.
	static FlagCodec& Instance();

	const FlagTexts& Render(uint32_t bits);

	// Number of distinct masks currently memoized
	size_t CachedCount() const;

	// Uncached rendering; deterministic and pure.
	static std::string RenderUncached(uint32_t bits, FlagVocabulary vocabulary = FlagVocabulary::kPrimary);

	// Case-insensitive primary-vocabulary name lookup.
	static std::optional<uint32_t> FlagId(std::string_view name);

private:
	const FlagTexts& InsertLocked(uint32_t bits) ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);

	mutable absl::Mutex mutex_;
	absl::flat_hash_map<uint32_t, std::unique_ptr<const FlagTexts>> cache_ ABSL_GUARDED_BY(mutex_);
};

} // namespace FseDump
