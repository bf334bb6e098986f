#include "flag_codec.h"

#include <glog/logging.h>

#include "absl/strings/match.h"

namespace FseDump {

namespace {

// Longest primary rendering is a little under 400 bytes
constexpr size_t kFlagStringCapacity = 512;

template <size_t N>
std::string RenderTable(uint32_t bits, const std::array<FlagEntry, N>& table) {
	std::string out;
	if (bits == 0) {
		return out;
	}
	out.reserve(kFlagStringCapacity);
	for (const auto& [name, flag] : table) {
		if ((bits & flag) == flag) {
			if (!out.empty()) {
				out.append(kFlagSeparator);
			}
			out.append(name);
		}
	}
	out.shrink_to_fit();
	return out;
}

} // namespace

FlagCodec::FlagCodec() {
	// Seed the empty mask and every single flag so the common masks never
	// need the exclusive path.
	absl::MutexLock lock(&mutex_);
	cache_.reserve(128);
	InsertLocked(0);
	for (const auto& [name, flag] : kFlags) {
		InsertLocked(flag);
	}
	for (const auto& [name, flag] : kAltFlags) {
		InsertLocked(flag);
	}
}

FlagCodec& FlagCodec::Instance() {
	static FlagCodec instance;
	return instance;
}

const FlagTexts& FlagCodec::Render(uint32_t bits) {
	{
		absl::ReaderMutexLock lock(&mutex_);
		auto it = cache_.find(bits);
		if (it != cache_.end()) {
			return *it->second;
		}
	}

	absl::MutexLock lock(&mutex_);
	return InsertLocked(bits);
}

const FlagTexts& FlagCodec::InsertLocked(uint32_t bits) {
	// Another thread may have inserted between dropping the shared lock and
	// taking the exclusive one.
	auto [it, inserted] = cache_.try_emplace(bits, nullptr);
	if (inserted) {
		VLOG(3) << "New flag mask 0x" << std::hex << bits;
		auto texts = std::make_unique<FlagTexts>();
		texts->text = RenderTable(bits, kFlags);
		texts->alt_text = RenderTable(bits, kAltFlags);
		it->second = std::move(texts);
	}
	return *it->second;
}

size_t FlagCodec::CachedCount() const {
	absl::ReaderMutexLock lock(&mutex_);
	return cache_.size();
}

std::string FlagCodec::RenderUncached(uint32_t bits, FlagVocabulary vocabulary) {
	switch (vocabulary) {
		case FlagVocabulary::kPrimary:
			return RenderTable(bits, kFlags);
		case FlagVocabulary::kAlternate:
			return RenderTable(bits, kAltFlags);
	}
	return {};
}

std::optional<uint32_t> FlagCodec::FlagId(std::string_view name) {
	for (const auto& [flag_name, flag] : kFlags) {
		if (absl::EqualsIgnoreCase(flag_name, name)) {
			return flag;
		}
	}
	return std::nullopt;
}

} // namespace FseDump
