#include "record.h"

namespace FseDump {

namespace {
const std::string kNoFlags;
} // namespace

const std::string& Record::FlagText() const {
	return flags ? flags->text : kNoFlags;
}

const std::string& Record::AltFlagText() const {
	return flags ? flags->alt_text : kNoFlags;
}

} // namespace FseDump
