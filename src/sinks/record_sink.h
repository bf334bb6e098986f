#pragma once

#include <string>

#include "decoder/record.h"

namespace FseDump {

/**
 * A consumer of decoded records, driven by a SinkRunner on its own thread.
 * Write may throw; the runner logs the failure and moves on to the next record.
 */
class RecordSink {
public:
	virtual ~RecordSink() = default;

	virtual void Write(const Record& record) = 0;

	// Called once after the last record; flush and close here
	virtual void Finish() {}

	virtual std::string Name() const = 0;
};

} // namespace FseDump
