#include "record_writer.h"

#include <glog/logging.h>

namespace FseDump {

RecordWriter::RecordWriter(const std::string& path, OutputFormat format, FormatOptions options)
	: out_(path),
	  formatter_(format, options) {
	out_.Write(formatter_.Header());
}

void RecordWriter::Write(const Record& record) {
	// Format fully before touching the file so a failed record leaves no partial row
	std::string chunk = formatter_.Format(record);
	out_.Write(chunk);
	++records_written_;
}

void RecordWriter::Finish() {
	out_.Write(formatter_.Footer(records_written_));
	out_.Close();
	LOG(INFO) << "Wrote " << records_written_ << " records to " << out_.path();
}

std::string RecordWriter::Name() const {
	return std::string(OutputFormatName(formatter_.format())) + " writer " + out_.path();
}

} // namespace FseDump
