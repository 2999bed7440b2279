#include "errors.hpp"

namespace heatcal {

const char* to_string(ErrorKind kind) {
	switch(kind) {
		case ErrorKind::InvalidTimestamp     : return "InvalidTimestamp";
		case ErrorKind::InvalidRange         : return "InvalidRange";
		case ErrorKind::RangeTooLarge        : return "RangeTooLarge";
		case ErrorKind::InvalidConfiguration : return "InvalidConfiguration";
	}
	return "unknown";
}

const char* to_string(Stage stage) {
	switch(stage) {
		case Stage::config    : return "config";
		case Stage::normalize : return "normalize";
		case Stage::aggregate : return "aggregate";
		case Stage::bucketize : return "bucketize";
		case Stage::grid      : return "grid";
		case Stage::assemble  : return "assemble";
		case Stage::ingest    : return "ingest";
		case Stage::render    : return "render";
	}
	return "unknown";
}

HeatmapError::HeatmapError(ErrorKind k, Stage s, const std::string& m)
	: std::runtime_error(std::string(to_string(s))+": "+m)
	, kind{k}
	, stage{s}
	, msg{m}
{ }

}
