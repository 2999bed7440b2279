#ifndef HEATCAL_ERRORS_HPP
#define HEATCAL_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace heatcal {

enum class ErrorKind {
	InvalidTimestamp,
	InvalidRange,
	RangeTooLarge,
	InvalidConfiguration
};

enum class Stage {
	config,
	normalize,
	aggregate,
	bucketize,
	grid,
	assemble,
	ingest,
	render
};

const char* to_string(ErrorKind kind);
const char* to_string(Stage stage);

// every failure of the heatmap pipeline, tagged with the stage which detected it.
struct HeatmapError : std::runtime_error {
	HeatmapError(ErrorKind k, Stage s, const std::string& m);
	ErrorKind   kind;
	Stage       stage;
	std::string msg;
};

// running the external command failed. code is the exit status of the child (or -1 when it could not be spawned).
struct ExecError : std::runtime_error {
	ExecError(int x, const std::string& cmd) : std::runtime_error("exec failed: "+cmd) , code{x} { }
	int code;
};

// a line of the commit log could not be understood.
struct ParseError : std::runtime_error {
	ParseError(size_t l, const std::string& m) : std::runtime_error("line "+std::to_string(l)+": "+m) , line{l} { }
	size_t line;
};

}

#endif
