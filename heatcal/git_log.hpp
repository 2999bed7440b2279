#ifndef HEATCAL_GIT_LOG_HPP
#define HEATCAL_GIT_LOG_HPP

#include "commit.hpp"
#include <string>
#include <vector>

namespace heatcal {

struct CommitRecord {
	CommitEvent event;
	std::string author;
};

// runs cmd through the shell and returns what it printed. Throws ExecError when it cannot be started or exits non-zero.
std::string exec(const std::string& cmd);

// git log invocation printing "<epoch> <±HHMM> <author>" per commit. Empty arguments are left out.
std::string git_log_command(const std::string& git_dir, const std::string& work_tree, const std::string& author);

// "+0200" → 120, "-0530" → -330. Throws ParseError(line).
int parse_offset(const std::string& s, size_t line = 0);

/* One line of the log, either
 *   1704103200 +0200 Jane Doe
 *   2024-01-01T12:00:00+02:00 Jane Doe      (Z for UTC, the author may be missing)
 * Throws ParseError(line).
 */
CommitRecord parse_commit_line(const std::string& text, size_t line = 0);

// every non-empty line of the log.
std::vector<CommitRecord> parse_commit_log(const std::string& log);

std::vector<CommitEvent> events_of(const std::vector<CommitRecord>& records);

}

#endif
