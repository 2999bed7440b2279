#include "git_log.hpp"
#include "errors.hpp"
#include <boost/lexical_cast.hpp>
#include <array>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <sys/wait.h>

namespace heatcal {

namespace {
	const boost::posix_time::ptime epoch(boost::gregorian::date(1970,1,1));
	// 1400-01-02 … 9999-12-30, what boost::gregorian can hold with a day to spare for offsets
	const long long min_epoch_seconds = -17987356800LL;
	const long long max_epoch_seconds = 253402214399LL;

	std::string quote(const std::string& s) {
		std::string q = "'";
		for(char ch : s) {
			if(ch == '\'') q += "'\\''";
			else           q += ch;
		}
		return q + "'";
	}

	bool all_digits(const std::string& s, size_t from, size_t to) {
		if(from >= to) return false;
		for(size_t i=from ; i<to ; ++i) { if(not std::isdigit(static_cast<unsigned char>(s[i]))) return false; }
		return true;
	}
}

// source: https://stackoverflow.com/questions/52164723/how-to-execute-a-command-and-get-return-code-stdout-and-stderr-of-command-in-c
std::string exec(const std::string& cmd) {
	std::array<char, 128> buffer;
	std::string result;
	FILE* pipe = popen(cmd.c_str(), "r");
	if (!pipe) throw ExecError(-1, cmd);
	while (!feof(pipe)) {
		if (fgets(buffer.data(), 128, pipe) != nullptr)
			result += buffer.data();
	}
	int rc = pclose(pipe);
	if (rc == -1) throw ExecError(-1, cmd);
	if (WIFEXITED(rc) and WEXITSTATUS(rc) == EXIT_SUCCESS) {
		return result;
	}
	throw ExecError(WIFEXITED(rc) ? WEXITSTATUS(rc) : rc, cmd);
}

std::string git_log_command(const std::string& git_dir, const std::string& work_tree, const std::string& author) {
	std::string gdir  = ""; if(git_dir   != "") gdir  = " --git-dir "  +quote(git_dir);
	std::string wtree = ""; if(work_tree != "") wtree = " --work-tree "+quote(work_tree);
	std::string aut   = ""; if(author    != "") aut   = " --author="   +quote(author);
	return "git"+gdir+wtree+" log --no-merges --pretty=format:'%at %ad %aN' --date=format:%z"+aut;
}

int parse_offset(const std::string& s, size_t line) {
	// ±HHMM, ±HH:MM or Z
	if(s == "Z" or s == "z") return 0;
	std::string digits = s.size() == 6 and s[3] == ':' ? s.substr(0,3)+s.substr(4) : s;
	if(digits.size() != 5 or (digits[0] != '+' and digits[0] != '-') or not all_digits(digits,1,5)) {
		throw ParseError(line, "bad timezone offset \""+s+"\"");
	}
	int hh = boost::lexical_cast<int>(digits.substr(1,2));
	int mm = boost::lexical_cast<int>(digits.substr(3,2));
	if(mm >= 60) throw ParseError(line, "bad timezone offset \""+s+"\"");
	int minutes = hh*60 + mm;
	return digits[0] == '-' ? -minutes : minutes;
}

CommitRecord parse_commit_line(const std::string& text, size_t line) {
	std::istringstream ss(text);
	std::string stamp;
	if(not (ss >> stamp)) throw ParseError(line, "empty line");

	CommitRecord rec;
	if(all_digits(stamp, stamp[0] == '-' ? 1 : 0, stamp.size())) {
		std::string off;
		if(not (ss >> off)) throw ParseError(line, "missing timezone offset after "+stamp);
		long long seconds{0};
		try {
			seconds = boost::lexical_cast<long long>(stamp);
		} catch(const boost::bad_lexical_cast&) {
			throw ParseError(line, "timestamp out of range \""+stamp+"\"");
		}
		if(seconds < min_epoch_seconds or seconds > max_epoch_seconds) {
			throw ParseError(line, "timestamp out of range \""+stamp+"\"");
		}
		rec.event.instant            = epoch + boost::posix_time::seconds(seconds);
		rec.event.utc_offset_minutes = parse_offset(off, line);
	} else {
		// ISO-8601: date 'T' time, followed by Z or ±HH:MM
		size_t t = stamp.find('T');
		size_t z = stamp.find_first_of("Zz+-", t == std::string::npos ? stamp.size() : t);
		if(t == std::string::npos or z == std::string::npos) {
			throw ParseError(line, "not a timestamp \""+stamp+"\"");
		}
		try {
			boost::posix_time::ptime wall = boost::posix_time::from_iso_extended_string(stamp.substr(0,z));
			if(wall.is_special()) throw ParseError(line, "not a timestamp \""+stamp+"\"");
			rec.event.utc_offset_minutes = parse_offset(stamp.substr(z), line);
			rec.event.instant            = wall - boost::posix_time::minutes(rec.event.utc_offset_minutes);
		} catch(const ParseError&) {
			throw;
		} catch(const std::exception& err) {
			// boost reports bad fields with bad_lexical_cast or one of the std::out_of_range family.
			throw ParseError(line, "not a timestamp \""+stamp+"\": "+err.what());
		}
	}

	std::getline(ss >> std::ws, rec.author);
	return rec;
}

std::vector<CommitRecord> parse_commit_log(const std::string& log) {
	std::vector<CommitRecord> records;
	std::istringstream ss(log);
	std::string tmp;
	size_t line{0};
	while(std::getline(ss,tmp,'\n')) {
		++line;
		if(tmp.find_first_not_of(" \t\r") == std::string::npos) continue;
		if(tmp.back() == '\r') tmp.pop_back();
		records.push_back(parse_commit_line(tmp, line));
	}
	return records;
}

std::vector<CommitEvent> events_of(const std::vector<CommitRecord>& records) {
	std::vector<CommitEvent> events;
	events.reserve(records.size());
	for(const auto& r : records) events.push_back(r.event);
	return events;
}

}
