#include "OptionsCal.hpp"
#include "heatcal/errors.hpp"
#include "heatcal/git_log.hpp"
#include "heatcal/heatmap_assembler.hpp"
#include "heatcal/renderer.hpp"
#include "heatcal/streaks.hpp"
#include <boost/date_time/posix_time/posix_time.hpp>
#include <iomanip>
#include <iostream>
#include <sys/ioctl.h>

// minutes east of UTC of this machine right now.
int local_offset_minutes() {
	auto local = boost::posix_time::second_clock::local_time();
	auto utc   = boost::posix_time::second_clock::universal_time();
	long diff  = (local - utc).total_seconds();
	// both clocks are read separately, round away the second between them.
	return int((diff + (diff >= 0 ? 30 : -30)) / 60);
}

void printStreaks(const heatcal::StreakInfo& stt) {
	if(stt.longest) {
		std::cout << " Longest streak " << heatcal::streak_days(*stt.longest)
		<< " days (" << stt.longest->begin() << " " << stt.longest->last() << ").";
		if(stt.current) {
			std::cout << " Current streak: " << heatcal::streak_days(*stt.current) << " days";
		}
	}
	std::cout << "\n";
}

int main(int argc, char** argv)
try {
	struct winsize ww{}; ioctl(0, TIOCGWINSZ, &ww);
	OptionsCal opt(ww.ws_col > 0 ? ww.ws_col : 80, 15);
	opt.parse(argc, argv);
	if(opt.help) {
		std::cout << opt.options << "\n";
		return 0;
	}
	opt.check();
	if(opt.verbose) opt.print();

	int local_offset = local_offset_minutes();
	int offset       = opt.timezone_offset(local_offset);
	heatcal::CivilDate today = (boost::posix_time::second_clock::universal_time() + boost::posix_time::minutes(offset)).date();
	heatcal::HeatmapConfig cfg = opt.heatmap_config(local_offset, today);

	std::string call = heatcal::git_log_command(opt.git_dir, opt.work_tree, opt.author);
	if(opt.verbose) std::cerr << "running: " << call << "\n";
	std::vector<heatcal::CommitRecord> records = heatcal::parse_commit_log(heatcal::exec(call));
	if(opt.verbose) std::cerr << records.size() << " commits read\n";

	heatcal::HeatmapResult result = heatcal::assemble_heatmap(heatcal::events_of(records), cfg);
	if(opt.verbose) {
		std::cerr << "grid " << result.grid.weeks().size() << " weeks, " << result.grid.range_start() << " .. " << result.grid.range_end()
		          << ", " << result.summary.commits_outside_range << " commits outside\n";
	}

	std::unique_ptr<heatcal::Renderer> renderer = heatcal::make_renderer(opt.render_options());
	std::cout << renderer->render(result);

	std::cout << std::setw(4) << result.summary.total_commits << " total commits on "
	          << result.summary.active_day_count << " days since " << result.grid.range_start()
	          << ", at most " << result.summary.max_daily_count << " a day.";
	if(opt.print_streaks) {
		printStreaks(heatcal::compute_streaks(result.day_counts, today));
	} else {
		std::cout << "\n";
	}
	return 0;

} catch(const po::error& err) {
	std::cerr << "Bad invocation: " << err.what() << "\n";
	return 2;
} catch(const UsageError& err) {
	std::cerr << "Bad invocation: " << err.what() << "\n";
	return 2;
} catch(const heatcal::HeatmapError& err) {
	std::cerr << "error [" << heatcal::to_string(err.kind) << "] " << err.what() << "\n";
	return 1;
} catch(const heatcal::ParseError& err) {
	std::cerr << "error: cannot read git log, " << err.what() << "\n";
	return 1;
} catch(const heatcal::ExecError& err) {
	std::cerr << "error: " << err.what() << " (exit code " << err.code << ")\n";
	return err.code > 0 ? err.code : 1;
} catch(const std::exception& err) {
	std::cerr << "error: " << err.what() << "\n";
	return 1;
}
