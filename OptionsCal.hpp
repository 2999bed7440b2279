#ifndef HEATCAL_OPTIONS_CAL_HPP
#define HEATCAL_OPTIONS_CAL_HPP

#include "heatcal/config.hpp"
#include "heatcal/errors.hpp"
#include "heatcal/git_log.hpp"
#include "heatcal/renderer.hpp"
#include <boost/program_options.hpp>
#include <boost/lexical_cast.hpp>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace po = boost::program_options;

// bad combination or value of options, reported as a bad invocation.
struct UsageError : std::runtime_error {
	UsageError(const std::string& m) : std::runtime_error(m) { }
};

struct OptionsCal
{
	boost::program_options::options_description options;
	po::variables_map vm_local;

	std::string	config_file;
	std::string	git_dir;
	std::string	work_tree;
	std::string	author;
	bool		start_with_sunday;
	bool		number_days;
	bool		number_commits;
	bool		print_streaks;
	bool		verbose;
	bool		help;
	int		weeks;
	std::string	since;
	std::string	until;
	std::string	timezone;
	int		levels;
	std::string	thresholds;
	std::string	style;
	size_t		max_cells;

	OptionsCal(unsigned columns, unsigned max_description_length)
		: options(columns		// width of the terminal
		, max_description_length)	// if option description eg. `--timezone arg (=local)` is longer than this, then explanation starts at next line
	{
		options.add_options()
		("help,h"                 , po::bool_switch       (&help                   )->default_value(false),"display this help.")
		("config"                 , po::value<std::string>(&config_file            )->default_value(""   ),"read more options from this file (key = value lines, same names as the long options), the command line wins")
		("git-dir"                , po::value<std::string>(&git_dir                )->default_value(""   ),"The --git-dir for git")
		("work-tree"              , po::value<std::string>(&work_tree              )->default_value(""   ),"The --work-tree for git")
		("author,a"               , po::value<std::string>(&author                 )->default_value(""   ),"analyse commits of only one selected author, otherwise all authors are included")
		("start-with-sunday,s"    , po::bool_switch       (&start_with_sunday      )->default_value(false),"start week with sunday instead of monday")
		("weeks,w"                , po::value<int>        (&weeks                  )->default_value(52   ),"number of weeks shown, ending with --until")
		("since"                  , po::value<std::string>(&since                  )->default_value(""   ),"first day shown, YYYY-MM-DD (overrides --weeks)")
		("until"                  , po::value<std::string>(&until                  )->default_value(""   ),"last day shown, YYYY-MM-DD, default today")
		("timezone,z"             , po::value<std::string>(&timezone               )->default_value("local"),"days are counted in: local, utc, origin (each commit's own zone) or an offset like +0200 (write --timezone=-0500 for negative ones)")
		("levels,l"               , po::value<int>        (&levels                 )->default_value(5    ),"number of intensity levels, including the empty one")
		("thresholds,t"           , po::value<std::string>(&thresholds             )->default_value(""   ),"comma separated lower bounds of levels 2.., empty means quantiles of the active days")
		("style"                  , po::value<std::string>(&style                  )->default_value("terminal"),"terminal (coloured blocks) or text (plain glyphs)")
		("number-days,n"          , po::bool_switch       (&number_days            )->default_value(false),"instead of ◼ put the day of the month (as in real calendar)")
		("number-commits,c"       , po::bool_switch       (&number_commits         )->default_value(false),"instead of ◼ put the commit count number")
		("print-streaks,S"        , po::bool_switch       (&print_streaks          )->default_value(false),"print the longest and current streak")
		("max-cells"              , po::value<size_t>     (&max_cells              )->default_value(7*52*100),"refuse to draw grids with more cells than this")
		("verbose,v"              , po::bool_switch       (&verbose                )->default_value(false),"print settings and progress to stderr")
		;
	};

	// throws po::error for unknown options or bad values, UsageError for a missing config file.
	void parse(int argc, const char* const* argv) {
		po::variables_map vm;
		po::store(po::parse_command_line(argc, argv, options), vm);
		// notify before reading the file, so that config_file is known. store() keeps the first value it sees.
		po::notify(vm);
		if(not config_file.empty()) {
			try {
				po::store(po::parse_config_file<char>(config_file.c_str(), options), vm);
			} catch(const po::reading_file&) {
				throw UsageError("cannot read config file "+config_file);
			}
			po::notify(vm);
		}
		vm_local=vm;
	}

	void check() const {
		if(number_commits and number_days) {
			throw UsageError("`--number-days,-n`  and  `--number-commits,-c`  are mutually exclusive.");
		}
		if(weeks < 1) {
			throw UsageError("`--weeks` must be at least 1.");
		}
		// a week is seven cells, more weeks than that would be refused by the grid anyway.
		if(size_t(weeks) > max_cells/7) {
			throw UsageError("`--weeks` "+boost::lexical_cast<std::string>(weeks)+" needs more than `--max-cells` "
				+boost::lexical_cast<std::string>(max_cells)+" cells.");
		}
		if(style != "terminal" and style != "text") {
			throw UsageError("`--style` must be terminal or text, got "+style);
		}
	}

	std::vector<unsigned> threshold_list() const {
		std::vector<unsigned> list{};
		std::string item;
		std::istringstream ss(thresholds);
		while(std::getline(ss, item, ',')) {
			try {
				list.push_back(boost::lexical_cast<unsigned>(item));
			} catch(const boost::bad_lexical_cast&) {
				throw UsageError("`--thresholds`: \""+item+"\" is not a number");
			}
		}
		return list;
	}

	// offset the days are counted in. "origin" counts in local time for today, each commit keeps its own zone.
	int timezone_offset(int local_offset_minutes) const {
		if(timezone == "local" or timezone == "origin") return local_offset_minutes;
		if(timezone == "utc"   or timezone == "UTC")    return 0;
		try {
			return heatcal::parse_offset(timezone);
		} catch(const heatcal::ParseError&) {
			throw UsageError("`--timezone` must be local, utc, origin or like +0200, got "+timezone);
		}
	}

	heatcal::CivilDate parse_day(const std::string& s, const char* name) const {
		heatcal::CivilDate d{boost::date_time::not_a_date_time};
		try {
			d = boost::gregorian::from_simple_string(s);
		} catch(const std::exception& err) {
			// bad_year, bad_month, bad_lexical_cast … all mean the same to the user.
			throw UsageError(std::string("`--")+name+"` is not a date like 2024-01-31: "+s+" ("+err.what()+")");
		}
		if(d.is_special()) throw UsageError(std::string("`--")+name+"` is not a date like 2024-01-31: "+s);
		return d;
	}

	// first day of the --weeks window ending at last.
	heatcal::CivilDate weeks_before(const heatcal::CivilDate& last) const {
		long back = long(weeks)*7 - 1;
		const heatcal::CivilDate calendar_begin(boost::date_time::min_date_time);
		if(back > (last - calendar_begin).days()) {
			throw UsageError("`--weeks` "+boost::lexical_cast<std::string>(weeks)+" reaches before "
				+boost::gregorian::to_iso_extended_string(calendar_begin));
		}
		return last - boost::gregorian::days(back);
	}

	// today is the current day in the chosen timezone.
	heatcal::HeatmapConfig heatmap_config(int local_offset_minutes, const heatcal::CivilDate& today) const {
		heatcal::HeatmapConfig cfg = heatcal::default_config();
		cfg.normalizer.timezone_offset_minutes = timezone_offset(local_offset_minutes);
		cfg.normalizer.use_origin_offset       = timezone == "origin";
		cfg.week_start                         = start_with_sunday ? boost::date_time::Sunday : boost::date_time::Monday;
		cfg.levels.level_count                 = levels;
		cfg.levels.thresholds                  = threshold_list();
		cfg.levels.mode                        = thresholds.empty() ? heatcal::ThresholdMode::quantile : heatcal::ThresholdMode::fixed;
		cfg.range_end                          = until.empty() ? today : parse_day(until, "until");
		cfg.range_start                        = since.empty() ? weeks_before(cfg.range_end) : parse_day(since, "since");
		cfg.max_cell_count                     = max_cells;
		return cfg;
	}

	heatcal::RenderOptions render_options() const {
		heatcal::RenderOptions ro;
		ro.style       = style == "text" ? heatcal::RenderStyle::text : heatcal::RenderStyle::terminal;
		ro.label       = number_days    ? heatcal::CellLabel::day_of_month
			       : number_commits ? heatcal::CellLabel::commit_count
			                        : heatcal::CellLabel::none;
		ro.level_count = levels;
		return ro;
	}

	void print(std::ostream& os=std::cerr,std::string prefix="") const
	{
		os << prefix << "Settings: \n";
		for (const auto& it : vm_local) {
			os << prefix << "  " << it.first.c_str() << "   \t= ";
			auto& value = it.second.value();
			if	(auto v2 = boost::any_cast<int>(&value))		os << *v2;
			else if (auto v3 = boost::any_cast<size_t>(&value))		os << *v3;
			else if (auto v4 = boost::any_cast<bool>(&value))		os << ((*v4)?std::string("true"):std::string("false"));
			else if (auto v5 = boost::any_cast<std::string>(&value))	os << *v5;
			else	os << prefix << "error";
			os << "\n";
		}
		os << prefix << "\n";
	};
};

#endif
