#include "renderer.hpp"
#include "errors.hpp"
#include <boost/lexical_cast.hpp>
#include <algorithm>
#include <functional>
#include <sstream>

namespace heatcal {

namespace {
	const size_t label_width  = 4;
	const size_t column_width = 2;

	std::string two_wide(unsigned v) {
		std::string s = boost::lexical_cast<std::string>(std::min(v, 99u));
		if(s.size() < 2) s = " "+s;
		return s;
	}

	std::string cell_label(const GridCell& cell, CellLabel label) {
		switch(label) {
			case CellLabel::day_of_month : return two_wide(cell.date->day());
			case CellLabel::commit_count : return two_wide(cell.count);
			case CellLabel::none         : break;
		}
		return "";
	}

	// month header, one row per weekday, legend.
	std::string layout(const CalendarGrid& grid, const std::function<std::string(const GridCell&)>& cell, const std::string& legend) {
		std::ostringstream os;
		os << month_header(grid, label_width, column_width) << "\n";
		std::vector<std::string> labels = weekday_labels(grid.week_start());
		for(int d=0 ; d<7 ; ++d) {
			std::string lbl = labels[d];
			lbl.resize(label_width, ' ');
			os << lbl;
			for(const auto& week : grid.weeks()) {
				const GridCell& c = week[d];
				if(c.in_range and c.date) {
					os << cell(c);
				} else {
					os << std::string(column_width, ' ');
				}
			}
			os << "\n";
		}
		os << std::string(label_width, ' ') << "Less " << legend << " More\n";
		return os.str();
	}
}

std::vector<std::string> weekday_labels(Weekday week_start) {
	std::vector<std::string> labels;
	for(int d=0 ; d<7 ; ++d) {
		boost::gregorian::greg_weekday wd((int(week_start)+d)%7);
		int n = wd.as_number();
		if(n == boost::date_time::Monday or n == boost::date_time::Wednesday or n == boost::date_time::Friday) {
			labels.push_back(wd.as_short_string());
		} else {
			labels.push_back("");
		}
	}
	return labels;
}

std::string month_header(const CalendarGrid& grid, size_t indent, size_t column_width) {
	std::string header(indent, ' ');
	int prev_month = -1;
	for(size_t w=0 ; w<grid.weeks().size() ; ++w) {
		// the month shown above a week is the month of its first in-range day.
		const Week& week = grid.weeks()[w];
		auto first = std::find_if(week.begin(), week.end(), [](const GridCell& c)->bool { return c.in_range; });
		if(first == week.end()) continue;
		int month = first->date->month();
		if(month == prev_month) continue;
		size_t pos = indent + w*column_width;
		// keep one blank between names, skip the name when the previous one is still in the way.
		if(header.size() > indent and pos < header.size()+1) continue;
		prev_month = month;
		header.resize(pos, ' ');
		header += first->date->month().as_short_string();
	}
	return header;
}

int TerminalRenderer::palette_index(int level, int level_count) {
	if(level <= 0) return 0;
	if(level_count <= 2) return 4;
	return std::min(4, 1 + (level-1)*3/(level_count-2));
}

std::string TerminalRenderer::colStart(int index) const {
	return esc+"[38;5;"+(boost::lexical_cast<std::string>(colors[index]))+"m";
}

std::string TerminalRenderer::colEnd() const {
	return esc+"[0m";
}

std::string TerminalRenderer::render(const HeatmapResult& result) const {
	int L = options.level_count;
	auto cell = [&](const GridCell& c)->std::string {
		int index = palette_index(c.level ? *c.level : 0, L);
		std::string body = options.label == CellLabel::none ? std::string("◼ ") : cell_label(c, options.label);
		return colStart(index)+body+colEnd();
	};
	std::string legend;
	for(int lvl=0 ; lvl<L ; ++lvl) {
		legend += colStart(palette_index(lvl, L))+"◼ "+colEnd();
	}
	return layout(result.grid, cell, legend);
}

char TextRenderer::glyph(int level, int level_count) {
	static const std::string ramp = "-+*#@";
	if(level <= 0) return '.';
	if(level_count <= 2) return ramp.back();
	size_t idx = std::min(ramp.size()-1, size_t(level-1)*(ramp.size()-1)/size_t(level_count-2));
	return ramp[idx];
}

std::string TextRenderer::render(const HeatmapResult& result) const {
	int L = options.level_count;
	auto cell = [&](const GridCell& c)->std::string {
		if(options.label != CellLabel::none) return cell_label(c, options.label);
		return std::string(1, glyph(c.level ? *c.level : 0, L))+" ";
	};
	std::string legend;
	for(int lvl=0 ; lvl<L ; ++lvl) {
		legend += std::string(1, glyph(lvl, L))+" ";
	}
	return layout(result.grid, cell, legend);
}

std::unique_ptr<Renderer> make_renderer(const RenderOptions& opt) {
	if(opt.level_count < 2) {
		throw HeatmapError(ErrorKind::InvalidConfiguration, Stage::render, "renderer needs at least 2 levels");
	}
	switch(opt.style) {
		case RenderStyle::terminal : return std::make_unique<TerminalRenderer>(opt);
		case RenderStyle::text     : return std::make_unique<TextRenderer>(opt);
	}
	throw HeatmapError(ErrorKind::InvalidConfiguration, Stage::render, "unknown render style");
}

}
