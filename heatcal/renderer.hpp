#ifndef HEATCAL_RENDERER_HPP
#define HEATCAL_RENDERER_HPP

#include "heatmap_assembler.hpp"
#include <memory>
#include <string>
#include <vector>

namespace heatcal {

enum class RenderStyle { terminal, text };

enum class CellLabel {
	none,          // a ◼ (or glyph) per day
	day_of_month,  // like a real calendar
	commit_count
};

struct RenderOptions {
	RenderStyle style{RenderStyle::terminal};
	CellLabel   label{CellLabel::none};
	int         level_count{5};
};

// turns a finished heatmap into something printable, never modifies it.
class Renderer {
	public:
		virtual ~Renderer() = default;
		virtual std::string render(const HeatmapResult& result) const = 0;
};

class TerminalRenderer : public Renderer {
	public:
		explicit TerminalRenderer(const RenderOptions& opt) : options(opt) { }
		std::string render(const HeatmapResult& result) const override;

		// index into the 5 colour palette, spreading level_count levels across it.
		static int  palette_index(int level, int level_count);
		std::string colStart(int index) const;
		std::string colEnd() const;

	private:
		RenderOptions options;
		const std::string      esc{char{27}};
		const std::vector<int> colors={ 237, 139, 40, 190, 1 };
};

class TextRenderer : public Renderer {
	public:
		explicit TextRenderer(const RenderOptions& opt) : options(opt) { }
		std::string render(const HeatmapResult& result) const override;

		static char glyph(int level, int level_count);

	private:
		RenderOptions options;
};

// the renderer matching opt.style.
std::unique_ptr<Renderer> make_renderer(const RenderOptions& opt);

// row labels for weeks starting on week_start: Mon, Wed and Fri are named, the other rows are blank.
std::vector<std::string> weekday_labels(Weekday week_start);

// one header line with the short month name above the first week starting in that month.
std::string month_header(const CalendarGrid& grid, size_t indent, size_t column_width);

}

#endif
