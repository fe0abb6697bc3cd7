#include "oncourt/display.hpp"
#include "oncourt/clock.hpp"
#include "oncourt/records.hpp"
#include "oncourt/summary.hpp"
#include <algorithm>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <ftxui/component/component.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/dom/elements.hpp>
#include <ftxui/dom/table.hpp>
#include <ftxui/screen/screen.hpp>

namespace oncourt {

namespace {

using namespace ftxui;

constexpr int page_rows = 30;

// -- Formatting helpers --

std::string f1(double v) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << v;
    return oss.str();
}

std::string mmss(double secs) {
    int whole = static_cast<int>(secs);
    std::ostringstream oss;
    oss << whole / 60 << ":" << std::setw(2) << std::setfill('0') << whole % 60;
    return oss.str();
}

std::string period_label(int period) {
    if (period <= regulation_periods) return "Q" + std::to_string(period);
    return "OT" + std::to_string(period - regulation_periods);
}

// Game time remaining back to the period clock it was read from.
std::string stint_clock(double t, int period) {
    double period_floor = period <= regulation_periods
        ? regulation_period_secs * (regulation_periods - period) : 0.0;
    return mmss(t - period_floor);
}

std::string side_label(const GameInfo& game, TeamId team_id) {
    return team_id == game.home_team_id ? "home" : "visitor";
}

Color minutes_color(double minutes, double max_minutes) {
    if (minutes >= max_minutes * 0.6) return Color::Green;
    if (minutes >= max_minutes * 0.3) return Color::Yellow;
    return Color::Red;
}

void print_element(const Element& document, std::ostream& out) {
    auto screen = Screen::Create(Dimension::Fit(document));
    Render(screen, document);
    out << screen.ToString() << "\n";
}

// -- Table data --

std::vector<std::vector<std::string>> lineup_rows(const GameLineups& result) {
    std::vector<std::vector<std::string>> rows;
    rows.push_back({"Event", "Period", "Clock", "Type",
                    "Home 1", "Home 2", "Home 3", "Home 4", "Home 5",
                    "Visitor 1", "Visitor 2", "Visitor 3", "Visitor 4", "Visitor 5"});

    for (size_t i = 0; i < result.rows.size(); ++i) {
        auto& r = result.rows[i];
        auto& e = result.events[i];
        std::vector<std::string> cells = {
            std::to_string(r.event_num), period_label(e.period), e.clock,
            std::to_string(static_cast<int>(e.type)),
        };
        for (auto id : r.home) cells.push_back(std::to_string(id));
        for (auto id : r.visitor) cells.push_back(std::to_string(id));
        rows.push_back(std::move(cells));
    }
    return rows;
}

std::vector<std::vector<std::string>> stint_rows(const GameLineups& result) {
    std::vector<std::vector<std::string>> rows;
    rows.push_back({"Player", "Side", "Period", "In", "Out", "Length"});

    for (auto& iv : result.intervals.intervals) {
        rows.push_back({
            std::to_string(iv.player_id),
            side_label(result.game, iv.team_id),
            period_label(iv.period),
            stint_clock(iv.time_in, iv.period),
            stint_clock(iv.time_out, iv.period),
            mmss(iv.duration()),
        });
    }
    return rows;
}

void write_csv(const std::vector<std::vector<std::string>>& rows, std::ostream& out) {
    for (auto& row : rows) {
        for (size_t i = 0; i < row.size(); ++i) {
            if (i > 0) out << ",";
            out << row[i];
        }
        out << "\n";
    }
}

// -- Render functions --

Element render_header(const GameLineups& result) {
    return hbox({
        text(" Game " + std::to_string(result.game.game_id)) | bold,
        text("  |  "),
        text("Home: " + std::to_string(result.game.home_team_id)),
        text("  |  "),
        text("Visitor: " + std::to_string(result.game.visitor_team_id)),
        text("  |  "),
        text("Events: " + std::to_string(result.rows.size())),
    }) | borderLight | color(Color::Cyan);
}

Element render_table(std::vector<std::vector<std::string>> rows) {
    auto table = Table(std::move(rows));
    table.SelectRow(0).Decorate(bold);
    table.SelectRow(0).SeparatorVertical(LIGHT);
    table.SelectAll().Border(LIGHT);
    return table.Render();
}

Element render_lineups(const GameLineups& result, int first_row) {
    auto all = lineup_rows(result);
    if (all.size() <= 1) return text("No events.") | dim;

    int last = std::min(first_row + page_rows, static_cast<int>(all.size()) - 1);
    std::vector<std::vector<std::string>> page = {all.front()};
    for (int i = first_row + 1; i <= last; ++i) page.push_back(all[i]);

    return vbox({
        text("Lineups by Event") | bold | color(Color::Cyan),
        separator(),
        render_table(std::move(page)),
        text("  Rows " + std::to_string(first_row + 1) + "-" + std::to_string(last) +
             " of " + std::to_string(all.size() - 1)) | dim,
    });
}

Element render_stints(const GameLineups& result, int first_row) {
    auto all = stint_rows(result);
    if (all.size() <= 1) return text("No stints.") | dim;

    int last = std::min(first_row + page_rows, static_cast<int>(all.size()) - 1);
    std::vector<std::vector<std::string>> page = {all.front()};
    for (int i = first_row + 1; i <= last; ++i) page.push_back(all[i]);

    return vbox({
        text("Stints") | bold | color(Color::Cyan),
        separator(),
        render_table(std::move(page)),
        text("  Rows " + std::to_string(first_row + 1) + "-" + std::to_string(last) +
             " of " + std::to_string(all.size() - 1)) | dim,
    });
}

Element render_minutes(const GameLineups& result) {
    auto teams = minutes_by_team(result.intervals, result.game.home_team_id,
                                 result.game.visitor_team_id);
    auto periods = result.events.empty() ? 0 : result.events.back().period;
    double game_minutes = game_length_secs(periods) / 60.0;

    Elements blocks;
    for (auto& team : teams) {
        Elements bars;
        for (auto& p : team.players) {
            auto c = minutes_color(p.minutes(), game_minutes);
            float pct = game_minutes > 0 ? static_cast<float>(p.minutes() / game_minutes) : 0.0f;
            bars.push_back(hbox({
                text(std::to_string(p.player_id)) | size(WIDTH, EQUAL, 12),
                gauge(pct) | size(WIDTH, EQUAL, 25) | color(c),
                text(" " + f1(p.minutes()) + " min") | color(c),
                text("  " + std::to_string(p.stints) + " stints") | dim,
            }));
        }

        blocks.push_back(vbox({
            hbox({
                text(side_label(result.game, team.team_id) + " " + std::to_string(team.team_id)) | bold,
                text("  " + f1(team.seconds / 60.0) + " player-minutes") | dim,
            }),
            vbox(bars),
            text(""),
        }));
    }

    return vbox({
        text("Minutes Played") | bold | color(Color::Cyan),
        separator(),
        vbox(blocks),
    });
}

} // namespace

void display_lineups(const GameLineups& result, OutputFormat format, std::ostream& out) {
    switch (format) {
        case OutputFormat::Csv:
            write_csv(lineup_rows(result), out);
            break;
        case OutputFormat::Json: {
            auto rows = nlohmann::json::array();
            for (auto& r : result.rows) rows.push_back(to_json(r));
            out << rows.dump(2) << "\n";
            break;
        }
        case OutputFormat::Table:
            print_element(vbox({render_header(result), render_table(lineup_rows(result))}), out);
            break;
    }
}

void display_stints(const GameLineups& result, OutputFormat format, std::ostream& out) {
    switch (format) {
        case OutputFormat::Csv:
            write_csv(stint_rows(result), out);
            break;
        case OutputFormat::Json: {
            auto intervals = nlohmann::json::array();
            for (auto& iv : result.intervals.intervals) intervals.push_back(to_json(iv));
            out << intervals.dump(2) << "\n";
            break;
        }
        case OutputFormat::Table:
            print_element(render_table(stint_rows(result)), out);
            break;
    }
}

void display_minutes(const GameLineups& result, OutputFormat format, std::ostream& out) {
    auto teams = minutes_by_team(result.intervals, result.game.home_team_id,
                                 result.game.visitor_team_id);
    switch (format) {
        case OutputFormat::Csv:
            out << "player_id,team_id,seconds,stints\n";
            for (auto& team : teams) {
                for (auto& p : team.players) {
                    out << p.player_id << "," << p.team_id << "," << p.seconds << "," << p.stints << "\n";
                }
            }
            break;
        case OutputFormat::Json: {
            auto j = nlohmann::json::array();
            for (auto& team : teams) {
                for (auto& p : team.players) {
                    j.push_back({{"player_id", p.player_id}, {"team_id", p.team_id},
                                 {"seconds", p.seconds}, {"stints", p.stints}});
                }
            }
            out << j.dump(2) << "\n";
            break;
        }
        case OutputFormat::Table:
            print_element(render_minutes(result), out);
            break;
    }
}

// -- Viewer --

void run_viewer(const GameLineups& result) {
    auto screen = ScreenInteractive::Fullscreen();

    int selected_tab = 0;
    int lineup_offset = 0;
    int stint_offset = 0;
    std::vector<std::string> tab_labels = {
        " Lineups       ",
        " Stints        ",
        " Minutes       ",
    };

    auto menu_option = MenuOption::Vertical();
    menu_option.entries_option.transform = [](const EntryState& state) {
        auto elem = text(state.label);
        if (state.focused) {
            elem = elem | bold | color(Color::Cyan) | inverted;
        } else if (state.active) {
            elem = elem | bold | color(Color::Cyan);
        } else {
            elem = elem | dim;
        }
        return elem;
    };

    auto menu = Menu(&tab_labels, &selected_tab, menu_option);

    auto content_renderer = Renderer([&] {
        switch (selected_tab) {
            case 0: return render_lineups(result, lineup_offset);
            case 1: return render_stints(result, stint_offset);
            case 2: return render_minutes(result);
            default: return text("Unknown tab") | dim;
        }
    });

    auto layout = Container::Horizontal({menu, content_renderer});

    auto renderer = Renderer(layout, [&] {
        return vbox({
            render_header(result),
            separator(),
            hbox({
                vbox({
                    text(" Reports") | bold,
                    separator(),
                    menu->Render() | vscroll_indicator | yframe |
                        size(WIDTH, EQUAL, 18),
                }) | borderLight,
                separator(),
                content_renderer->Render() | flex | yframe | xflex,
            }) | flex,
            separator(),
            hbox({
                text(" [↑/↓] Navigate") | dim,
                text("  [PgUp/PgDn] Scroll") | dim,
                text("  [q] Quit") | dim,
            }),
        }) | borderHeavy | color(Color::White);
    });

    auto scroll = [&](int delta) {
        int* offset = selected_tab == 0 ? &lineup_offset : &stint_offset;
        int total = selected_tab == 0 ? static_cast<int>(result.rows.size())
                                      : static_cast<int>(result.intervals.intervals.size());
        *offset = std::clamp(*offset + delta, 0, std::max(total - page_rows, 0));
    };

    auto with_keys = CatchEvent(renderer, [&](ftxui::Event event) {
        if (event == ftxui::Event::Character('q') || event == ftxui::Event::Escape) {
            screen.Exit();
            return true;
        }
        if (event == ftxui::Event::PageDown) {
            scroll(page_rows);
            return true;
        }
        if (event == ftxui::Event::PageUp) {
            scroll(-page_rows);
            return true;
        }
        return false;
    });

    screen.Loop(with_keys);
}

} // namespace oncourt
