#include "ui/gui_app.hpp"
#include <SFML/Graphics.hpp>
#include <imgui.h>
#include <imgui-SFML.h>
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <cstdio>
#include <optional>
#include <string>
#include <vector>

#include "backtest/backtest.hpp"
#include "core/errors.hpp"
#include "report/summary.hpp"

namespace ui {

namespace {

struct Line {
    const std::vector<float>* v;
    ImU32 col;
    const char* label;
};

struct HLine {
    float y;
    ImU32 col;
    const char* label;
};

struct Marker {
    int idx;
    float y;
    bool up;   // BUY: felfelé mutató zöld háromszög
};

const ImU32 kBg      = IM_COL32(24, 26, 30, 255);
const ImU32 kGrid    = IM_COL32(70, 70, 80, 255);
const ImU32 kPrice   = IM_COL32(90, 160, 240, 255);
const ImU32 kRsi     = IM_COL32(200, 140, 255, 255);
const ImU32 kGreen   = IM_COL32(60, 200, 90, 255);
const ImU32 kRed     = IM_COL32(230, 70, 70, 255);
const ImU32 kBh      = IM_COL32(240, 180, 60, 255);

// Egyszerű vonaldiagram ImDrawList-tel; a legendát a címsor mellé írja.
void draw_chart(const char* id, const char* title,
                const std::vector<Line>& lines,
                const std::vector<HLine>& hlines,
                const std::vector<Marker>& markers,
                const std::vector<std::string>& dates,
                float height){
    ImGui::TextUnformatted(title);
    for (const auto& l : lines){ ImGui::SameLine(); ImGui::TextColored(ImGui::ColorConvertU32ToFloat4(l.col), "  %s", l.label); }
    for (const auto& h : hlines){ ImGui::SameLine(); ImGui::TextColored(ImGui::ColorConvertU32ToFloat4(h.col), "  %s", h.label); }

    const ImVec2 p0 = ImGui::GetCursorScreenPos();
    const ImVec2 size(std::max(50.0f, ImGui::GetContentRegionAvail().x), height);
    ImGui::InvisibleButton(id, size);
    const ImVec2 p1(p0.x + size.x, p0.y + size.y);
    ImDrawList* dl = ImGui::GetWindowDrawList();
    dl->AddRectFilled(p0, p1, kBg);
    dl->AddRect(p0, p1, kGrid);

    std::size_t n = 0;
    float lo = 0.f, hi = 0.f;
    bool first = true;
    for (const auto& l : lines){
        n = std::max(n, l.v->size());
        for (float x : *l.v){
            if (first){ lo = hi = x; first = false; }
            lo = std::min(lo, x); hi = std::max(hi, x);
        }
    }
    for (const auto& h : hlines){ lo = std::min(lo, h.y); hi = std::max(hi, h.y); }
    if (n < 2) return;
    if (hi - lo < 1e-6f){ hi += 1.f; lo -= 1.f; }
    const float pad = (hi - lo) * 0.05f; lo -= pad; hi += pad;

    auto X = [&](std::size_t i){ return p0.x + size.x * static_cast<float>(i) / static_cast<float>(n - 1); };
    auto Y = [&](float v){ return p1.y - size.y * (v - lo) / (hi - lo); };

    for (const auto& h : hlines){
        // szaggatott vízszintes vonal
        for (float x = p0.x; x < p1.x; x += 10.f)
            dl->AddLine(ImVec2(x, Y(h.y)), ImVec2(std::min(x + 5.f, p1.x), Y(h.y)), h.col, 1.0f);
    }
    for (const auto& l : lines){
        const auto& v = *l.v;
        for (std::size_t i=1;i<v.size();++i)
            dl->AddLine(ImVec2(X(i-1), Y(v[i-1])), ImVec2(X(i), Y(v[i])), l.col, 1.5f);
    }
    for (const auto& m : markers){
        const float cx = X(static_cast<std::size_t>(m.idx)), cy = Y(m.y);
        if (m.up) dl->AddTriangleFilled(ImVec2(cx, cy - 2.f), ImVec2(cx - 6.f, cy + 10.f), ImVec2(cx + 6.f, cy + 10.f), kGreen);
        else      dl->AddTriangleFilled(ImVec2(cx, cy + 2.f), ImVec2(cx - 6.f, cy - 10.f), ImVec2(cx + 6.f, cy - 10.f), kRed);
    }

    dl->AddText(ImVec2(p0.x + 4.f, p0.y + 2.f), kGrid, fmt::format("{:.2f}", hi).c_str());
    dl->AddText(ImVec2(p0.x + 4.f, p1.y - 16.f), kGrid, fmt::format("{:.2f}", lo).c_str());

    if (ImGui::IsItemHovered()){
        const float mx = ImGui::GetIO().MousePos.x;
        const auto i = static_cast<std::size_t>(std::clamp((mx - p0.x) / size.x, 0.f, 1.f) * static_cast<float>(n - 1) + 0.5f);
        dl->AddLine(ImVec2(X(i), p0.y), ImVec2(X(i), p1.y), kGrid);
        std::string tip = (i < dates.size() ? dates[i] : std::to_string(i));
        for (const auto& l : lines)
            if (i < l.v->size()) tip += fmt::format("\n{}: {:.2f}", l.label, (*l.v)[i]);
        ImGui::SetTooltip("%s", tip.c_str());
    }
}

} // namespace

struct GuiApp::Impl {
    sf::RenderWindow window{sf::VideoMode(1200, 900), "RSI Backtesting Tool"};

    config::AppConfig cfg;
    std::unique_ptr<data::PriceSource> source;

    // Űrlap
    int company_idx{0};
    char start_buf[16] = "";
    char end_buf[16] = "";
    double capital{10000.0};
    double fee_pct{0.1};
    double overbought{70.0};
    double oversold{30.0};
    int period{14};

    // Üzenet ablak (Input Error / No Data / Data Error)
    std::string popup_title;
    std::string popup_msg;
    bool popup_pending{false};

    // Utolsó futás; minden futás teljesen lecseréli
    std::optional<backtest::Result> result;
    std::string result_label;
    double shown_ob{70.0}, shown_os{30.0};
    std::vector<std::string> dates;
    std::vector<float> price, rsi, equity, bh;
    std::vector<Marker> price_marks;
    std::vector<report::SummaryRow> rows;

    Impl(config::AppConfig c, std::unique_ptr<data::PriceSource> s)
    : cfg(std::move(c)), source(std::move(s)) {
        window.setFramerateLimit(60);
        const auto& d = cfg.defaults;
        std::snprintf(start_buf, sizeof(start_buf), "%s", d.start_date.c_str());
        std::snprintf(end_buf, sizeof(end_buf), "%s", d.end_date.c_str());
        capital = d.initial_capital; fee_pct = d.fee_percent;
        overbought = d.overbought; oversold = d.oversold; period = d.rsi_period;
    }

    void message(std::string title, std::string msg){
        popup_title = std::move(title); popup_msg = std::move(msg); popup_pending = true;
    }

    void run_backtest(){
        if (cfg.tickers.empty()){ message("Input Error", "No tickers configured."); return; }
        const auto& tk = cfg.tickers[static_cast<std::size_t>(std::clamp(company_idx, 0, static_cast<int>(cfg.tickers.size()) - 1))];

        backtest::Params p;
        p.rsi_period = period > 0 ? static_cast<std::size_t>(period) : 0;
        p.overbought = overbought;
        p.oversold = oversold;
        p.initial_capital = capital;
        p.fee_rate = fee_pct / 100.0;

        try {
            backtest::validate(p);
            const auto prices = backtest::fetch_prices(*source, tk.symbol, start_buf, end_buf);

            auto res = backtest::run_backtest(prices, p);
            load_result(tk.name, std::move(res), p);
        } catch (const InputValidationError& e){
            message("Input Error", e.what());
        } catch (const NoDataError&){
            message("No Data", "No data available for the selected parameters.");
        } catch (const DataSourceError& e){
            spdlog::error("data source {}: {}", source->id(), e.what());
            message("Data Error", e.what());
        }
    }

    void load_result(const std::string& label, backtest::Result res, const backtest::Params& p){
        dates.clear(); price.clear(); rsi.clear(); equity.clear(); bh.clear(); price_marks.clear();
        const auto& recs = res.records;
        for (std::size_t i=0;i<recs.size();++i){
            const auto& r = recs[i];
            dates.push_back(r.date);
            price.push_back(static_cast<float>(r.close));
            rsi.push_back(static_cast<float>(r.rsi));
            equity.push_back(static_cast<float>(r.portfolio_value));
            bh.push_back(static_cast<float>(res.buy_and_hold[i]));
            if (r.trade != TradeAction::None)
                price_marks.push_back({static_cast<int>(i), static_cast<float>(r.close), r.trade == TradeAction::Buy});
        }
        rows = report::summary_rows(res.metrics);
        result_label = label;
        shown_ob = p.overbought; shown_os = p.oversold;
        result = std::move(res);
    }
};

GuiApp::GuiApp(config::AppConfig cfg, std::unique_ptr<data::PriceSource> source)
: self(std::make_unique<Impl>(std::move(cfg), std::move(source))){
    ImGui::SFML::Init(self->window);
}

GuiApp::~GuiApp(){
    ImGui::SFML::Shutdown();
}

void GuiApp::run(){
    sf::Clock delta;

    bool running=true;
    while (running){
        sf::Event ev{};
        while (self->window.pollEvent(ev)){
            ImGui::SFML::ProcessEvent(self->window, ev);
            if (ev.type==sf::Event::Closed) running=false;
        }
        ImGui::SFML::Update(self->window, delta.restart());

        // --- UI: Parameters
        ImGui::SetNextWindowPos(ImVec2(10, 10), ImGuiCond_FirstUseEver);
        ImGui::SetNextWindowSize(ImVec2(420, 260), ImGuiCond_FirstUseEver);
        if (ImGui::Begin("Parameters")){
            const char* preview = self->cfg.tickers.empty() ? "" : self->cfg.tickers[static_cast<std::size_t>(self->company_idx)].name.c_str();
            if (ImGui::BeginCombo("Select Company", preview)){
                for (int i=0;i<static_cast<int>(self->cfg.tickers.size());++i){
                    const bool sel = (i == self->company_idx);
                    if (ImGui::Selectable(self->cfg.tickers[static_cast<std::size_t>(i)].name.c_str(), sel)) self->company_idx = i;
                    if (sel) ImGui::SetItemDefaultFocus();
                }
                ImGui::EndCombo();
            }
            ImGui::InputText("Start date", self->start_buf, IM_ARRAYSIZE(self->start_buf));
            ImGui::InputText("End date", self->end_buf, IM_ARRAYSIZE(self->end_buf));
            ImGui::InputDouble("Starting Capital ($)", &self->capital, 1000.0, 10000.0, "%.2f");
            ImGui::InputDouble("Fee per Trade (%)", &self->fee_pct, 0.01, 0.1, "%.3f");
            ImGui::InputDouble("RSI Overbought Level", &self->overbought, 1.0, 5.0, "%.1f");
            ImGui::InputDouble("RSI Oversold Level", &self->oversold, 1.0, 5.0, "%.1f");
            ImGui::InputInt("RSI Period", &self->period);
            ImGui::Separator();
            if (ImGui::Button("Run Backtest")) self->run_backtest();
            ImGui::SameLine();
            if (ImGui::Button("Exit")) running = false;
        }
        ImGui::End();

        // --- UI: Summary
        ImGui::SetNextWindowPos(ImVec2(440, 10), ImGuiCond_FirstUseEver);
        ImGui::SetNextWindowSize(ImVec2(420, 260), ImGuiCond_FirstUseEver);
        if (ImGui::Begin("Summary")){
            if (self->result){
                ImGui::TextUnformatted(self->result_label.c_str());
                if (ImGui::BeginTable("summary", 3, ImGuiTableFlags_Borders | ImGuiTableFlags_RowBg | ImGuiTableFlags_SizingStretchProp)){
                    ImGui::TableSetupColumn(""); ImGui::TableSetupColumn("RSI-Strategy"); ImGui::TableSetupColumn("Buy-n-Hold");
                    ImGui::TableHeadersRow();
                    for (const auto& r : self->rows){
                        ImGui::TableNextRow();
                        ImGui::TableSetColumnIndex(0); ImGui::Text("%s:", r.label.c_str());
                        ImGui::TableSetColumnIndex(1); ImGui::TextUnformatted(r.strategy.c_str());
                        ImGui::TableSetColumnIndex(2); ImGui::TextUnformatted(r.baseline.c_str());
                    }
                    ImGui::EndTable();
                }
            } else {
                ImGui::TextDisabled("Run a backtest to see results.");
            }
        }
        ImGui::End();

        // --- UI: Charts
        ImGui::SetNextWindowPos(ImVec2(10, 280), ImGuiCond_FirstUseEver);
        ImGui::SetNextWindowSize(ImVec2(1180, 610), ImGuiCond_FirstUseEver);
        if (ImGui::Begin("Charts") && self->result){
            const float h = std::max(120.0f, (ImGui::GetContentRegionAvail().y - 80.0f) / 3.0f);
            const std::string price_title = self->result_label + " Price with Buy/Sell Signals";
            draw_chart("##price", price_title.c_str(),
                       {{&self->price, kPrice, "Close"}}, {}, self->price_marks, self->dates, h);

            const std::string ob = fmt::format("Overbought ({})", self->shown_ob);
            const std::string os = fmt::format("Oversold ({})", self->shown_os);
            draw_chart("##rsi", "Relative Strength Index (RSI)",
                       {{&self->rsi, kRsi, "RSI"}},
                       {{static_cast<float>(self->shown_ob), kRed, ob.c_str()},
                        {static_cast<float>(self->shown_os), kGreen, os.c_str()}},
                       {}, self->dates, h);

            draw_chart("##equity", "Portfolio Value Over Time",
                       {{&self->equity, kPrice, "RSI-Strategy"}, {&self->bh, kBh, "Buy-n-Hold"}},
                       {}, {}, self->dates, h);
        }
        ImGui::End();

        // --- Üzenet
        if (self->popup_pending){ ImGui::OpenPopup("Message"); self->popup_pending = false; }
        if (ImGui::BeginPopupModal("Message", nullptr, ImGuiWindowFlags_AlwaysAutoResize)){
            ImGui::TextUnformatted(self->popup_title.c_str());
            ImGui::Separator();
            ImGui::TextWrapped("%s", self->popup_msg.c_str());
            if (ImGui::Button("OK")) ImGui::CloseCurrentPopup();
            ImGui::EndPopup();
        }

        // --- Render
        self->window.clear();
        ImGui::SFML::Render(self->window);
        self->window.display();
    }
    self->window.close();
}

} // namespace ui
