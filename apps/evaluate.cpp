#include <algorithm>
#include <fstream>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "core/config.hpp"
#include "core/logging.hpp"
#include "core/trade_date.hpp"
#include "core/types.hpp"
#include "exec/risk_budget.hpp"
#include "indicators/calendar_overlay.hpp"
#include "indicators/signal_calculator.hpp"
#include "strategy/composite_classifier.hpp"
#include "strategy/structure_selector.hpp"

// date,symbol,metric=value,...
struct Row {
    core::TradeDate date;
    std::string symbol;
    core::MarketSnapshot snap;
    std::optional<core::CreditQuad> credit;
};

static const char* kCreditCols[] = {"creditA", "creditB", "creditAPrev", "creditBPrev"};

static std::optional<double> to_double(const std::string& s){
    try {
        size_t n = 0;
        double v = std::stod(s, &n);
        if (n != s.size()) return std::nullopt;
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

static std::optional<Row> parse_row(const std::string& line, int lineno){
    std::stringstream ss(line);
    std::string x;
    Row r;
    if (!std::getline(ss, x, ',')) return std::nullopt;
    auto d = core::TradeDate::parse(x);
    if (!d){
        if (lineno > 1) spdlog::warn("line {}: bad date '{}', skipped", lineno, x);
        return std::nullopt;   // first line may be a header
    }
    r.date = *d;
    if (!std::getline(ss, r.symbol, ',') || r.symbol.empty()){
        spdlog::warn("line {}: missing symbol, skipped", lineno);
        return std::nullopt;
    }
    std::map<std::string, double> credit;
    while (std::getline(ss, x, ',')){
        if (x.empty()) continue;
        auto eq = x.find('=');
        if (eq == std::string::npos){ spdlog::warn("line {}: '{}' is not metric=value", lineno, x); continue; }
        auto key = x.substr(0, eq);
        auto v = to_double(x.substr(eq + 1));
        if (!v){ spdlog::warn("line {}: bad value for {}", lineno, key); continue; }
        if (std::find(std::begin(kCreditCols), std::end(kCreditCols), key) != std::end(kCreditCols))
            credit[key] = *v;
        else
            r.snap.set(key, *v);
    }
    if (credit.size() == 4)
        r.credit = core::CreditQuad{credit["creditA"], credit["creditB"], credit["creditAPrev"], credit["creditBPrev"]};
    return r;
}

// {"date": "...", "symbol": "...", "summary": {...}, "credit": {"creditA": ..., ...}}
static std::optional<Row> parse_json_row(const std::string& line, int lineno){
    try {
        auto j = nlohmann::json::parse(line);
        auto d = core::TradeDate::parse(j.value("date", std::string{}));
        if (!d){ spdlog::warn("line {}: bad or missing date, skipped", lineno); return std::nullopt; }
        Row r;
        r.date = *d;
        r.symbol = j.value("symbol", std::string{});
        if (r.symbol.empty()){ spdlog::warn("line {}: missing symbol, skipped", lineno); return std::nullopt; }
        if (j.contains("summary")) r.snap = core::snapshot_from_json(j["summary"]);
        if (j.contains("credit")){
            auto c = core::snapshot_from_json(j["credit"]);
            if (std::all_of(std::begin(kCreditCols), std::end(kCreditCols), [&](const char* k){ return c.has(k); }))
                r.credit = core::CreditQuad{c.get("creditA"), c.get("creditB"), c.get("creditAPrev"), c.get("creditBPrev")};
        }
        return r;
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("line {}: {}", lineno, e.what());
    }
    return std::nullopt;
}

static bool ends_with(const std::string& s, const std::string& suffix){
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

static bool load_rows(const std::string& path, std::vector<Row>& out){
    std::ifstream f(path);
    if (!f.good()) return false;
    const bool jsonl = ends_with(path, ".jsonl");
    std::string line;
    int lineno = 0;
    while (std::getline(f, line)){
        ++lineno;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty() || line[0] == '#') continue;
        auto r = jsonl ? parse_json_row(line, lineno) : parse_row(line, lineno);
        if (!r) continue;
        if (r->snap.empty()){ spdlog::warn("line {}: no metrics for {}, skipped", lineno, r->symbol); continue; }
        out.push_back(std::move(*r));
    }
    return !out.empty();
}

// Rolling reference rows for one symbol
struct SymbolState {
    core::ReferenceState ref;
    std::optional<core::TradeDate> session;
    core::MarketSnapshot last;
};

int main(int argc, char** argv){
    std::vector<std::string> pos;
    bool intraday = false;
    std::string log_level = "info";
    for (int i = 1; i < argc; ++i){
        std::string a = argv[i];
        if (a == "--intraday") intraday = true;
        else if (a.rfind("--log-level=", 0) == 0) log_level = a.substr(12);
        else pos.push_back(a);
    }
    core::init_logging(log_level);

    if (pos.empty()){
        fmt::print("Usage: volsig_evaluate <snapshots.csv|snapshots.jsonl> [config.json] [--intraday] [--log-level=debug]\n");
        return 1;
    }

    core::EngineConfig cfg;
    if (pos.size() >= 2){
        auto loaded = core::load_config_file(pos[1]);
        if (!loaded) return 3;
        cfg = std::move(*loaded);
    }

    std::vector<Row> rows;
    if (!load_rows(pos[0], rows)){
        spdlog::error("no usable rows in {}", pos[0]);
        return 2;
    }
    spdlog::info("{} rows from {}", rows.size(), pos[0]);

    ind::SignalCalculator calc(cfg.signals);
    ind::CalendarOverlay overlay(cfg.calendar);
    strategy::CompositeClassifier classifier(cfg.signals);
    exec::RiskBudgetSizer sizer(cfg.sizing);
    strategy::StructureSelector selector(cfg.selector);

    std::map<std::string, SymbolState> states;
    std::map<core::TradeDate, double> deployed;   // per-day risk already allocated

    for (const auto& r : rows){
        auto& st = states[r.symbol];
        if (!st.session || *st.session != r.date){
            if (st.session) st.ref.set_previous_day(st.last);
            st.ref.set_baseline(r.snap);
            st.session = r.date;
        }

        auto signals = calc.compute_signals(r.symbol, r.snap, st.ref, r.credit);
        auto cal = overlay.compute_overlay(r.date);
        auto comp = classifier.classify(signals, cal, intraday);
        st.last = r.snap;

        fmt::print("=== {} {}  calendar {} x{:.2f}\n", r.date.iso(), r.symbol, core::to_string(cal.label), cal.modifier);
        for (const auto& key : ind::signal_order()){
            auto it = signals.find(key);
            if (it == signals.end()) continue;
            const auto& s = it->second;
            fmt::print("  {:<18} {:>12.4f}  {:<7} T{}  {}\n", s.key, s.value, core::to_string(s.level), s.tier, s.label);
        }
        const auto& g = comp.counts;
        fmt::print("  groups: core {} wing {} funding {} momentum {} -> {} firing\n",
                   g.core, g.wing, g.funding, g.momentum, g.groups_firing);

        if (!comp.composite){
            fmt::print("  composite: none\n");
            continue;
        }

        auto budget = sizer.compute(comp, cal);
        double& used = deployed[r.date];
        const double room = std::max(0.0, sizer.max_daily_budget() - used);
        const double allowed = std::min(budget.risk_budget, room);
        used += allowed;
        if (allowed < budget.risk_budget)
            spdlog::warn("{} {}: budget {:.2f} cut to {:.2f} by the daily cap", r.date.iso(), r.symbol,
                         budget.risk_budget, allowed);

        fmt::print("  composite: {}  strength {}\n", core::to_string(*comp.composite), core::to_string(budget.strength));
        fmt::print("  risk budget: {:.2f} (base {:.2f} x {:.4f}), allowed {:.2f}\n",
                   budget.risk_budget, budget.base_risk, budget.multiplier, allowed);

        auto ranked = selector.rank(r.snap, g.core, std::nullopt, strategy::context_from(comp));
        for (size_t i = 0; i < ranked.size() && i < 3; ++i)
            fmt::print("  #{} {:<22} {:>5.1f}  {}\n", i + 1, core::to_string(ranked[i].structure),
                       ranked[i].score, ranked[i].reason);
    }
    return 0;
}
