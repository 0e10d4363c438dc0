#include "analysis/run_summary.hpp"
#include "common/logging.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <stdexcept>

namespace ramm {

namespace {

const JsonValue kEmptyObject = JsonValue::make_object();

const JsonValue& section(const JsonValue& rec, const std::string& key) {
    const JsonValue* v = rec.get_object(key);
    return v ? *v : kEmptyObject;
}

// The step's fills: the full "fills" list when present, else the single
// "fill" field written by older runs.
std::vector<const JsonValue*> step_fills(const JsonValue& rec) {
    std::vector<const JsonValue*> out;
    if (const JsonValue* fills = rec.get_array("fills")) {
        for (const auto& f : fills->arr) {
            if (f.is_object()) out.push_back(&f);
        }
    } else if (const JsonValue* fill = rec.get_object("fill")) {
        out.push_back(fill);
    }
    return out;
}

std::string csv_escape(const std::string& s) {
    if (s.find_first_of(",\"\n") == std::string::npos) return s;
    std::string out = "\"";
    for (char c : s) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

} // anonymous namespace

void SeriesStats::add(double v) {
    ++count;
    sum += v;
    min = std::min(min, v);
    max = std::max(max, v);
    last = v;
}

double RunSummary::fill_rate_pct() const {
    uint64_t actions = total_actions();
    return actions ? 100.0 * static_cast<double>(total_fills()) / static_cast<double>(actions) : 0.0;
}

double RunSummary::avg_fill_qty() const {
    uint64_t fills = total_fills();
    return fills ? total_fill_qty / static_cast<double>(fills) : 0.0;
}

std::vector<JsonValue> load_jsonl(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw std::runtime_error("cannot open " + path);
    }

    auto log = get_logger("summary");
    std::vector<JsonValue> records;
    std::string line;
    size_t line_no = 0;

    while (std::getline(f, line)) {
        ++line_no;
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
        try {
            JsonValue rec = parse_json(line);
            if (!rec.is_object()) {
                log->warn("{}:{}: skipping non-object line", path, line_no);
                continue;
            }
            records.push_back(std::move(rec));
        } catch (const ParseError& e) {
            log->warn("{}:{}: skipping invalid JSON line: {}", path, line_no, e.what());
        }
    }
    return records;
}

RunSummary summarize(const std::vector<JsonValue>& records) {
    RunSummary s;
    if (records.empty()) return s;

    const JsonValue& first = records.front();
    s.scenario   = first.get_string("scenario", "unknown");
    s.experiment = first.get_string("experiment", "unknown");
    s.run_id     = first.get_string("run_id", "unknown");
    s.mode       = first.get_string("mode", "unknown");

    s.total_steps = records.size();
    s.first_step  = std::numeric_limits<int64_t>::max();
    s.last_step   = std::numeric_limits<int64_t>::min();

    double peak_pnl = 0.0;

    for (const auto& rec : records) {
        int64_t step = rec.get_int("step");
        s.first_step = std::min(s.first_step, step);
        s.last_step  = std::max(s.last_step, step);

        const JsonValue& market = section(rec, "market");
        auto add_positive = [](SeriesStats& st, double v) { if (v > 0.0) st.add(v); };
        add_positive(s.bid, market.get_number("bid"));
        add_positive(s.ask, market.get_number("ask"));
        add_positive(s.mid, market.get_number("mid"));
        add_positive(s.spread, market.get_number("spread"));

        const JsonValue& state = section(rec, "state");
        double pnl = state.get_number("pnl");
        s.inventory.add(state.get_number("inventory"));
        s.pnl.add(pnl);
        s.final_cash_flow = state.get_number("cash_flow");

        peak_pnl = std::max(peak_pnl, pnl);
        s.max_drawdown = std::max(s.max_drawdown, peak_pnl - pnl);

        if (const JsonValue* action = rec.get_object("action")) {
            std::string side = action->get_string("side");
            if (side == "BUY") ++s.buy_actions;
            else if (side == "SELL") ++s.sell_actions;
        }

        for (const JsonValue* fill : step_fills(rec)) {
            std::string side = fill->get_string("side");
            if (side == "BUY") ++s.buy_fills;
            else if (side == "SELL") ++s.sell_fills;
            else continue;

            s.fill_price.add(fill->get_number("price"));
            s.total_fill_qty += fill->get_number("qty");
            const JsonValue* latency = fill->find("latency_ms");
            if (latency && latency->is_number()) {
                s.fill_latency.record(latency->number);
            }
        }
    }
    return s;
}

void print_summary(const RunSummary& s, std::ostream& os) {
    auto row = [&os](const std::string& key, double value) {
        os << "  " << std::left << std::setw(24) << key << std::right
           << std::setw(14) << std::fixed << std::setprecision(2) << value << "\n";
    };
    auto count_row = [&os](const std::string& key, uint64_t value) {
        os << "  " << std::left << std::setw(24) << key << std::right
           << std::setw(14) << value << "\n";
    };

    os << "\n=== Run Summary ===\n";
    os << "  scenario " << s.scenario << " | experiment " << s.experiment
       << " | mode " << s.mode << " | run " << s.run_id << "\n\n";

    count_row("total_steps", s.total_steps);
    count_row("first_step", static_cast<uint64_t>(std::max<int64_t>(0, s.first_step)));
    count_row("last_step", static_cast<uint64_t>(std::max<int64_t>(0, s.last_step)));

    row("min_bid", s.bid.min_or_zero());
    row("max_bid", s.bid.max_or_zero());
    row("avg_bid", s.bid.avg());
    row("min_ask", s.ask.min_or_zero());
    row("max_ask", s.ask.max_or_zero());
    row("avg_ask", s.ask.avg());
    row("min_mid", s.mid.min_or_zero());
    row("max_mid", s.mid.max_or_zero());
    row("avg_mid", s.mid.avg());
    row("min_spread", s.spread.min_or_zero());
    row("max_spread", s.spread.max_or_zero());
    row("avg_spread", s.spread.avg());

    row("min_inventory", s.inventory.min_or_zero());
    row("max_inventory", s.inventory.max_or_zero());
    row("avg_inventory", s.inventory.avg());
    row("final_inventory", s.inventory.last);
    row("min_pnl", s.pnl.min_or_zero());
    row("max_pnl", s.pnl.max_or_zero());
    row("avg_pnl", s.pnl.avg());
    row("final_pnl", s.pnl.last);
    row("max_drawdown", s.max_drawdown);
    row("final_cash_flow", s.final_cash_flow);

    count_row("total_actions", s.total_actions());
    count_row("buy_actions", s.buy_actions);
    count_row("sell_actions", s.sell_actions);
    count_row("total_fills", s.total_fills());
    count_row("buy_fills", s.buy_fills);
    count_row("sell_fills", s.sell_fills);
    row("fill_rate_pct", s.fill_rate_pct());
    row("avg_fill_price", s.fill_price.avg());
    row("avg_fill_qty", s.avg_fill_qty());
    row("min_fill_latency_ms", s.fill_latency.min_or_zero());
    row("max_fill_latency_ms", s.fill_latency.max_ms);
    row("avg_fill_latency_ms", s.fill_latency.avg_ms());
}

void write_flat_csv(const std::vector<JsonValue>& records, const std::string& csv_path) {
    std::ofstream f(csv_path);
    if (!f.is_open()) {
        throw std::runtime_error("cannot write " + csv_path);
    }

    f << "step,timestamp,scenario,experiment,run_id,mode,regime,"
         "bid,ask,mid,spread,last_trade,bid_depth,ask_depth,"
         "inventory,cash_flow,pnl,orders_sent,"
         "action_side,action_price,action_qty,"
         "fill_count,fill_side,fill_price,fill_qty,fill_latency_ms\n";

    f << std::fixed << std::setprecision(4);
    for (const auto& rec : records) {
        const JsonValue& market = section(rec, "market");
        const JsonValue& book   = section(rec, "book");
        const JsonValue& state  = section(rec, "state");
        const JsonValue* action = rec.get_object("action");
        const JsonValue* fill   = rec.get_object("fill");

        f << rec.get_int("step") << ","
          << csv_escape(rec.get_string("timestamp")) << ","
          << csv_escape(rec.get_string("scenario")) << ","
          << csv_escape(rec.get_string("experiment")) << ","
          << csv_escape(rec.get_string("run_id")) << ","
          << csv_escape(rec.get_string("mode")) << ","
          << csv_escape(rec.get_string("regime")) << ","
          << market.get_number("bid") << ","
          << market.get_number("ask") << ","
          << market.get_number("mid") << ","
          << market.get_number("spread") << ","
          << market.get_number("last_trade") << ","
          << book.get_int("bid_depth") << ","
          << book.get_int("ask_depth") << ","
          << state.get_int("inventory") << ","
          << state.get_number("cash_flow") << ","
          << state.get_number("pnl") << ","
          << state.get_int("orders_sent") << ","
          << (action ? action->get_string("side") : "") << ","
          << (action ? action->get_number("price") : 0.0) << ","
          << (action ? action->get_int("qty") : 0) << ","
          << step_fills(rec).size() << ","
          << (fill ? fill->get_string("side") : "") << ","
          << (fill ? fill->get_number("price") : 0.0) << ","
          << (fill ? fill->get_int("qty") : 0) << ","
          << (fill ? fill->get_number("latency_ms") : 0.0) << "\n";
    }
}

std::string summary_csv_header() {
    return "source_file,scenario,experiment,run_id,mode,total_steps,first_step,last_step,"
           "min_bid,max_bid,avg_bid,min_ask,max_ask,avg_ask,min_mid,max_mid,avg_mid,mid_range,"
           "min_spread,max_spread,avg_spread,"
           "min_inventory,max_inventory,avg_inventory,final_inventory,"
           "min_pnl,max_pnl,avg_pnl,final_pnl,max_drawdown,final_cash_flow,"
           "total_actions,buy_actions,sell_actions,total_fills,buy_fills,sell_fills,fill_rate_pct,"
           "avg_fill_price,total_fill_qty,avg_fill_qty,"
           "min_fill_latency_ms,max_fill_latency_ms,avg_fill_latency_ms";
}

std::string summary_csv_row(const RunSummary& s) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(4);
    ss << csv_escape(s.source_file) << "," << csv_escape(s.scenario) << ","
       << csv_escape(s.experiment) << "," << csv_escape(s.run_id) << "," << csv_escape(s.mode) << ","
       << s.total_steps << "," << s.first_step << "," << s.last_step << ","
       << s.bid.min_or_zero() << "," << s.bid.max_or_zero() << "," << s.bid.avg() << ","
       << s.ask.min_or_zero() << "," << s.ask.max_or_zero() << "," << s.ask.avg() << ","
       << s.mid.min_or_zero() << "," << s.mid.max_or_zero() << "," << s.mid.avg() << ","
       << (s.mid.max_or_zero() - s.mid.min_or_zero()) << ","
       << s.spread.min_or_zero() << "," << s.spread.max_or_zero() << "," << s.spread.avg() << ","
       << s.inventory.min_or_zero() << "," << s.inventory.max_or_zero() << ","
       << s.inventory.avg() << "," << s.inventory.last << ","
       << s.pnl.min_or_zero() << "," << s.pnl.max_or_zero() << "," << s.pnl.avg() << ","
       << s.pnl.last << "," << s.max_drawdown << "," << s.final_cash_flow << ","
       << s.total_actions() << "," << s.buy_actions << "," << s.sell_actions << ","
       << s.total_fills() << "," << s.buy_fills << "," << s.sell_fills << ","
       << s.fill_rate_pct() << ","
       << s.fill_price.avg() << "," << s.total_fill_qty << "," << s.avg_fill_qty() << ","
       << s.fill_latency.min_or_zero() << "," << s.fill_latency.max_ms << ","
       << s.fill_latency.avg_ms();
    return ss.str();
}

size_t write_directory_summary(const std::string& dir, const std::string& output_csv) {
    namespace fs = std::filesystem;

    if (!fs::is_directory(dir)) {
        throw std::runtime_error("data directory '" + dir + "' does not exist");
    }

    std::vector<fs::path> files;
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (entry.is_regular_file() && entry.path().extension() == ".jsonl") {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end());

    fs::path out_path(output_csv);
    if (out_path.has_parent_path()) {
        fs::create_directories(out_path.parent_path());
    }
    std::ofstream out(output_csv);
    if (!out.is_open()) {
        throw std::runtime_error("cannot write " + output_csv);
    }

    auto log = get_logger("summary");
    out << summary_csv_header() << "\n";
    for (const auto& file : files) {
        log->info("processing {}", file.filename().string());
        RunSummary s = summarize(load_jsonl(file.string()));
        s.source_file = file.filename().string();
        out << summary_csv_row(s) << "\n";
    }
    return files.size();
}

} // namespace ramm
