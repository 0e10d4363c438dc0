#include "backtest/backtest_runner.hpp"
#include "common/logging.hpp"
#include "config/engine_config.hpp"
#include "engine/trading_engine.hpp"
#include "logging/step_logger.hpp"
#include "strategy/experiment_strategies.hpp"
#include "wire/exchange_session.hpp"

#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace {

// Pause between consecutive live runs of an experiment matrix.
constexpr auto kBetweenLiveRuns = std::chrono::seconds(2);

struct Options {
    std::string config_path = "config/engine.json";
    std::string name;
    std::string password;
    std::string scenario    = "normal_market";
    std::string host        = "localhost:8080";
    std::string experiment;         // empty: take it from the config
    std::string data_file;
    std::string log_level;          // empty: take it from the config
    bool        secure      = false;
    bool        backtest    = false;
    bool        step_log    = true;
    bool        all_scenarios   = false;
    bool        all_experiments = false;
    bool        prioritized     = false;
    size_t      num_ticks   = 2000;
};

void print_usage(std::ostream& os) {
    os << "Usage: regime_bot [options]\n"
       << "  --config <path>      Engine config (default: config/engine.json)\n"
       << "  --name <team>        Team name, required for live trading\n"
       << "  --password <pw>      Team password\n"
       << "  --scenario <name>    Replay or synthetic scenario (default: normal_market)\n"
       << "  --host <host:port>   Exchange host (default: localhost:8080)\n"
       << "  --secure             Use https / wss\n"
       << "  --experiment <name>  Strategy experiment (default: regime_adaptive)\n"
       << "  --all-scenarios      Run every scenario in turn\n"
       << "  --all-experiments    Run every experiment in turn\n"
       << "  --prioritized        Run the prioritized scenario/experiment plan\n"
       << "  --list-experiments   List experiments and exit\n"
       << "  --list-scenarios     List scenarios and exit\n"
       << "  --backtest           Run offline against the simulated exchange\n"
       << "  --ticks <n>          Synthetic backtest length (default: 2000)\n"
       << "  --data <csv>         Backtest from a step,bid,bid_qty,ask,ask_qty file\n"
       << "  --log-level <lvl>    trace|debug|info|warn|error|critical|off\n"
       << "  --no-step-log        Do not write the JSONL step log\n"
       << "  --help               Show this help\n";
}

std::unique_ptr<ramm::StepLogger> open_step_log(const Options& opts,
                                                const ramm::EngineConfig& config,
                                                const std::string& mode) {
    if (!opts.step_log) return nullptr;
    auto log = std::make_unique<ramm::StepLogger>(
        config.logging.step_log_dir,
        ramm::StepLogIdentity{.scenario = opts.scenario, .experiment = config.strategies.experiment,
                              .mode = mode});
    ramm::get_logger("engine")->info("step log: {}", log->path());
    return log;
}

int run_backtest(const Options& opts, const ramm::EngineConfig& config) {
    ramm::BacktestConfig bt;
    bt.engine    = config;
    bt.scenario  = opts.scenario;
    bt.num_ticks = opts.num_ticks;
    bt.data_file = opts.data_file;

    auto step_log = open_step_log(opts, config, "backtest");
    ramm::BacktestRunner runner(bt, step_log.get());
    runner.run();
    runner.print_final_results(std::cout);
    return 0;
}

int run_live(const Options& opts, const ramm::EngineConfig& config) {
    ramm::SessionConfig session_cfg;
    session_cfg.host     = opts.host;
    session_cfg.name     = opts.name;
    session_cfg.password = opts.password;
    session_cfg.scenario = opts.scenario;
    session_cfg.secure   = opts.secure;

    auto credentials = ramm::register_session(session_cfg);

    auto step_log = open_step_log(opts, config, "live");
    if (step_log) step_log->set_run_id(credentials.run_id);

    ramm::EngineEventQueue queue;
    ramm::ExchangeSession session(session_cfg, credentials, queue);
    ramm::TradingEngine engine(config, opts.name, session, step_log.get());

    session.start();
    engine.run(queue);
    session.stop();

    engine.print_final_results(std::cout);
    return 0;
}

int run_once(const Options& opts, const ramm::EngineConfig& config) {
    return opts.backtest ? run_backtest(opts, config) : run_live(opts, config);
}

struct MatrixResult {
    std::string scenario;
    std::string experiment;
    bool        ok = false;
};

// Runs each scenario/experiment pair in turn. A failed run is logged and
// counted; the remaining runs still go ahead.
int run_matrix(const Options& opts, const ramm::EngineConfig& base,
               const std::vector<ramm::ExperimentRun>& runs) {
    auto log = ramm::get_logger("runner");
    log->info("running {} experiment(s)", runs.size());

    std::vector<MatrixResult> results;
    for (size_t i = 0; i < runs.size(); ++i) {
        const auto& run = runs[i];
        log->info("[{}/{}] {} - {}{}{}", i + 1, runs.size(), run.scenario, run.experiment,
                  run.description.empty() ? "" : ": ", run.description);

        Options run_opts = opts;
        run_opts.scenario = run.scenario;
        ramm::EngineConfig config = base;
        config.strategies.experiment = run.experiment;

        MatrixResult result{run.scenario, run.experiment, false};
        try {
            result.ok = run_once(run_opts, config) == 0;
        } catch (const std::exception& e) {
            log->error("{} - {} failed: {}", run.scenario, run.experiment, e.what());
        }
        results.push_back(result);

        if (!opts.backtest && i + 1 < runs.size()) {
            std::this_thread::sleep_for(kBetweenLiveRuns);
        }
    }

    size_t succeeded = 0;
    std::cout << "\n=== Experiment Summary ===\n";
    for (const auto& r : results) {
        if (r.ok) ++succeeded;
        std::cout << "  " << (r.ok ? "ok    " : "FAILED") << " " << r.scenario << " - "
                  << r.experiment << "\n";
    }
    std::cout << "Succeeded: " << succeeded << "/" << results.size() << "\n";
    return succeeded == results.size() ? 0 : 1;
}

std::vector<ramm::ExperimentRun> plan_runs(const Options& opts, const ramm::EngineConfig& config) {
    if (opts.prioritized) return ramm::prioritized_experiment_plan();

    std::vector<std::string> scenarios{opts.scenario};
    if (opts.all_scenarios) scenarios = ramm::BacktestRunner::scenario_names();

    std::vector<std::string> experiments{config.strategies.experiment};
    if (opts.all_experiments) {
        experiments.clear();
        for (const auto& e : ramm::experiment_catalog()) experiments.push_back(e.name);
    }

    std::vector<ramm::ExperimentRun> runs;
    for (const auto& scenario : scenarios) {
        for (const auto& experiment : experiments) {
            runs.push_back(ramm::ExperimentRun{scenario, experiment, ""});
        }
    }
    return runs;
}

void list_experiments(std::ostream& os) {
    os << "Available experiments:\n";
    for (const auto& e : ramm::experiment_catalog()) {
        os << "  " << std::left << std::setw(24) << e.name << e.description << "\n";
    }
}

void list_scenarios(std::ostream& os) {
    os << "Available scenarios:\n";
    for (const auto& s : ramm::BacktestRunner::scenario_names()) {
        os << "  " << s << "\n";
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    Options opts;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;
        if (arg == "--config" && has_value) {
            opts.config_path = argv[++i];
        } else if (arg == "--name" && has_value) {
            opts.name = argv[++i];
        } else if (arg == "--password" && has_value) {
            opts.password = argv[++i];
        } else if (arg == "--scenario" && has_value) {
            opts.scenario = argv[++i];
        } else if (arg == "--host" && has_value) {
            opts.host = argv[++i];
        } else if (arg == "--experiment" && has_value) {
            opts.experiment = argv[++i];
        } else if (arg == "--ticks" && has_value) {
            opts.num_ticks = std::strtoull(argv[++i], nullptr, 10);
        } else if (arg == "--data" && has_value) {
            opts.data_file = argv[++i];
            opts.backtest = true;
        } else if (arg == "--log-level" && has_value) {
            opts.log_level = argv[++i];
        } else if (arg == "--secure") {
            opts.secure = true;
        } else if (arg == "--backtest") {
            opts.backtest = true;
        } else if (arg == "--no-step-log") {
            opts.step_log = false;
        } else if (arg == "--all-scenarios") {
            opts.all_scenarios = true;
        } else if (arg == "--all-experiments") {
            opts.all_experiments = true;
        } else if (arg == "--prioritized") {
            opts.prioritized = true;
        } else if (arg == "--list-experiments") {
            list_experiments(std::cout);
            return 0;
        } else if (arg == "--list-scenarios") {
            list_scenarios(std::cout);
            return 0;
        } else if (arg == "--help") {
            print_usage(std::cout);
            return 0;
        } else {
            std::cerr << "Unknown or incomplete option: " << arg << "\n";
            print_usage(std::cerr);
            return 1;
        }
    }

    try {
        auto config = ramm::load_engine_config(opts.config_path);
        ramm::init_logging(opts.log_level.empty() ? config.logging.level : opts.log_level);

        if (!opts.experiment.empty()) config.strategies.experiment = opts.experiment;
        if (!ramm::is_known_experiment(config.strategies.experiment)) {
            throw ramm::ConfigError("unknown experiment '" + config.strategies.experiment +
                                    "' (see --list-experiments)");
        }

        if (!opts.backtest && opts.name.empty()) {
            std::cerr << "--name is required for live trading (or use --backtest)\n";
            print_usage(std::cerr);
            return 1;
        }
        if (opts.all_scenarios || opts.all_experiments || opts.prioritized) {
            if (!opts.data_file.empty()) {
                throw ramm::ConfigError("--data replays one file; it cannot be combined with a run matrix");
            }
            return run_matrix(opts, config, plan_runs(opts, config));
        }
        return run_once(opts, config);
    } catch (const ramm::ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 2;
    } catch (const ramm::SessionError& e) {
        std::cerr << "Session error: " << e.what() << "\n";
        return 3;
    } catch (const std::exception& e) {
        std::cerr << "Fatal: " << e.what() << "\n";
        return 1;
    }
}
