// LMSR market harness: runs trade sequences against market configs (JSON in, JSON out)
#include "market_json.hpp"
#include <iostream>
#include <fstream>
#include <boost/json/src.hpp>
#include <vector>
#include <string>
#include <thread>
#include <mutex>
#include <atomic>
#include <algorithm>
#include <cstdlib>
#include <stdexcept>

using namespace lmsr;

namespace {

std::string read_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) throw std::runtime_error("Cannot open " + path);
    return std::string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
}

} // namespace

int run_harness(const std::string& markets_file, const std::string& sequences_file, const std::string& output_file, size_t threads) {
    try {
        json::array markets = json::parse(read_file(markets_file)).as_object().at("markets").as_array();
        json::array seqs = json::parse(read_file(sequences_file)).as_object().at("sequences").as_array();
        if (seqs.empty()) throw std::runtime_error("No sequences found");

        // Snapshot controls via env
        const char* se = std::getenv("SNAPSHOT_EVERY");
        SnapshotPolicy policy = snapshot_policy(std::getenv("SAVE_LAST_ONLY"), se);
        if (policy.invalid_every) {
            std::cerr << "Ignoring invalid SNAPSHOT_EVERY=" << se << std::endl;
        }
        const size_t snapshot_every = policy.every;
        const bool trace = (std::getenv("TRACE") && std::string(std::getenv("TRACE")) == "1");

        struct Task { size_t mi; size_t si; };
        std::vector<Task> tasks;
        tasks.reserve(markets.size() * seqs.size());
        for (size_t mi = 0; mi < markets.size(); ++mi)
            for (size_t si = 0; si < seqs.size(); ++si) tasks.push_back({mi, si});

        std::vector<json::object> results(tasks.size());
        std::atomic<size_t> next{0};
        std::mutex io_mu;

        auto worker = [&]() {
            for (;;) {
                size_t idx = next.fetch_add(1);
                if (idx >= tasks.size()) break;
                const auto& market_obj = markets[tasks[idx].mi].as_object();
                const auto& sequence = seqs[tasks[idx].si].as_object();
                std::string market_name;
                std::string sequence_name;
                try {
                    market_name = std::string(market_obj.at("name").as_string().c_str());
                    sequence_name = std::string(sequence.at("name").as_string().c_str());
                    {
                        std::lock_guard<std::mutex> lk(io_mu);
                        std::cout << "Processing " << market_name << " x " << sequence_name << "..." << std::endl;
                    }

                    MarketRunner runner(market_from_json(market_obj));
                    auto actions = actions_from_json(sequence.at("actions").as_array());
                    RunResult run = runner.run(actions, snapshot_every);

                    if (trace) {
                        std::lock_guard<std::mutex> lk(io_mu);
                        for (size_t i = 0; i < run.actions.size(); ++i) {
                            const auto& r = run.actions[i];
                            std::cout << "TRACE buy market=" << market_name
                                      << " outcome=" << actions[i].outcome
                                      << " amount=" << actions[i].amount;
                            if (r.success) std::cout << " shares=" << r.shares_minted;
                            else std::cout << " error=\"" << r.message << "\"";
                            std::cout << "\n";
                        }
                    }

                    json::object res;
                    res["success"] = true;
                    res["trades"] = run.trades;
                    res["failed"] = run.failed;
                    if (snapshot_every != 0) {
                        json::array states;
                        states.push_back(to_json(MarketRunner::snapshot(market_from_json(market_obj))));
                        for (const auto& r : run.actions) {
                            if (!r.snapshot) continue;
                            auto st = to_json(*r.snapshot);
                            st["action_success"] = r.success;
                            if (r.success) st["shares_minted"] = std::to_string(r.shares_minted);
                            else st["error"] = r.message;
                            states.push_back(st);
                        }
                        res["states"] = states;
                    }
                    res["final_state"] = to_json(run.final_state);

                    json::object tr;
                    tr["market"] = market_name;
                    tr["sequence"] = sequence_name;
                    tr["result"] = res;
                    results[idx] = std::move(tr);
                } catch (const std::exception& e) {
                    // Per-task failure should not bring down the whole harness
                    json::object tr; tr["market"] = market_name; tr["sequence"] = sequence_name;
                    json::object res; res["success"] = false; res["error"] = e.what();
                    tr["result"] = res; results[idx] = std::move(tr);
                    std::lock_guard<std::mutex> lk(io_mu);
                    std::cerr << "Failed " << market_name << " x " << sequence_name << ": " << e.what() << std::endl;
                }
            }
        };

        std::vector<std::thread> ws;
        ws.reserve(threads);
        for (size_t t = 0; t < threads; ++t) ws.emplace_back(worker);
        for (auto& th : ws) th.join();

        json::array out;
        for (auto& r : results) out.push_back(r);
        json::object O;
        O["results"] = out;
        O["metadata"] = json::object{
            {"markets_file", markets_file},
            {"sequences_file", sequences_file},
            {"max_outcomes", MAX_OUTCOMES},
            {"total_tasks", tasks.size()}
        };
        std::ofstream of(output_file);
        if (!of) throw std::runtime_error("Cannot open " + output_file);
        of << json::serialize(O) << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

int main(int argc, char* argv[]) {
    if (argc < 4) {
        std::cerr << "Usage: " << argv[0] << " <markets.json> <sequences.json> <output.json> [--threads N]" << std::endl;
        return 1;
    }
    std::string markets = argv[1]; std::string seq = argv[2]; std::string out = argv[3];

    size_t threads = std::max<size_t>(1, std::thread::hardware_concurrency());
    if (const char* thr = std::getenv("CPP_THREADS")) {
        try { threads = std::max<size_t>(1, std::stoul(thr)); }
        catch (const std::exception&) { std::cerr << "Ignoring invalid CPP_THREADS=" << thr << std::endl; }
    }
    for (int i = 4; i < argc; ++i) {
        const std::string arg = argv[i];
        if ((arg == "--threads" || arg == "-n") && i + 1 < argc) {
            try { threads = std::max<size_t>(1, std::stoul(argv[++i])); }
            catch (const std::exception&) { std::cerr << "Invalid thread count: " << argv[i] << std::endl; return 1; }
        } else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            return 1;
        }
    }
    return run_harness(markets, seq, out, threads);
}
