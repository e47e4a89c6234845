#include <jsonsync/JsonSync.hpp>

#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

/**
 * @brief Бенчмарк хранилища
 *
 * Измеряем:
 * - insert/get/remove, update, extend, clear в памяти
 * - Стоимость flush() в зависимости от размера
 * - Цену каждой политики сброса на одной и той же нагрузке
 * - LockedMapBackend против ShardedMapBackend под конкурентной записью
 */

namespace fs = std::filesystem;

// ==================== Конфигурация ====================

struct BenchmarkConfig {
    /// Размеры для операций в памяти
    std::vector<size_t> memory_sizes = {10, 100, 1'000};

    /// Сколько раз повторять проход по memory_sizes
    size_t repetitions = 200;

    /// Размеры снимка для flush()
    std::vector<size_t> flush_sizes = {100, 1'000, 10'000};

    /// Сколько раз сбрасывать снимок каждого размера
    size_t flush_iterations = 20;

    /// Количество мутаций в сравнении политик
    size_t policy_mutations = 2'000;

    /// Интервал фонового сброса в сравнении политик
    std::chrono::milliseconds background_interval{50};

    /// Потоки и операции на поток в сравнении backend
    int threads = 4;
    size_t ops_per_thread = 100'000;
};

// ==================== Утилиты ====================

template<typename Func>
double measureMs(Func&& func) {
    auto start = std::chrono::high_resolution_clock::now();
    func();
    auto end = std::chrono::high_resolution_clock::now();

    std::chrono::duration<double, std::milli> duration = end - start;
    return duration.count();
}

void printResult(const std::string& name, double timeMs, size_t operations) {
    double opsPerSec = (operations / timeMs) * 1000.0;
    std::cout << std::left << std::setw(45) << name
              << std::right << std::setw(10) << std::fixed << std::setprecision(2)
              << timeMs << " ms"
              << std::setw(15) << std::fixed << std::setprecision(0)
              << opsPerSec << " ops/sec\n";
}

fs::path benchPath(const std::string& name, size_t size) {
    auto path = fs::temp_directory_path() /
                ("jsonsync_bench_" + name + "_" + std::to_string(size) + ".json");
    fs::remove(path);
    return path;
}

std::string key(size_t i) {
    return "k" + std::to_string(i);
}

using Store = JsonStore<std::string, int>;

// ==================== Операции в памяти ====================

void benchmarkInsertGetRemove(const BenchmarkConfig& config) {
    for (size_t size : config.memory_sizes) {
        auto path = benchPath("igr", size);
        auto db = Store::open(path);

        double timeMs = measureMs([&]() {
            for (size_t r = 0; r < config.repetitions; ++r) {
                for (size_t i = 0; i < size; ++i) {
                    db->insert(key(i), static_cast<int>(i));
                }
                for (size_t i = 0; i < size; ++i) {
                    db->get(key(i));
                }
                for (size_t i = 0; i < size; ++i) {
                    db->remove(key(i));
                }
            }
        });

        printResult("insert+get+remove (size=" + std::to_string(size) + ")",
                    timeMs, size * 3 * config.repetitions);
        fs::remove(path);
    }
}

void benchmarkUpdate(const BenchmarkConfig& config) {
    for (size_t size : config.memory_sizes) {
        auto path = benchPath("update", size);
        auto db = Store::open(path);
        for (size_t i = 0; i < size; ++i) {
            db->insert(key(i), static_cast<int>(i));
        }

        double timeMs = measureMs([&]() {
            for (size_t r = 0; r < config.repetitions; ++r) {
                for (size_t i = 0; i < size; ++i) {
                    db->update(key(i), [](int& v) { ++v; });
                }
            }
        });

        printResult("update (size=" + std::to_string(size) + ")",
                    timeMs, size * config.repetitions);
        fs::remove(path);
    }
}

void benchmarkExtendAndClear(const BenchmarkConfig& config) {
    for (size_t size : config.memory_sizes) {
        auto path = benchPath("extend", size);
        auto db = Store::open(path);

        std::vector<std::pair<std::string, int>> batch;
        batch.reserve(size);
        for (size_t i = 0; i < size; ++i) {
            batch.emplace_back(key(i), static_cast<int>(i));
        }

        double timeMs = measureMs([&]() {
            for (size_t r = 0; r < config.repetitions; ++r) {
                db->extend(batch);
                db->clear();
            }
        });

        printResult("extend+clear (size=" + std::to_string(size) + ")",
                    timeMs, size * config.repetitions);
        fs::remove(path);
    }
}

// ==================== Сброс на диск ====================

void benchmarkFlush(const BenchmarkConfig& config, bool pretty) {
    for (size_t size : config.flush_sizes) {
        auto path = benchPath(pretty ? "flush_pretty" : "flush", size);
        auto db = Store::builder(path).pretty(pretty).build();
        for (size_t i = 0; i < size; ++i) {
            db->insert(key(i), static_cast<int>(i));
        }

        double timeMs = measureMs([&]() {
            for (size_t r = 0; r < config.flush_iterations; ++r) {
                db->flush();
            }
        });

        std::string name = std::string(pretty ? "flush pretty" : "flush compact") +
                           " (entries=" + std::to_string(size) + ")";
        printResult(name, timeMs, config.flush_iterations);
        fs::remove(path);
    }
}

// ==================== Политики ====================

void benchmarkPolicies(const BenchmarkConfig& config) {
    struct Case {
        std::string name;
        FlushPolicy policy;
    };
    std::vector<Case> cases = {
        {"CallerDriven (one flush at end)", FlushPolicy::callerDriven()},
        {"BackgroundInterval", FlushPolicy::backgroundInterval(config.background_interval)},
        {"WriteThrough", FlushPolicy::writeThrough()},
    };

    for (const auto& c : cases) {
        auto path = benchPath("policy", static_cast<size_t>(c.policy.kind()));
        auto stats = std::make_shared<StatsListener<std::string, int>>();
        auto db = Store::builder(path).policy(c.policy).listener(stats).build();

        double timeMs = measureMs([&]() {
            for (size_t i = 0; i < config.policy_mutations; ++i) {
                db->insert(key(i % 100), static_cast<int>(i));
            }
            if (c.policy.kind() == FlushPolicy::Kind::CallerDriven) {
                db->flush();
            }
        });

        printResult("  " + c.name, timeMs, config.policy_mutations);
        std::cout << "      flushes: " << stats->flushes() << "\n";

        db.close();
        fs::remove(path);
    }
}

// ==================== Backend под конкурентной записью ====================

template<typename Backend>
void benchmarkBackend(const std::string& name, const BenchmarkConfig& config) {
    using BackendStore = JsonStore<int, int, Backend>;
    auto path = benchPath("backend", 0);
    auto db = BackendStore::open(path);
    auto store = db.store();

    double timeMs = measureMs([&]() {
        std::vector<std::thread> threads;
        for (int t = 0; t < config.threads; ++t) {
            threads.emplace_back([&store, &config, t]() {
                for (size_t i = 0; i < config.ops_per_thread; ++i) {
                    int k = static_cast<int>((t * 7919 + i) % 10'000);
                    if (i % 5 == 0) {
                        store->insert(k, static_cast<int>(i));
                    } else {
                        store->get(k);
                    }
                }
            });
        }
        for (auto& th : threads) {
            th.join();
        }
    });

    printResult("  " + name + " (" + std::to_string(config.threads) + " threads)",
                timeMs, config.ops_per_thread * static_cast<size_t>(config.threads));
    fs::remove(path);
}

// ==================== Main ====================

int main() {
    BenchmarkConfig config;

    std::cout << "=== Store Benchmark ===\n\n";

    try {
        std::cout << "--- In-memory operations ---\n";
        benchmarkInsertGetRemove(config);
        benchmarkUpdate(config);
        benchmarkExtendAndClear(config);

        std::cout << "\n--- Flush ---\n";
        benchmarkFlush(config, false);
        benchmarkFlush(config, true);

        std::cout << "\n--- Flush policies (" << config.policy_mutations << " inserts) ---\n";
        benchmarkPolicies(config);

        std::cout << "\n--- Backends (80% get, 20% insert) ---\n";
        benchmarkBackend<LockedMapBackend<int, int>>("LockedMapBackend", config);
        benchmarkBackend<ShardedMapBackend<int, int, 4>>("ShardedMapBackend<4>", config);
        benchmarkBackend<ShardedMapBackend<int, int, 16>>("ShardedMapBackend<16>", config);
    } catch (const StoreError& e) {
        std::cerr << "Benchmark failed: " << e.what() << "\n";
        return 1;
    }

    std::cout << "\n=== Benchmark complete ===\n";

    return 0;
}
