#include <jsonsync/JsonSync.hpp>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

/**
 * @brief Демонстрация библиотеки на примере небольшого склада
 *
 * Сценарии:
 * 1. Базовые операции и ручной flush()
 * 2. pretty-JSON + фоновый сброс
 * 3. LockedMapBackend + WriteThrough, счётчик через update()
 * 4. Логирование событий хранилища
 */

namespace fs = std::filesystem;

void printSeparator(const std::string& title) {
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << "  " << title << "\n";
    std::cout << std::string(60, '=') << "\n\n";
}

template<typename T>
void printList(const std::string& label, const std::vector<T>& items) {
    std::cout << "  " << label << " = [";
    for (size_t i = 0; i < items.size(); ++i) {
        std::cout << (i ? ", " : "") << items[i];
    }
    std::cout << "]\n";
}

std::string readFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in),
                       std::istreambuf_iterator<char>());
}

template<typename V>
std::string show(const std::optional<V>& value) {
    return value ? std::to_string(*value) : std::string("none");
}

/**
 * @brief Демо 1: insert/get/update/getOrInsert/extend, снимки, flush
 */
void demoBasicUsage() {
    printSeparator("Demo 1: Basic Usage");

    const fs::path path = fs::temp_directory_path() / "jsonsync_demo_basic.json";
    fs::remove(path);

    auto db = JsonStore<std::string, int>::open(path);

    db->insert("apples", 3);
    db->insert("bananas", 5);
    std::cout << "  apples  = " << show(db->get("apples")) << "\n";
    std::cout << "  bananas = " << show(db->get("bananas")) << "\n";

    db->update("apples", [](int& n) { n += 1; });
    std::cout << "  apples after update = " << show(db->get("apples")) << "\n";

    int oranges = db->getOrInsert("oranges", 0);
    std::cout << "  oranges (default 0) = " << oranges << "\n";

    db->extend({{"grapes", 12}, {"lemons", 7}});

    printList("keys  ", db->keys());
    printList("values", db->values());
    std::cout << "  len    = " << db->len() << "\n";
    std::cout << "  empty? = " << std::boolalpha << db->isEmpty() << "\n";

    db->flush();
    std::cout << "\n  On disk: " << readFile(path) << "\n";

    db->clear();
    std::cout << "  After clear: len = " << db->len() << "\n";

    fs::remove(path);
}

/**
 * @brief Демо 2: pretty-JSON и фоновый сброс раз в 5 секунд
 */
void demoPrettyBackground() {
    printSeparator("Demo 2: Pretty JSON + Background Flush");

    const fs::path path = fs::temp_directory_path() / "jsonsync_demo_builder.json";
    fs::remove(path);

    auto db = JsonStore<std::string, std::string>::builder(path)
        .pretty(true)
        .policy(FlushPolicy::backgroundInterval(std::chrono::seconds(5)))
        .build();

    db->insert("name", "jsonsync");
    db->insert("version", "0.1.0");
    db->insert("status", "stable");
    db->flush();

    std::cout << "On-disk JSON:\n" << readFile(db->path()) << "\n";
    std::cout << "\nDebug output: " << db << "\n";

    // Останавливаем фоновый поток до удаления файла
    db.close();
    fs::remove(path);
}

/**
 * @brief Демо 3: LockedMapBackend вместо шардированной map, WriteThrough
 */
void demoLockedBackend() {
    printSeparator("Demo 3: LockedMapBackend + WriteThrough");

    const fs::path path = fs::temp_directory_path() / "jsonsync_demo_locked.json";
    fs::remove(path);

    using CounterStore = JsonStore<std::string, uint64_t, LockedMapBackend<std::string, uint64_t>>;
    auto db = CounterStore::openWithPolicy(path, FlushPolicy::writeThrough());

    db->insert("counter", 0);
    for (int i = 0; i < 10; ++i) {
        db->update("counter", [](uint64_t& v) { ++v; });
    }
    std::cout << "  counter = " << show(db->get("counter")) << "\n";

    db->extend({{"x", 100}, {"y", 200}});
    printList("keys", db->keys());

    // WriteThrough: файл уже актуален, flush() не нужен
    auto reopened = CounterStore::open(path);
    std::cout << "  reopened counter = " << show(reopened->get("counter")) << "\n";

    fs::remove(path);
}

/**
 * @brief Демо 4: LoggingListener + StatsListener
 */
void demoListeners() {
    printSeparator("Demo 4: Listeners");

    const fs::path path = fs::temp_directory_path() / "jsonsync_demo_listeners.json";
    fs::remove(path);

    auto stats = std::make_shared<StatsListener<std::string, int>>();
    auto db = JsonStore<std::string, int>::builder(path)
        .listener(std::make_shared<LoggingListener<std::string, int>>("stock"))
        .listener(stats)
        .build();

    db->insert("bolts", 100);
    db->insert("bolts", 90);
    db->insert("nuts", 250);
    db->remove("nuts");
    db->flush();

    std::cout << "\n  Mutations: " << stats->totalMutations()
              << ", flushes: " << stats->flushes() << "\n";

    fs::remove(path);
}

int main() {
    std::cout << "=== jsonsync Demo: In-Memory Store Mirrored to JSON ===\n";

    try {
        demoBasicUsage();
        demoPrettyBackground();
        demoLockedBackend();
        demoListeners();

        std::cout << "\n" << std::string(60, '=') << "\n";
        std::cout << "  Demo Complete!\n";
        std::cout << std::string(60, '=') << "\n";

    } catch (const StoreError& e) {
        std::cerr << "Error (" << e.kind() << "): " << e.message() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
