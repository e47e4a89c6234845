#include <gtest/gtest.h>
#include <jsonsync/JsonSync.hpp>
#include "TestUtils.hpp"
#include <algorithm>
#include <chrono>
#include <map>
#include <sstream>
#include <string>
#include <vector>

/**
 * @brief Тесты для JsonStore, JsonStoreBuilder и JsonStoreHandle
 *
 * Проверяем:
 * - Открытие, сохранение и повторное открытие
 * - API чтения и записи
 * - pretty/компактный формат
 * - Ошибки конфигурации и повреждённый файл
 * - Отладочный вывод
 */

using namespace std::chrono_literals;

class JsonStoreTest : public TempFileTest {
protected:
    using Store = JsonStore<std::string, int>;
};

// ==================== Открытие и повторное открытие ====================

TEST_F(JsonStoreTest, OpenMissingFileIsEmpty) {
    auto db = Store::open(testFile_);

    EXPECT_TRUE(db->isEmpty());
    EXPECT_EQ(db->len(), 0u);
    EXPECT_EQ(db->path().string(), testFile_.string());
    EXPECT_EQ(db->policy(), FlushPolicy::callerDriven());
    EXPECT_FALSE(db->isPretty());
    EXPECT_FALSE(db.hasWorker());
    // Открытие файл не создаёт
    EXPECT_FALSE(std::filesystem::exists(testFile_));
}

TEST_F(JsonStoreTest, OpenEmptyFileIsEmpty) {
    writeFile(testFile_, "");

    auto db = Store::open(testFile_);

    EXPECT_TRUE(db->isEmpty());
}

TEST_F(JsonStoreTest, PersistAndReload) {
    {
        auto db = Store::open(testFile_);
        db->insert("one", 1);
        db->insert("two", 2);
        db->flush();
    }

    auto db = Store::open(testFile_);

    EXPECT_EQ(db->len(), 2u);
    EXPECT_EQ(db->get("one"), 1);
    EXPECT_EQ(db->get("two"), 2);
}

TEST_F(JsonStoreTest, ApplesAndBananas) {
    {
        auto db = Store::open(testFile_);
        db->insert("apples", 3);
        db->insert("bananas", 5);
        EXPECT_EQ(db->get("apples"), 3);

        EXPECT_TRUE(db->update("apples", [](int& n) { n += 1; }));
        EXPECT_EQ(db->get("apples"), 4);

        db->flush();
    }

    auto db = Store::open(testFile_);

    EXPECT_EQ(db->get("apples"), 4);
    EXPECT_EQ(db->get("bananas"), 5);
    EXPECT_EQ(db->len(), 2u);
}

TEST_F(JsonStoreTest, TempFileNotLeftAfterFlush) {
    auto db = Store::open(testFile_);
    db->insert("a", 1);

    db->flush();
    db->flush();

    EXPECT_TRUE(std::filesystem::exists(testFile_));
    EXPECT_FALSE(std::filesystem::exists(tempFile()));
}

TEST_F(JsonStoreTest, ClearThenFlushPersistsEmpty) {
    {
        auto db = Store::open(testFile_);
        db->insert("a", 1);
        db->flush();
        db->clear();
        db->flush();
    }

    EXPECT_EQ(readFile(testFile_), "{}");
    EXPECT_TRUE(Store::open(testFile_)->isEmpty());
}

TEST_F(JsonStoreTest, UnflushedChangesAreLost) {
    {
        auto db = Store::open(testFile_);
        db->insert("a", 1);
        db->flush();
        db->insert("b", 2);
    }

    auto db = Store::open(testFile_);

    EXPECT_EQ(db->len(), 1u);
    EXPECT_FALSE(db->containsKey("b"));
}

// ==================== Чтение и запись ====================

TEST_F(JsonStoreTest, InsertReturnsPrevious) {
    auto db = Store::open(testFile_);

    EXPECT_FALSE(db->insert("a", 1).has_value());
    EXPECT_EQ(db->insert("a", 2), 1);
    EXPECT_EQ(db->get("a"), 2);
    EXPECT_EQ(db->len(), 1u);
}

TEST_F(JsonStoreTest, RemoveReturnsRemoved) {
    auto db = Store::open(testFile_);
    db->insert("a", 1);

    EXPECT_EQ(db->remove("a"), 1);
    EXPECT_FALSE(db->remove("a").has_value());
    EXPECT_FALSE(db->containsKey("a"));
}

TEST_F(JsonStoreTest, KeysValuesEntries) {
    auto db = Store::open(testFile_);
    db->extend({{"a", 1}, {"b", 2}, {"c", 3}});

    auto keys = db->keys();
    auto values = db->values();
    auto entries = db->entries();
    std::sort(keys.begin(), keys.end());
    std::sort(values.begin(), values.end());
    std::sort(entries.begin(), entries.end());

    EXPECT_EQ(keys, (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(values, (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(entries, (Store::Snapshot{{"a", 1}, {"b", 2}, {"c", 3}}));
}

TEST_F(JsonStoreTest, GetReturnsCopy) {
    auto db = Store::open(testFile_);
    db->insert("a", 1);

    auto value = db->get("a");
    *value = 100;

    EXPECT_EQ(db->get("a"), 1);
}

TEST_F(JsonStoreTest, Clear) {
    auto db = Store::open(testFile_);
    db->extend({{"a", 1}, {"b", 2}});

    db->clear();

    EXPECT_TRUE(db->isEmpty());
    EXPECT_NO_THROW(db->clear());
}

TEST_F(JsonStoreTest, ExtendFromMapOverwritesExisting) {
    auto db = Store::open(testFile_);
    db->insert("a", 1);

    std::map<std::string, int> batch = {{"a", 10}, {"b", 20}};
    db->extend(batch);

    EXPECT_EQ(db->len(), 2u);
    EXPECT_EQ(db->get("a"), 10);
    EXPECT_EQ(db->get("b"), 20);
}

TEST_F(JsonStoreTest, ExtendWithEmptyRange) {
    auto db = Store::open(testFile_);

    db->extend(std::vector<std::pair<std::string, int>>{});

    EXPECT_TRUE(db->isEmpty());
}

TEST_F(JsonStoreTest, UpdateMissingReturnsFalse) {
    auto db = Store::open(testFile_);
    bool called = false;

    EXPECT_FALSE(db->update("missing", [&called](int&) { called = true; }));

    EXPECT_FALSE(called);
    EXPECT_TRUE(db->isEmpty());
}

TEST_F(JsonStoreTest, GetOrInsertPresent) {
    auto db = Store::open(testFile_);
    db->insert("a", 1);

    EXPECT_EQ(db->getOrInsert("a", 100), 1);
    EXPECT_EQ(db->len(), 1u);
}

TEST_F(JsonStoreTest, GetOrInsertAbsent) {
    auto db = Store::open(testFile_);

    EXPECT_EQ(db->getOrInsert("a", 100), 100);
    EXPECT_EQ(db->get("a"), 100);
    EXPECT_EQ(db->len(), 1u);
}

TEST_F(JsonStoreTest, GetOrInsertWithSkipsFactoryOnHit) {
    auto db = Store::open(testFile_);
    db->insert("a", 1);

    int value = db->getOrInsertWith("a", []() {
        ADD_FAILURE() << "factory called for existing key";
        return 0;
    });

    EXPECT_EQ(value, 1);
}

TEST_F(JsonStoreTest, GetOrInsertWithCallsFactoryOnMiss) {
    auto db = Store::open(testFile_);
    int calls = 0;

    int value = db->getOrInsertWith("a", [&calls]() { ++calls; return 7; });

    EXPECT_EQ(value, 7);
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(db->get("a"), 7);
}

// ==================== Типы ключей и значений ====================

TEST_F(JsonStoreTest, IntegerKeysAndStringValues) {
    {
        auto db = JsonStore<int, std::string>::open(testFile_);
        db->insert(1, "one");
        db->insert(-2, "minus two");
        db->flush();
    }

    EXPECT_NE(readFile(testFile_).find("\"1\":\"one\""), std::string::npos);

    auto db = JsonStore<int, std::string>::open(testFile_);
    EXPECT_EQ(db->get(1), std::string("one"));
    EXPECT_EQ(db->get(-2), std::string("minus two"));
}

TEST_F(JsonStoreTest, VectorValues) {
    using ListStore = JsonStore<std::string, std::vector<int>>;
    {
        auto db = ListStore::open(testFile_);
        db->insert("primes", {2, 3, 5, 7});
        db->update("primes", [](std::vector<int>& v) { v.push_back(11); });
        db->flush();
    }

    auto db = ListStore::open(testFile_);
    EXPECT_EQ(db->get("primes"), (std::vector<int>{2, 3, 5, 7, 11}));
}

TEST_F(JsonStoreTest, LockedBackend) {
    using LockedStore = JsonStore<std::string, int, LockedMapBackend<std::string, int>>;
    {
        auto db = LockedStore::builder(testFile_)
            .policy(FlushPolicy::writeThrough())
            .build();
        db->insert("a", 1);
        db->insert("b", 2);
        db->remove("b");
    }

    auto db = LockedStore::open(testFile_);
    EXPECT_EQ(db->len(), 1u);
    EXPECT_EQ(db->get("a"), 1);
}

// ==================== Формат файла ====================

TEST_F(JsonStoreTest, PrettyJson) {
    auto db = Store::builder(testFile_).pretty(true).build();
    db->extend({{"a", 1}, {"b", 2}, {"c", 3}});

    db->flush();

    auto content = readFile(testFile_);
    EXPECT_TRUE(db->isPretty());
    EXPECT_NE(content.find('\n'), std::string::npos);
    EXPECT_NE(content.find("  \""), std::string::npos);
}

TEST_F(JsonStoreTest, CompactJson) {
    auto db = Store::builder(testFile_).pretty(false).build();
    db->extend({{"a", 1}, {"b", 2}, {"c", 3}});

    db->flush();

    EXPECT_EQ(readFile(testFile_).find('\n'), std::string::npos);
}

TEST_F(JsonStoreTest, PrettyFileReopensAsCompact) {
    {
        auto db = Store::builder(testFile_).pretty(true).build();
        db->insert("a", 1);
        db->flush();
    }

    auto db = Store::open(testFile_);
    EXPECT_EQ(db->get("a"), 1);
}

// ==================== Ошибки ====================

TEST_F(JsonStoreTest, CorruptFileFailsToOpen) {
    writeFile(testFile_, "{ this is not json");

    EXPECT_THROW(Store::open(testFile_), DeserializeError);
}

TEST_F(JsonStoreTest, WrongValueTypeFailsToOpen) {
    writeFile(testFile_, "{\"a\": \"text\"}");

    EXPECT_THROW(Store::open(testFile_), DeserializeError);
}

TEST_F(JsonStoreTest, EmptyPathIsConfigError) {
    EXPECT_THROW(Store::open(""), ConfigError);
}

TEST_F(JsonStoreTest, DirectoryPathIsConfigError) {
    EXPECT_THROW(Store::open(dir_), ConfigError);
}

TEST_F(JsonStoreTest, ZeroIntervalIsConfigError) {
    EXPECT_THROW(Store::openWithPolicy(testFile_, FlushPolicy::backgroundInterval(0ms)),
                 ConfigError);
}

TEST_F(JsonStoreTest, NullListenerIsConfigError) {
    EXPECT_THROW(Store::builder(testFile_).listener(nullptr), ConfigError);
}

TEST_F(JsonStoreTest, StoreConstructorValidatesArguments) {
    auto persistence = std::make_shared<Store::Persistence>(
        testFile_, std::make_shared<JsonSerializer<std::string, int>>());
    auto map = std::make_shared<ShardedMapBackend<std::string, int>>();

    EXPECT_THROW((Store(nullptr, persistence, FlushPolicy(), false)), ConfigError);
    EXPECT_THROW((Store(map, nullptr, FlushPolicy(), false)), ConfigError);
    // Фоновой политике нужен канал толчков
    EXPECT_THROW((Store(map, persistence, FlushPolicy::backgroundInterval(1s), false)),
                 ConfigError);
}

// ==================== Handle ====================

TEST_F(JsonStoreTest, HandleMoveKeepsStore) {
    auto db = Store::open(testFile_);
    db->insert("a", 1);

    auto moved = std::move(db);

    EXPECT_EQ(moved->get("a"), 1);
}

TEST_F(JsonStoreTest, StoreOutlivesHandle) {
    std::shared_ptr<Store> store;
    {
        auto db = Store::openWithPolicy(testFile_, FlushPolicy::backgroundInterval(60s));
        store = db.store();
    }

    // Фонового потока больше нет, явный flush по-прежнему работает
    store->insert("a", 1);
    store->flush();

    EXPECT_EQ(Store::open(testFile_)->get("a"), 1);
}

TEST_F(JsonStoreTest, CloseStopsWorker) {
    auto db = Store::openWithPolicy(testFile_, FlushPolicy::backgroundInterval(60s));
    EXPECT_TRUE(db.hasWorker());

    db.close();
    db.close();

    EXPECT_FALSE(db.hasWorker());
    EXPECT_NO_THROW(db->insert("a", 1));
}

// ==================== Отладочный вывод ====================

TEST_F(JsonStoreTest, DebugOutput) {
    auto builder = Store::builder(testFile_)
        .policy(FlushPolicy::backgroundInterval(60s))
        .pretty(true);

    std::ostringstream builderText;
    builderText << builder;
    EXPECT_NE(builderText.str().find("JsonStoreBuilder {"), std::string::npos);
    EXPECT_NE(builderText.str().find("BackgroundInterval(60000ms)"), std::string::npos);
    EXPECT_NE(builderText.str().find("pretty: true"), std::string::npos);

    auto db = builder.build();

    std::ostringstream storeText;
    storeText << *db;
    EXPECT_NE(storeText.str().find("JsonStore { path: "), std::string::npos);
    EXPECT_NE(storeText.str().find(testFile_.filename().string()), std::string::npos);

    std::ostringstream handleText;
    handleText << db;
    EXPECT_NE(handleText.str().find("JsonStoreHandle {"), std::string::npos);
    EXPECT_NE(handleText.str().find("worker: running"), std::string::npos);
}
