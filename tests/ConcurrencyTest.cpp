#include <gtest/gtest.h>
#include <jsonsync/JsonSync.hpp>
#include "TestUtils.hpp"
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

/**
 * @brief Многопоточные тесты JsonStore
 *
 * Проверяем:
 * - Конкурентные вставки через общий store
 * - Одновременные flush() не портят файл
 * - Писатели и фоновый поток сброса вместе
 * - WriteThrough из нескольких потоков: на диске итоговое состояние
 */

using namespace std::chrono_literals;

class ConcurrencyTest : public TempFileTest {
protected:
    using Store = JsonStore<int, int>;
};

TEST_F(ConcurrencyTest, ConcurrentInsertsThenFlush) {
    const int numThreads = 4;
    const int opsPerThread = 250;
    {
        auto db = Store::open(testFile_);
        auto store = db.store();
        std::vector<std::thread> threads;

        for (int t = 0; t < numThreads; ++t) {
            threads.emplace_back([store, t, opsPerThread]() {
                for (int i = 0; i < opsPerThread; ++i) {
                    int key = t * opsPerThread + i;
                    store->insert(key, key * 2);
                }
            });
        }

        for (auto& th : threads) {
            th.join();
        }

        EXPECT_EQ(db->len(), static_cast<size_t>(numThreads * opsPerThread));
        db->flush();
    }

    auto db = Store::open(testFile_);
    ASSERT_EQ(db->len(), static_cast<size_t>(numThreads * opsPerThread));
    for (int key = 0; key < numThreads * opsPerThread; ++key) {
        EXPECT_EQ(db->get(key), key * 2) << "Key " << key;
    }
}

TEST_F(ConcurrencyTest, ConcurrentFlushesKeepFileValid) {
    auto db = Store::open(testFile_);
    for (int i = 0; i < 100; ++i) {
        db->insert(i, i);
    }

    auto store = db.store();
    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([store, &failures]() {
            for (int i = 0; i < 20; ++i) {
                try {
                    store->flush();
                } catch (const StoreError&) {
                    ++failures;
                }
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    EXPECT_EQ(failures.load(), 0);
    EXPECT_FALSE(std::filesystem::exists(tempFile()));
    EXPECT_EQ(Store::open(testFile_)->len(), 100u);
}

TEST_F(ConcurrencyTest, WritersWithBackgroundFlush) {
    {
        auto db = Store::openWithPolicy(testFile_, FlushPolicy::backgroundInterval(2ms));
        auto store = db.store();
        std::vector<std::thread> writers;

        for (int t = 0; t < 4; ++t) {
            writers.emplace_back([store, t]() {
                for (int i = 0; i < 200; ++i) {
                    store->insert(t * 1000 + i, i);
                    if (i % 3 == 0) {
                        store->remove(t * 1000 + i);
                    }
                }
            });
        }

        // Читатели файла видят только целые снимки
        for (int i = 0; i < 20; ++i) {
            if (std::filesystem::exists(testFile_)) {
                EXPECT_NO_THROW(Store::open(testFile_));
            }
            std::this_thread::sleep_for(1ms);
        }

        for (auto& th : writers) {
            th.join();
        }
        db->flush();
    }

    auto db = Store::open(testFile_);
    EXPECT_EQ(db->len(), 4u * 133u);
}

TEST_F(ConcurrencyTest, WriteThroughFromManyThreads) {
    {
        auto db = Store::openWithPolicy(testFile_, FlushPolicy::writeThrough());
        auto store = db.store();
        std::vector<std::thread> threads;

        for (int t = 0; t < 4; ++t) {
            threads.emplace_back([store, t]() {
                for (int i = 0; i < 25; ++i) {
                    store->insert(t * 100 + i, i);
                }
            });
        }
        for (auto& th : threads) {
            th.join();
        }
    }

    // Последний сброс снимал снимок после последней вставки
    EXPECT_EQ(Store::open(testFile_)->len(), 100u);
}

TEST_F(ConcurrencyTest, SameKeyUpdatesFromManyThreads) {
    auto db = Store::open(testFile_);
    auto store = db.store();
    const int key = 42;
    std::vector<std::thread> threads;

    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([store, t, key]() {
            for (int i = 0; i < 100; ++i) {
                store->insert(key, t * 1000 + i);
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    // Ключ существует с каким-то значением
    auto val = db->get(key);
    ASSERT_TRUE(val.has_value());
    EXPECT_GE(*val, 0);
    EXPECT_EQ(db->len(), 1u);
}
