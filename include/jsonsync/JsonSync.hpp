#pragma once

/**
 * @brief Подключает всё хранилище целиком
 *
 * JsonStore::open()/builder() возвращают JsonStoreHandle и JsonStoreBuilder,
 * поэтому для их вызова нужны все три заголовка — проще подключить этот.
 */

#include <jsonsync/StoreError.hpp>
#include <jsonsync/IMapBackend.hpp>
#include <jsonsync/backends/ShardedMapBackend.hpp>
#include <jsonsync/backends/LockedMapBackend.hpp>
#include <jsonsync/serialization/ISerializer.hpp>
#include <jsonsync/serialization/JsonSerializer.hpp>
#include <jsonsync/persistence/SnapshotPersistence.hpp>
#include <jsonsync/flush/FlushPolicy.hpp>
#include <jsonsync/flush/NudgeChannel.hpp>
#include <jsonsync/flush/AsyncFlushWorker.hpp>
#include <jsonsync/listeners/IStoreListener.hpp>
#include <jsonsync/listeners/LoggingListener.hpp>
#include <jsonsync/listeners/StatsListener.hpp>
#include <jsonsync/JsonStore.hpp>
#include <jsonsync/JsonStoreHandle.hpp>
#include <jsonsync/JsonStoreBuilder.hpp>
